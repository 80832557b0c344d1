#include "session.hpp"
#include "log.hpp"
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <utility>

CSmootherSession::CSmootherSession(const std::string& devicePath, const SWheelConfig& config, CLogger* logger) :
    m_logger(logger), m_input(devicePath, logger), m_output("Virtual " + m_input.name(), logger), m_filter(config, m_output, logger) {
    m_loop = wl_event_loop_create();
    if (!m_loop)
        throw std::runtime_error("wl_event_loop_create failed");

    m_inputSource   = wl_event_loop_add_fd(m_loop, m_input.fd(), WL_EVENT_READABLE, onInputReadable, this);
    m_sigintSource  = wl_event_loop_add_signal(m_loop, SIGINT, onSignal, this);
    m_sigtermSource = wl_event_loop_add_signal(m_loop, SIGTERM, onSignal, this);

    if (!m_inputSource || !m_sigintSource || !m_sigtermSource) {
        release();
        throw std::runtime_error("cannot register event sources");
    }

    if (m_logger)
        m_logger->debug("wheel debounce " + std::to_string(config.debounceTime.count()) + "ms, hwheel debounce " + std::to_string(config.hDebounceTime.count()) +
                        "ms, reversal timeout " + std::to_string(config.debounceTimeout.count()) + "ms");
}

CSmootherSession::~CSmootherSession() {
    release();
}

void CSmootherSession::release() {
    if (m_inputSource)
        wl_event_source_remove(m_inputSource);
    if (m_sigintSource)
        wl_event_source_remove(m_sigintSource);
    if (m_sigtermSource)
        wl_event_source_remove(m_sigtermSource);

    m_inputSource   = nullptr;
    m_sigintSource  = nullptr;
    m_sigtermSource = nullptr;

    if (m_loop)
        wl_event_loop_destroy(m_loop);
    m_loop = nullptr;
}

void CSmootherSession::run() {
    if (m_logger) {
        m_logger->info("processing wheel events...");
        m_logger->info("all other mouse events are passed through");
    }

    m_running = true;

    // anything queued before the loop existed would not wake it up
    try {
        drainInput();
    } catch (...) { fail(std::current_exception()); }

    while (m_running) {
        if (wl_event_loop_dispatch(m_loop, -1) < 0 && errno != EINTR)
            throw std::system_error(errno, std::generic_category(), "event loop dispatch failed");
    }

    if (m_error)
        std::rethrow_exception(std::exchange(m_error, nullptr));
}

void CSmootherSession::stop(const char* reason) {
    if (m_logger)
        m_logger->info(std::string("stopping: ") + (reason ? reason : "requested"));

    m_running = false;
}

void CSmootherSession::fail(std::exception_ptr error) {
    if (!m_error)
        m_error = error;

    m_running = false;
}

void CSmootherSession::drainInput() {
    SRawEvent                 event;
    CInputDevice::eReadResult result;
    while ((result = m_input.readEvent(event)) != CInputDevice::READ_AGAIN) {
        if (result == CInputDevice::READ_DROPPED)
            m_filter.discardPending();
        else
            m_filter.onEvent(event);
    }
}

int CSmootherSession::onInputReadable(int /*fd*/, uint32_t mask, void* data) {
    auto* self = static_cast<CSmootherSession*>(data);

    // exceptions must not unwind through libwayland, park them for run()
    try {
        if (mask & WL_EVENT_READABLE)
            self->drainInput();

        if (mask & (WL_EVENT_HANGUP | WL_EVENT_ERROR))
            throw std::runtime_error("input device " + self->m_input.path() + " went away");
    } catch (...) { self->fail(std::current_exception()); }

    return 0;
}

int CSmootherSession::onSignal(int signalNumber, void* data) {
    auto* self = static_cast<CSmootherSession*>(data);
    self->stop(signalNumber == SIGINT ? "SIGINT" : "SIGTERM");
    return 0;
}
