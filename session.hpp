#pragma once
#include "config.hpp"
#include "device.hpp"
#include "filter.hpp"
#include <wayland-server-core.h>
#include <exception>
#include <string>

class CLogger;

// One grabbed mouse, its virtual twin and the filter between them, driven by a wl_event_loop.
class CSmootherSession {
  public:
    CSmootherSession(const std::string& devicePath, const SWheelConfig& config, CLogger* logger = nullptr);
    ~CSmootherSession();

    CSmootherSession(const CSmootherSession&)            = delete;
    CSmootherSession& operator=(const CSmootherSession&) = delete;

    // Blocks until SIGINT/SIGTERM or stop(). Device failures are rethrown from here.
    void run();
    void stop(const char* reason = nullptr);

  private:
    static int         onInputReadable(int fd, uint32_t mask, void* data);
    static int         onSignal(int signalNumber, void* data);

    void               drainInput();
    void               fail(std::exception_ptr error);
    void               release();

    CLogger*           m_logger = nullptr;
    CInputDevice       m_input;
    CVirtualDevice     m_output;
    CWheelFilter       m_filter;

    wl_event_loop*     m_loop          = nullptr;
    wl_event_source*   m_inputSource   = nullptr;
    wl_event_source*   m_sigintSource  = nullptr;
    wl_event_source*   m_sigtermSource = nullptr;

    bool               m_running = false;
    std::exception_ptr m_error;
};
