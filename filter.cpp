#include "filter.hpp"
#include "log.hpp"

CWheelFilter::CWheelFilter(const SWheelConfig& config, IEventSink& sink, CLogger* logger) :
    m_sink(sink), m_logger(logger), m_vertical(config.debounceTime, config.debounceTimeout, "wheel", logger),
    m_horizontal(config.hDebounceTime, config.debounceTimeout, "hwheel", logger) {
    ;
}

void CWheelFilter::onEvent(const SRawEvent& event) {
    if (m_logger && m_logger->shouldLog(LOG_TRACE))
        m_logger->trace("event type=" + std::to_string(event.type) + " code=" + std::to_string(event.code) + " value=" + std::to_string(event.value));

    if (!event.isSyncMarker()) {
        m_grouper.push(event);
        return;
    }

    processBatch(m_grouper.flush(), event.arrival);

    m_sink.write(event);
}

void CWheelFilter::discardPending() {
    if (m_grouper.empty())
        return;

    if (m_logger)
        m_logger->debug("discarding " + std::to_string(m_grouper.size()) + " events of an incomplete report");

    m_grouper.flush();
}

void CWheelFilter::processBatch(const EventBatch& batch, Timestamp now) {
    const auto extracted = extractWheel(batch);

    for (const auto& e : extracted.passthrough) {
        m_sink.write(e);
    }

    if (!extracted.hadWheel)
        return;

    std::vector<SRawEvent> out;

    if (extracted.vertical.active()) {
        const auto filtered = m_vertical.smooth(extracted.vertical.hiRes, now);
        reconstructAxis(WHEEL_VERTICAL, filtered, now, out);
    }

    if (extracted.horizontal.active()) {
        const auto filtered = m_horizontal.smooth(extracted.horizontal.hiRes, now);
        reconstructAxis(WHEEL_HORIZONTAL, filtered, now, out);
    }

    for (const auto& e : out) {
        m_sink.write(e);
    }
}

const CWheelDebouncer& CWheelFilter::vertical() const {
    return m_vertical;
}

const CWheelDebouncer& CWheelFilter::horizontal() const {
    return m_horizontal;
}
