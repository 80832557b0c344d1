#include "debouncer.hpp"
#include <cstdlib>

static std::string toMs(Timestamp::duration d) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(d).count()) + "ms";
}

CWheelDebouncer::CWheelDebouncer(std::chrono::milliseconds debounceTime, std::chrono::milliseconds debounceTimeout, const char* axisName, CLogger* logger) :
    m_debounceTime(debounceTime), m_debounceTimeout(debounceTimeout), m_axisName(axisName), m_logger(logger) {
    ;
}

int32_t CWheelDebouncer::smooth(int32_t value, Timestamp now) {
    const int direction = value > 0 ? 1 : (value < 0 ? -1 : 0);

    // first report ever, or the wheel rested long enough: new gesture, take it as is
    if (!m_lastEventTime || now - *m_lastEventTime > m_debounceTime) {
        if (m_lastEventTime)
            log(LOG_DEBUG, "new gesture after " + toMs(now - *m_lastEventTime) + " idle, value " + std::to_string(value));
        else
            log(LOG_DEBUG, "first report, value " + std::to_string(value));

        m_scrolling     = true;
        m_lastDirection = direction;
        m_lastEventTime = now;
        m_debounceStart.reset();
        return value;
    }

    const auto sinceLast = now - *m_lastEventTime;
    m_lastEventTime      = now;

    log(LOG_TRACE,
        "report dir " + std::to_string(m_lastDirection) + " -> " + std::to_string(direction) + " value " + std::to_string(value) + " after " + toMs(sinceLast));

    if (direction != 0 && direction != m_lastDirection) {
        if (m_debounceStart && now - *m_debounceStart > m_debounceTimeout) {
            log(LOG_INFO, "reversal held for " + toMs(now - *m_debounceStart) + ", accepting direction " + std::to_string(direction));
            m_debounceStart.reset();
            m_lastDirection = direction;
            return value;
        }

        // reversed right after the previous report: mechanical bounce.
        // m_lastDirection stays, so a back-and-forth run keeps resolving against the original direction
        if (sinceLast < m_debounceTimeout) {
            if (!m_debounceStart) {
                m_debounceStart = now;
                log(LOG_DEBUG, "suppression started");
            }

            log(LOG_INFO, "dropped reversal jitter " + std::to_string(m_lastDirection) + " -> " + std::to_string(direction) + " after " + toMs(sinceLast));
            return 0;
        }

        if (std::abs(int64_t{value}) <= REVERSAL_MAGNITUDE_FLOOR) {
            log(LOG_INFO, "dropped small reversal " + std::to_string(value));
            return 0;
        }

        log(LOG_INFO, "direction change " + std::to_string(m_lastDirection) + " -> " + std::to_string(direction) + " value " + std::to_string(value));
        m_scrolling     = true;
        m_lastDirection = direction;
        m_debounceStart.reset();
        return value;
    }

    if (direction != 0)
        m_lastDirection = direction;

    return value;
}

int CWheelDebouncer::lastDirection() const {
    return m_lastDirection;
}

bool CWheelDebouncer::debouncing() const {
    return m_debounceStart.has_value();
}

bool CWheelDebouncer::scrolling() const {
    return m_scrolling;
}

void CWheelDebouncer::log(eLogLevel level, const std::string& msg) const {
    if (m_logger && m_logger->shouldLog(level))
        m_logger->log(level, std::string(m_axisName) + ": " + msg);
}
