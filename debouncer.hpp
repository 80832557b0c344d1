#pragma once
#include "globals.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Per-axis reversal filter for hi-res wheel deltas. One instance per axis per device session.
class CWheelDebouncer {
  public:
    CWheelDebouncer(std::chrono::milliseconds debounceTime, std::chrono::milliseconds debounceTimeout, const char* axisName = "wheel",
                    CLogger* logger = nullptr);

    // Returns the delta to emit for this report, 0 means drop it.
    int32_t smooth(int32_t value, Timestamp now);

    int  lastDirection() const;
    bool debouncing() const;
    bool scrolling() const;

  private:
    void                      log(eLogLevel level, const std::string& msg) const;

    std::chrono::milliseconds m_debounceTime;
    std::chrono::milliseconds m_debounceTimeout;
    const char*               m_axisName = "wheel";
    CLogger*                  m_logger   = nullptr;

    int                       m_lastDirection = 0;
    bool                      m_scrolling     = false;
    // unset until the first report, which always starts a new gesture
    std::optional<Timestamp>  m_lastEventTime;
    std::optional<Timestamp>  m_debounceStart;
};
