#pragma once
#include "config.hpp"
#include "debouncer.hpp"
#include "grouper.hpp"
#include "wheel.hpp"

// The per-device pipeline: group a report, debounce its wheel axes, rebuild and forward it.
class CWheelFilter {
  public:
    CWheelFilter(const SWheelConfig& config, IEventSink& sink, CLogger* logger = nullptr);

    // Feed every event read from the device, SYN_REPORT included.
    void                   onEvent(const SRawEvent& event);
    // Drops the events collected since the last SYN_REPORT, after the kernel lost some of them.
    void                   discardPending();

    const CWheelDebouncer& vertical() const;
    const CWheelDebouncer& horizontal() const;

  private:
    void            processBatch(const EventBatch& batch, Timestamp now);

    IEventSink&     m_sink;
    CLogger*        m_logger = nullptr;

    CEventGrouper   m_grouper;
    CWheelDebouncer m_vertical;
    CWheelDebouncer m_horizontal;
};
