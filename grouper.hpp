#pragma once
#include "events.hpp"

// Collects the events of one hardware report between two SYN_REPORTs.
class CEventGrouper {
  public:
    void       push(const SRawEvent& event);
    EventBatch flush();

    bool       empty() const;
    size_t     size() const;

  private:
    EventBatch m_batch;
};
