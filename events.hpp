#pragma once
#include "globals.hpp"
#include <linux/input.h>
#include <cstdint>
#include <vector>

struct SRawEvent {
    uint16_t  type    = 0;
    uint16_t  code    = 0;
    int32_t   value   = 0;
    Timestamp arrival = {};

    bool isSyncMarker() const {
        return type == EV_SYN && code == SYN_REPORT;
    }

    // arrival time is not part of the event identity
    bool operator==(const SRawEvent& other) const {
        return type == other.type && code == other.code && value == other.value;
    }
};

using EventBatch = std::vector<SRawEvent>;

// Destination of a filtered stream. Writes are synchronous and keep submission order, failures throw.
class IEventSink {
  public:
    virtual ~IEventSink() = default;

    virtual void write(const SRawEvent& event) = 0;
};
