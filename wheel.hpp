#pragma once
#include "events.hpp"
#include <cstdint>
#include <vector>

enum eWheelAxis : uint8_t {
    WHEEL_VERTICAL = 0,
    WHEEL_HORIZONTAL,
};

struct SWheelSample {
    int32_t standard = 0; // notches
    int32_t hiRes    = 0; // HIRES_PER_NOTCH per notch

    bool active() const {
        return hiRes != 0;
    }
};

struct SExtractedBatch {
    SWheelSample           vertical;
    SWheelSample           horizontal;
    bool                   hadWheel = false; // any wheel event, even a zero one
    std::vector<SRawEvent> passthrough;
};

struct SWheelCodes {
    uint16_t standard;
    uint16_t hiRes;
};

SWheelCodes     wheelCodes(eWheelAxis axis);
bool            isWheelEvent(const SRawEvent& event);

SExtractedBatch extractWheel(const EventBatch& batch);

// Appends the events carrying a filtered hi-res delta: nothing for 0, otherwise an optional notch event and the hi-res event.
void            reconstructAxis(eWheelAxis axis, int32_t filtered, Timestamp when, std::vector<SRawEvent>& out);
