#include "wheel.hpp"
#include <algorithm>
#include <limits>

SWheelCodes wheelCodes(eWheelAxis axis) {
    if (axis == WHEEL_HORIZONTAL)
        return {REL_HWHEEL, REL_HWHEEL_HI_RES};
    return {REL_WHEEL, REL_WHEEL_HI_RES};
}

bool isWheelEvent(const SRawEvent& event) {
    if (event.type != EV_REL)
        return false;

    return event.code == REL_WHEEL || event.code == REL_WHEEL_HI_RES || event.code == REL_HWHEEL || event.code == REL_HWHEEL_HI_RES;
}

SExtractedBatch extractWheel(const EventBatch& batch) {
    SExtractedBatch out;

    for (const auto& e : batch) {
        if (!isWheelEvent(e)) {
            out.passthrough.push_back(e);
            continue;
        }

        out.hadWheel = true;

        // one report per cycle: a repeated code overwrites the earlier value
        switch (e.code) {
            case REL_WHEEL: out.vertical.standard = e.value; break;
            case REL_WHEEL_HI_RES: out.vertical.hiRes = e.value; break;
            case REL_HWHEEL: out.horizontal.standard = e.value; break;
            case REL_HWHEEL_HI_RES: out.horizontal.hiRes = e.value; break;
            default: break;
        }
    }

    for (auto* sample : {&out.vertical, &out.horizontal}) {
        if (sample->hiRes == 0 && sample->standard != 0)
            sample->hiRes = std::clamp<int64_t>(int64_t{sample->standard} * HIRES_PER_NOTCH, std::numeric_limits<int32_t>::min(),
                                                std::numeric_limits<int32_t>::max());
    }

    return out;
}

void reconstructAxis(eWheelAxis axis, int32_t filtered, Timestamp when, std::vector<SRawEvent>& out) {
    if (filtered == 0)
        return;

    const auto codes    = wheelCodes(axis);
    const auto standard = filtered / HIRES_PER_NOTCH; // truncates toward zero

    if (standard != 0)
        out.push_back({EV_REL, codes.standard, standard, when});

    out.push_back({EV_REL, codes.hiRes, filtered, when});
}
