#pragma once
#include <chrono>
#include <cstdint>

using Timestamp = std::chrono::steady_clock::time_point;

// hi-res wheel units per legacy notch (kernel REL_WHEEL_HI_RES convention)
constexpr int32_t HIRES_PER_NOTCH = 120;

// slow reversals at or below this magnitude are still treated as jitter
constexpr int32_t REVERSAL_MAGNITUDE_FLOOR = 300;

constexpr const char* LOG_PREFIX            = "[wheel-smoother]";
constexpr const char* DEFAULT_CONFIG_PATH   = "/etc/wheel-smoother.conf";
constexpr const char* INPUT_DEVICE_DIR      = "/dev/input";
