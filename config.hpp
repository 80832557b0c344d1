#pragma once
#include <chrono>
#include <string>

class CLogger;

struct SDeviceConfig {
    std::string path;       // index or /dev/input path, empty = ask
    std::string nameFilter; // substring of the device name, empty = all
};

struct SWheelConfig {
    std::chrono::milliseconds debounceTime{50};
    std::chrono::milliseconds hDebounceTime{50};
    std::chrono::milliseconds debounceTimeout{300};
};

struct SLoggingConfig {
    std::string level = "info";
    std::string file;
};

struct SConfig {
    SDeviceConfig  device;
    SWheelConfig   wheel;
    SLoggingConfig logging;
};

// Loads a Hyprlang config file. A missing file gives the defaults, a broken one throws std::runtime_error.
SConfig     loadConfig(const std::string& path, CLogger* logger = nullptr);
SConfig     parseConfigString(const std::string& contents);

std::string defaultConfigText();
// Writes defaultConfigText() to path unless the file already exists.
void        writeDefaultConfig(const std::string& path, CLogger* logger = nullptr);
