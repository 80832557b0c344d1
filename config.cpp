#include "config.hpp"
#include "log.hpp"
#include <hyprlang.hpp>
#include <any>
#include <filesystem>
#include <fstream>
#include <stdexcept>

static std::chrono::milliseconds durationValue(Hyprlang::CConfig& config, const char* name) {
    const auto value = std::any_cast<Hyprlang::INT>(config.getConfigValue(name));
    if (value < 0)
        throw std::runtime_error(std::string("config error: ") + name + " must not be negative, got " + std::to_string(value));

    return std::chrono::milliseconds(value);
}

static std::string stringValue(Hyprlang::CConfig& config, const char* name) {
    const auto value = std::any_cast<Hyprlang::STRING>(config.getConfigValue(name));
    return value ? std::string(value) : std::string{};
}

static SConfig parseConfig(const std::string& source, bool isStream) {
    Hyprlang::SConfigOptions options;
    options.pathIsStream = isStream;

    Hyprlang::CConfig config(source.c_str(), options);

    config.addConfigValue("device:path", Hyprlang::STRING{""});
    config.addConfigValue("device:name_filter", Hyprlang::STRING{""});
    config.addConfigValue("wheel:debounce_time_ms", Hyprlang::INT{50});
    config.addConfigValue("wheel:h_debounce_time_ms", Hyprlang::INT{50});
    config.addConfigValue("wheel:debounce_timeout_ms", Hyprlang::INT{300});
    config.addConfigValue("logging:level", Hyprlang::STRING{"info"});
    config.addConfigValue("logging:file", Hyprlang::STRING{""});

    config.commence();

    const auto result = config.parse();
    if (result.error)
        throw std::runtime_error(std::string("config error: ") + result.getError());

    SConfig out;
    out.device.path           = stringValue(config, "device:path");
    out.device.nameFilter     = stringValue(config, "device:name_filter");
    out.wheel.debounceTime    = durationValue(config, "wheel:debounce_time_ms");
    out.wheel.hDebounceTime   = durationValue(config, "wheel:h_debounce_time_ms");
    out.wheel.debounceTimeout = durationValue(config, "wheel:debounce_timeout_ms");
    out.logging.level         = stringValue(config, "logging:level");
    out.logging.file          = stringValue(config, "logging:file");

    return out;
}

SConfig loadConfig(const std::string& path, CLogger* logger) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (logger)
            logger->info("config file " + path + " not found, using defaults");
        return SConfig{};
    }

    auto config = parseConfig(path, false);
    if (logger)
        logger->info("loaded config file " + path);

    return config;
}

SConfig parseConfigString(const std::string& contents) {
    return parseConfig(contents, true);
}

std::string defaultConfigText() {
    return "# wheel-smoother configuration\n"
           "\n"
           "device {\n"
           "    # event node or 1-based index from --list, empty = ask\n"
           "    # path = /dev/input/event3\n"
           "\n"
           "    # only consider devices whose name contains this\n"
           "    # name_filter = Logitech\n"
           "}\n"
           "\n"
           "wheel {\n"
           "    # a gap longer than this starts a new scroll gesture\n"
           "    debounce_time_ms = 50\n"
           "    h_debounce_time_ms = 50\n"
           "\n"
           "    # longest run of reversals that may be dropped as jitter\n"
           "    debounce_timeout_ms = 300\n"
           "}\n"
           "\n"
           "logging {\n"
           "    # error, warn, info, debug, trace\n"
           "    level = info\n"
           "\n"
           "    # file = /var/log/wheel-smoother.log\n"
           "}\n";
}

void writeDefaultConfig(const std::string& path, CLogger* logger) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (logger)
            logger->info("config file " + path + " already exists, leaving it alone");
        return;
    }

    std::ofstream file(path);
    if (!file.is_open())
        throw std::runtime_error("cannot write config file " + path);

    file << defaultConfigText();
    file.close();
    if (!file)
        throw std::runtime_error("failed writing config file " + path);

    if (logger)
        logger->info("created default config file " + path);
}
