#include "cli.hpp"
#include "config.hpp"
#include "device.hpp"
#include "log.hpp"
#include "session.hpp"
#include <iostream>
#include <string>
#include <vector>

static void applyLogLevel(CLogger& logger, const std::string& level) {
    if (const auto parsed = logLevelFromString(level)) {
        logger.setLevel(*parsed);
        logger.info(std::string("log level set to ") + logLevelName(*parsed));
        return;
    }

    logger.setLevel(LOG_INFO);
    logger.warn("invalid log level '" + level + "', using INFO");
}

static int runSmoother(const SCliOptions& opts, CLogger& logger) {
    if (!isRoot()) {
        logger.error("root is required to access input devices, run with sudo");
        return 1;
    }

    if (opts.createConfig) {
        writeDefaultConfig(opts.configPath, &logger);
        if (!opts.listOnly) {
            logger.info("default config written, exiting");
            return 0;
        }
    }

    const auto config = loadConfig(opts.configPath, &logger);

    // command line wins over the config file
    applyLogLevel(logger, opts.logLevel.value_or(config.logging.level));

    if (!config.logging.file.empty() && !logger.setFile(config.logging.file))
        logger.warn("cannot open log file " + config.logging.file);

    auto devices = findMouseDevices();

    if (!config.device.nameFilter.empty()) {
        devices = filterByName(devices, config.device.nameFilter);
        logger.info("name filter '" + config.device.nameFilter + "' matched " + std::to_string(devices.size()) + " device(s)");
    }

    if (devices.empty()) {
        logger.error("no mouse devices found");
        return 1;
    }

    if (opts.listOnly) {
        logger.info("available mouse devices:");
        printDeviceList(devices, std::cout);
        return 0;
    }

    std::optional<std::string> spec = opts.device;
    if (!spec && !config.device.path.empty())
        spec = config.device.path;

    const auto device = selectDevice(devices, spec, std::cin, std::cout, &logger);

    CSmootherSession session(device.path, config.wheel, &logger);
    session.run();

    logger.info("device released");
    return 0;
}

int main(int argc, char** argv) {
    CLogger logger;

    SCliOptions opts;
    try {
        opts = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const CUsageError& e) {
        logger.error(e.what());
        printUsage(std::cout);
        return 1;
    }

    if (opts.help) {
        printUsage(std::cout);
        return 0;
    }

    try {
        return runSmoother(opts, logger);
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }
}
