#pragma once
#include "globals.hpp"
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct SCliOptions {
    bool                       listOnly     = false;
    bool                       createConfig = false;
    bool                       help         = false;
    std::optional<std::string> device;
    std::optional<std::string> logLevel;
    std::string                configPath = DEFAULT_CONFIG_PATH;
};

class CUsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// args excludes argv[0]. Throws CUsageError on unknown options or missing values.
SCliOptions parseArgs(const std::vector<std::string>& args);
void        printUsage(std::ostream& out);
