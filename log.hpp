#pragma once
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

enum eLogLevel : uint8_t {
    LOG_ERROR = 0,
    LOG_WARN,
    LOG_INFO,
    LOG_DEBUG,
    LOG_TRACE,
};

std::optional<eLogLevel> logLevelFromString(std::string str);
const char*              logLevelName(eLogLevel level);

// Owned by main and handed to whoever logs. Not thread safe, the whole tool is single threaded.
class CLogger {
  public:
    explicit CLogger(eLogLevel level = LOG_INFO, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void      setLevel(eLogLevel level);
    eLogLevel level() const;
    bool      shouldLog(eLogLevel level) const;

    // Also append every line to this file. Returns false if it cannot be opened.
    bool setFile(const std::string& path);

    void log(eLogLevel level, const std::string& msg);

    void error(const std::string& msg);
    void warn(const std::string& msg);
    void info(const std::string& msg);
    void debug(const std::string& msg);
    void trace(const std::string& msg);

  private:
    eLogLevel     m_level = LOG_INFO;
    std::ostream& m_out;
    std::ostream& m_err;
    std::ofstream m_file;
};
