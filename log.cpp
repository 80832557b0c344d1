#include "log.hpp"
#include "globals.hpp"
#include <cctype>

std::optional<eLogLevel> logLevelFromString(std::string str) {
    for (auto& c : str)
        c = std::tolower(static_cast<unsigned char>(c));

    if (str == "error")
        return LOG_ERROR;
    if (str == "warn" || str == "warning")
        return LOG_WARN;
    if (str == "info")
        return LOG_INFO;
    if (str == "debug")
        return LOG_DEBUG;
    if (str == "trace")
        return LOG_TRACE;

    return std::nullopt;
}

const char* logLevelName(eLogLevel level) {
    switch (level) {
        case LOG_ERROR: return "ERROR";
        case LOG_WARN: return "WARN";
        case LOG_INFO: return "INFO";
        case LOG_DEBUG: return "DEBUG";
        case LOG_TRACE: return "TRACE";
    }
    return "INFO";
}

CLogger::CLogger(eLogLevel level, std::ostream& out, std::ostream& err) : m_level(level), m_out(out), m_err(err) {
    ;
}

void CLogger::setLevel(eLogLevel level) {
    m_level = level;
}

eLogLevel CLogger::level() const {
    return m_level;
}

bool CLogger::shouldLog(eLogLevel level) const {
    return level <= m_level;
}

bool CLogger::setFile(const std::string& path) {
    if (m_file.is_open())
        m_file.close();

    if (path.empty())
        return true;

    m_file.open(path, std::ios::app);
    return m_file.is_open();
}

void CLogger::log(eLogLevel level, const std::string& msg) {
    if (!shouldLog(level))
        return;

    const std::string line = std::string(LOG_PREFIX) + " [" + logLevelName(level) + "] " + msg;

    auto& stream = level == LOG_ERROR ? m_err : m_out;
    stream << line << "\n";

    if (m_file.is_open())
        m_file << line << "\n" << std::flush;
}

void CLogger::error(const std::string& msg) {
    log(LOG_ERROR, msg);
}

void CLogger::warn(const std::string& msg) {
    log(LOG_WARN, msg);
}

void CLogger::info(const std::string& msg) {
    log(LOG_INFO, msg);
}

void CLogger::debug(const std::string& msg) {
    log(LOG_DEBUG, msg);
}

void CLogger::trace(const std::string& msg) {
    log(LOG_TRACE, msg);
}
