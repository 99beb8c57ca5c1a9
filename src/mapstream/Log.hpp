#pragma once

#include <sstream>
#include <string>

namespace mapstream {

// Console logging in the "[Tag] message" style.
// Info/debug go to stdout, warnings/errors to stderr. Lines from the worker
// and the caller thread never interleave.

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool parseLogLevel(const std::string& name, LogLevel& out);

void logMessage(LogLevel level, const char* tag, const std::string& message);

inline void logDebug(const char* tag, const std::string& message){ logMessage(LogLevel::Debug, tag, message); }
inline void logInfo(const char* tag, const std::string& message){ logMessage(LogLevel::Info, tag, message); }
inline void logWarn(const char* tag, const std::string& message){ logMessage(LogLevel::Warn, tag, message); }
inline void logError(const char* tag, const std::string& message){ logMessage(LogLevel::Error, tag, message); }

// Concatenate streamable values: logWarn("Cache", str("bad file ", path)).
template <typename... Args>
std::string str(const Args&... args){
    std::ostringstream ss;
    (ss << ... << args);
    return ss.str();
}

} // namespace mapstream
