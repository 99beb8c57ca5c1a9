#include "mapstream/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace mapstream {

static std::atomic<int> gLogLevel{(int)LogLevel::Info};
static std::mutex gLogMutex;

void setLogLevel(LogLevel level){
    gLogLevel.store((int)level);
}

LogLevel getLogLevel(){
    return (LogLevel)gLogLevel.load();
}

bool parseLogLevel(const std::string& name, LogLevel& out){
    if(name == "debug") out = LogLevel::Debug;
    else if(name == "info") out = LogLevel::Info;
    else if(name == "warn") out = LogLevel::Warn;
    else if(name == "error") out = LogLevel::Error;
    else if(name == "off") out = LogLevel::Off;
    else return false;
    return true;
}

void logMessage(LogLevel level, const char* tag, const std::string& message){
    if((int)level < gLogLevel.load() || level == LogLevel::Off) return;

    std::lock_guard<std::mutex> lk(gLogMutex);
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if(level == LogLevel::Warn) os << "Warning: ";
    else if(level == LogLevel::Error) os << "ERROR: ";
    os << message << "\n";
}

} // namespace mapstream
