#include "mapstream/Config.hpp"

#include "mapstream/Hash.hpp"

#include <chrono>
#include <cstdlib>
#include <sstream>

#include <unistd.h>

namespace mapstream {

std::string getCacheRoot(){
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && xdg[0]) return std::string(xdg) + "/mapstream";
    const char* home = std::getenv("HOME");
    if (home && home[0]) return std::string(home) + "/.cache/mapstream";
    return "./.cache/mapstream";
}

std::string makeSessionName(){
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const uint64_t ns = (uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    return "session_" + std::to_string((long long)::getpid()) + "_" + hex64(ns);
}

SessionConfig defaultSessionConfig(){
    SessionConfig config;
    config.cacheRoot = getCacheRoot();
    config.sessionName = makeSessionName();
    return config;
}

static bool parseSize(const std::string& s, size_t& out){
    if(s.empty()) return false;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if(*end != '\0' || s[0] == '-') return false;
    out = (size_t)v;
    return true;
}

bool parseArgs(int argc, const char* const* argv, SessionConfig& config, std::string& error){
    int positional = 0;
    for(int i=1; i<argc; ++i){
        const std::string arg = argv[i];
        auto value = [&](std::string& out) -> bool {
            if(i + 1 >= argc){
                error = "missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string v;
        if(arg == "--memory-cache"){
            if(!value(v)) return false;
            if(!parseSize(v, config.memoryCacheCapacity)){ error = "invalid capacity: " + v; return false; }
        } else if(arg == "--disk-cache"){
            if(!value(v)) return false;
            if(!parseSize(v, config.diskCacheCapacity)){ error = "invalid capacity: " + v; return false; }
        } else if(arg == "--cache-root"){
            if(!value(config.cacheRoot)) return false;
        } else if(arg == "--mode"){
            if(!value(v)) return false;
            if(!parseMapViewMode(v, config.mapViewMode)){ error = "unknown mode: " + v; return false; }
        } else if(arg == "--theme"){
            if(!value(config.themeName)) return false;
        } else if(arg == "--text-scale"){
            if(!value(v)) return false;
            char* end = nullptr;
            config.textScale = std::strtof(v.c_str(), &end);
            if(v.empty() || *end != '\0' || !(config.textScale > 0.0f)){ error = "invalid text scale: " + v; return false; }
        } else if(arg == "--log-level"){
            if(!value(v)) return false;
            if(!parseLogLevel(v, config.logLevel)){ error = "unknown log level: " + v; return false; }
        } else if(arg == "--tile-frames"){
            config.debugSettings.drawTileFrames = true;
        } else if(arg == "--tile-coordinates"){
            config.debugSettings.drawTileCoordinates = true;
        } else if(arg == "--highlight-water"){
            config.debugSettings.highlightWaterTiles = true;
        } else if(arg.size() > 1 && arg[0] == '-'){
            error = "unknown option: " + arg;
            return false;
        } else if(positional == 0){
            config.mapFile = arg;
            ++positional;
        } else if(positional == 1){
            config.fontPath = arg;
            ++positional;
        } else {
            error = "unexpected argument: " + arg;
            return false;
        }
    }
    return true;
}

std::string usage(const char* argv0){
    std::ostringstream ss;
    ss << "Usage: " << argv0 << " [options] [map.map] [font.ttf]\n"
       << "  --memory-cache N      tiles kept in memory (default " << SessionConfig::DEFAULT_MEMORY_CACHE_CAPACITY << ")\n"
       << "  --disk-cache N        tiles kept on disk (default " << SessionConfig::DEFAULT_DISK_CACHE_CAPACITY << ")\n"
       << "  --cache-root DIR      disk cache location (default " << getCacheRoot() << ")\n"
       << "  --mode canvas         rendering mode\n"
       << "  --theme NAME          render theme name\n"
       << "  --text-scale F        label scale factor\n"
       << "  --log-level L         debug|info|warn|error|off\n"
       << "  --tile-frames         draw tile borders\n"
       << "  --tile-coordinates    label tiles with z/x/y\n"
       << "  --highlight-water     highlight water tiles\n";
    return ss.str();
}

} // namespace mapstream
