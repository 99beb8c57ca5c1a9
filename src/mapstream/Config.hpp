#pragma once

#include "mapstream/Log.hpp"
#include "mapstream/TileJob.hpp"

#include <cstddef>
#include <string>

namespace mapstream {

struct SessionConfig {
    static constexpr size_t DEFAULT_MEMORY_CACHE_CAPACITY = 20;
    static constexpr size_t DEFAULT_DISK_CACHE_CAPACITY = 100;

    std::string mapFile;
    std::string fontPath;

    size_t memoryCacheCapacity = DEFAULT_MEMORY_CACHE_CAPACITY;
    size_t diskCacheCapacity = DEFAULT_DISK_CACHE_CAPACITY;
    // Disk tiles go to <cacheRoot>/<sessionName>/.
    std::string cacheRoot;
    std::string sessionName;

    MapViewMode mapViewMode = MapViewMode::CanvasRenderer;
    std::string themeName = "default";
    float textScale = 1.0f;
    DebugSettings debugSettings;
    LogLevel logLevel = LogLevel::Info;
};

// $XDG_CACHE_HOME/mapstream, else $HOME/.cache/mapstream, else ./.cache/mapstream.
std::string getCacheRoot();

// Unique per process start, e.g. "session_1234_0000018c6f...".
std::string makeSessionName();

// Defaults with cache root and session name filled in.
SessionConfig defaultSessionConfig();

// Command line: [options] [map.map] [font.ttf]. Returns false with `error` set
// on a malformed option.
bool parseArgs(int argc, const char* const* argv, SessionConfig& config, std::string& error);

std::string usage(const char* argv0);

} // namespace mapstream
