#pragma once

#include "mapstream/Geo.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace mapstream {

// Rendering modes. Selected once per session; see createMapGenerator().
enum class MapViewMode {
    CanvasRenderer,
};

const char* mapViewModeName(MapViewMode mode);
// True for modes that fetch tiles instead of rendering a local map file.
bool requiresInternetConnection(MapViewMode mode);
bool parseMapViewMode(const std::string& name, MapViewMode& out);

// Data and style a tile is rendered from.
struct JobParameters {
    std::string mapFile;
    std::string themeName = "default";
    float textScale = 1.0f;

    bool operator==(const JobParameters& o) const {
        return mapFile == o.mapFile && themeName == o.themeName && textScale == o.textScale;
    }
    bool operator!=(const JobParameters& o) const { return !(*this == o); }
};

struct DebugSettings {
    bool drawTileCoordinates = false;
    bool drawTileFrames = false;
    bool highlightWaterTiles = false;

    bool operator==(const DebugSettings& o) const {
        return drawTileCoordinates == o.drawTileCoordinates && drawTileFrames == o.drawTileFrames
            && highlightWaterTiles == o.highlightWaterTiles;
    }
    bool operator!=(const DebugSettings& o) const { return !(*this == o); }
};

// One unit of rendering work. Two jobs are equal when every field is; the
// caches and the queue key on this.
struct TileJob {
    Tile tile;
    MapViewMode mapViewMode = MapViewMode::CanvasRenderer;
    JobParameters jobParameters;
    DebugSettings debugSettings;

    TileJob() = default;
    TileJob(const Tile& t, MapViewMode mode, JobParameters params, DebugSettings debug)
        : tile(t), mapViewMode(mode), jobParameters(std::move(params)), debugSettings(debug) {}

    // Stable across runs and platforms; names the file of the disk tier.
    uint64_t cacheKeyHash() const;

    bool operator==(const TileJob& o) const {
        return tile == o.tile && mapViewMode == o.mapViewMode
            && jobParameters == o.jobParameters && debugSettings == o.debugSettings;
    }
    bool operator!=(const TileJob& o) const { return !(*this == o); }

    std::string toString() const;
};

struct TileJobHash {
    size_t operator()(const TileJob& job) const noexcept { return (size_t)job.cacheKeyHash(); }
};

} // namespace mapstream
