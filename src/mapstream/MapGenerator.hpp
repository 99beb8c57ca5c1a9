#pragma once

#include "mapstream/Geo.hpp"
#include "mapstream/TileBitmap.hpp"
#include "mapstream/TileJob.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace mapstream {

class MapDatabase;

// Produces tile images for one MapViewMode.
class MapGenerator {
public:
    virtual ~MapGenerator() = default;

    // Renders `job` into `bitmap`. A false return means the image is
    // unusable and must not be cached.
    virtual bool executeJob(const TileJob& job, TileBitmap& bitmap) = 0;

    // Where to centre a fresh view; empty if the generator has no data yet.
    virtual std::optional<GeoPoint> getStartPoint() const = 0;
    virtual uint8_t getZoomLevelDefault() const = 0;
    virtual uint8_t getZoomLevelMax() const = 0;
    virtual bool requiresInternetConnection() const = 0;

    // Called by the worker thread before it exits.
    virtual void cleanup() {}
};

// The generator for `mode`; `database` must outlive it.
std::unique_ptr<MapGenerator> createMapGenerator(MapViewMode mode, MapDatabase& database);

} // namespace mapstream
