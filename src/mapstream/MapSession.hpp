#pragma once

#include "mapstream/Config.hpp"
#include "mapstream/FileSystemTileCache.hpp"
#include "mapstream/JobQueue.hpp"
#include "mapstream/MapDatabase.hpp"
#include "mapstream/MapGenerator.hpp"
#include "mapstream/MapPosition.hpp"
#include "mapstream/TileCache.hpp"
#include "mapstream/TileWorker.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mapstream {

// A tile of the current viewport. `bitmap` is null while the tile is queued.
struct VisibleTile {
    Tile tile;
    TileBitmapPtr bitmap;
    // top-left corner relative to the viewport's top-left, in pixels
    double screenX = 0.0;
    double screenY = 0.0;
};

// Owns everything a map view needs: the open map file, the viewport position,
// the job queue, both cache tiers and the tile worker. All methods are meant
// for the caller (UI) thread.
class MapSession {
public:
    explicit MapSession(const SessionConfig& config);
    ~MapSession();

    MapSession(const MapSession&) = delete;
    MapSession& operator=(const MapSession&) = delete;

    // Swaps the map file with the worker paused. On failure the previous file
    // stays open; pending jobs are dropped either way.
    FileOpenResult setMapFile(const std::string& path);
    const std::string& getMapFile() const { return m_jobParameters.mapFile; }

    // Collects the tiles covering a width x height viewport: cached ones are
    // returned with their bitmap, missing ones are queued.
    std::vector<VisibleTile> redraw(int width, int height);

    void moveMap(double dx, double dy){ m_mapPosition.moveMap(dx, dy); }
    // Returns false if the new zoom level is out of range.
    bool zoom(int zoomLevelDiff);
    void setCenterAndZoom(const GeoPoint& center, int zoomLevel);

    void setDebugSettings(const DebugSettings& debugSettings);
    const DebugSettings& getDebugSettings() const { return m_debugSettings; }
    void setTextScale(float textScale);
    void setThemeName(const std::string& themeName);

    // Invoked on the worker thread for every finished tile.
    void setRepaintCallback(TileWorker::RepaintCallback callback);

    // Stops the worker and releases the map file and both cache tiers.
    void destroy();

    MapPosition& getMapPosition() { return m_mapPosition; }
    MapDatabase& getMapDatabase() { return m_mapDatabase; }
    JobQueue& getJobQueue() { return m_jobQueue; }
    TileCache& getMemoryCache() { return m_memoryCache; }
    TileCache& getDiskCache() { return m_diskCache; }
    const std::string& getDiskCacheDirectory() const { return m_diskCache.getStore().getDirectory(); }
    TileWorker& getTileWorker() { return m_worker; }

private:
    TileJob makeJob(const Tile& tile) const;

    const MapViewMode m_mapViewMode;
    JobParameters m_jobParameters;
    DebugSettings m_debugSettings;

    MapPosition m_mapPosition;
    MapDatabase m_mapDatabase;
    std::unique_ptr<MapGenerator> m_mapGenerator;
    JobQueue m_jobQueue;
    InMemoryTileCache m_memoryCache;
    FileSystemTileCache m_diskCache;
    TileWorker m_worker;
    bool m_destroyed = false;
};

} // namespace mapstream
