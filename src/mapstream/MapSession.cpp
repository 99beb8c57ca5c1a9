#include "mapstream/MapSession.hpp"

#include "mapstream/Log.hpp"

#include <cmath>

namespace mapstream {

MapSession::MapSession(const SessionConfig& config)
    : m_mapViewMode(config.mapViewMode),
      m_debugSettings(config.debugSettings),
      m_mapGenerator(createMapGenerator(config.mapViewMode, m_mapDatabase)),
      m_jobQueue(m_mapPosition),
      m_memoryCache(config.memoryCacheCapacity, MemoryTileStore()),
      m_diskCache(config.diskCacheCapacity, FileTileStore(config.cacheRoot + "/" + config.sessionName)),
      m_worker(m_jobQueue, m_memoryCache, m_diskCache)
{
    m_jobParameters.themeName = config.themeName;
    m_jobParameters.textScale = config.textScale;

    if(m_mapGenerator){
        m_mapPosition.setZoomLevelMax(m_mapGenerator->getZoomLevelMax());
    } else {
        logError("MapSession", std::string("no generator for mode ") + mapViewModeName(config.mapViewMode));
    }
    m_worker.setMapGenerator(m_mapGenerator.get());
    m_worker.start();

    logInfo("MapSession", str("Tile cache: ", config.memoryCacheCapacity, " in memory, ",
                              config.diskCacheCapacity, " on disk in ", getDiskCacheDirectory()));
}

MapSession::~MapSession(){
    destroy();
}

FileOpenResult MapSession::setMapFile(const std::string& path){
    if(requiresInternetConnection(m_mapViewMode)){
        return FileOpenResult::failure(FileOpenResult::ErrorKind::IoError,
                                       std::string("mode does not use map files: ") + mapViewModeName(m_mapViewMode));
    }

    m_worker.pause();
    m_worker.awaitPausing();

    m_jobQueue.clear();
    FileOpenResult result = m_mapDatabase.openFile(path);
    if(result.isSuccess()){
        m_jobParameters.mapFile = path;
        // tiles of the previous file are never shown again
        m_memoryCache.clear();
        m_diskCache.clear();
        if(m_mapGenerator){
            std::optional<GeoPoint> startPoint = m_mapGenerator->getStartPoint();
            if(startPoint) m_mapPosition.setMapCenterAndZoomLevel(*startPoint, m_mapGenerator->getZoomLevelDefault());
        }
    } else {
        logWarn("MapSession", "keeping " + (m_jobParameters.mapFile.empty() ? std::string("no map file") : m_jobParameters.mapFile)
                              + ": " + result.toString());
    }

    m_worker.proceed();
    return result;
}

TileJob MapSession::makeJob(const Tile& tile) const {
    return TileJob(tile, m_mapViewMode, m_jobParameters, m_debugSettings);
}

std::vector<VisibleTile> MapSession::redraw(int width, int height){
    std::vector<VisibleTile> visible;
    if(width <= 0 || height <= 0 || !m_mapPosition.isValid() || m_destroyed) return visible;

    const MapPositionFix fix = m_mapPosition.getMapPositionFix();
    const double pixelLeft = MercatorProjection::longitudeToPixelX(fix.longitude, fix.zoomLevel) - (width >> 1);
    const double pixelTop = MercatorProjection::latitudeToPixelY(fix.latitude, fix.zoomLevel) - (height >> 1);

    const int64_t tileLeft = MercatorProjection::pixelXToTileX(pixelLeft, fix.zoomLevel);
    const int64_t tileTop = MercatorProjection::pixelYToTileY(pixelTop, fix.zoomLevel);
    const int64_t tileRight = MercatorProjection::pixelXToTileX(pixelLeft + width, fix.zoomLevel);
    const int64_t tileBottom = MercatorProjection::pixelYToTileY(pixelTop + height, fix.zoomLevel);

    for(int64_t tileY=tileTop; tileY<=tileBottom; ++tileY){
        for(int64_t tileX=tileLeft; tileX<=tileRight; ++tileX){
            VisibleTile vt;
            vt.tile = Tile(tileX, tileY, fix.zoomLevel);
            vt.screenX = (double)vt.tile.getPixelX() - pixelLeft;
            vt.screenY = (double)vt.tile.getPixelY() - pixelTop;

            const TileJob job = makeJob(vt.tile);
            vt.bitmap = m_memoryCache.get(job);
            if(!vt.bitmap){
                vt.bitmap = m_diskCache.get(job);
                if(vt.bitmap){
                    m_memoryCache.put(job, vt.bitmap);
                } else {
                    // cache miss, or the stored image could not be read
                    m_jobQueue.addJob(job);
                }
            }
            visible.push_back(std::move(vt));
        }
    }

    m_jobQueue.requestSchedule();
    return visible;
}

bool MapSession::zoom(int zoomLevelDiff){
    const int zoomLevel = (int)m_mapPosition.getZoomLevel() + zoomLevelDiff;
    if(zoomLevel < 0 || zoomLevel > (int)m_mapPosition.getZoomLevelMax()) return false;
    m_mapPosition.setZoomLevel(zoomLevel);
    return true;
}

void MapSession::setCenterAndZoom(const GeoPoint& center, int zoomLevel){
    m_mapPosition.setMapCenterAndZoomLevel(center, zoomLevel);
}

void MapSession::setDebugSettings(const DebugSettings& debugSettings){
    m_debugSettings = debugSettings;
    // queued jobs carry the old key
    m_jobQueue.clear();
}

void MapSession::setTextScale(float textScale){
    m_jobParameters.textScale = textScale;
    m_jobQueue.clear();
}

void MapSession::setThemeName(const std::string& themeName){
    m_jobParameters.themeName = themeName;
    m_jobQueue.clear();
}

void MapSession::setRepaintCallback(TileWorker::RepaintCallback callback){
    m_worker.pause();
    m_worker.awaitPausing();
    m_worker.setRepaintCallback(std::move(callback));
    m_worker.proceed();
}

void MapSession::destroy(){
    if(m_destroyed) return;
    m_destroyed = true;

    m_jobQueue.interrupt();
    m_worker.interrupt();
    m_worker.join();

    m_memoryCache.destroy();
    m_diskCache.destroy();
    m_mapDatabase.closeFile();
    logDebug("MapSession", "destroyed");
}

} // namespace mapstream
