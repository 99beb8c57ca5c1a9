#include "mapstream/TileJob.hpp"

#include "mapstream/Hash.hpp"

#include <cstring>
#include <sstream>

namespace mapstream {

const char* mapViewModeName(MapViewMode mode){
    switch(mode){
        case MapViewMode::CanvasRenderer: return "canvas";
    }
    return "unknown";
}

bool requiresInternetConnection(MapViewMode mode){
    switch(mode){
        case MapViewMode::CanvasRenderer: return false;
    }
    return false;
}

bool parseMapViewMode(const std::string& name, MapViewMode& out){
    if(name == "canvas" || name == "CANVAS_RENDERER"){
        out = MapViewMode::CanvasRenderer;
        return true;
    }
    return false;
}

// Fields are hashed in a fixed little-endian layout so the disk tier keeps
// finding its files after a restart.
static uint64_t hashInt(uint64_t h, int64_t v){
    uint8_t b[8];
    for(int i=0;i<8;i++) b[i] = (uint8_t)((uint64_t)v >> (8*i));
    return fnv1a64(b, sizeof(b), h);
}

uint64_t TileJob::cacheKeyHash() const {
    uint64_t h = kFnvOffsetBasis;
    h = hashInt(h, tile.tileX);
    h = hashInt(h, tile.tileY);
    h = hashInt(h, tile.zoomLevel);
    h = hashInt(h, (int64_t)mapViewMode);
    h = hashInt(h, (int64_t)jobParameters.mapFile.size());
    h = fnv1a64_str(jobParameters.mapFile, h);
    h = hashInt(h, (int64_t)jobParameters.themeName.size());
    h = fnv1a64_str(jobParameters.themeName, h);
    uint32_t scaleBits = 0;
    std::memcpy(&scaleBits, &jobParameters.textScale, sizeof(scaleBits));
    h = hashInt(h, scaleBits);
    const int flags = (debugSettings.drawTileCoordinates ? 1 : 0)
                    | (debugSettings.drawTileFrames ? 2 : 0)
                    | (debugSettings.highlightWaterTiles ? 4 : 0);
    h = hashInt(h, flags);
    return h;
}

std::string TileJob::toString() const {
    std::ostringstream ss;
    ss << tile.toString() << " " << mapViewModeName(mapViewMode) << " " << jobParameters.mapFile;
    return ss.str();
}

} // namespace mapstream
