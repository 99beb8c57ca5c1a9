#pragma once

#include "mapstream/Geo.hpp"
#include "mapstream/MapFileInfo.hpp"

#include <cstdint>

namespace mapstream {

// Which blocks of a sub-file a tile query touches.
struct QueryParameters {
    int64_t fromBaseTileX = 0;
    int64_t fromBaseTileY = 0;
    int64_t toBaseTileX = 0;
    int64_t toBaseTileY = 0;

    int64_t fromBlockX = 0;
    int64_t fromBlockY = 0;
    int64_t toBlockX = 0;
    int64_t toBlockY = 0;

    uint8_t queryZoomLevel = 0;
    int queryTileBitmask = 0;
    bool useTileBitmask = false;

    void calculateBaseTiles(const Tile& tile, const SubFileParameter& subFile);
    void calculateBlocks(const SubFileParameter& subFile);
};

// A block at base zoom is split into 4x4 sub-tiles; ways carry a 16-bit mask
// of the sub-tiles they touch. Bit 15 is the top-left sub-tile, row by row.
int calculateTileBitmask(const Tile& tile, int zoomLevelDifference);

} // namespace mapstream
