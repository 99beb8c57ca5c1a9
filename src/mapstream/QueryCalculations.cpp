#include "mapstream/QueryCalculations.hpp"

#include <algorithm>

namespace mapstream {

static int firstLevelTileBitmask(const Tile& tile){
    const bool evenX = tile.tileX % 2 == 0;
    const bool evenY = tile.tileY % 2 == 0;
    if(evenX && evenY) return 0xcc00;   // upper left quadrant
    if(!evenX && evenY) return 0x3300;  // upper right
    if(evenX && !evenY) return 0x00cc;  // lower left
    return 0x0033;                      // lower right
}

static int secondLevelTileBitmaskUpperLeft(int64_t subtileX, int64_t subtileY){
    if(subtileX % 2 == 0 && subtileY % 2 == 0) return 0x8000;
    if(subtileX % 2 == 1 && subtileY % 2 == 0) return 0x4000;
    if(subtileX % 2 == 0 && subtileY % 2 == 1) return 0x0800;
    return 0x0400;
}

static int secondLevelTileBitmaskUpperRight(int64_t subtileX, int64_t subtileY){
    if(subtileX % 2 == 0 && subtileY % 2 == 0) return 0x2000;
    if(subtileX % 2 == 1 && subtileY % 2 == 0) return 0x1000;
    if(subtileX % 2 == 0 && subtileY % 2 == 1) return 0x0200;
    return 0x0100;
}

static int secondLevelTileBitmaskLowerLeft(int64_t subtileX, int64_t subtileY){
    if(subtileX % 2 == 0 && subtileY % 2 == 0) return 0x0080;
    if(subtileX % 2 == 1 && subtileY % 2 == 0) return 0x0040;
    if(subtileX % 2 == 0 && subtileY % 2 == 1) return 0x0008;
    return 0x0004;
}

static int secondLevelTileBitmaskLowerRight(int64_t subtileX, int64_t subtileY){
    if(subtileX % 2 == 0 && subtileY % 2 == 0) return 0x0020;
    if(subtileX % 2 == 1 && subtileY % 2 == 0) return 0x0010;
    if(subtileX % 2 == 0 && subtileY % 2 == 1) return 0x0002;
    return 0x0001;
}

int calculateTileBitmask(const Tile& tile, int zoomLevelDifference){
    if(zoomLevelDifference == 1) return firstLevelTileBitmask(tile);

    // sub-tile two levels below the block
    const int64_t subtileX = tile.tileX >> (zoomLevelDifference - 2);
    const int64_t subtileY = tile.tileY >> (zoomLevelDifference - 2);

    const int64_t parentTileX = subtileX >> 1;
    const int64_t parentTileY = subtileY >> 1;

    if(parentTileX % 2 == 0 && parentTileY % 2 == 0) return secondLevelTileBitmaskUpperLeft(subtileX, subtileY);
    if(parentTileX % 2 == 1 && parentTileY % 2 == 0) return secondLevelTileBitmaskUpperRight(subtileX, subtileY);
    if(parentTileX % 2 == 0 && parentTileY % 2 == 1) return secondLevelTileBitmaskLowerLeft(subtileX, subtileY);
    return secondLevelTileBitmaskLowerRight(subtileX, subtileY);
}

void QueryParameters::calculateBaseTiles(const Tile& tile, const SubFileParameter& subFile){
    if(tile.zoomLevel < subFile.baseZoomLevel){
        // the tile spans several blocks
        const int zoomLevelDifference = subFile.baseZoomLevel - tile.zoomLevel;
        fromBaseTileX = tile.tileX << zoomLevelDifference;
        fromBaseTileY = tile.tileY << zoomLevelDifference;
        toBaseTileX = fromBaseTileX + (1LL << zoomLevelDifference) - 1;
        toBaseTileY = fromBaseTileY + (1LL << zoomLevelDifference) - 1;
        useTileBitmask = false;
    } else if(tile.zoomLevel > subFile.baseZoomLevel){
        // the tile is a part of one block
        const int zoomLevelDifference = tile.zoomLevel - subFile.baseZoomLevel;
        fromBaseTileX = tile.tileX >> zoomLevelDifference;
        fromBaseTileY = tile.tileY >> zoomLevelDifference;
        toBaseTileX = fromBaseTileX;
        toBaseTileY = fromBaseTileY;
        useTileBitmask = true;
        queryTileBitmask = calculateTileBitmask(tile, zoomLevelDifference);
    } else {
        fromBaseTileX = tile.tileX;
        fromBaseTileY = tile.tileY;
        toBaseTileX = fromBaseTileX;
        toBaseTileY = fromBaseTileY;
        useTileBitmask = false;
    }
}

void QueryParameters::calculateBlocks(const SubFileParameter& subFile){
    fromBlockX = std::max<int64_t>(fromBaseTileX - subFile.boundaryTileLeft, 0);
    fromBlockY = std::max<int64_t>(fromBaseTileY - subFile.boundaryTileTop, 0);
    toBlockX = std::min<int64_t>(toBaseTileX - subFile.boundaryTileLeft, subFile.blocksWidth - 1);
    toBlockY = std::min<int64_t>(toBaseTileY - subFile.boundaryTileTop, subFile.blocksHeight - 1);
}

} // namespace mapstream
