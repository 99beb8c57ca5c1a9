#pragma once

#include "mapstream/Geo.hpp"
#include "mapstream/MapDatabase.hpp"
#include "mapstream/MapFileInfo.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mapstream {

// Builds binary map files (format version 3) in memory: header, one index per
// sub-file and the tile blocks. Every header field is public so that broken
// files can be produced on purpose.
class MapFileWriter {
public:
    std::string magic = "mapsforge binary OSM";
    std::optional<int32_t> remainingHeaderSizeOverride;
    int32_t fileVersion = 3;
    // added to the real file size when writing the size field
    int64_t fileSizeAdjustment = 0;
    int64_t mapDate = 1324124730145LL;
    BoundingBox boundingBox;
    int16_t tilePixelSize = kTileSize;
    std::string projectionName = "Mercator";
    std::optional<std::string> languagePreference;
    bool debugFile = false;
    std::optional<GeoPoint> startPosition;
    std::vector<Tag> poiTags;
    std::vector<Tag> wayTags;
    std::optional<std::string> commentText;

    // Returns the sub-file's index for the add* calls below.
    size_t addSubFile(uint8_t baseZoomLevel, uint8_t zoomLevelMin, uint8_t zoomLevelMax);

    // Content is attached to the block of base tile (tileX, tileY) and becomes
    // visible from `zoomLevel` on. Tags missing from the tag tables are
    // appended to them.
    void addPointOfInterest(size_t subFile, int64_t tileX, int64_t tileY, int zoomLevel, const PointOfInterest& poi);
    // Each element of `dataBlocks` is one list of coordinate blocks.
    void addWay(size_t subFile, int64_t tileX, int64_t tileY, int zoomLevel, const Way& way,
                const std::vector<std::vector<std::vector<GeoPoint>>>& dataBlocks,
                bool doubleDeltaEncoding = false, int tileBitmask = 0xffff);
    // Single data block taken from way.coordinateBlocks.
    void addWay(size_t subFile, int64_t tileX, int64_t tileY, int zoomLevel, const Way& way,
                bool doubleDeltaEncoding = false, int tileBitmask = 0xffff);
    void setWater(size_t subFile, int64_t tileX, int64_t tileY, bool water);

    // Boundary tiles and block counts of a sub-file as a reader computes them
    // from the header. Addresses are not filled in.
    SubFileParameter getSubFileParameter(size_t subFile) const;

    std::vector<uint8_t> build() const;
    bool write(const std::string& path, std::string& error) const;

private:
    struct PoiRecord {
        int zoomLevel;
        PointOfInterest poi;
        std::vector<uint32_t> tagIds;
    };
    struct WayRecord {
        int zoomLevel;
        Way way;
        std::vector<uint32_t> tagIds;
        std::vector<std::vector<std::vector<GeoPoint>>> dataBlocks;
        bool doubleDelta;
        int tileBitmask;
    };
    struct Block {
        std::vector<PoiRecord> pois;
        std::vector<WayRecord> ways;
        bool water = false;
    };
    struct SubFile {
        uint8_t baseZoomLevel;
        uint8_t zoomLevelMin;
        uint8_t zoomLevelMax;
        std::map<std::pair<int64_t, int64_t>, Block> blocks;
    };

    std::vector<uint8_t> buildHeader(const std::vector<std::pair<int64_t, int64_t>>& subFileAddresses, int64_t fileSize) const;
    std::vector<uint8_t> buildSubFile(const SubFile& subFile) const;
    std::vector<uint8_t> buildBlock(const SubFile& subFile, const SubFileParameter& sp,
                                    int64_t tileX, int64_t tileY, const Block& block) const;

    static std::vector<uint32_t> resolveTags(std::vector<Tag>& vocabulary, const std::vector<Tag>& tags);

    std::vector<SubFile> m_subFiles;
};

} // namespace mapstream
