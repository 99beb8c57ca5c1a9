#pragma once

#include "mapstream/Geo.hpp"
#include "mapstream/IndexCache.hpp"
#include "mapstream/MapFileHeader.hpp"
#include "mapstream/MapFileInfo.hpp"
#include "mapstream/QueryCalculations.hpp"
#include "mapstream/ReadBuffer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mapstream {

struct PointOfInterest {
    int layer = 0;
    GeoPoint position;
    std::vector<Tag> tags;
    std::optional<std::string> name;
    std::optional<std::string> houseNumber;
    std::optional<int32_t> elevation;
};

// One way data block: the first coordinate block is the outer line/polygon,
// further blocks are inner rings.
struct Way {
    int layer = 0;
    std::vector<Tag> tags;
    std::optional<std::string> name;
    std::optional<std::string> houseNumber;
    std::optional<std::string> ref;
    std::optional<GeoPoint> labelPosition;
    std::vector<std::vector<GeoPoint>> coordinateBlocks;
};

// Receives the decoded content of a tile query.
class MapDatabaseCallback {
public:
    virtual ~MapDatabaseCallback() = default;

    virtual void renderPointOfInterest(const PointOfInterest& poi) = 0;
    virtual void renderWay(const Way& way) = 0;
    // Every block touched by the query is flagged as water in the index.
    virtual void renderWaterBackground() = 0;
};

// An opened map file: header state, index cache and block decoding. One
// instance is owned by the session and swapped only while the tile worker is
// paused.
class MapDatabase {
public:
    static constexpr int SIGNATURE_LENGTH_BLOCK = 32;
    static constexpr int SIGNATURE_LENGTH_POI = 32;
    static constexpr int SIGNATURE_LENGTH_WAY = 32;
    static constexpr size_t INDEX_CACHE_SIZE = 64;

    static constexpr int POI_FEATURE_NAME = 0x80;
    static constexpr int POI_FEATURE_HOUSE_NUMBER = 0x40;
    static constexpr int POI_FEATURE_ELEVATION = 0x20;

    static constexpr int WAY_FEATURE_NAME = 0x80;
    static constexpr int WAY_FEATURE_HOUSE_NUMBER = 0x40;
    static constexpr int WAY_FEATURE_REF = 0x20;
    static constexpr int WAY_FEATURE_LABEL_POSITION = 0x10;
    static constexpr int WAY_FEATURE_DATA_BLOCKS_BYTE = 0x08;
    static constexpr int WAY_FEATURE_DOUBLE_DELTA_ENCODING = 0x04;

    MapDatabase() = default;
    ~MapDatabase();

    MapDatabase(const MapDatabase&) = delete;
    MapDatabase& operator=(const MapDatabase&) = delete;

    // Opens `path` and replaces the current file. On failure the current file
    // (if any) stays open and usable.
    FileOpenResult openFile(const std::string& path);

    // Safe to call when no file is open.
    void closeFile();

    bool hasOpenFile() const { return m_fd >= 0; }
    const std::string& getMapFile() const { return m_mapFile; }

    // Empty while no file is open.
    std::shared_ptr<const MapFileInfo> getMapFileInfo() const { return m_header.getMapFileInfo(); }
    const MapFileHeader& getMapFileHeader() const { return m_header; }

    // Decodes everything stored for `tile`. Returns false if no file is open or
    // the data of a block is corrupt (blocks decoded before that were delivered).
    bool executeQuery(const Tile& tile, MapDatabaseCallback& callback);

private:
    bool processBlocks(MapDatabaseCallback& callback, const QueryParameters& qp, const SubFileParameter& subFile);
    bool processBlock(MapDatabaseCallback& callback, const QueryParameters& qp, const SubFileParameter& subFile);
    bool processBlockSignature();
    bool processPOIs(MapDatabaseCallback& callback, uint32_t numberOfPois);
    bool processWays(MapDatabaseCallback& callback, const QueryParameters& qp, uint32_t numberOfWays);
    bool readTagIds(const std::vector<Tag>& vocabulary, int numberOfTags, std::vector<Tag>& out);
    bool readWayNodes(bool doubleDelta, std::vector<GeoPoint>& out);

    int m_fd = -1;
    int64_t m_fileSize = 0;
    std::string m_mapFile;
    MapFileHeader m_header;
    std::shared_ptr<const MapFileInfo> m_info;
    std::unique_ptr<IndexCache> m_indexCache;
    ReadBuffer m_readBuffer;

    // top-left corner of the block being decoded, microdegrees
    int32_t m_tileLatitude = 0;
    int32_t m_tileLongitude = 0;
    std::string m_signatureBlock;
};

} // namespace mapstream
