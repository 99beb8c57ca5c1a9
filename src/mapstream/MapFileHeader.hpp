#pragma once

#include "mapstream/MapFileInfo.hpp"
#include "mapstream/ReadBuffer.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace mapstream {

// Reads and validates the header block of a binary map file and keeps the
// zoom level -> sub-file lookup table.
class MapFileHeader {
public:
    static const char* const BINARY_OSM_MAGIC_BYTE;
    static constexpr int SUPPORTED_FILE_VERSION = 3;
    static constexpr int HEADER_SIZE_MIN = 70;
    static constexpr int HEADER_SIZE_MAX = 1000000;
    static constexpr int64_t MAP_DATE_MIN = 1200000000000LL;
    static constexpr int BASE_ZOOM_LEVEL_MAX = 20;
    static constexpr int ZOOM_LEVEL_MAX = 22;
    static constexpr int SIGNATURE_LENGTH_INDEX = 16;
    static constexpr int HEADER_BITMASK_DEBUG = 0x80;
    static constexpr int HEADER_BITMASK_START_POSITION = 0x40;
    static constexpr int32_t LATITUDE_MIN = -90000000;
    static constexpr int32_t LATITUDE_MAX = 90000000;
    static constexpr int32_t LONGITUDE_MIN = -180000000;
    static constexpr int32_t LONGITUDE_MAX = 180000000;

    // Reads the header starting at file offset 0. On failure the previous
    // header state (if any) is left untouched.
    FileOpenResult readHeader(ReadBuffer& readBuffer, int64_t fileSize);

    void reset();

    // Empty until a header has been read successfully.
    std::shared_ptr<const MapFileInfo> getMapFileInfo() const { return m_mapFileInfo; }

    // Clamps a zoom level to the interval covered by the sub-files.
    uint8_t getQueryZoomLevel(int zoomLevel) const;

    // Sub-file serving a zoom level in [getZoomLevelMinimum(), getZoomLevelMaximum()].
    const SubFileParameter* getSubFileParameter(int queryZoomLevel) const;

    // All sub-files in file order.
    const std::vector<SubFileParameter>& getSubFileParameters() const { return m_subFileParameters; }

    uint8_t getZoomLevelMinimum() const { return m_zoomLevelMinimum; }
    uint8_t getZoomLevelMaximum() const { return m_zoomLevelMaximum; }

private:
    std::shared_ptr<const MapFileInfo> m_mapFileInfo;
    std::vector<SubFileParameter> m_subFileParameters;
    // index into m_subFileParameters per zoom level, -1 where none
    std::vector<int> m_lookup;
    uint8_t m_zoomLevelMinimum = 0;
    uint8_t m_zoomLevelMaximum = 0;
};

} // namespace mapstream
