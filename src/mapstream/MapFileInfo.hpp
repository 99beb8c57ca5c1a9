#pragma once

#include "mapstream/Geo.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mapstream {

// OSM tag stored as "key=value" in the file header.
struct Tag {
    std::string key;
    std::string value;

    Tag() = default;
    Tag(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
    // Splits at the first '='; a tag without '=' has an empty value.
    explicit Tag(const std::string& keyValue);

    std::string toString() const { return key + "=" + value; }

    bool operator==(const Tag& o) const { return key == o.key && value == o.value; }
    bool operator!=(const Tag& o) const { return !(*this == o); }
};

// One physical sub-file: a zoom interval with its own spatial index.
struct SubFileParameter {
    // Bytes per index entry (5).
    static constexpr int BYTES_PER_INDEX_ENTRY = 5;

    uint8_t baseZoomLevel = 0;
    uint8_t zoomLevelMin = 0;
    uint8_t zoomLevelMax = 0;

    uint64_t startAddress = 0;
    uint64_t indexStartAddress = 0;
    uint64_t indexEndAddress = 0;
    uint64_t subFileSize = 0;

    // Tiles covered by the map bounding box at the base zoom level.
    int64_t boundaryTileLeft = 0;
    int64_t boundaryTileTop = 0;
    int64_t boundaryTileRight = 0;
    int64_t boundaryTileBottom = 0;
    int64_t blocksWidth = 0;
    int64_t blocksHeight = 0;
    int64_t numberOfBlocks = 0;

    // Fills the boundary and block fields from the map bounding box.
    void computeBlocks(const BoundingBox& bbox);

    bool operator==(const SubFileParameter& o) const;
};

// Immutable header metadata of an opened map file.
struct MapFileInfo {
    BoundingBox boundingBox;
    std::optional<std::string> commentText;
    bool debugFile = false;
    int64_t fileSize = 0;
    int32_t fileVersion = 0;
    std::optional<std::string> languagePreference;
    GeoPoint mapCenter;
    int64_t mapDate = 0;
    uint8_t numberOfSubFiles = 0;
    std::vector<Tag> poiTags;
    std::string projectionName;
    std::optional<GeoPoint> startPosition;
    int32_t tilePixelSize = 0;
    std::vector<Tag> wayTags;
};

// Outcome of MapDatabase::openFile / MapFileHeader::readHeader.
class FileOpenResult {
public:
    enum class ErrorKind {
        None,
        IoError,
        InvalidMagicByte,
        InvalidHeaderSize,
        UnsupportedVersion,
        SizeMismatch,
        InvalidDate,
        InvalidBoundingBox,
        UnsupportedTileSize,
        UnsupportedProjection,
        InvalidStartPosition,
        InvalidTag,
        NoSubFiles,
        InvalidSubFile,
    };

    static FileOpenResult success(){ return FileOpenResult(); }
    static FileOpenResult failure(ErrorKind kind, std::string message){
        return FileOpenResult(kind, std::move(message));
    }

    bool isSuccess() const { return m_kind == ErrorKind::None; }
    ErrorKind getErrorKind() const { return m_kind; }
    const std::string& getErrorMessage() const { return m_errorMessage; }

    std::string toString() const;

private:
    FileOpenResult() = default;
    FileOpenResult(ErrorKind kind, std::string message) : m_kind(kind), m_errorMessage(std::move(message)) {}

    ErrorKind m_kind = ErrorKind::None;
    std::string m_errorMessage;
};

const char* errorKindName(FileOpenResult::ErrorKind kind);

} // namespace mapstream
