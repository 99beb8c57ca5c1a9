#include "mapstream/MapFileInfo.hpp"

#include <sstream>

namespace mapstream {

Tag::Tag(const std::string& keyValue){
    const size_t p = keyValue.find('=');
    if(p == std::string::npos){
        key = keyValue;
        return;
    }
    key = keyValue.substr(0, p);
    value = keyValue.substr(p + 1);
}

void SubFileParameter::computeBlocks(const BoundingBox& bbox){
    boundaryTileBottom = MercatorProjection::latitudeToTileY(bbox.getMinLatitude(), baseZoomLevel);
    boundaryTileLeft = MercatorProjection::longitudeToTileX(bbox.getMinLongitude(), baseZoomLevel);
    boundaryTileTop = MercatorProjection::latitudeToTileY(bbox.getMaxLatitude(), baseZoomLevel);
    boundaryTileRight = MercatorProjection::longitudeToTileX(bbox.getMaxLongitude(), baseZoomLevel);

    blocksWidth = boundaryTileRight - boundaryTileLeft + 1;
    blocksHeight = boundaryTileBottom - boundaryTileTop + 1;
    numberOfBlocks = blocksWidth * blocksHeight;

    indexEndAddress = indexStartAddress + (uint64_t)numberOfBlocks * BYTES_PER_INDEX_ENTRY;
}

bool SubFileParameter::operator==(const SubFileParameter& o) const {
    return baseZoomLevel == o.baseZoomLevel && zoomLevelMin == o.zoomLevelMin && zoomLevelMax == o.zoomLevelMax
        && startAddress == o.startAddress && indexStartAddress == o.indexStartAddress
        && subFileSize == o.subFileSize;
}

const char* errorKindName(FileOpenResult::ErrorKind kind){
    using K = FileOpenResult::ErrorKind;
    switch(kind){
        case K::None: return "none";
        case K::IoError: return "io error";
        case K::InvalidMagicByte: return "invalid magic byte";
        case K::InvalidHeaderSize: return "invalid header size";
        case K::UnsupportedVersion: return "unsupported version";
        case K::SizeMismatch: return "size mismatch";
        case K::InvalidDate: return "invalid date";
        case K::InvalidBoundingBox: return "invalid bounding box";
        case K::UnsupportedTileSize: return "unsupported tile size";
        case K::UnsupportedProjection: return "unsupported projection";
        case K::InvalidStartPosition: return "invalid start position";
        case K::InvalidTag: return "invalid tag";
        case K::NoSubFiles: return "no sub-files";
        case K::InvalidSubFile: return "invalid sub-file";
    }
    return "unknown";
}

std::string FileOpenResult::toString() const {
    std::ostringstream ss;
    ss << "FileOpenResult [success=" << (isSuccess() ? "true" : "false");
    if(!isSuccess()) ss << ", kind=" << errorKindName(m_kind) << ", errorMessage=" << m_errorMessage;
    ss << "]";
    return ss.str();
}

} // namespace mapstream
