#include "mapstream/MapFileHeader.hpp"

#include "mapstream/Log.hpp"

#include <algorithm>
#include <cstring>

namespace mapstream {

const char* const MapFileHeader::BINARY_OSM_MAGIC_BYTE = "mapsforge binary OSM";

using ErrorKind = FileOpenResult::ErrorKind;

namespace {

// Fields collected while parsing; turned into a MapFileInfo only on success.
struct HeaderBuilder {
    MapFileInfo info;
    bool hasStartPosition = false;
    std::vector<SubFileParameter> subFiles;
    std::vector<int> lookup;
    uint8_t zoomMin = 0;
    uint8_t zoomMax = 0;
};

FileOpenResult truncated(const ReadBuffer& rb){
    return FileOpenResult::failure(ErrorKind::InvalidHeaderSize, "truncated header: " + rb.error());
}

bool latitudeInRange(int32_t v){ return v >= MapFileHeader::LATITUDE_MIN && v <= MapFileHeader::LATITUDE_MAX; }
bool longitudeInRange(int32_t v){ return v >= MapFileHeader::LONGITUDE_MIN && v <= MapFileHeader::LONGITUDE_MAX; }

FileOpenResult readMagicByte(ReadBuffer& rb){
    const size_t magicLength = std::strlen(MapFileHeader::BINARY_OSM_MAGIC_BYTE);
    // magic byte plus the 4 byte remaining header size
    if(!rb.readFromFile(magicLength + 4)){
        return FileOpenResult::failure(ErrorKind::InvalidMagicByte, "reading magic byte has failed");
    }
    std::optional<std::string> magic = rb.readUTF8EncodedString(magicLength);
    if(!magic || *magic != MapFileHeader::BINARY_OSM_MAGIC_BYTE){
        return FileOpenResult::failure(ErrorKind::InvalidMagicByte, "invalid magic byte: " + magic.value_or(""));
    }
    return FileOpenResult::success();
}

FileOpenResult readRemainingHeader(ReadBuffer& rb){
    const int32_t remainingHeaderSize = rb.readInt();
    if(remainingHeaderSize < MapFileHeader::HEADER_SIZE_MIN || remainingHeaderSize > MapFileHeader::HEADER_SIZE_MAX){
        return FileOpenResult::failure(ErrorKind::InvalidHeaderSize,
                                       str("invalid remaining header size: ", remainingHeaderSize));
    }
    if(!rb.readFromFile((size_t)remainingHeaderSize)){
        return FileOpenResult::failure(ErrorKind::InvalidHeaderSize,
                                       str("reading header data has failed: ", remainingHeaderSize));
    }
    return FileOpenResult::success();
}

FileOpenResult readFileVersion(ReadBuffer& rb, HeaderBuilder& b){
    const int32_t fileVersion = rb.readInt();
    if(!rb) return truncated(rb);
    if(fileVersion != MapFileHeader::SUPPORTED_FILE_VERSION){
        return FileOpenResult::failure(ErrorKind::UnsupportedVersion, str("unsupported file version: ", fileVersion));
    }
    b.info.fileVersion = fileVersion;
    return FileOpenResult::success();
}

FileOpenResult readFileSize(ReadBuffer& rb, int64_t fileSize, HeaderBuilder& b){
    const int64_t headerFileSize = rb.readLong();
    if(!rb) return truncated(rb);
    if(headerFileSize != fileSize){
        return FileOpenResult::failure(ErrorKind::SizeMismatch, str("invalid file size: ", headerFileSize));
    }
    b.info.fileSize = fileSize;
    return FileOpenResult::success();
}

FileOpenResult readMapDate(ReadBuffer& rb, HeaderBuilder& b){
    const int64_t mapDate = rb.readLong();
    if(!rb) return truncated(rb);
    // anything before 2008-01-10 is not a real map date
    if(mapDate < MapFileHeader::MAP_DATE_MIN){
        return FileOpenResult::failure(ErrorKind::InvalidDate, str("invalid map date: ", mapDate));
    }
    b.info.mapDate = mapDate;
    return FileOpenResult::success();
}

FileOpenResult readBoundingBox(ReadBuffer& rb, HeaderBuilder& b){
    const int32_t minLatitude = rb.readInt();
    const int32_t minLongitude = rb.readInt();
    const int32_t maxLatitude = rb.readInt();
    const int32_t maxLongitude = rb.readInt();
    if(!rb) return truncated(rb);

    if(!latitudeInRange(minLatitude))
        return FileOpenResult::failure(ErrorKind::InvalidBoundingBox, str("invalid minimum latitude: ", minLatitude));
    if(!longitudeInRange(minLongitude))
        return FileOpenResult::failure(ErrorKind::InvalidBoundingBox, str("invalid minimum longitude: ", minLongitude));
    if(!latitudeInRange(maxLatitude))
        return FileOpenResult::failure(ErrorKind::InvalidBoundingBox, str("invalid maximum latitude: ", maxLatitude));
    if(!longitudeInRange(maxLongitude))
        return FileOpenResult::failure(ErrorKind::InvalidBoundingBox, str("invalid maximum longitude: ", maxLongitude));

    if(minLatitude > maxLatitude){
        return FileOpenResult::failure(ErrorKind::InvalidBoundingBox,
                                       str("invalid latitude range: ", minLatitude, " ", maxLatitude));
    }
    if(minLongitude > maxLongitude){
        return FileOpenResult::failure(ErrorKind::InvalidBoundingBox,
                                       str("invalid longitude range: ", minLongitude, " ", maxLongitude));
    }

    b.info.boundingBox = BoundingBox{minLatitude, minLongitude, maxLatitude, maxLongitude};
    b.info.mapCenter = b.info.boundingBox.getCenterPoint();
    return FileOpenResult::success();
}

FileOpenResult readTilePixelSize(ReadBuffer& rb, HeaderBuilder& b){
    const int16_t tilePixelSize = rb.readShort();
    if(!rb) return truncated(rb);
    if(tilePixelSize != kTileSize){
        return FileOpenResult::failure(ErrorKind::UnsupportedTileSize, str("unsupported tile pixel size: ", tilePixelSize));
    }
    b.info.tilePixelSize = tilePixelSize;
    return FileOpenResult::success();
}

FileOpenResult readProjectionName(ReadBuffer& rb, HeaderBuilder& b){
    std::optional<std::string> projectionName = rb.readUTF8EncodedString();
    if(!rb) return truncated(rb);
    if(!projectionName || *projectionName != "Mercator"){
        return FileOpenResult::failure(ErrorKind::UnsupportedProjection,
                                       "unsupported projection: " + projectionName.value_or(""));
    }
    b.info.projectionName = *projectionName;
    return FileOpenResult::success();
}

FileOpenResult readMapStartPosition(ReadBuffer& rb, HeaderBuilder& b){
    if(!b.hasStartPosition) return FileOpenResult::success();

    const int32_t startLatitude = rb.readInt();
    const int32_t startLongitude = rb.readInt();
    if(!rb) return truncated(rb);
    if(!latitudeInRange(startLatitude)){
        return FileOpenResult::failure(ErrorKind::InvalidStartPosition, str("invalid map start latitude: ", startLatitude));
    }
    if(!longitudeInRange(startLongitude)){
        return FileOpenResult::failure(ErrorKind::InvalidStartPosition, str("invalid map start longitude: ", startLongitude));
    }
    b.info.startPosition = GeoPoint{startLatitude, startLongitude};
    return FileOpenResult::success();
}

FileOpenResult readTags(ReadBuffer& rb, const char* kind, std::vector<Tag>& out){
    const int16_t numberOfTags = rb.readShort();
    if(!rb) return truncated(rb);
    if(numberOfTags < 0){
        return FileOpenResult::failure(ErrorKind::InvalidTag, str("invalid number of ", kind, " tags: ", numberOfTags));
    }

    out.clear();
    out.reserve((size_t)numberOfTags);
    for(int tagId=0; tagId<numberOfTags; ++tagId){
        std::optional<std::string> tag = rb.readUTF8EncodedString();
        if(!rb) return truncated(rb);
        if(!tag){
            return FileOpenResult::failure(ErrorKind::InvalidTag, str(kind, " tag must not be null: ", tagId));
        }
        out.emplace_back(*tag);
    }
    return FileOpenResult::success();
}

FileOpenResult readSubFileParameters(ReadBuffer& rb, int64_t fileSize, HeaderBuilder& b){
    const int8_t numberOfSubFiles = rb.readByte();
    if(!rb) return truncated(rb);
    if(numberOfSubFiles < 1){
        return FileOpenResult::failure(ErrorKind::NoSubFiles, str("invalid number of sub-files: ", (int)numberOfSubFiles));
    }
    b.info.numberOfSubFiles = (uint8_t)numberOfSubFiles;

    int zoomMin = MapFileHeader::ZOOM_LEVEL_MAX;
    int zoomMax = 0;
    b.subFiles.clear();

    for(int i=0; i<numberOfSubFiles; ++i){
        const int8_t baseZoomLevel = rb.readByte();
        const int8_t zoomLevelMin = rb.readByte();
        const int8_t zoomLevelMax = rb.readByte();
        const int64_t startAddress = rb.readLong();
        const int64_t subFileSize = rb.readLong();
        if(!rb) return truncated(rb);

        if(baseZoomLevel < 0 || baseZoomLevel > MapFileHeader::BASE_ZOOM_LEVEL_MAX){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile, str("invalid base zoom level: ", (int)baseZoomLevel));
        }
        if(zoomLevelMin < 0 || zoomLevelMin > MapFileHeader::ZOOM_LEVEL_MAX){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile, str("invalid minimum zoom level: ", (int)zoomLevelMin));
        }
        if(zoomLevelMax < 0 || zoomLevelMax > MapFileHeader::ZOOM_LEVEL_MAX){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile, str("invalid maximum zoom level: ", (int)zoomLevelMax));
        }
        if(zoomLevelMin > zoomLevelMax){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile,
                                           str("invalid zoom level range: ", (int)zoomLevelMin, " ", (int)zoomLevelMax));
        }
        if(startAddress < MapFileHeader::HEADER_SIZE_MIN || startAddress >= fileSize){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile, str("invalid start address: ", startAddress));
        }
        if(subFileSize < 1){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile, str("invalid sub-file size: ", subFileSize));
        }

        SubFileParameter sp;
        sp.baseZoomLevel = (uint8_t)baseZoomLevel;
        sp.zoomLevelMin = (uint8_t)zoomLevelMin;
        sp.zoomLevelMax = (uint8_t)zoomLevelMax;
        sp.startAddress = (uint64_t)startAddress;
        sp.indexStartAddress = (uint64_t)startAddress;
        // debug files carry an index signature in front of the index
        if(b.info.debugFile) sp.indexStartAddress += MapFileHeader::SIGNATURE_LENGTH_INDEX;
        sp.subFileSize = (uint64_t)subFileSize;
        sp.computeBlocks(b.info.boundingBox);
        b.subFiles.push_back(sp);

        zoomMin = std::min(zoomMin, (int)zoomLevelMin);
        zoomMax = std::max(zoomMax, (int)zoomLevelMax);
    }

    // Later sub-files overwrite earlier ones where zoom intervals overlap.
    b.lookup.assign((size_t)zoomMax + 1, -1);
    for(size_t i=0; i<b.subFiles.size(); ++i){
        for(int z=b.subFiles[i].zoomLevelMin; z<=b.subFiles[i].zoomLevelMax; ++z){
            b.lookup[(size_t)z] = (int)i;
        }
    }
    for(int z=zoomMin; z<=zoomMax; ++z){
        if(b.lookup[(size_t)z] < 0){
            return FileOpenResult::failure(ErrorKind::InvalidSubFile, str("zoom level not covered by any sub-file: ", z));
        }
    }

    b.zoomMin = (uint8_t)zoomMin;
    b.zoomMax = (uint8_t)zoomMax;
    return FileOpenResult::success();
}

} // namespace

FileOpenResult MapFileHeader::readHeader(ReadBuffer& readBuffer, int64_t fileSize){
    FileOpenResult r = readMagicByte(readBuffer);
    if(!r.isSuccess()) return r;

    r = readRemainingHeader(readBuffer);
    if(!r.isSuccess()) return r;

    HeaderBuilder b;

    r = readFileVersion(readBuffer, b);
    if(!r.isSuccess()) return r;

    r = readFileSize(readBuffer, fileSize, b);
    if(!r.isSuccess()) return r;

    r = readMapDate(readBuffer, b);
    if(!r.isSuccess()) return r;

    r = readBoundingBox(readBuffer, b);
    if(!r.isSuccess()) return r;

    r = readTilePixelSize(readBuffer, b);
    if(!r.isSuccess()) return r;

    r = readProjectionName(readBuffer, b);
    if(!r.isSuccess()) return r;

    b.info.languagePreference = readBuffer.readUTF8EncodedString();

    const int8_t metaFlags = readBuffer.readByte();
    if(!readBuffer) return truncated(readBuffer);
    b.info.debugFile = (metaFlags & HEADER_BITMASK_DEBUG) != 0;
    b.hasStartPosition = (metaFlags & HEADER_BITMASK_START_POSITION) != 0;

    r = readMapStartPosition(readBuffer, b);
    if(!r.isSuccess()) return r;

    r = readTags(readBuffer, "POI", b.info.poiTags);
    if(!r.isSuccess()) return r;

    r = readTags(readBuffer, "way", b.info.wayTags);
    if(!r.isSuccess()) return r;

    r = readSubFileParameters(readBuffer, fileSize, b);
    if(!r.isSuccess()) return r;

    b.info.commentText = readBuffer.readUTF8EncodedString();
    if(!readBuffer) return truncated(readBuffer);

    m_mapFileInfo = std::make_shared<const MapFileInfo>(std::move(b.info));
    m_subFileParameters = std::move(b.subFiles);
    m_lookup = std::move(b.lookup);
    m_zoomLevelMinimum = b.zoomMin;
    m_zoomLevelMaximum = b.zoomMax;
    return FileOpenResult::success();
}

void MapFileHeader::reset(){
    m_mapFileInfo.reset();
    m_subFileParameters.clear();
    m_lookup.clear();
    m_zoomLevelMinimum = 0;
    m_zoomLevelMaximum = 0;
}

uint8_t MapFileHeader::getQueryZoomLevel(int zoomLevel) const {
    if(zoomLevel > m_zoomLevelMaximum) return m_zoomLevelMaximum;
    if(zoomLevel < m_zoomLevelMinimum) return m_zoomLevelMinimum;
    return (uint8_t)zoomLevel;
}

const SubFileParameter* MapFileHeader::getSubFileParameter(int queryZoomLevel) const {
    if(queryZoomLevel < 0 || (size_t)queryZoomLevel >= m_lookup.size()) return nullptr;
    const int idx = m_lookup[(size_t)queryZoomLevel];
    if(idx < 0) return nullptr;
    return &m_subFileParameters[(size_t)idx];
}

} // namespace mapstream
