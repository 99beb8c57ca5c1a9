#include "mapstream/MapDatabase.hpp"

#include "mapstream/Log.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mapstream {

using ErrorKind = FileOpenResult::ErrorKind;

static const int MAXIMUM_WAY_NODES_SEQUENCE_LENGTH = 32767;
static const int MAXIMUM_COORDINATE_BLOCKS = 32767;

// Coordinates are accumulated in 64 bits; anything off the globe means the
// block is corrupt.
static bool toGeoPoint(int64_t latitude, int64_t longitude, GeoPoint& out){
    if(latitude < MapFileHeader::LATITUDE_MIN || latitude > MapFileHeader::LATITUDE_MAX
       || longitude < MapFileHeader::LONGITUDE_MIN || longitude > MapFileHeader::LONGITUDE_MAX){
        logWarn("MapDatabase", str("invalid coordinate: ", latitude, ", ", longitude));
        return false;
    }
    out = GeoPoint{(int32_t)latitude, (int32_t)longitude};
    return true;
}

static bool startsWith(const std::optional<std::string>& s, const char* prefix){
    return s && s->compare(0, std::strlen(prefix), prefix) == 0;
}

MapDatabase::~MapDatabase(){
    closeFile();
}

FileOpenResult MapDatabase::openFile(const std::string& path){
    struct stat st{};
    if(::stat(path.c_str(), &st) != 0){
        return FileOpenResult::failure(ErrorKind::IoError, "file does not exist: " + path);
    }
    if(!S_ISREG(st.st_mode)){
        return FileOpenResult::failure(ErrorKind::IoError, "not a file: " + path);
    }

    const int fd = ::open(path.c_str(), O_RDONLY);
    if(fd < 0){
        return FileOpenResult::failure(ErrorKind::IoError,
                                       "cannot read file: " + path + ": " + std::strerror(errno));
    }

    // Parse into fresh state so a failed open keeps the current file usable.
    ReadBuffer readBuffer(fd);
    MapFileHeader header;
    FileOpenResult result = header.readHeader(readBuffer, (int64_t)st.st_size);
    if(!result.isSuccess()){
        ::close(fd);
        logWarn("MapDatabase", "cannot open " + path + ": " + result.getErrorMessage());
        return result;
    }

    closeFile();
    m_fd = fd;
    m_fileSize = (int64_t)st.st_size;
    m_mapFile = path;
    m_header = std::move(header);
    m_info = m_header.getMapFileInfo();
    m_readBuffer = ReadBuffer(fd);
    m_indexCache = std::make_unique<IndexCache>(fd, INDEX_CACHE_SIZE);

    logInfo("MapDatabase", str("Opened ", path, " (", m_fileSize, " bytes, ", (int)m_info->numberOfSubFiles,
                               " sub-files, zoom ", (int)m_header.getZoomLevelMinimum(), "-",
                               (int)m_header.getZoomLevelMaximum(), ")"));
    return result;
}

void MapDatabase::closeFile(){
    m_indexCache.reset();
    m_readBuffer = ReadBuffer();
    m_header.reset();
    m_info.reset();
    m_mapFile.clear();
    m_fileSize = 0;
    if(m_fd >= 0){
        ::close(m_fd);
        m_fd = -1;
    }
}

bool MapDatabase::executeQuery(const Tile& tile, MapDatabaseCallback& callback){
    if(!hasOpenFile()){
        logWarn("MapDatabase", "no map file is currently opened");
        return false;
    }

    QueryParameters qp;
    qp.queryZoomLevel = m_header.getQueryZoomLevel(tile.zoomLevel);

    const SubFileParameter* subFile = m_header.getSubFileParameter(qp.queryZoomLevel);
    if(!subFile){
        logWarn("MapDatabase", str("no sub-file for zoom level: ", (int)qp.queryZoomLevel));
        return false;
    }

    qp.calculateBaseTiles(tile, *subFile);
    qp.calculateBlocks(*subFile);
    return processBlocks(callback, qp, *subFile);
}

bool MapDatabase::processBlocks(MapDatabaseCallback& callback, const QueryParameters& qp, const SubFileParameter& subFile){
    bool queryIsWater = true;
    bool queryReadWaterInfo = false;

    for(int64_t row=qp.fromBlockY; row<=qp.toBlockY; ++row){
        for(int64_t column=qp.fromBlockX; column<=qp.toBlockX; ++column){
            const int64_t blockNumber = row * subFile.blocksWidth + column;

            std::optional<uint64_t> indexEntry = m_indexCache->getIndexEntry(subFile, blockNumber);
            if(!indexEntry) return false;

            // a tile is water only if every block says so
            if(queryIsWater){
                queryIsWater = (*indexEntry & IndexCache::BITMASK_INDEX_WATER) != 0;
                queryReadWaterInfo = true;
            }

            const uint64_t currentBlockPointer = *indexEntry & IndexCache::BITMASK_INDEX_OFFSET;
            if(currentBlockPointer < 1 || currentBlockPointer > subFile.subFileSize){
                logWarn("MapDatabase", str("invalid current block pointer: ", currentBlockPointer));
                return false;
            }

            uint64_t nextBlockPointer = 0;
            if(blockNumber + 1 == subFile.numberOfBlocks){
                // the last block ends with the sub-file
                nextBlockPointer = subFile.subFileSize;
            } else {
                std::optional<uint64_t> nextEntry = m_indexCache->getIndexEntry(subFile, blockNumber + 1);
                if(!nextEntry) return false;
                nextBlockPointer = *nextEntry & IndexCache::BITMASK_INDEX_OFFSET;
                if(nextBlockPointer > subFile.subFileSize){
                    logWarn("MapDatabase", str("invalid next block pointer: ", nextBlockPointer));
                    return false;
                }
            }

            if(nextBlockPointer < currentBlockPointer){
                logWarn("MapDatabase", str("invalid block size: ", currentBlockPointer, " ", nextBlockPointer));
                return false;
            }
            const uint64_t currentBlockSize = nextBlockPointer - currentBlockPointer;
            if(currentBlockSize == 0){
                // empty block
                continue;
            }
            if(currentBlockSize > ReadBuffer::MAXIMUM_BUFFER_SIZE){
                logWarn("MapDatabase", str("current block size too large: ", currentBlockSize));
                continue;
            }
            if((uint64_t)subFile.startAddress + currentBlockPointer + currentBlockSize > (uint64_t)m_fileSize){
                logWarn("MapDatabase", str("current block larger than file size: ", currentBlockSize));
                return false;
            }

            if(!m_readBuffer.readFromFile(subFile.startAddress + currentBlockPointer, (size_t)currentBlockSize)){
                logWarn("MapDatabase", str("reading current block has failed: ", currentBlockSize));
                return false;
            }

            const double tileLatitudeDeg = MercatorProjection::tileYToLatitude(subFile.boundaryTileTop + row, subFile.baseZoomLevel);
            const double tileLongitudeDeg = MercatorProjection::tileXToLongitude(subFile.boundaryTileLeft + column, subFile.baseZoomLevel);
            m_tileLatitude = (int32_t)(tileLatitudeDeg * kConversionFactor);
            m_tileLongitude = (int32_t)(tileLongitudeDeg * kConversionFactor);

            if(!processBlock(callback, qp, subFile)){
                logWarn("MapDatabase", str("corrupt block ", blockNumber, " in ", m_mapFile,
                                           (m_readBuffer.good() ? "" : ": " + m_readBuffer.error())));
                return false;
            }
        }
    }

    if(queryIsWater && queryReadWaterInfo){
        callback.renderWaterBackground();
    }
    return true;
}

bool MapDatabase::processBlockSignature(){
    if(!m_info->debugFile) return true;
    // get and check the block signature
    m_signatureBlock = m_readBuffer.readUTF8EncodedString(SIGNATURE_LENGTH_BLOCK).value_or("");
    if(m_signatureBlock.compare(0, 12, "###TileStart") != 0){
        logWarn("MapDatabase", "invalid block signature: " + m_signatureBlock);
        return false;
    }
    return true;
}

bool MapDatabase::processBlock(MapDatabaseCallback& callback, const QueryParameters& qp, const SubFileParameter& subFile){
    if(!processBlockSignature()) return false;

    // zoom table: cumulated POI and way counts per zoom level of the sub-file
    const int rows = subFile.zoomLevelMax - subFile.zoomLevelMin + 1;
    std::vector<std::pair<uint32_t, uint32_t>> zoomTable((size_t)rows);
    uint32_t cumulatedPois = 0;
    uint32_t cumulatedWays = 0;
    for(int row=0; row<rows; ++row){
        cumulatedPois += m_readBuffer.readUnsignedInt();
        cumulatedWays += m_readBuffer.readUnsignedInt();
        zoomTable[(size_t)row] = {cumulatedPois, cumulatedWays};
    }
    if(!m_readBuffer) return false;

    const int zoomTableRow = qp.queryZoomLevel - subFile.zoomLevelMin;
    const uint32_t poisOnQueryZoomLevel = zoomTable[(size_t)zoomTableRow].first;
    const uint32_t waysOnQueryZoomLevel = zoomTable[(size_t)zoomTableRow].second;

    // offset of the first way, relative to the end of this field
    uint64_t firstWayOffset = m_readBuffer.readUnsignedInt();
    if(!m_readBuffer) return false;
    firstWayOffset += m_readBuffer.getBufferPosition();
    if(firstWayOffset > m_readBuffer.getBufferSize()){
        logWarn("MapDatabase", str("invalid first way offset: ", firstWayOffset));
        return false;
    }

    if(!processPOIs(callback, poisOnQueryZoomLevel)) return false;

    // finished reading POIs, check if the way data starts where expected
    if(m_readBuffer.getBufferPosition() > firstWayOffset){
        logWarn("MapDatabase", str("invalid buffer position: ", m_readBuffer.getBufferPosition()));
        return false;
    }
    m_readBuffer.setBufferPosition((size_t)firstWayOffset);

    return processWays(callback, qp, waysOnQueryZoomLevel);
}

bool MapDatabase::readTagIds(const std::vector<Tag>& vocabulary, int numberOfTags, std::vector<Tag>& out){
    out.clear();
    for(int i=0; i<numberOfTags; ++i){
        const uint32_t tagId = m_readBuffer.readUnsignedInt();
        if(!m_readBuffer) return false;
        if(tagId >= vocabulary.size()){
            logWarn("MapDatabase", str("invalid tag ID: ", tagId));
            return false;
        }
        out.push_back(vocabulary[tagId]);
    }
    return true;
}

bool MapDatabase::processPOIs(MapDatabaseCallback& callback, uint32_t numberOfPois){
    PointOfInterest poi;
    for(uint32_t i=0; i<numberOfPois; ++i){
        if(m_info->debugFile){
            std::optional<std::string> signature = m_readBuffer.readUTF8EncodedString(SIGNATURE_LENGTH_POI);
            if(!startsWith(signature, "***POIStart")){
                logWarn("MapDatabase", "invalid POI signature: " + signature.value_or("") + " (" + m_signatureBlock + ")");
                return false;
            }
        }

        poi = PointOfInterest();
        const int64_t latitude = (int64_t)m_tileLatitude + m_readBuffer.readSignedInt();
        const int64_t longitude = (int64_t)m_tileLongitude + m_readBuffer.readSignedInt();
        if(!m_readBuffer || !toGeoPoint(latitude, longitude, poi.position)) return false;

        // layer (4 bits) and number of tags (4 bits)
        const uint8_t specialByte = (uint8_t)m_readBuffer.readByte();
        poi.layer = (specialByte & 0xf0) >> 4;
        if(!readTagIds(m_info->poiTags, specialByte & 0x0f, poi.tags)) return false;

        const uint8_t featureByte = (uint8_t)m_readBuffer.readByte();
        if(featureByte & POI_FEATURE_NAME) poi.name = m_readBuffer.readUTF8EncodedString();
        if(featureByte & POI_FEATURE_HOUSE_NUMBER) poi.houseNumber = m_readBuffer.readUTF8EncodedString();
        if(featureByte & POI_FEATURE_ELEVATION) poi.elevation = m_readBuffer.readSignedInt();
        if(!m_readBuffer) return false;

        callback.renderPointOfInterest(poi);
    }
    return true;
}

bool MapDatabase::readWayNodes(bool doubleDelta, std::vector<GeoPoint>& out){
    const uint32_t numberOfWayNodes = m_readBuffer.readUnsignedInt();
    if(!m_readBuffer) return false;
    if(numberOfWayNodes < 2 || numberOfWayNodes > (uint32_t)MAXIMUM_WAY_NODES_SEQUENCE_LENGTH){
        logWarn("MapDatabase", str("invalid number of way nodes: ", numberOfWayNodes));
        return false;
    }

    out.clear();
    out.reserve(numberOfWayNodes);

    // first node is an offset from the block corner, the others are deltas
    int64_t latitude = (int64_t)m_tileLatitude + m_readBuffer.readSignedInt();
    int64_t longitude = (int64_t)m_tileLongitude + m_readBuffer.readSignedInt();
    GeoPoint node;
    if(!m_readBuffer || !toGeoPoint(latitude, longitude, node)) return false;
    out.push_back(node);

    int64_t previousDeltaLatitude = 0;
    int64_t previousDeltaLongitude = 0;
    for(uint32_t i=1; i<numberOfWayNodes; ++i){
        int64_t deltaLatitude = m_readBuffer.readSignedInt();
        int64_t deltaLongitude = m_readBuffer.readSignedInt();
        if(!m_readBuffer) return false;
        if(doubleDelta){
            deltaLatitude += previousDeltaLatitude;
            deltaLongitude += previousDeltaLongitude;
            previousDeltaLatitude = deltaLatitude;
            previousDeltaLongitude = deltaLongitude;
        }
        latitude += deltaLatitude;
        longitude += deltaLongitude;
        if(!toGeoPoint(latitude, longitude, node)) return false;
        out.push_back(node);
    }
    return true;
}

bool MapDatabase::processWays(MapDatabaseCallback& callback, const QueryParameters& qp, uint32_t numberOfWays){
    Way way;
    for(uint32_t i=0; i<numberOfWays; ++i){
        if(m_info->debugFile){
            std::optional<std::string> signature = m_readBuffer.readUTF8EncodedString(SIGNATURE_LENGTH_WAY);
            if(!startsWith(signature, "---WayStart")){
                logWarn("MapDatabase", "invalid way signature: " + signature.value_or("") + " (" + m_signatureBlock + ")");
                return false;
            }
        }

        // size of the way data after this field, including the sub-tile bitmask
        const uint32_t wayDataSize = m_readBuffer.readUnsignedInt();
        if(!m_readBuffer) return false;
        if(wayDataSize < 2){
            logWarn("MapDatabase", str("invalid way data size: ", wayDataSize));
            return false;
        }

        if(qp.useTileBitmask){
            const int tileBitmask = m_readBuffer.readShort() & 0xffff;
            if((qp.queryTileBitmask & tileBitmask) == 0){
                // the way is not in the requested part of the block
                m_readBuffer.skipBytes(wayDataSize - 2);
                if(!m_readBuffer) return false;
                continue;
            }
        } else {
            m_readBuffer.skipBytes(2);
        }

        way = Way();
        const uint8_t specialByte = (uint8_t)m_readBuffer.readByte();
        way.layer = (specialByte & 0xf0) >> 4;
        if(!readTagIds(m_info->wayTags, specialByte & 0x0f, way.tags)) return false;

        const uint8_t featureByte = (uint8_t)m_readBuffer.readByte();
        if(featureByte & WAY_FEATURE_NAME) way.name = m_readBuffer.readUTF8EncodedString();
        if(featureByte & WAY_FEATURE_HOUSE_NUMBER) way.houseNumber = m_readBuffer.readUTF8EncodedString();
        if(featureByte & WAY_FEATURE_REF) way.ref = m_readBuffer.readUTF8EncodedString();
        if(featureByte & WAY_FEATURE_LABEL_POSITION){
            const int64_t latitude = (int64_t)m_tileLatitude + m_readBuffer.readSignedInt();
            const int64_t longitude = (int64_t)m_tileLongitude + m_readBuffer.readSignedInt();
            GeoPoint label;
            if(!m_readBuffer || !toGeoPoint(latitude, longitude, label)) return false;
            way.labelPosition = label;
        }

        uint32_t wayDataBlocks = 1;
        if(featureByte & WAY_FEATURE_DATA_BLOCKS_BYTE) wayDataBlocks = m_readBuffer.readUnsignedInt();
        if(!m_readBuffer) return false;
        if(wayDataBlocks < 1){
            logWarn("MapDatabase", str("invalid number of way data blocks: ", wayDataBlocks));
            return false;
        }

        const bool doubleDelta = (featureByte & WAY_FEATURE_DOUBLE_DELTA_ENCODING) != 0;
        for(uint32_t block=0; block<wayDataBlocks; ++block){
            const uint32_t numberOfCoordinateBlocks = m_readBuffer.readUnsignedInt();
            if(!m_readBuffer) return false;
            if(numberOfCoordinateBlocks < 1 || numberOfCoordinateBlocks > (uint32_t)MAXIMUM_COORDINATE_BLOCKS){
                logWarn("MapDatabase", str("invalid number of way coordinate blocks: ", numberOfCoordinateBlocks));
                return false;
            }

            way.coordinateBlocks.assign(numberOfCoordinateBlocks, std::vector<GeoPoint>());
            for(uint32_t c=0; c<numberOfCoordinateBlocks; ++c){
                if(!readWayNodes(doubleDelta, way.coordinateBlocks[c])) return false;
            }
            callback.renderWay(way);
        }
    }
    return true;
}

} // namespace mapstream
