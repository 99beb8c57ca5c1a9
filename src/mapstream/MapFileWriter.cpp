#include "mapstream/MapFileWriter.hpp"

#include "mapstream/Log.hpp"
#include "mapstream/MapFileHeader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace mapstream {

namespace {

// Big-endian fixed-width values and the variable-length encodings read back by
// ReadBuffer.
struct ByteWriter {
    std::vector<uint8_t> bytes;

    void putByte(int v){ bytes.push_back((uint8_t)v); }
    void putShort(int v){ putByte(v >> 8); putByte(v); }
    void putInt(int32_t v){
        for(int s=24; s>=0; s-=8) putByte((int)((uint32_t)v >> s));
    }
    void putLong(int64_t v){
        for(int s=56; s>=0; s-=8) putByte((int)((uint64_t)v >> s));
    }
    void putFiveBytes(uint64_t v){
        for(int s=32; s>=0; s-=8) putByte((int)(v >> s));
    }
    void putUnsignedInt(uint32_t v){
        while(v > 0x7f){
            putByte((int)((v & 0x7f) | 0x80));
            v >>= 7;
        }
        putByte((int)v);
    }
    void putSignedInt(int32_t v){
        const bool negative = v < 0;
        uint64_t magnitude = negative ? (uint64_t)(-(int64_t)v) : (uint64_t)v;
        while(magnitude > 0x3f){
            putByte((int)((magnitude & 0x7f) | 0x80));
            magnitude >>= 7;
        }
        putByte((int)(magnitude | (negative ? 0x40 : 0x00)));
    }
    // Absent strings are written as length 0.
    void putString(const std::optional<std::string>& s){
        if(!s){ putUnsignedInt(0); return; }
        putUnsignedInt((uint32_t)s->size());
        bytes.insert(bytes.end(), s->begin(), s->end());
    }
    // Debug signatures: padded with spaces to `length`.
    void putSignature(std::string s, size_t length){
        s.resize(length, ' ');
        bytes.insert(bytes.end(), s.begin(), s.end());
    }
    void append(const std::vector<uint8_t>& other){ bytes.insert(bytes.end(), other.begin(), other.end()); }
};

} // namespace

size_t MapFileWriter::addSubFile(uint8_t baseZoomLevel, uint8_t zoomLevelMin, uint8_t zoomLevelMax){
    m_subFiles.push_back(SubFile{baseZoomLevel, zoomLevelMin, zoomLevelMax, {}});
    return m_subFiles.size() - 1;
}

std::vector<uint32_t> MapFileWriter::resolveTags(std::vector<Tag>& vocabulary, const std::vector<Tag>& tags){
    std::vector<uint32_t> ids;
    for(const auto& tag : tags){
        auto it = std::find(vocabulary.begin(), vocabulary.end(), tag);
        if(it == vocabulary.end()){
            vocabulary.push_back(tag);
            it = vocabulary.end() - 1;
        }
        ids.push_back((uint32_t)(it - vocabulary.begin()));
    }
    return ids;
}

void MapFileWriter::addPointOfInterest(size_t subFile, int64_t tileX, int64_t tileY, int zoomLevel, const PointOfInterest& poi){
    Block& block = m_subFiles.at(subFile).blocks[{tileX, tileY}];
    block.pois.push_back(PoiRecord{zoomLevel, poi, resolveTags(poiTags, poi.tags)});
}

void MapFileWriter::addWay(size_t subFile, int64_t tileX, int64_t tileY, int zoomLevel, const Way& way,
                           const std::vector<std::vector<std::vector<GeoPoint>>>& dataBlocks,
                           bool doubleDeltaEncoding, int tileBitmask){
    Block& block = m_subFiles.at(subFile).blocks[{tileX, tileY}];
    block.ways.push_back(WayRecord{zoomLevel, way, resolveTags(wayTags, way.tags), dataBlocks,
                                   doubleDeltaEncoding, tileBitmask});
}

void MapFileWriter::addWay(size_t subFile, int64_t tileX, int64_t tileY, int zoomLevel, const Way& way,
                           bool doubleDeltaEncoding, int tileBitmask){
    addWay(subFile, tileX, tileY, zoomLevel, way, {way.coordinateBlocks}, doubleDeltaEncoding, tileBitmask);
}

void MapFileWriter::setWater(size_t subFile, int64_t tileX, int64_t tileY, bool water){
    m_subFiles.at(subFile).blocks[{tileX, tileY}].water = water;
}

SubFileParameter MapFileWriter::getSubFileParameter(size_t subFile) const {
    const SubFile& sf = m_subFiles.at(subFile);
    SubFileParameter sp;
    sp.baseZoomLevel = sf.baseZoomLevel;
    sp.zoomLevelMin = sf.zoomLevelMin;
    sp.zoomLevelMax = sf.zoomLevelMax;
    sp.computeBlocks(boundingBox);
    return sp;
}

static int clampZoom(int zoomLevel, int zoomLevelMin, int zoomLevelMax){
    return std::max(zoomLevelMin, std::min(zoomLevel, zoomLevelMax));
}

std::vector<uint8_t> MapFileWriter::buildBlock(const SubFile& subFile, const SubFileParameter& sp,
                                               int64_t tileX, int64_t tileY, const Block& block) const {
    // same truncation as the reader applies to the block corner
    const int32_t tileLatitude = (int32_t)(MercatorProjection::tileYToLatitude(tileY, sp.baseZoomLevel) * kConversionFactor);
    const int32_t tileLongitude = (int32_t)(MercatorProjection::tileXToLongitude(tileX, sp.baseZoomLevel) * kConversionFactor);

    std::vector<const PoiRecord*> pois;
    for(const auto& p : block.pois) pois.push_back(&p);
    std::vector<const WayRecord*> ways;
    for(const auto& w : block.ways) ways.push_back(&w);
    std::stable_sort(pois.begin(), pois.end(), [](const PoiRecord* a, const PoiRecord* b){ return a->zoomLevel < b->zoomLevel; });
    std::stable_sort(ways.begin(), ways.end(), [](const WayRecord* a, const WayRecord* b){ return a->zoomLevel < b->zoomLevel; });

    ByteWriter out;
    if(debugFile){
        out.putSignature("###TileStart" + std::to_string(tileX) + "," + std::to_string(tileY) + "###",
                         MapDatabase::SIGNATURE_LENGTH_BLOCK);
    }

    // zoom table: new POIs/ways per zoom row (the reader accumulates)
    const int rows = subFile.zoomLevelMax - subFile.zoomLevelMin + 1;
    for(int row=0; row<rows; ++row){
        const int z = subFile.zoomLevelMin + row;
        uint32_t poiCount = 0, wayCount = 0;
        for(const auto* p : pois) if(clampZoom(p->zoomLevel, subFile.zoomLevelMin, subFile.zoomLevelMax) == z) ++poiCount;
        for(const auto* w : ways) if(clampZoom(w->zoomLevel, subFile.zoomLevelMin, subFile.zoomLevelMax) == z) ++wayCount;
        out.putUnsignedInt(poiCount);
        out.putUnsignedInt(wayCount);
    }

    ByteWriter poiData;
    int poiNumber = 0;
    for(const auto* rec : pois){
        const PointOfInterest& poi = rec->poi;
        if(debugFile){
            poiData.putSignature("***POIStart" + std::to_string(++poiNumber) + "***", MapDatabase::SIGNATURE_LENGTH_POI);
        }
        poiData.putSignedInt(poi.position.latitudeE6 - tileLatitude);
        poiData.putSignedInt(poi.position.longitudeE6 - tileLongitude);
        poiData.putByte(((poi.layer & 0x0f) << 4) | ((int)rec->tagIds.size() & 0x0f));
        for(uint32_t id : rec->tagIds) poiData.putUnsignedInt(id);

        int featureByte = 0;
        if(poi.name) featureByte |= MapDatabase::POI_FEATURE_NAME;
        if(poi.houseNumber) featureByte |= MapDatabase::POI_FEATURE_HOUSE_NUMBER;
        if(poi.elevation) featureByte |= MapDatabase::POI_FEATURE_ELEVATION;
        poiData.putByte(featureByte);
        if(poi.name) poiData.putString(poi.name);
        if(poi.houseNumber) poiData.putString(poi.houseNumber);
        if(poi.elevation) poiData.putSignedInt(*poi.elevation);
    }

    out.putUnsignedInt((uint32_t)poiData.bytes.size());
    out.append(poiData.bytes);

    int wayNumber = 0;
    for(const auto* rec : ways){
        const Way& way = rec->way;
        if(debugFile){
            out.putSignature("---WayStart" + std::to_string(++wayNumber) + "---", MapDatabase::SIGNATURE_LENGTH_WAY);
        }

        ByteWriter body;
        body.putShort(rec->tileBitmask);
        body.putByte(((way.layer & 0x0f) << 4) | ((int)rec->tagIds.size() & 0x0f));
        for(uint32_t id : rec->tagIds) body.putUnsignedInt(id);

        int featureByte = 0;
        if(way.name) featureByte |= MapDatabase::WAY_FEATURE_NAME;
        if(way.houseNumber) featureByte |= MapDatabase::WAY_FEATURE_HOUSE_NUMBER;
        if(way.ref) featureByte |= MapDatabase::WAY_FEATURE_REF;
        if(way.labelPosition) featureByte |= MapDatabase::WAY_FEATURE_LABEL_POSITION;
        if(rec->dataBlocks.size() != 1) featureByte |= MapDatabase::WAY_FEATURE_DATA_BLOCKS_BYTE;
        if(rec->doubleDelta) featureByte |= MapDatabase::WAY_FEATURE_DOUBLE_DELTA_ENCODING;
        body.putByte(featureByte);

        if(way.name) body.putString(way.name);
        if(way.houseNumber) body.putString(way.houseNumber);
        if(way.ref) body.putString(way.ref);
        if(way.labelPosition){
            body.putSignedInt(way.labelPosition->latitudeE6 - tileLatitude);
            body.putSignedInt(way.labelPosition->longitudeE6 - tileLongitude);
        }
        if(rec->dataBlocks.size() != 1) body.putUnsignedInt((uint32_t)rec->dataBlocks.size());

        for(const auto& coordinateBlocks : rec->dataBlocks){
            body.putUnsignedInt((uint32_t)coordinateBlocks.size());
            for(const auto& nodes : coordinateBlocks){
                body.putUnsignedInt((uint32_t)nodes.size());
                if(nodes.empty()) continue;
                body.putSignedInt(nodes[0].latitudeE6 - tileLatitude);
                body.putSignedInt(nodes[0].longitudeE6 - tileLongitude);
                int32_t previousDeltaLatitude = 0, previousDeltaLongitude = 0;
                for(size_t i=1; i<nodes.size(); ++i){
                    const int32_t deltaLatitude = nodes[i].latitudeE6 - nodes[i-1].latitudeE6;
                    const int32_t deltaLongitude = nodes[i].longitudeE6 - nodes[i-1].longitudeE6;
                    if(rec->doubleDelta){
                        body.putSignedInt(deltaLatitude - previousDeltaLatitude);
                        body.putSignedInt(deltaLongitude - previousDeltaLongitude);
                        previousDeltaLatitude = deltaLatitude;
                        previousDeltaLongitude = deltaLongitude;
                    } else {
                        body.putSignedInt(deltaLatitude);
                        body.putSignedInt(deltaLongitude);
                    }
                }
            }
        }

        out.putUnsignedInt((uint32_t)body.bytes.size());
        out.append(body.bytes);
    }
    return out.bytes;
}

std::vector<uint8_t> MapFileWriter::buildSubFile(const SubFile& subFile) const {
    SubFileParameter sp;
    sp.baseZoomLevel = subFile.baseZoomLevel;
    sp.computeBlocks(boundingBox);

    for(const auto& kv : subFile.blocks){
        const int64_t tileX = kv.first.first, tileY = kv.first.second;
        if(tileX < sp.boundaryTileLeft || tileX > sp.boundaryTileRight
           || tileY < sp.boundaryTileTop || tileY > sp.boundaryTileBottom){
            logWarn("MapFileWriter", str("block outside the bounding box dropped: ", tileX, ",", tileY));
        }
    }

    const size_t indexOffset = debugFile ? MapFileHeader::SIGNATURE_LENGTH_INDEX : 0;
    const size_t indexSize = (size_t)sp.numberOfBlocks * SubFileParameter::BYTES_PER_INDEX_ENTRY;

    ByteWriter index;
    ByteWriter blocks;
    for(int64_t row=0; row<sp.blocksHeight; ++row){
        for(int64_t column=0; column<sp.blocksWidth; ++column){
            const int64_t tileX = sp.boundaryTileLeft + column;
            const int64_t tileY = sp.boundaryTileTop + row;
            // block pointers are relative to the sub-file start
            const uint64_t pointer = indexOffset + indexSize + blocks.bytes.size();

            bool water = false;
            auto it = subFile.blocks.find({tileX, tileY});
            if(it != subFile.blocks.end()){
                water = it->second.water;
                if(!it->second.pois.empty() || !it->second.ways.empty()){
                    blocks.append(buildBlock(subFile, sp, tileX, tileY, it->second));
                }
            }
            index.putFiveBytes(pointer | (water ? 0x8000000000ULL : 0));
        }
    }

    ByteWriter out;
    if(debugFile) out.putSignature("+++IndexStart+++", MapFileHeader::SIGNATURE_LENGTH_INDEX);
    out.append(index.bytes);
    out.append(blocks.bytes);
    return out.bytes;
}

std::vector<uint8_t> MapFileWriter::buildHeader(const std::vector<std::pair<int64_t, int64_t>>& subFileAddresses,
                                                int64_t fileSize) const {
    ByteWriter h;
    h.putInt(fileVersion);
    h.putLong(fileSize);
    h.putLong(mapDate);
    h.putInt(boundingBox.minLatitudeE6);
    h.putInt(boundingBox.minLongitudeE6);
    h.putInt(boundingBox.maxLatitudeE6);
    h.putInt(boundingBox.maxLongitudeE6);
    h.putShort(tilePixelSize);
    h.putString(projectionName);
    h.putString(languagePreference);

    int flags = 0;
    if(debugFile) flags |= MapFileHeader::HEADER_BITMASK_DEBUG;
    if(startPosition) flags |= MapFileHeader::HEADER_BITMASK_START_POSITION;
    h.putByte(flags);
    if(startPosition){
        h.putInt(startPosition->latitudeE6);
        h.putInt(startPosition->longitudeE6);
    }

    h.putShort((int)poiTags.size());
    for(const auto& tag : poiTags) h.putString(tag.toString());
    h.putShort((int)wayTags.size());
    for(const auto& tag : wayTags) h.putString(tag.toString());

    h.putByte((int)m_subFiles.size());
    for(size_t i=0; i<m_subFiles.size(); ++i){
        h.putByte(m_subFiles[i].baseZoomLevel);
        h.putByte(m_subFiles[i].zoomLevelMin);
        h.putByte(m_subFiles[i].zoomLevelMax);
        h.putLong(subFileAddresses[i].first);
        h.putLong(subFileAddresses[i].second);
    }
    h.putString(commentText);

    ByteWriter out;
    out.bytes.assign(magic.begin(), magic.end());
    out.putInt(remainingHeaderSizeOverride.value_or((int32_t)h.bytes.size()));
    out.append(h.bytes);
    return out.bytes;
}

std::vector<uint8_t> MapFileWriter::build() const {
    std::vector<std::vector<uint8_t>> subFiles;
    for(const auto& sf : m_subFiles) subFiles.push_back(buildSubFile(sf));

    // the header has a fixed size for given tags and strings; measure it first
    std::vector<std::pair<int64_t, int64_t>> addresses(m_subFiles.size(), {0, 0});
    const int64_t headerSize = (int64_t)buildHeader(addresses, 0).size();

    int64_t position = headerSize;
    for(size_t i=0; i<subFiles.size(); ++i){
        addresses[i] = {position, (int64_t)subFiles[i].size()};
        position += (int64_t)subFiles[i].size();
    }

    ByteWriter out;
    out.append(buildHeader(addresses, position + fileSizeAdjustment));
    for(const auto& sf : subFiles) out.append(sf);
    return out.bytes;
}

bool MapFileWriter::write(const std::string& path, std::string& error) const {
    const std::vector<uint8_t> bytes = build();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out){
        error = "cannot create " + path;
        return false;
    }
    out.write((const char*)bytes.data(), (std::streamsize)bytes.size());
    if(!out){
        error = "failed writing " + path;
        return false;
    }
    return true;
}

} // namespace mapstream
