#include "mapstream/Log.hpp"
#include "mapstream/MapDatabase.hpp"
#include "mapstream/MapFileHeader.hpp"
#include "mapstream/MapFileWriter.hpp"

#include "TestHarness.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <vector>

using namespace mapstream;
using ErrorKind = FileOpenResult::ErrorKind;

static std::filesystem::path WriteTemp(const std::vector<uint8_t>& bytes){
    const auto path = MakeTempPath("mapstream_header");
    std::ofstream out(path, std::ios::binary);
    out.write((const char*)bytes.data(), (std::streamsize)bytes.size());
    return path;
}

static FileOpenResult ReadHeader(const std::vector<uint8_t>& bytes, MapFileHeader& header){
    const auto path = WriteTemp(bytes);
    const int fd = ::open(path.c_str(), O_RDONLY);
    ReadBuffer rb(fd);
    FileOpenResult r = header.readHeader(rb, (int64_t)bytes.size());
    ::close(fd);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return r;
}

static ErrorKind KindOf(const MapFileWriter& writer){
    MapFileHeader header;
    FileOpenResult r = ReadHeader(writer.build(), header);
    if(!r.isSuccess()) EXPECT_TRUE(header.getMapFileInfo() == nullptr);
    return r.getErrorKind();
}

static MapFileWriter Minimal(){
    MapFileWriter w;
    w.addSubFile(0, 0, 0);
    return w;
}

static void TestMinimalFile(){
    MapFileHeader header;
    FileOpenResult r = ReadHeader(Minimal().build(), header);
    ASSERT_TRUE(r.isSuccess());

    auto info = header.getMapFileInfo();
    ASSERT_TRUE(info != nullptr);
    EXPECT_EQ(info->fileVersion, 3);
    EXPECT_EQ(info->mapDate, (int64_t)1324124730145LL);
    EXPECT_EQ((int)info->numberOfSubFiles, 1);
    EXPECT_EQ(info->tilePixelSize, 256);
    EXPECT_EQ(info->projectionName, std::string("Mercator"));
    EXPECT_FALSE(info->startPosition.has_value());
    EXPECT_FALSE(info->languagePreference.has_value());
    EXPECT_FALSE(info->commentText.has_value());
    EXPECT_FALSE(info->debugFile);
    EXPECT_TRUE(info->boundingBox == BoundingBox{});

    EXPECT_EQ((int)header.getZoomLevelMinimum(), 0);
    EXPECT_EQ((int)header.getZoomLevelMaximum(), 0);
    const SubFileParameter* sp = header.getSubFileParameter(0);
    ASSERT_TRUE(sp != nullptr);
    EXPECT_EQ(sp->numberOfBlocks, (int64_t)1);
    EXPECT_EQ(sp->indexStartAddress, sp->startAddress);
}

static void TestOptionalFields(){
    MapFileWriter w = Minimal();
    w.boundingBox = BoundingBox{52000000, 13000000, 52600000, 13800000};
    w.startPosition = GeoPoint{52500000, 13400000};
    w.languagePreference = std::string("de");
    w.commentText = std::string("test data");
    w.poiTags = {Tag("amenity", "cafe")};
    w.wayTags = {Tag("highway", "primary"), Tag("building", "yes")};

    MapFileHeader header;
    ASSERT_TRUE(ReadHeader(w.build(), header).isSuccess());
    auto info = header.getMapFileInfo();
    EXPECT_TRUE(info->boundingBox == w.boundingBox);
    EXPECT_TRUE(info->startPosition.has_value() && *info->startPosition == (GeoPoint{52500000, 13400000}));
    EXPECT_EQ(info->mapCenter.latitudeE6, 52300000);
    EXPECT_EQ(info->mapCenter.longitudeE6, 13400000);
    EXPECT_EQ(info->languagePreference.value_or(""), std::string("de"));
    EXPECT_EQ(info->commentText.value_or(""), std::string("test data"));
    ASSERT_TRUE(info->poiTags.size() == 1 && info->wayTags.size() == 2);
    EXPECT_TRUE(info->poiTags[0] == Tag("amenity", "cafe"));
    EXPECT_TRUE(info->wayTags[1] == Tag("building", "yes"));
}

static void TestRejectedHeaders(){
    {
        MapFileWriter w = Minimal();
        w.fileSizeAdjustment = 1;
        EXPECT_EQ(KindOf(w), ErrorKind::SizeMismatch);
    }
    {
        MapFileWriter w = Minimal();
        w.magic = "mapsforge binary OSX";
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidMagicByte);
    }
    {
        MapFileWriter w = Minimal();
        w.remainingHeaderSizeOverride = 69;
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidHeaderSize);
        w.remainingHeaderSizeOverride = 1000001;
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidHeaderSize);
    }
    {
        MapFileWriter w = Minimal();
        w.fileVersion = 4;
        EXPECT_EQ(KindOf(w), ErrorKind::UnsupportedVersion);
    }
    {
        MapFileWriter w = Minimal();
        w.mapDate = 1199999999999LL;
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidDate);
    }
    {
        MapFileWriter w = Minimal();
        w.boundingBox = BoundingBox{10, 0, 5, 0};
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidBoundingBox);
        w.boundingBox = BoundingBox{0, 0, 90000001, 0};
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidBoundingBox);
    }
    {
        MapFileWriter w = Minimal();
        w.tilePixelSize = 512;
        EXPECT_EQ(KindOf(w), ErrorKind::UnsupportedTileSize);
    }
    {
        MapFileWriter w = Minimal();
        w.projectionName = "Lambert";
        EXPECT_EQ(KindOf(w), ErrorKind::UnsupportedProjection);
    }
    {
        MapFileWriter w = Minimal();
        w.startPosition = GeoPoint{0, 180000001};
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidStartPosition);
    }
    {
        // padded past the minimum header size so the sub-file count is reached
        MapFileWriter w;
        w.commentText = std::string(40, 'c');
        EXPECT_EQ(KindOf(w), ErrorKind::NoSubFiles);
    }
    {
        MapFileWriter w;
        w.addSubFile(0, 5, 3);
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidSubFile);
    }
    {
        MapFileWriter w;
        w.addSubFile(21, 0, 0);
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidSubFile);
    }
    {
        // zoom levels 3 and 4 not covered
        MapFileWriter w;
        w.addSubFile(0, 0, 2);
        w.addSubFile(6, 5, 8);
        EXPECT_EQ(KindOf(w), ErrorKind::InvalidSubFile);
    }
}

static void TestNegativeTagCount(){
    // magic(20) size(4) version(4) fileSize(8) date(8) bbox(16) tileSize(2)
    // projection(1+8) language(1) flags(1) -> POI tag count at 73
    std::vector<uint8_t> bytes = Minimal().build();
    ASSERT_TRUE(bytes.size() > 74);
    bytes[73] = 0x80;
    MapFileHeader header;
    EXPECT_EQ(ReadHeader(bytes, header).getErrorKind(), ErrorKind::InvalidTag);
}

static void TestEmptyTagString(){
    MapFileWriter w = Minimal();
    w.poiTags = {Tag("amenity", "cafe")};
    std::vector<uint8_t> bytes = w.build();
    // POI tag count at 73..74, length of the first tag string at 75
    ASSERT_TRUE(bytes.size() > 76);
    ASSERT_TRUE(bytes[75] == 12);
    bytes[75] = 0;
    MapFileHeader header;
    FileOpenResult r = ReadHeader(bytes, header);
    EXPECT_EQ(r.getErrorKind(), ErrorKind::InvalidTag);
    EXPECT_TRUE(header.getMapFileInfo() == nullptr);
}

static void TestTruncatedFile(){
    std::vector<uint8_t> bytes = Minimal().build();
    bytes.resize(40);
    MapFileHeader header;
    FileOpenResult r = ReadHeader(bytes, header);
    EXPECT_FALSE(r.isSuccess());
    EXPECT_EQ(r.getErrorKind(), ErrorKind::InvalidHeaderSize);
}

static void TestZoomLevelLookup(){
    MapFileWriter w;
    w.addSubFile(6, 3, 10);
    w.addSubFile(12, 8, 14);

    MapFileHeader header;
    ASSERT_TRUE(ReadHeader(w.build(), header).isSuccess());
    EXPECT_EQ((int)header.getZoomLevelMinimum(), 3);
    EXPECT_EQ((int)header.getZoomLevelMaximum(), 14);

    EXPECT_EQ((int)header.getQueryZoomLevel(0), 3);
    EXPECT_EQ((int)header.getQueryZoomLevel(9), 9);
    EXPECT_EQ((int)header.getQueryZoomLevel(22), 14);

    // the later sub-file wins where intervals overlap
    EXPECT_EQ((int)header.getSubFileParameter(7)->baseZoomLevel, 6);
    EXPECT_EQ((int)header.getSubFileParameter(8)->baseZoomLevel, 12);
    EXPECT_EQ((int)header.getSubFileParameter(10)->baseZoomLevel, 12);
    EXPECT_TRUE(header.getSubFileParameter(2) == nullptr);
    EXPECT_TRUE(header.getSubFileParameter(15) == nullptr);
}

static void TestDebugIndexSignature(){
    MapFileWriter w = Minimal();
    w.debugFile = true;
    MapFileHeader header;
    ASSERT_TRUE(ReadHeader(w.build(), header).isSuccess());
    EXPECT_TRUE(header.getMapFileInfo()->debugFile);
    const SubFileParameter* sp = header.getSubFileParameter(0);
    ASSERT_TRUE(sp != nullptr);
    EXPECT_EQ(sp->indexStartAddress, sp->startAddress + 16);
}

static void TestFailedReadKeepsState(){
    MapFileWriter good = Minimal();
    good.commentText = std::string("first");
    MapFileHeader header;
    ASSERT_TRUE(ReadHeader(good.build(), header).isSuccess());

    MapFileWriter bad = Minimal();
    bad.fileVersion = 2;
    EXPECT_FALSE(ReadHeader(bad.build(), header).isSuccess());
    ASSERT_TRUE(header.getMapFileInfo() != nullptr);
    EXPECT_EQ(header.getMapFileInfo()->commentText.value_or(""), std::string("first"));

    header.reset();
    EXPECT_TRUE(header.getMapFileInfo() == nullptr);
    EXPECT_TRUE(header.getSubFileParameter(0) == nullptr);
}

static void TestOpenFileErrors(){
    MapDatabase db;
    FileOpenResult r = db.openFile(MakeTempPath("mapstream_missing").string());
    EXPECT_EQ(r.getErrorKind(), ErrorKind::IoError);
    EXPECT_FALSE(db.hasOpenFile());
    EXPECT_TRUE(db.getMapFileInfo() == nullptr);

    r = db.openFile(std::filesystem::temp_directory_path().string());
    EXPECT_EQ(r.getErrorKind(), ErrorKind::IoError);

    EXPECT_EQ(std::string(errorKindName(ErrorKind::SizeMismatch)), std::string("size mismatch"));
}

int main(){
    setLogLevel(LogLevel::Error);
    TestMinimalFile();
    TestOptionalFields();
    TestRejectedHeaders();
    TestNegativeTagCount();
    TestEmptyTagString();
    TestTruncatedFile();
    TestZoomLevelLookup();
    TestDebugIndexSignature();
    TestFailedReadKeepsState();
    TestOpenFileErrors();
    return FinishTests("mapstream_map_file_header_tests");
}
