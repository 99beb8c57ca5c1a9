#include "mapstream/Log.hpp"
#include "mapstream/MapDatabase.hpp"
#include "mapstream/MapFileWriter.hpp"
#include "mapstream/QueryCalculations.hpp"

#include "TestHarness.hpp"

#include <fstream>
#include <vector>

using namespace mapstream;

namespace {

struct Collector : MapDatabaseCallback {
    std::vector<PointOfInterest> pois;
    std::vector<Way> ways;
    int waterCalls = 0;

    void renderPointOfInterest(const PointOfInterest& poi) override { pois.push_back(poi); }
    void renderWay(const Way& way) override { ways.push_back(way); }
    void renderWaterBackground() override { ++waterCalls; }
};

// A small map around one base zoom 14 block with content attached to the
// top-left block of the bounding box.
struct Fixture {
    MapFileWriter writer;
    size_t subFile = 0;
    int64_t blockX = 0;
    int64_t blockY = 0;
    // block corner, microdegrees
    int32_t cornerLat = 0;
    int32_t cornerLon = 0;

    Fixture(){
        writer.boundingBox = BoundingBox{52500000, 13400000, 52540000, 13440000};
        subFile = writer.addSubFile(14, 12, 16);
        const SubFileParameter sp = writer.getSubFileParameter(subFile);
        blockX = sp.boundaryTileLeft;
        blockY = sp.boundaryTileTop;
        cornerLat = (int32_t)(MercatorProjection::tileYToLatitude(blockY, 14) * kConversionFactor);
        cornerLon = (int32_t)(MercatorProjection::tileXToLongitude(blockX, 14) * kConversionFactor);
    }

    GeoPoint at(int32_t south, int32_t east) const { return GeoPoint{cornerLat - south, cornerLon + east}; }

    std::filesystem::path write(){
        const auto path = MakeTempPath("mapstream_db");
        std::string error;
        EXPECT_TRUE(writer.write(path.string(), error));
        return path;
    }
};

void RemoveFile(const std::filesystem::path& path){
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

static void TestPointsOfInterest(){
    Fixture f;
    PointOfInterest cafe;
    cafe.position = f.at(1000, 2000);
    cafe.layer = 5;
    cafe.tags = {Tag("amenity", "cafe")};
    cafe.name = std::string("Kaffeehaus");
    cafe.houseNumber = std::string("12a");
    cafe.elevation = -4;
    f.writer.addPointOfInterest(f.subFile, f.blockX, f.blockY, 12, cafe);

    PointOfInterest peak;
    peak.position = f.at(3000, 500);
    peak.tags = {Tag("natural", "peak")};
    f.writer.addPointOfInterest(f.subFile, f.blockX, f.blockY, 15, peak);

    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());

    Collector c14;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c14));
    ASSERT_TRUE(c14.pois.size() == 1);
    const PointOfInterest& p = c14.pois[0];
    EXPECT_TRUE(p.position == cafe.position);
    EXPECT_EQ(p.layer, 5);
    EXPECT_TRUE(p.tags.size() == 1 && p.tags[0] == Tag("amenity", "cafe"));
    EXPECT_EQ(p.name.value_or(""), std::string("Kaffeehaus"));
    EXPECT_EQ(p.houseNumber.value_or(""), std::string("12a"));
    EXPECT_EQ(p.elevation.value_or(0), -4);
    EXPECT_EQ(c14.waterCalls, 0);

    // zoom table rows accumulate: zoom 15 sees both
    Collector c15;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX * 2, f.blockY * 2, 15), c15));
    ASSERT_TRUE(c15.pois.size() == 2);
    EXPECT_FALSE(c15.pois[1].name.has_value());
    EXPECT_TRUE(c15.pois[1].position == peak.position);

    // below the sub-file minimum the query is clamped to zoom 12
    Collector c5;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX >> 9, f.blockY >> 9, 5), c5));
    EXPECT_EQ(c5.pois.size(), (size_t)1);

    RemoveFile(path);
}

static void TestWays(){
    Fixture f;
    Way road;
    road.tags = {Tag("highway", "primary")};
    road.name = std::string("Hauptstrasse");
    road.ref = std::string("B1");
    road.layer = 7;
    road.coordinateBlocks = {{f.at(100, 100), f.at(200, 300), f.at(250, 700), f.at(240, 1500)}};
    f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, road);

    Way area;
    area.tags = {Tag("building", "yes")};
    area.houseNumber = std::string("7");
    area.labelPosition = f.at(5050, 5050);
    area.coordinateBlocks = {
        {f.at(5000, 5000), f.at(5000, 5100), f.at(5100, 5100), f.at(5100, 5000), f.at(5000, 5000)},
        {f.at(5020, 5020), f.at(5020, 5040), f.at(5040, 5040), f.at(5020, 5020)},
    };
    f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, area, true);

    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());

    Collector c;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
    ASSERT_TRUE(c.ways.size() == 2);

    const Way& r = c.ways[0];
    EXPECT_EQ(r.layer, 7);
    EXPECT_EQ(r.name.value_or(""), std::string("Hauptstrasse"));
    EXPECT_EQ(r.ref.value_or(""), std::string("B1"));
    EXPECT_FALSE(r.labelPosition.has_value());
    ASSERT_TRUE(r.coordinateBlocks.size() == 1);
    EXPECT_TRUE(r.coordinateBlocks[0] == road.coordinateBlocks[0]);

    // double delta encoded polygon with an inner ring
    const Way& a = c.ways[1];
    EXPECT_EQ(a.houseNumber.value_or(""), std::string("7"));
    EXPECT_TRUE(a.labelPosition.has_value() && *a.labelPosition == *area.labelPosition);
    ASSERT_TRUE(a.coordinateBlocks.size() == 2);
    EXPECT_TRUE(a.coordinateBlocks[0] == area.coordinateBlocks[0]);
    EXPECT_TRUE(a.coordinateBlocks[1] == area.coordinateBlocks[1]);

    RemoveFile(path);
}

static void TestMultipleDataBlocks(){
    Fixture f;
    Way way;
    way.tags = {Tag("waterway", "river")};
    const std::vector<std::vector<std::vector<GeoPoint>>> dataBlocks = {
        {{f.at(10, 10), f.at(20, 20)}},
        {{f.at(30, 30), f.at(40, 40), f.at(50, 50)}},
    };
    f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, way, dataBlocks);

    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());
    Collector c;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
    // one callback per data block
    ASSERT_TRUE(c.ways.size() == 2);
    EXPECT_EQ(c.ways[1].coordinateBlocks[0].size(), (size_t)3);
    RemoveFile(path);
}

static void TestTileBitmask(){
    EXPECT_EQ(calculateTileBitmask(Tile(0, 0, 15), 1), 0xcc00);
    EXPECT_EQ(calculateTileBitmask(Tile(1, 1, 15), 1), 0x0033);
    EXPECT_EQ(calculateTileBitmask(Tile(0, 0, 16), 2), 0x8000);
    EXPECT_EQ(calculateTileBitmask(Tile(3, 3, 16), 2), 0x0001);
    EXPECT_EQ(calculateTileBitmask(Tile(2, 1, 16), 2), 0x0200);

    Fixture f;
    Way topLeft;
    topLeft.tags = {Tag("highway", "service")};
    topLeft.coordinateBlocks = {{f.at(10, 10), f.at(20, 20)}};
    f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, topLeft, false, 0x8000);

    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());

    Collector inside;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX * 4, f.blockY * 4, 16), inside));
    EXPECT_EQ(inside.ways.size(), (size_t)1);

    Collector outside;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX * 4 + 3, f.blockY * 4 + 3, 16), outside));
    EXPECT_EQ(outside.ways.size(), (size_t)0);

    // the whole block ignores the mask
    Collector block;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), block));
    EXPECT_EQ(block.ways.size(), (size_t)1);
    RemoveFile(path);
}

static void TestWater(){
    Fixture f;
    const SubFileParameter sp = f.writer.getSubFileParameter(f.subFile);
    for(int64_t y = sp.boundaryTileTop; y <= sp.boundaryTileBottom; ++y){
        for(int64_t x = sp.boundaryTileLeft; x <= sp.boundaryTileRight; ++x){
            f.writer.setWater(f.subFile, x, y, true);
        }
    }
    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());

    Collector c;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
    EXPECT_EQ(c.waterCalls, 1);

    // a zoom 12 tile spans every block of the bounding box
    Collector wide;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX >> 2, f.blockY >> 2, 12), wide));
    EXPECT_EQ(wide.waterCalls, 1);
    RemoveFile(path);

    Fixture g;
    g.writer.setWater(g.subFile, g.blockX, g.blockY, false);
    const auto dry = g.write();
    ASSERT_TRUE(db.openFile(dry.string()).isSuccess());
    Collector d;
    EXPECT_TRUE(db.executeQuery(Tile(g.blockX, g.blockY, 14), d));
    EXPECT_EQ(d.waterCalls, 0);
    RemoveFile(dry);
}

static void TestDebugSignatures(){
    Fixture f;
    f.writer.debugFile = true;
    PointOfInterest poi;
    poi.position = f.at(100, 100);
    poi.tags = {Tag("place", "village")};
    f.writer.addPointOfInterest(f.subFile, f.blockX, f.blockY, 12, poi);
    Way way;
    way.tags = {Tag("railway", "rail")};
    way.coordinateBlocks = {{f.at(10, 10), f.at(20, 20)}};
    f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, way);

    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());
    EXPECT_TRUE(db.getMapFileInfo()->debugFile);

    Collector c;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
    EXPECT_EQ(c.pois.size(), (size_t)1);
    EXPECT_EQ(c.ways.size(), (size_t)1);
    RemoveFile(path);
}

static void TestCorruptBlock(){
    Fixture f;
    Way way;
    way.tags = {Tag("highway", "primary")};
    way.coordinateBlocks = {{f.at(10, 10), f.at(20, 20)}};
    f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, way);
    // the block refers to way tag 0, the header declares none
    f.writer.wayTags.clear();

    const auto path = f.write();
    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());
    Collector c;
    EXPECT_FALSE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
    EXPECT_TRUE(c.ways.empty());

    // the database stays usable
    EXPECT_TRUE(db.hasOpenFile());
    Collector empty;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX + 1, f.blockY, 14), empty));
    RemoveFile(path);
}

static void TestCoordinatesOffTheGlobe(){
    {
        // double delta accumulates past the north pole
        Fixture f;
        Way way;
        way.tags = {Tag("highway", "primary")};
        way.coordinateBlocks = {{f.at(0, 0), GeoPoint{f.cornerLat + 20000000, f.cornerLon},
                                 GeoPoint{f.cornerLat + 40000000, f.cornerLon}}};
        f.writer.addWay(f.subFile, f.blockX, f.blockY, 12, way, true);
        const auto path = f.write();
        MapDatabase db;
        ASSERT_TRUE(db.openFile(path.string()).isSuccess());
        Collector c;
        EXPECT_FALSE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
        EXPECT_TRUE(c.ways.empty());
        RemoveFile(path);
    }
    {
        Fixture f;
        PointOfInterest poi;
        poi.position = GeoPoint{f.cornerLat, 185000000};
        f.writer.addPointOfInterest(f.subFile, f.blockX, f.blockY, 12, poi);
        const auto path = f.write();
        MapDatabase db;
        ASSERT_TRUE(db.openFile(path.string()).isSuccess());
        Collector c;
        EXPECT_FALSE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
        EXPECT_TRUE(c.pois.empty());
        RemoveFile(path);
    }
}

// The last block of the sub-file runs past the end of a truncated file whose
// size field was patched to match.
static void TestBlockBeyondEndOfFile(){
    Fixture f;
    const SubFileParameter sp = f.writer.getSubFileParameter(f.subFile);
    ASSERT_TRUE(sp.boundaryTileRight > sp.boundaryTileLeft || sp.boundaryTileBottom > sp.boundaryTileTop);
    PointOfInterest first;
    first.position = f.at(100, 100);
    f.writer.addPointOfInterest(f.subFile, f.blockX, f.blockY, 12, first);
    PointOfInterest last;
    last.position = GeoPoint{
        (int32_t)(MercatorProjection::tileYToLatitude(sp.boundaryTileBottom, 14) * kConversionFactor) - 100,
        (int32_t)(MercatorProjection::tileXToLongitude(sp.boundaryTileRight, 14) * kConversionFactor) + 100};
    f.writer.addPointOfInterest(f.subFile, sp.boundaryTileRight, sp.boundaryTileBottom, 12, last);

    std::vector<uint8_t> bytes = f.writer.build();
    bytes.resize(bytes.size() - 3);
    // file size field, big-endian int64 after magic, header size and version
    const uint64_t size = bytes.size();
    for(int i=0; i<8; ++i) bytes[28 + i] = (uint8_t)(size >> (8 * (7 - i)));

    const auto path = MakeTempPath("mapstream_db_truncated");
    {
        std::ofstream out(path, std::ios::binary);
        out.write((const char*)bytes.data(), (std::streamsize)bytes.size());
    }

    MapDatabase db;
    ASSERT_TRUE(db.openFile(path.string()).isSuccess());
    Collector tail;
    EXPECT_FALSE(db.executeQuery(Tile(sp.boundaryTileRight, sp.boundaryTileBottom, 14), tail));
    EXPECT_TRUE(tail.pois.empty());
    Collector head;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), head));
    EXPECT_EQ(head.pois.size(), (size_t)1);
    RemoveFile(path);
}

static void TestFailedOpenKeepsFile(){
    Fixture f;
    PointOfInterest poi;
    poi.position = f.at(100, 100);
    f.writer.addPointOfInterest(f.subFile, f.blockX, f.blockY, 12, poi);
    const auto good = f.write();

    MapFileWriter broken;
    broken.addSubFile(0, 0, 0);
    broken.fileVersion = 5;
    const auto bad = MakeTempPath("mapstream_db_bad");
    std::string error;
    ASSERT_TRUE(broken.write(bad.string(), error));

    MapDatabase db;
    ASSERT_TRUE(db.openFile(good.string()).isSuccess());
    FileOpenResult r = db.openFile(bad.string());
    EXPECT_EQ(r.getErrorKind(), FileOpenResult::ErrorKind::UnsupportedVersion);
    EXPECT_TRUE(db.hasOpenFile());
    EXPECT_EQ(db.getMapFile(), good.string());

    Collector c;
    EXPECT_TRUE(db.executeQuery(Tile(f.blockX, f.blockY, 14), c));
    EXPECT_EQ(c.pois.size(), (size_t)1);

    db.closeFile();
    EXPECT_FALSE(db.hasOpenFile());
    EXPECT_TRUE(db.getMapFileInfo() == nullptr);
    Collector none;
    EXPECT_FALSE(db.executeQuery(Tile(f.blockX, f.blockY, 14), none));
    // closing twice is harmless
    db.closeFile();

    RemoveFile(good);
    RemoveFile(bad);
}

int main(){
    setLogLevel(LogLevel::Error);
    TestPointsOfInterest();
    TestWays();
    TestMultipleDataBlocks();
    TestTileBitmask();
    TestWater();
    TestDebugSignatures();
    TestCorruptBlock();
    TestCoordinatesOffTheGlobe();
    TestBlockBeyondEndOfFile();
    TestFailedOpenKeepsFile();
    return FinishTests("mapstream_map_database_tests");
}
