#include "mapstream/FileSystemTileCache.hpp"
#include "mapstream/Log.hpp"
#include "mapstream/TileBitmap.hpp"
#include "mapstream/TileCache.hpp"
#include "mapstream/TileJob.hpp"

#include "TestHarness.hpp"

#include <fstream>

using namespace mapstream;
namespace fs = std::filesystem;

static TileJob MakeJob(int64_t x, int64_t y = 0, uint8_t zoom = 10){
    JobParameters params;
    params.mapFile = "berlin.map";
    return TileJob(Tile(x, y, zoom), MapViewMode::CanvasRenderer, params, DebugSettings());
}

static TileBitmapPtr MakeBitmap(uint8_t shade){
    auto bitmap = std::make_shared<TileBitmap>();
    bitmap->fill(Color{shade, shade, shade, 255});
    bitmap->setPixel(3, 4, Color{255, 0, 0, 255});
    return bitmap;
}

static void TestTileJobKeys(){
    const TileJob a = MakeJob(1, 2);
    const TileJob b = MakeJob(1, 2);
    EXPECT_TRUE(a == b);
    EXPECT_EQ(a.cacheKeyHash(), b.cacheKeyHash());

    TileJob otherFile = a;
    otherFile.jobParameters.mapFile = "hamburg.map";
    EXPECT_FALSE(a == otherFile);
    EXPECT_NE(a.cacheKeyHash(), otherFile.cacheKeyHash());

    TileJob frames = a;
    frames.debugSettings.drawTileFrames = true;
    EXPECT_FALSE(a == frames);
    EXPECT_NE(a.cacheKeyHash(), frames.cacheKeyHash());

    TileJob scaled = a;
    scaled.jobParameters.textScale = 1.5f;
    EXPECT_NE(a.cacheKeyHash(), scaled.cacheKeyHash());

    EXPECT_NE(MakeJob(1, 2).cacheKeyHash(), MakeJob(2, 1).cacheKeyHash());

    MapViewMode mode;
    EXPECT_TRUE(parseMapViewMode("canvas", mode));
    EXPECT_TRUE(parseMapViewMode("CANVAS_RENDERER", mode));
    EXPECT_FALSE(parseMapViewMode("mapnik", mode));
    EXPECT_FALSE(requiresInternetConnection(MapViewMode::CanvasRenderer));
}

static void TestTileBitmap(){
    TileBitmap bitmap(4, 3);
    EXPECT_EQ(bitmap.byteSize(), (size_t)(4 * 3 * 4));
    bitmap.fill(Color{1, 2, 3, 4});
    EXPECT_TRUE(bitmap.getPixel(3, 2) == (Color{1, 2, 3, 4}));

    // ignored outside the bitmap
    bitmap.setPixel(4, 0, Color{9, 9, 9, 9});
    bitmap.setPixel(-1, 0, Color{9, 9, 9, 9});
    EXPECT_TRUE(bitmap.getPixel(0, 0) == (Color{1, 2, 3, 4}));

    bitmap.fillRect(-5, -5, 1, 0, Color{7, 7, 7, 255});
    EXPECT_TRUE(bitmap.getPixel(0, 0) == (Color{7, 7, 7, 255}));
    EXPECT_TRUE(bitmap.getPixel(1, 0) == (Color{7, 7, 7, 255}));
    EXPECT_TRUE(bitmap.getPixel(2, 0) == (Color{1, 2, 3, 4}));

    TileBitmap line(8, 8);
    line.fill(Color{0, 0, 0, 255});
    // far outside on both ends, clipped to the visible part
    line.drawLine(-1e9, 2, 1e9, 2, Color{255, 255, 255, 255});
    for(int x=0; x<8; ++x) EXPECT_TRUE(line.getPixel(x, 2) == (Color{255, 255, 255, 255}));
    EXPECT_TRUE(line.getPixel(0, 3) == (Color{0, 0, 0, 255}));

    line.drawLine(0, 0, 7, 7, Color{0, 255, 0, 255});
    EXPECT_TRUE(line.getPixel(5, 5) == (Color{0, 255, 0, 255}));
}

static void TestMemoryCacheEviction(){
    InMemoryTileCache cache(2, MemoryTileStore());
    EXPECT_EQ(cache.getCapacity(), (size_t)2);

    cache.put(MakeJob(1), MakeBitmap(10));
    cache.put(MakeJob(2), MakeBitmap(20));
    EXPECT_TRUE(cache.get(MakeJob(1)) != nullptr);
    cache.put(MakeJob(3), MakeBitmap(30));

    // 2 was the least recently used entry
    EXPECT_EQ(cache.size(), (size_t)2);
    EXPECT_TRUE(cache.containsKey(MakeJob(1)));
    EXPECT_FALSE(cache.containsKey(MakeJob(2)));
    EXPECT_TRUE(cache.containsKey(MakeJob(3)));
    EXPECT_TRUE(cache.get(MakeJob(2)) == nullptr);
}

static void TestMemoryCachePutReplaces(){
    InMemoryTileCache cache(2, MemoryTileStore());
    const TileBitmapPtr first = MakeBitmap(10);
    const TileBitmapPtr second = MakeBitmap(20);
    cache.put(MakeJob(1), first);
    cache.put(MakeJob(2), MakeBitmap(15));
    cache.put(MakeJob(1), second);
    EXPECT_EQ(cache.size(), (size_t)2);
    EXPECT_TRUE(cache.get(MakeJob(1)) == second);

    // re-putting touched 1, so 2 goes first
    cache.put(MakeJob(3), MakeBitmap(30));
    EXPECT_TRUE(cache.containsKey(MakeJob(1)));
    EXPECT_FALSE(cache.containsKey(MakeJob(2)));

    cache.put(MakeJob(4), nullptr);
    EXPECT_FALSE(cache.containsKey(MakeJob(4)));

    cache.clear();
    EXPECT_EQ(cache.size(), (size_t)0);
    cache.put(MakeJob(5), MakeBitmap(50));
    EXPECT_TRUE(cache.containsKey(MakeJob(5)));
    cache.destroy();
    EXPECT_EQ(cache.size(), (size_t)0);
}

static void TestZeroCapacity(){
    InMemoryTileCache memory(0, MemoryTileStore());
    memory.put(MakeJob(1), MakeBitmap(1));
    EXPECT_EQ(memory.size(), (size_t)0);
    EXPECT_TRUE(memory.get(MakeJob(1)) == nullptr);

    const fs::path dir = MakeTempPath("mapstream_cache_zero");
    FileSystemTileCache disk(0, FileTileStore(dir.string()));
    disk.put(MakeJob(1), MakeBitmap(1));
    EXPECT_EQ(disk.size(), (size_t)0);
    EXPECT_FALSE(fs::exists(disk.getStore().pathFor(MakeJob(1))));
    disk.destroy();
    EXPECT_FALSE(fs::exists(dir));
}

static void TestDiskCacheRoundTrip(){
    const fs::path dir = MakeTempPath("mapstream_cache_disk");
    FileSystemTileCache cache(2, FileTileStore(dir.string()));
    EXPECT_TRUE(fs::is_directory(dir));

    const TileBitmapPtr bitmap = MakeBitmap(77);
    cache.put(MakeJob(1), bitmap);
    const std::string path1 = cache.getStore().pathFor(MakeJob(1));
    EXPECT_TRUE(fs::exists(path1));

    TileBitmapPtr loaded = cache.get(MakeJob(1));
    ASSERT_TRUE(loaded != nullptr);
    EXPECT_TRUE(*loaded == *bitmap);

    cache.put(MakeJob(2), MakeBitmap(2));
    cache.get(MakeJob(1));
    cache.put(MakeJob(3), MakeBitmap(3));
    // evicting removes the file as well
    EXPECT_FALSE(cache.containsKey(MakeJob(2)));
    EXPECT_FALSE(fs::exists(cache.getStore().pathFor(MakeJob(2))));
    EXPECT_TRUE(fs::exists(path1));

    cache.clear();
    EXPECT_EQ(cache.size(), (size_t)0);
    EXPECT_FALSE(fs::exists(path1));
    EXPECT_TRUE(fs::is_directory(dir));

    cache.destroy();
    EXPECT_FALSE(fs::exists(dir));
}

static void TestDiskCacheCorruption(){
    const fs::path dir = MakeTempPath("mapstream_cache_corrupt");
    FileSystemTileCache cache(4, FileTileStore(dir.string()));

    cache.put(MakeJob(1), MakeBitmap(1));
    cache.put(MakeJob(2), MakeBitmap(2));
    cache.put(MakeJob(3), MakeBitmap(3));

    // truncated file
    const std::string path1 = cache.getStore().pathFor(MakeJob(1));
    fs::resize_file(path1, 20);
    EXPECT_TRUE(cache.get(MakeJob(1)) == nullptr);
    EXPECT_FALSE(cache.containsKey(MakeJob(1)));
    EXPECT_FALSE(fs::exists(path1));

    // flipped pixel byte fails the checksum
    const std::string path2 = cache.getStore().pathFor(MakeJob(2));
    {
        std::fstream f(path2, std::ios::binary | std::ios::in | std::ios::out);
        f.seekp(-1, std::ios::end);
        f.put('\x5a');
    }
    EXPECT_TRUE(cache.get(MakeJob(2)) == nullptr);
    EXPECT_FALSE(cache.containsKey(MakeJob(2)));

    // deleted behind the cache's back
    fs::remove(cache.getStore().pathFor(MakeJob(3)));
    EXPECT_TRUE(cache.get(MakeJob(3)) == nullptr);
    EXPECT_EQ(cache.size(), (size_t)0);

    // the tier keeps working
    cache.put(MakeJob(1), MakeBitmap(9));
    EXPECT_TRUE(cache.get(MakeJob(1)) != nullptr);

    cache.destroy();
}

static void TestDestroyKeepsForeignFiles(){
    const fs::path dir = MakeTempPath("mapstream_cache_foreign");
    FileSystemTileCache cache(4, FileTileStore(dir.string()));
    cache.put(MakeJob(1), MakeBitmap(1));
    const std::string own = cache.getStore().pathFor(MakeJob(1));

    const fs::path foreign = dir / "notes.txt";
    {
        std::ofstream out(foreign);
        out << "keep me";
    }

    cache.destroy();
    EXPECT_FALSE(fs::exists(own));
    EXPECT_TRUE(fs::exists(foreign));
    EXPECT_EQ(cache.size(), (size_t)0);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

static void TestSessionsDoNotShareFiles(){
    const fs::path root = MakeTempPath("mapstream_cache_sessions");
    FileSystemTileCache a(4, FileTileStore((root / "session_a").string()));
    FileSystemTileCache b(4, FileTileStore((root / "session_b").string()));

    a.put(MakeJob(1), MakeBitmap(1));
    EXPECT_FALSE(b.containsKey(MakeJob(1)));
    b.put(MakeJob(1), MakeBitmap(2));

    a.destroy();
    TileBitmapPtr fromB = b.get(MakeJob(1));
    ASSERT_TRUE(fromB != nullptr);
    EXPECT_TRUE(fromB->getPixel(0, 0) == (Color{2, 2, 2, 255}));

    b.destroy();
    std::error_code ec;
    fs::remove_all(root, ec);
}

int main(){
    setLogLevel(LogLevel::Off);
    TestTileJobKeys();
    TestTileBitmap();
    TestMemoryCacheEviction();
    TestMemoryCachePutReplaces();
    TestZeroCapacity();
    TestDiskCacheRoundTrip();
    TestDiskCacheCorruption();
    TestDestroyKeepsForeignFiles();
    TestSessionsDoNotShareFiles();
    return FinishTests("mapstream_tile_cache_tests");
}
