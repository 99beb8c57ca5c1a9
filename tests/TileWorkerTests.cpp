#include "mapstream/JobQueue.hpp"
#include "mapstream/Log.hpp"
#include "mapstream/MapGenerator.hpp"
#include "mapstream/MapPosition.hpp"
#include "mapstream/TileCache.hpp"
#include "mapstream/TileWorker.hpp"

#include "TestHarness.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

using namespace mapstream;
using namespace std::chrono_literals;

namespace {

// Paints tiles a flat colour. Optionally holds each job until released.
class FakeGenerator : public MapGenerator {
public:
    bool executeJob(const TileJob& job, TileBitmap& bitmap) override {
        {
            std::unique_lock<std::mutex> lk(m_mutex);
            ++m_started;
            m_cv.notify_all();
            m_cv.wait(lk, [&]{ return !m_hold; });
        }
        ++calls;
        if(failAll) return false;
        bitmap.fill(Color{(uint8_t)job.tile.tileX, 0, 0, 255});
        return true;
    }
    std::optional<GeoPoint> getStartPoint() const override { return std::nullopt; }
    uint8_t getZoomLevelDefault() const override { return 10; }
    uint8_t getZoomLevelMax() const override { return 20; }
    bool requiresInternetConnection() const override { return false; }
    void cleanup() override { cleanedUp = true; }

    void hold(){ std::lock_guard<std::mutex> lk(m_mutex); m_hold = true; }
    void release(){ std::lock_guard<std::mutex> lk(m_mutex); m_hold = false; m_cv.notify_all(); }
    void awaitStarted(int n){
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv.wait(lk, [&]{ return m_started >= n; });
    }

    std::atomic<int> calls{0};
    std::atomic<bool> cleanedUp{false};
    bool failAll = false;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_hold = false;
    int m_started = 0;
};

TileJob MakeJob(int64_t x){
    JobParameters params;
    params.mapFile = "test.map";
    return TileJob(Tile(x, 0, 8), MapViewMode::CanvasRenderer, params, DebugSettings());
}

bool WaitFor(const std::function<bool()>& cond){
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while(!cond()){
        if(std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

struct Rig {
    MapPosition position;
    JobQueue queue{position};
    InMemoryTileCache memory{8, MemoryTileStore()};
    InMemoryTileCache disk{8, MemoryTileStore()};
    FakeGenerator generator;
    TileWorker worker{queue, memory, disk};

    Rig(){
        // west of tile x=0, so lower x is scheduled first
        position.setMapCenterAndZoomLevel(GeoPoint::fromDegrees(80, -179.9), 8);
        worker.setMapGenerator(&generator);
    }
};

} // namespace

static void TestProducesTiles(){
    Rig rig;
    std::atomic<int> repaints{0};
    rig.worker.setRepaintCallback([&](const TileJob&, const TileBitmapPtr& bitmap){
        if(bitmap) ++repaints;
    });
    rig.queue.addJob(MakeJob(1));
    rig.queue.addJob(MakeJob(2));
    rig.worker.start();

    EXPECT_TRUE(WaitFor([&]{ return rig.worker.getTilesProduced() == 2; }));
    EXPECT_TRUE(WaitFor([&]{ return repaints.load() == 2; }));
    EXPECT_TRUE(rig.memory.containsKey(MakeJob(1)));
    EXPECT_TRUE(rig.disk.containsKey(MakeJob(2)));
    EXPECT_TRUE(rig.memory.get(MakeJob(2))->getPixel(0, 0) == (Color{2, 0, 0, 255}));

    rig.worker.interrupt();
    rig.worker.join();
    EXPECT_TRUE(rig.worker.getState() == TileWorker::State::Stopped);
    EXPECT_TRUE(rig.generator.cleanedUp.load());
}

static void TestDiskHitIsPromoted(){
    Rig rig;
    auto stored = std::make_shared<TileBitmap>();
    rig.disk.put(MakeJob(5), stored);
    rig.queue.addJob(MakeJob(5));
    rig.worker.start();

    EXPECT_TRUE(WaitFor([&]{ return rig.worker.getCacheHits() == 1; }));
    EXPECT_TRUE(rig.memory.get(MakeJob(5)) == stored);
    EXPECT_EQ(rig.generator.calls.load(), 0);
    EXPECT_EQ(rig.worker.getTilesProduced(), (uint64_t)0);
}

static void TestFailedJobIsNotCached(){
    Rig rig;
    rig.generator.failAll = true;
    rig.queue.addJob(MakeJob(3));
    rig.worker.start();

    EXPECT_TRUE(WaitFor([&]{ return rig.generator.calls.load() == 1; }));
    EXPECT_TRUE(WaitFor([&]{ return rig.queue.isEmpty(); }));
    rig.worker.interrupt();
    rig.worker.join();
    EXPECT_FALSE(rig.memory.containsKey(MakeJob(3)));
    EXPECT_FALSE(rig.disk.containsKey(MakeJob(3)));
}

static void TestPauseWhileIdle(){
    Rig rig;
    rig.worker.start();
    std::this_thread::sleep_for(10ms);

    // the worker is blocked on the empty queue
    rig.worker.pause();
    rig.worker.awaitPausing();
    EXPECT_TRUE(rig.worker.isPaused());
    EXPECT_TRUE(rig.worker.getState() == TileWorker::State::Paused);

    rig.queue.addJob(MakeJob(1));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(rig.generator.calls.load(), 0);
    EXPECT_EQ(rig.queue.size(), (size_t)1);

    rig.worker.proceed();
    EXPECT_TRUE(WaitFor([&]{ return rig.worker.getTilesProduced() == 1; }));
    EXPECT_FALSE(rig.worker.isPaused());
}

static void TestPauseFinishesCurrentJob(){
    Rig rig;
    rig.generator.hold();
    rig.queue.addJob(MakeJob(1));
    rig.queue.addJob(MakeJob(2));
    rig.worker.start();
    rig.generator.awaitStarted(1);

    rig.worker.pause();
    std::atomic<bool> paused{false};
    std::thread waiter([&]{
        rig.worker.awaitPausing();
        paused = true;
    });
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(paused.load());

    rig.generator.release();
    waiter.join();
    EXPECT_TRUE(paused.load());
    // the job in progress was completed and cached, the next one waits
    EXPECT_TRUE(rig.memory.containsKey(MakeJob(1)));
    EXPECT_FALSE(rig.memory.containsKey(MakeJob(2)));
    EXPECT_EQ(rig.queue.size(), (size_t)1);

    rig.worker.proceed();
    EXPECT_TRUE(WaitFor([&]{ return rig.memory.containsKey(MakeJob(2)); }));
}

static void TestRepeatedPauseCycles(){
    Rig rig;
    rig.worker.start();
    for(int i=0; i<50; ++i){
        rig.queue.addJob(MakeJob(i));
        rig.worker.pause();
        rig.worker.awaitPausing();
        const int callsWhilePaused = rig.generator.calls.load();
        std::this_thread::sleep_for(1ms);
        EXPECT_EQ(rig.generator.calls.load(), callsWhilePaused);
        rig.worker.proceed();
    }
    EXPECT_TRUE(WaitFor([&]{ return rig.queue.isEmpty(); }));
}

static void TestInterruptWhilePaused(){
    Rig rig;
    rig.worker.start();
    rig.worker.pause();
    rig.worker.awaitPausing();
    rig.worker.interrupt();
    rig.worker.join();
    EXPECT_TRUE(rig.worker.getState() == TileWorker::State::Stopped);
    // nothing to wait for once stopped
    rig.worker.pause();
    rig.worker.awaitPausing();
}

static void TestQueueInterruptStopsWorker(){
    Rig rig;
    rig.worker.start();
    rig.queue.interrupt();
    rig.worker.join();
    EXPECT_TRUE(rig.worker.getState() == TileWorker::State::Stopped);
}

int main(){
    setLogLevel(LogLevel::Error);
    TestProducesTiles();
    TestDiskHitIsPromoted();
    TestFailedJobIsNotCached();
    TestPauseWhileIdle();
    TestPauseFinishesCurrentJob();
    TestRepeatedPauseCycles();
    TestInterruptWhilePaused();
    TestQueueInterruptStopsWorker();
    return FinishTests("mapstream_tile_worker_tests");
}
