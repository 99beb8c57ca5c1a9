#pragma once

#include "mapstream/JobQueue.hpp"
#include "mapstream/MapGenerator.hpp"
#include "mapstream/TileCache.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace mapstream {

// The single background thread that turns queued jobs into cached tiles.
//
// Pausing is cooperative: a pause request wakes a worker blocked in the queue
// and is honoured between jobs, so a job already taken from the queue is
// finished (and cached) before awaitPausing() returns.
class TileWorker {
public:
    enum class State { Running, Paused, Stopped };

    // Called on the worker thread whenever a tile became available.
    using RepaintCallback = std::function<void(const TileJob&, const TileBitmapPtr&)>;

    TileWorker(JobQueue& jobQueue, TileCache& memoryCache, TileCache& diskCache);
    ~TileWorker();

    TileWorker(const TileWorker&) = delete;
    TileWorker& operator=(const TileWorker&) = delete;

    // Only while paused or before start().
    void setMapGenerator(MapGenerator* generator){ m_generator = generator; }
    void setRepaintCallback(RepaintCallback callback){ m_repaintCallback = std::move(callback); }

    void start();

    void pause();
    // Blocks until the worker is idle in the paused state (or not running).
    void awaitPausing();
    void proceed();
    bool isPaused() const;

    // Ends the loop after the current job; join() afterwards.
    void interrupt();
    void join();

    State getState() const;

    uint64_t getTilesProduced() const { return m_tilesProduced.load(); }
    uint64_t getCacheHits() const { return m_cacheHits.load(); }

private:
    void run();
    void processJob(const TileJob& job);
    void notifyRepaint(const TileJob& job, const TileBitmapPtr& bitmap);

    JobQueue& m_jobQueue;
    TileCache& m_memoryCache;
    TileCache& m_diskCache;
    MapGenerator* m_generator = nullptr;
    RepaintCallback m_repaintCallback;

    std::thread m_thread;
    mutable std::mutex m_stateMutex;
    std::condition_variable m_stateCv;
    bool m_alive = false;
    bool m_paused = false;
    bool m_pauseRequested = false;
    bool m_interruptRequested = false;

    // mirrors of the flags above for the queue's wake condition, which runs
    // under the queue lock
    std::atomic<bool> m_pauseFlag{false};
    std::atomic<bool> m_interruptFlag{false};

    std::atomic<uint64_t> m_tilesProduced{0};
    std::atomic<uint64_t> m_cacheHits{0};
};

} // namespace mapstream
