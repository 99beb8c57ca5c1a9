#include "mapstream/TileWorker.hpp"

#include "mapstream/Log.hpp"

namespace mapstream {

TileWorker::TileWorker(JobQueue& jobQueue, TileCache& memoryCache, TileCache& diskCache)
    : m_jobQueue(jobQueue), m_memoryCache(memoryCache), m_diskCache(diskCache) {}

TileWorker::~TileWorker(){
    interrupt();
    join();
}

void TileWorker::start(){
    std::lock_guard<std::mutex> lk(m_stateMutex);
    if(m_alive || m_thread.joinable()) return;
    m_alive = true;
    m_thread = std::thread([this]{ run(); });
}

void TileWorker::pause(){
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        m_pauseRequested = true;
        m_pauseFlag = true;
    }
    // takes the queue lock, so a worker between its wake check and wait()
    // cannot miss this
    m_jobQueue.notifyAll();
}

void TileWorker::awaitPausing(){
    std::unique_lock<std::mutex> lk(m_stateMutex);
    m_stateCv.wait(lk, [&]{ return m_paused || !m_alive || !m_pauseRequested; });
}

void TileWorker::proceed(){
    std::lock_guard<std::mutex> lk(m_stateMutex);
    m_pauseRequested = false;
    m_pauseFlag = false;
    m_stateCv.notify_all();
}

bool TileWorker::isPaused() const {
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_paused;
}

void TileWorker::interrupt(){
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        m_interruptRequested = true;
        m_interruptFlag = true;
        m_stateCv.notify_all();
    }
    m_jobQueue.notifyAll();
}

void TileWorker::join(){
    if(m_thread.joinable()) m_thread.join();
}

TileWorker::State TileWorker::getState() const {
    std::lock_guard<std::mutex> lk(m_stateMutex);
    if(!m_alive) return State::Stopped;
    return m_paused ? State::Paused : State::Running;
}

void TileWorker::run(){
    logDebug("TileWorker", "started");
    while(true){
        {
            std::unique_lock<std::mutex> lk(m_stateMutex);
            if(m_pauseRequested && !m_interruptRequested){
                m_paused = true;
                m_stateCv.notify_all();
                m_stateCv.wait(lk, [&]{ return !m_pauseRequested || m_interruptRequested; });
                m_paused = false;
            }
            if(m_interruptRequested) break;
        }

        std::optional<TileJob> job = m_jobQueue.removeNext([this]{
            return m_pauseFlag.load() || m_interruptFlag.load();
        });
        if(!job){
            if(m_jobQueue.isInterrupted()) break;
            continue;
        }
        processJob(*job);
    }

    if(m_generator) m_generator->cleanup();
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        m_alive = false;
        m_paused = false;
        m_stateCv.notify_all();
    }
    logDebug("TileWorker", "stopped");
}

void TileWorker::processJob(const TileJob& job){
    // another path may have filled the caches while the job was queued
    if(TileBitmapPtr bitmap = m_memoryCache.get(job)){
        ++m_cacheHits;
        notifyRepaint(job, bitmap);
        return;
    }
    if(TileBitmapPtr bitmap = m_diskCache.get(job)){
        ++m_cacheHits;
        m_memoryCache.put(job, bitmap);
        notifyRepaint(job, bitmap);
        return;
    }

    if(!m_generator) return;
    auto bitmap = std::make_shared<TileBitmap>();
    if(!m_generator->executeJob(job, *bitmap)){
        logDebug("TileWorker", "no image for " + job.toString());
        return;
    }

    TileBitmapPtr result = std::move(bitmap);
    m_memoryCache.put(job, result);
    m_diskCache.put(job, result);
    ++m_tilesProduced;
    notifyRepaint(job, result);
}

void TileWorker::notifyRepaint(const TileJob& job, const TileBitmapPtr& bitmap){
    if(m_repaintCallback) m_repaintCallback(job, bitmap);
}

} // namespace mapstream
