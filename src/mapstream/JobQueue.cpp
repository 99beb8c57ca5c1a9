#include "mapstream/JobQueue.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace mapstream {

JobQueue::Priority JobQueue::calculatePriority(const Tile& tile, const MapPositionFix& position){
    // tile centre in degrees, then in pixels at the current zoom
    const double tileLatitude = MercatorProjection::pixelYToLatitude((double)tile.getPixelY() + kTileSize / 2.0, tile.zoomLevel);
    const double tileLongitude = MercatorProjection::pixelXToLongitude((double)tile.getPixelX() + kTileSize / 2.0, tile.zoomLevel);

    const double tilePixelX = MercatorProjection::longitudeToPixelX(tileLongitude, position.zoomLevel);
    const double tilePixelY = MercatorProjection::latitudeToPixelY(tileLatitude, position.zoomLevel);
    const double centerPixelX = MercatorProjection::longitudeToPixelX(position.longitude, position.zoomLevel);
    const double centerPixelY = MercatorProjection::latitudeToPixelY(position.latitude, position.zoomLevel);

    Priority p;
    p.distance = std::hypot(tilePixelX - centerPixelX, tilePixelY - centerPixelY);
    p.zoomDistance = std::abs((int)tile.zoomLevel - (int)position.zoomLevel);
    return p;
}

bool JobQueue::addJob(const TileJob& job){
    const MapPositionFix position = m_mapPosition.getMapPositionFix();
    std::lock_guard<std::mutex> lk(m_mutex);
    if(m_interrupted) return false;
    if(!m_pending.insert(job).second) return false;

    QueueItem item{job, calculatePriority(job.tile, position)};
    auto it = std::upper_bound(m_items.begin(), m_items.end(), item,
                               [](const QueueItem& a, const QueueItem& b){ return a.priority < b.priority; });
    m_items.insert(it, std::move(item));
    m_cv.notify_all();
    return true;
}

void JobQueue::requestSchedule(){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_scheduleNeeded = true;
    m_cv.notify_all();
}

void JobQueue::schedule(){
    const MapPositionFix position = m_mapPosition.getMapPositionFix();
    for(auto& item : m_items) item.priority = calculatePriority(item.job.tile, position);
    std::stable_sort(m_items.begin(), m_items.end(),
                     [](const QueueItem& a, const QueueItem& b){ return a.priority < b.priority; });
    m_scheduleNeeded = false;
}

std::optional<TileJob> JobQueue::removeNext(const std::function<bool()>& wakeCondition){
    std::unique_lock<std::mutex> lk(m_mutex);
    bool woken = false;
    m_cv.wait(lk, [&]{
        woken = m_interrupted || (wakeCondition && wakeCondition());
        return woken || !m_items.empty();
    });
    if(woken) return std::nullopt;

    if(m_scheduleNeeded) schedule();

    TileJob job = std::move(m_items.front().job);
    m_items.erase(m_items.begin());
    m_pending.erase(job);
    return job;
}

void JobQueue::notifyAll(){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_cv.notify_all();
}

void JobQueue::clear(){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_items.clear();
    m_pending.clear();
    m_scheduleNeeded = false;
}

void JobQueue::interrupt(){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_interrupted = true;
    m_cv.notify_all();
}

bool JobQueue::isInterrupted() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_interrupted;
}

size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_items.size();
}

} // namespace mapstream
