#pragma once

#include "mapstream/MapPosition.hpp"
#include "mapstream/TileJob.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace mapstream {

// Pending tile jobs, closest to the viewport first. Shared by the caller
// thread (producer) and the tile worker (consumer); all locking is internal.
class JobQueue {
public:
    explicit JobQueue(const MapPosition& mapPosition) : m_mapPosition(mapPosition) {}

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // Returns false if an equal job is already pending.
    bool addJob(const TileJob& job);

    // Reorder all pending jobs against the current map position before the
    // next removal.
    void requestSchedule();

    // Blocks until a job is available and returns the closest one. Returns
    // nothing once interrupt() was called, or when `wakeCondition` holds; it is
    // evaluated under the queue lock on every wake-up (see notifyAll()).
    std::optional<TileJob> removeNext(const std::function<bool()>& wakeCondition = {});

    // Wakes blocked removeNext() callers so they re-check their wake condition.
    void notifyAll();

    void clear();

    // Permanently wakes all blocked callers; removeNext() returns nothing from
    // now on.
    void interrupt();
    bool isInterrupted() const;

    size_t size() const;
    bool isEmpty() const { return size() == 0; }

    // Scheduling key: pixel distance of the tile centre to the viewport centre
    // at the current zoom, then zoom level distance. Smaller comes first.
    struct Priority {
        double distance = 0.0;
        int zoomDistance = 0;

        bool operator<(const Priority& o) const {
            if(distance != o.distance) return distance < o.distance;
            return zoomDistance < o.zoomDistance;
        }
    };
    static Priority calculatePriority(const Tile& tile, const MapPositionFix& position);

private:
    struct QueueItem {
        TileJob job;
        Priority priority;
    };

    void schedule();

    const MapPosition& m_mapPosition;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<QueueItem> m_items; // sorted by priority
    std::unordered_set<TileJob, TileJobHash> m_pending;
    bool m_scheduleNeeded = false;
    bool m_interrupted = false;
};

} // namespace mapstream
