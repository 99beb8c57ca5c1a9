#pragma once

#include "mapstream/Log.hpp"
#include "mapstream/TileBitmap.hpp"
#include "mapstream/TileJob.hpp"

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace mapstream {

using TileBitmapPtr = std::shared_ptr<const TileBitmap>;

// Bounded map TileJob -> rendered tile. Implementations synchronise
// internally.
class TileCache {
public:
    virtual ~TileCache() = default;

    virtual bool containsKey(const TileJob& job) const = 0;
    // nullptr on a miss, including an entry whose stored data cannot be read.
    virtual TileBitmapPtr get(const TileJob& job) = 0;
    // Replaces an existing entry; evicts the least recently used one when full.
    virtual void put(const TileJob& job, const TileBitmapPtr& bitmap) = 0;
    // Drops every entry but keeps the cache usable.
    virtual void clear() = 0;
    // Releases everything the cache holds; the cache stays empty afterwards.
    virtual void destroy() = 0;

    virtual size_t size() const = 0;
    virtual size_t getCapacity() const = 0;
};

// LRU eviction over a storage backend. A Store provides
//   bool store(const TileJob&, const TileBitmapPtr&)
//   TileBitmapPtr load(const TileJob&)      // nullptr if unreadable
//   void remove(const TileJob&)
//   void destroy()
template <typename Store>
class LruTileCache : public TileCache {
public:
    LruTileCache(size_t capacity, Store store)
        : m_capacity(capacity), m_store(std::move(store)) {}

    bool containsKey(const TileJob& job) const override {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_index.find(job) != m_index.end();
    }

    TileBitmapPtr get(const TileJob& job) override {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_index.find(job);
        if(it == m_index.end()) return nullptr;

        TileBitmapPtr bitmap = m_store.load(job);
        if(!bitmap){
            // unreadable entry: forget it so the tile gets produced again
            m_store.remove(job);
            m_lru.erase(it->second);
            m_index.erase(it);
            return nullptr;
        }
        m_lru.splice(m_lru.begin(), m_lru, it->second);
        return bitmap;
    }

    void put(const TileJob& job, const TileBitmapPtr& bitmap) override {
        if(!bitmap || m_capacity == 0) return;
        std::lock_guard<std::mutex> lk(m_mutex);

        auto it = m_index.find(job);
        if(it != m_index.end()){
            m_lru.splice(m_lru.begin(), m_lru, it->second);
            if(!m_store.store(job, bitmap)){
                m_store.remove(job);
                m_lru.erase(it->second);
                m_index.erase(it);
            }
            return;
        }

        while(m_index.size() >= m_capacity){
            const TileJob& eldest = m_lru.back();
            m_store.remove(eldest);
            m_index.erase(eldest);
            m_lru.pop_back();
        }

        if(!m_store.store(job, bitmap)) return;
        m_lru.push_front(job);
        m_index.emplace(job, m_lru.begin());
    }

    void clear() override {
        std::lock_guard<std::mutex> lk(m_mutex);
        for(const auto& job : m_lru) m_store.remove(job);
        m_lru.clear();
        m_index.clear();
    }

    void destroy() override {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_store.destroy();
        m_lru.clear();
        m_index.clear();
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_index.size();
    }

    size_t getCapacity() const override { return m_capacity; }

    const Store& getStore() const { return m_store; }

private:
    const size_t m_capacity;
    Store m_store;

    mutable std::mutex m_mutex;
    std::list<TileJob> m_lru; // front = most recently used
    std::unordered_map<TileJob, std::list<TileJob>::iterator, TileJobHash> m_index;
};

// Decoded bitmaps kept in memory.
class MemoryTileStore {
public:
    bool store(const TileJob& job, const TileBitmapPtr& bitmap){
        m_bitmaps[job] = bitmap;
        return true;
    }
    TileBitmapPtr load(const TileJob& job) const {
        auto it = m_bitmaps.find(job);
        return it == m_bitmaps.end() ? nullptr : it->second;
    }
    void remove(const TileJob& job){ m_bitmaps.erase(job); }
    void destroy(){ m_bitmaps.clear(); }

private:
    std::unordered_map<TileJob, TileBitmapPtr, TileJobHash> m_bitmaps;
};

using InMemoryTileCache = LruTileCache<MemoryTileStore>;

} // namespace mapstream
