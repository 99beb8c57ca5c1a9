#pragma once

#include "mapstream/TileCache.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>

namespace mapstream {

// One file per tile under a private directory. Files are named by
// TileJob::cacheKeyHash() and hold a small header plus raw RGBA rows.
// Unreadable, truncated or checksum-failing files load as nullptr.
class FileTileStore {
public:
    static constexpr uint32_t FILE_MAGIC = 0x4254534d; // 'MSTB'
    static constexpr uint32_t FILE_VERSION = 1;

    // Creates `directory` if needed. Only files written through this store
    // are ever deleted, plus the directory itself once it is empty.
    explicit FileTileStore(std::string directory);

    bool store(const TileJob& job, const TileBitmapPtr& bitmap);
    TileBitmapPtr load(const TileJob& job) const;
    void remove(const TileJob& job);
    void destroy();

    const std::string& getDirectory() const { return m_directory; }
    std::string pathFor(const TileJob& job) const;

private:
    std::string m_directory;
    bool m_directoryReady = false;
    std::unordered_set<std::string> m_written;
};

using FileSystemTileCache = LruTileCache<FileTileStore>;

} // namespace mapstream
