#pragma once

#include "mapstream/MapFileInfo.hpp"

#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mapstream {

// LRU cache of sub-file index blocks. Each index block holds up to 128
// five-byte entries that are read from the map file in one go.
class IndexCache {
public:
    static constexpr int INDEX_ENTRIES_PER_BLOCK = 128;
    static constexpr int SIZE_OF_INDEX_BLOCK = INDEX_ENTRIES_PER_BLOCK * SubFileParameter::BYTES_PER_INDEX_ENTRY;

    // Top bit of an index entry: the block is entirely covered by water.
    static constexpr uint64_t BITMASK_INDEX_WATER = 0x8000000000ULL;
    // Low 39 bits: block offset relative to the sub-file start.
    static constexpr uint64_t BITMASK_INDEX_OFFSET = 0x7FFFFFFFFFULL;

    IndexCache(int fd, size_t capacity);

    // Raw 40-bit index entry of a block; empty when the block number is out of
    // range or the index cannot be read.
    std::optional<uint64_t> getIndexEntry(const SubFileParameter& subFile, int64_t blockNumber);


private:
    struct Key {
        uint64_t indexStartAddress;
        int64_t indexBlockNumber;
        bool operator==(const Key& o) const { return indexStartAddress == o.indexStartAddress && indexBlockNumber == o.indexBlockNumber; }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const noexcept {
            return std::hash<uint64_t>()(k.indexStartAddress * 1099511628211ULL ^ (uint64_t)k.indexBlockNumber);
        }
    };
    struct Entry {
        Key key;
        std::vector<uint8_t> bytes;
    };

    int m_fd;
    size_t m_capacity;
    std::list<Entry> m_lru; // front = most recently used
    std::unordered_map<Key, std::list<Entry>::iterator, KeyHash> m_entries;
};

} // namespace mapstream
