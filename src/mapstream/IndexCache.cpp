#include "mapstream/IndexCache.hpp"

#include "mapstream/Log.hpp"
#include "mapstream/ReadBuffer.hpp"

#include <algorithm>

namespace mapstream {

IndexCache::IndexCache(int fd, size_t capacity) : m_fd(fd), m_capacity(std::max<size_t>(1, capacity)) {}

std::optional<uint64_t> IndexCache::getIndexEntry(const SubFileParameter& subFile, int64_t blockNumber){
    if(blockNumber < 0 || blockNumber >= subFile.numberOfBlocks){
        logWarn("IndexCache", str("invalid block number: ", blockNumber));
        return std::nullopt;
    }

    const int64_t indexBlockNumber = blockNumber / INDEX_ENTRIES_PER_BLOCK;
    const Key key{subFile.indexStartAddress, indexBlockNumber};

    auto it = m_entries.find(key);
    if(it != m_entries.end()){
        m_lru.splice(m_lru.begin(), m_lru, it->second);
    } else {
        const uint64_t indexBlockPosition = subFile.indexStartAddress + (uint64_t)indexBlockNumber * SIZE_OF_INDEX_BLOCK;
        const uint64_t remainingIndexSize = subFile.indexEndAddress - indexBlockPosition;
        const size_t indexBlockSize = (size_t)std::min<uint64_t>(SIZE_OF_INDEX_BLOCK, remainingIndexSize);

        Entry e;
        e.key = key;
        e.bytes.resize(indexBlockSize);
        if(!readFully(m_fd, indexBlockPosition, e.bytes.data(), indexBlockSize)){
            logWarn("IndexCache", str("reading the index block has failed: ", indexBlockNumber));
            return std::nullopt;
        }

        m_lru.push_front(std::move(e));
        m_entries[key] = m_lru.begin();
        if(m_entries.size() > m_capacity){
            m_entries.erase(m_lru.back().key);
            m_lru.pop_back();
        }
        it = m_entries.find(key);
    }

    const std::vector<uint8_t>& bytes = it->second->bytes;
    const size_t address = (size_t)(blockNumber % INDEX_ENTRIES_PER_BLOCK) * SubFileParameter::BYTES_PER_INDEX_ENTRY;
    if(address + SubFileParameter::BYTES_PER_INDEX_ENTRY > bytes.size()) return std::nullopt;

    uint64_t v = 0;
    for(int i=0;i<SubFileParameter::BYTES_PER_INDEX_ENTRY;i++) v = (v << 8) | bytes[address + i];
    return v;
}

} // namespace mapstream
