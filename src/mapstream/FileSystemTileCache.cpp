#include "mapstream/FileSystemTileCache.hpp"

#include "mapstream/Hash.hpp"
#include "mapstream/Log.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace mapstream {

namespace fs = std::filesystem;

namespace {

struct TileFileHeader {
    uint32_t magic = 0;
    uint32_t version = 0;
    uint64_t keyHash = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t checksum = 0;
};

} // namespace

FileTileStore::FileTileStore(std::string directory) : m_directory(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    m_directoryReady = !ec && fs::is_directory(m_directory, ec);
    if(!m_directoryReady){
        logWarn("Cache", "cannot create tile cache directory " + m_directory + ": " + ec.message());
    }
}

std::string FileTileStore::pathFor(const TileJob& job) const {
    return m_directory + "/" + hex64(job.cacheKeyHash()) + ".tile";
}

bool FileTileStore::store(const TileJob& job, const TileBitmapPtr& bitmap){
    if(!m_directoryReady) return false;
    const std::string path = pathFor(job);

    TileFileHeader h;
    h.magic = FILE_MAGIC;
    h.version = FILE_VERSION;
    h.keyHash = job.cacheKeyHash();
    h.width = (uint32_t)bitmap->getWidth();
    h.height = (uint32_t)bitmap->getHeight();
    h.checksum = fnv1a64(bitmap->data(), bitmap->byteSize());

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if(out){
            m_written.insert(path);
            out.write((const char*)&h, sizeof(h));
            out.write((const char*)bitmap->data(), (std::streamsize)bitmap->byteSize());
        }
        if(out) return true;
    }
    logWarn("Cache", "failed writing " + path);
    std::error_code ec;
    fs::remove(path, ec);
    m_written.erase(path);
    return false;
}

TileBitmapPtr FileTileStore::load(const TileJob& job) const {
    const std::string path = pathFor(job);
    std::ifstream in(path, std::ios::binary);
    if(!in){
        logWarn("Cache", "tile file missing: " + path);
        return nullptr;
    }

    TileFileHeader h;
    in.read((char*)&h, sizeof(h));
    if(!in || h.magic != FILE_MAGIC || h.version != FILE_VERSION || h.keyHash != job.cacheKeyHash()
       || h.width == 0 || h.height == 0 || h.width > 4096 || h.height > 4096){
        logWarn("Cache", "corrupt tile header: " + path);
        return nullptr;
    }

    auto bitmap = std::make_shared<TileBitmap>((int)h.width, (int)h.height);
    in.read((char*)bitmap->data(), (std::streamsize)bitmap->byteSize());
    if(!in || fnv1a64(bitmap->data(), bitmap->byteSize()) != h.checksum){
        logWarn("Cache", "corrupt tile data: " + path);
        return nullptr;
    }
    return bitmap;
}

void FileTileStore::remove(const TileJob& job){
    const std::string path = pathFor(job);
    if(m_written.erase(path) == 0) return;
    std::error_code ec;
    fs::remove(path, ec);
}

void FileTileStore::destroy(){
    std::error_code ec;
    for(const auto& path : m_written) fs::remove(path, ec);
    m_written.clear();
    // fails unless empty, which leaves foreign files alone
    fs::remove(m_directory, ec);
    m_directoryReady = false;
}

} // namespace mapstream
