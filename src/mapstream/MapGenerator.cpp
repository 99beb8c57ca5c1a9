#include "mapstream/MapGenerator.hpp"

#include "mapstream/DatabaseRenderer.hpp"

namespace mapstream {

std::unique_ptr<MapGenerator> createMapGenerator(MapViewMode mode, MapDatabase& database){
    switch(mode){
        case MapViewMode::CanvasRenderer:
            return std::make_unique<DatabaseRenderer>(database);
    }
    return nullptr;
}

} // namespace mapstream
