#include "mapstream/DatabaseRenderer.hpp"

#include <algorithm>
#include <cmath>

namespace mapstream {

static const Color kLandColor{242, 239, 233, 255};
static const Color kWaterColor{181, 208, 208, 255};
static const Color kWaterHighlightColor{64, 128, 255, 255};
static const Color kFrameColor{255, 0, 0, 255};
static const Color kPoiColor{200, 40, 40, 255};

static bool hasTag(const std::vector<Tag>& tags, const char* key, const char* value = nullptr){
    for(const auto& t : tags){
        if(t.key == key && (!value || t.value == value)) return true;
    }
    return false;
}

// Fill colour for closed ways that describe an area; false for plain lines.
static bool areaColor(const std::vector<Tag>& tags, Color& out){
    if(hasTag(tags, "natural", "water") || hasTag(tags, "waterway", "riverbank") || hasTag(tags, "landuse", "reservoir")){
        out = kWaterColor; return true;
    }
    if(hasTag(tags, "building")){ out = Color{217, 208, 201, 255}; return true; }
    if(hasTag(tags, "landuse", "forest") || hasTag(tags, "natural", "wood")){ out = Color{173, 209, 158, 255}; return true; }
    if(hasTag(tags, "leisure") || hasTag(tags, "landuse", "grass")){ out = Color{200, 250, 204, 255}; return true; }
    if(hasTag(tags, "landuse")){ out = Color{224, 223, 223, 255}; return true; }
    if(hasTag(tags, "natural") || hasTag(tags, "amenity") || hasTag(tags, "area", "yes")){
        out = Color{230, 226, 214, 255}; return true;
    }
    return false;
}

static Color lineColor(const std::vector<Tag>& tags){
    for(const auto& t : tags){
        if(t.key == "highway"){
            if(t.value == "motorway" || t.value == "motorway_link") return Color{232, 146, 162, 255};
            if(t.value == "trunk" || t.value == "trunk_link") return Color{249, 178, 156, 255};
            if(t.value == "primary" || t.value == "primary_link") return Color{252, 214, 164, 255};
            if(t.value == "secondary" || t.value == "tertiary") return Color{200, 190, 120, 255};
            return Color{150, 150, 150, 255};
        }
        if(t.key == "waterway") return Color{120, 170, 220, 255};
        if(t.key == "railway") return Color{90, 90, 90, 255};
        if(t.key == "boundary") return Color{172, 70, 172, 255};
    }
    return Color{160, 160, 160, 255};
}

std::optional<GeoPoint> DatabaseRenderer::getStartPoint() const {
    std::shared_ptr<const MapFileInfo> info = m_database.getMapFileInfo();
    if(!info) return std::nullopt;
    if(info->startPosition) return info->startPosition;
    return info->mapCenter;
}

// Latitudes beyond the Mercator limit (up to the poles) are clamped to it, so
// every projected coordinate is finite.
DatabaseRenderer::PixelPoint DatabaseRenderer::project(const GeoPoint& p) const {
    const double latitude = MercatorProjection::limitLatitude(p.latitude());
    const double longitude = MercatorProjection::limitLongitude(p.longitude());
    return PixelPoint{
        MercatorProjection::longitudeToPixelX(longitude, m_tile.zoomLevel) - m_tilePixelX,
        MercatorProjection::latitudeToPixelY(latitude, m_tile.zoomLevel) - m_tilePixelY,
    };
}

void DatabaseRenderer::renderPointOfInterest(const PointOfInterest& poi){
    m_points.push_back(PointItem{poi.layer, kPoiColor, project(poi.position)});
}

void DatabaseRenderer::renderWay(const Way& way){
    if(way.coordinateBlocks.empty()) return;

    std::vector<Ring> rings;
    rings.reserve(way.coordinateBlocks.size());
    for(const auto& block : way.coordinateBlocks){
        Ring ring;
        ring.reserve(block.size());
        for(const auto& p : block) ring.push_back(project(p));
        rings.push_back(std::move(ring));
    }

    const auto& outer = way.coordinateBlocks.front();
    const bool closed = outer.size() > 2 && outer.front() == outer.back();
    Color fill;
    if(closed && areaColor(way.tags, fill)){
        m_areas.push_back(AreaItem{way.layer, fill, std::move(rings)});
    } else {
        m_lines.push_back(LineItem{way.layer, lineColor(way.tags), std::move(rings)});
    }
}

void DatabaseRenderer::renderWaterBackground(){
    m_water = true;
}

// Even-odd scanline fill over all rings, sampled at pixel centres.
void DatabaseRenderer::fillPolygon(TileBitmap& bitmap, const std::vector<Ring>& rings, Color color) const {
    std::vector<double> xs;
    for(int y=0; y<bitmap.getHeight(); ++y){
        const double sy = y + 0.5;
        xs.clear();
        for(const auto& ring : rings){
            const size_t n = ring.size();
            for(size_t i=0; i<n; ++i){
                const PixelPoint& a = ring[i];
                const PixelPoint& b = ring[(i + 1) % n];
                if((a.y <= sy && b.y > sy) || (b.y <= sy && a.y > sy)){
                    xs.push_back(a.x + (sy - a.y) / (b.y - a.y) * (b.x - a.x));
                }
            }
        }
        if(xs.size() < 2) continue;
        std::sort(xs.begin(), xs.end());
        for(size_t i=0; i+1<xs.size(); i+=2){
            const double left = std::ceil(xs[i] - 0.5);
            const double right = std::floor(xs[i+1] - 0.5);
            if(!(right >= 0.0) || !(left < bitmap.getWidth())) continue;
            bitmap.fillRect((int)std::max(left, 0.0), y, (int)std::min(right, (double)bitmap.getWidth() - 1), y, color);
        }
    }
}

bool DatabaseRenderer::executeJob(const TileJob& job, TileBitmap& bitmap){
    m_tile = job.tile;
    m_tilePixelX = (double)m_tile.getPixelX();
    m_tilePixelY = (double)m_tile.getPixelY();
    m_water = false;
    m_areas.clear();
    m_lines.clear();
    m_points.clear();

    if(!m_database.executeQuery(m_tile, *this)) return false;

    if(m_water){
        bitmap.fill(job.debugSettings.highlightWaterTiles ? kWaterHighlightColor : kWaterColor);
    } else {
        bitmap.fill(kLandColor);
    }

    auto byLayer = [](const auto& a, const auto& b){ return a.layer < b.layer; };
    std::stable_sort(m_areas.begin(), m_areas.end(), byLayer);
    std::stable_sort(m_lines.begin(), m_lines.end(), byLayer);
    std::stable_sort(m_points.begin(), m_points.end(), byLayer);

    for(const auto& area : m_areas) fillPolygon(bitmap, area.rings, area.color);
    for(const auto& line : m_lines){
        for(const auto& ring : line.lines){
            for(size_t i=1; i<ring.size(); ++i){
                bitmap.drawLine(ring[i-1].x, ring[i-1].y, ring[i].x, ring[i].y, line.color);
            }
        }
    }
    for(const auto& point : m_points){
        const double px = std::floor(point.p.x);
        const double py = std::floor(point.p.y);
        // dots wholly outside the tile
        if(!(px >= -1.0 && px <= bitmap.getWidth() && py >= -1.0 && py <= bitmap.getHeight())) continue;
        const int x = (int)px;
        const int y = (int)py;
        bitmap.fillRect(x - 1, y - 1, x + 1, y + 1, point.color);
    }

    if(job.debugSettings.drawTileFrames){
        const double w = bitmap.getWidth() - 1, h = bitmap.getHeight() - 1;
        bitmap.drawLine(0, 0, w, 0, kFrameColor);
        bitmap.drawLine(w, 0, w, h, kFrameColor);
        bitmap.drawLine(w, h, 0, h, kFrameColor);
        bitmap.drawLine(0, h, 0, 0, kFrameColor);
    }
    return true;
}

} // namespace mapstream
