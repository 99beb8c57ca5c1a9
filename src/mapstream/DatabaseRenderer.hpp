#pragma once

#include "mapstream/MapDatabase.hpp"
#include "mapstream/MapGenerator.hpp"

#include <vector>

namespace mapstream {

// Rasterises map file content with a fixed palette: filled areas, 1 px lines
// and small POI dots. No theme language; tile coordinates are left to the
// viewer's text overlay.
class DatabaseRenderer : public MapGenerator, private MapDatabaseCallback {
public:
    static constexpr uint8_t ZOOM_LEVEL_DEFAULT = 12;
    static constexpr uint8_t ZOOM_LEVEL_MAX = 22;

    explicit DatabaseRenderer(MapDatabase& database) : m_database(database) {}

    bool executeJob(const TileJob& job, TileBitmap& bitmap) override;

    std::optional<GeoPoint> getStartPoint() const override;
    uint8_t getZoomLevelDefault() const override { return ZOOM_LEVEL_DEFAULT; }
    uint8_t getZoomLevelMax() const override { return ZOOM_LEVEL_MAX; }
    bool requiresInternetConnection() const override { return false; }

private:
    void renderPointOfInterest(const PointOfInterest& poi) override;
    void renderWay(const Way& way) override;
    void renderWaterBackground() override;

    struct PixelPoint { double x, y; };
    using Ring = std::vector<PixelPoint>;

    struct AreaItem { int layer; Color color; std::vector<Ring> rings; };
    struct LineItem { int layer; Color color; std::vector<Ring> lines; };
    struct PointItem { int layer; Color color; PixelPoint p; };

    PixelPoint project(const GeoPoint& p) const;
    void fillPolygon(TileBitmap& bitmap, const std::vector<Ring>& rings, Color color) const;

    MapDatabase& m_database;

    Tile m_tile;
    double m_tilePixelX = 0.0;
    double m_tilePixelY = 0.0;
    bool m_water = false;
    std::vector<AreaItem> m_areas;
    std::vector<LineItem> m_lines;
    std::vector<PointItem> m_points;
};

} // namespace mapstream
