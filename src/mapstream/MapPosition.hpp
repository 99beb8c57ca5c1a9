#pragma once

#include "mapstream/Geo.hpp"

#include <cstdint>
#include <mutex>

namespace mapstream {

// Immutable snapshot of the viewport centre and zoom level.
struct MapPositionFix {
    double latitude = 0.0;
    double longitude = 0.0;
    uint8_t zoomLevel = 0;
};

// Viewport centre and zoom level shared by the caller thread (writes) and the
// job queue (reads while scheduling).
class MapPosition {
public:
    MapPosition() = default;

    GeoPoint getMapCenter() const;
    MapPositionFix getMapPositionFix() const;
    uint8_t getZoomLevel() const;

    // False until a centre has been set.
    bool isValid() const;

    // Pans by a pixel offset at the current zoom; positive values move the map
    // right/down, i.e. the centre left/up.
    void moveMap(double moveHorizontal, double moveVertical);

    void setMapCenterAndZoomLevel(const GeoPoint& center, int zoomLevel);
    void setMapCenter(const GeoPoint& center);
    void setZoomLevel(int zoomLevel);

    // Upper bound applied by the setters above.
    void setZoomLevelMax(uint8_t zoomLevelMax);
    uint8_t getZoomLevelMax() const;

private:
    uint8_t limitZoomLevel(int zoomLevel) const;

    mutable std::mutex m_mutex;
    bool m_valid = false;
    double m_latitude = 0.0;
    double m_longitude = 0.0;
    uint8_t m_zoomLevel = 0;
    uint8_t m_zoomLevelMax = 22;
};

} // namespace mapstream
