#pragma once

#include <cstdint>
#include <string>

namespace mapstream {

// Tile edge length in pixels. Map files with any other tile size are rejected.
static const int kTileSize = 256;

static const double kConversionFactor = 1000000.0;

// Latitude/longitude in microdegrees.
struct GeoPoint {
    int32_t latitudeE6 = 0;
    int32_t longitudeE6 = 0;

    double latitude() const { return latitudeE6 / kConversionFactor; }
    double longitude() const { return longitudeE6 / kConversionFactor; }

    static GeoPoint fromDegrees(double latitude, double longitude);

    bool operator==(const GeoPoint& o) const { return latitudeE6 == o.latitudeE6 && longitudeE6 == o.longitudeE6; }
    bool operator!=(const GeoPoint& o) const { return !(*this == o); }
};

struct BoundingBox {
    int32_t minLatitudeE6 = 0;
    int32_t minLongitudeE6 = 0;
    int32_t maxLatitudeE6 = 0;
    int32_t maxLongitudeE6 = 0;

    GeoPoint getCenterPoint() const;

    double getMinLatitude() const { return minLatitudeE6 / kConversionFactor; }
    double getMinLongitude() const { return minLongitudeE6 / kConversionFactor; }
    double getMaxLatitude() const { return maxLatitudeE6 / kConversionFactor; }
    double getMaxLongitude() const { return maxLongitudeE6 / kConversionFactor; }

    bool operator==(const BoundingBox& o) const {
        return minLatitudeE6 == o.minLatitudeE6 && minLongitudeE6 == o.minLongitudeE6
            && maxLatitudeE6 == o.maxLatitudeE6 && maxLongitudeE6 == o.maxLongitudeE6;
    }
    bool operator!=(const BoundingBox& o) const { return !(*this == o); }

    std::string toString() const;
};

// One square of the projected plane at a zoom level.
struct Tile {
    int64_t tileX = 0;
    int64_t tileY = 0;
    uint8_t zoomLevel = 0;

    Tile() = default;
    Tile(int64_t x, int64_t y, uint8_t zoom) : tileX(x), tileY(y), zoomLevel(zoom) {}

    // Pixel coordinates of the top-left corner at this tile's zoom level.
    int64_t getPixelX() const { return tileX * kTileSize; }
    int64_t getPixelY() const { return tileY * kTileSize; }

    bool operator==(const Tile& o) const { return tileX == o.tileX && tileY == o.tileY && zoomLevel == o.zoomLevel; }
    bool operator!=(const Tile& o) const { return !(*this == o); }

    std::string toString() const;
};

// Spherical (Web) Mercator with kTileSize pixel tiles.
namespace MercatorProjection {

static const double LATITUDE_MAX = 85.05112877980659;
static const double LATITUDE_MIN = -LATITUDE_MAX;
static const double LONGITUDE_MAX = 180;
static const double LONGITUDE_MIN = -180;

double getMapSize(uint8_t zoom);

double latitudeToPixelY(double latitude, uint8_t zoom);
double longitudeToPixelX(double longitude, uint8_t zoom);
int64_t latitudeToTileY(double latitude, uint8_t zoom);
int64_t longitudeToTileX(double longitude, uint8_t zoom);

double pixelXToLongitude(double pixelX, uint8_t zoom);
double pixelYToLatitude(double pixelY, uint8_t zoom);
int64_t pixelXToTileX(double pixelX, uint8_t zoom);
int64_t pixelYToTileY(double pixelY, uint8_t zoom);

double tileXToLongitude(int64_t tileX, uint8_t zoom);
double tileYToLatitude(int64_t tileY, uint8_t zoom);

double limitLatitude(double latitude);
double limitLongitude(double longitude);

} // namespace MercatorProjection

} // namespace mapstream
