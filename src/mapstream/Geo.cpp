#include "mapstream/Geo.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace mapstream {

GeoPoint GeoPoint::fromDegrees(double latitude, double longitude){
    GeoPoint p;
    p.latitudeE6 = (int32_t)std::lround(latitude * kConversionFactor);
    p.longitudeE6 = (int32_t)std::lround(longitude * kConversionFactor);
    return p;
}

GeoPoint BoundingBox::getCenterPoint() const {
    GeoPoint c;
    c.latitudeE6 = minLatitudeE6 + (maxLatitudeE6 - minLatitudeE6) / 2;
    c.longitudeE6 = minLongitudeE6 + (maxLongitudeE6 - minLongitudeE6) / 2;
    return c;
}

std::string BoundingBox::toString() const {
    std::ostringstream ss;
    ss << "BoundingBox [minLatitudeE6=" << minLatitudeE6 << ", minLongitudeE6=" << minLongitudeE6
       << ", maxLatitudeE6=" << maxLatitudeE6 << ", maxLongitudeE6=" << maxLongitudeE6 << "]";
    return ss.str();
}

std::string Tile::toString() const {
    std::ostringstream ss;
    ss << (int)zoomLevel << "/" << tileX << "/" << tileY;
    return ss.str();
}

namespace MercatorProjection {

double getMapSize(uint8_t zoom){
    return (double)((int64_t)kTileSize << zoom);
}

double latitudeToPixelY(double latitude, uint8_t zoom){
    const double sinLatitude = std::sin(latitude * (M_PI / 180));
    return (0.5 - std::log((1 + sinLatitude) / (1 - sinLatitude)) / (4 * M_PI)) * getMapSize(zoom);
}

double longitudeToPixelX(double longitude, uint8_t zoom){
    return (longitude + 180) / 360 * getMapSize(zoom);
}

int64_t latitudeToTileY(double latitude, uint8_t zoom){
    return pixelYToTileY(latitudeToPixelY(latitude, zoom), zoom);
}

int64_t longitudeToTileX(double longitude, uint8_t zoom){
    return pixelXToTileX(longitudeToPixelX(longitude, zoom), zoom);
}

double pixelXToLongitude(double pixelX, uint8_t zoom){
    return 360 * ((pixelX / getMapSize(zoom)) - 0.5);
}

double pixelYToLatitude(double pixelY, uint8_t zoom){
    const double y = 0.5 - (pixelY / getMapSize(zoom));
    return 90 - 360 * std::atan(std::exp(-y * (2 * M_PI))) / M_PI;
}

int64_t pixelXToTileX(double pixelX, uint8_t zoom){
    const double maxTile = std::ldexp(1.0, zoom) - 1;
    return (int64_t)std::min(std::max(pixelX / kTileSize, 0.0), maxTile);
}

int64_t pixelYToTileY(double pixelY, uint8_t zoom){
    const double maxTile = std::ldexp(1.0, zoom) - 1;
    return (int64_t)std::min(std::max(pixelY / kTileSize, 0.0), maxTile);
}

double tileXToLongitude(int64_t tileX, uint8_t zoom){
    return pixelXToLongitude((double)(tileX * kTileSize), zoom);
}

double tileYToLatitude(int64_t tileY, uint8_t zoom){
    return pixelYToLatitude((double)(tileY * kTileSize), zoom);
}

double limitLatitude(double latitude){
    return std::max(std::min(latitude, LATITUDE_MAX), LATITUDE_MIN);
}

double limitLongitude(double longitude){
    return std::max(std::min(longitude, LONGITUDE_MAX), LONGITUDE_MIN);
}

} // namespace MercatorProjection

} // namespace mapstream
