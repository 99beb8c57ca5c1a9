#include "mapstream/MapPosition.hpp"

#include <algorithm>

namespace mapstream {

GeoPoint MapPosition::getMapCenter() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return GeoPoint::fromDegrees(m_latitude, m_longitude);
}

MapPositionFix MapPosition::getMapPositionFix() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return MapPositionFix{m_latitude, m_longitude, m_zoomLevel};
}

uint8_t MapPosition::getZoomLevel() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_zoomLevel;
}

bool MapPosition::isValid() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_valid;
}

void MapPosition::moveMap(double moveHorizontal, double moveVertical){
    std::lock_guard<std::mutex> lk(m_mutex);
    if(!m_valid) return;
    const double pixelX = MercatorProjection::longitudeToPixelX(m_longitude, m_zoomLevel);
    const double pixelY = MercatorProjection::latitudeToPixelY(m_latitude, m_zoomLevel);

    m_latitude = MercatorProjection::limitLatitude(MercatorProjection::pixelYToLatitude(pixelY - moveVertical, m_zoomLevel));
    m_longitude = MercatorProjection::limitLongitude(MercatorProjection::pixelXToLongitude(pixelX - moveHorizontal, m_zoomLevel));
}

void MapPosition::setMapCenterAndZoomLevel(const GeoPoint& center, int zoomLevel){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_latitude = MercatorProjection::limitLatitude(center.latitude());
    m_longitude = MercatorProjection::limitLongitude(center.longitude());
    m_zoomLevel = limitZoomLevel(zoomLevel);
    m_valid = true;
}

void MapPosition::setMapCenter(const GeoPoint& center){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_latitude = MercatorProjection::limitLatitude(center.latitude());
    m_longitude = MercatorProjection::limitLongitude(center.longitude());
    m_valid = true;
}

void MapPosition::setZoomLevel(int zoomLevel){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_zoomLevel = limitZoomLevel(zoomLevel);
}

void MapPosition::setZoomLevelMax(uint8_t zoomLevelMax){
    std::lock_guard<std::mutex> lk(m_mutex);
    m_zoomLevelMax = zoomLevelMax;
    m_zoomLevel = limitZoomLevel(m_zoomLevel);
}

uint8_t MapPosition::getZoomLevelMax() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_zoomLevelMax;
}

uint8_t MapPosition::limitZoomLevel(int zoomLevel) const {
    return (uint8_t)std::max(0, std::min(zoomLevel, (int)m_zoomLevelMax));
}

} // namespace mapstream
