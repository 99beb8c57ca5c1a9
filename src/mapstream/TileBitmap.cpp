#include "mapstream/TileBitmap.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace mapstream {

TileBitmap::TileBitmap(int width, int height)
    : m_width(std::max(width, 0)), m_height(std::max(height, 0)),
      m_pixels((size_t)m_width * (size_t)m_height * 4, 0) {}

void TileBitmap::fill(Color c){
    for(size_t i=0; i<m_pixels.size(); i+=4){
        m_pixels[i] = c.r; m_pixels[i+1] = c.g; m_pixels[i+2] = c.b; m_pixels[i+3] = c.a;
    }
}

void TileBitmap::setPixel(int x, int y, Color c){
    if(x < 0 || y < 0 || x >= m_width || y >= m_height) return;
    uint8_t* p = &m_pixels[((size_t)y * m_width + x) * 4];
    p[0] = c.r; p[1] = c.g; p[2] = c.b; p[3] = c.a;
}

Color TileBitmap::getPixel(int x, int y) const {
    if(x < 0 || y < 0 || x >= m_width || y >= m_height) return Color{0,0,0,0};
    const uint8_t* p = &m_pixels[((size_t)y * m_width + x) * 4];
    return Color{p[0], p[1], p[2], p[3]};
}

void TileBitmap::fillRect(int x0, int y0, int x1, int y1, Color c){
    x0 = std::max(x0, 0); y0 = std::max(y0, 0);
    x1 = std::min(x1, m_width - 1); y1 = std::min(y1, m_height - 1);
    for(int y=y0; y<=y1; ++y)
        for(int x=x0; x<=x1; ++x)
            setPixel(x, y, c);
}

// Liang-Barsky against the pixel rectangle; false if nothing is left.
static bool clipSegment(double& x0, double& y0, double& x1, double& y1, double maxX, double maxY){
    const double dx = x1 - x0, dy = y1 - y0;
    double t0 = 0.0, t1 = 1.0;
    const double p[4] = { -dx, dx, -dy, dy };
    const double q[4] = { x0, maxX - x0, y0, maxY - y0 };
    for(int i=0;i<4;i++){
        if(p[i] == 0.0){
            if(q[i] < 0.0) return false;
            continue;
        }
        const double t = q[i] / p[i];
        if(p[i] < 0.0){
            if(t > t1) return false;
            if(t > t0) t0 = t;
        } else {
            if(t < t0) return false;
            if(t < t1) t1 = t;
        }
    }
    const double nx0 = x0 + t0 * dx, ny0 = y0 + t0 * dy;
    const double nx1 = x0 + t1 * dx, ny1 = y0 + t1 * dy;
    x0 = nx0; y0 = ny0; x1 = nx1; y1 = ny1;
    return true;
}

void TileBitmap::drawLine(double fx0, double fy0, double fx1, double fy1, Color c){
    if(m_width == 0 || m_height == 0) return;
    if(!std::isfinite(fx0) || !std::isfinite(fy0) || !std::isfinite(fx1) || !std::isfinite(fy1)) return;
    if(!clipSegment(fx0, fy0, fx1, fy1, m_width - 1, m_height - 1)) return;

    int x0 = (int)std::lround(fx0), y0 = (int)std::lround(fy0);
    const int x1 = (int)std::lround(fx1), y1 = (int)std::lround(fy1);
    const int dx = std::abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
    const int dy = -std::abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    while(true){
        setPixel(x0, y0, c);
        if(x0 == x1 && y0 == y1) break;
        const int e2 = 2 * err;
        if(e2 >= dy){ err += dy; x0 += sx; }
        if(e2 <= dx){ err += dx; y0 += sy; }
    }
}

} // namespace mapstream
