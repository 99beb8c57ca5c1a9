#pragma once

#include "mapstream/Geo.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mapstream {

struct Color {
    uint8_t r=0, g=0, b=0, a=255;

    bool operator==(const Color& o) const { return r==o.r && g==o.g && b==o.b && a==o.a; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Rendered tile image, tightly packed RGBA8 rows, top row first (ready for
// glTexImage2D with GL_RGBA/GL_UNSIGNED_BYTE).
class TileBitmap {
public:
    explicit TileBitmap(int width = kTileSize, int height = kTileSize);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    const uint8_t* data() const { return m_pixels.data(); }
    uint8_t* data() { return m_pixels.data(); }
    size_t byteSize() const { return m_pixels.size(); }

    void fill(Color c);
    // Out-of-range coordinates are ignored.
    void setPixel(int x, int y, Color c);
    Color getPixel(int x, int y) const;

    void fillRect(int x0, int y0, int x1, int y1, Color c);
    // 1 px line in pixel coordinates, clipped to the bitmap first.
    void drawLine(double x0, double y0, double x1, double y1, Color c);

    bool operator==(const TileBitmap& o) const {
        return m_width == o.m_width && m_height == o.m_height && m_pixels == o.m_pixels;
    }

private:
    int m_width;
    int m_height;
    std::vector<uint8_t> m_pixels;
};

} // namespace mapstream
