#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/// 8-bit RGBA raster, row-major, 4 bytes per pixel.
struct RGBAImage
{
    int width = 0;
    int height = 0;
    std::vector<uint8_t> data;  // width * height * 4

    /// Compositing order; higher values paint on top.
    int displayZIndex = 0;

    /// Blend weight in [0, 1] used when this image is layered over others.
    float opacity = 1.0f;

    RGBAImage() = default;
    RGBAImage(int w, int h);

    bool empty() const { return width <= 0 || height <= 0; }
    std::size_t pixelCount() const;

    uint8_t* pixel(int x, int y) { return data.data() + (static_cast<std::size_t>(y) * width + x) * 4; }
    const uint8_t* pixel(int x, int y) const { return data.data() + (static_cast<std::size_t>(y) * width + x) * 4; }
};

/// Convert a mapped channel value to a byte: rounds half to even, clamps to
/// [0, 255], and turns NaN into 0.
uint8_t toChannelByte(float v);

/// Nearest-neighbour resample of a block-structured buffer.  Each source
/// pixel is blockSize consecutive elements.  Target pixel (x, y) copies
/// source pixel (floor(x * w / newW), floor(y * h / newH)).  When the sizes
/// already match the source is returned unchanged.
std::vector<uint8_t> nearestNeighbour(const std::vector<uint8_t>& source,
                                      int width, int height,
                                      int newWidth, int newHeight,
                                      int blockSize = 4);

/// Resample an image to the given size, keeping its z-index and opacity.
RGBAImage resampleNearest(const RGBAImage& source, int newWidth, int newHeight);
