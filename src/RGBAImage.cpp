#include "RGBAImage.h"

#include <algorithm>
#include <cmath>

RGBAImage::RGBAImage(int w, int h)
    : width(std::max(w, 0)), height(std::max(h, 0))
{
    data.assign(pixelCount() * 4, 0);
}

std::size_t RGBAImage::pixelCount() const
{
    if (empty())
        return 0;
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
}

uint8_t toChannelByte(float v)
{
    if (std::isnan(v) || v <= 0.0f)
        return 0;
    if (v >= 255.0f)
        return 255;
    return static_cast<uint8_t>(std::nearbyint(v));
}

std::vector<uint8_t> nearestNeighbour(const std::vector<uint8_t>& source,
                                      int width, int height,
                                      int newWidth, int newHeight,
                                      int blockSize)
{
    if (width == newWidth && height == newHeight)
        return source;
    if (newWidth <= 0 || newHeight <= 0 || width <= 0 || height <= 0)
        return std::vector<uint8_t>(
            static_cast<std::size_t>(std::max(newWidth, 0)) * std::max(newHeight, 0) * blockSize, 0);

    std::vector<uint8_t> target(static_cast<std::size_t>(newWidth) * newHeight * blockSize);
    double xRatio = static_cast<double>(width) / newWidth;
    double yRatio = static_cast<double>(height) / newHeight;

    for (int ty = 0; ty < newHeight; ++ty)
    {
        int sy = std::min(static_cast<int>(std::floor(ty * yRatio)), height - 1);
        std::size_t srcRow = static_cast<std::size_t>(sy) * width;
        std::size_t dstRow = static_cast<std::size_t>(ty) * newWidth;
        for (int tx = 0; tx < newWidth; ++tx)
        {
            int sx = std::min(static_cast<int>(std::floor(tx * xRatio)), width - 1);
            const uint8_t* src = source.data() + (srcRow + sx) * blockSize;
            uint8_t* dst = target.data() + (dstRow + tx) * blockSize;
            std::copy(src, src + blockSize, dst);
        }
    }
    return target;
}

RGBAImage resampleNearest(const RGBAImage& source, int newWidth, int newHeight)
{
    RGBAImage out;
    out.width = std::max(newWidth, 0);
    out.height = std::max(newHeight, 0);
    out.data = nearestNeighbour(source.data, source.width, source.height,
                                out.width, out.height, 4);
    out.displayZIndex = source.displayZIndex;
    out.opacity = source.opacity;
    return out;
}
