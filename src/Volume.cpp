#include "Volume.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <glm/gtc/matrix_inverse.hpp>

namespace
{

/// Voxel layout of one slice: voxel (u, v) of the slice lives at
/// base + u * du + v * dv in the frame.
struct SliceLayout
{
    int width;
    int height;
    std::size_t base;
    std::size_t du;
    std::size_t dv;
};

SliceLayout sliceLayout(const glm::ivec3& dims, SliceAxis axis, int index)
{
    const std::size_t dimX = dims.x;
    const std::size_t dimXY = static_cast<std::size_t>(dims.x) * dims.y;

    switch (axis)
    {
    case SliceAxis::X:
        return {dims.y, dims.z, static_cast<std::size_t>(index), dimX, dimXY};
    case SliceAxis::Y:
        return {dims.x, dims.z, static_cast<std::size_t>(index) * dimX, 1, dimXY};
    default:
        return {dims.x, dims.y, static_cast<std::size_t>(index) * dimXY, 1, dimX};
    }
}

/// Copy one slice of `block`-sized voxels, flipping rows so v grows upward.
template <typename T>
void copySlice(const std::vector<T>& src, std::size_t frameOffset,
               const SliceLayout& L, int block, std::vector<T>& dst)
{
    dst.resize(static_cast<std::size_t>(L.width) * L.height * block);
    for (int v = 0; v < L.height; ++v)
    {
        std::size_t dstRow = static_cast<std::size_t>(L.height - 1 - v) * L.width;
        for (int u = 0; u < L.width; ++u)
        {
            std::size_t voxel = frameOffset + L.base + u * L.du + v * L.dv;
            const T* s = src.data() + voxel * block;
            std::copy(s, s + block, dst.data() + (dstRow + u) * block);
        }
    }
}

int axisLength(const glm::ivec3& dims, SliceAxis axis)
{
    return dims[static_cast<int>(axis)];
}

} // anonymous namespace

void Volume::setGeometry(const glm::ivec3& dims, const glm::dvec3& stepMm,
                         const glm::dvec3& startMm,
                         const glm::dmat3& directionCosines)
{
    dimensions = dims;
    step = stepMm;
    start = startMm;
    dirCos = directionCosines;

    // world = dirCos * diag(step) * voxel + start
    glm::dmat3 affine = dirCos;
    for (int i = 0; i < 3; ++i)
        affine[i] *= step[i];

    voxelToWorld = glm::dmat4(
        glm::dvec4(affine[0], 0.0),
        glm::dvec4(affine[1], 0.0),
        glm::dvec4(affine[2], 0.0),
        glm::dvec4(start, 1.0)
    );
    worldToVoxel = glm::inverse(voxelToWorld);
}

void Volume::computeRange()
{
    if (data.empty())
    {
        min_value = 0.0f;
        max_value = 1.0f;
    }
    else
    {
        min_value = std::numeric_limits<float>::max();
        max_value = std::numeric_limits<float>::lowest();
        for (float v : data)
        {
            if (v < min_value) min_value = v;
            if (v > max_value) max_value = v;
        }
        if (min_value >= max_value)
            max_value = min_value + 1.0f;
    }

    intensityMin = min_value;
    intensityMax = max_value;
}

void Volume::generate_test_data(int size)
{
    setGeometry(glm::ivec3(size), glm::dvec3(1.0), glm::dvec3(-size / 2.0));
    frames = 1;
    dataType = VolumeDataType::Float32;
    rgbaData.clear();
    data.resize(static_cast<std::size_t>(size) * size * size);

    const float centre = size / 2.0f;
    const float radius = size * 60.0f / 256.0f;

    for (int z = 0; z < size; ++z)
    {
        for (int y = 0; y < size; ++y)
        {
            for (int x = 0; x < size; ++x)
            {
                float val = static_cast<float>(x) / static_cast<float>(size);
                // Grid lines
                if (z % 32 == 0 || y % 32 == 0 || x % 32 == 0)
                    val = 0.8f;

                // Sphere in center
                float dx = x - centre;
                float dy = y - centre;
                float dz = z - centre;
                if (std::sqrt(dx * dx + dy * dy + dz * dz) < radius)
                    val = 1.0f;

                data[(static_cast<std::size_t>(z) * size + y) * size + x] = val;
            }
        }
    }

    computeRange();
}

std::size_t Volume::voxelsPerFrame() const
{
    return static_cast<std::size_t>(std::max(dimensions.x, 0)) *
           static_cast<std::size_t>(std::max(dimensions.y, 0)) *
           static_cast<std::size_t>(std::max(dimensions.z, 0));
}

float Volume::get(int x, int y, int z, int time) const
{
    if (x < 0 || x >= dimensions.x ||
        y < 0 || y >= dimensions.y ||
        z < 0 || z >= dimensions.z ||
        time < 0 || time >= frames) return 0.0f;

    std::size_t idx = time * voxelsPerFrame() +
                      (static_cast<std::size_t>(z) * dimensions.y + y) * dimensions.x + x;
    if (idx >= data.size())
        return 0.0f;
    return data[idx];
}

int Volume::sliceCount(SliceAxis axis) const
{
    return axisLength(dimensions, axis);
}

VolumeSlice Volume::slice(SliceAxis axis, int index, int time) const
{
    VolumeSlice out;
    out.displayZIndex = displayZIndex;

    const std::size_t perFrame = voxelsPerFrame();
    const int count = axisLength(dimensions, axis);
    if (perFrame == 0 || count <= 0 || empty())
        return out;

    index = std::clamp(index, 0, count - 1);
    time = std::clamp(time, 0, std::max(frames, 1) - 1);
    const SliceLayout layout = sliceLayout(dimensions, axis, index);
    const std::size_t frameOffset = time * perFrame;

    if (dataType == VolumeDataType::Rgb8)
    {
        if (rgbaData.size() < (frameOffset + perFrame) * 4)
            return out;
        copySlice(rgbaData, frameOffset, layout, 4, out.rgba);
    }
    else
    {
        if (data.size() < frameOffset + perFrame)
            return out;
        copySlice(data, frameOffset, layout, 1, out.data);
    }

    out.width = layout.width;
    out.height = layout.height;
    return out;
}

void Volume::transformVoxelToWorld(const glm::ivec3& voxel, glm::dvec3& world) const
{
    glm::dvec4 v(static_cast<double>(voxel.x), static_cast<double>(voxel.y), static_cast<double>(voxel.z), 1.0);
    glm::dvec4 w = voxelToWorld * v;
    world.x = w.x;
    world.y = w.y;
    world.z = w.z;
}

void Volume::transformWorldToVoxel(const glm::dvec3& world, glm::ivec3& voxel) const
{
    glm::dvec4 w(world.x, world.y, world.z, 1.0);
    glm::dvec4 v = worldToVoxel * w;
    voxel.x = static_cast<int>(std::round(v.x));
    voxel.y = static_cast<int>(std::round(v.y));
    voxel.z = static_cast<int>(std::round(v.z));

    voxel.x = std::clamp(voxel.x, 0, std::max(dimensions.x - 1, 0));
    voxel.y = std::clamp(voxel.y, 0, std::max(dimensions.y - 1, 0));
    voxel.z = std::clamp(voxel.z, 0, std::max(dimensions.z - 1, 0));
}

Volume loadRawVolume(const std::string& path, const RawVolumeDescription& desc)
{
    if (path.empty())
        throw std::runtime_error("Empty filename provided");
    if (desc.dimensions.x <= 0 || desc.dimensions.y <= 0 ||
        desc.dimensions.z <= 0 || desc.frames <= 0)
        throw std::runtime_error("Invalid dimensions for raw volume: " + path);

    Volume vol;
    vol.setGeometry(desc.dimensions, desc.step, desc.start);
    vol.frames = desc.frames;
    vol.dataType = desc.dataType;

    const std::size_t voxels = vol.voxelsPerFrame() * static_cast<std::size_t>(desc.frames);
    const std::size_t bytesPerVoxel = 4;
    const std::size_t expected = voxels * bytesPerVoxel;

    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs)
        throw std::runtime_error("Failed to open file: " + path);
    const std::streamsize size = ifs.tellg();
    if (size < 0 || static_cast<std::size_t>(size) != expected)
        throw std::runtime_error("Raw volume size mismatch (expected " +
                                 std::to_string(expected) + " bytes): " + path);
    ifs.seekg(0);

    std::vector<uint8_t> bytes(expected);
    if (!ifs.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(expected)))
        throw std::runtime_error("Failed to load volume data: " + path);

    if (desc.dataType == VolumeDataType::Rgb8)
    {
        vol.rgbaData = std::move(bytes);
    }
    else
    {
        vol.data.resize(voxels);
        for (std::size_t i = 0; i < voxels; ++i)
        {
            uint32_t raw;
            std::memcpy(&raw, bytes.data() + i * 4, 4);
            if constexpr (std::endian::native == std::endian::big)
                raw = (raw >> 24) | ((raw >> 8) & 0xFF00u) | ((raw << 8) & 0xFF0000u) | (raw << 24);
            std::memcpy(&vol.data[i], &raw, 4);
        }
        vol.computeRange();
    }

    vol.name = path;
    return vol;
}
