#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ColourTable.h"

/// Storage of voxel values.  Rgb8 volumes are pre-coloured: each voxel is
/// four bytes of RGBA and bypasses colour mapping.
enum class VolumeDataType
{
    Float32,
    Rgb8
};

/// Slicing axis.  The slice is perpendicular to the named axis:
/// X = sagittal (y,z), Y = coronal (x,z), Z = transverse (x,y).
enum class SliceAxis
{
    X = 0,
    Y = 1,
    Z = 2
};

/// Roles that gate which voxels of a risk heat map are shown.
struct VolumeRoles
{
    bool riskHeatMap = false;  // heat map restricted to a region of interest
    bool safety = false;       // heat map layered over a safety context
    bool anat = false;         // anatomical label mask (safety context)
    bool riskMask = false;     // dedicated risk region mask
    int riskId = 0;            // mask label the heat map is restricted to
};

/// One 2D raster cut from a volume, row-major (width, then height).
struct VolumeSlice
{
    int width = 0;
    int height = 0;
    std::vector<float> data;     // scalar intensities (Float32 volumes)
    std::vector<uint8_t> rgba;   // packed colours (Rgb8 volumes)
    int displayZIndex = 0;

    bool hasExtent() const { return width > 0 && height > 0; }
};

class Volume {
public:
    std::string name;

    glm::ivec3 dimensions{0, 0, 0};  // X, Y, Z voxel counts
    int frames = 1;                  // time points

    /// Voxel spacing in mm along each axis.  Index 0 = X, 1 = Y, 2 = Z.
    glm::dvec3 step{1.0, 1.0, 1.0};

    /// World coordinate of the first voxel along each axis.
    glm::dvec3 start{0.0, 0.0, 0.0};

    /// Direction cosines per axis (unit vectors in world space).
    glm::dmat3 dirCos{1.0, 0.0, 0.0,
                      0.0, 1.0, 0.0,
                      0.0, 0.0, 1.0};

    VolumeDataType dataType = VolumeDataType::Float32;

    /// Scalar voxels, X fastest, then Y, Z and time.
    std::vector<float> data;

    /// Rgb8 voxels, 4 bytes each, same order as `data`.
    std::vector<uint8_t> rgbaData;

    /// Data range, computed by computeRange().
    float min_value = 0.0f;
    float max_value = 1.0f;

    /// Display window used when colour mapping.
    double intensityMin = 0.0;
    double intensityMax = 1.0;

    /// Palette for display; shared by every slice of the volume.
    std::shared_ptr<const ColourTable> colourTable;

    float opacity = 1.0f;
    int displayZIndex = 0;
    VolumeRoles roles;

    /// 4x4 transformation matrix from voxel coordinates to world coordinates.
    glm::dmat4 voxelToWorld{1.0};

    /// Inverse matrix: world coordinates to voxel coordinates.
    glm::dmat4 worldToVoxel{1.0};

    /// Set the sampling grid and rebuild voxelToWorld / worldToVoxel.
    void setGeometry(const glm::ivec3& dims, const glm::dvec3& stepMm,
                     const glm::dvec3& startMm,
                     const glm::dmat3& directionCosines = glm::dmat3(1.0));

    /// Recompute min_value / max_value from the scalar data and reset the
    /// display window to that range.  A constant volume gets a unit range.
    void computeRange();

    /// Fill with a synthetic pattern: an X ramp with grid lines every 32
    /// voxels and a bright sphere at the centre.
    void generate_test_data(int size = 256);

    bool empty() const { return data.empty() && rgbaData.empty(); }
    std::size_t voxelsPerFrame() const;

    /// Scalar value at a voxel; out-of-bounds reads return 0.
    float get(int x, int y, int z, int time = 0) const;

    /// Extract the slice perpendicular to `axis` at `index` and frame `time`.
    /// Rows run bottom-up so that superior / anterior is at the top.
    /// Indices are clamped into range; an empty volume yields no extent.
    VolumeSlice slice(SliceAxis axis, int index, int time = 0) const;

    /// Number of slices along an axis.
    int sliceCount(SliceAxis axis) const;

    /// Transform voxel coordinates (integers) to world coordinates.
    void transformVoxelToWorld(const glm::ivec3& voxel, glm::dvec3& world) const;

    /// Transform world coordinates to voxel indices.  Result is rounded to
    /// the nearest integer and clamped to the volume.
    void transformWorldToVoxel(const glm::dvec3& world, glm::ivec3& voxel) const;
};

/// Shape of a headerless raw volume file.
struct RawVolumeDescription
{
    glm::ivec3 dimensions{0, 0, 0};
    int frames = 1;
    glm::dvec3 step{1.0, 1.0, 1.0};
    glm::dvec3 start{0.0, 0.0, 0.0};
    VolumeDataType dataType = VolumeDataType::Float32;
};

/// Read a headerless little-endian float32 (or RGBA8) volume.
/// @throws std::runtime_error if the file cannot be read or its size does
///         not match the description.
Volume loadRawVolume(const std::string& path, const RawVolumeDescription& desc);
