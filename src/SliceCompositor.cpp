#include "SliceCompositor.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "IntensityMapper.h"

namespace
{

/// First slice whose volume carries the given role, or null.
template <typename RolePredicate>
const VolumeSlice* findRoleSlice(const CompositeSlice& composite,
                                 const std::vector<std::shared_ptr<const Volume>>& volumes,
                                 RolePredicate hasRole)
{
    std::size_t n = std::min(composite.slices.size(), volumes.size());
    for (std::size_t i = 0; i < n; ++i)
    {
        if (hasRole(volumes[i]->roles))
            return &composite.slices[i];
    }
    return nullptr;
}

/// Zero every value whose mask voxel is not the risk label.
std::vector<float> applyRiskMask(const std::vector<float>& values,
                                 const std::vector<float>& mask, int riskId)
{
    std::vector<float> out(values.size(), 0.0f);
    if (riskId == 0)
        return out;

    const float label = static_cast<float>(riskId);
    const std::size_t n = std::min(values.size(), mask.size());
    for (std::size_t i = 0; i < n; ++i)
    {
        if (mask[i] == label)
            out[i] = values[i];
    }
    return out;
}

bool isBlack(const uint8_t* p)
{
    return p[0] == 0 && p[1] == 0 && p[2] == 0;
}

} // anonymous namespace

// -----------------------------------------------------------------------
// Blending
// -----------------------------------------------------------------------

RGBAImage blendImages(std::vector<RGBAImage> images, int width, int height)
{
    if (images.size() == 1)
        return std::move(images.front());

    std::stable_sort(images.begin(), images.end(),
                     [](const RGBAImage& a, const RGBAImage& b)
                     { return a.displayZIndex < b.displayZIndex; });

    RGBAImage target(std::max(width, 0), std::max(height, 0));

    for (int y = 0; y < target.height; ++y)
    {
        for (int x = 0; x < target.width; ++x)
        {
            uint8_t* dst = target.pixel(x, y);

            for (std::size_t i = 0; i < images.size(); ++i)
            {
                const RGBAImage& img = images[i];
                if (x >= img.width || y >= img.height)
                    continue;

                const uint8_t* src = img.pixel(x, y);
                const float keep = (i == 0) ? 0.0f : 1.0f - img.opacity;

                if (!isBlack(src))
                {
                    for (int c = 0; c < 3; ++c)
                        dst[c] = toChannelByte(dst[c] * keep + src[c] * img.opacity);
                }
                dst[3] = 255;
            }
        }
    }

    return target;
}

// -----------------------------------------------------------------------
// CompositeVolume
// -----------------------------------------------------------------------

CompositeVolume::CompositeVolume(std::vector<std::shared_ptr<const Volume>> volumes)
    : volumes_(std::move(volumes))
{
    if (volumes_.empty())
        throw std::invalid_argument("CompositeVolume needs at least one volume");

    for (const auto& vol : volumes_)
    {
        if (!vol)
            throw std::invalid_argument("CompositeVolume given a null volume");
        blendRatios_.push_back(1.0 / static_cast<double>(volumes_.size()));
        opacities_.push_back(vol->opacity);
    }
}

CompositeSlice CompositeVolume::slice(SliceAxis axis, int index, int time) const
{
    CompositeSlice composite;
    composite.axis = axis;

    const int a = static_cast<int>(axis);
    const double baseStep = volumes_.front()->step[a];

    for (const auto& vol : volumes_)
    {
        int corrected = index;
        double factor = vol->step[a] / baseStep;
        if (std::isfinite(factor) && factor != 0.0)
            corrected = static_cast<int>(std::round(index / factor));

        VolumeSlice s = vol->slice(axis, corrected, time);
        s.displayZIndex = vol->displayZIndex;
        composite.slices.push_back(std::move(s));
    }
    return composite;
}

RGBAImage CompositeVolume::renderVolumeSlice(std::size_t volumeIndex,
                                             const VolumeSlice& slice,
                                             const VolumeSlice* anatSlice,
                                             const VolumeSlice* riskMaskSlice,
                                             double contrast, double brightness) const
{
    const Volume& vol = *volumes_[volumeIndex];
    RGBAImage image(slice.width, slice.height);
    image.displayZIndex = slice.displayZIndex;
    image.opacity = opacities_[volumeIndex];

    if (vol.dataType == VolumeDataType::Rgb8)
    {
        std::size_t n = std::min(image.data.size(), slice.rgba.size());
        std::copy_n(slice.rgba.begin(), n, image.data.begin());
        return image;
    }

    std::shared_ptr<const ColourTable> table = vol.colourTable ? vol.colourTable
                                                               : defaultColourTable_;
    if (!table)
        throw MissingColourMapError(vol.name);

    const std::vector<float>* values = &slice.data;
    std::vector<float> masked;
    if (vol.roles.riskHeatMap)
    {
        const VolumeSlice* mask = vol.roles.safety ? anatSlice : riskMaskSlice;
        if (mask)
        {
            masked = applyRiskMask(slice.data, mask->data, vol.roles.riskId);
            values = &masked;
        }
    }

    MappingOptions opts;
    opts.min = vol.intensityMin;
    opts.max = vol.intensityMax;
    opts.contrast = contrast;
    opts.brightness = brightness;

    if (!mapColours(*table, *values, opts, image.data))
        std::cerr << "[compositor] colour table of '" << vol.name << "' is empty\n";

    // The mapped buffer may have grown past the raster for short slices.
    image.data.resize(image.pixelCount() * 4);
    return image;
}

RGBAImage CompositeVolume::getSliceImage(const CompositeSlice& slice, double zoom,
                                         double contrast, double brightness) const
{
    if (slice.slices.empty())
        return {};

    if (!(zoom > 0.0))
        zoom = 1.0;

    const VolumeSlice& first = slice.slices.front();
    if (!first.hasExtent())
    {
        std::cerr << "[compositor] first slice has no extent, nothing to draw\n";
        return {};
    }

    const int targetWidth = static_cast<int>(std::round(first.width * zoom));
    const int targetHeight = static_cast<int>(std::round(first.height * zoom));

    const VolumeSlice* anatSlice = findRoleSlice(slice, volumes_,
        [](const VolumeRoles& r) { return r.anat; });
    const VolumeSlice* riskMaskSlice = findRoleSlice(slice, volumes_,
        [](const VolumeRoles& r) { return r.riskMask; });

    std::vector<RGBAImage> images;
    const std::size_t n = std::min(slice.slices.size(), volumes_.size());
    for (std::size_t i = 0; i < n; ++i)
    {
        const VolumeSlice& s = slice.slices[i];
        if (!s.hasExtent())
        {
            std::cerr << "[compositor] skipping '" << volumes_[i]->name
                      << "': slice has no extent\n";
            continue;
        }

        RGBAImage source = renderVolumeSlice(i, s, anatSlice, riskMaskSlice,
                                             contrast, brightness);
        images.push_back(resampleNearest(source, targetWidth, targetHeight));
    }

    return blendImages(std::move(images), targetWidth, targetHeight);
}

double CompositeVolume::getIntensityValue(int i, int j, int k, int time) const
{
    glm::dvec3 world;
    volumes_.front()->transformVoxelToWorld(glm::ivec3(i, j, k), world);

    double intensity = 0.0;
    for (std::size_t v = 0; v < volumes_.size(); ++v)
    {
        glm::ivec3 voxel;
        volumes_[v]->transformWorldToVoxel(world, voxel);
        intensity += volumes_[v]->get(voxel.x, voxel.y, voxel.z, time) * blendRatios_[v];
    }
    return intensity;
}
