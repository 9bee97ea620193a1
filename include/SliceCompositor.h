#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ColourTable.h"
#include "RGBAImage.h"
#include "Volume.h"

/// Raised when a scalar volume has to be drawn but neither it nor the
/// composite carries a colour table.
class MissingColourMapError : public std::runtime_error
{
public:
    explicit MissingColourMapError(const std::string& volumeName)
        : std::runtime_error("No colour map set for volume '" + volumeName +
                             "'. Cannot render slice.")
    {
    }
};

/// One slice per participating volume, in volume order.
struct CompositeSlice
{
    SliceAxis axis = SliceAxis::Z;
    std::vector<VolumeSlice> slices;
};

/// Layer images into a width x height target in ascending displayZIndex
/// (ties keep input order).  Image i contributes
///   target = target * (i == 0 ? 0 : 1 - opacity_i) + source * opacity_i
/// per RGB channel, but only where its pixel is not pure black.  Alpha is
/// opaque wherever any image covers the pixel.  A single image is returned
/// as is.
RGBAImage blendImages(std::vector<RGBAImage> images, int width, int height);

/// Several co-registered volumes viewed through the world space of the
/// first one.
class CompositeVolume
{
public:
    /// @throws std::invalid_argument if `volumes` is empty or holds null.
    explicit CompositeVolume(std::vector<std::shared_ptr<const Volume>> volumes);

    const std::vector<std::shared_ptr<const Volume>>& volumes() const { return volumes_; }
    const std::vector<double>& blendRatios() const { return blendRatios_; }
    const std::vector<float>& opacities() const { return opacities_; }

    /// Used for any scalar volume without its own colour table.
    void setDefaultColourTable(std::shared_ptr<const ColourTable> table) { defaultColourTable_ = std::move(table); }

    /// World space of the composite: the first volume's.
    const glm::dmat4& voxelToWorld() const { return volumes_.front()->voxelToWorld; }

    int sliceCount(SliceAxis axis) const { return volumes_.front()->sliceCount(axis); }

    /// Gather one slice per volume.  `index` is in the first volume's
    /// sampling and is rescaled by the ratio of step sizes for the others.
    CompositeSlice slice(SliceAxis axis, int index, int time = 0) const;

    /// Colour, mask, resample and blend a composite slice into one image of
    /// round(first slice size * zoom).  Slices without extent are skipped.
    /// @throws MissingColourMapError
    RGBAImage getSliceImage(const CompositeSlice& slice, double zoom = 1.0,
                            double contrast = 1.0, double brightness = 0.0) const;

    /// Blend-weighted intensity at voxel (i, j, k) of the composite.
    double getIntensityValue(int i, int j, int k, int time = 0) const;

private:
    RGBAImage renderVolumeSlice(std::size_t volumeIndex, const VolumeSlice& slice,
                                const VolumeSlice* anatSlice,
                                const VolumeSlice* riskMaskSlice,
                                double contrast, double brightness) const;

    std::vector<std::shared_ptr<const Volume>> volumes_;
    std::vector<double> blendRatios_;
    std::vector<float> opacities_;
    std::shared_ptr<const ColourTable> defaultColourTable_;
};
