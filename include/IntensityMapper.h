#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ColourTable.h"

/// Values in (max, kDefaultMaxSpectrum] are pulled just below max before
/// mapping, so bounded spectrum encodings that overshoot the window ceiling
/// by rounding still get the top colour.
constexpr double kDefaultMaxSpectrum = 4.0;
constexpr double kSpectrumEpsilon = 0.0001;

/// Which voxels a sided colour applies to.  Positions up to and including
/// leftCount belong to the left hemisphere, the rest to the right.
enum class ColourSide
{
    All,
    Left,
    Right
};

struct SidedColour
{
    double value = 0.0;  // 1 matches any value in (0, 1]; others match exactly
    ColourSide side = ColourSide::All;
};

/// Value-keyed override used for hemisphere-specific colouring.  A voxel
/// whose value and side match one of `colours` keeps its table colour;
/// every other in-window voxel gets `defaultColour`.
struct SidedColourOptions
{
    std::vector<SidedColour> colours;
    std::array<float, 4> defaultColour = {0.0f, 0.0f, 0.0f, 1.0f};
    std::size_t leftCount = 0;
};

/// Colours written for out-of-window values: either one RGBA colour reused
/// at every position, or one RGBA colour per position.
struct DefaultColours
{
    std::vector<float> rgba = {0.0f, 0.0f, 0.0f, 1.0f};

    bool perPosition() const { return rgba.size() != 4; }
};

/// Per-call mapping parameters.  Unset overrides fall back to the colour
/// table's own configuration.
struct MappingOptions
{
    double min = 0.0;
    double max = 255.0;
    double maxSpectrum = kDefaultMaxSpectrum;

    std::optional<bool> clamp;
    std::optional<bool> flip;
    std::optional<double> scale;
    std::optional<double> contrast;
    std::optional<double> brightness;

    DefaultColours defaultColours;
    std::optional<SidedColourOptions> colourOptions;
};

/// Optional transform applied to the table before mapping, for example to
/// hide a background colour from a legend.
using ColourFilter = std::function<ColourTable(const ColourTable&)>;

/// Map intensities through the table into a new float RGBA buffer of
/// 4 * intensities.size() values.  Returns nothing when the (filtered) table
/// has no entries.
std::optional<std::vector<float>> mapColours(const ColourTable& table,
                                             const std::vector<float>& intensities,
                                             const MappingOptions& options,
                                             const ColourFilter& filter = {});

/// Same, writing into a caller-supplied float buffer.  The buffer grows to
/// 4 * intensities.size() if it is smaller.  Returns false when there is
/// nothing to draw; the buffer is then left untouched.
bool mapColours(const ColourTable& table,
                const std::vector<float>& intensities,
                const MappingOptions& options,
                std::vector<float>& destination,
                const ColourFilter& filter = {});

/// Same, writing bytes: each channel is rounded and clamped to [0, 255].
bool mapColours(const ColourTable& table,
                const std::vector<float>& intensities,
                const MappingOptions& options,
                std::vector<uint8_t>& destination,
                const ColourFilter& filter = {});

/// Window and overrides for single-value lookups.  Clamp and flip always
/// come from the table.
struct ColourQuery
{
    double min = 0.0;
    double max = 255.0;
    std::optional<double> scale;
    std::optional<double> contrast;
    std::optional<double> brightness;
};

/// Colour of one value.  RGB is contrast/brightness adjusted and clamped to
/// [0, 1]; all four channels are then multiplied by the scale.  Out-of-window
/// values yield opaque black.
std::array<float, 4> colourFromValue(const ColourTable& table, double value,
                                     const ColourQuery& query = {});

/// Colour of one value as a six-digit lowercase hex string ("ff8000").
std::string colourHexFromValue(const ColourTable& table, double value,
                               const ColourQuery& query = {});
