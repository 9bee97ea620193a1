#include "IntensityMapper.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

#include "RGBAImage.h"

namespace
{

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

/// Table settings after applying per-call overrides.
struct EffectiveSettings
{
    bool clamp;
    bool flip;
    double scale;
    double contrast;
    double brightness;
};

EffectiveSettings resolveSettings(const ColourTableConfig& cfg, const MappingOptions& o)
{
    EffectiveSettings s;
    s.clamp = o.clamp.value_or(cfg.clamp);
    s.flip = o.flip.value_or(cfg.flip);
    s.scale = o.scale.value_or(cfg.scale);
    s.contrast = o.contrast.value_or(cfg.contrast);
    s.brightness = o.brightness.value_or(cfg.brightness);
    return s;
}

bool sideMatches(ColourSide side, std::size_t position, std::size_t leftCount)
{
    switch (side)
    {
    case ColourSide::All:  return true;
    case ColourSide::Left: return position <= leftCount;
    default:               return position > leftCount;
    }
}

bool sidedColourMatches(const SidedColour& c, double value,
                        std::size_t position, std::size_t leftCount)
{
    if (!sideMatches(c.side, position, leftCount))
        return false;
    if (c.value == 1.0)
        return value > 0.0 && value <= 1.0;
    return c.value == value;
}

/// Core loop shared by the float and byte outputs.  `store` converts a
/// mapped channel value to the destination element type.
template <typename T, typename Store>
void mapInto(const ColourTable& table,
             const std::vector<float>& intensities,
             const MappingOptions& options,
             T* dst, Store store)
{
    const EffectiveSettings s = resolveSettings(table.config(), options);
    const double min = options.min;
    const double max = options.max;
    const std::size_t length = table.entryCount();
    const double increment = colourIncrement(min, max, length);

    // Contrast and brightness are expressed in output units.
    const double contrast = s.contrast * s.scale;
    const double brightness = s.brightness * s.scale;
    const double scale = s.scale;

    const std::vector<float>& colours = table.colours();
    const std::vector<float>& defaults = options.defaultColours.rgba;
    const bool perPosition = options.defaultColours.perPosition();
    const SidedColourOptions* sided =
        options.colourOptions ? &*options.colourOptions : nullptr;

    auto defaultChannel = [&](std::size_t idx) -> float
    {
        return idx < defaults.size() ? defaults[idx] : kNaN;
    };

    auto tableChannel = [&](int offset, int c) -> float
    {
        std::size_t entry = static_cast<std::size_t>(offset) / kChannels;
        return table.isDefined(entry) ? colours[offset + c] : kNaN;
    };

    auto write = [&](std::size_t ic, float r, float g, float b, float a)
    {
        dst[ic]     = store(contrast * r + brightness);
        dst[ic + 1] = store(contrast * g + brightness);
        dst[ic + 2] = store(contrast * b + brightness);
        dst[ic + 3] = store(scale * a);
    };

    for (std::size_t i = 0, count = intensities.size(); i < count; ++i)
    {
        double value = intensities[i];
        if (value > max && value <= options.maxSpectrum)
            value = max - kSpectrumEpsilon;

        std::size_t ic = i * kChannels;
        int offset = resolveColourIndex(value, min, max, increment,
                                        s.clamp, s.flip, length);

        if (offset < 0)
        {
            std::size_t idc = perPosition ? ic : 0;
            write(ic, defaultChannel(idc), defaultChannel(idc + 1),
                  defaultChannel(idc + 2), defaultChannel(idc + 3));
        }
        else if (sided)
        {
            bool found = std::any_of(sided->colours.begin(), sided->colours.end(),
                [&](const SidedColour& c)
                {
                    return sidedColourMatches(c, value, i, sided->leftCount);
                });
            if (found)
            {
                write(ic, tableChannel(offset, 0), tableChannel(offset, 1),
                      tableChannel(offset, 2), tableChannel(offset, 3));
            }
            else
            {
                const auto& dc = sided->defaultColour;
                write(ic, dc[0], dc[1], dc[2], dc[3]);
            }
        }
        else
        {
            write(ic, tableChannel(offset, 0), tableChannel(offset, 1),
                  tableChannel(offset, 2), tableChannel(offset, 3));
        }
    }
}

/// Apply the optional filter; `holder` keeps a filtered copy alive.
const ColourTable& activeTable(const ColourTable& table, const ColourFilter& filter,
                               std::optional<ColourTable>& holder)
{
    if (!filter)
        return table;
    holder = filter(table);
    return *holder;
}

} // anonymous namespace

// -----------------------------------------------------------------------
// Public API
// -----------------------------------------------------------------------

std::optional<std::vector<float>> mapColours(const ColourTable& table,
                                             const std::vector<float>& intensities,
                                             const MappingOptions& options,
                                             const ColourFilter& filter)
{
    std::vector<float> destination;
    if (!mapColours(table, intensities, options, destination, filter))
        return std::nullopt;
    return destination;
}

bool mapColours(const ColourTable& table,
                const std::vector<float>& intensities,
                const MappingOptions& options,
                std::vector<float>& destination,
                const ColourFilter& filter)
{
    std::optional<ColourTable> holder;
    const ColourTable& active = activeTable(table, filter, holder);
    if (active.empty())
        return false;

    std::size_t needed = intensities.size() * kChannels;
    if (destination.size() < needed)
        destination.resize(needed);

    mapInto(active, intensities, options, destination.data(),
            [](double v) { return static_cast<float>(v); });
    return true;
}

bool mapColours(const ColourTable& table,
                const std::vector<float>& intensities,
                const MappingOptions& options,
                std::vector<uint8_t>& destination,
                const ColourFilter& filter)
{
    std::optional<ColourTable> holder;
    const ColourTable& active = activeTable(table, filter, holder);
    if (active.empty())
        return false;

    std::size_t needed = intensities.size() * kChannels;
    if (destination.size() < needed)
        destination.resize(needed);

    mapInto(active, intensities, options, destination.data(),
            [](double v) { return toChannelByte(static_cast<float>(v)); });
    return true;
}

std::array<float, 4> colourFromValue(const ColourTable& table, double value,
                                     const ColourQuery& query)
{
    const ColourTableConfig& cfg = table.config();
    double scale = query.scale.value_or(cfg.scale);
    double contrast = query.contrast.value_or(cfg.contrast);
    double brightness = query.brightness.value_or(cfg.brightness);

    // Single lookups stretch the window over the whole table, label
    // atlases included.
    std::size_t length = table.entryCount();
    double span = std::max(query.max - query.min, kMinWindowSpan);
    double increment = static_cast<double>(length) / span;
    int offset = resolveColourIndex(value, query.min, query.max, increment,
                                    cfg.clamp, cfg.flip, length);

    std::array<float, 4> colour = {0.0f, 0.0f, 0.0f, 1.0f};
    if (offset >= 0)
        colour = table.entry(static_cast<std::size_t>(offset) / kChannels);

    for (int c = 0; c < 3; ++c)
    {
        double v = contrast * colour[c] + brightness;
        colour[c] = std::isnan(v) ? 0.0f : static_cast<float>(std::clamp(v, 0.0, 1.0));
    }
    for (int c = 0; c < 4; ++c)
        colour[c] = static_cast<float>(colour[c] * scale);
    return colour;
}

std::string colourHexFromValue(const ColourTable& table, double value,
                               const ColourQuery& query)
{
    ColourQuery unscaled = query;
    unscaled.scale = 1.0;
    std::array<float, 4> colour = colourFromValue(table, value, unscaled);

    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02x%02x%02x",
                  static_cast<unsigned>(std::floor(colour[0] * 255.0f)),
                  static_cast<unsigned>(std::floor(colour[1] * 255.0f)),
                  static_cast<unsigned>(std::floor(colour[2] * 255.0f)));
    return std::string(buf);
}
