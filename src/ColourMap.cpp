#include "ColourMap.h"

#include <algorithm>
#include <array>
#include <string>

// -----------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------

namespace
{

/// A single control point in a piecewise-linear colour ramp.
struct ControlPoint
{
    float pos;          // normalised position [0, 1]
    float r, g, b, a;   // RGBA [0, 1]
};

/// Sample a piecewise-linear ramp into kBuiltinTableSize RGBA entries.
/// Entry i corresponds to the normalised position i/255.
std::vector<float> sampleControlPoints(const ControlPoint* pts, int nPts)
{
    std::vector<float> colours(kBuiltinTableSize * kChannels);
    int seg = 0;
    for (int i = 0; i < kBuiltinTableSize; ++i)
    {
        float pos = static_cast<float>(i) / static_cast<float>(kBuiltinTableSize - 1);

        // Advance to the correct segment.
        while (seg < nPts - 2 && pos > pts[seg + 1].pos)
            ++seg;

        const ControlPoint& p0 = pts[seg];
        const ControlPoint& p1 = pts[seg + 1];
        float span = p1.pos - p0.pos;
        float t = (span > 1e-9f) ? (pos - p0.pos) / span : 0.0f;
        t = std::clamp(t, 0.0f, 1.0f);

        float* out = colours.data() + i * kChannels;
        out[0] = p0.r + (p1.r - p0.r) * t;
        out[1] = p0.g + (p1.g - p0.g) * t;
        out[2] = p0.b + (p1.b - p0.b) * t;
        out[3] = p0.a + (p1.a - p0.a) * t;
    }
    return colours;
}

// -----------------------------------------------------------------------
// Control point definitions, matching legacy bicpl.
// -----------------------------------------------------------------------

// --- Gray Scale ---
const ControlPoint kGrayScale[] = {
    { 0.0f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 1.0f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Hot Metal ---
const ControlPoint kHotMetal[] = {
    { 0.00f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 0.25f, 0.5f, 0.0f, 0.0f, 1.0f },
    { 0.50f, 1.0f, 0.5f, 0.0f, 1.0f },
    { 0.75f, 1.0f, 1.0f, 0.5f, 1.0f },
    { 1.00f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Hot Metal Negative ---
const ControlPoint kHotMetalNeg[] = {
    { 0.00f, 1.0f, 1.0f, 1.0f, 1.0f },
    { 0.25f, 1.0f, 1.0f, 0.5f, 1.0f },
    { 0.50f, 1.0f, 0.5f, 0.0f, 1.0f },
    { 0.75f, 0.5f, 0.0f, 0.0f, 1.0f },
    { 1.00f, 0.0f, 0.0f, 0.0f, 1.0f },
};

// --- Cold Metal ---
const ControlPoint kColdMetal[] = {
    { 0.00f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 0.25f, 0.0f, 0.0f, 0.5f, 1.0f },
    { 0.50f, 0.0f, 0.5f, 1.0f, 1.0f },
    { 0.75f, 0.5f, 1.0f, 1.0f, 1.0f },
    { 1.00f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Cold Metal Negative ---
const ControlPoint kColdMetalNeg[] = {
    { 0.00f, 1.0f, 1.0f, 1.0f, 1.0f },
    { 0.25f, 0.5f, 1.0f, 1.0f, 1.0f },
    { 0.50f, 0.0f, 0.5f, 1.0f, 1.0f },
    { 0.75f, 0.0f, 0.0f, 0.5f, 1.0f },
    { 1.00f, 0.0f, 0.0f, 0.0f, 1.0f },
};

// --- Green Metal ---
const ControlPoint kGreenMetal[] = {
    { 0.00f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 0.25f, 0.0f, 0.5f, 0.0f, 1.0f },
    { 0.50f, 0.0f, 1.0f, 0.5f, 1.0f },
    { 0.75f, 0.5f, 1.0f, 1.0f, 1.0f },
    { 1.00f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Green Metal Negative ---
const ControlPoint kGreenMetalNeg[] = {
    { 0.00f, 1.0f, 1.0f, 1.0f, 1.0f },
    { 0.25f, 0.5f, 1.0f, 1.0f, 1.0f },
    { 0.50f, 0.0f, 1.0f, 0.5f, 1.0f },
    { 0.75f, 0.0f, 0.5f, 0.0f, 1.0f },
    { 1.00f, 0.0f, 0.0f, 0.0f, 1.0f },
};

// --- Lime Metal ---
const ControlPoint kLimeMetal[] = {
    { 0.00f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 0.25f, 0.0f, 0.5f, 0.0f, 1.0f },
    { 0.50f, 0.5f, 1.0f, 0.0f, 1.0f },
    { 0.75f, 1.0f, 1.0f, 0.5f, 1.0f },
    { 1.00f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Lime Metal Negative ---
const ControlPoint kLimeMetalNeg[] = {
    { 0.00f, 1.0f, 1.0f, 1.0f, 1.0f },
    { 0.25f, 1.0f, 1.0f, 0.5f, 1.0f },
    { 0.50f, 0.5f, 1.0f, 0.0f, 1.0f },
    { 0.75f, 0.0f, 0.5f, 0.0f, 1.0f },
    { 1.00f, 0.0f, 0.0f, 0.0f, 1.0f },
};

// --- Red Metal ---
const ControlPoint kRedMetal[] = {
    { 0.00f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 0.25f, 0.5f, 0.0f, 0.0f, 1.0f },
    { 0.50f, 1.0f, 0.0f, 0.5f, 1.0f },
    { 0.75f, 1.0f, 0.5f, 1.0f, 1.0f },
    { 1.00f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Red Metal Negative ---
const ControlPoint kRedMetalNeg[] = {
    { 0.00f, 1.0f, 1.0f, 1.0f, 1.0f },
    { 0.25f, 1.0f, 0.5f, 1.0f, 1.0f },
    { 0.50f, 1.0f, 0.0f, 0.5f, 1.0f },
    { 0.75f, 0.5f, 0.0f, 0.0f, 1.0f },
    { 1.00f, 0.0f, 0.0f, 0.0f, 1.0f },
};

// --- Purple Metal ---
const ControlPoint kPurpleMetal[] = {
    { 0.00f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 0.25f, 0.0f, 0.0f, 0.5f, 1.0f },
    { 0.50f, 0.5f, 0.0f, 1.0f, 1.0f },
    { 0.75f, 1.0f, 0.5f, 1.0f, 1.0f },
    { 1.00f, 1.0f, 1.0f, 1.0f, 1.0f },
};

// --- Purple Metal Negative ---
const ControlPoint kPurpleMetalNeg[] = {
    { 0.00f, 1.0f, 1.0f, 1.0f, 1.0f },
    { 0.25f, 1.0f, 0.5f, 1.0f, 1.0f },
    { 0.50f, 0.5f, 0.0f, 1.0f, 1.0f },
    { 0.75f, 0.0f, 0.0f, 0.5f, 1.0f },
    { 1.00f, 0.0f, 0.0f, 0.0f, 1.0f },
};

// --- Spectral (21 control points) ---
const ControlPoint kSpectral[] = {
    { 0.00f, 0.0000f, 0.0000f, 0.0000f, 1.0f },
    { 0.05f, 0.4667f, 0.0000f, 0.5333f, 1.0f },
    { 0.10f, 0.5333f, 0.0000f, 0.6000f, 1.0f },
    { 0.15f, 0.0000f, 0.0000f, 0.6667f, 1.0f },
    { 0.20f, 0.0000f, 0.0000f, 0.8667f, 1.0f },
    { 0.25f, 0.0000f, 0.4667f, 0.8667f, 1.0f },
    { 0.30f, 0.0000f, 0.6000f, 0.8667f, 1.0f },
    { 0.35f, 0.0000f, 0.6667f, 0.6667f, 1.0f },
    { 0.40f, 0.0000f, 0.6667f, 0.5333f, 1.0f },
    { 0.45f, 0.0000f, 0.6000f, 0.0000f, 1.0f },
    { 0.50f, 0.0000f, 0.7333f, 0.0000f, 1.0f },
    { 0.55f, 0.0000f, 0.8667f, 0.0000f, 1.0f },
    { 0.60f, 0.0000f, 1.0000f, 0.0000f, 1.0f },
    { 0.65f, 0.7333f, 1.0000f, 0.0000f, 1.0f },
    { 0.70f, 0.9333f, 0.9333f, 0.0000f, 1.0f },
    { 0.75f, 1.0000f, 0.8000f, 0.0000f, 1.0f },
    { 0.80f, 1.0000f, 0.6000f, 0.0000f, 1.0f },
    { 0.85f, 1.0000f, 0.0000f, 0.0000f, 1.0f },
    { 0.90f, 0.8667f, 0.0000f, 0.0000f, 1.0f },
    { 0.95f, 0.8000f, 0.0000f, 0.0000f, 1.0f },
    { 1.00f, 0.8000f, 0.8000f, 0.8000f, 1.0f },
};

// --- Red ---
const ControlPoint kRed[] = {
    { 0.0f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 1.0f, 1.0f, 0.0f, 0.0f, 1.0f },
};

// --- Green ---
const ControlPoint kGreen[] = {
    { 0.0f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 1.0f, 0.0f, 1.0f, 0.0f, 1.0f },
};

// --- Blue ---
const ControlPoint kBlue[] = {
    { 0.0f, 0.0f, 0.0f, 0.0f, 1.0f },
    { 1.0f, 0.0f, 0.0f, 1.0f, 1.0f },
};

// --- Contour (6 banded segments with discontinuities) ---
const ControlPoint kContour[] = {
    { 0.000f, 0.0f, 0.0f, 0.3f, 1.0f },
    { 0.166f, 0.0f, 0.0f, 1.0f, 1.0f },
    { 0.166f, 0.0f, 0.3f, 0.3f, 1.0f },
    { 0.333f, 0.0f, 1.0f, 1.0f, 1.0f },
    { 0.333f, 0.0f, 0.3f, 0.0f, 1.0f },
    { 0.500f, 0.0f, 1.0f, 0.0f, 1.0f },
    { 0.500f, 0.3f, 0.3f, 0.0f, 1.0f },
    { 0.666f, 1.0f, 1.0f, 0.0f, 1.0f },
    { 0.666f, 0.3f, 0.0f, 0.0f, 1.0f },
    { 0.833f, 1.0f, 0.0f, 0.0f, 1.0f },
    { 0.833f, 0.3f, 0.3f, 0.3f, 1.0f },
    { 1.000f, 1.0f, 1.0f, 1.0f, 1.0f },
};

template<typename T, int N>
constexpr int countOf(const T (&)[N]) { return N; }

std::vector<float> buildColours(ColourMapType type)
{
    switch (type)
    {
    case ColourMapType::GrayScale:      return sampleControlPoints(kGrayScale, countOf(kGrayScale));
    case ColourMapType::HotMetal:       return sampleControlPoints(kHotMetal, countOf(kHotMetal));
    case ColourMapType::HotMetalNeg:    return sampleControlPoints(kHotMetalNeg, countOf(kHotMetalNeg));
    case ColourMapType::ColdMetal:      return sampleControlPoints(kColdMetal, countOf(kColdMetal));
    case ColourMapType::ColdMetalNeg:   return sampleControlPoints(kColdMetalNeg, countOf(kColdMetalNeg));
    case ColourMapType::GreenMetal:     return sampleControlPoints(kGreenMetal, countOf(kGreenMetal));
    case ColourMapType::GreenMetalNeg:  return sampleControlPoints(kGreenMetalNeg, countOf(kGreenMetalNeg));
    case ColourMapType::LimeMetal:      return sampleControlPoints(kLimeMetal, countOf(kLimeMetal));
    case ColourMapType::LimeMetalNeg:   return sampleControlPoints(kLimeMetalNeg, countOf(kLimeMetalNeg));
    case ColourMapType::RedMetal:       return sampleControlPoints(kRedMetal, countOf(kRedMetal));
    case ColourMapType::RedMetalNeg:    return sampleControlPoints(kRedMetalNeg, countOf(kRedMetalNeg));
    case ColourMapType::PurpleMetal:    return sampleControlPoints(kPurpleMetal, countOf(kPurpleMetal));
    case ColourMapType::PurpleMetalNeg: return sampleControlPoints(kPurpleMetalNeg, countOf(kPurpleMetalNeg));
    case ColourMapType::Spectral:       return sampleControlPoints(kSpectral, countOf(kSpectral));
    case ColourMapType::Red:            return sampleControlPoints(kRed, countOf(kRed));
    case ColourMapType::Green:          return sampleControlPoints(kGreen, countOf(kGreen));
    case ColourMapType::Blue:           return sampleControlPoints(kBlue, countOf(kBlue));
    case ColourMapType::Contour:        return sampleControlPoints(kContour, countOf(kContour));
    default:                            return sampleControlPoints(kGrayScale, countOf(kGrayScale));
    }
}

/// Enum spelling used in config files ("HotMetal").
std::string_view colourMapKey(ColourMapType type)
{
    switch (type)
    {
    case ColourMapType::GrayScale:      return "GrayScale";
    case ColourMapType::HotMetal:       return "HotMetal";
    case ColourMapType::HotMetalNeg:    return "HotMetalNeg";
    case ColourMapType::ColdMetal:      return "ColdMetal";
    case ColourMapType::ColdMetalNeg:   return "ColdMetalNeg";
    case ColourMapType::GreenMetal:     return "GreenMetal";
    case ColourMapType::GreenMetalNeg:  return "GreenMetalNeg";
    case ColourMapType::LimeMetal:      return "LimeMetal";
    case ColourMapType::LimeMetalNeg:   return "LimeMetalNeg";
    case ColourMapType::RedMetal:       return "RedMetal";
    case ColourMapType::RedMetalNeg:    return "RedMetalNeg";
    case ColourMapType::PurpleMetal:    return "PurpleMetal";
    case ColourMapType::PurpleMetalNeg: return "PurpleMetalNeg";
    case ColourMapType::Spectral:       return "Spectral";
    case ColourMapType::Red:            return "Red";
    case ColourMapType::Green:          return "Green";
    case ColourMapType::Blue:           return "Blue";
    case ColourMapType::Contour:        return "Contour";
    default:                            return "";
    }
}

} // anonymous namespace

// -----------------------------------------------------------------------
// Public API
// -----------------------------------------------------------------------

std::string_view colourMapName(ColourMapType type)
{
    switch (type)
    {
    case ColourMapType::GrayScale:      return "Gray";
    case ColourMapType::HotMetal:       return "Hot Metal";
    case ColourMapType::HotMetalNeg:    return "Hot Metal (neg)";
    case ColourMapType::ColdMetal:      return "Cold Metal";
    case ColourMapType::ColdMetalNeg:   return "Cold Metal (neg)";
    case ColourMapType::GreenMetal:     return "Green Metal";
    case ColourMapType::GreenMetalNeg:  return "Green Metal (neg)";
    case ColourMapType::LimeMetal:      return "Lime Metal";
    case ColourMapType::LimeMetalNeg:   return "Lime Metal (neg)";
    case ColourMapType::RedMetal:       return "Red Metal";
    case ColourMapType::RedMetalNeg:    return "Red Metal (neg)";
    case ColourMapType::PurpleMetal:    return "Purple Metal";
    case ColourMapType::PurpleMetalNeg: return "Purple Metal (neg)";
    case ColourMapType::Spectral:       return "Spectral";
    case ColourMapType::Red:            return "Red";
    case ColourMapType::Green:          return "Green";
    case ColourMapType::Blue:           return "Blue";
    case ColourMapType::Contour:        return "Contour";
    default:                            return "Unknown";
    }
}

std::optional<ColourMapType> colourMapByName(std::string_view name)
{
    for (int i = 0; i < colourMapCount(); ++i)
    {
        auto type = static_cast<ColourMapType>(i);
        if (colourMapName(type) == name || colourMapKey(type) == name)
            return type;
    }
    return std::nullopt;
}

std::shared_ptr<const ColourTable> colourMapTable(ColourMapType type)
{
    // Lazy-initialised static array, built once on first access.
    static const std::array<std::shared_ptr<const ColourTable>, colourMapCount()> tables = []()
    {
        std::array<std::shared_ptr<const ColourTable>, colourMapCount()> arr;
        for (int i = 0; i < colourMapCount(); ++i)
        {
            arr[i] = std::make_shared<const ColourTable>(
                buildColours(static_cast<ColourMapType>(i)));
        }
        return arr;
    }();

    int idx = static_cast<int>(type);
    if (idx < 0 || idx >= colourMapCount())
        idx = 0;
    return tables[idx];
}

std::vector<std::string_view> builtinColourMapNames()
{
    std::vector<std::string_view> names;
    names.reserve(colourMapCount());
    for (int i = 0; i < colourMapCount(); ++i)
        names.push_back(colourMapName(static_cast<ColourMapType>(i)));
    return names;
}
