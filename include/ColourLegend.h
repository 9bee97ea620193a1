#pragma once

#include <array>
#include <functional>
#include <string>
#include <vector>

#include "ColourTable.h"
#include "RGBAImage.h"

/// Legend geometry, in pixels.
constexpr int kLegendGradientHeight = 20;
constexpr int kLegendHeight = 40;
constexpr int kLegendTickTop = 20;
constexpr int kLegendTickHeight = 10;
constexpr int kLegendSamples = 256;
constexpr double kLegendLabelBaseline = 40.0;

/// Tick and label colours.
constexpr std::array<uint8_t, 3> kLegendTickColour = {0xBF, 0xBF, 0xBF};
constexpr std::array<uint8_t, 3> kLegendTextColour = {0x59, 0x59, 0x59};

enum class LegendStyle
{
    Linear,           ///< min..max, 3 significant digits shown with 2 decimals
    LogP,             ///< min..max, rounded to 4 decimals
    Percent,          ///< min..max as whole percentages
    SymmetricPosNeg   ///< -outer .. -inner .. 0 .. inner .. outer
};

/// A text label for the UI layer to paint.  (x, y) is the left end of the
/// baseline.
struct LegendLabel
{
    std::string text;
    double x = 0.0;
    double y = kLegendLabelBaseline;
};

struct ColourLegend
{
    RGBAImage image;                 ///< gradient strip and tick marks
    std::array<double, 5> ticks{};   ///< tick x positions, left to right
    std::vector<LegendLabel> labels; ///< five labels, left to right
};

/// Returns the advance width of a string in pixels.
using TextMeasure = std::function<double(const std::string&)>;

struct LegendOptions
{
    /// Width of the gradient area; the image is width + 2 * margin wide.
    int width = kLegendSamples;

    /// LogP only: also hide opaque black (the masked background of
    /// volumetric heat maps) from the gradient.
    bool volumetric = false;

    /// Defaults to approximate 12px Arial advance widths.
    TextMeasure measureText;
};

/// Build a legend for a colour table.
///
/// For Linear, LogP and Percent, `min` and `max` are the value range shown.
/// For SymmetricPosNeg, `min` is the inner magnitude and `max` the outer
/// magnitude of a range mirrored around zero; the inner ticks sit at
/// width/2 -/+ 0.5 * width * (min / max).
///
/// The table is sampled with the intensities 0..255 at scale 255; the
/// table's own scale is not modified.
ColourLegend buildColourLegend(const ColourTable& table, LegendStyle style,
                               double min, double max,
                               const LegendOptions& options = {});

/// Label formatting, exposed for testing.
std::string formatLinearLabel(double value);
std::string formatPercentLabel(double value);
std::string formatLogPLabel(double value);
std::string formatSymmetricLabel(double value);

/// Approximate advance width of `text` in 12px Arial.
double estimateTextWidth(const std::string& text);
