#include "ColourLegend.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "IntensityMapper.h"

namespace
{

const std::array<float, 4> kWhite = {1.0f, 1.0f, 1.0f, 1.0f};
const std::array<float, 4> kOpaqueBlack = {0.0f, 0.0f, 0.0f, 1.0f};

/// Round to `p` significant digits.
double roundSignificant(double v, int p)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*g", p, v);
    return std::strtod(buf, nullptr);
}

/// Fixed-point text with `digits` decimals; exact ties round away from zero.
std::string toFixed(double v, int digits)
{
    if (std::isnan(v))
        return "NaN";
    bool negative = v < 0.0;
    double a = std::fabs(v);
    double scaled = a * std::pow(10.0, digits);
    if (scaled - std::floor(scaled) == 0.5)
        a = (std::floor(scaled) + 1.0) / std::pow(10.0, digits);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, a);
    std::string s(buf);
    bool allZero = s.find_first_not_of("0.") == std::string::npos;
    if (negative && !allZero)
        s.insert(s.begin(), '-');
    return s;
}

/// Shortest decimal text that reads back as `v`, without exponent for
/// ordinary magnitudes.
std::string shortestNumber(double v)
{
    if (std::isnan(v))
        return "NaN";
    if (v == 0.0)
        return "0";

    char buf[64];
    for (int p = 1; p <= 17; ++p)
    {
        std::snprintf(buf, sizeof(buf), "%.*g", p, v);
        if (std::strtod(buf, nullptr) != v)
            continue;

        double a = std::fabs(v);
        if (a < 1e-6 || a >= 1e21)
            return buf;
        int exponent = static_cast<int>(std::floor(std::log10(a)));
        int decimals = std::max(0, p - 1 - exponent);
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

/// `p` significant digits; exponent form ("1.235e+4") when the exponent is
/// below -6 or at least `p`.
std::string toPrecision(double v, int p)
{
    if (std::isnan(v))
        return "NaN";
    if (v == 0.0)
        return toFixed(0.0, p - 1);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*e", p - 1, v);
    std::string sci(buf);
    std::size_t ePos = sci.find('e');
    int exponent = std::atoi(sci.c_str() + ePos + 1);

    if (exponent < -6 || exponent >= p)
    {
        std::string mantissa = sci.substr(0, ePos);
        return mantissa + "e" + (exponent < 0 ? "-" : "+") + std::to_string(std::abs(exponent));
    }
    std::snprintf(buf, sizeof(buf), "%.*f", p - 1 - exponent, v);
    return buf;
}

void fillColumn(RGBAImage& img, int x, int y0, int h, const std::array<uint8_t, 3>& rgb)
{
    if (x < 0 || x >= img.width)
        return;
    for (int y = std::max(y0, 0); y < std::min(y0 + h, img.height); ++y)
    {
        uint8_t* p = img.pixel(x, y);
        p[0] = rgb[0];
        p[1] = rgb[1];
        p[2] = rgb[2];
        p[3] = 255;
    }
}

void fillRow(RGBAImage& img, int y, const std::array<uint8_t, 3>& rgb)
{
    for (int x = 0; x < img.width; ++x)
        fillColumn(img, x, y, 1, rgb);
}

uint8_t gradientChannel(float v)
{
    if (std::isnan(v) || v <= 0.0f)
        return 0;
    if (v >= 255.0f)
        return 255;
    return static_cast<uint8_t>(std::floor(v));
}

/// Paint the 256-sample gradient strip.  With `cutWhite`, leading white
/// entries are trimmed from the table and any pure white column repeats
/// the previous column's colour.
void paintGradient(RGBAImage& img, const ColourTable& table, int margin,
                   bool cutWhite, const std::array<float, 4>* hiddenColour)
{
    std::vector<float> ramp(kLegendSamples);
    for (int i = 0; i < kLegendSamples; ++i)
        ramp[i] = static_cast<float>(i);

    MappingOptions opts;
    opts.scale = 255.0;

    ColourFilter filter;
    if (cutWhite)
    {
        filter = [hiddenColour](const ColourTable& t)
        {
            ColourTable trimmed = t.trimLeading(kWhite);
            return hiddenColour ? trimmed.without(*hiddenColour) : trimmed;
        };
    }

    std::vector<float> colours;
    if (!mapColours(table, ramp, opts, colours, filter))
        return;

    std::array<uint8_t, 3> previous = {255, 255, 255};
    for (int i = 0; i < kLegendSamples; ++i)
    {
        std::array<uint8_t, 3> rgb = {gradientChannel(colours[i * 4]),
                                      gradientChannel(colours[i * 4 + 1]),
                                      gradientChannel(colours[i * 4 + 2])};
        bool white = rgb[0] == 255 && rgb[1] == 255 && rgb[2] == 255;
        if (cutWhite && white)
            rgb = previous;
        else
            previous = rgb;

        fillColumn(img, i + margin, 0, kLegendGradientHeight, rgb);
    }
}

void paintTicks(ColourLegend& legend)
{
    for (double x : legend.ticks)
    {
        fillColumn(legend.image, static_cast<int>(std::floor(x)),
                   kLegendTickTop, kLegendTickHeight, kLegendTickColour);
    }
}

/// Five labels at the quarter positions of a linear value range.
/// The linear legend right-aligns its max label using the width of the
/// three-quarter label; the other quarter styles use the max label itself.
void layoutQuarterLabels(ColourLegend& legend, double min, double max,
                         const std::function<std::string(double)>& format,
                         const TextMeasure& measure, bool alignMaxOnThreeQuarter)
{
    double w = legend.image.width;
    double range = max - min;
    const double fractions[5] = {0.0, 0.25, 0.5, 0.75, 1.0};

    std::string texts[5];
    for (int i = 0; i < 5; ++i)
        texts[i] = format((i == 4) ? max : min + fractions[i] * range);

    for (int i = 0; i < 5; ++i)
    {
        double x;
        if (i == 0)
            x = 0.0;
        else if (i == 4)
            x = w - measure(alignMaxOnThreeQuarter ? texts[3] : texts[4]);
        else
            x = fractions[i] * w - measure(texts[i]) / 2.0;
        legend.labels.push_back({texts[i], x, kLegendLabelBaseline});
    }
}

void layoutSymmetric(ColourLegend& legend, double inner, double outer,
                     const TextMeasure& measure)
{
    double w = legend.image.width;
    double sub = (outer != 0.0) ? 0.5 * w * (inner / outer) : 0.0;
    if (!std::isfinite(sub))
        sub = 0.0;

    legend.ticks = {0.0,
                    std::floor(w / 2.0 - sub),
                    w / 2.0,
                    std::floor(w / 2.0 + sub),
                    w - 1.0};

    // Frame lines above and below the gradient.
    fillRow(legend.image, 0, kLegendTickColour);
    fillRow(legend.image, kLegendGradientHeight + 1, kLegendTickColour);

    std::string outerText = formatSymmetricLabel(outer);
    std::string innerText = formatSymmetricLabel(inner);

    std::string minusOuter = "-" + outerText;
    double minusOuterRight = measure(minusOuter);

    std::string middle = "0";
    double middleLeft = 0.5 * w - measure(middle) / 2.0;
    double middleRight = middleLeft + measure(middle);

    double plusOuterLeft = w - measure(outerText);

    std::string minusInner = "-" + innerText;
    double minusInnerWidth = measure(minusInner);
    double minusInnerLeft = 0.5 * w - sub - minusInnerWidth / 2.0;
    if (minusInnerLeft < minusOuterRight)
        minusInnerLeft = minusOuterRight + 2.0;
    if (minusInnerLeft + minusInnerWidth > middleLeft)
        minusInnerLeft = middleLeft - minusInnerWidth - 2.0;

    double plusInnerWidth = measure(innerText);
    double plusInnerLeft = 0.5 * w + sub - plusInnerWidth / 2.0;
    if (plusInnerLeft < middleRight)
        plusInnerLeft = middleRight + 2.0;
    if (plusInnerLeft + plusInnerWidth > plusOuterLeft)
        plusInnerLeft = plusOuterLeft - plusInnerWidth - 2.0;

    legend.labels = {
        {minusOuter, 0.0, kLegendLabelBaseline},
        {minusInner, minusInnerLeft, kLegendLabelBaseline},
        {middle, middleLeft, kLegendLabelBaseline},
        {innerText, plusInnerLeft, kLegendLabelBaseline},
        {outerText, plusOuterLeft, kLegendLabelBaseline},
    };
}

} // anonymous namespace

// -----------------------------------------------------------------------
// Label formatting
// -----------------------------------------------------------------------

std::string formatLinearLabel(double value)
{
    return toFixed(roundSignificant(value, 3), 2);
}

std::string formatPercentLabel(double value)
{
    return toFixed(roundSignificant(value * 100.0, 3), 0) + "%";
}

std::string formatLogPLabel(double value)
{
    if (value == 0.0)
        return "0";
    double rounded = std::strtod(toFixed(value, 4).c_str(), nullptr);
    return shortestNumber(rounded);
}

std::string formatSymmetricLabel(double value)
{
    if (std::isnan(value))
        value = 0.0;
    std::string s = shortestNumber(value);
    if (s.size() <= 4)
        return s;
    return toPrecision(value, 4);
}

double estimateTextWidth(const std::string& text)
{
    // Arial advance widths in em, at 12px.
    double em = 0.0;
    for (char c : text)
    {
        switch (c)
        {
        case '.': em += 0.278; break;
        case '-': em += 0.333; break;
        case '+': em += 0.584; break;
        case '%': em += 0.889; break;
        default:  em += 0.556; break;
        }
    }
    return em * 12.0;
}

// -----------------------------------------------------------------------
// Legend construction
// -----------------------------------------------------------------------

ColourLegend buildColourLegend(const ColourTable& table, LegendStyle style,
                               double min, double max,
                               const LegendOptions& options)
{
    const int margin = table.config().margin;
    const int gradientWidth = options.width > 0 ? options.width : kLegendSamples;
    const TextMeasure measure = options.measureText ? options.measureText
                                                    : TextMeasure(estimateTextWidth);

    ColourLegend legend;
    legend.image = RGBAImage(gradientWidth + 2 * margin, kLegendHeight);

    const bool cutWhite = (style == LegendStyle::LogP);
    const std::array<float, 4>* hidden =
        (cutWhite && options.volumetric) ? &kOpaqueBlack : nullptr;
    paintGradient(legend.image, table, margin, cutWhite, hidden);

    if (style == LegendStyle::SymmetricPosNeg)
    {
        layoutSymmetric(legend, min, max, measure);
        paintTicks(legend);
        return legend;
    }

    double w = legend.image.width;
    legend.ticks = {0.5 + margin, w / 4.0, w / 2.0, 3.0 * w / 4.0, w - 0.5 - margin};
    paintTicks(legend);

    switch (style)
    {
    case LegendStyle::LogP:
        layoutQuarterLabels(legend, min, max, formatLogPLabel, measure, false);
        break;
    case LegendStyle::Percent:
        layoutQuarterLabels(legend, min, max, formatPercentLabel, measure, false);
        break;
    default:
        layoutQuarterLabels(legend, min, max, formatLinearLabel, measure, true);
        break;
    }
    return legend;
}
