#include "ColourTable.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace
{

/// Split a line on runs of whitespace, keeping at most maxFields tokens.
std::vector<std::string> splitFields(const std::string& line, std::size_t maxFields)
{
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string tok;
    while (fields.size() < maxFields && iss >> tok)
        fields.push_back(tok);
    return fields;
}

/// Leading-number parse: "0.5abc" -> 0.5, garbage -> NaN.
float parseChannel(const std::string& s)
{
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin)
        return std::numeric_limits<float>::quiet_NaN();
    return static_cast<float>(v);
}

} // anonymous namespace

// -----------------------------------------------------------------------
// ColourTable
// -----------------------------------------------------------------------

ColourTable::ColourTable(std::vector<float> colours, ColourTableConfig config)
    : colours_(std::move(colours)), config_(config)
{
    if (colours_.size() % kChannels != 0)
        throw std::invalid_argument("Colour table size must be a multiple of 4");
    defined_.assign(colours_.size() / kChannels, true);
}

ColourTable ColourTable::parse(std::string_view text, ColourTableConfig config)
{
    ColourTable table;
    table.config_ = config;

    std::istringstream in{std::string(text)};
    std::string line;
    std::size_t next = 0;  // entry written by the next dense line

    while (std::getline(in, line))
    {
        std::vector<std::string> fields = splitFields(line, 5);
        if (fields.size() < 3)
            continue;

        float rgba[4] = {0.0f, 0.0f, 0.0f, 1.0f};

        if (fields.size() == 5)
        {
            // Sparse entry: the label selects the slot, the rest is RGBA.
            char* end = nullptr;
            long label = std::strtol(fields[0].c_str(), &end, 10);
            if (end == fields[0].c_str() || label < 0)
                continue;
            if (label > kMaxSparseLabel)
            {
                std::cerr << "[colour] Skipping colour-map label " << fields[0]
                          << " (largest supported label is " << kMaxSparseLabel << ")\n";
                continue;
            }
            next = static_cast<std::size_t>(label);
            for (int c = 0; c < 4; ++c)
                rgba[c] = parseChannel(fields[c + 1]);
        }
        else
        {
            for (std::size_t c = 0; c < fields.size(); ++c)
                rgba[c] = parseChannel(fields[c]);
        }

        table.store(next, rgba);
        ++next;
    }

    return table;
}

void ColourTable::store(std::size_t entry, const float* rgba)
{
    if (entry >= defined_.size())
    {
        defined_.resize(entry + 1, false);
        colours_.resize((entry + 1) * kChannels, 0.0f);
    }
    std::copy(rgba, rgba + kChannels, colours_.begin() + entry * kChannels);
    defined_[entry] = true;
}

bool ColourTable::isDefined(std::size_t entry) const
{
    return entry < defined_.size() && defined_[entry];
}

std::array<float, 4> ColourTable::entry(std::size_t index) const
{
    if (!isDefined(index))
        return {0.0f, 0.0f, 0.0f, 0.0f};
    const float* p = colours_.data() + index * kChannels;
    return {p[0], p[1], p[2], p[3]};
}

bool ColourTable::entryEquals(std::size_t index, const std::array<float, 4>& colour) const
{
    if (!isDefined(index))
        return false;
    const float* p = colours_.data() + index * kChannels;
    return p[0] == colour[0] && p[1] == colour[1] &&
           p[2] == colour[2] && p[3] == colour[3];
}

ColourTable ColourTable::copyEntries(std::size_t first, const std::array<float, 4>* skip) const
{
    ColourTable out;
    out.config_ = config_;
    for (std::size_t e = first; e < entryCount(); ++e)
    {
        if (skip && entryEquals(e, *skip))
            continue;
        out.defined_.push_back(defined_[e]);
        out.colours_.insert(out.colours_.end(),
                            colours_.begin() + e * kChannels,
                            colours_.begin() + (e + 1) * kChannels);
    }
    return out;
}

ColourTable ColourTable::trimLeading(const std::array<float, 4>& colour) const
{
    std::size_t first = 0;
    while (first < entryCount() && entryEquals(first, colour))
        ++first;
    return copyEntries(first, nullptr);
}

ColourTable ColourTable::without(const std::array<float, 4>& colour) const
{
    return copyEntries(0, &colour);
}

// -----------------------------------------------------------------------
// Index resolution
// -----------------------------------------------------------------------

bool isLabelAtlasWindow(double min, double max)
{
    if (min != kLabelAtlasMin)
        return false;
    return std::find(kLabelAtlasMaxima.begin(), kLabelAtlasMaxima.end(), max) !=
           kLabelAtlasMaxima.end();
}

double colourIncrement(double min, double max, std::size_t length)
{
    if (isLabelAtlasWindow(min, max))
        return 1.0;
    double span = max - min;
    if (span < kMinWindowSpan)
        span = kMinWindowSpan;
    return static_cast<double>(length) / span;
}

int resolveColourIndex(double value, double min, double max, double increment,
                       bool clamp, bool flip, std::size_t length)
{
    if (length == 0)
        return kOutOfRange;
    // NaN intensities have no colour.
    if (std::isnan(value))
        return kOutOfRange;
    if ((value < min || value > max) && !clamp)
        return kOutOfRange;

    double last = static_cast<double>(length - 1);
    double pos = std::max(0.0, std::min((value - min) * increment, last));
    int index = static_cast<int>(std::floor(pos));
    if (flip)
        index = static_cast<int>(length) - 1 - index;

    return index * kChannels;
}

ColourTable loadColourTableFile(const std::string& path, ColourTableConfig config)
{
    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open colour map file: " + path);

    std::string content((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw std::runtime_error("Error reading colour map file: " + path);

    ColourTable table = ColourTable::parse(content, config);
    if (table.empty())
        std::cerr << "[colour] " << path << " contains no colour entries\n";
    return table;
}
