#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/// Channel count of every colour table entry (R, G, B, A).
constexpr int kChannels = 4;

/// Sentinel returned by resolveColourIndex() for values outside the window.
constexpr int kOutOfRange = -1;

/// Windows starting at kLabelAtlasMin and ending at one of kLabelAtlasMaxima
/// belong to a discrete label atlas.  For those the increment is forced to 1
/// so that each label value addresses its own table entry.
/// TODO: confirm with the atlas owners whether other label ranges need this.
constexpr double kLabelAtlasMin = 0.0;
constexpr std::array<double, 2> kLabelAtlasMaxima = {17.0, 18.0};

/// Largest label accepted on a sparse colour-map line.  Lines with a larger
/// label are skipped.
constexpr long kMaxSparseLabel = 65535;

/// Smallest window span used when max == min.
constexpr double kMinWindowSpan = 1e-12;

/// Scalar display settings carried by a colour table.  Each of them can be
/// overridden per mapping call without touching the table itself.
struct ColourTableConfig
{
    bool clamp = true;         // saturate out-of-window values to the ends
    bool flip = false;         // traverse the palette in reverse
    double scale = 1.0;        // output scale, usually 1 or 255
    double contrast = 1.0;
    double brightness = 0.0;
    int margin = 0;            // legend padding in pixels
};

/// Flat RGBA palette.  Entry e occupies colours()[4e .. 4e+3].
///
/// Tables parsed from sparse text may contain holes: entries that no line
/// wrote.  Holes read as zero in colours() and report false from isDefined().
class ColourTable
{
public:
    ColourTable() = default;

    /// Build a dense table; colours.size() must be a multiple of 4.
    /// @throws std::invalid_argument otherwise.
    explicit ColourTable(std::vector<float> colours, ColourTableConfig config = {});

    /// Parse the whitespace-separated text format:
    ///   "R G B [A]"      dense entry appended after the previous one
    ///   "L R G B A"      sparse entry placed at entry L
    /// Lines with fewer than three fields are skipped.  Only the first five
    /// fields of a line are read.
    static ColourTable parse(std::string_view text, ColourTableConfig config = {});

    const std::vector<float>& colours() const { return colours_; }
    const std::vector<bool>& definedMask() const { return defined_; }

    std::size_t entryCount() const { return defined_.size(); }
    bool empty() const { return defined_.empty(); }
    bool isDefined(std::size_t entry) const;

    /// RGBA of one entry; holes and out-of-range entries read as zero.
    std::array<float, 4> entry(std::size_t index) const;

    /// Copy without the run of leading entries equal to `colour`.
    ColourTable trimLeading(const std::array<float, 4>& colour) const;

    /// Copy without any entry equal to `colour`.  Holes are kept.
    ColourTable without(const std::array<float, 4>& colour) const;

    const ColourTableConfig& config() const { return config_; }
    ColourTableConfig& config() { return config_; }

private:
    void store(std::size_t entry, const float* rgba);
    bool entryEquals(std::size_t entry, const std::array<float, 4>& colour) const;
    ColourTable copyEntries(std::size_t first, const std::array<float, 4>* skip) const;

    std::vector<float> colours_;
    std::vector<bool> defined_;
    ColourTableConfig config_;
};

/// True when [min, max] is one of the discrete label atlas windows.
bool isLabelAtlasWindow(double min, double max);

/// Table entries per unit of intensity for the window [min, max].
/// Degenerate windows use kMinWindowSpan; label atlas windows return 1.
double colourIncrement(double min, double max, std::size_t length);

/// Map one value to the channel offset of its table entry (entry * 4), or
/// kOutOfRange when the value lies outside [min, max] and clamp is off.
int resolveColourIndex(double value, double min, double max, double increment,
                       bool clamp, bool flip, std::size_t length);

/// Read a colour table text file.
/// @throws std::runtime_error if the file cannot be read.
ColourTable loadColourTableFile(const std::string& path, ColourTableConfig config = {});
