#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "ColourLegend.h"
#include "Volume.h"

/// Per-volume settings: the raw file layout, its display window and its
/// role in the composite.
struct VolumeConfig
{
    std::string path;                            // Raw volume file path
    std::array<int, 3> dimensions = {0, 0, 0};   // X, Y, Z voxel counts
    int frames = 1;
    std::array<double, 3> step = {1.0, 1.0, 1.0};
    std::array<double, 3> start = {0.0, 0.0, 0.0};
    std::string datatype = "float32";            // "float32" or "rgb8"
    std::optional<std::string> colourMap;        // Built-in name or table file (nullopt = global default)
    std::optional<double> valueMin;              // Display window min (nullopt = data range)
    std::optional<double> valueMax;              // Display window max (nullopt = data range)
    double opacity = 1.0;
    int displayZIndex = 0;
    bool riskHeatMap = false;
    bool safety = false;
    bool anat = false;
    bool riskMask = false;
    int riskId = 0;
};

/// Global rendering defaults.
struct GlobalConfig
{
    std::string defaultColourMap = "GrayScale";  // Colour map for volumes without one
    std::string axis = "z";                      // "x", "y" or "z"
    double zoom = 1.0;
    double contrast = 1.0;
    double brightness = 0.0;
    bool writeLegend = false;                    // Write a legend next to the slice
    std::string legendStyle = "linear";          // linear, logp, percent, symmetric
    int legendWidth = 256;
    std::optional<std::string> outputDir;        // Directory for relative output files
};

/// Top-level config structure.
struct AppConfig
{
    GlobalConfig global;
    std::vector<VolumeConfig> volumes;
};

/// Return the global config file path: $HOME/.config/brainblend/config.json
std::string globalConfigPath();

/// Load a config from a JSON file.  Returns a default AppConfig if the file
/// does not exist.  Throws std::runtime_error on parse errors.
AppConfig loadConfig(const std::string& path);

/// Save a config to a JSON file.  Creates parent directories as needed.
/// Throws std::runtime_error on I/O errors.
void saveConfig(const AppConfig& config, const std::string& path);

/// Merge a local config on top of a global config.
/// Local values override global values where they differ from the defaults.
/// Local volume entries override global volume entries matched by path;
/// unmatched local volumes are appended.
AppConfig mergeConfigs(const AppConfig& global, const AppConfig& local);

/// Raw file layout described by a volume entry.
/// Throws std::runtime_error on an unknown datatype.
RawVolumeDescription rawDescription(const VolumeConfig& volume);

/// "x", "y" or "z" (case-insensitive).  Throws std::runtime_error otherwise.
SliceAxis parseSliceAxis(const std::string& name);

/// "linear", "logp", "percent" or "symmetric".  Throws std::runtime_error
/// otherwise.
LegendStyle parseLegendStyle(const std::string& name);

/// Parse a command-line number; the whole text must be consumed.
/// Throws std::runtime_error naming the flag otherwise.
double parseNumberOption(const std::string& flag, const std::string& text);

/// Parse a command-line integer; the whole text must be consumed and the
/// value must fit an int.  Throws std::runtime_error naming the flag otherwise.
int parseIntegerOption(const std::string& flag, const std::string& text);
