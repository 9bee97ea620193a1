#include "AppConfig.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <glaze/glaze.hpp>

// ---- Glaze meta for custom JSON field names --------------------------------

template <>
struct glz::meta<VolumeConfig>
{
    using T = VolumeConfig;
    static constexpr auto value = object(
        "path",           &T::path,
        "dimensions",     &T::dimensions,
        "frames",         &T::frames,
        "step",           &T::step,
        "start",          &T::start,
        "datatype",       &T::datatype,
        "colour_map",     &T::colourMap,
        "value_min",      &T::valueMin,
        "value_max",      &T::valueMax,
        "opacity",        &T::opacity,
        "display_zindex", &T::displayZIndex,
        "risk_heat_map",  &T::riskHeatMap,
        "safety",         &T::safety,
        "anat",           &T::anat,
        "risk_mask",      &T::riskMask,
        "risk_id",        &T::riskId
    );
};

template <>
struct glz::meta<GlobalConfig>
{
    using T = GlobalConfig;
    static constexpr auto value = object(
        "default_colour_map", &T::defaultColourMap,
        "axis",               &T::axis,
        "zoom",               &T::zoom,
        "contrast",           &T::contrast,
        "brightness",         &T::brightness,
        "write_legend",       &T::writeLegend,
        "legend_style",       &T::legendStyle,
        "legend_width",       &T::legendWidth,
        "output_dir",         &T::outputDir
    );
};

template <>
struct glz::meta<AppConfig>
{
    using T = AppConfig;
    static constexpr auto value = object(
        "global",  &T::global,
        "volumes", &T::volumes
    );
};

// ---- Implementation --------------------------------------------------------

std::string globalConfigPath()
{
    // Prefer XDG_CONFIG_HOME, fall back to $HOME/.config
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path dir;
    if (xdg && xdg[0] != '\0')
    {
        dir = std::filesystem::path(xdg) / "brainblend";
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (!home || home[0] == '\0')
            throw std::runtime_error("Cannot determine home directory");
        dir = std::filesystem::path(home) / ".config" / "brainblend";
    }
    return (dir / "config.json").string();
}

AppConfig loadConfig(const std::string& path)
{
    if (!std::filesystem::exists(path))
        return {};

    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open config file: " + path);

    std::string content((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());

    AppConfig config{};
    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, content);
    if (ec)
    {
        throw std::runtime_error("Failed to parse config file: " + path +
                                 "\n" + glz::format_error(ec, content));
    }
    return config;
}

void saveConfig(const AppConfig& config, const std::string& path)
{
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("Cannot create config directory: " +
                                     dir.string() + " (" + ec.message() + ")");
    }

    std::string buffer{};
    auto ec = glz::write<glz::opts{.prettify = true}>(config, buffer);
    if (ec)
        throw std::runtime_error("Failed to serialize config to JSON");

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Cannot write config file: " + path);
    ofs << buffer;
}

AppConfig mergeConfigs(const AppConfig& global, const AppConfig& local)
{
    AppConfig merged = global;

    // Override global settings with local ones if they differ from defaults
    GlobalConfig defaultGlobal{};
    if (local.global.defaultColourMap != defaultGlobal.defaultColourMap)
        merged.global.defaultColourMap = local.global.defaultColourMap;
    if (local.global.axis != defaultGlobal.axis)
        merged.global.axis = local.global.axis;
    if (local.global.zoom != defaultGlobal.zoom)
        merged.global.zoom = local.global.zoom;
    if (local.global.contrast != defaultGlobal.contrast)
        merged.global.contrast = local.global.contrast;
    if (local.global.brightness != defaultGlobal.brightness)
        merged.global.brightness = local.global.brightness;
    if (local.global.writeLegend != defaultGlobal.writeLegend)
        merged.global.writeLegend = local.global.writeLegend;
    if (local.global.legendStyle != defaultGlobal.legendStyle)
        merged.global.legendStyle = local.global.legendStyle;
    if (local.global.legendWidth != defaultGlobal.legendWidth)
        merged.global.legendWidth = local.global.legendWidth;
    if (local.global.outputDir.has_value())
        merged.global.outputDir = local.global.outputDir;

    // Merge volumes: local volumes override global ones matched by path,
    // unmatched local volumes are appended.
    for (const auto& lv : local.volumes)
    {
        bool found = false;
        for (auto& mv : merged.volumes)
        {
            if (mv.path == lv.path)
            {
                mv = lv;
                found = true;
                break;
            }
        }
        if (!found)
            merged.volumes.push_back(lv);
    }

    return merged;
}

namespace
{

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

RawVolumeDescription rawDescription(const VolumeConfig& volume)
{
    RawVolumeDescription desc;
    desc.dimensions = glm::ivec3(volume.dimensions[0], volume.dimensions[1], volume.dimensions[2]);
    desc.frames = volume.frames;
    desc.step = glm::dvec3(volume.step[0], volume.step[1], volume.step[2]);
    desc.start = glm::dvec3(volume.start[0], volume.start[1], volume.start[2]);

    std::string type = lowercase(volume.datatype);
    if (type == "float32")
        desc.dataType = VolumeDataType::Float32;
    else if (type == "rgb8")
        desc.dataType = VolumeDataType::Rgb8;
    else
        throw std::runtime_error("Unknown datatype '" + volume.datatype +
                                 "' for volume: " + volume.path);
    return desc;
}

SliceAxis parseSliceAxis(const std::string& name)
{
    std::string a = lowercase(name);
    if (a == "x")
        return SliceAxis::X;
    if (a == "y")
        return SliceAxis::Y;
    if (a == "z")
        return SliceAxis::Z;
    throw std::runtime_error("Unknown axis: " + name);
}

LegendStyle parseLegendStyle(const std::string& name)
{
    std::string s = lowercase(name);
    if (s == "linear")
        return LegendStyle::Linear;
    if (s == "logp")
        return LegendStyle::LogP;
    if (s == "percent")
        return LegendStyle::Percent;
    if (s == "symmetric")
        return LegendStyle::SymmetricPosNeg;
    throw std::runtime_error("Unknown legend style: " + name);
}

double parseNumberOption(const std::string& flag, const std::string& text)
{
    try
    {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        if (used == text.size())
            return v;
    }
    catch (const std::logic_error&)
    {
        // Falls through to the error below.
    }
    throw std::runtime_error("Invalid value for " + flag + ": " + text);
}

int parseIntegerOption(const std::string& flag, const std::string& text)
{
    try
    {
        std::size_t used = 0;
        int v = std::stoi(text, &used);
        if (used == text.size())
            return v;
    }
    catch (const std::logic_error&)
    {
        // Falls through to the error below.
    }
    throw std::runtime_error("Invalid integer for " + flag + ": " + text);
}
