#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include "AppConfig.h"
#include "ColourLegend.h"
#include "ColourMap.h"
#include "SliceCompositor.h"
#include "Volume.h"

namespace
{

/// Command-line state; unset values fall back to the merged config.
struct CliOptions
{
    std::string configPath;
    std::optional<std::string> axis;
    std::optional<int> slice;
    int time = 0;
    std::optional<double> zoom;
    std::optional<double> contrast;
    std::optional<double> brightness;
    std::optional<std::string> legendStyle;
    std::string output = "slice.png";
    std::string saveConfigPath;
    std::vector<std::string> volumeFiles;
    std::vector<std::optional<std::string>> lutPerVolume;
};

void printUsage()
{
    std::cerr << "Usage: brainblend [options] [volume1.raw ...]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>      Load config from <path>\n"
              << "  -h, --help               Show this help message\n"
              << "      --axis <x|y|z>       Slicing axis\n"
              << "      --slice <n>          Slice index (default: middle)\n"
              << "      --time <t>           Time frame\n"
              << "      --zoom <f>           Output scale factor\n"
              << "      --contrast <f>       Contrast multiplier\n"
              << "      --brightness <f>     Brightness offset\n"
              << "      --lut <name|file>    Colour map for the next volume\n"
              << "      --legend <style>     Also write a legend: linear, logp, percent, symmetric\n"
              << "  -o <file.png>            Output image (default slice.png)\n"
              << "      --save-config <path> Write the merged config to <path>\n"
              << "\nRaw volume layouts come from the \"volumes\" entries of the config.\n"
              << "Without volumes a synthetic test volume is rendered.\n"
              << "Example: brainblend -c study.json --axis y --lut \"Hot Metal\" heat.raw\n";
}

void printColourMaps()
{
    std::cerr << "Available maps:";
    for (std::string_view name : builtinColourMapNames())
        std::cerr << " \"" << name << "\"";
    std::cerr << "\n";
}

/// Resolve a colour map name or colour-map text file into a table scaled
/// to bytes.
std::shared_ptr<const ColourTable> resolveColourTable(const std::string& nameOrPath)
{
    if (auto type = colourMapByName(nameOrPath))
    {
        auto table = std::make_shared<ColourTable>(*colourMapTable(*type));
        table->config().scale = 255.0;
        return table;
    }

    if (std::filesystem::exists(nameOrPath))
    {
        ColourTableConfig config;
        config.scale = 255.0;
        return std::make_shared<ColourTable>(loadColourTableFile(nameOrPath, config));
    }

    std::cerr << "Unknown colour map: " << nameOrPath << "\n";
    printColourMaps();
    return nullptr;
}

const VolumeConfig* findVolumeConfig(const AppConfig& cfg, const std::string& path)
{
    for (const auto& vc : cfg.volumes)
    {
        if (vc.path == path)
            return &vc;
    }
    return nullptr;
}

std::shared_ptr<Volume> loadConfiguredVolume(const VolumeConfig& vc)
{
    auto vol = std::make_shared<Volume>(loadRawVolume(vc.path, rawDescription(vc)));
    vol->name = std::filesystem::path(vc.path).filename().string();
    if (vc.valueMin)
        vol->intensityMin = *vc.valueMin;
    if (vc.valueMax)
        vol->intensityMax = *vc.valueMax;
    vol->opacity = static_cast<float>(std::clamp(vc.opacity, 0.0, 1.0));
    vol->displayZIndex = vc.displayZIndex;
    vol->roles.riskHeatMap = vc.riskHeatMap;
    vol->roles.safety = vc.safety;
    vol->roles.anat = vc.anat;
    vol->roles.riskMask = vc.riskMask;
    vol->roles.riskId = vc.riskId;
    return vol;
}

std::string resolveOutputPath(const std::string& path, const GlobalConfig& global)
{
    std::filesystem::path p(path);
    if (p.is_relative() && global.outputDir && !global.outputDir->empty())
    {
        std::filesystem::path dir(*global.outputDir);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("Cannot create output directory: " +
                                     dir.string() + " (" + ec.message() + ")");
        p = dir / p;
    }
    return p.string();
}

bool writePng(const std::string& filename, const RGBAImage& image)
{
    if (image.empty())
    {
        std::cerr << "[brainblend] nothing to write for " << filename << "\n";
        return false;
    }
    int ok = stbi_write_png(filename.c_str(), image.width, image.height, 4,
                            image.data.data(), image.width * 4);
    if (!ok)
    {
        std::cerr << "[brainblend] failed to write " << filename << "\n";
        return false;
    }
    std::cout << "Saved: " << filename << " (" << image.width << "x"
              << image.height << ")\n";
    return true;
}

std::string legendFilename(const std::string& output)
{
    std::filesystem::path p(output);
    std::filesystem::path legend = p.parent_path() /
        (p.stem().string() + "_legend.png");
    return legend.string();
}

/// Legend of the top-most volume with a colour table.
bool writeLegend(const CompositeVolume& composite, LegendStyle style,
                 int width, const std::string& filename)
{
    std::shared_ptr<const Volume> top;
    for (const auto& vol : composite.volumes())
    {
        if (vol->colourTable && (!top || vol->displayZIndex >= top->displayZIndex))
            top = vol;
    }
    if (!top)
    {
        std::cerr << "[brainblend] no colour-mapped volume for the legend\n";
        return false;
    }

    double lo = top->intensityMin;
    double hi = top->intensityMax;
    if (style == LegendStyle::SymmetricPosNeg)
    {
        double a = std::fabs(lo);
        double b = std::fabs(hi);
        lo = std::min(a, b);
        hi = std::max(a, b);
    }

    LegendOptions options;
    options.width = width;
    ColourLegend legend = buildColourLegend(*top->colourTable, style, lo, hi, options);

    std::cout << "Legend labels for " << top->name << ":";
    for (const auto& label : legend.labels)
        std::cout << " " << label.text << "@" << label.x;
    std::cout << "\n";

    return writePng(filename, legend.image);
}

} // anonymous namespace

int main(int argc, char** argv)
{
    CliOptions cli;
    std::optional<std::string> pendingLut;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if ((arg == "--config" || arg == "-c") && hasValue)
                cli.configPath = argv[++i];
            else if (arg == "--help" || arg == "-h")
            {
                printUsage();
                return 0;
            }
            else if (arg == "--axis" && hasValue)
                cli.axis = argv[++i];
            else if (arg == "--slice" && hasValue)
                cli.slice = parseIntegerOption(std::string(arg), argv[++i]);
            else if (arg == "--time" && hasValue)
                cli.time = parseIntegerOption(std::string(arg), argv[++i]);
            else if (arg == "--zoom" && hasValue)
                cli.zoom = parseNumberOption(std::string(arg), argv[++i]);
            else if (arg == "--contrast" && hasValue)
                cli.contrast = parseNumberOption(std::string(arg), argv[++i]);
            else if (arg == "--brightness" && hasValue)
                cli.brightness = parseNumberOption(std::string(arg), argv[++i]);
            else if (arg == "--lut" && hasValue)
                pendingLut = argv[++i];
            else if (arg == "--legend" && hasValue)
                cli.legendStyle = argv[++i];
            else if (arg == "-o" && hasValue)
                cli.output = argv[++i];
            else if (arg == "--save-config" && hasValue)
                cli.saveConfigPath = argv[++i];
            else if (!arg.empty() && arg[0] == '-')
            {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage();
                return 1;
            }
            else
            {
                // Not an option: a volume file path
                cli.volumeFiles.push_back(std::string(arg));
                cli.lutPerVolume.push_back(pendingLut);
                pendingLut.reset();
            }
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (pendingLut.has_value())
        std::cerr << "Warning: LUT flag at end of arguments has no volume to apply to\n";

    // --- Load and merge configs ---
    AppConfig globalCfg;
    try { globalCfg = loadConfig(globalConfigPath()); }
    catch (const std::exception& e)
    {
        std::cerr << "[config] Warning: " << e.what() << "\n";
    }

    // --config takes priority, else ./config.json
    std::string localConfigPath = cli.configPath;
    if (localConfigPath.empty() && std::filesystem::exists("config.json"))
        localConfigPath = "config.json";

    AppConfig localCfg;
    if (!localConfigPath.empty())
    {
        try { localCfg = loadConfig(localConfigPath); }
        catch (const std::exception& e)
        {
            std::cerr << "[config] Warning: " << e.what() << "\n";
        }
    }

    AppConfig cfg = mergeConfigs(globalCfg, localCfg);

    // CLI filenames take priority; if none given, use config's volume list
    if (cli.volumeFiles.empty())
    {
        for (const auto& vc : cfg.volumes)
        {
            if (vc.path.empty())
                continue;
            cli.volumeFiles.push_back(vc.path);
            cli.lutPerVolume.push_back(std::nullopt);
        }
    }

    try
    {
        const SliceAxis axis = parseSliceAxis(cli.axis.value_or(cfg.global.axis));
        const double zoom = cli.zoom.value_or(cfg.global.zoom);
        const double contrast = cli.contrast.value_or(cfg.global.contrast);
        const double brightness = cli.brightness.value_or(cfg.global.brightness);

        // --- Load volumes ---
        std::vector<std::shared_ptr<const Volume>> volumes;
        for (std::size_t v = 0; v < cli.volumeFiles.size(); ++v)
        {
            const std::string& path = cli.volumeFiles[v];
            const VolumeConfig* vc = findVolumeConfig(cfg, path);
            if (!vc)
            {
                std::cerr << "[brainblend] no layout configured for " << path
                          << ", skipping\n";
                continue;
            }

            try
            {
                std::shared_ptr<Volume> vol = loadConfiguredVolume(*vc);
                std::string lut = cli.lutPerVolume[v].value_or(
                    vc->colourMap.value_or(cfg.global.defaultColourMap));
                if (vol->dataType == VolumeDataType::Float32)
                {
                    vol->colourTable = resolveColourTable(lut);
                    if (!vol->colourTable)
                        return 1;
                }
                volumes.push_back(std::move(vol));
            }
            catch (const std::exception& e)
            {
                std::cerr << "Failed to load volume: " << e.what() << "\n";
            }
        }

        if (volumes.empty())
        {
            if (!cli.volumeFiles.empty())
            {
                std::cerr << "No volumes loaded.\n";
                return 1;
            }
            auto vol = std::make_shared<Volume>();
            vol->generate_test_data();
            vol->name = "Test Data";
            vol->colourTable = resolveColourTable(cfg.global.defaultColourMap);
            if (!vol->colourTable)
                return 1;
            volumes.push_back(std::move(vol));
        }

        CompositeVolume composite(volumes);
        const int index = cli.slice.value_or(composite.sliceCount(axis) / 2);

        CompositeSlice slice = composite.slice(axis, index, cli.time);
        RGBAImage image = composite.getSliceImage(slice, zoom, contrast, brightness);

        const std::string output = resolveOutputPath(cli.output, cfg.global);
        if (!writePng(output, image))
            return 1;

        if (cli.legendStyle || cfg.global.writeLegend)
        {
            LegendStyle style = parseLegendStyle(cli.legendStyle.value_or(cfg.global.legendStyle));
            if (!writeLegend(composite, style,
                             cfg.global.legendWidth, legendFilename(output)))
                return 1;
        }

        if (!cli.saveConfigPath.empty())
        {
            saveConfig(cfg, cli.saveConfigPath);
            std::cout << "Saved config: " << cli.saveConfigPath << "\n";
        }
    }
    catch (const MissingColourMapError& e)
    {
        std::cerr << "[brainblend] " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[brainblend] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
