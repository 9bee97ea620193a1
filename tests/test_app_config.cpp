// test_app_config.cpp: AppConfig JSON serialization, merging and the
// string-to-enum helpers used by the command line.

#include "AppConfig.h"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

static bool approxEq(double a, double b, double tol = 1e-9)
{
    return std::fabs(a - b) < tol;
}

/// RAII helper to create a temp file and remove it on destruction.
struct TmpFile
{
    std::string path;

    TmpFile(const std::string& name)
        : path((std::filesystem::temp_directory_path() / name).string())
    {}

    TmpFile(const std::string& name, const std::string& content)
        : path((std::filesystem::temp_directory_path() / name).string())
    {
        std::ofstream ofs(path, std::ios::trunc);
        ofs << content;
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// ---------------------------------------------------------------------------
// Test 1: Missing file returns default AppConfig
// ---------------------------------------------------------------------------
static void testMissingFileReturnsDefault()
{
    std::cout << "  testMissingFileReturnsDefault...";

    AppConfig cfg = loadConfig("/nonexistent/path/config_that_does_not_exist.json");

    CHECK(cfg.volumes.empty(), "default config should have no volumes");
    CHECK(cfg.global.defaultColourMap == "GrayScale", "default colour map should be GrayScale");
    CHECK(cfg.global.axis == "z", "default axis should be z");
    CHECK(approxEq(cfg.global.zoom, 1.0), "default zoom should be 1");
    CHECK(approxEq(cfg.global.contrast, 1.0), "default contrast should be 1");
    CHECK(approxEq(cfg.global.brightness, 0.0), "default brightness should be 0");
    CHECK(!cfg.global.writeLegend, "legend should be off by default");
    CHECK(cfg.global.legendStyle == "linear", "default legend style should be linear");
    CHECK(cfg.global.legendWidth == 256, "default legend width should be 256");
    CHECK(!cfg.global.outputDir.has_value(), "default outputDir should be nullopt");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 2: Full round-trip with all fields populated
// ---------------------------------------------------------------------------
static void testSaveAndReloadRoundTrip()
{
    std::cout << "  testSaveAndReloadRoundTrip...";
    TmpFile tmp("test_brainblend_cfg_rt.json");

    AppConfig original;
    original.global.defaultColourMap = "HotMetal";
    original.global.axis = "x";
    original.global.zoom = 2.5;
    original.global.contrast = 1.5;
    original.global.brightness = -0.25;
    original.global.writeLegend = true;
    original.global.legendStyle = "symmetric";
    original.global.legendWidth = 300;
    original.global.outputDir = "/tmp/out";

    VolumeConfig anat;
    anat.path = "/data/t1.raw";
    anat.dimensions = {181, 217, 181};
    anat.step = {1.0, 1.0, 1.0};
    anat.start = {-90.0, -126.0, -72.0};
    anat.valueMin = -10.5;
    anat.valueMax = 200.3;
    anat.anat = true;

    VolumeConfig heat;
    heat.path = "/data/risk.raw";
    heat.dimensions = {91, 109, 91};
    heat.frames = 3;
    heat.step = {2.0, 2.0, 2.0};
    heat.colourMap = "Spectral";
    heat.opacity = 0.4;
    heat.displayZIndex = 2;
    heat.riskHeatMap = true;
    heat.safety = true;
    heat.riskId = 7;

    VolumeConfig rgb;
    rgb.path = "/data/labels.rgba";
    rgb.datatype = "rgb8";
    rgb.riskMask = true;

    original.volumes = {anat, heat, rgb};

    saveConfig(original, tmp.path);
    AppConfig loaded = loadConfig(tmp.path);

    CHECK(loaded.global.defaultColourMap == "HotMetal", "global.defaultColourMap");
    CHECK(loaded.global.axis == "x", "global.axis");
    CHECK(approxEq(loaded.global.zoom, 2.5), "global.zoom");
    CHECK(approxEq(loaded.global.contrast, 1.5), "global.contrast");
    CHECK(approxEq(loaded.global.brightness, -0.25), "global.brightness");
    CHECK(loaded.global.writeLegend, "global.writeLegend");
    CHECK(loaded.global.legendStyle == "symmetric", "global.legendStyle");
    CHECK(loaded.global.legendWidth == 300, "global.legendWidth");
    CHECK(loaded.global.outputDir == std::optional<std::string>("/tmp/out"), "global.outputDir");

    CHECK(loaded.volumes.size() == 3, "should have 3 volumes");

    const auto& la = loaded.volumes[0];
    CHECK(la.path == "/data/t1.raw", "anat.path");
    CHECK(la.dimensions[0] == 181 && la.dimensions[1] == 217 && la.dimensions[2] == 181,
          "anat.dimensions");
    CHECK(approxEq(la.start[0], -90.0) && approxEq(la.start[1], -126.0) &&
          approxEq(la.start[2], -72.0), "anat.start");
    CHECK(la.valueMin.has_value() && approxEq(*la.valueMin, -10.5), "anat.valueMin");
    CHECK(la.valueMax.has_value() && approxEq(*la.valueMax, 200.3), "anat.valueMax");
    CHECK(!la.colourMap.has_value(), "anat.colourMap should remain nullopt");
    CHECK(la.anat && !la.riskHeatMap && !la.riskMask, "anat roles");

    const auto& lh = loaded.volumes[1];
    CHECK(lh.frames == 3, "heat.frames");
    CHECK(approxEq(lh.step[0], 2.0) && approxEq(lh.step[2], 2.0), "heat.step");
    CHECK(lh.colourMap == std::optional<std::string>("Spectral"), "heat.colourMap");
    CHECK(approxEq(lh.opacity, 0.4), "heat.opacity");
    CHECK(lh.displayZIndex == 2, "heat.displayZIndex");
    CHECK(lh.riskHeatMap && lh.safety && lh.riskId == 7, "heat roles");
    CHECK(!lh.valueMin.has_value() && !lh.valueMax.has_value(), "heat window should remain nullopt");

    const auto& lr = loaded.volumes[2];
    CHECK(lr.datatype == "rgb8", "rgb.datatype");
    CHECK(lr.riskMask, "rgb.riskMask");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 3: Keys use snake_case and unknown keys are ignored
// ---------------------------------------------------------------------------
static void testJsonKeys()
{
    std::cout << "  testJsonKeys...";

    TmpFile tmp("test_brainblend_cfg_keys.json", R"({
        "global": {"default_colour_map": "Blue", "write_legend": true, "legend_style": "logp",
                   "window_width": 1024},
        "volumes": [{"path": "a.raw", "dimensions": [4, 5, 6], "display_zindex": 3,
                     "risk_heat_map": true, "risk_id": 2, "colour_map": "Red",
                     "value_min": 1.0, "unused": "ignored"}]
    })");

    AppConfig cfg = loadConfig(tmp.path);
    CHECK(cfg.global.defaultColourMap == "Blue", "default_colour_map");
    CHECK(cfg.global.writeLegend, "write_legend");
    CHECK(cfg.global.legendStyle == "logp", "legend_style");
    CHECK(cfg.volumes.size() == 1, "one volume");
    const auto& v = cfg.volumes[0];
    CHECK(v.dimensions[0] == 4 && v.dimensions[1] == 5 && v.dimensions[2] == 6, "dimensions");
    CHECK(v.displayZIndex == 3, "display_zindex");
    CHECK(v.riskHeatMap && v.riskId == 2, "risk keys");
    CHECK(v.colourMap == std::optional<std::string>("Red"), "colour_map");
    CHECK(v.valueMin.has_value() && approxEq(*v.valueMin, 1.0), "value_min");
    CHECK(approxEq(v.opacity, 1.0) && v.datatype == "float32", "missing keys keep defaults");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 4: Merge local config over global config
// ---------------------------------------------------------------------------
static void testMergeConfigs()
{
    std::cout << "  testMergeConfigs...";

    AppConfig global;
    global.global.defaultColourMap = "HotMetal";
    global.global.zoom = 3.0;
    global.global.outputDir = "/global/out";
    VolumeConfig g1;
    g1.path = "/data/a.raw";
    g1.opacity = 0.3;
    VolumeConfig g2;
    g2.path = "/data/b.raw";
    global.volumes = {g1, g2};

    AppConfig local;
    local.global.axis = "y";
    local.global.contrast = 2.0;
    VolumeConfig l1;
    l1.path = "/data/a.raw";
    l1.opacity = 0.9;
    VolumeConfig l3;
    l3.path = "/data/c.raw";
    local.volumes = {l1, l3};

    AppConfig merged = mergeConfigs(global, local);
    CHECK(merged.global.defaultColourMap == "HotMetal", "default-valued local should keep global");
    CHECK(approxEq(merged.global.zoom, 3.0), "global zoom should survive");
    CHECK(merged.global.axis == "y", "local axis should override");
    CHECK(approxEq(merged.global.contrast, 2.0), "local contrast should override");
    CHECK(merged.global.outputDir == std::optional<std::string>("/global/out"),
          "unset local outputDir should keep global");

    CHECK(merged.volumes.size() == 3, "matched volume replaced, unmatched appended");
    CHECK(merged.volumes[0].path == "/data/a.raw" && approxEq(merged.volumes[0].opacity, 0.9),
          "local volume should replace the global entry in place");
    CHECK(merged.volumes[1].path == "/data/b.raw", "unmatched global volume kept");
    CHECK(merged.volumes[2].path == "/data/c.raw", "unmatched local volume appended");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 5: Malformed JSON throws
// ---------------------------------------------------------------------------
static void testMalformedJsonThrows()
{
    std::cout << "  testMalformedJsonThrows...";

    TmpFile tmp("test_brainblend_cfg_bad.json", "{ this is not valid json !!!");

    bool caught = false;
    try
    {
        loadConfig(tmp.path);
    }
    catch (const std::runtime_error&)
    {
        caught = true;
    }
    CHECK(caught, "loadConfig should throw std::runtime_error on malformed JSON");

    TmpFile bad("test_brainblend_cfg_badstruct.json",
                R"({"global": 42, "volumes": "not_an_array"})");
    caught = false;
    try
    {
        loadConfig(bad.path);
    }
    catch (const std::runtime_error&)
    {
        caught = true;
    }
    CHECK(caught, "loadConfig should throw std::runtime_error on invalid structure");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 6: saveConfig creates parent directories
// ---------------------------------------------------------------------------
static void testSaveCreatesParentDir()
{
    std::cout << "  testSaveCreatesParentDir...";

    auto root = std::filesystem::temp_directory_path() / "test_brainblend_cfg_sub";
    std::string nested = (root / "deep" / "config.json").string();
    std::filesystem::remove_all(root);

    AppConfig cfg;
    cfg.global.defaultColourMap = "Blue";

    saveConfig(cfg, nested);
    CHECK(std::filesystem::exists(nested), "config file should exist in nested dir");

    AppConfig loaded = loadConfig(nested);
    CHECK(loaded.global.defaultColourMap == "Blue", "nested config should round-trip");

    std::filesystem::remove_all(root);

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 7: Raw layout and enum parsing
// ---------------------------------------------------------------------------
static void testRawDescriptionAndParsers()
{
    std::cout << "  testRawDescriptionAndParsers...";

    VolumeConfig v;
    v.path = "/data/x.raw";
    v.dimensions = {10, 20, 30};
    v.frames = 2;
    v.step = {0.5, 1.0, 2.0};
    v.start = {-5.0, 0.0, 5.0};
    v.datatype = "Float32";

    RawVolumeDescription desc = rawDescription(v);
    CHECK(desc.dimensions == glm::ivec3(10, 20, 30), "dimensions copied");
    CHECK(desc.frames == 2, "frames copied");
    CHECK(approxEq(desc.step.x, 0.5) && approxEq(desc.step.z, 2.0), "step copied");
    CHECK(approxEq(desc.start.x, -5.0) && approxEq(desc.start.z, 5.0), "start copied");
    CHECK(desc.dataType == VolumeDataType::Float32, "datatype should be case-insensitive");

    v.datatype = "RGB8";
    CHECK(rawDescription(v).dataType == VolumeDataType::Rgb8, "rgb8 datatype");

    v.datatype = "int16";
    bool threw = false;
    try { rawDescription(v); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "unknown datatype should throw");

    CHECK(parseSliceAxis("x") == SliceAxis::X && parseSliceAxis("Y") == SliceAxis::Y &&
          parseSliceAxis("z") == SliceAxis::Z, "axis names");
    threw = false;
    try { parseSliceAxis("w"); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "unknown axis should throw");

    CHECK(parseLegendStyle("linear") == LegendStyle::Linear &&
          parseLegendStyle("LogP") == LegendStyle::LogP &&
          parseLegendStyle("percent") == LegendStyle::Percent &&
          parseLegendStyle("symmetric") == LegendStyle::SymmetricPosNeg, "legend style names");
    threw = false;
    try { parseLegendStyle("radial"); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "unknown legend style should throw");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 8: Command-line number parsing
// ---------------------------------------------------------------------------
static bool optionThrows(bool integer, const std::string& text)
{
    try
    {
        if (integer)
            parseIntegerOption("--slice", text);
        else
            parseNumberOption("--zoom", text);
    }
    catch (const std::runtime_error&)
    {
        return true;
    }
    return false;
}

static void testNumberOptions()
{
    std::cout << "  testNumberOptions...";

    CHECK(parseIntegerOption("--slice", "42") == 42, "plain integer");
    CHECK(parseIntegerOption("--time", "-3") == -3, "negative integer");
    CHECK(optionThrows(true, "2.5"), "fractional slice should be rejected, not truncated");
    CHECK(optionThrows(true, "1e20"), "out-of-range slice should be rejected");
    CHECK(optionThrows(true, "99999999999"), "integer past int range should be rejected");
    CHECK(optionThrows(true, "7x"), "trailing characters should be rejected");
    CHECK(optionThrows(true, ""), "empty integer should be rejected");

    CHECK(approxEq(parseNumberOption("--zoom", "2.5"), 2.5), "plain number");
    CHECK(approxEq(parseNumberOption("--brightness", "-0.25"), -0.25), "negative number");
    CHECK(optionThrows(false, "fast"), "non-numeric zoom should be rejected");
    CHECK(optionThrows(false, "1.5px"), "trailing characters should be rejected");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main()
{
    std::cout << "=== AppConfig Tests ===\n";

    testMissingFileReturnsDefault();
    testSaveAndReloadRoundTrip();
    testJsonKeys();
    testMergeConfigs();
    testMalformedJsonThrows();
    testSaveCreatesParentDir();
    testRawDescriptionAndParsers();
    testNumberOptions();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All AppConfig tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " AppConfig test(s) FAILED.\n";
        return 1;
    }
}
