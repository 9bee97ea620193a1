#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "ColourTable.h"

/// Number of entries in each built-in colour table.
constexpr int kBuiltinTableSize = 256;

/// Built-in colour maps.  The order matches the legacy bicpl
/// Colour_coding_types enum for the maps we implement.
enum class ColourMapType
{
    GrayScale,
    HotMetal,
    HotMetalNeg,
    ColdMetal,
    ColdMetalNeg,
    GreenMetal,
    GreenMetalNeg,
    LimeMetal,
    LimeMetalNeg,
    RedMetal,
    RedMetalNeg,
    PurpleMetal,
    PurpleMetalNeg,
    Spectral,
    Red,
    Green,
    Blue,
    Contour,

    Count  // sentinel, must be last
};

/// Return the human-readable display name for a colour map type.
std::string_view colourMapName(ColourMapType type);

/// Look up a colour map by display name ("Hot Metal") or by its enum
/// spelling ("HotMetal").
std::optional<ColourMapType> colourMapByName(std::string_view name);

/// Shared immutable 256-entry table for the given map, in the 0..1 range.
/// Built once on first access; the pointer stays valid for the program.
std::shared_ptr<const ColourTable> colourMapTable(ColourMapType type);

/// Display names of all built-in maps, in enum order.
std::vector<std::string_view> builtinColourMapNames();

/// Total number of colour map types (excluding the Count sentinel).
constexpr int colourMapCount()
{
    return static_cast<int>(ColourMapType::Count);
}
