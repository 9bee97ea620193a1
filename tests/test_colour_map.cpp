#include "ColourMap.h"
#include "IntensityMapper.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::fprintf(stderr, "FAIL (line %d): %s\n", line, msg);
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

static bool near(float a, float b, float tol = 0.01f)
{
    return std::fabs(a - b) <= tol;
}

int main()
{
    // 1. All colour maps should be nameable, full-size and opaque.
    for (int i = 0; i < colourMapCount(); ++i)
    {
        auto type = static_cast<ColourMapType>(i);
        auto name = colourMapName(type);
        CHECK(!name.empty(), "colour map name should not be empty");
        CHECK(colourMapByName(name) == type, "display name should look up its own map");

        auto table = colourMapTable(type);
        CHECK(table != nullptr, "built-in table should exist");
        CHECK(table->entryCount() == static_cast<std::size_t>(kBuiltinTableSize),
              "built-in table should have 256 entries");
        for (std::size_t j = 0; j < table->entryCount(); ++j)
        {
            CHECK(table->isDefined(j), "built-in entries should all be defined");
            CHECK(table->entry(j)[3] == 1.0f, "alpha should be 1 for all built-in maps");
        }
    }

    // 2. Gray scale: first entry should be black, last should be white.
    {
        auto gray = colourMapTable(ColourMapType::GrayScale);
        auto first = gray->entry(0);
        CHECK(first[0] == 0.0f && first[1] == 0.0f && first[2] == 0.0f, "gray[0] should be black");

        auto last = gray->entry(255);
        CHECK(near(last[0], 1.0f) && near(last[1], 1.0f) && near(last[2], 1.0f),
              "gray[255] should be white");

        auto mid = gray->entry(128);
        CHECK(near(mid[0], 128.0f / 255.0f), "gray[128] R should be ~0.5");
        CHECK(mid[0] == mid[1] && mid[1] == mid[2], "gray[128] should be neutral");
    }

    // 3. Hot metal: black to white through dark red.
    {
        auto hot = colourMapTable(ColourMapType::HotMetal);
        auto c = hot->entry(64);
        CHECK(near(c[0], 0.5f), "hot[64] R should be ~0.5");
        CHECK(near(c[1], 0.0f) && near(c[2], 0.0f), "hot[64] G,B should be ~0");

        auto last = hot->entry(255);
        CHECK(near(last[0], 1.0f) && near(last[1], 1.0f) && near(last[2], 1.0f),
              "hot[255] should be white");
    }

    // 4. Primary ramps end on their primary.
    {
        auto red = colourMapTable(ColourMapType::Red)->entry(255);
        CHECK(near(red[0], 1.0f) && red[1] == 0.0f && red[2] == 0.0f, "red[255] should be pure red");
        auto green = colourMapTable(ColourMapType::Green)->entry(255);
        CHECK(green[0] == 0.0f && near(green[1], 1.0f) && green[2] == 0.0f, "green[255] should be pure green");
        auto blue = colourMapTable(ColourMapType::Blue)->entry(255);
        CHECK(blue[0] == 0.0f && blue[1] == 0.0f && near(blue[2], 1.0f), "blue[255] should be pure blue");
    }

    // 5. Hot Metal Neg is hot metal reversed.
    {
        auto neg = colourMapTable(ColourMapType::HotMetalNeg);
        auto first = neg->entry(0);
        CHECK(near(first[0], 1.0f) && near(first[1], 1.0f) && near(first[2], 1.0f),
              "hot neg[0] should be white");
        auto last = neg->entry(255);
        CHECK(near(last[0], 0.0f) && near(last[1], 0.0f) && near(last[2], 0.0f),
              "hot neg[255] should be black");
    }

    // 6. Contour: visible discontinuity at the first band edge (0.166).
    {
        auto contour = colourMapTable(ColourMapType::Contour);
        auto a = contour->entry(42);
        auto b = contour->entry(43);
        float maxDiff = std::max({std::fabs(a[0] - b[0]), std::fabs(a[1] - b[1]),
                                  std::fabs(a[2] - b[2])});
        CHECK(maxDiff > 0.3f, "contour should jump between entries 42 and 43");
    }

    // 7. Lookup by enum spelling and failure on unknown names.
    CHECK(colourMapByName("HotMetal") == ColourMapType::HotMetal, "enum spelling should resolve");
    CHECK(colourMapByName("Gray") == ColourMapType::GrayScale, "display name should resolve");
    CHECK(!colourMapByName("NoSuchMap").has_value(), "unknown name should not resolve");
    CHECK(colourMapCount() == 18, "should have 18 colour map types");
    CHECK(builtinColourMapNames().size() == 18u, "name list should cover every map");

    // 8. Tables are built once and shared.
    CHECK(colourMapTable(ColourMapType::Spectral) == colourMapTable(ColourMapType::Spectral),
          "colourMapTable should return the shared table");

    // 9. Gray maps the window ends to black and white.
    {
        auto gray = colourMapTable(ColourMapType::GrayScale);
        ColourQuery q;
        q.min = 0.0;
        q.max = 100.0;
        CHECK(colourHexFromValue(*gray, 0.0, q) == "000000", "gray min should be black");
        CHECK(colourHexFromValue(*gray, 100.0, q) == "ffffff", "gray max should be white");
    }

    if (failures == 0)
    {
        std::printf("All colour map tests passed.\n");
        return 0;
    }
    else
    {
        std::fprintf(stderr, "%d test(s) failed.\n", failures);
        return 1;
    }
}
