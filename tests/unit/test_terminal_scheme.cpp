#include <gtest/gtest.h>
#include <limits>
#include <tincture/error.hpp>
#include <tincture/terminal_scheme.hpp>

using namespace tincture;

namespace
{

bool is_gray(const Color& c)
{
    const Rgb8 rgb = c.to_rgb8();
    return rgb.r == rgb.g && rgb.g == rgb.b;
}

}   // namespace

TEST(TerminalScheme, DefaultLayout)
{
    const Palette palette = TerminalScheme{}.compute();
    ASSERT_EQ(palette.size(), TERMINAL_PALETTE_SIZE);
    EXPECT_EQ(palette[0].to_hex(), "000000");
    EXPECT_EQ(palette[15].to_hex(), "ffffff");
}

TEST(TerminalScheme, GrayRampBetweenBackgroundAndForeground)
{
    const Palette palette = TerminalScheme{}.compute();
    EXPECT_TRUE(is_gray(palette[8])) << palette[8].to_hex();
    EXPECT_TRUE(is_gray(palette[7])) << palette[7].to_hex();

    const int dark  = palette[8].to_rgb8().r;
    const int light = palette[7].to_rgb8().r;
    EXPECT_GT(dark, 0);
    EXPECT_LT(dark, light);
    EXPECT_LT(light, 255);

    EXPECT_NEAR(palette[8].polar(ColorSpace::CieLab).lightness, 100.0 / 3.0, 0.5);
    EXPECT_NEAR(palette[7].polar(ColorSpace::CieLab).lightness, 200.0 / 3.0, 0.5);
}

TEST(TerminalScheme, SpectrumHuesLandInAnsiOrder)
{
    const Palette palette = TerminalScheme{}.compute();

    // red, yellow, green, cyan, blue, magenta
    const size_t normal[] = {1, 3, 2, 6, 4, 5};
    const size_t bright[] = {9, 11, 10, 14, 12, 13};
    for (size_t i = 0; i < 6; ++i)
    {
        const double expected = 60.0 * static_cast<double>(i);
        EXPECT_LT(hue_distance(palette[normal[i]].polar(ColorSpace::CieLab).hue, expected), 2.0)
            << "slot " << normal[i];
        EXPECT_LT(hue_distance(palette[bright[i]].polar(ColorSpace::CieLab).hue, expected), 2.0)
            << "slot " << bright[i];
    }
}

TEST(TerminalScheme, SpectrumRowsKeepTheirLightness)
{
    const Palette palette = TerminalScheme{}.compute();
    EXPECT_NEAR(palette[1].polar(ColorSpace::CieLab).lightness, 35.0, 0.5);
    EXPECT_NEAR(palette[11].polar(ColorSpace::CieLab).lightness, 65.0, 0.5);
}

TEST(TerminalScheme, SpectrumHueRotatesTheRows)
{
    TerminalScheme scheme;
    scheme.spectrum.hue        = 30.0;
    scheme.spectrum_bright.hue = 30.0;
    const Palette palette      = scheme.compute();
    EXPECT_LT(hue_distance(palette[1].polar(ColorSpace::CieLab).hue, 30.0), 2.0);
    EXPECT_LT(hue_distance(palette[3].polar(ColorSpace::CieLab).hue, 90.0), 2.0);
}

TEST(TerminalScheme, Deterministic)
{
    TerminalScheme scheme;
    scheme.space = ColorSpace::JzAzBz;
    scheme.foreground = {0.2, 0.0, 0.0};
    scheme.background = {0.01, 0.002, 250.0};
    scheme.spectrum = {0.08, 0.01, 20.0};
    scheme.spectrum_bright = {0.12, 0.015, 20.0};
    EXPECT_EQ(scheme.compute(), scheme.compute());
}

TEST(TerminalScheme, OklabVariant)
{
    TerminalScheme scheme;
    scheme.space           = ColorSpace::Oklab;
    scheme.foreground      = {1.0, 0.0, 0.0};
    scheme.background      = {0.0, 0.0, 0.0};
    scheme.spectrum        = {0.5, 0.1, 30.0};
    scheme.spectrum_bright = {0.75, 0.12, 30.0};

    const Palette palette = scheme.compute();
    ASSERT_EQ(palette.size(), TERMINAL_PALETTE_SIZE);
    EXPECT_EQ(palette[0].to_hex(), "000000");
    EXPECT_EQ(palette[15].to_hex(), "ffffff");
    EXPECT_LT(hue_distance(palette[1].polar(ColorSpace::Oklab).hue, 30.0), 2.0);
    EXPECT_TRUE(is_gray(palette[8]));
}

TEST(TerminalScheme, ToThemeUsesAccentSlot)
{
    const TerminalScheme scheme;
    const Theme          theme = scheme.to_theme("Default", {{"ERROR", 1}});
    EXPECT_EQ(theme.name(), "Default");
    EXPECT_EQ(theme.accent(), theme.palette()[11]);
    EXPECT_EQ(theme.extra("ERROR"), 1);
    EXPECT_EQ(theme.palette(), scheme.compute());
}

TEST(TerminalScheme, RejectsAccentOutsidePalette)
{
    for (int accent : {-1, 16})
    {
        TerminalScheme scheme;
        scheme.accent = accent;
        try
        {
            scheme.to_theme("x");
            FAIL() << "accent " << accent << " accepted";
        }
        catch (const Error& e)
        {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter);
        }
    }
}

TEST(TerminalScheme, RejectsNonFiniteCoordinates)
{
    TerminalScheme scheme;
    scheme.spectrum.hue = std::numeric_limits<double>::infinity();
    try
    {
        scheme.compute();
        FAIL() << "non-finite hue accepted";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter);
    }
}

TEST(TerminalScheme, ExtrasAreValidatedAgainstPalette)
{
    try
    {
        TerminalScheme{}.to_theme("x", {{"BEYOND", 16}});
        FAIL() << "extra past the palette accepted";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidExtras);
        EXPECT_EQ(e.subject(), "BEYOND");
    }
}
