#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tincture
{

// ─── Spaces ──────────────────────────────────────────────────────────────────
//
// Coordinate conventions:
//   CieLab  (L 0..100, a, b)           D65, reference white taken from the sRGB matrix
//   Oklab   (L 0..1,   a, b)
//   JzAzBz  (Jz, az, bz)               absolute; sRGB white = ConversionOptions::hdr_white
//   Hsv     (H degrees, S 0..1, V 0..1) on gamma-encoded sRGB

enum class ColorSpace
{
    CieLab,
    Oklab,
    JzAzBz,
    Hsv
};

inline constexpr std::array<ColorSpace, 4> ALL_COLOR_SPACES = {
    ColorSpace::CieLab,
    ColorSpace::Oklab,
    ColorSpace::JzAzBz,
    ColorSpace::Hsv,
};

const char* color_space_name(ColorSpace space);

// Accepts "lab", "cielab", "oklab", "jzazbz", "hsv" in any case.
std::optional<ColorSpace> parse_color_space(std::string_view name);

inline constexpr double DEFAULT_HDR_WHITE = 203.0;   // cd/m², ITU-R BT.2408 reference white

struct ConversionOptions
{
    double hdr_white = DEFAULT_HDR_WHITE;

    bool operator==(const ConversionOptions&) const = default;
};

using Coords = std::array<double, 3>;

struct Rgb8
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb8&) const = default;
};

// Cylindrical view of any space. For HSV: lightness = V, chroma = S, hue = H.
struct Lch
{
    double lightness = 0.0;
    double chroma    = 0.0;
    double hue       = 0.0;   // degrees, [0, 360)

    bool operator==(const Lch&) const = default;
};

struct LightnessRange
{
    double black = 0.0;
    double white = 1.0;
};

// ─── Conversions ─────────────────────────────────────────────────────────────

// Device sRGB for `coords`. Out-of-gamut input is pulled toward neutral by
// scaling the chroma components (hue and lightness kept) until every channel
// fits, then quantized. Lightness outside the displayable range is clamped
// first. NaN coordinates are treated as 0. Never fails.
//
// A reduced color is quantized to whichever floor/ceil neighbour keeps the
// hue closest to the input. Its hue is then within 1° of the input, or, where
// the gamut at that lightness is too narrow for an 8-bit step to resolve 1°,
// its hue displacement C·Δh (Δh in radians) stays below a fraction of one
// 8-bit step: 0.5 in CIE Lab, 0.015 in Oklab, 0.003 in JzAzBz. For HSV the
// error stays within 30° divided by the max-min channel spread in 8-bit units.
Rgb8 to_srgb(ColorSpace space, const Coords& coords, const ConversionOptions& options = {});

// Forward transform of an 8-bit triple. Total.
Coords from_srgb(ColorSpace space, Rgb8 rgb, const ConversionOptions& options = {});

// Unquantized, unclamped conversion between two spaces.
Coords convert(ColorSpace               from,
               ColorSpace               to,
               const Coords&            coords,
               const ConversionOptions& options = {});

// True when `coords` maps inside the sRGB cube without any chroma reduction.
bool in_gamut(ColorSpace space, const Coords& coords, const ConversionOptions& options = {});

Lch    to_polar(ColorSpace space, const Coords& coords);
Coords from_polar(ColorSpace space, const Lch& lch);

LightnessRange lightness_range(ColorSpace space, const ConversionOptions& options = {});

// Wraps into [0, 360).
double normalize_hue(double degrees);

// Smallest absolute angle between two hues, in [0, 180].
double hue_distance(double a, double b);

}   // namespace tincture
