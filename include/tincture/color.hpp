#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <tincture/color_space.hpp>

namespace tincture
{

// "rrggbb", lowercase, no leading '#'.
std::string to_hex(Rgb8 rgb);

// Accepts "rrggbb" or "#rrggbb" in any case.
std::optional<Rgb8> parse_hex(std::string_view text);

// Perceptual color value, stored as Oklab.
// Whatever the stored coordinates, to_rgb8() / to_hex() always yield an
// in-gamut triple (chroma reduced along constant hue first).
class Color
{
   public:
    constexpr Color() = default;

    static Color from_oklab(const Coords& lab);
    static Color from_rgb8(Rgb8 rgb);
    static Color from_rgb8(uint8_t r, uint8_t g, uint8_t b) { return from_rgb8(Rgb8{r, g, b}); }
    static std::optional<Color> from_hex(std::string_view text);

    // Gamut-maps `coords` in `space` (see to_srgb) and stores the resulting
    // device color.
    static Color from_coords(ColorSpace               space,
                             const Coords&            coords,
                             const ConversionOptions& options = {});

    const Coords& oklab() const { return lab_; }

    Coords coords(ColorSpace space, const ConversionOptions& options = {}) const;
    Lch    polar(ColorSpace space, const ConversionOptions& options = {}) const;

    Rgb8        to_rgb8() const;
    std::string to_hex() const;

    bool operator==(const Color&) const = default;

   private:
    explicit constexpr Color(const Coords& lab) : lab_(lab) {}

    Coords lab_{0.0, 0.0, 0.0};
};

}   // namespace tincture
