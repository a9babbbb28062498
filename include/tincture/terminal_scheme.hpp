#pragma once

#include <array>
#include <string>

#include <tincture/color_space.hpp>
#include <tincture/palette.hpp>
#include <tincture/theme.hpp>

namespace tincture
{

inline constexpr size_t TERMINAL_PALETTE_SIZE = 16;

// Classic 16-color terminal layout described by four polar colors.
//
//   0        background          15       foreground
//   8        bg + (fg - bg) / 3   7       fg + (bg - fg) / 3
//   1 3 2 6 4 5                  red yellow green cyan blue magenta from `spectrum`
//   9 11 10 14 12 13             the same hues from `spectrum_bright`
//
// Spectrum hues start at the spectrum's own hue and step by 60 degrees.
struct TerminalScheme
{
    ColorSpace space      = ColorSpace::CieLab;
    Lch        foreground = {100.0, 0.0, 0.0};
    Lch        background = {0.0, 0.0, 0.0};
    Lch        spectrum   = {35.0, 35.0, 0.0};
    Lch        spectrum_bright = {65.0, 65.0, 0.0};
    int        accent     = 11;   // bright yellow

    ConversionOptions options;

    // Throws Error(InvalidParameter) for non-finite coordinates.
    Palette compute() const;

    // Accent is palette[accent]. Throws Error(InvalidParameter) when
    // `accent` is not a palette slot.
    Theme to_theme(std::string name, Theme::Extras extras = {}) const;

    bool operator==(const TerminalScheme&) const = default;
};

}   // namespace tincture
