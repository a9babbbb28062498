#include <tincture/terminal_scheme.hpp>

#include <tincture/error.hpp>
#include <tincture/logger.hpp>

#include <cmath>
#include <numbers>

namespace tincture
{

namespace
{

// Hue order of the six spectrum entries and the slots they land in.
constexpr std::array<size_t, 6> NORMAL_SLOTS = {1, 3, 2, 6, 4, 5};
constexpr std::array<size_t, 6> BRIGHT_SLOTS = {9, 11, 10, 14, 12, 13};

constexpr int SPECTRUM_SIZE = static_cast<int>(NORMAL_SLOTS.size());

bool finite(const Lch& lch)
{
    return std::isfinite(lch.lightness) && std::isfinite(lch.chroma) && std::isfinite(lch.hue);
}

// Mix in rectangular (lightness, x, y) so a gray end point does not drag its
// arbitrary hue into the blend.
Color mix(ColorSpace space, const Lch& from, const Lch& to, double t, const ConversionOptions& opts)
{
    constexpr double deg = std::numbers::pi / 180.0;

    const double x0 = from.chroma * std::cos(from.hue * deg);
    const double y0 = from.chroma * std::sin(from.hue * deg);
    const double x1 = to.chroma * std::cos(to.hue * deg);
    const double y1 = to.chroma * std::sin(to.hue * deg);
    const double x  = x0 + (x1 - x0) * t;
    const double y  = y0 + (y1 - y0) * t;

    const Lch mixed{from.lightness + (to.lightness - from.lightness) * t,
                    std::hypot(x, y),
                    normalize_hue(std::atan2(y, x) / deg)};
    return Color::from_coords(space, from_polar(space, mixed), opts);
}

Palette spectrum_row(ColorSpace space, const Lch& spectrum, const ConversionOptions& opts)
{
    return generate_palette_at_hue(spectrum.hue,
                                   space,
                                   SPECTRUM_SIZE,
                                   std::vector<double>(SPECTRUM_SIZE, spectrum.lightness),
                                   HuePolicy::equal_steps(360.0),
                                   ChromaPolicy::constant(spectrum.chroma),
                                   opts);
}

}   // namespace

Palette TerminalScheme::compute() const
{
    for (const Lch* lch : {&foreground, &background, &spectrum, &spectrum_bright})
    {
        if (!finite(*lch))
            throw Error(ErrorKind::InvalidParameter, "terminal scheme has a non-finite coordinate");
    }

    std::vector<Color> colors(TERMINAL_PALETTE_SIZE);
    colors[0]  = Color::from_coords(space, from_polar(space, background), options);
    colors[15] = Color::from_coords(space, from_polar(space, foreground), options);
    colors[8]  = mix(space, background, foreground, 1.0 / 3.0, options);
    colors[7]  = mix(space, foreground, background, 1.0 / 3.0, options);

    const Palette normal = spectrum_row(space, spectrum, options);
    const Palette bright = spectrum_row(space, spectrum_bright, options);
    for (size_t i = 0; i < NORMAL_SLOTS.size(); ++i)
    {
        colors[NORMAL_SLOTS[i]] = normal[i];
        colors[BRIGHT_SLOTS[i]] = bright[i];
    }

    TINCTURE_LOG_DEBUG("scheme", "computed terminal palette in {}", color_space_name(space));
    return Palette(std::move(colors));
}

Theme TerminalScheme::to_theme(std::string name, Theme::Extras extras) const
{
    if (accent < 0 || accent >= static_cast<int>(TERMINAL_PALETTE_SIZE))
    {
        throw Error(ErrorKind::InvalidParameter,
                    "accent slot " + std::to_string(accent) + " is not a terminal palette slot",
                    std::to_string(accent));
    }
    Palette     palette = compute();
    const Color accent_color = palette[static_cast<size_t>(accent)];
    return Theme::build(std::move(name), std::move(palette), accent_color, std::move(extras));
}

}   // namespace tincture
