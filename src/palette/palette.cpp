#include <tincture/palette.hpp>

#include <tincture/error.hpp>
#include <tincture/logger.hpp>

#include <algorithm>
#include <cmath>

namespace tincture
{

// ─── Palette ─────────────────────────────────────────────────────────────────

const Color& Palette::at(size_t index) const
{
    if (index >= colors_.size())
    {
        throw Error(ErrorKind::SlotOutOfRange,
                    "palette slot " + std::to_string(index) + " out of range (size "
                        + std::to_string(colors_.size()) + ")",
                    std::to_string(index));
    }
    return colors_[index];
}

std::vector<std::string> Palette::to_hex() const
{
    std::vector<std::string> out;
    out.reserve(colors_.size());
    for (const auto& c : colors_)
        out.push_back(c.to_hex());
    return out;
}

// ─── Policies ────────────────────────────────────────────────────────────────

double HuePolicy::offset(size_t slot, size_t count) const
{
    if (mode == Mode::Offsets)
        return offsets[slot];
    return span * static_cast<double>(slot) / static_cast<double>(count);
}

double ChromaPolicy::evaluate(double lightness, const LightnessRange& range) const
{
    double c = chroma;
    if (mode == Mode::ScaledByLightness)
    {
        const double extent = range.white - range.black;
        const double t = extent > 0.0 ? std::clamp((lightness - range.black) / extent, 0.0, 1.0)
                                      : 0.0;
        c *= 4.0 * t * (1.0 - t);
    }
    return std::max(c, 0.0);
}

// ─── Generation ──────────────────────────────────────────────────────────────

namespace
{

void require(bool condition, const std::string& message)
{
    if (!condition)
        throw Error(ErrorKind::InvalidParameter, message);
}

bool all_finite(const std::vector<double>& values)
{
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

}   // namespace

Palette generate_palette_at_hue(double                     base_hue,
                                ColorSpace                 space,
                                int                        count,
                                const std::vector<double>& lightness,
                                const HuePolicy&           hue,
                                const ChromaPolicy&        chroma,
                                const ConversionOptions&   options)
{
    require(count > 0, "palette size must be positive, got " + std::to_string(count));
    const auto n = static_cast<size_t>(count);
    require(lightness.size() == n,
            "lightness curve has " + std::to_string(lightness.size()) + " values, expected "
                + std::to_string(n));
    require(all_finite(lightness), "lightness curve contains a non-finite value");
    require(std::isfinite(base_hue), "base hue is not finite");
    require(std::isfinite(chroma.chroma), "chroma is not finite");
    if (hue.mode == HuePolicy::Mode::Offsets)
    {
        require(hue.offsets.size() == n,
                "hue offsets have " + std::to_string(hue.offsets.size()) + " values, expected "
                    + std::to_string(n));
        require(all_finite(hue.offsets), "hue offsets contain a non-finite value");
    }
    else
    {
        require(std::isfinite(hue.span), "hue span is not finite");
    }

    const LightnessRange range = lightness_range(space, options);

    std::vector<Color> colors;
    colors.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        const Lch lch{lightness[i],
                      chroma.evaluate(lightness[i], range),
                      normalize_hue(base_hue + hue.offset(i, n))};
        colors.push_back(Color::from_coords(space, from_polar(space, lch), options));
    }

    TINCTURE_LOG_TRACE("palette",
                       "generated {} slots in {} from hue {}",
                       n,
                       color_space_name(space),
                       base_hue);
    return Palette(std::move(colors));
}

Palette generate_palette(const Color&               base,
                         ColorSpace                 space,
                         int                        count,
                         const std::vector<double>& lightness,
                         const HuePolicy&           hue,
                         const ChromaPolicy&        chroma,
                         const ConversionOptions&   options)
{
    const double base_hue = base.polar(space, options).hue;
    return generate_palette_at_hue(base_hue, space, count, lightness, hue, chroma, options);
}

Palette generate_palette(const PaletteRequest& request)
{
    return generate_palette(request.base,
                            request.space,
                            request.count,
                            request.lightness,
                            request.hue,
                            request.chroma,
                            request.options);
}

// ─── Lightness curves ────────────────────────────────────────────────────────

std::vector<double> linear_lightness(ColorSpace               space,
                                     int                      count,
                                     double                   lo,
                                     double                   hi,
                                     const ConversionOptions& options)
{
    require(count > 0, "lightness curve size must be positive, got " + std::to_string(count));
    require(std::isfinite(lo) && std::isfinite(hi), "lightness bounds are not finite");

    const LightnessRange range  = lightness_range(space, options);
    const double         extent = range.white - range.black;

    std::vector<double> out(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i)
    {
        const double t    = count > 1 ? static_cast<double>(i) / (count - 1) : 0.0;
        const double frac = lo + (hi - lo) * t;
        out[static_cast<size_t>(i)] = range.black + extent * frac;
    }
    return out;
}

std::vector<double> constant_lightness(ColorSpace               space,
                                       int                      count,
                                       double                   fraction,
                                       const ConversionOptions& options)
{
    return linear_lightness(space, count, fraction, fraction, options);
}

}   // namespace tincture
