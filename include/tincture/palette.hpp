#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <tincture/color.hpp>
#include <tincture/color_space.hpp>

namespace tincture
{

// Fixed-length ordered color sequence. Slot 0 is the background by
// convention, the last slot the foreground.
class Palette
{
   public:
    Palette() = default;
    explicit Palette(std::vector<Color> colors) : colors_(std::move(colors)) {}

    size_t size() const { return colors_.size(); }
    bool   empty() const { return colors_.empty(); }

    const Color& operator[](size_t index) const { return colors_[index]; }

    // Throws Error(SlotOutOfRange) for index >= size().
    const Color& at(size_t index) const;

    const std::vector<Color>& colors() const { return colors_; }

    std::vector<Color>::const_iterator begin() const { return colors_.begin(); }
    std::vector<Color>::const_iterator end() const { return colors_.end(); }

    std::vector<std::string> to_hex() const;

    bool operator==(const Palette&) const = default;

   private:
    std::vector<Color> colors_;
};

// ─── Generation policies ─────────────────────────────────────────────────────

struct HuePolicy
{
    enum class Mode
    {
        EqualSteps,   // offset_i = i * span / N
        Offsets       // offset_i = offsets[i]
    };

    Mode                mode = Mode::EqualSteps;
    double              span = 360.0;
    std::vector<double> offsets;

    static HuePolicy equal_steps(double span = 360.0) { return {Mode::EqualSteps, span, {}}; }
    static HuePolicy explicit_offsets(std::vector<double> offsets)
    {
        return {Mode::Offsets, 360.0, std::move(offsets)};
    }

    double offset(size_t slot, size_t count) const;
};

struct ChromaPolicy
{
    enum class Mode
    {
        Constant,            // chroma everywhere
        ScaledByLightness    // chroma * 4t(1-t), t = lightness fraction; zero at black and white
    };

    Mode   mode   = Mode::Constant;
    double chroma = 0.0;

    static ChromaPolicy constant(double chroma) { return {Mode::Constant, chroma}; }
    static ChromaPolicy scaled(double peak) { return {Mode::ScaledByLightness, peak}; }

    // Never negative.
    double evaluate(double lightness, const LightnessRange& range) const;
};

struct PaletteRequest
{
    Color               base;
    ColorSpace          space = ColorSpace::Oklab;
    int                 count = 16;
    std::vector<double> lightness;   // `count` values in the space's lightness units
    HuePolicy           hue;
    ChromaPolicy        chroma;
    ConversionOptions   options;
};

// Slot i = (lightness[i], chroma(lightness[i]), hue(base) + offset_i) in
// `space`, mapped to sRGB. Throws Error(InvalidParameter) when count <= 0,
// the curve or offset list does not have `count` entries, or any input is
// not finite.
Palette generate_palette(const PaletteRequest& request);

Palette generate_palette(const Color&               base,
                         ColorSpace                 space,
                         int                        count,
                         const std::vector<double>& lightness,
                         const HuePolicy&           hue,
                         const ChromaPolicy&        chroma,
                         const ConversionOptions&   options = {});

// Same as above with the hue anchor given directly instead of read from a
// base color.
Palette generate_palette_at_hue(double                     base_hue,
                                ColorSpace                 space,
                                int                        count,
                                const std::vector<double>& lightness,
                                const HuePolicy&           hue,
                                const ChromaPolicy&        chroma,
                                const ConversionOptions&   options = {});

// ─── Lightness curves ────────────────────────────────────────────────────────
// `lo`, `hi` and `fraction` are fractions of the space's black..white range.

std::vector<double> linear_lightness(ColorSpace               space,
                                     int                      count,
                                     double                   lo,
                                     double                   hi,
                                     const ConversionOptions& options = {});

std::vector<double> constant_lightness(ColorSpace               space,
                                       int                      count,
                                       double                   fraction,
                                       const ConversionOptions& options = {});

}   // namespace tincture
