#include <tincture/color.hpp>

namespace tincture
{

namespace
{

int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}   // namespace

std::string to_hex(Rgb8 rgb)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string           out(6, '0');
    const uint8_t         channels[3] = {rgb.r, rgb.g, rgb.b};
    for (int i = 0; i < 3; ++i)
    {
        out[i * 2]     = digits[channels[i] >> 4];
        out[i * 2 + 1] = digits[channels[i] & 0x0F];
    }
    return out;
}

std::optional<Rgb8> parse_hex(std::string_view text)
{
    if (!text.empty() && text.front() == '#')
        text.remove_prefix(1);
    if (text.size() != 6)
        return std::nullopt;

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i)
    {
        const int hi = hex_digit(text[i * 2]);
        const int lo = hex_digit(text[i * 2 + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Rgb8{channels[0], channels[1], channels[2]};
}

Color Color::from_oklab(const Coords& lab)
{
    return Color(lab);
}

Color Color::from_rgb8(Rgb8 rgb)
{
    return Color(from_srgb(ColorSpace::Oklab, rgb));
}

std::optional<Color> Color::from_hex(std::string_view text)
{
    auto rgb = parse_hex(text);
    if (!rgb)
        return std::nullopt;
    return from_rgb8(*rgb);
}

Color Color::from_coords(ColorSpace space, const Coords& coords, const ConversionOptions& options)
{
    return from_rgb8(to_srgb(space, coords, options));
}

Coords Color::coords(ColorSpace space, const ConversionOptions& options) const
{
    return convert(ColorSpace::Oklab, space, lab_, options);
}

Lch Color::polar(ColorSpace space, const ConversionOptions& options) const
{
    return to_polar(space, coords(space, options));
}

Rgb8 Color::to_rgb8() const
{
    return to_srgb(ColorSpace::Oklab, lab_);
}

std::string Color::to_hex() const
{
    return tincture::to_hex(to_rgb8());
}

}   // namespace tincture
