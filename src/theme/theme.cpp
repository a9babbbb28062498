#include <tincture/theme.hpp>

#include <tincture/error.hpp>

namespace tincture
{

Theme Theme::build(std::string name, Palette palette, Color accent, Extras extras)
{
    if (palette.empty())
        throw Error(ErrorKind::InvalidParameter, "theme '" + name + "' has an empty palette", name);

    const auto size = static_cast<long long>(palette.size());
    for (const auto& [key, index] : extras)
    {
        if (key.empty())
            throw Error(ErrorKind::InvalidExtras, "theme '" + name + "' has an unnamed extra");
        if (index < 0 || index >= size)
        {
            throw Error(ErrorKind::InvalidExtras,
                        "extra '" + key + "' points at slot " + std::to_string(index)
                            + " but the palette has " + std::to_string(size) + " colors",
                        key);
        }
    }

    Theme theme;
    theme.name_    = std::move(name);
    theme.palette_ = std::move(palette);
    theme.accent_  = accent;
    theme.extras_  = std::move(extras);
    return theme;
}

Theme Theme::build_from_entries(std::string                                     name,
                                Palette                                         palette,
                                Color                                           accent,
                                const std::vector<std::pair<std::string, int>>& extras)
{
    Extras map;
    for (const auto& [key, index] : extras)
    {
        if (!map.emplace(key, index).second)
            throw Error(ErrorKind::DuplicateKey, "extra '" + key + "' is defined twice", key);
    }
    return build(std::move(name), std::move(palette), accent, std::move(map));
}

std::optional<int> Theme::extra(std::string_view key) const
{
    auto it = extras_.find(key);
    if (it == extras_.end())
        return std::nullopt;
    return it->second;
}

const Color& Theme::extra_color(std::string_view key) const
{
    auto it = extras_.find(key);
    if (it == extras_.end())
    {
        throw Error(ErrorKind::MissingExtra,
                    "theme '" + name_ + "' has no extra '" + std::string(key) + "'",
                    std::string(key));
    }
    return palette_[static_cast<size_t>(it->second)];
}

Theme Theme::with_name(std::string name) const
{
    return build(std::move(name), palette_, accent_, extras_);
}

Theme Theme::with_color(size_t index, Color color) const
{
    std::vector<Color> colors = palette_.colors();
    if (index >= colors.size())
    {
        throw Error(ErrorKind::SlotOutOfRange,
                    "palette slot " + std::to_string(index) + " out of range (size "
                        + std::to_string(colors.size()) + ")",
                    std::to_string(index));
    }
    colors[index] = color;
    return build(name_, Palette(std::move(colors)), accent_, extras_);
}

Theme Theme::with_accent(Color accent) const
{
    return build(name_, palette_, accent, extras_);
}

Theme Theme::with_extras(Extras extras) const
{
    return build(name_, palette_, accent_, std::move(extras));
}

}   // namespace tincture
