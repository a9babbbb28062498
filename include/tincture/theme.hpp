#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tincture/color.hpp>
#include <tincture/palette.hpp>

namespace tincture
{

// Named palette with an accent and semantic aliases ("extras") into the
// palette. Immutable: every edit returns a new, fully validated Theme, so a
// Theme shared between threads never changes under a reader.
class Theme
{
   public:
    using Extras = std::map<std::string, int, std::less<>>;

    // Throws Error(InvalidParameter) for an empty palette and
    // Error(InvalidExtras) for an empty extras name or an index outside
    // [0, palette.size()).
    static Theme build(std::string name, Palette palette, Color accent, Extras extras = {});

    // Same, for extras read from an untyped source where a key can repeat.
    // Throws Error(DuplicateKey) naming the repeated key.
    static Theme build_from_entries(std::string                                     name,
                                    Palette                                         palette,
                                    Color                                           accent,
                                    const std::vector<std::pair<std::string, int>>& extras);

    const std::string& name() const { return name_; }
    const Palette&     palette() const { return palette_; }
    const Color&       accent() const { return accent_; }
    const Extras&      extras() const { return extras_; }

    std::optional<int> extra(std::string_view key) const;

    // Palette color an extra points at. Throws Error(MissingExtra).
    const Color& extra_color(std::string_view key) const;

    Theme with_name(std::string name) const;
    Theme with_color(size_t index, Color color) const;
    Theme with_accent(Color accent) const;
    Theme with_extras(Extras extras) const;

    bool operator==(const Theme&) const = default;

   private:
    Theme() = default;

    std::string name_;
    Palette     palette_;
    Color       accent_;
    Extras      extras_;
};

}   // namespace tincture
