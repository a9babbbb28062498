#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <tincture/theme.hpp>

namespace tincture
{

struct RenderedDocument
{
    std::string text;
    std::string path_hint;
};

class ExporterTemplate;

// Throws Error(TemplateParseError) when an extra name is empty, contains
// characters other than [A-Za-z0-9_], or collides with a reserved
// placeholder, and when a recognised placeholder name runs into the end of
// its line or of the text (the message carries line and column). Any other
// span that is not exactly a placeholder, such as `${NAME:-x}` or `{HEX1 }`,
// is copied through unchanged. With `palette_size` given, a {HEXk}
// with k >= palette_size throws Error(SlotOutOfRange) here instead of at
// render time.
ExporterTemplate parse_template(std::string                 name,
                                std::string_view            raw,
                                const std::set<std::string>& declared_extras,
                                std::string                 path_hint    = {},
                                std::optional<size_t>       palette_size = std::nullopt);

// Same, with the extras declared as name -> expected palette slot. Negative
// slots are a TemplateParseError.
ExporterTemplate parse_template_with_hints(std::string                       name,
                                           std::string_view                  raw,
                                           const std::map<std::string, int>& extra_hints,
                                           std::string                       path_hint = {},
                                           std::optional<size_t> palette_size = std::nullopt);

// Parsed exporter template. The body is split once into literal runs and
// placeholders; render() only walks that list, so substituted text is never
// rescanned. Immutable after parse and safe to share between threads.
//
// Placeholders (case-sensitive):
//   {NAME}           theme name
//   {ACCHEX}         accent hex
//   {HEXk}           palette[k] hex, k written without leading zeros
//   {<EXTRA>HEX}     palette[extras[EXTRA]] hex, EXTRA declared
// Any other brace sequence is copied through untouched.
class ExporterTemplate
{
   public:
    struct Segment
    {
        enum class Kind
        {
            Literal,
            Name,
            Accent,
            Slot,
            Extra
        };

        Kind        kind = Kind::Literal;
        std::string text;       // Literal: the text; Extra: the extra name
        size_t      slot = 0;   // Slot only
    };

    const std::string& name() const { return name_; }
    const std::string& path_hint() const { return path_hint_; }
    const std::string& body() const { return body_; }

    const std::set<std::string, std::less<>>& required_extras() const { return required_; }

    // Palette slot each declared extra is expected to point at, as given by
    // the exporter source. Empty for templates parsed without hints.
    const std::map<std::string, int, std::less<>>& extra_hints() const { return hints_; }

    const std::vector<Segment>& segments() const { return segments_; }

    // Highest {HEXk} index used, if any.
    std::optional<size_t> highest_slot() const { return highest_slot_; }

    // Throws Error(MissingExtra) for the first declared extra the theme
    // lacks, then Error(SlotOutOfRange) if a {HEXk} is past the palette.
    void validate(const Theme& theme) const;

    RenderedDocument render(const Theme& theme) const;

   private:
    friend ExporterTemplate parse_template(std::string                 name,
                                           std::string_view            raw,
                                           const std::set<std::string>& declared_extras,
                                           std::string                 path_hint,
                                           std::optional<size_t>       palette_size);

    friend ExporterTemplate parse_template_with_hints(std::string                       name,
                                                      std::string_view                  raw,
                                                      const std::map<std::string, int>& extra_hints,
                                                      std::string                       path_hint,
                                                      std::optional<size_t>             palette_size);

    ExporterTemplate() = default;

    std::string                             name_;
    std::string                             path_hint_;
    std::string                             body_;
    std::set<std::string, std::less<>>      required_;
    std::map<std::string, int, std::less<>> hints_;
    std::vector<Segment>                    segments_;
    std::optional<size_t>                   highest_slot_;
};

}   // namespace tincture
