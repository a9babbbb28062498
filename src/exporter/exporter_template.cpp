#include <tincture/exporter_template.hpp>

#include <tincture/error.hpp>
#include <tincture/logger.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

namespace tincture
{

namespace
{

constexpr std::string_view HEX_SUFFIX = "HEX";

bool is_token_char(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_digits(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string location(std::string_view raw, size_t offset)
{
    size_t line   = 1;
    size_t column = 1;
    for (size_t i = 0; i < offset && i < raw.size(); ++i)
    {
        if (raw[i] == '\n')
        {
            ++line;
            column = 1;
        }
        else
        {
            ++column;
        }
    }
    return std::to_string(line) + ":" + std::to_string(column);
}

void check_extra_name(const std::string& template_name, const std::string& extra)
{
    if (extra.empty())
    {
        throw Error(ErrorKind::TemplateParseError,
                    "template '" + template_name + "' declares an unnamed extra",
                    template_name);
    }
    if (!std::all_of(extra.begin(), extra.end(), is_token_char))
    {
        throw Error(ErrorKind::TemplateParseError,
                    "template '" + template_name + "': extra name '" + extra
                        + "' may only contain letters, digits and '_'",
                    extra);
    }
    // {ACCHEX} is the accent
    if (extra == "ACC")
    {
        throw Error(ErrorKind::TemplateParseError,
                    "template '" + template_name + "': extra name 'ACC' is reserved",
                    extra);
    }
}

// Classifies the text between a '{' and '}' pair. nullopt means the braces
// are ordinary text.
std::optional<ExporterTemplate::Segment> classify(std::string_view                          token,
                                                  const std::set<std::string, std::less<>>& extras)
{
    using Kind = ExporterTemplate::Segment::Kind;

    if (token == "NAME")
        return ExporterTemplate::Segment{Kind::Name, {}, 0};
    if (token == "ACCHEX")
        return ExporterTemplate::Segment{Kind::Accent, {}, 0};

    if (token.substr(0, HEX_SUFFIX.size()) == HEX_SUFFIX)
    {
        const std::string_view digits = token.substr(HEX_SUFFIX.size());
        if (is_digits(digits) && (digits.size() == 1 || digits.front() != '0'))
        {
            size_t slot = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), slot);
            if (ec == std::errc::result_out_of_range)
                slot = std::numeric_limits<size_t>::max();
            return ExporterTemplate::Segment{Kind::Slot, {}, slot};
        }
    }

    if (token.size() > HEX_SUFFIX.size()
        && token.substr(token.size() - HEX_SUFFIX.size()) == HEX_SUFFIX)
    {
        const std::string_view extra = token.substr(0, token.size() - HEX_SUFFIX.size());
        if (extras.find(extra) != extras.end())
            return ExporterTemplate::Segment{Kind::Extra, std::string(extra), 0};
    }

    return std::nullopt;
}

Error slot_error(const std::string& template_name, size_t slot, size_t palette_size)
{
    const std::string token = "HEX" + std::to_string(slot);
    return Error(ErrorKind::SlotOutOfRange,
                 "template '" + template_name + "' uses {" + token + "} but the palette has "
                     + std::to_string(palette_size) + " colors",
                 token);
}

}   // namespace

// ─── Parsing ─────────────────────────────────────────────────────────────────

ExporterTemplate parse_template(std::string                  name,
                                std::string_view             raw,
                                const std::set<std::string>& declared_extras,
                                std::string                  path_hint,
                                std::optional<size_t>        palette_size)
{
    std::set<std::string, std::less<>> required;
    for (const auto& extra : declared_extras)
    {
        check_extra_name(name, extra);
        required.insert(extra);
    }

    using Segment = ExporterTemplate::Segment;
    std::vector<Segment>  segments;
    std::optional<size_t> highest_slot;
    std::string           literal;
    auto                  flush = [&]()
    {
        if (!literal.empty())
        {
            segments.push_back(Segment{Segment::Kind::Literal, std::move(literal), 0});
            literal.clear();
        }
    };

    size_t i = 0;
    while (i < raw.size())
    {
        if (raw[i] != '{')
        {
            literal += raw[i++];
            continue;
        }

        size_t end = i + 1;
        while (end < raw.size() && is_token_char(raw[end]))
            ++end;
        const std::string_view token = raw.substr(i + 1, end - i - 1);

        auto segment = classify(token, required);
        if (!segment)
        {
            literal += raw[i++];
            continue;
        }
        if (end >= raw.size() || raw[end] == '\n' || raw[end] == '\r')
        {
            throw Error(ErrorKind::TemplateParseError,
                        "template '" + name + "': unterminated placeholder '{" + std::string(token)
                            + "' at " + location(raw, i),
                        name);
        }
        if (raw[end] != '}')
        {
            literal += raw[i++];
            continue;
        }

        if (segment->kind == Segment::Kind::Slot)
        {
            if (palette_size && segment->slot >= *palette_size)
                throw slot_error(name, segment->slot, *palette_size);
            highest_slot = std::max(highest_slot.value_or(0), segment->slot);
        }

        flush();
        segments.push_back(std::move(*segment));
        i = end + 1;
    }
    flush();

    ExporterTemplate tmpl;
    tmpl.name_         = std::move(name);
    tmpl.path_hint_    = std::move(path_hint);
    tmpl.body_         = std::string(raw);
    tmpl.required_     = std::move(required);
    tmpl.segments_     = std::move(segments);
    tmpl.highest_slot_ = highest_slot;

    TINCTURE_LOG_DEBUG("exporter",
                       "parsed template '{}': {} segments, {} extras",
                       tmpl.name_,
                       tmpl.segments_.size(),
                       tmpl.required_.size());
    return tmpl;
}

ExporterTemplate parse_template_with_hints(std::string                       name,
                                           std::string_view                  raw,
                                           const std::map<std::string, int>& extra_hints,
                                           std::string                       path_hint,
                                           std::optional<size_t>             palette_size)
{
    std::set<std::string> declared;
    for (const auto& [extra, slot] : extra_hints)
    {
        if (slot < 0)
        {
            throw Error(ErrorKind::TemplateParseError,
                        "template '" + name + "': extra '" + extra + "' has negative slot "
                            + std::to_string(slot),
                        extra);
        }
        declared.insert(extra);
    }

    ExporterTemplate tmpl =
        parse_template(std::move(name), raw, declared, std::move(path_hint), palette_size);
    tmpl.hints_.insert(extra_hints.begin(), extra_hints.end());
    return tmpl;
}

// ─── Rendering ───────────────────────────────────────────────────────────────

void ExporterTemplate::validate(const Theme& theme) const
{
    for (const auto& extra : required_)
    {
        if (!theme.extra(extra))
        {
            throw Error(ErrorKind::MissingExtra,
                        "template '" + name_ + "' requires extra '" + extra + "' which theme '"
                            + theme.name() + "' does not define",
                        extra);
        }
    }

    if (highest_slot_ && *highest_slot_ >= theme.palette().size())
        throw slot_error(name_, *highest_slot_, theme.palette().size());
}

RenderedDocument ExporterTemplate::render(const Theme& theme) const
{
    validate(theme);

    RenderedDocument doc;
    doc.path_hint = path_hint_;
    doc.text.reserve(body_.size());

    for (const auto& segment : segments_)
    {
        switch (segment.kind)
        {
            case Segment::Kind::Literal:
                doc.text += segment.text;
                break;
            case Segment::Kind::Name:
                doc.text += theme.name();
                break;
            case Segment::Kind::Accent:
                doc.text += theme.accent().to_hex();
                break;
            case Segment::Kind::Slot:
                doc.text += theme.palette()[segment.slot].to_hex();
                break;
            case Segment::Kind::Extra:
                doc.text += theme.extra_color(segment.text).to_hex();
                break;
        }
    }

    TINCTURE_LOG_DEBUG("exporter",
                       "rendered '{}' for theme '{}' ({} bytes)",
                       name_,
                       theme.name(),
                       doc.text.size());
    return doc;
}

}   // namespace tincture
