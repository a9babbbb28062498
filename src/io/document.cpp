#include <tincture/document.hpp>

#include <tincture/error.hpp>
#include <tincture/logger.hpp>

#include <algorithm>
#include <climits>
#include <cmath>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>

namespace tincture
{

namespace
{

[[noreturn]] void fail(std::string_view source, const std::string& message, std::string subject = {})
{
    throw Error(ErrorKind::InvalidDocument, std::string(source) + ": " + message, std::move(subject));
}

toml::table parse_toml(std::string_view text, std::string_view source)
{
    try
    {
        return toml::parse(text, source);
    }
    catch (const toml::parse_error& err)
    {
        const auto& begin = err.source().begin;
        fail(source,
             std::string(err.description()) + " (line " + std::to_string(begin.line) + ", column "
                 + std::to_string(begin.column) + ")");
    }
}

std::string required_string(const toml::table& table, std::string_view key, std::string_view source)
{
    const toml::node* node = table.get(key);
    if (!node)
        fail(source, "missing key '" + std::string(key) + "'", std::string(key));
    auto value = node->value<std::string_view>();
    if (!value)
        fail(source, "'" + std::string(key) + "' must be a string", std::string(key));
    return std::string(*value);
}

std::optional<std::string> optional_string(const toml::table& table,
                                           std::string_view   key,
                                           std::string_view   source)
{
    if (!table.contains(key))
        return std::nullopt;
    return required_string(table, key, source);
}

int to_int(int64_t value)
{
    return static_cast<int>(std::clamp<int64_t>(value, INT_MIN, INT_MAX));
}

Color hex_color(const toml::node& node, std::string_view source, const std::string& what)
{
    auto text = node.value<std::string_view>();
    if (!text)
        fail(source, what + " must be a hex string", what);
    auto color = Color::from_hex(*text);
    if (!color)
        fail(source, what + " is not a 6-digit hex color: '" + std::string(*text) + "'", what);
    return *color;
}

// Table of name -> integer, in document order.
std::vector<std::pair<std::string, int>> int_table(const toml::table& table,
                                                   std::string_view   key,
                                                   std::string_view   source)
{
    std::vector<std::pair<std::string, int>> entries;
    const toml::node* node = table.get(key);
    if (!node)
        return entries;

    const toml::table* inner = node->as_table();
    if (!inner)
        fail(source, "'" + std::string(key) + "' must be a table", std::string(key));

    for (auto&& [name, value] : *inner)
    {
        auto index = value.value_exact<int64_t>();
        if (!index)
        {
            fail(source,
                 std::string(key) + "." + std::string(name.str()) + " must be an integer",
                 std::string(name.str()));
        }
        entries.emplace_back(std::string(name.str()), to_int(*index));
    }
    return entries;
}

Lch lch_value(const toml::table& table, std::string_view key, const Lch& fallback, std::string_view source)
{
    const toml::node* node = table.get(key);
    if (!node)
        return fallback;

    const toml::array* array = node->as_array();
    if (!array || array->size() != 3)
        fail(source, "'" + std::string(key) + "' must be an array of 3 numbers", std::string(key));

    double values[3];
    for (size_t i = 0; i < 3; ++i)
    {
        auto v = (*array)[i].value<double>();
        if (!v || !std::isfinite(*v))
            fail(source, "'" + std::string(key) + "' must be an array of 3 numbers", std::string(key));
        values[i] = *v;
    }
    return {values[0], values[1], values[2]};
}

toml::array lch_array(const Lch& lch)
{
    return toml::array{lch.lightness, lch.chroma, lch.hue};
}

std::string to_string(const toml::table& table)
{
    std::ostringstream out;
    out << table << "\n";
    return out.str();
}

}   // namespace

// ─── Presets ─────────────────────────────────────────────────────────────────

Theme parse_theme(std::string_view text, std::string_view source)
{
    const toml::table table = parse_toml(text, source);
    std::string       name  = required_string(table, "name", source);

    const toml::array* palette_node = table["palette"].as_array();
    if (!palette_node)
        fail(source, "'palette' must be an array of hex strings", "palette");
    if (palette_node->empty())
        fail(source, "'palette' is empty", "palette");

    std::vector<Color> colors;
    colors.reserve(palette_node->size());
    for (size_t i = 0; i < palette_node->size(); ++i)
        colors.push_back(hex_color((*palette_node)[i], source, "palette[" + std::to_string(i) + "]"));

    const toml::node* accent_node = table.get("accent");
    if (!accent_node)
        fail(source, "missing key 'accent'", "accent");
    Color accent;
    if (auto index = accent_node->value_exact<int64_t>())
    {
        if (*index < 0 || *index >= static_cast<int64_t>(colors.size()))
        {
            fail(source,
                 "accent slot " + std::to_string(*index) + " is outside the palette",
                 "accent");
        }
        accent = colors[static_cast<size_t>(*index)];
    }
    else
    {
        accent = hex_color(*accent_node, source, "accent");
    }

    auto extras = int_table(table, "extras", source);
    TINCTURE_LOG_DEBUG("document",
                       "{}: preset '{}' with {} colors, {} extras",
                       source,
                       name,
                       colors.size(),
                       extras.size());
    return Theme::build_from_entries(std::move(name), Palette(std::move(colors)), accent, extras);
}

std::string serialize_theme(const Theme& theme)
{
    toml::array palette;
    for (const auto& color : theme.palette())
        palette.push_back(color.to_hex());

    toml::table root;
    root.insert_or_assign("name", theme.name());
    root.insert_or_assign("palette", std::move(palette));
    root.insert_or_assign("accent", theme.accent().to_hex());

    if (!theme.extras().empty())
    {
        toml::table extras;
        for (const auto& [key, index] : theme.extras())
            extras.insert_or_assign(key, static_cast<int64_t>(index));
        root.insert_or_assign("extras", std::move(extras));
    }
    return to_string(root);
}

Theme load_theme(const std::filesystem::path& path)
{
    return parse_theme(read_text_file(path), path.string());
}

void save_theme(const Theme& theme, const std::filesystem::path& path)
{
    write_text_file(path, serialize_theme(theme));
}

// ─── Terminal schemes ────────────────────────────────────────────────────────

TerminalScheme parse_scheme(std::string_view text, std::string_view source, const TerminalScheme& base)
{
    const toml::table table  = parse_toml(text, source);
    TerminalScheme    scheme = base;

    if (auto name = optional_string(table, "space", source))
    {
        auto space = parse_color_space(*name);
        if (!space)
            fail(source, "unknown color space '" + *name + "'", "space");
        scheme.space = *space;
    }

    if (const toml::node* node = table.get("hdr_white"))
    {
        auto white = node->value<double>();
        if (!white || !std::isfinite(*white) || *white <= 0.0)
            fail(source, "'hdr_white' must be a positive number", "hdr_white");
        scheme.options.hdr_white = *white;
    }

    scheme.foreground      = lch_value(table, "foreground", scheme.foreground, source);
    scheme.background      = lch_value(table, "background", scheme.background, source);
    scheme.spectrum        = lch_value(table, "spectrum", scheme.spectrum, source);
    scheme.spectrum_bright = lch_value(table, "spectrum_bright", scheme.spectrum_bright, source);

    if (const toml::node* node = table.get("accent"))
    {
        auto accent = node->value_exact<int64_t>();
        if (!accent || *accent < 0 || *accent >= static_cast<int64_t>(TERMINAL_PALETTE_SIZE))
            fail(source, "'accent' must be a slot between 0 and 15", "accent");
        scheme.accent = static_cast<int>(*accent);
    }
    return scheme;
}

std::string serialize_scheme(const TerminalScheme& scheme)
{
    toml::table root;
    root.insert_or_assign("space", std::string(color_space_name(scheme.space)));
    root.insert_or_assign("hdr_white", scheme.options.hdr_white);
    root.insert_or_assign("foreground", lch_array(scheme.foreground));
    root.insert_or_assign("background", lch_array(scheme.background));
    root.insert_or_assign("spectrum", lch_array(scheme.spectrum));
    root.insert_or_assign("spectrum_bright", lch_array(scheme.spectrum_bright));
    root.insert_or_assign("accent", static_cast<int64_t>(scheme.accent));
    return to_string(root);
}

TerminalScheme load_scheme(const std::filesystem::path& path, const TerminalScheme& base)
{
    return parse_scheme(read_text_file(path), path.string(), base);
}

void save_scheme(const TerminalScheme& scheme, const std::filesystem::path& path)
{
    write_text_file(path, serialize_scheme(scheme));
}

// ─── Exporter sources ────────────────────────────────────────────────────────

ExporterTemplate parse_exporter_document(std::string_view text, std::string_view source)
{
    const toml::table table = parse_toml(text, source);

    std::string name = required_string(table, "name", source);
    if (name.empty())
        fail(source, "'name' is empty", "name");
    std::string path      = optional_string(table, "path", source).value_or("");
    std::string formatter = required_string(table, "formatter", source);

    std::map<std::string, int> hints;
    for (auto& [extra, slot] : int_table(table, "extras", source))
        hints.emplace(std::move(extra), slot);

    return parse_template_with_hints(std::move(name), formatter, hints, std::move(path));
}

ExporterTemplate load_exporter(const std::filesystem::path& path)
{
    return parse_exporter_document(read_text_file(path), path.string());
}

// ─── Files ───────────────────────────────────────────────────────────────────

std::string read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw Error(ErrorKind::Io, "cannot open '" + path.string() + "' for reading", path.string());

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad())
        throw Error(ErrorKind::Io, "error while reading '" + path.string() + "'", path.string());
    return contents.str();
}

void write_text_file(const std::filesystem::path& path, std::string_view text)
{
    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw Error(ErrorKind::Io,
                        "cannot create '" + path.parent_path().string() + "': " + ec.message(),
                        path.string());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw Error(ErrorKind::Io, "cannot open '" + path.string() + "' for writing", path.string());
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
        throw Error(ErrorKind::Io, "error while writing '" + path.string() + "'", path.string());

    TINCTURE_LOG_DEBUG("document", "wrote {} bytes to {}", text.size(), path.string());
}

}   // namespace tincture
