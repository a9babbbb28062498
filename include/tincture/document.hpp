#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <tincture/exporter_template.hpp>
#include <tincture/terminal_scheme.hpp>
#include <tincture/theme.hpp>

namespace tincture
{

// TOML documents. Every parse_* throws Error(InvalidDocument) for TOML
// syntax errors, missing keys, wrong value types and malformed hex; errors
// coming from the built object itself (InvalidExtras, TemplateParseError,
// ...) propagate unchanged. `source` only labels messages.

// ─── Presets ─────────────────────────────────────────────────────────────────
//
//   name    = "Dusk"
//   palette = ["101014", ..., "f0f0f4"]
//   accent  = "e0b050"            # or an integer palette slot
//   [extras]
//   CONSTANT = 3

Theme       parse_theme(std::string_view text, std::string_view source = "<preset>");
std::string serialize_theme(const Theme& theme);
Theme       load_theme(const std::filesystem::path& path);
void        save_theme(const Theme& theme, const std::filesystem::path& path);

// ─── Terminal schemes ────────────────────────────────────────────────────────
//
// All keys optional, defaults from TerminalScheme:
//   space           = "cielab"
//   hdr_white       = 203.0
//   foreground      = [100, 0, 0]       # lightness, chroma, hue
//   background      = [0, 0, 0]
//   spectrum        = [35, 35, 0]
//   spectrum_bright = [65, 65, 0]
//   accent          = 11
//
// Keys absent from the document keep their value from `base`.

TerminalScheme parse_scheme(std::string_view      text,
                            std::string_view      source = "<scheme>",
                            const TerminalScheme& base   = {});
std::string    serialize_scheme(const TerminalScheme& scheme);
TerminalScheme load_scheme(const std::filesystem::path& path, const TerminalScheme& base = {});
void           save_scheme(const TerminalScheme& scheme, const std::filesystem::path& path);

// ─── Exporter sources ────────────────────────────────────────────────────────
//
//   name      = "kitty"
//   path      = "kitty/theme.conf"     # optional
//   extras    = { CONSTANT = 3 }       # optional, extra -> expected slot
//   formatter = '''...'''

ExporterTemplate parse_exporter_document(std::string_view text,
                                         std::string_view source = "<exporter>");
ExporterTemplate load_exporter(const std::filesystem::path& path);

// ─── Files ───────────────────────────────────────────────────────────────────

// Throw Error(Io) naming the path.
std::string read_text_file(const std::filesystem::path& path);
void        write_text_file(const std::filesystem::path& path, std::string_view text);

}   // namespace tincture
