#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include <tincture/color_space.hpp>
#include <tincture/logger.hpp>

namespace tincture
{

// User settings from $XDG_CONFIG_HOME/tincture/config.toml
// (or $HOME/.config/tincture/config.toml):
//
//   log_level     = "info"
//   space         = "oklab"
//   hdr_white     = 203.0
//   template_dirs = ["~/.config/tincture/exporters"]
//   palette_size  = 16
//
// Environment overrides: TINCTURE_LOG_LEVEL, TINCTURE_TEMPLATE_DIR (replaces
// template_dirs).
struct Config
{
    LogLevel                           log_level    = LogLevel::Info;
    ColorSpace                         space        = ColorSpace::Oklab;
    double                             hdr_white    = DEFAULT_HDR_WHITE;
    std::vector<std::filesystem::path> template_dirs;
    int                                palette_size = 16;

    ConversionOptions conversion_options() const { return {hdr_white}; }

    // Directory holding config.toml; empty when neither XDG_CONFIG_HOME nor
    // HOME is set.
    static std::filesystem::path config_dir();
    static std::filesystem::path default_path();

    // Built-in settings, with template_dirs = {config_dir()/exporters}.
    static Config defaults();

    // Keys absent from `text` keep their default. Throws
    // Error(InvalidDocument) for syntax errors, wrong types, unknown level or
    // space names, hdr_white <= 0 and palette_size <= 0.
    static Config parse(std::string_view text, std::string_view source = "<config>");

    // Missing file -> defaults().
    static Config load(const std::filesystem::path& path);

    // load(default_path()) followed by apply_environment().
    static Config load_default();

    // Invalid TINCTURE_LOG_LEVEL values are logged and ignored.
    void apply_environment();
};

}   // namespace tincture
