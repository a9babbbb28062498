#include <tincture/config.hpp>

#include <tincture/document.hpp>
#include <tincture/error.hpp>

#include <cmath>
#include <cstdlib>
#include <toml++/toml.hpp>

namespace tincture
{

namespace
{

const char* env(const char* name)
{
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

[[noreturn]] void fail(std::string_view source, const std::string& message, std::string subject)
{
    throw Error(ErrorKind::InvalidDocument, std::string(source) + ": " + message, std::move(subject));
}

std::filesystem::path expand_home(std::string_view text)
{
    if (text == "~" || text.starts_with("~/"))
    {
        if (const char* home = env("HOME"))
            return std::filesystem::path(home) / std::string(text.substr(text.size() > 1 ? 2 : 1));
    }
    return std::filesystem::path(text);
}

std::string_view string_value(const toml::node& node, std::string_view key, std::string_view source)
{
    auto value = node.value<std::string_view>();
    if (!value)
        fail(source, "'" + std::string(key) + "' must be a string", std::string(key));
    return *value;
}

}   // namespace

std::filesystem::path Config::config_dir()
{
    if (const char* xdg = env("XDG_CONFIG_HOME"))
        return std::filesystem::path(xdg) / "tincture";
    if (const char* home = env("HOME"))
        return std::filesystem::path(home) / ".config" / "tincture";
    return {};
}

std::filesystem::path Config::default_path()
{
    const auto dir = config_dir();
    return dir.empty() ? std::filesystem::path() : dir / "config.toml";
}

Config Config::defaults()
{
    Config config;
    const auto dir = config_dir();
    if (!dir.empty())
        config.template_dirs.push_back(dir / "exporters");
    return config;
}

Config Config::parse(std::string_view text, std::string_view source)
{
    toml::table table;
    try
    {
        table = toml::parse(text, source);
    }
    catch (const toml::parse_error& err)
    {
        fail(source,
             std::string(err.description()) + " (line " + std::to_string(err.source().begin.line)
                 + ")",
             {});
    }

    Config config = defaults();

    if (const toml::node* node = table.get("log_level"))
    {
        const auto name  = string_value(*node, "log_level", source);
        auto       level = parse_log_level(name);
        if (!level)
            fail(source, "unknown log level '" + std::string(name) + "'", "log_level");
        config.log_level = *level;
    }

    if (const toml::node* node = table.get("space"))
    {
        const auto name  = string_value(*node, "space", source);
        auto       space = parse_color_space(name);
        if (!space)
            fail(source, "unknown color space '" + std::string(name) + "'", "space");
        config.space = *space;
    }

    if (const toml::node* node = table.get("hdr_white"))
    {
        auto white = node->value<double>();
        if (!white || !std::isfinite(*white) || *white <= 0.0)
            fail(source, "'hdr_white' must be a positive number", "hdr_white");
        config.hdr_white = *white;
    }

    if (const toml::node* node = table.get("palette_size"))
    {
        auto size = node->value_exact<int64_t>();
        if (!size || *size <= 0 || *size > 4096)
            fail(source, "'palette_size' must be an integer between 1 and 4096", "palette_size");
        config.palette_size = static_cast<int>(*size);
    }

    if (const toml::node* node = table.get("template_dirs"))
    {
        const toml::array* dirs = node->as_array();
        if (!dirs)
            fail(source, "'template_dirs' must be an array of strings", "template_dirs");
        config.template_dirs.clear();
        for (const auto& dir : *dirs)
            config.template_dirs.push_back(expand_home(string_value(dir, "template_dirs", source)));
    }

    return config;
}

Config Config::load(const std::filesystem::path& path)
{
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec))
    {
        TINCTURE_LOG_DEBUG("config", "no config file at '{}', using defaults", path.string());
        return defaults();
    }
    return parse(read_text_file(path), path.string());
}

Config Config::load_default()
{
    Config config = load(default_path());
    config.apply_environment();
    return config;
}

void Config::apply_environment()
{
    if (const char* value = env("TINCTURE_LOG_LEVEL"))
    {
        if (auto level = parse_log_level(value))
            log_level = *level;
        else
            TINCTURE_LOG_WARN("config", "ignoring unknown TINCTURE_LOG_LEVEL '{}'", value);
    }

    if (const char* value = env("TINCTURE_TEMPLATE_DIR"))
        template_dirs = {expand_home(value)};
}

}   // namespace tincture
