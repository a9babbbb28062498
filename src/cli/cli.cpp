#include "cli/cli.hpp"

#include <tincture/document.hpp>
#include <tincture/error.hpp>
#include <tincture/exporter_registry.hpp>
#include <tincture/logger.hpp>
#include <tincture/tincture.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tincture::cli
{

namespace
{

constexpr const char* USAGE = R"(usage: tincture [--log-level LEVEL] <command> [options]

commands:
  list                                   registered exporters
  generate --base HEX [--space S] [--count N] [--name NAME]
           [--lightness LO:HI] [--hue-span DEG]
           [--chroma C | --chroma-scaled C] [--accent K] [-o FILE]
                                         write a preset from a base color
  scheme [SCHEME.toml] [--name NAME] [-o FILE]
                                         write a preset from a 16-color terminal scheme
  render --theme PRESET.toml --exporter NAME [--adopt-extras] [-o FILE]
                                         render a preset through an exporter
  convert --from SPACE C0 C1 C2          coordinates -> hex
  convert --to SPACE HEX                 hex -> coordinates

spaces: cielab (lab), oklab, jzazbz, hsv
)";

struct UsageError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Cursor over the arguments of one command.
class Args
{
   public:
    Args(const std::vector<std::string>& argv, size_t first)
        : args_(argv.begin() + static_cast<std::ptrdiff_t>(first), argv.end())
    {
    }

    bool             done() const { return pos_ >= args_.size(); }
    std::string_view next() { return args_[pos_++]; }

    std::string value(std::string_view flag)
    {
        if (done())
            throw UsageError(std::string(flag) + " needs a value");
        return std::string(next());
    }

   private:
    std::vector<std::string_view> args_;
    size_t                        pos_ = 0;
};

double parse_number(const std::string& text, std::string_view what)
{
    errno      = 0;
    char*  end = nullptr;
    double v   = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0' || errno == ERANGE)
        throw UsageError("invalid number for " + std::string(what) + ": '" + text + "'");
    return v;
}

int parse_int(const std::string& text, std::string_view what)
{
    errno     = 0;
    char* end = nullptr;
    long  v   = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE || v < INT32_MIN || v > INT32_MAX)
        throw UsageError("invalid integer for " + std::string(what) + ": '" + text + "'");
    return static_cast<int>(v);
}

ColorSpace parse_space(const std::string& text)
{
    auto space = parse_color_space(text);
    if (!space)
        throw UsageError("unknown color space '" + text + "'");
    return *space;
}

// Peak chroma that keeps most hues in gamut at mid lightness.
double default_chroma(ColorSpace space)
{
    switch (space)
    {
        case ColorSpace::CieLab:
            return 40.0;
        case ColorSpace::Oklab:
            return 0.12;
        case ColorSpace::JzAzBz:
            return 0.012;
        case ColorSpace::Hsv:
            return 0.6;
    }
    return 0.0;
}

void emit(std::ostream& out, const std::string& text, const std::optional<std::string>& output)
{
    if (output)
    {
        write_text_file(*output, text);
        TINCTURE_LOG_INFO("cli", "wrote {}", *output);
    }
    else
    {
        out << text;
        out.flush();
    }
}

void load_exporters(ExporterRegistry& registry, const Config& config)
{
    registry.load_builtins();
    for (const auto& dir : config.template_dirs)
    {
        const auto failures = registry.load_directory(dir);
        if (!failures.empty())
            TINCTURE_LOG_WARN("cli", "{} exporter(s) in {} were skipped", failures.size(), dir.string());
    }
}

// ─── Commands ────────────────────────────────────────────────────────────────

int cmd_list(Args& args, const Config& config, std::ostream& out)
{
    if (!args.done())
        throw UsageError("list takes no arguments");

    ExporterRegistry registry;
    load_exporters(registry, config);

    for (const auto& name : registry.names())
    {
        auto        tmpl = registry.find(name);
        std::string extras;
        for (const auto& extra : tmpl->required_extras())
        {
            if (!extras.empty())
                extras += ",";
            extras += extra;
        }
        out << name << "\t" << (tmpl->path_hint().empty() ? "-" : tmpl->path_hint()) << "\t"
                  << (extras.empty() ? "-" : extras) << "\n";
    }
    return 0;
}

int cmd_generate(Args& args, const Config& config, std::ostream& out)
{
    std::optional<Color>        base;
    ColorSpace                  space    = config.space;
    int                         count    = config.palette_size;
    std::string                 name     = "tincture";
    double                      lo       = 0.08;
    double                      hi       = 0.95;
    double                      hue_span = 360.0;
    std::optional<ChromaPolicy> chroma;
    std::optional<int>          accent;
    std::optional<std::string>  output;

    while (!args.done())
    {
        const std::string_view arg = args.next();
        if (arg == "--base")
        {
            const std::string hex = args.value(arg);
            base                  = Color::from_hex(hex);
            if (!base)
                throw UsageError("invalid hex color '" + hex + "'");
        }
        else if (arg == "--space")
            space = parse_space(args.value(arg));
        else if (arg == "--count")
            count = parse_int(args.value(arg), arg);
        else if (arg == "--name")
            name = args.value(arg);
        else if (arg == "--lightness")
        {
            const std::string range = args.value(arg);
            const auto        colon = range.find(':');
            if (colon == std::string::npos)
                throw UsageError("--lightness expects LO:HI, got '" + range + "'");
            lo = parse_number(range.substr(0, colon), arg);
            hi = parse_number(range.substr(colon + 1), arg);
        }
        else if (arg == "--hue-span")
            hue_span = parse_number(args.value(arg), arg);
        else if (arg == "--chroma")
            chroma = ChromaPolicy::constant(parse_number(args.value(arg), arg));
        else if (arg == "--chroma-scaled")
            chroma = ChromaPolicy::scaled(parse_number(args.value(arg), arg));
        else if (arg == "--accent")
            accent = parse_int(args.value(arg), arg);
        else if (arg == "-o" || arg == "--output")
            output = args.value(arg);
        else
            throw UsageError("generate: unknown option '" + std::string(arg) + "'");
    }
    if (!base)
        throw UsageError("generate needs --base HEX");

    const ConversionOptions options = config.conversion_options();

    PaletteRequest request;
    request.base      = *base;
    request.space     = space;
    request.count     = count;
    request.lightness = linear_lightness(space, count, lo, hi, options);
    request.hue       = HuePolicy::equal_steps(hue_span);
    request.chroma    = chroma.value_or(ChromaPolicy::scaled(default_chroma(space)));
    request.options   = options;
    const Palette palette = generate_palette(request);

    const int accent_slot = accent.value_or(std::min(11, count - 1));
    if (accent_slot < 0 || accent_slot >= count)
        throw UsageError("--accent " + std::to_string(accent_slot) + " is not a palette slot");

    const Theme theme = Theme::build(name, palette, palette[static_cast<size_t>(accent_slot)]);
    emit(out, serialize_theme(theme), output);
    return 0;
}

int cmd_scheme(Args& args, const Config& config, std::ostream& out)
{
    std::optional<std::string> scheme_path;
    std::string                name = "tincture";
    std::optional<std::string> output;

    while (!args.done())
    {
        const std::string_view arg = args.next();
        if (arg == "--name")
            name = args.value(arg);
        else if (arg == "-o" || arg == "--output")
            output = args.value(arg);
        else if (!arg.starts_with("-") && !scheme_path)
            scheme_path = std::string(arg);
        else
            throw UsageError("scheme: unexpected argument '" + std::string(arg) + "'");
    }

    TerminalScheme scheme;
    scheme.options = config.conversion_options();
    if (scheme_path)
        scheme = load_scheme(*scheme_path, scheme);

    emit(out, serialize_theme(scheme.to_theme(name)), output);
    return 0;
}

int cmd_render(Args& args, const Config& config, std::ostream& out)
{
    std::optional<std::string> theme_path;
    std::optional<std::string> exporter;
    bool                       adopt_extras = false;
    std::optional<std::string> output;

    while (!args.done())
    {
        const std::string_view arg = args.next();
        if (arg == "--theme")
            theme_path = args.value(arg);
        else if (arg == "--exporter")
            exporter = args.value(arg);
        else if (arg == "--adopt-extras")
            adopt_extras = true;
        else if (arg == "-o" || arg == "--output")
            output = args.value(arg);
        else
            throw UsageError("render: unknown option '" + std::string(arg) + "'");
    }
    if (!theme_path || !exporter)
        throw UsageError("render needs --theme and --exporter");

    ExporterRegistry registry;
    load_exporters(registry, config);
    auto tmpl = registry.find(*exporter);
    if (!tmpl)
        throw UsageError("no exporter named '" + *exporter + "' (see 'tincture list')");

    Theme theme = load_theme(*theme_path);
    if (adopt_extras)
    {
        Theme::Extras extras = theme.extras();
        for (const auto& [key, slot] : tmpl->extra_hints())
            extras.emplace(key, slot);
        theme = theme.with_extras(std::move(extras));
    }

    const RenderedDocument doc = tmpl->render(theme);
    if (!output && !doc.path_hint.empty())
        TINCTURE_LOG_INFO("cli", "'{}' usually lives at {}", tmpl->name(), doc.path_hint);
    emit(out, doc.text, output);
    return 0;
}

int cmd_convert(Args& args, const Config& config, std::ostream& out)
{
    std::optional<ColorSpace> from;
    std::optional<ColorSpace> to;
    std::vector<std::string>  values;

    while (!args.done())
    {
        const std::string_view arg = args.next();
        if (arg == "--from")
            from = parse_space(args.value(arg));
        else if (arg == "--to")
            to = parse_space(args.value(arg));
        else if (arg.starts_with("--"))
            throw UsageError("convert: unknown option '" + std::string(arg) + "'");
        else
            values.emplace_back(arg);
    }

    const ConversionOptions options = config.conversion_options();
    if (from && !to && values.size() == 3)
    {
        const Coords coords = {parse_number(values[0], "C0"),
                               parse_number(values[1], "C1"),
                               parse_number(values[2], "C2")};
        if (!in_gamut(*from, coords, options))
            TINCTURE_LOG_INFO("cli", "coordinates are outside sRGB, chroma reduced");
        out << to_hex(to_srgb(*from, coords, options)) << "\n";
        return 0;
    }
    if (to && !from && values.size() == 1)
    {
        auto rgb = parse_hex(values[0]);
        if (!rgb)
            throw UsageError("invalid hex color '" + values[0] + "'");
        const Coords c = from_srgb(*to, *rgb, options);
        char         line[128];
        std::snprintf(line, sizeof(line), "%.6f %.6f %.6f\n", c[0], c[1], c[2]);
        out << line;
        return 0;
    }
    throw UsageError("convert needs either --from SPACE C0 C1 C2 or --to SPACE HEX");
}

}   // namespace

int run(const std::vector<std::string>& argv,
        const std::function<Config()>&  load_config,
        std::ostream&                   out,
        std::ostream&                   err)
{
    size_t                     first = 1;
    std::optional<std::string> log_level;
    while (first < argv.size() && std::string_view(argv[first]).starts_with("--"))
    {
        const std::string_view arg = argv[first];
        if (arg == "--help")
        {
            out << USAGE;
            return 0;
        }
        if (arg == "--log-level" && first + 1 < argv.size())
        {
            log_level = argv[first + 1];
            first += 2;
            continue;
        }
        err << "tincture: unknown option '" << arg << "'\n\n" << USAGE;
        return 2;
    }
    if (first >= argv.size())
    {
        err << USAGE;
        return 2;
    }

    try
    {
        Config config = load_config();
        if (log_level)
        {
            auto level = parse_log_level(*log_level);
            if (!level)
                throw UsageError("unknown log level '" + *log_level + "'");
            config.log_level = *level;
        }
        Logger::instance().set_level(config.log_level);

        const std::string_view command = argv[first];
        Args                   args(argv, first + 1);
        if (command == "list")
            return cmd_list(args, config, out);
        if (command == "generate")
            return cmd_generate(args, config, out);
        if (command == "scheme")
            return cmd_scheme(args, config, out);
        if (command == "render")
            return cmd_render(args, config, out);
        if (command == "convert")
            return cmd_convert(args, config, out);
        if (command == "help")
        {
            out << USAGE;
            return 0;
        }
        throw UsageError("unknown command '" + std::string(command) + "'");
    }
    catch (const UsageError& e)
    {
        err << "tincture: " << e.what() << "\n\n" << USAGE;
        return 2;
    }
    catch (const Error& e)
    {
        TINCTURE_LOG_ERROR("cli", "{} ({})", e.what(), error_kind_name(e.kind()));
        return 1;
    }
    catch (const std::exception& e)
    {
        TINCTURE_LOG_CRITICAL("cli", "{}", e.what());
        return 1;
    }
}

}   // namespace tincture::cli
