#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <tincture/document.hpp>
#include <tincture/error.hpp>
#include <tincture/logger.hpp>
#include <vector>

#include "cli/cli.hpp"

using namespace tincture;

class CliTest : public ::testing::Test
{
   protected:
    std::filesystem::path dir;
    Config                config;
    std::ostringstream    out;
    std::ostringstream    err;
    LogLevel              saved_level = LogLevel::Info;

    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path()
              / (std::string("tincture_test_")
                 + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir / "exporters");

        config.template_dirs = {dir / "exporters"};
        saved_level          = Logger::instance().get_level();
    }

    void TearDown() override
    {
        Logger::instance().set_level(saved_level);
        std::filesystem::remove_all(dir);
    }

    int run(std::vector<std::string> args)
    {
        out.str("");
        err.str("");
        args.insert(args.begin(), "tincture");
        return cli::run(args, [this] { return config; }, out, err);
    }

    void write(const std::filesystem::path& path, std::string_view text)
    {
        std::ofstream file(path);
        file << text;
    }
};

// ─── Commands ────────────────────────────────────────────────────────────────

TEST_F(CliTest, GenerateThenRender)
{
    const auto preset = dir / "dusk.toml";
    ASSERT_EQ(run({"generate", "--base", "3a6ea5", "--name", "dusk", "-o", preset.string()}), 0)
        << err.str();
    EXPECT_TRUE(out.str().empty());

    const Theme theme = load_theme(preset);
    EXPECT_EQ(theme.name(), "dusk");
    EXPECT_EQ(theme.palette().size(), 16u);
    EXPECT_EQ(theme.accent(), theme.palette()[11]);

    write(dir / "exporters" / "mini.toml",
          "name = \"mini\"\nformatter = \"bg={HEX0} acc={ACCHEX} name={NAME}\"\n");
    ASSERT_EQ(run({"render", "--theme", preset.string(), "--exporter", "mini"}), 0) << err.str();
    EXPECT_EQ(out.str(),
              "bg=" + theme.palette()[0].to_hex() + " acc=" + theme.accent().to_hex()
                  + " name=dusk");
}

TEST_F(CliTest, GenerateToStdoutUsesConfigPaletteSize)
{
    config.palette_size = 8;
    ASSERT_EQ(run({"generate", "--base", "#c82828", "--space", "lab"}), 0) << err.str();

    const Theme theme = parse_theme(out.str());
    EXPECT_EQ(theme.name(), "tincture");
    EXPECT_EQ(theme.palette().size(), 8u);
    EXPECT_EQ(theme.accent(), theme.palette()[7]);
}

TEST_F(CliTest, AdoptExtrasFillsMissingExtras)
{
    const auto preset = dir / "plain.toml";
    ASSERT_EQ(run({"generate", "--base", "3a6ea5", "-o", preset.string()}), 0) << err.str();
    const Theme theme = load_theme(preset);
    ASSERT_TRUE(theme.extras().empty());

    EXPECT_EQ(run({"render", "--theme", preset.string(), "--exporter", "vim"}), 1);

    ASSERT_EQ(run({"render", "--theme", preset.string(), "--exporter", "vim", "--adopt-extras"}),
              0)
        << err.str();
    EXPECT_NE(out.str().find("let s:constant = '#" + theme.palette()[3].to_hex() + "'"),
              std::string::npos)
        << out.str();
}

TEST_F(CliTest, AdoptExtrasKeepsThemeValues)
{
    const auto preset = dir / "own.toml";
    ASSERT_EQ(run({"generate", "--base", "3a6ea5", "-o", preset.string()}), 0) << err.str();
    Theme::Extras extras = {{"CONSTANT", 9}};
    save_theme(load_theme(preset).with_extras(extras), preset);
    const Theme theme = load_theme(preset);

    ASSERT_EQ(run({"render", "--theme", preset.string(), "--exporter", "vim", "--adopt-extras"}),
              0)
        << err.str();
    EXPECT_NE(out.str().find("let s:constant = '#" + theme.palette()[9].to_hex() + "'"),
              std::string::npos)
        << out.str();
}

TEST_F(CliTest, SchemeKeepsConfiguredHdrWhite)
{
    const auto scheme_path = dir / "scheme.toml";
    write(scheme_path, R"(
space = "jzazbz"
foreground = [0.2, 0.0, 0.0]
background = [0.01, 0.003, 250.0]
spectrum = [0.08, 0.01, 20.0]
spectrum_bright = [0.12, 0.015, 20.0]
)");
    config.hdr_white = 400.0;
    ASSERT_EQ(run({"scheme", scheme_path.string(), "--name", "hdr"}), 0) << err.str();

    TerminalScheme base;
    base.options.hdr_white = 400.0;
    EXPECT_EQ(out.str(), serialize_theme(load_scheme(scheme_path, base).to_theme("hdr")));
    EXPECT_NE(out.str(), serialize_theme(load_scheme(scheme_path).to_theme("hdr")));
}

TEST_F(CliTest, ListShowsBuiltinsAndUserExporters)
{
    write(dir / "exporters" / "mini.toml", "name = \"mini\"\nformatter = \"{NAME}\"\n");
    ASSERT_EQ(run({"list"}), 0) << err.str();
    EXPECT_NE(out.str().find("mini\t-\t-\n"), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("vim\tcolors/tincture.vim\t"), std::string::npos) << out.str();
}

TEST_F(CliTest, Convert)
{
    ASSERT_EQ(run({"convert", "--from", "hsv", "0", "1", "1"}), 0) << err.str();
    EXPECT_EQ(out.str(), "ff0000\n");
}

// ─── Exit codes ──────────────────────────────────────────────────────────────

TEST_F(CliTest, UsageErrorsExitWithTwo)
{
    const std::vector<std::vector<std::string>> cases = {
        {},
        {"--bogus"},
        {"frobnicate"},
        {"generate"},
        {"generate", "--base", "nothex"},
        {"generate", "--base", "3a6ea5", "--count", "many"},
        {"generate", "--base", "3a6ea5", "--count", "4", "--accent", "4"},
        {"render", "--exporter", "vim"},
        {"render", "--theme", "x.toml", "--exporter", "no_such_exporter"},
        {"convert", "--from", "hsv", "0", "1"},
        {"--log-level", "shouty", "list"},
    };
    for (const auto& args : cases)
    {
        EXPECT_EQ(run(args), 2) << (args.empty() ? "<none>" : args[0]);
        EXPECT_NE(err.str().find("usage: tincture"), std::string::npos);
        EXPECT_TRUE(out.str().empty());
    }
}

TEST_F(CliTest, FailedOperationsExitWithOne)
{
    EXPECT_EQ(run({"render", "--theme", (dir / "absent.toml").string(), "--exporter", "kitty"}), 1);
    EXPECT_EQ(run({"generate", "--base", "3a6ea5", "--count", "0"}), 1);

    write(dir / "bad.toml", "accent = 99\n");
    EXPECT_EQ(run({"scheme", (dir / "bad.toml").string()}), 1);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, HelpSkipsConfig)
{
    std::ostringstream help;
    EXPECT_EQ(cli::run({"tincture", "--help"},
                       []() -> Config { throw Error(ErrorKind::InvalidDocument, "broken"); },
                       help,
                       err),
              0);
    EXPECT_NE(help.str().find("usage: tincture"), std::string::npos);
}

TEST_F(CliTest, BrokenConfigExitsWithOne)
{
    EXPECT_EQ(cli::run({"tincture", "list"},
                       []() -> Config { throw Error(ErrorKind::InvalidDocument, "broken"); },
                       out,
                       err),
              1);
}
