#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <tincture/error.hpp>
#include <tincture/exporter_template.hpp>
#include <vector>

using namespace tincture;

namespace
{

// 16 slots: 0 black, 3 #112233, 15 white, the rest mid gray. Accent #ff00ff.
Theme make_theme(Theme::Extras extras = {})
{
    std::vector<Color> colors(16, Color::from_rgb8(128, 128, 128));
    colors[0]  = Color::from_rgb8(0, 0, 0);
    colors[3]  = Color::from_rgb8(0x11, 0x22, 0x33);
    colors[15] = Color::from_rgb8(255, 255, 255);
    return Theme::build("Test",
                        Palette(std::move(colors)),
                        Color::from_rgb8(255, 0, 255),
                        std::move(extras));
}

std::string render(std::string_view raw, const std::set<std::string>& extras, const Theme& theme)
{
    return parse_template("t", raw, extras).render(theme).text;
}

template <typename Fn>
Error expect_error(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const Error& e)
    {
        return e;
    }
    ADD_FAILURE() << "expected tincture::Error";
    return Error(ErrorKind::Io, "no error");
}

}   // namespace

// ─── Substitution ────────────────────────────────────────────────────────────

TEST(ExporterTemplate, SubstitutesBuiltinPlaceholders)
{
    EXPECT_EQ(render("{NAME} {HEX0} {HEX15} {ACCHEX}", {}, make_theme()),
              "Test 000000 ffffff ff00ff");
}

TEST(ExporterTemplate, SubstitutesDeclaredExtras)
{
    const Theme theme = make_theme({{"CONSTANT", 3}});
    EXPECT_EQ(render("hi Constant guifg=#{CONSTANTHEX}", {"CONSTANT"}, theme),
              "hi Constant guifg=#112233");
}

TEST(ExporterTemplate, RepeatedPlaceholders)
{
    EXPECT_EQ(render("{HEX3}{HEX3}-{NAME}{NAME}", {}, make_theme()), "112233112233-TestTest");
}

TEST(ExporterTemplate, NoPlaceholdersIsIdentity)
{
    const std::string body = "set background=dark\nhi clear\n";
    EXPECT_EQ(render(body, {}, make_theme()), body);
    EXPECT_EQ(render("", {}, make_theme()), "");
}

TEST(ExporterTemplate, UnknownBracesPassThrough)
{
    EXPECT_EQ(render("{UNKNOWN_TOKEN}", {}, make_theme()), "{UNKNOWN_TOKEN}");
    EXPECT_EQ(render("bar { status_command i3status }", {}, make_theme()),
              "bar { status_command i3status }");
    EXPECT_EQ(render("{}", {}, make_theme()), "{}");
    EXPECT_EQ(render("trailing {", {}, make_theme()), "trailing {");
}

TEST(ExporterTemplate, PlaceholdersAreCaseSensitive)
{
    EXPECT_EQ(render("{hex0} {name} {Acchex}", {}, make_theme()), "{hex0} {name} {Acchex}");
}

TEST(ExporterTemplate, LeadingZeroSlotPassesThrough)
{
    EXPECT_EQ(render("{HEX01} {HEX00}", {}, make_theme()), "{HEX01} {HEX00}");
}

TEST(ExporterTemplate, UndeclaredExtraPassesThrough)
{
    const Theme theme = make_theme({{"CONSTANT", 3}});
    EXPECT_EQ(render("{CONSTANTHEX}", {}, theme), "{CONSTANTHEX}");
}

TEST(ExporterTemplate, DoubledBracesKeepOuterPair)
{
    EXPECT_EQ(render("{{HEX0}}", {}, make_theme()), "{000000}");
}

TEST(ExporterTemplate, SubstitutedTextIsNotRescanned)
{
    const Theme theme = make_theme().with_name("{HEX0}");
    EXPECT_EQ(render("name={NAME}", {}, theme), "name={HEX0}");
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(ExporterTemplate, MissingExtraNamesTheKey)
{
    const ExporterTemplate tmpl = parse_template("vim", "{CONSTANTHEX}", {"CONSTANT"});
    const Error            e    = expect_error([&] { tmpl.render(make_theme()); });
    EXPECT_EQ(e.kind(), ErrorKind::MissingExtra);
    EXPECT_EQ(e.subject(), "CONSTANT");
}

TEST(ExporterTemplate, DeclaredExtrasAreRequiredEvenIfUnused)
{
    const ExporterTemplate tmpl = parse_template("t", "{NAME}", {"ERROR"});
    const Error            e    = expect_error([&] { tmpl.validate(make_theme()); });
    EXPECT_EQ(e.kind(), ErrorKind::MissingExtra);
    EXPECT_NO_THROW(tmpl.validate(make_theme({{"ERROR", 1}})));
}

TEST(ExporterTemplate, SlotPastPaletteFailsAtRender)
{
    const ExporterTemplate tmpl = parse_template("t", "{HEX16}", {});
    ASSERT_EQ(tmpl.highest_slot(), 16u);
    const Error e = expect_error([&] { tmpl.render(make_theme()); });
    EXPECT_EQ(e.kind(), ErrorKind::SlotOutOfRange);
    EXPECT_EQ(e.subject(), "HEX16");
}

TEST(ExporterTemplate, SlotPastKnownPaletteFailsAtParse)
{
    const Error e = expect_error([] { parse_template("t", "{HEX15} {HEX16}", {}, {}, 16); });
    EXPECT_EQ(e.kind(), ErrorKind::SlotOutOfRange);
    EXPECT_EQ(e.subject(), "HEX16");
    EXPECT_NO_THROW(parse_template("t", "{HEX15}", {}, {}, 16));
}

TEST(ExporterTemplate, HugeSlotIsOutOfRange)
{
    const ExporterTemplate tmpl = parse_template("t", "{HEX99999999999999999999999}", {});
    const Error            e    = expect_error([&] { tmpl.render(make_theme()); });
    EXPECT_EQ(e.kind(), ErrorKind::SlotOutOfRange);
}

TEST(ExporterTemplate, UnterminatedPlaceholderReportsPosition)
{
    const Error e = expect_error([] { parse_template("kitty", "ok\n  {NAME", {}); });
    EXPECT_EQ(e.kind(), ErrorKind::TemplateParseError);
    EXPECT_EQ(e.subject(), "kitty");
    EXPECT_NE(std::string(e.what()).find("2:3"), std::string::npos) << e.what();
}

TEST(ExporterTemplate, UnterminatedAtEndOfLine)
{
    const Error e = expect_error([] { parse_template("t", "bg {HEX0\nfg {HEX7}", {}); });
    EXPECT_EQ(e.kind(), ErrorKind::TemplateParseError);
    EXPECT_NE(std::string(e.what()).find("1:4"), std::string::npos) << e.what();
}

TEST(ExporterTemplate, NearMissPlaceholdersPassThrough)
{
    const Theme theme = make_theme({{"ERROR", 1}});
    for (const std::string raw :
         {"echo ${NAME:-x}", "{NAME-dark}", "{HEX1 }", "{ACCHEX.x}", "{ERRORHEX }"})
    {
        std::string text;
        ASSERT_NO_THROW(text = render(raw, {"ERROR"}, theme)) << raw;
        EXPECT_EQ(text, raw);
    }
    EXPECT_EQ(render("{NAME{NAME}}", {}, theme), "{NAMETest}");
}

TEST(ExporterTemplate, RejectsBadExtraNames)
{
    for (const std::string bad : {"", "with space", "dash-ed", "ACC"})
    {
        const Error e = expect_error([&] { parse_template("t", "x", {bad}); });
        EXPECT_EQ(e.kind(), ErrorKind::TemplateParseError) << "'" << bad << "'";
    }
}

// ─── Metadata ────────────────────────────────────────────────────────────────

TEST(ExporterTemplate, KeepsMetadata)
{
    const ExporterTemplate tmpl =
        parse_template("vim", "{NAME}{HEX2}{HEX7}", {"ERROR"}, "colors/tincture.vim");
    EXPECT_EQ(tmpl.name(), "vim");
    EXPECT_EQ(tmpl.path_hint(), "colors/tincture.vim");
    EXPECT_EQ(tmpl.body(), "{NAME}{HEX2}{HEX7}");
    EXPECT_EQ(tmpl.required_extras().size(), 1u);
    EXPECT_EQ(tmpl.highest_slot(), 7u);
    EXPECT_TRUE(tmpl.extra_hints().empty());

    const RenderedDocument doc = tmpl.render(make_theme({{"ERROR", 1}}));
    EXPECT_EQ(doc.path_hint, "colors/tincture.vim");
}

TEST(ExporterTemplate, NoSlotsMeansNoHighestSlot)
{
    EXPECT_FALSE(parse_template("t", "{NAME}", {}).highest_slot().has_value());
}

TEST(ExporterTemplate, SegmentsSplitLiteralsAndPlaceholders)
{
    using Kind = ExporterTemplate::Segment::Kind;

    const ExporterTemplate tmpl = parse_template("t", "a{NAME}b{HEX4}{ERRHEX}{X}", {"ERR"});
    const auto&            segs = tmpl.segments();
    ASSERT_EQ(segs.size(), 6u);
    EXPECT_EQ(segs[0].kind, Kind::Literal);
    EXPECT_EQ(segs[0].text, "a");
    EXPECT_EQ(segs[1].kind, Kind::Name);
    EXPECT_EQ(segs[2].kind, Kind::Literal);
    EXPECT_EQ(segs[3].kind, Kind::Slot);
    EXPECT_EQ(segs[3].slot, 4u);
    EXPECT_EQ(segs[4].kind, Kind::Extra);
    EXPECT_EQ(segs[4].text, "ERR");
    EXPECT_EQ(segs[5].kind, Kind::Literal);
    EXPECT_EQ(segs[5].text, "{X}");
}

TEST(ExporterTemplate, HintsDeclareExtras)
{
    const ExporterTemplate tmpl =
        parse_template_with_hints("dunst", "{CRITICALHEX}", {{"CRITICAL", 1}});
    EXPECT_EQ(tmpl.required_extras().count("CRITICAL"), 1u);
    ASSERT_EQ(tmpl.extra_hints().size(), 1u);
    EXPECT_EQ(tmpl.extra_hints().at("CRITICAL"), 1);

    const Theme theme = make_theme(Theme::Extras(tmpl.extra_hints().begin(),
                                                 tmpl.extra_hints().end()));
    EXPECT_EQ(tmpl.render(theme).text, "808080");
}

TEST(ExporterTemplate, NegativeHintIsRejected)
{
    const Error e =
        expect_error([] { parse_template_with_hints("t", "{ERRHEX}", {{"ERR", -1}}); });
    EXPECT_EQ(e.kind(), ErrorKind::TemplateParseError);
    EXPECT_EQ(e.subject(), "ERR");
}

// ─── Sharing ─────────────────────────────────────────────────────────────────

TEST(ExporterTemplate, ConcurrentRendersAgree)
{
    const ExporterTemplate tmpl =
        parse_template("t", "{NAME}:{HEX0}:{HEX3}:{ERRHEX}:{ACCHEX}", {"ERR"});
    const Theme       theme    = make_theme({{"ERR", 3}});
    const std::string expected = "Test:000000:112233:112233:ff00ff";

    std::vector<std::thread> threads;
    std::vector<int>         mismatches(8, 0);
    for (size_t t = 0; t < mismatches.size(); ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                for (int i = 0; i < 200; ++i)
                {
                    if (tmpl.render(theme).text != expected)
                        ++mismatches[t];
                }
            });
    }
    for (auto& th : threads)
        th.join();

    for (int m : mismatches)
        EXPECT_EQ(m, 0);
}
