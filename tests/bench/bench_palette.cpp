#include <benchmark/benchmark.h>
#include <string>
#include <tincture/tincture.hpp>
#include <vector>

using namespace tincture;

static void BM_ToSrgb_InGamut(benchmark::State& state)
{
    const auto space = static_cast<ColorSpace>(state.range(0));
    const Coords c   = from_srgb(space, Rgb8{90, 140, 200});

    for (auto _ : state)
    {
        Rgb8 rgb = to_srgb(space, c);
        benchmark::DoNotOptimize(rgb);
    }
    state.SetLabel(std::string(color_space_name(space)));
}
BENCHMARK(BM_ToSrgb_InGamut)->DenseRange(0, 3);

static void BM_ToSrgb_GamutMapped(benchmark::State& state)
{
    const Coords c = from_polar(ColorSpace::CieLab, {55.0, 200.0, 290.0});

    for (auto _ : state)
    {
        Rgb8 rgb = to_srgb(ColorSpace::CieLab, c);
        benchmark::DoNotOptimize(rgb);
    }
}
BENCHMARK(BM_ToSrgb_GamutMapped);

static void BM_GeneratePalette(benchmark::State& state)
{
    const int count = static_cast<int>(state.range(0));

    PaletteRequest request;
    request.base      = Color::from_rgb8(58, 110, 165);
    request.space     = ColorSpace::Oklab;
    request.count     = count;
    request.lightness = linear_lightness(ColorSpace::Oklab, count, 0.08, 0.95);
    request.chroma    = ChromaPolicy::scaled(0.15);

    for (auto _ : state)
    {
        Palette palette = generate_palette(request);
        benchmark::DoNotOptimize(palette);
    }
    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_GeneratePalette)->Arg(16)->Arg(256);

static void BM_TerminalScheme(benchmark::State& state)
{
    const TerminalScheme scheme;

    for (auto _ : state)
    {
        Palette palette = scheme.compute();
        benchmark::DoNotOptimize(palette);
    }
}
BENCHMARK(BM_TerminalScheme);

static void BM_RenderTemplate(benchmark::State& state)
{
    std::string body;
    for (int i = 0; i < 16; ++i)
        body += "color" + std::to_string(i) + " #{HEX" + std::to_string(i) + "}\n";
    body += "cursor #{ACCHEX}\n# {NAME}\n";

    const ExporterTemplate tmpl  = parse_template("bench", body, {});
    const Theme            theme = TerminalScheme{}.to_theme("Bench");

    for (auto _ : state)
    {
        RenderedDocument doc = tmpl.render(theme);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(body.size()));
}
BENCHMARK(BM_RenderTemplate);
