#pragma once

#include <tincture/color.hpp>
#include <tincture/color_space.hpp>
#include <tincture/error.hpp>
#include <tincture/exporter_template.hpp>
#include <tincture/logger.hpp>
#include <tincture/palette.hpp>
#include <tincture/terminal_scheme.hpp>
#include <tincture/theme.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   using namespace tincture;
//   auto base    = *Color::from_hex("3a6ea5");
//   auto palette = generate_palette(base, ColorSpace::Oklab, 16,
//                                   linear_lightness(ColorSpace::Oklab, 16, 0.1, 0.95),
//                                   HuePolicy::equal_steps(),
//                                   ChromaPolicy::scaled(0.12));
//   auto theme   = Theme::build("Harbor", palette, palette[11]);
//   auto tmpl    = parse_template("demo", "bg={HEX0} fg={HEX15}", {});
//   std::cout << tmpl.render(theme).text;
//
// TOML documents, the exporter registry and Config live in tincture_io:
// <tincture/document.hpp>, <tincture/exporter_registry.hpp>,
// <tincture/config.hpp>.
