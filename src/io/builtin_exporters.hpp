#pragma once

#include <span>
#include <string_view>

namespace tincture::detail
{

// Exporter sources compiled into the binary, in the same TOML format as
// user exporter files.
struct BuiltinExporter
{
    std::string_view id;
    std::string_view source;
};

std::span<const BuiltinExporter> builtin_exporters();

}   // namespace tincture::detail
