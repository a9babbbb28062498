#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <tincture/exporter_template.hpp>

namespace tincture
{

// Exporter source that could not be loaded.
struct ExporterLoadFailure
{
    std::filesystem::path path;
    std::string           message;
};

// Name -> parsed exporter template.
// Thread-safe: registration and lookup may be called from any thread.
// Templates are handed out as shared, immutable objects and stay valid after
// being replaced or unregistered.
class ExporterRegistry
{
   public:
    ExporterRegistry()  = default;
    ~ExporterRegistry() = default;

    ExporterRegistry(const ExporterRegistry&)            = delete;
    ExporterRegistry& operator=(const ExporterRegistry&) = delete;

    // Registers under tmpl.name(). Replaces an existing entry of that name.
    void register_template(ExporterTemplate tmpl);

    bool unregister_template(std::string_view name);

    // Exact, case-sensitive name. nullptr if not registered.
    std::shared_ptr<const ExporterTemplate> find(std::string_view name) const;

    // Sorted.
    std::vector<std::string> names() const;

    size_t count() const;

    void clear();

    // Registers the exporters compiled into the binary. Returns how many.
    size_t load_builtins();

    // Parses every *.toml file in `dir` (not recursive, in file name order)
    // and registers the valid ones, replacing built-ins of the same name.
    // Invalid files are logged and returned; a missing directory yields no
    // failures. Throws Error(Io) when `dir` exists but is not a directory.
    std::vector<ExporterLoadFailure> load_directory(const std::filesystem::path& dir);

   private:
    mutable std::mutex                                                          mutex_;
    std::map<std::string, std::shared_ptr<const ExporterTemplate>, std::less<>> templates_;
};

}   // namespace tincture
