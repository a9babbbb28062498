#include <tincture/exporter_registry.hpp>

#include <tincture/document.hpp>
#include <tincture/error.hpp>
#include <tincture/logger.hpp>

#include <algorithm>

#include "builtin_exporters.hpp"

namespace tincture
{

void ExporterRegistry::register_template(ExporterTemplate tmpl)
{
    auto        shared = std::make_shared<const ExporterTemplate>(std::move(tmpl));
    std::string name   = shared->name();

    std::lock_guard lock(mutex_);
    const bool      replaced = templates_.contains(name);
    templates_.insert_or_assign(name, std::move(shared));
    TINCTURE_LOG_DEBUG("registry", "{} exporter '{}'", replaced ? "replaced" : "registered", name);
}

bool ExporterRegistry::unregister_template(std::string_view name)
{
    std::lock_guard lock(mutex_);
    auto            it = templates_.find(name);
    if (it == templates_.end())
        return false;
    templates_.erase(it);
    return true;
}

std::shared_ptr<const ExporterTemplate> ExporterRegistry::find(std::string_view name) const
{
    std::lock_guard lock(mutex_);
    auto            it = templates_.find(name);
    return it != templates_.end() ? it->second : nullptr;
}

std::vector<std::string> ExporterRegistry::names() const
{
    std::lock_guard          lock(mutex_);
    std::vector<std::string> result;
    result.reserve(templates_.size());
    for (const auto& [name, tmpl] : templates_)
        result.push_back(name);
    return result;
}

size_t ExporterRegistry::count() const
{
    std::lock_guard lock(mutex_);
    return templates_.size();
}

void ExporterRegistry::clear()
{
    std::lock_guard lock(mutex_);
    templates_.clear();
}

size_t ExporterRegistry::load_builtins()
{
    size_t loaded = 0;
    for (const auto& builtin : detail::builtin_exporters())
    {
        register_template(parse_exporter_document(builtin.source, builtin.id));
        ++loaded;
    }
    TINCTURE_LOG_DEBUG("registry", "loaded {} built-in exporters", loaded);
    return loaded;
}

std::vector<ExporterLoadFailure> ExporterRegistry::load_directory(const std::filesystem::path& dir)
{
    namespace fs = std::filesystem;

    std::vector<ExporterLoadFailure> failures;
    std::error_code                  ec;
    if (!fs::exists(dir, ec))
    {
        TINCTURE_LOG_DEBUG("registry", "exporter directory {} does not exist", dir.string());
        return failures;
    }
    if (!fs::is_directory(dir, ec))
        throw Error(ErrorKind::Io, "'" + dir.string() + "' is not a directory", dir.string());

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->path().extension() == ".toml" && it->is_regular_file(ec))
            files.push_back(it->path());
    }
    if (ec)
        throw Error(ErrorKind::Io, "cannot list '" + dir.string() + "': " + ec.message(), dir.string());
    std::sort(files.begin(), files.end());

    for (const auto& file : files)
    {
        try
        {
            register_template(load_exporter(file));
        }
        catch (const Error& e)
        {
            TINCTURE_LOG_WARN("registry", "skipping exporter {}: {}", file.string(), e.what());
            failures.push_back({file, e.what()});
        }
    }

    TINCTURE_LOG_INFO("registry",
                      "loaded {} of {} exporters from {}",
                      files.size() - failures.size(),
                      files.size(),
                      dir.string());
    return failures;
}

}   // namespace tincture
