#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tincture
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical"
// (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    // Replaces each "{}" in order; surplus placeholders are left as-is and
    // substituted text is never rescanned.
    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos != std::string::npos)
                {
                    std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    search_from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink stderr_sink();
}   // namespace sinks

#define TINCTURE_LOG_TRACE(category, ...)                                             \
    do                                                                                \
    {                                                                                 \
        if (::tincture::Logger::instance().is_enabled(::tincture::LogLevel::Trace))   \
        {                                                                             \
            ::tincture::Logger::instance().log_formatted(::tincture::LogLevel::Trace, \
                                                         category,                    \
                                                         __VA_ARGS__);                \
        }                                                                             \
    } while (0)

#define TINCTURE_LOG_DEBUG(category, ...)                                             \
    do                                                                                \
    {                                                                                 \
        if (::tincture::Logger::instance().is_enabled(::tincture::LogLevel::Debug))   \
        {                                                                             \
            ::tincture::Logger::instance().log_formatted(::tincture::LogLevel::Debug, \
                                                         category,                    \
                                                         __VA_ARGS__);                \
        }                                                                             \
    } while (0)

#define TINCTURE_LOG_INFO(category, ...)                                             \
    do                                                                               \
    {                                                                                \
        if (::tincture::Logger::instance().is_enabled(::tincture::LogLevel::Info))   \
        {                                                                            \
            ::tincture::Logger::instance().log_formatted(::tincture::LogLevel::Info, \
                                                         category,                   \
                                                         __VA_ARGS__);               \
        }                                                                            \
    } while (0)

#define TINCTURE_LOG_WARN(category, ...)                                                \
    do                                                                                  \
    {                                                                                   \
        if (::tincture::Logger::instance().is_enabled(::tincture::LogLevel::Warning))   \
        {                                                                               \
            ::tincture::Logger::instance().log_formatted(::tincture::LogLevel::Warning, \
                                                         category,                      \
                                                         __VA_ARGS__);                  \
        }                                                                               \
    } while (0)

#define TINCTURE_LOG_ERROR(category, ...)                                             \
    do                                                                                \
    {                                                                                 \
        if (::tincture::Logger::instance().is_enabled(::tincture::LogLevel::Error))   \
        {                                                                             \
            ::tincture::Logger::instance().log_formatted(::tincture::LogLevel::Error, \
                                                         category,                    \
                                                         __VA_ARGS__);                \
        }                                                                             \
    } while (0)

#define TINCTURE_LOG_CRITICAL(category, ...)                                             \
    do                                                                                   \
    {                                                                                    \
        if (::tincture::Logger::instance().is_enabled(::tincture::LogLevel::Critical))   \
        {                                                                                \
            ::tincture::Logger::instance().log_formatted(::tincture::LogLevel::Critical, \
                                                         category,                       \
                                                         __VA_ARGS__);                   \
        }                                                                                \
    } while (0)

}   // namespace tincture
