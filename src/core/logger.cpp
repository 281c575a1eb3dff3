/// @file logger.cpp
/// @brief Dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>
#include <vector>

namespace sunpath::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

std::mutex s_init_mutex;
bool s_file_attached = false;

/// @brief Replace any registered logger of the same name.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Explicit init: console + rotating file
// -----------------------------------------------------------------

void Logger::init(const std::filesystem::path& log_file)
{
    std::lock_guard lock(s_init_mutex);
    if (s_core_logger && s_file_attached)
    {
        return;
    }

    // Console sink with color output
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    // Rotating file sink: 5 MB max size, 3 rotated files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    std::string file_error;
    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }
    catch (const spdlog::spdlog_ex& e)
    {
        file_error = e.what();
    }

    // Keep a level chosen before init
    const auto core_level = s_core_logger ? s_core_logger->level() : spdlog::level::info;
    const auto app_level = s_app_logger ? s_app_logger->level() : spdlog::level::info;

    // -----------------------------------------------------------------
    // Core logger ("SUNPATH"): ephemeris engine
    // Application logger ("APP"): report front end, configuration
    // -----------------------------------------------------------------
    s_core_logger = make_logger("SUNPATH", sinks, core_level);
    s_app_logger = make_logger("APP", sinks, app_level);
    s_file_attached = file_error.empty();

    if (!s_file_attached)
    {
        s_core_logger->warn("Logger: Cannot open {} ({}), logging to console only",
                            log_file.string(), file_error);
    }
}

// -----------------------------------------------------------------
// Lazy init: console only, never touches the filesystem
// -----------------------------------------------------------------

void Logger::init_console()
{
    std::lock_guard lock(s_init_mutex);
    if (s_core_logger)
    {
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    const std::vector<spdlog::sink_ptr> sinks{console_sink};
    s_core_logger = make_logger("SUNPATH", sinks, spdlog::level::info);
    s_app_logger = make_logger("APP", sinks, spdlog::level::info);
    s_file_attached = false;
}

void Logger::shutdown()
{
    std::lock_guard lock(s_init_mutex);
    s_core_logger.reset();
    s_app_logger.reset();
    s_file_attached = false;
    spdlog::drop_all();
    spdlog::shutdown();
}

bool Logger::has_file_sink()
{
    std::lock_guard lock(s_init_mutex);
    return s_file_attached;
}

void Logger::set_level(spdlog::level::level_enum level)
{
    get_core_logger()->set_level(level);
    get_app_logger()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    if (!s_core_logger)
    {
        init_console();
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    if (!s_app_logger)
    {
        init_console();
    }
    return s_app_logger;
}

} // namespace sunpath::core
