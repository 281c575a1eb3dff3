// src/main.cpp - SunPath report entry point
//
// Prints the Sun's current direction and today's rise/set/noon for a site:
//  1. Parse command-line options
//  2. Load the site configuration (optional) and apply overrides
//  3. Resolve the time zone and the instant
//  4. Evaluate the ephemeris and render the report panel

#include "astro/time_system.hpp"
#include "astro/time_zone.hpp"
#include "core/logger.hpp"
#include "display/sun_report.hpp"
#include "site/site_config.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace sunpath;

namespace
{

struct CommandLine
{
    std::optional<std::string> config_path;
    std::optional<f64> latitude;
    std::optional<f64> longitude;
    std::optional<i32> utc_offset_minutes;
    bool local_zone = false;
    std::optional<std::string> time;
    bool verbose = false;
};

void print_help()
{
    std::cout << "Usage: sunpath_report [options]\n"
              << "  --config FILE        Site configuration file\n"
              << "  --lat DEG            Latitude, north positive [-90, 90]\n"
              << "  --lon DEG            Longitude, east positive\n"
              << "  --utc-offset MIN     Fixed UTC offset in minutes for the local day\n"
              << "  --local              Use the system time zone for the local day\n"
              << "  --time ISO8601       UTC instant, e.g. 2024-03-20T12:00:00Z (default: now)\n"
              << "  --verbose            Print debug logging\n"
              << "  --help               Print this info\n";
}

template <typename T>
std::optional<T> parse_number(std::string_view text)
{
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1);
    }

    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

/// @return The parsed options, or std::nullopt when the program should exit.
std::optional<CommandLine> parse_command_line(int argc, char** argv, int& exit_code)
{
    CommandLine cmd;
    exit_code = 0;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};

        const auto next_value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc)
            {
                SP_ERROR("No value provided for {}", arg);
                return std::nullopt;
            }
            return std::string_view{argv[++i]};
        };

        if (arg == "--help" || arg == "-h")
        {
            print_help();
            return std::nullopt;
        }

        if (arg == "--verbose")
        {
            cmd.verbose = true;
        }
        else if (arg == "--local")
        {
            cmd.local_zone = true;
        }
        else if (arg == "--config" || arg == "--time")
        {
            const auto value = next_value();
            if (!value)
            {
                exit_code = 1;
                return std::nullopt;
            }
            (arg == "--config" ? cmd.config_path : cmd.time) = std::string{*value};
        }
        else if (arg == "--lat" || arg == "--lon")
        {
            const auto value = next_value();
            const auto degrees = value ? parse_number<f64>(*value) : std::nullopt;
            if (!degrees)
            {
                SP_ERROR("{} expects a number of degrees", arg);
                exit_code = 1;
                return std::nullopt;
            }
            (arg == "--lat" ? cmd.latitude : cmd.longitude) = *degrees;
        }
        else if (arg == "--utc-offset")
        {
            const auto value = next_value();
            const auto minutes = value ? parse_number<i32>(*value) : std::nullopt;
            if (!minutes)
            {
                SP_ERROR("--utc-offset expects whole minutes");
                exit_code = 1;
                return std::nullopt;
            }
            if (!site::SiteConfigLoader::is_valid_utc_offset(*minutes))
            {
                SP_ERROR("UTC offset {} min is outside [-720, 840]", *minutes);
                exit_code = 1;
                return std::nullopt;
            }
            cmd.utc_offset_minutes = *minutes;
        }
        else
        {
            SP_ERROR("Argument not recognized: {}", arg);
            print_help();
            exit_code = 1;
            return std::nullopt;
        }
    }

    return cmd;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    // -----------------------------------------------------------------------
    // 1. Command line
    // -----------------------------------------------------------------------
    int exit_code = 0;
    const auto cmd = parse_command_line(argc, argv, exit_code);
    if (!cmd)
    {
        core::Logger::shutdown();
        return exit_code;
    }

    // -----------------------------------------------------------------------
    // 2. Site configuration + overrides
    // -----------------------------------------------------------------------
    site::SiteConfig config{};
    if (cmd->config_path)
    {
        auto loaded = site::SiteConfigLoader::load(*cmd->config_path);
        if (!loaded)
        {
            core::Logger::shutdown();
            return 1;
        }
        config = std::move(*loaded);
    }

    if (cmd->latitude)
    {
        if (*cmd->latitude < -90.0 || *cmd->latitude > 90.0)
        {
            SP_ERROR("Latitude {} is outside [-90, 90]", *cmd->latitude);
            core::Logger::shutdown();
            return 1;
        }
        config.location.latitude_deg = *cmd->latitude;
        config.name = "Custom site";
    }
    if (cmd->longitude)
    {
        config.location.longitude_deg = astro::GeoCoordinate{0.0, *cmd->longitude}.normalized().longitude_deg;
        config.name = "Custom site";
    }
    if (cmd->utc_offset_minutes)
    {
        config.zone = site::ZoneKind::Fixed;
        config.utc_offset = std::chrono::minutes{*cmd->utc_offset_minutes};
    }
    if (cmd->local_zone)
    {
        config.zone = site::ZoneKind::Local;
    }

    core::Logger::set_level(cmd->verbose ? spdlog::level::debug : config.log_level);

    // -----------------------------------------------------------------------
    // 3. Zone and instant
    // -----------------------------------------------------------------------
    const auto zone = config.make_zone();

    astro::Instant instant = astro::TimeSystem::now();
    if (cmd->time)
    {
        const auto parsed = astro::TimeSystem::parse_iso8601(*cmd->time);
        if (!parsed)
        {
            SP_ERROR("Time '{}' is not of the form YYYY-MM-DDTHH:MM[:SS]Z", *cmd->time);
            core::Logger::shutdown();
            return 1;
        }
        instant = *parsed;
    }

    {
        const auto dt = astro::TimeSystem::to_date_time(instant);
        SP_DEBUG("Report instant: JD {:.6f} ({:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:04.1f} UTC)",
                 astro::TimeSystem::julian_day(instant),
                 dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
        SP_DEBUG("Site: {} ({:.4f}, {:.4f}), zone {}",
                 config.name, config.location.latitude_deg, config.location.longitude_deg, zone->name());
    }

    // -----------------------------------------------------------------------
    // 4. Evaluate and render
    // -----------------------------------------------------------------------
    const auto report = display::SunReport::compute(config.name, config.location, instant, *zone);

    display::ConsoleReport console;
    console.render(std::cout, report, *zone);

    core::Logger::shutdown();
    return 0;
}
