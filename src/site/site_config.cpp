/// @file site_config.cpp
/// @brief Implementation of the site configuration loader.

#include "site/site_config.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <fstream>
#include <string>

namespace sunpath::site
{

std::unique_ptr<astro::TimeZone> SiteConfig::make_zone() const
{
    if (zone == ZoneKind::Local)
    {
        return std::make_unique<astro::SystemLocalZone>();
    }
    return std::make_unique<astro::FixedOffsetZone>(utc_offset);
}

// -----------------------------------------------------------------
// Load from file
// -----------------------------------------------------------------

std::optional<SiteConfig> SiteConfigLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SP_ERROR("SiteConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    SiteConfig config = parse(file, path.string());
    SP_INFO("SiteConfigLoader: Loaded site '{}' ({:.4f}, {:.4f}) from {}",
            config.name, config.location.latitude_deg, config.location.longitude_deg, path.string());

    return config;
}

// -----------------------------------------------------------------
// Parse `key = value` lines
// -----------------------------------------------------------------

SiteConfig SiteConfigLoader::parse(std::istream& input, std::string_view source)
{
    SiteConfig config{};
    std::string line;
    u32 line_number = 0;
    u32 skipped = 0;

    while (std::getline(input, line))
    {
        ++line_number;

        std::string_view content{line};
        const auto comment = content.find('#');
        if (comment != std::string_view::npos)
        {
            content = content.substr(0, comment);
        }
        content = trim(content);

        if (content.empty())
        {
            continue;
        }

        const auto separator = content.find('=');
        if (separator == std::string_view::npos)
        {
            SP_WARN("SiteConfigLoader: {}:{}: Missing '=' in line: {}", source, line_number, line);
            ++skipped;
            continue;
        }

        const auto key   = trim(content.substr(0, separator));
        const auto value = trim(content.substr(separator + 1));

        if (!apply(config, key, value))
        {
            SP_WARN("SiteConfigLoader: {}:{}: Ignoring '{}' = '{}'", source, line_number, key, value);
            ++skipped;
        }
    }

    if (skipped > 0)
    {
        SP_WARN("SiteConfigLoader: Skipped {} invalid lines in {}", skipped, source);
    }

    return config;
}

bool SiteConfigLoader::is_valid_utc_offset(i32 minutes)
{
    // Real-world offsets span UTC-12:00 .. UTC+14:00
    return minutes >= -12 * 60 && minutes <= 14 * 60;
}

bool SiteConfigLoader::apply(SiteConfig& config, std::string_view key, std::string_view value)
{
    if (key == "name")
    {
        if (value.empty())
        {
            return false;
        }
        config.name = std::string{value};
        return true;
    }

    if (key == "latitude")
    {
        const auto latitude = parse_f64(value);
        if (!latitude || *latitude < -90.0 || *latitude > 90.0)
        {
            return false;
        }
        config.location.latitude_deg = *latitude;
        return true;
    }

    if (key == "longitude")
    {
        const auto longitude = parse_f64(value);
        if (!longitude)
        {
            return false;
        }
        config.location.longitude_deg = astro::GeoCoordinate{0.0, *longitude}.normalized().longitude_deg;
        return true;
    }

    if (key == "utc_offset_minutes")
    {
        const auto offset = parse_i32(value);
        if (!offset || !is_valid_utc_offset(*offset))
        {
            return false;
        }
        config.utc_offset = std::chrono::minutes{*offset};
        return true;
    }

    if (key == "zone")
    {
        if (value == "fixed")
        {
            config.zone = ZoneKind::Fixed;
            return true;
        }
        if (value == "local")
        {
            config.zone = ZoneKind::Local;
            return true;
        }
        return false;
    }

    if (key == "log_level")
    {
        const auto level = spdlog::level::from_str(std::string{value});
        if (level == spdlog::level::off && value != "off")
        {
            return false;
        }
        config.log_level = level;
        return true;
    }

    return false;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view SiteConfigLoader::trim(std::string_view sv)
{
    const auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    const auto end = sv.find_last_not_of(" \t\r\n");
    return sv.substr(start, end - start + 1);
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> SiteConfigLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

// -----------------------------------------------------------------
// Utility: parse i32 from string_view
// -----------------------------------------------------------------

std::optional<i32> SiteConfigLoader::parse_i32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // from_chars rejects a leading '+'
    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace sunpath::site
