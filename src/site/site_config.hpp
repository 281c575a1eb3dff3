#pragma once

/// @file site_config.hpp
/// @brief Observing site configuration and its plain-text loader.

#include "astro/coordinates.hpp"
#include "astro/time_zone.hpp"
#include "core/types.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sunpath::site
{
    /// @brief How local days are resolved for a site.
    enum class ZoneKind
    {
        Fixed,  ///< Constant UTC offset (utc_offset)
        Local,  ///< Platform local time zone
    };

    /// @brief Observing site: where the observer stands and which clock they read.
    /// Defaults to the Royal Observatory, Greenwich, on UTC.
    struct SiteConfig
    {
        std::string name = "Royal Observatory Greenwich";
        astro::GeoCoordinate location{.latitude_deg = 51.4769, .longitude_deg = -0.0005};
        ZoneKind zone = ZoneKind::Fixed;
        std::chrono::minutes utc_offset{0};
        spdlog::level::level_enum log_level = spdlog::level::info;

        /// @brief Build the time zone collaborator described by this config.
        [[nodiscard]] std::unique_ptr<astro::TimeZone> make_zone() const;
    };

    /// @brief Static utility class for loading site configuration files.
    ///
    /// Format: one `key = value` pair per line, `#` starts a comment.
    /// Recognized keys:
    ///   name, latitude, longitude, utc_offset_minutes, zone (fixed|local),
    ///   log_level (trace|debug|info|warn|error|critical|off)
    ///
    /// Unknown keys and unparsable values are skipped with a warning;
    /// unspecified keys keep their SiteConfig defaults.
    class SiteConfigLoader
    {
    public:
        SiteConfigLoader() = delete;

        /// @brief Load a site configuration file.
        /// @param path Path to the config file.
        /// @return The configuration, or std::nullopt if the file cannot be opened.
        [[nodiscard]] static std::optional<SiteConfig> load(const std::filesystem::path& path);

        /// @brief Parse configuration text from a stream.
        /// @param input Stream positioned at the first line.
        /// @param source Label used in log messages.
        [[nodiscard]] static SiteConfig parse(std::istream& input, std::string_view source);

        /// @brief True for offsets in [-720, 840] minutes (UTC-12:00 .. UTC+14:00).
        [[nodiscard]] static bool is_valid_utc_offset(i32 minutes);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single i32 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<i32> parse_i32(std::string_view sv);

        /// @brief Apply one key/value pair to a config.
        /// @return false when the key is unknown or the value is invalid.
        [[nodiscard]] static bool apply(SiteConfig& config, std::string_view key, std::string_view value);
    };

} // namespace sunpath::site
