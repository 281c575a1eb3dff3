#pragma once

/// @file sun_report.hpp
/// @brief Text formatting of ephemeris results and the console report panel.

#include "astro/coordinates.hpp"
#include "astro/solar_ephemeris.hpp"
#include "astro/time_system.hpp"
#include "astro/time_zone.hpp"
#include "core/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sunpath::display
{
    /// @brief Everything the report panel shows for one site and instant.
    struct SunReport
    {
        std::string site_name;
        astro::GeoCoordinate location;
        astro::Instant instant;
        std::string zone_name;
        std::optional<std::chrono::minutes> utc_offset;

        astro::SunPositionRounded position;
        astro::SunEventResult events;
        std::optional<astro::Instant> transit;

        /// @brief Evaluate the ephemeris for a site at an instant.
        [[nodiscard]] static SunReport compute(
            std::string site_name,
            const astro::GeoCoordinate& location,
            astro::Instant instant,
            const astro::TimeZone& zone
        );
    };

    /// @brief Static formatting helpers shared by the report and its tests.
    class SunFormat
    {
    public:
        SunFormat() = delete;

        /// Shown in place of an event that does not happen today.
        static constexpr std::string_view kPlaceholder = "–";

        /// @brief 8-point compass sector for an azimuth ("N", "NE", ... "NW").
        [[nodiscard]] static std::string_view compass_direction(i32 azimuth_deg);

        /// @brief Bearing of a shadow cast by the Sun (opposite azimuth).
        [[nodiscard]] static i32 shadow_azimuth(i32 azimuth_deg);

        /// @brief Degrees/minutes/seconds text, e.g. 51°28′36″ N, 0°0′1″ W.
        [[nodiscard]] static std::string format_dms(const astro::GeoCoordinate& location);

        /// @brief Local wall-clock time "HH:MM" (seconds truncated), or the placeholder.
        [[nodiscard]] static std::string format_local_time(
            const std::optional<astro::Instant>& instant,
            const astro::TimeZone& zone
        );

        /// @brief "HH hrs and MM mins" between rise and set, or the placeholder.
        [[nodiscard]] static std::string format_day_length(
            const std::optional<astro::Instant>& rise,
            const std::optional<astro::Instant>& set
        );

        /// @brief Azimuth as a zero-padded bearing with compass sector, e.g. "087° E".
        [[nodiscard]] static std::string format_bearing(i32 azimuth_deg);

        /// @brief Unit vector for a compass needle in screen space (x right, y down).
        [[nodiscard]] static Vec2d needle_direction(f64 azimuth_deg);
    };

    /// @brief Prints a SunReport as a boxed terminal panel.
    class ConsoleReport
    {
    public:
        /// Panel width in characters.
        int width{52};

        void render(std::ostream& out, const SunReport& report, const astro::TimeZone& zone) const;

    private:
        void row(std::ostream& out, std::string_view label, std::string_view value) const;

        static void hline(std::ostream& out, int w, char c = '-');
    };

} // namespace sunpath::display
