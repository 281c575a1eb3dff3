/// @file sun_report.cpp
/// @brief Implementation of ephemeris text formatting and the console report.

#include "display/sun_report.hpp"

#include "astro/angles.hpp"

#include <spdlog/fmt/fmt.h>

#include <glm/trigonometric.hpp>

#include <array>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace sunpath::display
{

namespace
{

/// @brief Number of code points in a UTF-8 string (terminal columns for our glyphs).
int display_width(std::string_view text)
{
    int width = 0;
    for (const char c : text)
    {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            ++width;
        }
    }
    return width;
}

} // anonymous namespace

// -----------------------------------------------------------------
// SunReport
// -----------------------------------------------------------------

SunReport SunReport::compute(
    std::string site_name,
    const astro::GeoCoordinate& location,
    astro::Instant instant,
    const astro::TimeZone& zone)
{
    using astro::SolarEphemeris;

    return SunReport{
        .site_name  = std::move(site_name),
        .location   = location,
        .instant    = instant,
        .zone_name  = zone.name(),
        .utc_offset = zone.utc_offset(instant),
        .position   = SolarEphemeris::compute_sun_position_rounded(instant, location),
        .events     = SolarEphemeris::compute_sun_rise_set(instant, location, zone),
        .transit    = SolarEphemeris::compute_solar_transit(instant, location, zone),
    };
}

// -----------------------------------------------------------------
// SunFormat
// -----------------------------------------------------------------

std::string_view SunFormat::compass_direction(i32 azimuth_deg)
{
    static constexpr std::array<std::string_view, 8> kDirections{
        "N", "NE", "E", "SE", "S", "SW", "W", "NW",
    };

    const f64 wrapped = astro::wrap_degrees(static_cast<f64>(azimuth_deg));
    const auto index = static_cast<std::size_t>((wrapped + 22.5) / 45.0) % kDirections.size();
    return kDirections[index];
}

i32 SunFormat::shadow_azimuth(i32 azimuth_deg)
{
    return astro::round_azimuth_deg(static_cast<f64>(azimuth_deg) + 180.0);
}

std::string SunFormat::format_dms(const astro::GeoCoordinate& location)
{
    auto dms = [](f64 decimal) {
        const f64 magnitude = std::abs(decimal);
        const int degrees = static_cast<int>(magnitude);
        const f64 minutes_full = (magnitude - degrees) * 60.0;
        const int minutes = static_cast<int>(minutes_full);
        const int seconds = static_cast<int>((minutes_full - minutes) * 60.0);
        return fmt::format("{}°{}′{}″", degrees, minutes, seconds);
    };

    return fmt::format("{} {}, {} {}",
                       dms(location.latitude_deg), location.latitude_deg >= 0.0 ? 'N' : 'S',
                       dms(location.longitude_deg), location.longitude_deg >= 0.0 ? 'E' : 'W');
}

std::string SunFormat::format_local_time(
    const std::optional<astro::Instant>& instant,
    const astro::TimeZone& zone)
{
    if (!instant)
    {
        return std::string{kPlaceholder};
    }

    const auto offset = zone.utc_offset(*instant);
    if (!offset)
    {
        return std::string{kPlaceholder};
    }

    const astro::Instant local = *instant + *offset;
    const std::chrono::hh_mm_ss<std::chrono::milliseconds> hms{
        local - std::chrono::floor<std::chrono::days>(local)};

    return fmt::format("{:02d}:{:02d}", hms.hours().count(), hms.minutes().count());
}

std::string SunFormat::format_day_length(
    const std::optional<astro::Instant>& rise,
    const std::optional<astro::Instant>& set)
{
    if (!rise || !set || *set <= *rise)
    {
        return std::string{kPlaceholder};
    }

    const auto total = std::chrono::duration_cast<std::chrono::minutes>(*set - *rise).count();
    return fmt::format("{:02d} hrs and {:02d} mins", total / 60, total % 60);
}

std::string SunFormat::format_bearing(i32 azimuth_deg)
{
    return fmt::format("{:03d}° {}", azimuth_deg, compass_direction(azimuth_deg));
}

Vec2d SunFormat::needle_direction(f64 azimuth_deg)
{
    const f64 radians = glm::radians(azimuth_deg);
    return Vec2d{std::sin(radians), -std::cos(radians)};
}

// -----------------------------------------------------------------
// ConsoleReport
// -----------------------------------------------------------------

void ConsoleReport::hline(std::ostream& out, int w, char c)
{
    out << '+';
    for (int i = 0; i < w - 2; ++i) out << c;
    out << '+' << '\n';
}

void ConsoleReport::row(std::ostream& out, std::string_view label, std::string_view value) const
{
    constexpr int kLabelWidth = 14;

    const std::string text = fmt::format("{:<{}}{}", label, kLabelWidth, value);
    const int padding = width - 4 - display_width(text);

    out << "| " << text;
    for (int i = 0; i < padding; ++i) out << ' ';
    out << " |\n";
}

void ConsoleReport::render(std::ostream& out, const SunReport& report, const astro::TimeZone& zone) const
{
    const auto& pos = report.position;
    const auto& events = report.events;

    hline(out, width, '=');
    row(out, "SUNPATH", report.site_name);
    hline(out, width, '-');

    row(out, "Location", fmt::format("{:.5f}°, {:.5f}°",
                                     report.location.latitude_deg, report.location.longitude_deg));
    row(out, "DMS", format_dms(report.location));

    std::string offset_text{kPlaceholder};
    if (report.utc_offset)
    {
        const auto minutes = report.utc_offset->count();
        offset_text = fmt::format("{}{:02d}:{:02d}", minutes < 0 ? '-' : '+',
                                  std::abs(minutes) / 60, std::abs(minutes) % 60);
    }
    row(out, "Local time", fmt::format("{} ({} {})",
                                       format_local_time(report.instant, zone),
                                       report.zone_name, offset_text));
    hline(out, width, '-');

    row(out, "Azimuth", format_bearing(pos.azimuth_deg));
    row(out, "Altitude", fmt::format("{}°", pos.altitude_deg));
    row(out, "Shadow", format_bearing(shadow_azimuth(pos.azimuth_deg)));
    row(out, "Sun visible", astro::SolarEphemeris::is_sun_visible(pos.altitude_deg) ? "Yes" : "No");

    const Vec2d needle = needle_direction(static_cast<f64>(pos.azimuth_deg));
    row(out, "Needle", fmt::format("({:+.3f}, {:+.3f})", needle.x, needle.y));
    hline(out, width, '-');

    row(out, "Sunrise", format_local_time(events.rise, zone));
    row(out, "  azimuth", events.rise ? format_bearing(events.rise_azimuth_deg) : std::string{kPlaceholder});
    row(out, "Sunset", format_local_time(events.set, zone));
    row(out, "  azimuth", events.set ? format_bearing(events.set_azimuth_deg) : std::string{kPlaceholder});
    row(out, "Solar noon", format_local_time(report.transit, zone));
    row(out, "Day length", format_day_length(events.rise, events.set));
    hline(out, width, '=');
}

} // namespace sunpath::display
