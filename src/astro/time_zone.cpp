/// @file time_zone.cpp
/// @brief Fixed-offset and system-local time zone implementations.

#include "astro/time_zone.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <ctime>

namespace sunpath::astro
{

// -----------------------------------------------------------------
// TimeZone
// -----------------------------------------------------------------

std::optional<DayWindow> TimeZone::day_window(Instant instant) const
{
    const auto start = start_of_day(instant);
    if (!start)
    {
        SP_CORE_WARN("TimeZone: Could not resolve start of day in zone {}", name());
        return std::nullopt;
    }

    // 26 h past midnight always lands inside the next local day, even when
    // the current day is shortened or lengthened by a DST transition.
    const auto next = start_of_day(*start + std::chrono::hours{26});
    if (!next || *next <= *start)
    {
        SP_CORE_WARN("TimeZone: Could not resolve end of day in zone {}", name());
        return std::nullopt;
    }

    return DayWindow{
        .start = *start,
        .end   = *next,
    };
}

const TimeZone& TimeZone::utc()
{
    static const FixedOffsetZone kUtc{std::chrono::minutes{0}};
    return kUtc;
}

// -----------------------------------------------------------------
// FixedOffsetZone
// -----------------------------------------------------------------

FixedOffsetZone::FixedOffsetZone(std::chrono::minutes offset)
    : m_offset(offset)
{
}

std::optional<Instant> FixedOffsetZone::start_of_day(Instant instant) const
{
    const auto local_midnight = std::chrono::floor<std::chrono::days>(instant + m_offset);
    return Instant{local_midnight} - m_offset;
}

std::optional<std::chrono::minutes> FixedOffsetZone::utc_offset(Instant /*instant*/) const
{
    return m_offset;
}

std::string FixedOffsetZone::name() const
{
    if (m_offset.count() == 0)
    {
        return "UTC";
    }

    const auto total = std::abs(m_offset.count());
    return fmt::format("UTC{}{:02d}:{:02d}", m_offset.count() < 0 ? '-' : '+', total / 60, total % 60);
}

// -----------------------------------------------------------------
// SystemLocalZone
// -----------------------------------------------------------------

std::optional<Instant> SystemLocalZone::start_of_day(Instant instant) const
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(instant);

    std::tm local{};
    if (localtime_r(&tt, &local) == nullptr)
    {
        SP_CORE_ERROR("SystemLocalZone: localtime_r failed for t={}", static_cast<long long>(tt));
        return std::nullopt;
    }

    local.tm_hour  = 0;
    local.tm_min   = 0;
    local.tm_sec   = 0;
    local.tm_isdst = -1;

    const std::time_t midnight = std::mktime(&local);
    if (midnight == static_cast<std::time_t>(-1))
    {
        SP_CORE_ERROR("SystemLocalZone: mktime could not resolve local midnight");
        return std::nullopt;
    }

    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::from_time_t(midnight));
}

std::optional<std::chrono::minutes> SystemLocalZone::utc_offset(Instant instant) const
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(instant);

    std::tm local{};
    if (localtime_r(&tt, &local) == nullptr)
    {
        SP_CORE_ERROR("SystemLocalZone: localtime_r failed for t={}", static_cast<long long>(tt));
        return std::nullopt;
    }

    return std::chrono::minutes{local.tm_gmtoff / 60};
}

std::string SystemLocalZone::name() const
{
    return "local";
}

} // namespace sunpath::astro
