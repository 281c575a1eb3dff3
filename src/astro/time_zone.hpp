#pragma once

/// @file time_zone.hpp
/// @brief Local-day resolution: the calendar/time-zone collaborator of the event finder.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sunpath::astro
{
    /// @brief Half-open interval [start, end) covering one local calendar day.
    struct DayWindow
    {
        Instant start;
        Instant end;
    };

    /// @brief Resolves local-day boundaries and UTC offsets for a time zone.
    ///
    /// Implementations must be immutable after construction so a single
    /// instance can be shared between concurrent ephemeris calls.
    class TimeZone
    {
    public:
        virtual ~TimeZone() = default;

        /// @brief Start of the local calendar day containing an instant.
        /// @return Local midnight, or std::nullopt if the platform cannot resolve it.
        [[nodiscard]] virtual std::optional<Instant> start_of_day(Instant instant) const = 0;

        /// @brief UTC offset in effect at an instant (local = UTC + offset).
        [[nodiscard]] virtual std::optional<std::chrono::minutes> utc_offset(Instant instant) const = 0;

        /// @brief Human-readable zone label for reports and logs.
        [[nodiscard]] virtual std::string name() const = 0;

        /// @brief The local day containing an instant, from its midnight to the next.
        /// Days are 23 or 25 hours long across daylight-saving transitions.
        [[nodiscard]] std::optional<DayWindow> day_window(Instant instant) const;

        /// @brief Shared UTC zone instance.
        [[nodiscard]] static const TimeZone& utc();
    };

    /// @brief Zone with a constant UTC offset (no daylight saving).
    class FixedOffsetZone final : public TimeZone
    {
    public:
        explicit FixedOffsetZone(std::chrono::minutes offset);

        [[nodiscard]] std::optional<Instant> start_of_day(Instant instant) const override;
        [[nodiscard]] std::optional<std::chrono::minutes> utc_offset(Instant instant) const override;
        [[nodiscard]] std::string name() const override;

    private:
        std::chrono::minutes m_offset;
    };

    /// @brief The platform's local time zone (TZ environment / system setting).
    ///
    /// Uses localtime_r and mktime, so daylight-saving rules come from the
    /// C library's zone database.
    class SystemLocalZone final : public TimeZone
    {
    public:
        [[nodiscard]] std::optional<Instant> start_of_day(Instant instant) const override;
        [[nodiscard]] std::optional<std::chrono::minutes> utc_offset(Instant instant) const override;
        [[nodiscard]] std::string name() const override;
    };

} // namespace sunpath::astro
