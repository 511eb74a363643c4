#pragma once

/// @file include/fras/calendar.hpp
/// @brief ISO-8601 timestamp parsing and UTC calendar breakdown.
///
/// # Module: Calendar
///
/// ## Responsibility
/// Turn the textual timestamps of incoming records into `sys_seconds` and
/// derive the civil fields the temporal features need (hour, weekday,
/// month-end, quarter-end).
///
/// ## Accepted Forms
/// ```
/// 2025-03-31
/// 2025-03-31T23:15
/// 2025-03-31T23:15:07
/// 2025-03-31T23:15:07.250Z
/// 2025-03-31 23:15:07+02:00
/// 2025-03-31T23:15:07-0500
/// ```
/// A missing offset means UTC. Fractional seconds are truncated.
///
/// ## Guarantees
/// - Never throws; malformed or out-of-range input yields `nullopt`
/// - All derived fields are UTC

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fras::calendar {

/// UTC civil breakdown of an instant.
struct CivilTime {
    int  year;
    unsigned month;      ///< 1–12
    unsigned day;        ///< 1–31
    int  hour;           ///< 0–23
    int  minute;         ///< 0–59
    unsigned weekday;    ///< 0 = Sunday … 6 = Saturday
    bool is_month_end;   ///< Last calendar day of the month
    bool is_quarter_end; ///< Last day of March, June, September or December
};

/// Parse an ISO-8601 date or date-time.
///
/// # Returns
/// The UTC instant, or `nullopt` if the text is not a valid timestamp
/// (bad shape, month 13, February 30, hour 24, offset beyond ±18:00, …).
[[nodiscard]] std::optional<std::chrono::sys_seconds>
parse_iso8601(std::string_view text) noexcept;

/// Break a UTC instant into civil fields.
[[nodiscard]] CivilTime to_civil(std::chrono::sys_seconds t) noexcept;

/// Format as `YYYY-MM-DDTHH:MM:SSZ`.
[[nodiscard]] std::string format_iso8601(std::chrono::sys_seconds t);

} // namespace fras::calendar
