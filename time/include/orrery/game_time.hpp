/**
* @file game_time.hpp
* @brief Orrery game time types
*
* Game time is counted in whole seconds. A TimePoint is an absolute date
* (seconds since 1970-01-01 00:00:00 UTC, proleptic Gregorian calendar) and a
* Duration is a non-negative span between two of them.
*
* Sub-second resolution is deliberately absent: the scheduler, every
* processor and the save format agree on seconds.
*/

#ifndef ORRERY_GAME_TIME_HPP
#define ORRERY_GAME_TIME_HPP

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace orrery
{

/* ============================================================================
* Time Types
* ========================================================================= */

/**
* @brief Span of game time in seconds
*/
struct Duration
{
   uint64_t value{0};

   constexpr Duration() = default;
   constexpr explicit Duration(uint64_t v) : value(v) {}

   constexpr Duration operator+(Duration rhs) const { return Duration{value + rhs.value}; }
   constexpr Duration operator-(Duration rhs) const { return Duration{value - rhs.value}; }
   constexpr Duration& operator+=(Duration rhs) { value += rhs.value; return *this; }
   constexpr Duration& operator-=(Duration rhs) { value -= rhs.value; return *this; }

   constexpr bool operator==(Duration rhs) const { return value == rhs.value; }
   constexpr bool operator!=(Duration rhs) const { return value != rhs.value; }
   constexpr bool operator< (Duration rhs) const { return value <  rhs.value; }
   constexpr bool operator<=(Duration rhs) const { return value <= rhs.value; }
   constexpr bool operator> (Duration rhs) const { return value >  rhs.value; }
   constexpr bool operator>=(Duration rhs) const { return value >= rhs.value; }

   [[nodiscard]] constexpr bool is_zero() const { return value == 0; }

   static constexpr Duration max()
   {
      return Duration{std::numeric_limits<uint64_t>::max()};
   }

   static constexpr Duration minutes(uint64_t m) { return Duration{m * 60}; }
   static constexpr Duration hours(uint64_t h)   { return Duration{h * 60 * 60}; }
   static constexpr Duration days(uint64_t d)    { return Duration{d * 24 * 60 * 60}; }
};

/**
* @brief Absolute game date in seconds since the Unix epoch
*
* Time points can be compared and offset by a Duration. Use
* duration_between() to get the (non-negative) difference.
*/
struct TimePoint
{
   int64_t value{0};

   constexpr TimePoint() = default;
   constexpr explicit TimePoint(int64_t v) : value(v) {}

   constexpr bool operator==(TimePoint rhs) const { return value == rhs.value; }
   constexpr bool operator!=(TimePoint rhs) const { return value != rhs.value; }
   constexpr bool operator< (TimePoint rhs) const { return value <  rhs.value; }
   constexpr bool operator<=(TimePoint rhs) const { return value <= rhs.value; }
   constexpr bool operator> (TimePoint rhs) const { return value >  rhs.value; }
   constexpr bool operator>=(TimePoint rhs) const { return value >= rhs.value; }
};

constexpr TimePoint operator+(TimePoint tp, Duration d)
{
   return TimePoint{tp.value + static_cast<int64_t>(d.value)};
}

constexpr TimePoint operator+(Duration d, TimePoint tp)
{
   return tp + d;
}

/**
* @brief Seconds from 'earlier' to 'later', or zero if 'later' is not later
*/
constexpr Duration duration_between(TimePoint later, TimePoint earlier)
{
   return later > earlier ? Duration{static_cast<uint64_t>(later.value - earlier.value)} : Duration{0};
}

/* ============================================================================
* Calendar Conversion
* ========================================================================= */

/**
* @brief Build a TimePoint from a UTC calendar date
* @throws std::invalid_argument if the fields do not form a valid date/time
*/
[[nodiscard]] TimePoint make_date(int year, unsigned month, unsigned day,
                                  unsigned hour = 0, unsigned minute = 0, unsigned second = 0);

/**
* @brief Format as "YYYY-MM-DD HH:MM:SS" (UTC)
*/
[[nodiscard]] std::string format_date(TimePoint tp);

/**
* @brief Parse "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DD" (UTC)
* @throws std::invalid_argument on malformed or out-of-range input
*
* The year may be wider than four digits and may carry a leading '-', as
* format_date() writes for dates outside 0000-9999.
*
* format_date() and parse_date() round-trip exactly, so the save/load
* collaborator may store either the raw seconds or the text form.
*/
[[nodiscard]] TimePoint parse_date(std::string_view text);

} // namespace orrery

#endif // ORRERY_GAME_TIME_HPP
