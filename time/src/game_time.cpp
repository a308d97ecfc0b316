/**
 * @file game_time.cpp
 * @brief Calendar conversion for game dates
 */

#include "orrery/game_time.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace orrery
{

static constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

// Floor division, so dates before 1970 land on the right day
static constexpr int64_t floor_div(int64_t a, int64_t b)
{
   int64_t q = a / b;
   if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
   return q;
}

TimePoint make_date(int year, unsigned month, unsigned day, unsigned hour, unsigned minute, unsigned second)
{
   using namespace std::chrono;

   year_month_day const ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
   if (!ymd.ok()) {
      throw std::invalid_argument("make_date: invalid calendar date");
   }
   if (hour > 23 || minute > 59 || second > 59) {
      throw std::invalid_argument("make_date: invalid time of day");
   }

   int64_t const days = sys_days{ymd}.time_since_epoch().count();
   return TimePoint{days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second};
}

std::string format_date(TimePoint tp)
{
   using namespace std::chrono;

   int64_t const days = floor_div(tp.value, SECONDS_PER_DAY);
   int64_t const secs = tp.value - days * SECONDS_PER_DAY;

   year_month_day const ymd{sys_days{std::chrono::days{days}}};

   char buf[40];
   std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                 static_cast<int>(ymd.year()),
                 static_cast<unsigned>(ymd.month()),
                 static_cast<unsigned>(ymd.day()),
                 static_cast<int>(secs / 3600),
                 static_cast<int>((secs % 3600) / 60),
                 static_cast<int>(secs % 60));
   return buf;
}

template<typename T>
static T parse_field(std::string_view text, std::size_t pos, std::size_t len)
{
   T value{};
   auto const* first = text.data() + pos;
   auto const* last  = first + len;
   auto [ptr, ec] = std::from_chars(first, last, value);
   if (ec != std::errc{} || ptr != last) {
      throw std::invalid_argument("parse_date: malformed number in '" + std::string(text) + "'");
   }
   return value;
}

TimePoint parse_date(std::string_view text)
{
   // [-]YYYY-MM-DD[ HH:MM:SS], the year is at least four characters wide
   auto const d = text.size() > 4 ? text.find('-', 4) : std::string_view::npos;
   if (d == std::string_view::npos || (text.size() != d + 6 && text.size() != d + 15)) {
      throw std::invalid_argument("parse_date: expected 'YYYY-MM-DD' or 'YYYY-MM-DD HH:MM:SS'");
   }
   if (text[d + 3] != '-') {
      throw std::invalid_argument("parse_date: bad date separators in '" + std::string(text) + "'");
   }

   int const      year  = parse_field<int>(text, 0, d);
   unsigned const month = parse_field<unsigned>(text, d + 1, 2);
   unsigned const day   = parse_field<unsigned>(text, d + 4, 2);

   unsigned hour = 0, minute = 0, second = 0;
   if (text.size() == d + 15) {
      if ((text[d + 6] != ' ' && text[d + 6] != 'T') || text[d + 9] != ':' || text[d + 12] != ':') {
         throw std::invalid_argument("parse_date: bad time separators in '" + std::string(text) + "'");
      }
      hour   = parse_field<unsigned>(text, d + 7, 2);
      minute = parse_field<unsigned>(text, d + 10, 2);
      second = parse_field<unsigned>(text, d + 13, 2);
   }

   return make_date(year, month, day, hour, minute, second);
}

} // namespace orrery
