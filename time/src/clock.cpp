/**
* @file clock.cpp
* @brief Simulation clock
*/

#include "orrery/clock.hpp"

#include <limits>
#include <stdexcept>

namespace orrery
{

Duration Clock::headroom() const noexcept
{
   // Unsigned wrap-around gives the exact headroom for negative dates too
   return Duration{static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                   - static_cast<uint64_t>(current.value)};
}

void Clock::advance(Duration d)
{
   if (d > headroom()) {
      throw std::overflow_error("Clock::advance: game date overflow");
   }
   current = current + d;
}

} // namespace orrery
