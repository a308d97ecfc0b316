/**
* @file clock.hpp
* @brief The simulation clock
*
* One Clock per simulation instance. It is owned by the PulseScheduler, which
* is the only code allowed to advance it; everything else reads it through a
* const reference.
*
*   Scheduler: subpulse of N seconds begins
*    -> Clock::advance(N)
*       -> Pipeline runs, processors read Clock::now()
*/

#ifndef ORRERY_CLOCK_HPP
#define ORRERY_CLOCK_HPP

#include "orrery/game_time.hpp"

namespace orrery
{

class Clock
{
public:
   /**
   * @brief Start the clock at a given date
   *
   * Loading a saved game constructs the clock directly from the stored
   * TimePoint; the value round-trips exactly.
   */
   explicit Clock(TimePoint start) noexcept : current(start), epoch(start) {}

   Clock(Clock const&)            = delete;
   Clock& operator=(Clock const&) = delete;

   /**
   * @brief Current game date
   */
   [[nodiscard]] TimePoint now() const noexcept { return current; }

   /**
   * @brief Date the clock was constructed with
   */
   [[nodiscard]] TimePoint start() const noexcept { return epoch; }

   /**
   * @brief Total game time elapsed since construction
   */
   [[nodiscard]] Duration elapsed() const noexcept { return duration_between(current, epoch); }

   /**
   * @brief Largest Duration advance() still accepts
   */
   [[nodiscard]] Duration headroom() const noexcept;

   /**
   * @brief Move the clock forward
   * @throws std::overflow_error if the date would leave the representable range
   *
   * The clock never moves backward; there is no way to rewind it.
   */
   void advance(Duration d);

private:
   TimePoint current;
   TimePoint epoch;
};

} // namespace orrery

#endif // ORRERY_CLOCK_HPP
