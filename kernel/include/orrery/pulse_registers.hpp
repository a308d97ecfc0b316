/**
 * @file pulse_registers.hpp
 * @brief Coordination registers shared by the scheduler and the processors
 *
 * Two registers let processors steer the time-advancement loop without
 * calling back into it:
 *
 *   SubpulseLimit:  "the next subpulse must end within N seconds"
 *   PulseInterrupt: "stop advancing once this subpulse is done"
 *
 * Both are owned by the PulseScheduler and handed to processors through the
 * PulseContext. Neither is thread-safe; exactly one pipeline pass runs at a
 * time.
 */

#ifndef ORRERY_PULSE_REGISTERS_HPP
#define ORRERY_PULSE_REGISTERS_HPP

#include "orrery/game_time.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace orrery
{

using RegionId = std::uint32_t;
using EntityId = std::uint32_t;

/* ============================================================================
 * SubpulseLimit
 * ========================================================================= */

/**
 * @brief Upper bound on the length of the next subpulse
 *
 * The scheduler resets the limit to unbounded right before a subpulse's
 * processors run and reads it at the following subpulse boundary, so a
 * request made during subpulse N bounds the length of subpulse N+1.
 *
 * Requests can only shorten the limit. The effective value is the minimum of
 * every request made since the last reset.
 */
class SubpulseLimit
{
public:
   constexpr SubpulseLimit() = default;

   /**
    * @brief Forget every request (limit becomes unbounded)
    */
   constexpr void reset() noexcept { max_seconds = Duration::max(); }

   /**
    * @brief Ask for the next subpulse to last at most 'seconds'
    *
    * A zero request is treated as one second, the clock's granularity, so a
    * subpulse can never be empty.
    */
   constexpr void request(Duration seconds) noexcept
   {
      if (seconds.is_zero()) seconds = Duration{1};
      if (seconds < max_seconds) max_seconds = seconds;
   }

   [[nodiscard]] constexpr Duration read()       const noexcept { return max_seconds; }
   [[nodiscard]] constexpr bool     is_bounded() const noexcept { return max_seconds != Duration::max(); }

private:
   Duration max_seconds{Duration::max()};
};

/* ============================================================================
 * PulseInterrupt
 * ========================================================================= */

/**
 * @brief Why advancement stopped early
 *
 * Enough context for the caller to decide how to resume: what happened,
 * which processor noticed, where, and when.
 */
struct Interrupt
{
   std::string reason;
   std::string source;                ///< Name of the raising processor
   std::optional<RegionId> region{};  ///< Originating region, if known
   std::optional<EntityId> entity{};  ///< Originating entity, if known
   TimePoint raised_at{};             ///< Clock value when raised
};

/**
 * @brief Single-slot interrupt register (first raiser wins)
 *
 * Once set, further raises are ignored until the scheduler clears the
 * register at the top of the next advance() call, or the caller clears it
 * explicitly.
 */
class PulseInterrupt
{
public:
   /**
    * @brief Raise an interrupt
    * @return true if this call set the register, false if one was already set
    */
   bool raise(Interrupt interrupt);

   [[nodiscard]] bool is_set() const noexcept { return slot.has_value(); }

   /**
    * @brief The interrupt currently held, if any
    */
   [[nodiscard]] std::optional<Interrupt> const& current() const noexcept { return slot; }

   void clear() noexcept { slot.reset(); }

private:
   std::optional<Interrupt> slot;
};

} // namespace orrery

#endif // ORRERY_PULSE_REGISTERS_HPP
