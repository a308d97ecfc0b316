/**
 * @file config.hpp
 * @brief Orrery compile-time configuration
 *
 * Defaults for the runtime settings structs (SchedulerSettings,
 * SimulationSettings). Changing a value here changes the default for every
 * simulation instance; individual instances can still override them.
 */

#ifndef ORRERY_CONFIG_HPP
#define ORRERY_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace orrery::config
{
   /**
    * @brief Smallest amount of game time (seconds) a pulse can advance
    *
    * Every requested pulse is quantized down to a multiple of this.
    */
   static constexpr std::uint64_t MINIMUM_TIMESTEP = 5;
   static_assert(MINIMUM_TIMESTEP > 0, "Minimum timestep must be at least one second.");

   /**
    * @brief Length of one economy cycle in seconds (one game day)
    */
   static constexpr std::uint64_t ECONOMY_CYCLE = 24 * 60 * 60;
   static_assert(ECONOMY_CYCLE % MINIMUM_TIMESTEP == 0, "Economy cycle must land on a timestep boundary.");

   /**
    * @brief Default campaign start: 2050-01-01 00:00:00 UTC, in Unix seconds
    */
   static constexpr std::int64_t DEFAULT_START_DATE = 2'524'608'000;

   /**
    * @brief Stack reserved for each cooperative pulse fiber
    */
   static constexpr std::size_t FIBER_STACK_SIZE = 256 * 1024;
   static_assert(FIBER_STACK_SIZE % 16 == 0, "Fiber stacks must be 16-byte aligned.");

}  // namespace orrery::config

#endif // ORRERY_CONFIG_HPP
