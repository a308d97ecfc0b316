/**
 * @file simulation.hpp
 * @brief A simulation instance: galaxy + clock + scheduler
 *
 * Two-phase initialization:
 *
 *   Simulation sim(settings);   // clock at start date, empty galaxy
 *   ... create or load regions ...
 *   sim.on_ready();             // builds and installs the pipeline
 *   auto r = sim.advance(3600); // now legal
 */

#ifndef ORRERY_SIMULATION_HPP
#define ORRERY_SIMULATION_HPP

#include "orrery/config.hpp"
#include "orrery/galaxy.hpp"
#include "orrery/scheduler.hpp"

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

namespace orrery
{

struct SimulationSettings
{
   std::string       name{"Orrery"};
   TimePoint         start_date{config::DEFAULT_START_DATE};
   SchedulerSettings scheduler{};
   Duration          economy_cycle{config::ECONOMY_CYCLE};
};

class Simulation
{
public:
   /**
    * @throws std::invalid_argument on invalid settings
    */
   explicit Simulation(SimulationSettings settings = {});

   Simulation(Simulation const&)            = delete;
   Simulation& operator=(Simulation const&) = delete;

   /**
    * @brief Build the default pipeline (orbit, movement, economy) and install it
    * @throws std::logic_error if already ready
    */
   void on_ready();

   /**
    * @brief Install a custom pipeline instead of the default one
    * @throws std::logic_error if already ready
    */
   void on_ready(Pipeline&& pipeline);

   [[nodiscard]] bool is_ready() const noexcept { return pulse_scheduler.is_ready(); }

   /**
    * @brief See PulseScheduler::advance()
    */
   [[nodiscard]] PulseResult advance(std::int64_t requested_seconds,
                                     std::stop_token cancel = {},
                                     ProgressSink const& progress = {});

   [[nodiscard]] Galaxy&       galaxy()       noexcept { return regions; }
   [[nodiscard]] Galaxy const& galaxy() const noexcept { return regions; }

   [[nodiscard]] PulseScheduler&       scheduler()       noexcept { return pulse_scheduler; }
   [[nodiscard]] PulseScheduler const& scheduler() const noexcept { return pulse_scheduler; }

   [[nodiscard]] TimePoint now() const noexcept { return pulse_scheduler.clock().now(); }

   [[nodiscard]] std::optional<Interrupt> const& interrupt() const noexcept { return pulse_scheduler.interrupt().current(); }
   void clear_interrupt() noexcept { pulse_scheduler.clear_interrupt(); }

   [[nodiscard]] SimulationSettings const& settings() const noexcept { return sim_settings; }

   /**
    * @brief The standard processor order for 'settings'
    */
   [[nodiscard]] static Pipeline default_pipeline(SimulationSettings const& settings);

private:
   SimulationSettings sim_settings;
   Galaxy             regions;
   PulseScheduler     pulse_scheduler;
};

} // namespace orrery

#endif // ORRERY_SIMULATION_HPP
