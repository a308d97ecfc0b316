/**
 * @file simulation.cpp
 */

#include "orrery/simulation.hpp"
#include "orrery/processors.hpp"

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "orrery/debug_print.hpp"

namespace orrery
{

Simulation::Simulation(SimulationSettings settings)
   : sim_settings(std::move(settings))
   , pulse_scheduler(sim_settings.start_date, sim_settings.scheduler)
{
   if (sim_settings.economy_cycle.is_zero()) {
      throw std::invalid_argument("Simulation: economy cycle must be non-zero");
   }
}

Pipeline Simulation::default_pipeline(SimulationSettings const& settings)
{
   // Order matters: movement chases bodies at their post-orbit positions
   std::vector<std::unique_ptr<IProcessor>> stages;
   stages.push_back(std::make_unique<OrbitProcessor>());
   stages.push_back(std::make_unique<MovementProcessor>());
   stages.push_back(std::make_unique<EconomyProcessor>(settings.economy_cycle));
   return Pipeline(std::move(stages));
}

void Simulation::on_ready()
{
   on_ready(default_pipeline(sim_settings));
}

void Simulation::on_ready(Pipeline&& pipeline)
{
   if (is_ready()) throw std::logic_error("Simulation: on_ready() called twice");
   pulse_scheduler.install(std::move(pipeline), regions);
   LOG_SCHED("simulation '%s' ready at %s with %zu regions",
             sim_settings.name.c_str(), format_date(now()).c_str(), regions.size());
}

PulseResult Simulation::advance(std::int64_t requested_seconds, std::stop_token cancel, ProgressSink const& progress)
{
   return pulse_scheduler.advance(requested_seconds, std::move(cancel), progress);
}

} // namespace orrery
