/**
 * @file economy_processor.cpp
 * @brief Cycle-based colony production
 */

#include "orrery/processors.hpp"

#include <stdexcept>
#include <string>

#include "orrery/debug_print.hpp"

namespace orrery
{

EconomyProcessor::EconomyProcessor(Duration cycle) : cycle(cycle)
{
   if (cycle.is_zero()) throw std::invalid_argument("EconomyProcessor: cycle length must be non-zero");
}

void EconomyProcessor::process_region(PulseContext& context, Region& region, Duration elapsed)
{
   for (Colony& colony : region.colonies) {
      colony.cycle_progress += elapsed;

      uint64_t const cycles = colony.cycle_progress.value / cycle.value;
      colony.cycle_progress = Duration{colony.cycle_progress.value % cycle.value};

      if (cycles > 0) {
         colony.stockpile += colony.industry_per_cycle * static_cast<double>(cycles);
         LOG_PROC("economy: colony %u '%s' ran %llu cycles, stockpile=%.1f",
                  colony.id, colony.name.c_str(), static_cast<unsigned long long>(cycles), colony.stockpile);
      }

      if (colony.stockpile_alert && !colony.alert_raised && colony.stockpile >= *colony.stockpile_alert) {
         colony.alert_raised = true;
         context.raise_interrupt(Interrupt{
            .reason = "colony '" + colony.name + "' stockpile reached " + std::to_string(*colony.stockpile_alert),
            .region = region.id,
            .entity = colony.id,
         });
      }

      context.request_subpulse_limit(cycle - colony.cycle_progress);
   }
}

} // namespace orrery
