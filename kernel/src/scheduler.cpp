/**
 * @file scheduler.cpp
 * @brief Pulse scheduler
 */

#include "orrery/scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "orrery/debug_print.hpp"

// Invariants list:
// The clock is only advanced here, between pipeline passes, never backwards.
// The pipeline always receives the length of the current subpulse.
// Cancellation is only honoured before a subpulse starts; a started pass always completes.

namespace orrery
{

PulseScheduler::PulseScheduler(TimePoint start, SchedulerSettings settings)
   : settings(settings), game_clock(start)
{
   if (settings.minimum_timestep.is_zero()) {
      throw std::invalid_argument("PulseScheduler: minimum timestep must be at least one second");
   }
}

void PulseScheduler::install(Pipeline&& pipeline, IRegionProvider& regions)
{
   if (installed) throw std::logic_error("PulseScheduler: pipeline already installed");

   processors      = std::move(pipeline);
   region_provider = &regions;
   installed       = true;

   LOG_SCHED("installed pipeline with %zu processors", processors.size());
}

Duration PulseScheduler::quantize(std::int64_t requested_seconds) const noexcept
{
   uint64_t const step = settings.minimum_timestep.value;
   if (requested_seconds <= 0) return Duration{step};

   auto const requested = static_cast<uint64_t>(requested_seconds);
   uint64_t quantized = requested - requested % step;
   if (quantized == 0) quantized = step;

   // Never ask for more than the clock can still represent
   uint64_t const headroom = game_clock.headroom().value;
   uint64_t const ceiling  = headroom - headroom % step;
   if (ceiling != 0 && quantized > ceiling) quantized = ceiling;

   return Duration{quantized};
}

PulseResult PulseScheduler::advance(std::int64_t requested_seconds, std::stop_token cancel, ProgressSink const& progress)
{
   if (!installed) throw std::logic_error("PulseScheduler: advance() before install()");

   PulseResult result{.requested = quantize(requested_seconds)};
   Duration remaining = result.requested;

   LOG_SCHED("advance: requested=%lld quantized=%llu from %s",
             static_cast<long long>(requested_seconds),
             static_cast<unsigned long long>(result.requested.value),
             format_date(game_clock.now()).c_str());

   pulse_interrupt.clear();

   while (!pulse_interrupt.is_set() && !remaining.is_zero()) {
      if (cancel.stop_requested()) {
         LOG_SCHED("advance: cancelled after %llu s (%u subpulses)",
                   static_cast<unsigned long long>(result.advanced.value), result.subpulses);
         result.outcome = PulseOutcome::Cancelled;
         return result;
      }

      Duration const subpulse = std::min(subpulse_limit.read(), remaining);
      // Processors re-derive the next checkpoint during this pass
      subpulse_limit.reset();

      game_clock.advance(subpulse);

      auto const regions = region_provider->active_regions();
      PulseContext context(game_clock, subpulse_limit, pulse_interrupt, result.subpulses);
      processors.run_all(context, regions, subpulse);

      remaining       -= subpulse;
      result.advanced += subpulse;
      result.subpulses++;

      if (progress) {
         progress(static_cast<double>(result.advanced.value) / static_cast<double>(result.requested.value));
      }
   }

   if (pulse_interrupt.is_set()) {
      result.outcome   = PulseOutcome::Interrupted;
      result.interrupt = pulse_interrupt.current();
   }

   LOG_SCHED("advance: %s, advanced=%llu in %u subpulses, now %s",
             OUTCOME_TO_STR(result.outcome),
             static_cast<unsigned long long>(result.advanced.value), result.subpulses,
             format_date(game_clock.now()).c_str());

   return result;
}

} // namespace orrery
