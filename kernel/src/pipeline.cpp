/**
 * @file pipeline.cpp
 * @brief Pipeline execution and fault reporting
 */

#include "orrery/processor.hpp"

#include <utility>

#include "orrery/debug_print.hpp"

namespace orrery
{

static std::string describe_fault(std::string const& processor, std::uint32_t subpulse,
                                  std::optional<RegionId> region, std::string const& detail)
{
   std::string msg = "processor '" + processor + "' failed in subpulse " + std::to_string(subpulse);
   if (region) msg += " (region " + std::to_string(*region) + ")";
   msg += ": " + detail;
   return msg;
}

ProcessorFault::ProcessorFault(std::string processor, std::uint32_t subpulse_index,
                               std::optional<RegionId> region, std::string detail)
   : std::runtime_error(describe_fault(processor, subpulse_index, region, detail))
   , processor_name(std::move(processor))
   , subpulse(subpulse_index)
   , failed_region(region)
   , cause(std::move(detail))
{
}

bool PulseContext::raise_interrupt(Interrupt interrupt)
{
   if (interrupt.source.empty()) interrupt.source = std::string(running);
   interrupt.raised_at = game_clock.now();
   return pulse_interrupt.raise(std::move(interrupt));
}

Pipeline::Pipeline(std::vector<std::unique_ptr<IProcessor>> processors) : stages(std::move(processors))
{
   for (auto const& stage : stages) {
      if (!stage) throw std::invalid_argument("Pipeline: null processor");
   }
}

void Pipeline::run_all(PulseContext& context, RegionSet regions, Duration elapsed) const
{
   LOG_PIPE("subpulse %u: %zu processors over %zu regions, elapsed=%llu",
            context.subpulse_index(), stages.size(), regions.size(),
            static_cast<unsigned long long>(elapsed.value));

   for (auto const& stage : stages) {
      context.running = stage->name();
      try {
         stage->process(context, regions, elapsed);
      } catch (RegionFault const& fault) {
         context.running = {};
         LOG_PIPE("%s faulted in region %u: %s", std::string(stage->name()).c_str(), fault.region(), fault.what());
         throw ProcessorFault(std::string(stage->name()), context.subpulse_index(), fault.region(), fault.what());
      } catch (std::exception const& e) {
         context.running = {};
         LOG_PIPE("%s faulted: %s", std::string(stage->name()).c_str(), e.what());
         throw ProcessorFault(std::string(stage->name()), context.subpulse_index(), std::nullopt, e.what());
      } catch (...) {
         context.running = {};
         LOG_PIPE("%s faulted with a non-standard exception", std::string(stage->name()).c_str());
         throw ProcessorFault(std::string(stage->name()), context.subpulse_index(), std::nullopt, "unknown exception");
      }
   }
   context.running = {};
}

std::vector<std::string_view> Pipeline::processor_names() const
{
   std::vector<std::string_view> names;
   names.reserve(stages.size());
   for (auto const& stage : stages) names.push_back(stage->name());
   return names;
}

} // namespace orrery
