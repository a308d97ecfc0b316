/**
 * @file region_processor.cpp
 */

#include "orrery/processors.hpp"

namespace orrery
{

void RegionProcessor::process(PulseContext& context, RegionSet regions, Duration elapsed)
{
   for (Region* region : regions) {
      try {
         process_region(context, *region, elapsed);
      } catch (RegionFault const&) {
         throw;
      } catch (std::exception const& e) {
         throw RegionFault(region->id, e.what());
      } catch (...) {
         throw RegionFault(region->id, "unknown exception");
      }
   }
}

} // namespace orrery
