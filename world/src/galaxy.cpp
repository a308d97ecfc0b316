/**
 * @file galaxy.cpp
 * @brief Region storage and lookups
 */

#include "orrery/galaxy.hpp"

#include <algorithm>
#include <utility>

namespace orrery
{

Region& Galaxy::add_region(std::string name)
{
   auto region  = std::make_unique<Region>();
   region->id   = ++last_region_id;
   region->name = std::move(name);
   regions.push_back(std::move(region));
   return *regions.back();
}

bool Galaxy::remove_region(RegionId id)
{
   auto it = std::find_if(regions.begin(), regions.end(), [id](auto const& r) { return r->id == id; });
   if (it == regions.end()) return false;
   regions.erase(it);
   return true;
}

Region* Galaxy::find(RegionId id) noexcept
{
   for (auto& region : regions) {
      if (region->id == id) return region.get();
   }
   return nullptr;
}

Region const* Galaxy::find(RegionId id) const noexcept
{
   for (auto const& region : regions) {
      if (region->id == id) return region.get();
   }
   return nullptr;
}

bool Galaxy::set_active(RegionId id, bool active) noexcept
{
   Region* region = find(id);
   if (!region) return false;
   region->active = active;
   return true;
}

std::vector<Region*> Galaxy::active_regions()
{
   std::vector<Region*> active;
   active.reserve(regions.size());
   for (auto& region : regions) {
      if (region->active) active.push_back(region.get());
   }
   return active;
}

} // namespace orrery
