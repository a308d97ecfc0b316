/**
 * @file galaxy.hpp
 * @brief Owner of every region in a simulation instance
 */

#ifndef ORRERY_GALAXY_HPP
#define ORRERY_GALAXY_HPP

#include "orrery/region.hpp"
#include "orrery/scheduler.hpp"

#include <memory>
#include <string>
#include <vector>

namespace orrery
{

/**
 * @brief Region storage and the scheduler's region provider
 *
 * Regions live behind unique_ptr so the Region* handed to the pipeline stays
 * valid while other regions are added. Removing a region is only safe
 * between subpulses (i.e. outside a pipeline pass).
 */
class Galaxy final : public IRegionProvider
{
public:
   Galaxy() = default;
   Galaxy(Galaxy const&)            = delete;
   Galaxy& operator=(Galaxy const&) = delete;

   /**
    * @brief Create a new, active region
    */
   Region& add_region(std::string name);

   /**
    * @return true if a region with that id existed
    */
   bool remove_region(RegionId id);

   [[nodiscard]] Region*       find(RegionId id) noexcept;
   [[nodiscard]] Region const* find(RegionId id) const noexcept;

   /**
    * @brief Include or exclude a region from future pipeline passes
    * @return false if no such region
    */
   bool set_active(RegionId id, bool active) noexcept;

   /**
    * @brief Allocate a galaxy-unique entity id (never 0)
    */
   [[nodiscard]] EntityId next_entity_id() noexcept { return ++last_entity_id; }

   [[nodiscard]] std::size_t size() const noexcept { return regions.size(); }

   /**
    * @brief Snapshot of active regions, in creation order
    */
   [[nodiscard]] std::vector<Region*> active_regions() override;

private:
   std::vector<std::unique_ptr<Region>> regions;
   RegionId last_region_id{0};
   EntityId last_entity_id{0};
};

} // namespace orrery

#endif // ORRERY_GALAXY_HPP
