/**
 * @file region.cpp
 */

#include "orrery/region.hpp"

#include <algorithm>

namespace orrery
{

template<typename Range>
static auto* find_by_id(Range& range, EntityId id) noexcept
{
   auto it = std::find_if(range.begin(), range.end(), [id](auto const& e) { return e.id == id; });
   return it == range.end() ? nullptr : &*it;
}

Body*       Region::find_body(EntityId id) noexcept       { return find_by_id(bodies, id); }
Body const* Region::find_body(EntityId id) const noexcept { return find_by_id(bodies, id); }
Ship*       Region::find_ship(EntityId id) noexcept       { return find_by_id(ships, id); }
Colony*     Region::find_colony(EntityId id) noexcept     { return find_by_id(colonies, id); }

} // namespace orrery
