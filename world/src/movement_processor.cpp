/**
 * @file movement_processor.cpp
 * @brief Straight-line ship movement
 */

#include "orrery/processors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "orrery/debug_print.hpp"

namespace orrery
{

// Arrival tolerance absorbs floating point error in the last step
static constexpr double ARRIVAL_EPSILON_KM = 1e-6;

static Vec2 resolve_destination(Region const& region, Ship const& ship, MoveOrder const& order)
{
   if (!order.target_body) return order.target_km;

   Body const* body = region.find_body(*order.target_body);
   if (!body) {
      throw std::runtime_error("ship '" + ship.name + "' ordered to unknown body " + std::to_string(*order.target_body));
   }
   return body->position_km;
}

void MovementProcessor::process_region(PulseContext& context, Region& region, Duration elapsed)
{
   for (Ship& ship : region.ships) {
      if (!ship.order) continue;

      if (!(ship.speed_km_s > 0.0)) {
         throw std::runtime_error("ship '" + ship.name + "' has a move order but no speed");
      }

      Vec2 const destination = resolve_destination(region, ship, *ship.order);
      Vec2 const to_go       = destination - ship.position_km;
      double const distance  = to_go.length();
      double const travel    = ship.speed_km_s * static_cast<double>(elapsed.value);

      if (travel + ARRIVAL_EPSILON_KM >= distance) {
         ship.position_km = destination;
         bool const notify = ship.order->interrupt_on_arrival;
         ship.order.reset();

         LOG_PROC("movement: ship %u '%s' arrived (interrupt=%s)", ship.id, ship.name.c_str(), TRUE_FALSE(notify));
         if (notify) {
            context.raise_interrupt(Interrupt{
               .reason = "ship '" + ship.name + "' arrived at destination",
               .region = region.id,
               .entity = ship.id,
            });
         }
         continue;
      }

      ship.position_km = ship.position_km + to_go * (travel / distance);

      // End the next subpulse on the (projected) arrival
      double const seconds_left = std::ceil((distance - travel) / ship.speed_km_s);
      if (seconds_left >= static_cast<double>(Duration::max().value)) continue; // Too slow to bound anything
      context.request_subpulse_limit(Duration{static_cast<uint64_t>(seconds_left)});
   }
}

} // namespace orrery
