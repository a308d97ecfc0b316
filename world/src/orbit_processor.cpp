/**
 * @file orbit_processor.cpp
 * @brief Circular orbit update
 */

#include "orrery/processors.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include "orrery/debug_print.hpp"

namespace orrery
{

static constexpr double TWO_PI = 2.0 * std::numbers::pi;

void OrbitProcessor::process_region(PulseContext& /*context*/, Region& region, Duration elapsed)
{
   for (std::size_t i = 0; i < region.bodies.size(); ++i) {
      Body& body = region.bodies[i];
      if (!body.parent) continue; // Roots stay put

      if (*body.parent >= i) {
         throw std::logic_error("body '" + body.name + "' is listed before its parent");
      }
      Body const& parent = region.bodies[*body.parent];

      if (!body.orbit_period.is_zero()) {
         // Reduce elapsed first so long pulses keep precision
         auto const period = body.orbit_period.value;
         double const fraction = static_cast<double>(elapsed.value % period) / static_cast<double>(period);
         body.mean_anomaly_rad = std::fmod(body.mean_anomaly_rad + TWO_PI * fraction, TWO_PI);
      }

      body.position_km = parent.position_km + Vec2{std::cos(body.mean_anomaly_rad), std::sin(body.mean_anomaly_rad)} * body.orbit_radius_km;
   }

   LOG_PROC("orbit: region %u, %zu bodies", region.id, region.bodies.size());
}

} // namespace orrery
