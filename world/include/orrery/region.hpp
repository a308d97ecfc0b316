/**
 * @file region.hpp
 * @brief Region (star system) model used by the reference processors
 *
 * Plain data. Entity storage proper belongs to the host game; this model is
 * just rich enough for the orbit, movement and economy processors to run
 * against.
 */

#ifndef ORRERY_REGION_HPP
#define ORRERY_REGION_HPP

#include "orrery/game_time.hpp"
#include "orrery/pulse_registers.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace orrery
{

struct Vec2
{
   double x{0.0};
   double y{0.0};

   constexpr Vec2 operator+(Vec2 rhs) const { return Vec2{x + rhs.x, y + rhs.y}; }
   constexpr Vec2 operator-(Vec2 rhs) const { return Vec2{x - rhs.x, y - rhs.y}; }
   constexpr Vec2 operator*(double s) const { return Vec2{x * s, y * s}; }
   constexpr bool operator==(Vec2 const&) const = default;

   [[nodiscard]] double length() const { return std::hypot(x, y); }
};

/**
 * @brief A star, planet or moon on a circular orbit
 *
 * 'parent' indexes Region::bodies and must point at an earlier entry, so a
 * single front-to-back pass sees every parent before its children. A body
 * without a parent (or with a zero period) stays where it is.
 */
struct Body
{
   EntityId id{0};
   std::string name;
   std::optional<std::size_t> parent{};
   double orbit_radius_km{0.0};
   Duration orbit_period{0};
   double mean_anomaly_rad{0.0};
   Vec2 position_km{};
};

/**
 * @brief Where a ship is headed
 *
 * If 'target_body' is set the destination is that body's position as of the
 * current subpulse (after orbits have moved), otherwise 'target_km'.
 */
struct MoveOrder
{
   std::optional<EntityId> target_body{};
   Vec2 target_km{};
   bool interrupt_on_arrival{true};
};

struct Ship
{
   EntityId id{0};
   std::string name;
   Vec2 position_km{};
   double speed_km_s{0.0};
   std::optional<MoveOrder> order{};
};

struct Colony
{
   EntityId id{0};
   std::string name;
   double industry_per_cycle{0.0};      ///< Stockpile gained per economy cycle
   double stockpile{0.0};
   std::optional<double> stockpile_alert{}; ///< Interrupt once stockpile reaches this
   bool alert_raised{false};
   Duration cycle_progress{0};          ///< Time into the current economy cycle
};

struct Region
{
   RegionId id{0};
   std::string name;
   bool active{true};

   std::vector<Body>   bodies;
   std::vector<Ship>   ships;
   std::vector<Colony> colonies;

   [[nodiscard]] Body*       find_body(EntityId id) noexcept;
   [[nodiscard]] Body const* find_body(EntityId id) const noexcept;
   [[nodiscard]] Ship*       find_ship(EntityId id) noexcept;
   [[nodiscard]] Colony*     find_colony(EntityId id) noexcept;
};

} // namespace orrery

#endif // ORRERY_REGION_HPP
