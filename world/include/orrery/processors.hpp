/**
 * @file processors.hpp
 * @brief Reference processors for the default pipeline
 *
 * Default order (see Simulation::default_pipeline()):
 *
 *   OrbitProcessor    -> bodies move along their orbits
 *   MovementProcessor -> ships move, chasing bodies at their new positions
 *   EconomyProcessor  -> colonies produce once per economy cycle
 *
 * The formulas here are deliberately simple (circular orbits, straight-line
 * travel at constant speed, flat production). What matters is how each one
 * uses the subpulse registers.
 */

#ifndef ORRERY_PROCESSORS_HPP
#define ORRERY_PROCESSORS_HPP

#include "orrery/config.hpp"
#include "orrery/processor.hpp"
#include "orrery/region.hpp"

#include <string_view>

namespace orrery
{

/**
 * @brief Processor that handles one region at a time
 *
 * Any std::exception escaping process_region() is rethrown as a RegionFault
 * for that region, so the resulting ProcessorFault names it.
 */
class RegionProcessor : public IProcessor
{
public:
   void process(PulseContext& context, RegionSet regions, Duration elapsed) final;

protected:
   virtual void process_region(PulseContext& context, Region& region, Duration elapsed) = 0;
};

/**
 * @brief Circular orbits
 *
 * Advances each body's mean anomaly by 2*pi*elapsed/period and places it
 * relative to its (already updated) parent.
 */
class OrbitProcessor final : public RegionProcessor
{
public:
   [[nodiscard]] std::string_view name() const noexcept override { return "orbit"; }

protected:
   void process_region(PulseContext& context, Region& region, Duration elapsed) override;
};

/**
 * @brief Straight-line ship movement
 *
 * A ship that will not reach its destination this subpulse asks for the
 * next subpulse to end when it would arrive, so arrivals land exactly on a
 * subpulse boundary. Arrival clears the order and, if requested, raises the
 * pulse interrupt.
 */
class MovementProcessor final : public RegionProcessor
{
public:
   [[nodiscard]] std::string_view name() const noexcept override { return "movement"; }

protected:
   void process_region(PulseContext& context, Region& region, Duration elapsed) override;
};

/**
 * @brief Cycle-based colony production
 *
 * Production is applied in whole cycles. Each colony bounds the next
 * subpulse so it ends on its next cycle boundary.
 */
class EconomyProcessor final : public RegionProcessor
{
public:
   /**
    * @throws std::invalid_argument if cycle is zero
    */
   explicit EconomyProcessor(Duration cycle = Duration{config::ECONOMY_CYCLE});

   [[nodiscard]] std::string_view name() const noexcept override { return "economy"; }

   [[nodiscard]] Duration cycle_length() const noexcept { return cycle; }

protected:
   void process_region(PulseContext& context, Region& region, Duration elapsed) override;

private:
   Duration cycle;
};

} // namespace orrery

#endif // ORRERY_PROCESSORS_HPP
