/**
 * @file test_processors.cpp
 * @brief Unit tests for the orbit, movement and economy processors
 */

#include "orrery/processors.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <numbers>
#include <stdexcept>
#include <string>
#include <vector>

using namespace orrery;

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class ProcessorTest : public ::testing::Test
{
protected:
   Clock          clock{TimePoint{0}};
   SubpulseLimit  limit;
   PulseInterrupt interrupt;
   Region         region{.id = 7, .name = "Sol"};

   // Runs 'processor' alone over the fixture's region
   void run(IProcessor& processor, uint64_t seconds, std::uint32_t subpulse_index = 0)
   {
      clock.advance(Duration{seconds});
      limit.reset();
      PulseContext context(clock, limit, interrupt, subpulse_index);
      Region* regions[] = {&region};
      processor.process(context, regions, Duration{seconds});
   }

   Ship& add_ship(Vec2 from, double speed, MoveOrder order)
   {
      region.ships.push_back(Ship{.id = 50, .name = "Endeavour", .position_km = from, .speed_km_s = speed, .order = order});
      return region.ships.back();
   }
};

/* ============================================================================
 * OrbitProcessor
 * ========================================================================= */

class OrbitProcessorTest : public ProcessorTest
{
protected:
   void SetUp() override
   {
      region.bodies.push_back(Body{.id = 1, .name = "Sun"});
      region.bodies.push_back(Body{.id = 2, .name = "Planet", .parent = 0, .orbit_radius_km = 1000.0,
                                   .orbit_period = Duration{400}});
      region.bodies.push_back(Body{.id = 3, .name = "Moon", .parent = 1, .orbit_radius_km = 10.0,
                                   .orbit_period = Duration{100}});
   }

   OrbitProcessor orbit;
};

TEST_F(OrbitProcessorTest, QuarterOrbit)
{
   run(orbit, 100);

   Body const& planet = region.bodies[1];
   EXPECT_NEAR(planet.mean_anomaly_rad, std::numbers::pi / 2.0, 1e-12);
   EXPECT_NEAR(planet.position_km.x, 0.0, 1e-9);
   EXPECT_NEAR(planet.position_km.y, 1000.0, 1e-9);

   // Full moon period: back at anomaly 0, offset from the planet's new position
   Body const& moon = region.bodies[2];
   EXPECT_NEAR(moon.position_km.x, 10.0, 1e-9);
   EXPECT_NEAR(moon.position_km.y, 1000.0, 1e-9);

   // The root does not move
   EXPECT_EQ(region.bodies[0].position_km, (Vec2{0.0, 0.0}));
}

TEST_F(OrbitProcessorTest, SplitStepsMatchOneStep)
{
   Region single = region;

   run(orbit, 60);
   run(orbit, 140);

   Clock other_clock{TimePoint{0}};
   other_clock.advance(Duration{200});
   PulseContext context(other_clock, limit, interrupt, 0);
   Region* regions[] = {&single};
   orbit.process(context, regions, Duration{200});

   EXPECT_NEAR(region.bodies[1].position_km.x, single.bodies[1].position_km.x, 1e-9);
   EXPECT_NEAR(region.bodies[1].position_km.y, single.bodies[1].position_km.y, 1e-9);
   EXPECT_NEAR(region.bodies[2].position_km.x, single.bodies[2].position_km.x, 1e-9);
}

TEST_F(OrbitProcessorTest, NeverLimitsSubpulse)
{
   run(orbit, 100);
   EXPECT_FALSE(limit.is_bounded());
   EXPECT_FALSE(interrupt.is_set());
}

TEST_F(OrbitProcessorTest, ChildBeforeParentIsARegionFault)
{
   region.bodies[1].parent = 2;

   try {
      run(orbit, 100);
      FAIL() << "expected RegionFault";
   } catch (RegionFault const& fault) {
      EXPECT_EQ(fault.region(), 7u);
      EXPECT_NE(std::string(fault.what()).find("Planet"), std::string::npos);
   }
}

/* ============================================================================
 * MovementProcessor
 * ========================================================================= */

class MovementProcessorTest : public ProcessorTest
{
protected:
   MovementProcessor movement;
};

TEST_F(MovementProcessorTest, MovesTowardTargetAndLimitsToArrival)
{
   Ship& ship = add_ship({0.0, 0.0}, 10.0, MoveOrder{.target_km = {1000.0, 0.0}});

   run(movement, 30);

   EXPECT_NEAR(ship.position_km.x, 300.0, 1e-9);
   EXPECT_TRUE(ship.order.has_value());
   EXPECT_EQ(limit.read().value, 70u);
   EXPECT_FALSE(interrupt.is_set());
}

TEST_F(MovementProcessorTest, ArrivalSnapsClearsOrderAndInterrupts)
{
   Ship& ship = add_ship({300.0, 0.0}, 10.0, MoveOrder{.target_km = {1000.0, 0.0}});

   run(movement, 70);

   EXPECT_EQ(ship.position_km, (Vec2{1000.0, 0.0}));
   EXPECT_FALSE(ship.order.has_value());
   EXPECT_FALSE(limit.is_bounded());

   ASSERT_TRUE(interrupt.is_set());
   EXPECT_EQ(interrupt.current()->region, 7u);
   EXPECT_EQ(interrupt.current()->entity, 50u);
   EXPECT_NE(interrupt.current()->reason.find("Endeavour"), std::string::npos);
   EXPECT_EQ(interrupt.current()->raised_at.value, 70);
}

TEST_F(MovementProcessorTest, OvershootStillArrives)
{
   Ship& ship = add_ship({0.0, 0.0}, 10.0, MoveOrder{.target_km = {0.0, 55.0}});

   run(movement, 3600);

   EXPECT_EQ(ship.position_km, (Vec2{0.0, 55.0}));
   EXPECT_TRUE(interrupt.is_set());
}

TEST_F(MovementProcessorTest, QuietArrival)
{
   Ship& ship = add_ship({0.0, 0.0}, 10.0, MoveOrder{.target_km = {10.0, 0.0}, .interrupt_on_arrival = false});

   run(movement, 5);

   EXPECT_FALSE(ship.order.has_value());
   EXPECT_FALSE(interrupt.is_set());
}

TEST_F(MovementProcessorTest, ChasesBodyPosition)
{
   region.bodies.push_back(Body{.id = 9, .name = "Mars", .position_km = {0.0, 500.0}});
   Ship& ship = add_ship({0.0, 0.0}, 10.0, MoveOrder{.target_body = 9u});

   run(movement, 20);
   EXPECT_NEAR(ship.position_km.y, 200.0, 1e-9);

   // Body moved; the ship re-targets its current position
   region.bodies[0].position_km = {0.0, 260.0};
   run(movement, 6);
   EXPECT_EQ(ship.position_km, (Vec2{0.0, 260.0}));
   EXPECT_FALSE(ship.order.has_value());
}

TEST_F(MovementProcessorTest, IdleShipsIgnored)
{
   region.ships.push_back(Ship{.id = 1, .name = "Idle", .position_km = {5.0, 5.0}});

   run(movement, 100);

   EXPECT_EQ(region.ships[0].position_km, (Vec2{5.0, 5.0}));
   EXPECT_FALSE(limit.is_bounded());
}

TEST_F(MovementProcessorTest, CrawlingShipDoesNotLimitSubpulse)
{
   Ship& ship = add_ship({0.0, 0.0}, 1e-30, MoveOrder{.target_km = {1e6, 0.0}});

   run(movement, 5);

   EXPECT_TRUE(ship.order.has_value());
   EXPECT_FALSE(limit.is_bounded());
   EXPECT_FALSE(interrupt.is_set());
}

TEST_F(MovementProcessorTest, OrderWithoutSpeedIsARegionFault)
{
   add_ship({0.0, 0.0}, 0.0, MoveOrder{.target_km = {10.0, 0.0}});

   EXPECT_THROW(run(movement, 5), RegionFault);
}

TEST_F(MovementProcessorTest, UnknownTargetBodyIsARegionFault)
{
   add_ship({0.0, 0.0}, 1.0, MoveOrder{.target_body = 404u});

   try {
      run(movement, 5);
      FAIL() << "expected RegionFault";
   } catch (RegionFault const& fault) {
      EXPECT_EQ(fault.region(), 7u);
      EXPECT_NE(std::string(fault.what()).find("404"), std::string::npos);
   }
}

/* ============================================================================
 * EconomyProcessor
 * ========================================================================= */

class EconomyProcessorTest : public ProcessorTest
{
protected:
   void SetUp() override
   {
      region.colonies.push_back(Colony{.id = 20, .name = "Luna Base", .industry_per_cycle = 5.0});
   }

   EconomyProcessor economy{Duration{100}};
};

TEST_F(EconomyProcessorTest, AppliesWholeCyclesOnly)
{
   Colony& colony = region.colonies[0];

   run(economy, 250);
   EXPECT_DOUBLE_EQ(colony.stockpile, 10.0);
   EXPECT_EQ(colony.cycle_progress.value, 50u);

   // Next subpulse ends on the next cycle boundary
   EXPECT_EQ(limit.read().value, 50u);

   run(economy, 50);
   EXPECT_DOUBLE_EQ(colony.stockpile, 15.0);
   EXPECT_TRUE(colony.cycle_progress.is_zero());
   EXPECT_EQ(limit.read().value, 100u);
}

TEST_F(EconomyProcessorTest, StockpileAlertFiresOnce)
{
   Colony& colony = region.colonies[0];
   colony.stockpile_alert = 10.0;

   run(economy, 100);
   EXPECT_FALSE(interrupt.is_set());

   run(economy, 100);
   ASSERT_TRUE(interrupt.is_set());
   EXPECT_EQ(interrupt.current()->entity, 20u);
   EXPECT_EQ(interrupt.current()->region, 7u);
   EXPECT_TRUE(colony.alert_raised);

   interrupt.clear();
   run(economy, 100);
   EXPECT_FALSE(interrupt.is_set());
}

TEST_F(EconomyProcessorTest, ZeroCycleRejected)
{
   EXPECT_THROW(EconomyProcessor{Duration{0}}, std::invalid_argument);
   EXPECT_EQ(EconomyProcessor{}.cycle_length().value, config::ECONOMY_CYCLE);
}

/* ============================================================================
 * Region fault tagging
 * ========================================================================= */

TEST_F(ProcessorTest, FaultNamesTheFailingRegion)
{
   Region healthy{.id = 1, .name = "Healthy"};
   healthy.ships.push_back(Ship{.id = 1, .name = "Fine", .speed_km_s = 1.0, .order = MoveOrder{.target_km = {100.0, 0.0}}});
   region.ships.push_back(Ship{.id = 2, .name = "Stuck", .order = MoveOrder{.target_km = {1.0, 0.0}}});

   std::vector<std::unique_ptr<IProcessor>> stages;
   stages.push_back(std::make_unique<MovementProcessor>());
   Pipeline pipeline(std::move(stages));

   clock.advance(Duration{5});
   PulseContext context(clock, limit, interrupt, 3);
   Region* regions[] = {&healthy, &region};

   try {
      pipeline.run_all(context, regions, Duration{5});
      FAIL() << "expected ProcessorFault";
   } catch (ProcessorFault const& fault) {
      EXPECT_EQ(fault.processor(), "movement");
      EXPECT_EQ(fault.region(), 7u);
      EXPECT_EQ(fault.subpulse_index(), 3u);
      EXPECT_NE(fault.detail().find("Stuck"), std::string::npos);
   }

   // Regions before the failing one were already processed
   EXPECT_NEAR(healthy.ships[0].position_km.x, 5.0, 1e-9);
}

namespace
{
   class ThrowingRegionProcessor final : public RegionProcessor
   {
   public:
      [[nodiscard]] std::string_view name() const noexcept override { return "throwing"; }

   protected:
      void process_region(PulseContext&, Region&, Duration) override { throw 7; }
   };
}

TEST_F(ProcessorTest, NonStandardExceptionStillNamesTheRegion)
{
   ThrowingRegionProcessor processor;

   try {
      run(processor, 5);
      FAIL() << "expected RegionFault";
   } catch (RegionFault const& fault) {
      EXPECT_EQ(fault.region(), 7u);
      EXPECT_NE(std::string(fault.what()).find("unknown exception"), std::string::npos);
   }
}
