/**
 * @file fiber_pulse_driver.hpp
 * @brief Cooperative pulse driver (Boost.Context fiber backend)
 *
 * Runs a PulseScheduler::advance() call on its own fiber and hands control
 * back to the caller at every subpulse boundary. A UI or server loop can
 * then interleave other work with a long pulse without a second thread:
 *
 *   FiberPulseDriver driver(sim.scheduler());
 *   driver.start(30 * 24 * 3600);
 *   while (driver.step()) {
 *      redraw(driver.progress());   // between subpulses
 *   }
 *   PulseResult r = *driver.result();
 *
 * Everything still happens on the caller's thread; the fiber only changes
 * where the loop is parked. Suspension happens exactly between one
 * subpulse's progress report and the next cancellation check, never inside
 * a pipeline pass.
 */

#ifndef ORRERY_FIBER_PULSE_DRIVER_HPP
#define ORRERY_FIBER_PULSE_DRIVER_HPP

#include "orrery/config.hpp"
#include "orrery/scheduler.hpp"

#include <boost/context/fiber.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <stop_token>

namespace orrery
{

class FiberPulseDriver
{
public:
   explicit FiberPulseDriver(PulseScheduler& scheduler, std::size_t stack_size = config::FIBER_STACK_SIZE) noexcept
      : scheduler(scheduler), stack_size(stack_size) {}

   /**
    * @brief Destroying a driver mid-pulse unwinds the fiber stack
    *
    * Subpulses already committed stay committed.
    */
   ~FiberPulseDriver() = default;

   FiberPulseDriver(FiberPulseDriver const&)            = delete;
   FiberPulseDriver& operator=(FiberPulseDriver const&) = delete;
   FiberPulseDriver(FiberPulseDriver&&)            = delete;
   FiberPulseDriver& operator=(FiberPulseDriver&&) = delete;

   /**
    * @brief Prepare a pulse; nothing runs until the first step()
    * @throws std::logic_error if a pulse is already in flight
    */
   void start(std::int64_t requested_seconds, std::stop_token cancel = {});

   /**
    * @brief Run until the next subpulse boundary or the end of the pulse
    * @return true if the pulse has more work left
    * @throws ProcessorFault (or anything else advance() throws), after which
    *         the driver is idle again
    */
   bool step();

   /**
    * @brief step() until done
    * @throws std::logic_error if no pulse was started
    */
   PulseResult run_to_completion();

   [[nodiscard]] bool   in_flight() const noexcept { return running; }
   [[nodiscard]] double progress()  const noexcept { return fraction; }

   /**
    * @brief Result of the last finished pulse
    */
   [[nodiscard]] std::optional<PulseResult> const& result() const noexcept { return outcome; }

private:
   PulseScheduler& scheduler;
   std::size_t     stack_size;

   boost::context::fiber caller; // caller to return to (owned by the pulse side)

   std::optional<PulseResult> outcome;
   std::exception_ptr         fault;
   double                     fraction{0.0};
   bool                       running{false};

   // Declared last: destroyed (and unwound) before anything it references
   boost::context::fiber pulse;  // parked pulse (owned by the caller side)
};

} // namespace orrery

#endif // ORRERY_FIBER_PULSE_DRIVER_HPP
