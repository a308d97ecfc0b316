/**
 * @file background_pulse.hpp
 * @brief Runs one pulse on a worker thread
 *
 * The pulse itself is still strictly sequential; it just runs somewhere
 * other than the caller's foreground thread. The caller must not touch the
 * simulation until wait() returns.
 *
 * Example:
 *   BackgroundPulse pulse(sim.scheduler(), 7 * 24 * 3600);
 *   while (!pulse.done()) {
 *      show(pulse.progress());
 *      if (user_pressed_stop) pulse.request_stop();
 *   }
 *   PulseResult r = pulse.wait();
 */

#ifndef ORRERY_BACKGROUND_PULSE_HPP
#define ORRERY_BACKGROUND_PULSE_HPP

#include "orrery/scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <optional>
#include <thread>

namespace orrery
{

class BackgroundPulse
{
public:
   /**
    * @brief Start the pulse immediately on a new thread
    */
   BackgroundPulse(PulseScheduler& scheduler, std::int64_t requested_seconds);

   /**
    * @brief Requests cancellation and joins
    */
   ~BackgroundPulse() = default;

   BackgroundPulse(BackgroundPulse const&)            = delete;
   BackgroundPulse& operator=(BackgroundPulse const&) = delete;

   /**
    * @brief Last progress fraction reported by the scheduler
    */
   [[nodiscard]] double progress() const noexcept { return fraction.load(std::memory_order_acquire); }

   [[nodiscard]] bool done() const noexcept { return finished.load(std::memory_order_acquire); }

   /**
    * @brief Cancel at the next subpulse boundary
    */
   void request_stop() noexcept { worker.request_stop(); }

   /**
    * @brief Join the worker and return its result
    * @throws whatever advance() threw (e.g. ProcessorFault)
    */
   PulseResult wait();

private:
   std::atomic<double>        fraction{0.0};
   std::atomic<bool>          finished{false};
   std::optional<PulseResult> outcome;
   std::exception_ptr         fault;

   // Last member: the thread starts after everything above is constructed
   std::jthread worker;
};

} // namespace orrery

#endif // ORRERY_BACKGROUND_PULSE_HPP
