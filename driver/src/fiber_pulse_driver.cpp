/**
 * fiber_pulse_driver.cpp
 */
#include "orrery/fiber_pulse_driver.hpp"

#include <boost/context/fiber.hpp>
#include <boost/context/protected_fixedsize_stack.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

#include "orrery/debug_print.hpp"

namespace orrery
{

void FiberPulseDriver::start(std::int64_t requested_seconds, std::stop_token cancel)
{
   if (running) throw std::logic_error("FiberPulseDriver: pulse already in flight");

   outcome.reset();
   fault    = nullptr;
   fraction = 0.0;

   LOG_DRIVER("fiber pulse of %lld s prepared (stack=%zu)", static_cast<long long>(requested_seconds), stack_size);

   boost::context::protected_fixedsize_stack stack_allocator(stack_size);
   pulse = boost::context::fiber(std::allocator_arg, stack_allocator,
      [this, requested_seconds, cancel = std::move(cancel)](boost::context::fiber&& caller_in) mutable -> boost::context::fiber
      {
         // First entry, save the caller fiber handle
         caller = std::move(caller_in);

         try {
            outcome = scheduler.advance(requested_seconds, cancel, [this](double progress)
            {
               fraction = progress;
               // Park on the subpulse boundary until the next step()
               caller = std::move(caller).resume();
            });
         } catch (boost::context::detail::forced_unwind const&) {
            throw; // Driver destroyed mid-pulse, let Boost unwind the stack
         } catch (...) {
            fault = std::current_exception();
         }

         return std::move(caller);
      });

   running = true;
}

bool FiberPulseDriver::step()
{
   if (!running) return false;

   // Enter/resume the pulse fiber. Returns when it parks or finishes
   pulse = std::move(pulse).resume();

   if (!pulse) {
      running = false;
      LOG_DRIVER("fiber pulse finished%s", fault ? " with a fault" : "");
      if (fault) std::rethrow_exception(std::exchange(fault, nullptr));
   }
   return running;
}

PulseResult FiberPulseDriver::run_to_completion()
{
   if (!running && !outcome) throw std::logic_error("FiberPulseDriver: no pulse started");

   while (step()) {}
   return *outcome;
}

} // namespace orrery
