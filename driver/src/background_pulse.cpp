/**
 * @file background_pulse.cpp
 * @brief Worker-thread pulse driver
 */

#include "orrery/background_pulse.hpp"

#include <stdexcept>
#include <stop_token>
#include <utility>

#include "orrery/debug_print.hpp"

namespace orrery
{

BackgroundPulse::BackgroundPulse(PulseScheduler& scheduler, std::int64_t requested_seconds)
   : worker([this, target = &scheduler, requested_seconds](std::stop_token cancel)
     {
        LOG_DRIVER("background pulse of %lld s started", static_cast<long long>(requested_seconds));
        try {
           outcome = target->advance(requested_seconds, cancel, [this](double progress)
           {
              fraction.store(progress, std::memory_order_release);
           });
        } catch (...) {
           // Handed to the joining thread by wait()
           fault = std::current_exception();
        }
        finished.store(true, std::memory_order_release);
     })
{
}

PulseResult BackgroundPulse::wait()
{
   if (worker.joinable()) worker.join();

   if (fault) std::rethrow_exception(std::exchange(fault, nullptr));
   if (!outcome) throw std::logic_error("BackgroundPulse: pulse faulted, no result");
   return *outcome;
}

} // namespace orrery
