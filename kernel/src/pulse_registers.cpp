/**
 * @file pulse_registers.cpp
 */

#include "orrery/pulse_registers.hpp"

#include <utility>

#include "orrery/debug_print.hpp"

namespace orrery
{

bool PulseInterrupt::raise(Interrupt interrupt)
{
   if (slot) {
      LOG_SCHED("interrupt '%s' from %s ignored, already holding '%s'",
                interrupt.reason.c_str(), interrupt.source.c_str(), slot->reason.c_str());
      return false;
   }

   slot = std::move(interrupt);
   LOG_SCHED("interrupt raised by %s: %s", slot->source.c_str(), slot->reason.c_str());
   return true;
}

} // namespace orrery
