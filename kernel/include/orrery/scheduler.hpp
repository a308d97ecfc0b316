/**
 * @file scheduler.hpp
 * @brief Orrery pulse scheduler (time-advancement loop)
 *
 * The scheduler is the only way game time moves. A caller asks for a pulse
 * of N seconds; the scheduler splits it into subpulses whose lengths are
 * negotiated with the processors, and runs the whole pipeline once per
 * subpulse:
 *
 *   advance(N)
 *    -> quantize N to the minimum timestep, clear the interrupt
 *    -> while no interrupt and time remains:
 *          cancellation check (only suspension/abort point)
 *          subpulse = min(SubpulseLimit, remaining); SubpulseLimit.reset()
 *          Clock += subpulse
 *          Pipeline::run_all(context, active regions, subpulse)
 *          report progress
 *
 * Single-threaded by contract: callers must serialize advance() calls on a
 * given scheduler. The call itself may run on any one thread (see the
 * drivers).
 */

#ifndef ORRERY_SCHEDULER_HPP
#define ORRERY_SCHEDULER_HPP

#include "orrery/clock.hpp"
#include "orrery/config.hpp"
#include "orrery/game_time.hpp"
#include "orrery/processor.hpp"
#include "orrery/pulse_registers.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <vector>

namespace orrery
{

/**
 * @brief Supplies the set of active regions, fresh for every subpulse
 *
 * The scheduler never caches the returned list, so regions may be added or
 * removed between subpulses.
 */
class IRegionProvider
{
public:
   virtual ~IRegionProvider() = default;

   [[nodiscard]] virtual std::vector<Region*> active_regions() = 0;
};

struct SchedulerSettings
{
   Duration minimum_timestep{config::MINIMUM_TIMESTEP};
};

enum class PulseOutcome : std::uint8_t
{
   Completed,    ///< The whole (quantized) request was advanced
   Interrupted,  ///< A processor raised the interrupt; see PulseResult::interrupt
   Cancelled     ///< The stop token fired at a subpulse boundary
};

/**
 * @brief What an advance() call actually did
 */
struct PulseResult
{
   PulseOutcome outcome{PulseOutcome::Completed};
   Duration requested{0};               ///< Request after quantization
   Duration advanced{0};                ///< Game time committed by this call
   std::uint32_t subpulses{0};          ///< Pipeline passes that ran
   std::optional<Interrupt> interrupt{}; ///< Set when outcome == Interrupted

   [[nodiscard]] bool completed()   const noexcept { return outcome == PulseOutcome::Completed;   }
   [[nodiscard]] bool interrupted() const noexcept { return outcome == PulseOutcome::Interrupted; }
   [[nodiscard]] bool cancelled()   const noexcept { return outcome == PulseOutcome::Cancelled;   }
};

/**
 * @brief Progress callback, receives advanced/requested in [0,1] after every subpulse
 */
using ProgressSink = std::function<void(double)>;

class PulseScheduler
{
public:
   /**
    * @throws std::invalid_argument if settings.minimum_timestep is zero
    */
   explicit PulseScheduler(TimePoint start, SchedulerSettings settings = {});

   PulseScheduler(PulseScheduler const&)            = delete;
   PulseScheduler& operator=(PulseScheduler const&) = delete;

   /**
    * @brief Install the pipeline and region provider (second init phase)
    * @throws std::logic_error if already installed
    *
    * 'regions' must outlive the scheduler.
    */
   void install(Pipeline&& pipeline, IRegionProvider& regions);

   [[nodiscard]] bool is_ready() const noexcept { return installed; }

   /**
    * @brief Advance game time by up to 'requested_seconds'
    * @param requested_seconds Quantized down to the minimum timestep; zero or
    *        negative requests advance exactly one minimum timestep, and
    *        requests past the last representable date are cut short there
    * @param cancel Checked once at every subpulse boundary
    * @param progress Optional progress callback
    * @return What was advanced and why the call stopped
    * @throws ProcessorFault if a processor fails (clock keeps the failing subpulse)
    * @throws std::logic_error if install() has not been called
    * @throws std::overflow_error only once the clock is within one minimum
    *         timestep of the last representable date
    */
   [[nodiscard]] PulseResult advance(std::int64_t requested_seconds,
                                     std::stop_token cancel = {},
                                     ProgressSink const& progress = {});

   /**
    * @brief The length a request of 'requested_seconds' is normalized to
    */
   [[nodiscard]] Duration quantize(std::int64_t requested_seconds) const noexcept;

   [[nodiscard]] Duration minimum_timestep() const noexcept { return settings.minimum_timestep; }

   [[nodiscard]] Clock const&          clock()         const noexcept { return game_clock; }
   [[nodiscard]] SubpulseLimit const&  next_subpulse() const noexcept { return subpulse_limit; }
   [[nodiscard]] PulseInterrupt const& interrupt()     const noexcept { return pulse_interrupt; }
   [[nodiscard]] Pipeline const&       pipeline()      const noexcept { return processors; }

   /**
    * @brief Acknowledge an interrupt left over from the last advance()
    *
    * advance() clears it anyway on entry; this is for callers that want the
    * register empty before deciding what to do next.
    */
   void clear_interrupt() noexcept { pulse_interrupt.clear(); }

private:
   SchedulerSettings settings;
   Clock             game_clock;
   SubpulseLimit     subpulse_limit;
   PulseInterrupt    pulse_interrupt;
   Pipeline          processors;
   IRegionProvider*  region_provider{nullptr};
   bool              installed{false};
};

} // namespace orrery

#endif // ORRERY_SCHEDULER_HPP
