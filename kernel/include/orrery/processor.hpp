/**
 * @file processor.hpp
 * @brief Processor and Pipeline contract
 *
 * A processor is a stateless unit of simulation logic (orbits, movement,
 * economy, ...). The Pipeline runs a fixed, ordered list of them once per
 * subpulse against every active region:
 *
 *   PulseScheduler: subpulse of N seconds
 *    -> Pipeline::run_all(context, regions, N)
 *       -> processor[0].process(context, regions, N)
 *       -> processor[1].process(context, regions, N)  // sees processor[0]'s writes
 *       -> ...
 *
 * Processors talk back to the scheduler only through the PulseContext
 * registers. They must never call PulseScheduler::advance() themselves.
 */

#ifndef ORRERY_PROCESSOR_HPP
#define ORRERY_PROCESSOR_HPP

#include "orrery/clock.hpp"
#include "orrery/game_time.hpp"
#include "orrery/pulse_registers.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace orrery
{

/**
 * @brief A simulated spatial partition (star system)
 *
 * Opaque to the kernel: the scheduler and pipeline pass regions along but
 * never look inside. The world layer defines it.
 */
struct Region;

using RegionSet = std::span<Region* const>;

/* ============================================================================
 * PulseContext
 * ========================================================================= */

/**
 * @brief A processor's view of the simulation instance for one subpulse
 *
 * Built by the scheduler for each subpulse. Exposes the clock read-only and
 * the two coordination registers write-only (narrowing/raising).
 */
class PulseContext
{
public:
   PulseContext(Clock const& clock, SubpulseLimit& next_subpulse, PulseInterrupt& interrupt,
                std::uint32_t subpulse_index) noexcept
      : game_clock(clock), limit(next_subpulse), pulse_interrupt(interrupt), index(subpulse_index) {}

   PulseContext(PulseContext const&)            = delete;
   PulseContext& operator=(PulseContext const&) = delete;

   [[nodiscard]] Clock const& clock() const noexcept { return game_clock; }
   [[nodiscard]] TimePoint    now()   const noexcept { return game_clock.now(); }

   /**
    * @brief 0-based index of this subpulse within the current advance() call
    */
   [[nodiscard]] std::uint32_t subpulse_index() const noexcept { return index; }

   /**
    * @brief Name of the processor currently running (empty outside a pipeline pass)
    */
   [[nodiscard]] std::string_view active_processor() const noexcept { return running; }

   /**
    * @brief Ask for the next subpulse to last at most 'seconds'
    */
   void request_subpulse_limit(Duration seconds) noexcept { limit.request(seconds); }

   /**
    * @brief Raise the pulse interrupt
    * @return true if this call won the register
    *
    * Stamps the interrupt with the current clock value, and with the active
    * processor's name when the caller left 'source' empty.
    */
   bool raise_interrupt(Interrupt interrupt);

   [[nodiscard]] bool interrupt_pending() const noexcept { return pulse_interrupt.is_set(); }

   [[nodiscard]] SubpulseLimit const&  next_subpulse() const noexcept { return limit; }
   [[nodiscard]] PulseInterrupt const& interrupt()     const noexcept { return pulse_interrupt; }

private:
   friend class Pipeline;

   Clock const&    game_clock;
   SubpulseLimit&  limit;
   PulseInterrupt& pulse_interrupt;
   std::uint32_t   index;
   std::string_view running{};
};

/* ============================================================================
 * Processor
 * ========================================================================= */

class IProcessor
{
public:
   IProcessor() = default;
   virtual ~IProcessor() = default;
   IProcessor(IProcessor const&)            = delete;
   IProcessor& operator=(IProcessor const&) = delete;

   /**
    * @brief Short, stable name used in logs, interrupts and faults
    */
   [[nodiscard]] virtual std::string_view name() const noexcept = 0;

   /**
    * @brief Advance the processor's slice of the world by 'elapsed' seconds
    * @param context Clock and coordination registers for this subpulse
    * @param regions Every active region, snapshot for this subpulse
    * @param elapsed Length of this subpulse
    *
    * The clock already reads the end of the subpulse when this is called.
    * Throwing aborts the whole advance() call (see ProcessorFault).
    */
   virtual void process(PulseContext& context, RegionSet regions, Duration elapsed) = 0;
};

/* ============================================================================
 * Faults
 * ========================================================================= */

/**
 * @brief Thrown by a processor to tag a failure with the region it hit
 *
 * The Pipeline turns this into a ProcessorFault carrying the region id.
 */
class RegionFault : public std::runtime_error
{
public:
   RegionFault(RegionId region, std::string const& what) : std::runtime_error(what), failed_region(region) {}

   [[nodiscard]] RegionId region() const noexcept { return failed_region; }

private:
   RegionId failed_region;
};

/**
 * @brief A processor failed during a pipeline pass
 *
 * Fatal to the advance() call that was running. Region state written by
 * earlier processors in the same subpulse is not rolled back.
 */
class ProcessorFault : public std::runtime_error
{
public:
   ProcessorFault(std::string processor, std::uint32_t subpulse_index, std::optional<RegionId> region,
                  std::string detail);

   [[nodiscard]] std::string const&      processor()      const noexcept { return processor_name; }
   [[nodiscard]] std::uint32_t           subpulse_index() const noexcept { return subpulse; }
   [[nodiscard]] std::optional<RegionId> region()         const noexcept { return failed_region; }
   [[nodiscard]] std::string const&      detail()         const noexcept { return cause; }

private:
   std::string             processor_name;
   std::uint32_t           subpulse;
   std::optional<RegionId> failed_region;
   std::string             cause;
};

/* ============================================================================
 * Pipeline
 * ========================================================================= */

/**
 * @brief Fixed, ordered list of processors
 *
 * Order is part of correctness: a processor observes every write made by the
 * processors before it in the same subpulse. The list cannot change after
 * construction.
 */
class Pipeline
{
public:
   Pipeline() = default;

   /**
    * @throws std::invalid_argument if any entry is null
    */
   explicit Pipeline(std::vector<std::unique_ptr<IProcessor>> processors);

   Pipeline(Pipeline&&) noexcept            = default;
   Pipeline& operator=(Pipeline&&) noexcept = default;
   Pipeline(Pipeline const&)            = delete;
   Pipeline& operator=(Pipeline const&) = delete;

   /**
    * @brief Run every processor once, in order, synchronously
    * @throws ProcessorFault if a processor throws
    */
   void run_all(PulseContext& context, RegionSet regions, Duration elapsed) const;

   [[nodiscard]] std::size_t size()  const noexcept { return stages.size(); }
   [[nodiscard]] bool        empty() const noexcept { return stages.empty(); }

   [[nodiscard]] std::vector<std::string_view> processor_names() const;

private:
   std::vector<std::unique_ptr<IProcessor>> stages;
};

} // namespace orrery

#endif // ORRERY_PROCESSOR_HPP
