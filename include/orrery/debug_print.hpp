// Just for debugging ;)
#ifndef ORRERY_DEBUG_PRINT_HPP
#define ORRERY_DEBUG_PRINT_HPP

#include <cstdint>
#include <cstdio>

namespace orrery::debug
{
   enum class Channel
   {
      Scheduler,
      Pipeline,
      Processor,
      Driver,
      Test
   };

#if DEBUG_PRINT_ENABLE
   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "\x1b[36m"; // cyan
         case Channel::Pipeline:  return "\x1b[35m"; // magenta
         case Channel::Processor: return "\x1b[34m"; // blue
         case Channel::Driver:    return "\x1b[33m"; // yellow
         case Channel::Test:      return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "SCHED ";
         case Channel::Pipeline:  return "PIPE  ";
         case Channel::Processor: return "PROC  ";
         case Channel::Driver:    return "DRIVER";
         case Channel::Test:      return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      std::printf("%s[%s] ", color(ch), label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
   }

   inline constexpr const char* outcome_to_str(uint8_t outcome)
   {
      switch (outcome) {
         case 0: return "Completed";
         case 1: return "Interrupted";
         case 2: return "Cancelled";
         default: return "???";
      }
   }
#endif

}

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_SCHED(fmt, ...)      orrery::debug::print(orrery::debug::Channel::Scheduler, fmt, ##__VA_ARGS__)
#  define LOG_PIPE(fmt, ...)       orrery::debug::print(orrery::debug::Channel::Pipeline,  fmt, ##__VA_ARGS__)
#  define LOG_PROC(fmt, ...)       orrery::debug::print(orrery::debug::Channel::Processor, fmt, ##__VA_ARGS__)
#  define LOG_DRIVER(fmt, ...)     orrery::debug::print(orrery::debug::Channel::Driver,    fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)       orrery::debug::print(orrery::debug::Channel::Test,      fmt, ##__VA_ARGS__)
#  define OUTCOME_TO_STR(outcome)  orrery::debug::outcome_to_str(static_cast<uint8_t>(outcome))
#  define TRUE_FALSE(what) what ? "TRUE" : "FALSE"
#else
#  define LOG_SCHED(...)  ((void)0)
#  define LOG_PIPE(...)   ((void)0)
#  define LOG_PROC(...)   ((void)0)
#  define LOG_DRIVER(...) ((void)0)
#  define LOG_TEST(...)   ((void)0)
#  define OUTCOME_TO_STR(outcome)
#  define TRUE_FALSE(what)
#endif

#endif
