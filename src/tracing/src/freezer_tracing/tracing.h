/*****************************************************************/ /**
 * @file   tracing.h
 * @brief  Contains tracing macros.
 * Tracing is backed by Tracy and compiled out unless the build
 * defines `FREEZER_ENABLE_TRACING`.
 *
 * @author Raphael Dib Nehme
 * @date   December 2025
 *********************************************************************/
#ifndef __HG_FREEZER_TRACING_TRACING
#define __HG_FREEZER_TRACING_TRACING

#include <chrono>
#include <cstring>

#ifdef FREEZER_ENABLE_TRACING
  #include <Tracy.hpp>

  /// @brief Traces the current function
  #define FREEZER_TRACE_FN() ZoneScoped
  /// @brief Traces a block (which is named)
  /// @code{.cpp}
  /// {
  ///   FREEZER_TRACE_BLOCK("thaw fields");
  ///   for (auto& field : fields)
  ///     thaw_field(field, in);
  /// }
  /// @endcode
  #define FREEZER_TRACE_BLOCK(name) ZoneNamedN(, name, true)
  /// @brief Sends a message (a NUL terminated string) to the profiler
  #define FREEZER_TRACE_MESSAGE(text) TracyMessage(text, std::strlen(text))

#else

  /// @brief Traces the current function
  #define FREEZER_TRACE_FN() \
    do                       \
    {                        \
    } while (0)
  /// @brief Traces a block (which is named)
  #define FREEZER_TRACE_BLOCK(name)   (void)0
  /// @brief Sends a message (a NUL terminated string) to the profiler
  #define FREEZER_TRACE_MESSAGE(text) (void)(text)
#endif // FREEZER_ENABLE_TRACING

namespace freezer
{
  /// @brief Check if the library is built with tracing enabled
  /// @return True if tracing is enabled
  consteval bool is_tracing_enabled() noexcept
  {
#ifndef FREEZER_ENABLE_TRACING
    return false;
#else
    return true;
#endif
  }

  /// @brief Waits for the tracy profiler to be connected
  /// @param timeout The timeout in milliseconds after which to fail
  /// @return True if connection was successful, false otherwise
  bool wait_for_tracer(std::chrono::milliseconds timeout) noexcept;
  /// @brief Forces shutdown of the tracy profiler.
  /// This function waits for all the data to be transferred before returning.
  void shutdown_tracer() noexcept;
} // namespace freezer

#endif // !__HG_FREEZER_TRACING_TRACING
