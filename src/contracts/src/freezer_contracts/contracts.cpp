/*****************************************************************/ /**
 * @file   contracts.cpp
 * @brief  Implementation of `contracts.h`
 *
 * @author Raphael Dib Nehme
 * @date   Oct 2025
 *********************************************************************/
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <cpptrace/cpptrace.hpp>

#include <freezer_debugging/debugging.h>
#include "contracts.h"

namespace freezer::contracts
{
  static std::atomic<violation_handler_fn_t*> global_handler = nullptr;

  void unreachable(const std::source_location& loc) noexcept
  {
    violation_handler(
        "freezer::contracts::unreachable()", "An unreachable branch was hit.",
        Kind::Assert, loc);
    std::abort();
  }

  void default_runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept
  {
    std::string trace = {};
    try
    {
      // skip this function, `runtime_violation_handler` and `violation_handler`
      trace = cpptrace::generate_trace(3).to_string(
          cpptrace::isatty(cpptrace::stderr_fileno));
    }
    catch (const std::exception&)
    {
      // out of memory: report without the trace
      trace.clear();
    }

    if (loc.has_value())
    {
      std::fprintf(
          stderr, "FATAL ERROR:\n  %s:%u:%u: in %s\n  %s: %s\n  explanation: %s\n",
          loc->file_name(), static_cast<unsigned>(loc->line()),
          static_cast<unsigned>(loc->column()), loc->function_name(),
          to_string(kind), expr, explanation);
    }
    else
    {
      std::fprintf(
          stderr, "FATAL ERROR:\n  %s: %s\n  explanation: %s\n", to_string(kind),
          expr, explanation);
    }
    if (!trace.empty())
      std::fprintf(stderr, "\n  %s", trace.c_str());

    std::fflush(stderr);
    freezer::breakpoint_if_debugging();
    std::abort();
  }

  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept
  {
    auto handler = global_handler.load(std::memory_order_relaxed);
    if (handler)
      handler(expr, explanation, kind, loc);
    else
      default_runtime_violation_handler(expr, explanation, kind, loc);
  }

  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept
  {
    if (fn == nullptr)
      return global_handler.load(std::memory_order_relaxed);
    return global_handler.exchange(fn, std::memory_order_relaxed);
  }
} // namespace freezer::contracts
