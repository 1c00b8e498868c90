/*****************************************************************/ /**
 * @file   tracing.cpp
 * @brief  Contains the implementation of `tracing.h`
 *
 * @author Raphael Dib Nehme
 * @date   December 2025
 *********************************************************************/
#include "tracing.h"
#include <thread>

namespace freezer
{
  bool wait_for_tracer(std::chrono::milliseconds timeout) noexcept
  {
#ifndef FREEZER_ENABLE_TRACING
    (void)timeout;
    return false;
#else
    using namespace std::chrono_literals;

    const auto start = std::chrono::steady_clock::now();
    while (!tracy::GetProfiler().IsConnected())
    {
      if (std::chrono::steady_clock::now() - start >= timeout)
        return false;
      std::this_thread::sleep_for(15ms);
    }
    return true;
#endif
  }

  void shutdown_tracer() noexcept
  {
#ifdef FREEZER_ENABLE_TRACING
    using namespace std::chrono_literals;

    if (!tracy::GetProfiler().IsConnected())
      return;
    tracy::GetProfiler().RequestShutdown();
    while (!tracy::GetProfiler().HasShutdownFinished())
      std::this_thread::sleep_for(15ms);
#endif
  }
} // namespace freezer
