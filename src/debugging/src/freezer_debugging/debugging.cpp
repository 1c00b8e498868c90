/*****************************************************************/ /**
 * @file   debugging.cpp
 * @brief  Contains the implementation of `debugging.h`.
 * @date   October 2025
 *********************************************************************/
#include "debugging.h"
#include <freezer_macros/compiler.h>

#if FREEZER_MSVC
  #include <intrin.h>
  #include <windows.h>
#elif defined(__APPLE__)
  #include <sys/types.h>
  #include <sys/sysctl.h>
  #include <unistd.h>
#elif defined(__linux__)
  #include <cstdio>
  #include <cstdlib>
  #include <cstring>
#endif

#include <csignal>

namespace freezer
{
  void breakpoint() noexcept
  {
#if FREEZER_MSVC
    __debugbreak();
#elif (FREEZER_GCC || FREEZER_CLANG) && (defined(__i386__) || defined(__x86_64__))
    __asm__ volatile("int3");
#elif defined(SIGTRAP)
    std::raise(SIGTRAP);
#else
    std::raise(SIGABRT);
#endif
  }

  bool is_debugger_present() noexcept
  {
#if FREEZER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(__APPLE__)
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PID, getpid()};
    struct kinfo_proc info{};
    size_t size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) != 0 || size != sizeof(info))
      return false;
    return (info.kp_proc.p_flag & P_TRACED) != 0;
#elif defined(__linux__)
    FILE* status = std::fopen("/proc/self/status", "r");
    if (!status)
      return false;

    static constexpr char TRACER_PID[] = "TracerPid:";
    char line[256];
    long tracer = 0;
    while (std::fgets(line, sizeof(line), status))
    {
      if (std::strncmp(line, TRACER_PID, sizeof(TRACER_PID) - 1) != 0)
        continue;
      tracer = std::strtol(line + sizeof(TRACER_PID) - 1, nullptr, 10);
      break;
    }
    std::fclose(status);
    return tracer != 0;
#else
    return false;
#endif
  }
} // namespace freezer
