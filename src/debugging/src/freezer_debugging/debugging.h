/*****************************************************************/ /**
 * @file   debugging.h
 * @brief  Contains programmatic debugging utilities.
 * Used by the contract violation handler to stop in an attached
 * debugger before aborting.
 * @date   October 2025
 *********************************************************************/
#ifndef __HG_FREEZER_DEBUGGING_DEBUGGING
#define __HG_FREEZER_DEBUGGING_DEBUGGING

#include <freezer_debugging_export.h>

namespace freezer
{
  FREEZER_DEBUGGING_EXPORT
  /// @brief Attempts to pass control to the debugger
  void breakpoint() noexcept;

  FREEZER_DEBUGGING_EXPORT
  /// @brief Checks whether the current process is traced by a debugger
  /// @return True if under the control of a debugger
  bool is_debugger_present() noexcept;

  /// @brief Pass control to the debugger only if running under one
  inline void breakpoint_if_debugging() noexcept
  {
    if (is_debugger_present())
      breakpoint();
  }
} // namespace freezer

#endif // !__HG_FREEZER_DEBUGGING_DEBUGGING
