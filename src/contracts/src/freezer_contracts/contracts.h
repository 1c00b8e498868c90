/*****************************************************************/ /**
 * @file   contracts.h
 * @brief  Contains macros for assertions, pre/post conditions.
 * Contracts guard against programmer errors (null contexts, invoking
 * values that cannot be invoked...). Recoverable failures, such as
 * malformed input or unfreezable values, are reported through
 * `Expected` and never through contracts.
 *
 * @author Raphael Dib Nehme
 * @date   Oct 2025
 *********************************************************************/
#ifndef __HG_FREEZER_CONTRACTS_CONTRACTS
#define __HG_FREEZER_CONTRACTS_CONTRACTS

#include "freezer_contracts_export.h"
#include "freezer_contracts_config.h"
#include <source_location>
#include <optional>
#include <type_traits>

#ifdef FREEZER_NO_SOURCE_LOCATION
  /// @brief The current source location
  #define FREEZER_CURRENT_SOURCE_LOCATION std::source_location()
#else
  /// @brief The current source location
  #define FREEZER_CURRENT_SOURCE_LOCATION std::source_location::current()
#endif // FREEZER_NO_SOURCE_LOCATION

namespace freezer::contracts
{
  /// @brief The contract kind
  enum class Kind : unsigned char
  {
    /// @brief Precondition
    Pre,
    /// @brief Postcondition
    Post,
    /// @brief Assertion
    Assert,
  };

  /// @brief Returns a human readable name for `kind`
  /// @param kind The kind
  /// @return "precondition", "postcondition" or "assertion"
  constexpr const char* to_string(Kind kind) noexcept
  {
    switch (kind)
    {
    case Kind::Pre:
      return "precondition";
    case Kind::Post:
      return "postcondition";
    default:
      return "assertion";
    }
  }

  /// @brief A contract failed during constant evaluation.
  /// Calling this non-constexpr function from a constant expression
  /// halts compilation.
  inline void contract_failed_in_constexpr()
  {
    // A contract failed at compile-time!
  }

  /// @brief The type of a violation handler function
  using violation_handler_fn_t = void(
      const char*, const char*, Kind,
      const std::optional<std::source_location>&) noexcept;

  [[noreturn]] FREEZER_CONTRACTS_EXPORT
      /// @brief Marks a branch as unreachable.
      /// @param loc The source location
      void
      unreachable(
          const std::source_location& loc =
              FREEZER_CURRENT_SOURCE_LOCATION) noexcept;

  [[noreturn]] FREEZER_CONTRACTS_EXPORT
      /// @brief The default runtime contract violation handler.
      /// Prints the violation and a stack trace, then aborts.
      /// @param expr The expression as a string
      /// @param explanation The explanation
      /// @param kind The kind of the violation
      /// @param loc The source location
      void
      default_runtime_violation_handler(
          const char* expr, const char* explanation, Kind kind,
          const std::optional<std::source_location>& loc) noexcept;

  FREEZER_CONTRACTS_EXPORT
  /// @brief Calls the registered violation handler, or the default one.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The kind of the violation
  /// @param loc The source location
  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept;

  /// @brief The contract violation handler.
  /// During constant evaluation only a compilation error can be produced.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The violation kind
  /// @param loc The source code location
  constexpr void violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc =
          FREEZER_CURRENT_SOURCE_LOCATION) noexcept
  {
    if (std::is_constant_evaluated())
      contract_failed_in_constexpr();
    else
      runtime_violation_handler(expr, explanation, kind, loc);
  }

  FREEZER_CONTRACTS_EXPORT
  /// @brief Replaces the current violation handler.
  /// The registered function should not return. Does nothing for `nullptr`.
  /// @param fn The new violation handler
  /// @return The previously registered handler (nullptr for the default)
  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept;
} // namespace freezer::contracts

#define __FREEZER_CONTRACT(cond, explanation, kind)                  \
  do                                                                 \
  {                                                                  \
    if (!static_cast<bool>(cond))                                    \
      freezer::contracts::violation_handler(#cond, explanation, kind); \
  } while (false)

/// @brief Precondition (checks that `cond` evaluates to true)
#define FREEZER_pre(cond, explanation) \
  __FREEZER_CONTRACT(cond, explanation, freezer::contracts::Kind::Pre)
/// @brief Postcondition (checks that `cond` evaluates to true)
#define FREEZER_post(cond, explanation) \
  __FREEZER_CONTRACT(cond, explanation, freezer::contracts::Kind::Post)
/// @brief Assertion (checks that `cond` evaluates to true)
#define FREEZER_assert(cond, explanation) \
  __FREEZER_CONTRACT(cond, explanation, freezer::contracts::Kind::Assert)

#ifdef FREEZER_DEBUG
  /// @brief Precondition that is only evaluated on Debug config
  #define FREEZER_debug_pre(cond, explanation) FREEZER_pre(cond, explanation)
  /// @brief Assertion that is only evaluated on Debug config
  #define FREEZER_debug_assert(cond, explanation) \
    FREEZER_assert(cond, explanation)
#else
  /// @brief Precondition that is only evaluated on Debug config
  #define FREEZER_debug_pre(cond, explanation) \
    do                                         \
    {                                          \
    } while (false)
  /// @brief Assertion that is only evaluated on Debug config
  #define FREEZER_debug_assert(cond, explanation) \
    do                                            \
    {                                             \
    } while (false)
#endif // FREEZER_DEBUG

#endif // !__HG_FREEZER_CONTRACTS_CONTRACTS
