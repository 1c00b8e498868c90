/*****************************************************************/ /**
 * @file   expected.h
 * @brief  Contains the `Expected` vocabulary type.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_VOCABULARY_EXPECTED
#define __HG_FREEZER_VOCABULARY_EXPECTED

#include <cstdlib>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>
#include <freezer_contracts/contracts.h>

namespace freezer
{
  /// @brief Tag struct for constructing errors in Expected
  struct unexpected_t
  {
  };

  /// @brief Tag object for constructing errors in Expected
  inline constexpr unexpected_t unexpected;

  /// @brief A helper class that can hold either a value or an error.
  /// Example Usage:
  /// @code{.cpp}
  /// Expected<int, const char*> div(int a, int b)
  /// {
  ///   if (b != 0)
  ///     return a / b;
  ///   return { unexpected, "Division by zero is prohibited!" };
  /// }
  /// @endcode
  /// @tparam ExpectedTy The expected type
  /// @tparam ErrorTy The error type
  template<typename ExpectedTy, typename ErrorTy>
  class Expected
  {
    union
    {
      /// @brief The expected value (active when is_error_v == false)
      ExpectedTy expected;
      /// @brief The error value (active when is_error_v == true)
      ErrorTy error_v;
    };

    /// @brief True if an error is stored in the Expected
    bool is_error_v;

    constexpr void destroy() noexcept
    {
      if (is_error_v)
        error_v.~ErrorTy();
      else
        expected.~ExpectedTy();
    }

  public:
    /// @brief The expected type
    using value_type = ExpectedTy;
    /// @brief The error type
    using error_type = ErrorTy;

    /// @brief Copy constructs an error in the Expected
    /// @param value The error to copy
    constexpr Expected(unexpected_t, const ErrorTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(value);
    }

    /// @brief Move constructs an error in the Expected
    /// @param to_move The error to move
    constexpr Expected(unexpected_t, ErrorTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(std::move(to_move));
    }

    /// @brief Copy constructs an expected value in the Expected
    /// @param value The value to copy
    constexpr Expected(const ExpectedTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>)
        : is_error_v(false)
    {
      new (&expected) ExpectedTy(value);
    }

    /// @brief Move constructs an expected value in the Expected
    /// @param to_move The value to move
    constexpr Expected(ExpectedTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>)
        : is_error_v(false)
    {
      new (&expected) ExpectedTy(std::move(to_move));
    }

    /// @brief Copy constructs an Expected
    /// @param copy The Expected to copy
    constexpr Expected(const Expected& copy) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>
        && std::is_nothrow_copy_constructible_v<ErrorTy>)
        : is_error_v(copy.is_error_v)
    {
      if (is_error_v)
        new (&error_v) ErrorTy(copy.error_v);
      else
        new (&expected) ExpectedTy(copy.expected);
    }

    /// @brief Move constructs an Expected
    /// @param move The Expected to move
    constexpr Expected(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>
        && std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(move.is_error_v)
    {
      if (is_error_v)
        new (&error_v) ErrorTy(std::move(move.error_v));
      else
        new (&expected) ExpectedTy(std::move(move.expected));
    }

    /// @brief Copy assignment operator
    /// @param copy The Expected to copy
    /// @return Self
    constexpr Expected& operator=(const Expected& copy)
    {
      if (&copy == this)
        return *this;
      destroy();
      is_error_v = copy.is_error_v;
      if (is_error_v)
        new (&error_v) ErrorTy(copy.error_v);
      else
        new (&expected) ExpectedTy(copy.expected);
      return *this;
    }

    /// @brief Move assignment operator
    /// @param move The Expected to move
    /// @return Self
    constexpr Expected& operator=(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>
        && std::is_nothrow_move_constructible_v<ErrorTy>)
    {
      if (&move == this)
        return *this;
      destroy();
      is_error_v = move.is_error_v;
      if (is_error_v)
        new (&error_v) ErrorTy(std::move(move.error_v));
      else
        new (&expected) ExpectedTy(std::move(move.expected));
      return *this;
    }

    /// @brief Destructs the active member
    constexpr ~Expected() noexcept(
        std::is_nothrow_destructible_v<ExpectedTy>
        && std::is_nothrow_destructible_v<ErrorTy>)
    {
      destroy();
    }

    /// @brief Check if the Expected contains an error
    constexpr bool is_error() const noexcept { return is_error_v; }
    /// @brief Check if the Expected contains an expected value
    constexpr bool is_expect() const noexcept { return !is_error_v; }
    /// @brief Check if the Expected contains an error
    constexpr bool operator!() const noexcept { return is_error_v; }
    /// @brief Check if the Expected contains an expected value
    explicit constexpr operator bool() const noexcept { return !is_error_v; }

    constexpr const ExpectedTy* operator->() const noexcept
    {
      FREEZER_debug_pre(is_expect(), "Expected contains an error!");
      return &expected;
    }
    constexpr ExpectedTy* operator->() noexcept
    {
      FREEZER_debug_pre(is_expect(), "Expected contains an error!");
      return &expected;
    }
    constexpr const ExpectedTy& operator*() const& noexcept
    {
      FREEZER_debug_pre(is_expect(), "Expected contains an error!");
      return expected;
    }
    constexpr ExpectedTy& operator*() & noexcept
    {
      FREEZER_debug_pre(is_expect(), "Expected contains an error!");
      return expected;
    }
    constexpr ExpectedTy&& operator*() && noexcept
    {
      FREEZER_debug_pre(is_expect(), "Expected contains an error!");
      return std::move(expected);
    }

    /// @brief Returns the expected value (precondition: is_expect())
    constexpr const ExpectedTy& value() const& noexcept { return **this; }
    /// @brief Returns the expected value (precondition: is_expect())
    constexpr ExpectedTy& value() & noexcept { return **this; }
    /// @brief Returns the expected value (precondition: is_expect())
    constexpr ExpectedTy&& value() && noexcept { return *std::move(*this); }

    /// @brief Returns the error (precondition: is_error())
    constexpr const ErrorTy& error() const& noexcept
    {
      FREEZER_debug_pre(is_error(), "Expected does not contain an error!");
      return error_v;
    }
    /// @brief Returns the error (precondition: is_error())
    constexpr ErrorTy& error() & noexcept
    {
      FREEZER_debug_pre(is_error(), "Expected does not contain an error!");
      return error_v;
    }
    /// @brief Returns the error (precondition: is_error())
    constexpr ErrorTy&& error() && noexcept
    {
      FREEZER_debug_pre(is_error(), "Expected does not contain an error!");
      return std::move(error_v);
    }

    /// @brief Returns the expected value or `default_value`
    /// @param default_value The value to return if the Expected is an error
    template<typename U>
    constexpr ExpectedTy value_or(U&& default_value) const&
    {
      if (is_error_v)
        return static_cast<ExpectedTy>(std::forward<U>(default_value));
      return expected;
    }

    /// @brief Chains a function returning an Expected with the same error type.
    /// @param f Called with the expected value if there is no error
    /// @return The result of `f`, or the error
    template<typename F>
    constexpr auto and_then(F&& f) const&
    {
      using Ret = std::remove_cvref_t<std::invoke_result_t<F, const ExpectedTy&>>;
      if (is_error_v)
        return Ret(unexpected, error_v);
      return std::invoke(std::forward<F>(f), expected);
    }

    /// @brief Returns the expected value, or aborts if it does not exist.
    /// @param on_abort The function to call before aborting or null
    /// @return The expected value
    constexpr const ExpectedTy& value_or_abort(
        void (*on_abort)(void) noexcept = nullptr) const& noexcept
    {
      if (is_error_v)
      {
        if (on_abort)
          on_abort();
        std::abort();
      }
      return expected;
    }
  };

  /// @brief Expected for operations that only produce an error.
  /// @tparam ErrorTy The error type
  template<typename ErrorTy>
  class Expected<void, ErrorTy>
  {
    union
    {
      /// @brief Unused (active when is_error_v == false)
      char none;
      /// @brief The error value (active when is_error_v == true)
      ErrorTy error_v;
    };

    /// @brief True if an error is stored in the Expected
    bool is_error_v;

  public:
    /// @brief The expected type
    using value_type = void;
    /// @brief The error type
    using error_type = ErrorTy;

    /// @brief Constructs a success
    constexpr Expected() noexcept
        : none(0)
        , is_error_v(false)
    {
    }
    /// @brief Copy constructs an error in the Expected
    /// @param value The error to copy
    constexpr Expected(unexpected_t, const ErrorTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(value);
    }
    /// @brief Move constructs an error in the Expected
    /// @param to_move The error to move
    constexpr Expected(unexpected_t, ErrorTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(std::move(to_move));
    }
    constexpr Expected(const Expected& copy) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
        : none(0)
        , is_error_v(copy.is_error_v)
    {
      if (is_error_v)
        new (&error_v) ErrorTy(copy.error_v);
    }
    constexpr Expected(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
        : none(0)
        , is_error_v(move.is_error_v)
    {
      if (is_error_v)
        new (&error_v) ErrorTy(std::move(move.error_v));
    }
    Expected& operator=(const Expected&) = delete;
    Expected& operator=(Expected&&)      = delete;

    constexpr ~Expected() noexcept(std::is_nothrow_destructible_v<ErrorTy>)
    {
      if (is_error_v)
        error_v.~ErrorTy();
    }

    /// @brief Check if the Expected contains an error
    constexpr bool is_error() const noexcept { return is_error_v; }
    /// @brief Check if the Expected is a success
    constexpr bool is_expect() const noexcept { return !is_error_v; }
    /// @brief Check if the Expected contains an error
    constexpr bool operator!() const noexcept { return is_error_v; }
    /// @brief Check if the Expected is a success
    explicit constexpr operator bool() const noexcept { return !is_error_v; }

    /// @brief Returns the error (precondition: is_error())
    constexpr const ErrorTy& error() const& noexcept
    {
      FREEZER_debug_pre(is_error(), "Expected does not contain an error!");
      return error_v;
    }
    /// @brief Returns the error (precondition: is_error())
    constexpr ErrorTy& error() & noexcept
    {
      FREEZER_debug_pre(is_error(), "Expected does not contain an error!");
      return error_v;
    }
    /// @brief Returns the error (precondition: is_error())
    constexpr ErrorTy&& error() && noexcept
    {
      FREEZER_debug_pre(is_error(), "Expected does not contain an error!");
      return std::move(error_v);
    }
  };
} // namespace freezer

#endif // !__HG_FREEZER_VOCABULARY_EXPECTED
