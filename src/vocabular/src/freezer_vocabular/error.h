/*****************************************************************/ /**
 * @file   error.h
 * @brief  Contains `FreezeError`, the error reported by freeze/thaw.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_VOCABULARY_ERROR
#define __HG_FREEZER_VOCABULARY_ERROR

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <freezer_vocabular/expected.h>

namespace freezer
{
  /// @brief The kind of a freeze/thaw error
  enum class ErrorKind : uint8_t
  {
    /// @brief A named binding could not be found (unit missing or renamed)
    ERROR_UNRESOLVABLE_BINDING,
    /// @brief The fields read while thawing do not match the loaded type
    ERROR_SHAPE_MISMATCH,
    /// @brief A value (or a value captured by a closure) cannot be frozen
    ERROR_UNFREEZABLE_VALUE,
    /// @brief The fields or constructor of a closure type are not available
    ERROR_INTROSPECTION_FAILURE,
    /// @brief The bytes to thaw are truncated or garbled
    ERROR_MALFORMED_INPUT,
    /// @brief The bytes reference an extension that is not registered
    ERROR_UNKNOWN_EXTENSION,
    /// @brief Two extension names map to the same extension id
    ERROR_EXTENSION_CONFLICT,
  };

  /// @brief Returns a human readable name for an error kind
  /// @param kind The error kind
  /// @return Name of the error kind
  constexpr std::string_view to_string(ErrorKind kind) noexcept
  {
    switch (kind)
    {
    case ErrorKind::ERROR_UNRESOLVABLE_BINDING:
      return "unresolvable binding";
    case ErrorKind::ERROR_SHAPE_MISMATCH:
      return "shape mismatch";
    case ErrorKind::ERROR_UNFREEZABLE_VALUE:
      return "unfreezable value";
    case ErrorKind::ERROR_INTROSPECTION_FAILURE:
      return "introspection failure";
    case ErrorKind::ERROR_MALFORMED_INPUT:
      return "malformed input";
    case ErrorKind::ERROR_UNKNOWN_EXTENSION:
      return "unknown extension";
    case ErrorKind::ERROR_EXTENSION_CONFLICT:
      return "extension conflict";
    }
    return "unknown error";
  }

  /// @brief Error reported by freeze/thaw operations.
  /// Errors are propagated unchanged to the caller of freeze/thaw:
  /// a nested failure keeps its kind and message.
  struct FreezeError
  {
    /// @brief The kind of the error
    ErrorKind kind;
    /// @brief Human readable explanation
    std::string message;
  };

  /// @brief Shorthand for `Expected<T, FreezeError>`
  template<typename T>
  using Result = Expected<T, FreezeError>;

  /// @brief Creates an error result
  /// @param kind The error kind
  /// @param message The explanation
  /// @return FreezeError
  inline FreezeError make_error(ErrorKind kind, std::string message)
  {
    return FreezeError{kind, std::move(message)};
  }
} // namespace freezer

#endif // !__HG_FREEZER_VOCABULARY_ERROR
