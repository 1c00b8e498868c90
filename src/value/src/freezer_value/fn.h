/*****************************************************************/ /**
 * @file   fn.h
 * @brief  Contains the delegating callables: `MetaFn` and `EnclosingFn`.
 * Both wrap another value and forward every invocation to it.
 * `MetaFn` attaches metadata to a callable, `EnclosingFn` makes any
 * invocable value (map, vector or callable) behave as a callable.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_VALUE_FN
#define __HG_FREEZER_VALUE_FN

#include <freezer_value_export.h>
#include <freezer_value/value.h>

namespace freezer
{
  /// @brief A callable with metadata.
  /// Invocations are forwarded to the inner callable, the metadata
  /// never changes the result.
  class FREEZER_VALUE_EXPORT MetaFn final : public Fn
  {
    /// @brief The wrapped callable (never a MetaFn)
    FnPtr _inner;
    /// @brief The metadata
    Map _meta;

  public:
    /// @brief Constructs a MetaFn
    /// @param inner The callable to wrap (not null)
    /// @param meta The metadata
    MetaFn(FnPtr inner, Map meta) noexcept;

    Value invoke(std::span<const Value> args) const override;
    const Map* meta() const noexcept override { return &_meta; }

    /// @brief Returns the wrapped callable
    const FnPtr& inner() const noexcept { return _inner; }
  };

  /// @brief A callable that forwards to an invocable value.
  class FREEZER_VALUE_EXPORT EnclosingFn final : public Fn
  {
    /// @brief The value invocations are forwarded to
    Value _enclosing;

  public:
    /// @brief Constructs an EnclosingFn
    /// @param enclosing The value to forward to (`is_invocable`)
    explicit EnclosingFn(Value enclosing) noexcept;

    Value invoke(std::span<const Value> args) const override;

    /// @brief Returns the value invocations are forwarded to
    const Value& enclosing() const noexcept { return _enclosing; }
  };

  /// @brief Returns a callable behaving as `fn` with metadata `meta`.
  /// If `fn` already carries metadata, the metadata is replaced (the
  /// wrappers never nest).
  /// @param fn The callable (not null)
  /// @param meta The metadata
  /// @return New callable
  FREEZER_VALUE_EXPORT
  FnPtr with_meta(const FnPtr& fn, Map meta);

  /// @brief Returns the metadata of a callable, or nullptr
  /// @param fn The callable
  /// @return The metadata or nullptr
  FREEZER_VALUE_EXPORT
  const Map* meta(const FnPtr& fn) noexcept;

  /// @brief Returns a callable forwarding to `enclosing`
  /// @param enclosing The value to forward to (`is_invocable`)
  /// @return New callable
  FREEZER_VALUE_EXPORT
  FnPtr bind_enclosing(Value enclosing);
} // namespace freezer

#endif // !__HG_FREEZER_VALUE_FN
