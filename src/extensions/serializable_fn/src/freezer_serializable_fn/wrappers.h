/*****************************************************************/ /**
 * @file   wrappers.h
 * @brief  Contains the hooks of the delegating callables.
 * `MetaFn` is written as its metadata map followed by the wrapped
 * callable, `EnclosingFn` as its enclosing value. Both are matched by
 * exact runtime type, before the generic callable hook.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_SERIALIZABLE_FN_WRAPPERS
#define __HG_FREEZER_EXT_SERIALIZABLE_FN_WRAPPERS

#include <freezer_serializable_fn_export.h>
#include <freezer_engine/engine.h>
#include <freezer_value/fn.h>

namespace freezer::ext::fn
{
  /// @brief Writes a `MetaFn`
  /// @pre The runtime type of `value` is `MetaFn`
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<void> encode_meta(const Engine& engine, const Value& value, OutputStream& out);
  /// @brief Reads a `MetaFn` written by `encode_meta`
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<Value> decode_meta(const Engine& engine, InputStream& in);

  /// @brief Writes an `EnclosingFn`
  /// @pre The runtime type of `value` is `EnclosingFn`
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<void> encode_enclosing(
      const Engine& engine, const Value& value, OutputStream& out);
  /// @brief Reads an `EnclosingFn` written by `encode_enclosing`
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<Value> decode_enclosing(const Engine& engine, InputStream& in);
} // namespace freezer::ext::fn

#endif // !__HG_FREEZER_EXT_SERIALIZABLE_FN_WRAPPERS
