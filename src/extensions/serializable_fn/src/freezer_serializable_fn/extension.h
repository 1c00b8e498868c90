/*****************************************************************/ /**
 * @file   extension.h
 * @brief  Contains the registration of the callable hooks.
 * Three extensions are registered on an engine:
 * - `freezer.fn/fn-meta` for `MetaFn`,
 * - `freezer.fn/fn-enclosing` for `EnclosingFn`,
 * - `freezer.fn/fn` for every other callable (named bindings and
 *   registered closure types).
 *
 * @code{.cpp}
 * if (auto res = freezer::ext::fn::install(); res.is_error())
 *   return res;
 * auto bytes = freezer::freeze(freezer::Value{adder});
 * @endcode
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_SERIALIZABLE_FN_EXTENSION
#define __HG_FREEZER_EXT_SERIALIZABLE_FN_EXTENSION

#include <freezer_serializable_fn_export.h>
#include <freezer_engine/engine.h>
#include <freezer_serializable_fn/codec.h>
#include <string_view>

namespace freezer::ext::fn
{
  /// @brief Tag name of named bindings and closures
  inline constexpr std::string_view FN_TAG = "freezer.fn/fn";
  /// @brief Tag name of `MetaFn`
  inline constexpr std::string_view FN_META_TAG = "freezer.fn/fn-meta";
  /// @brief Tag name of `EnclosingFn`
  inline constexpr std::string_view FN_ENCLOSING_TAG = "freezer.fn/fn-enclosing";

  /// @brief Returns the environment made of the process-wide instances
  FREEZER_SERIALIZABLE_FN_EXPORT
  const Environment& default_environment() noexcept;

  /// @brief Registers the callable hooks on `engine`.
  /// The environment is copied: the objects it points to must outlive
  /// the engine.
  /// @param engine The engine
  /// @param env The environment
  /// @return Success or ERROR_EXTENSION_CONFLICT
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<void> install(Engine& engine, const Environment& env);

  /// @brief Registers the callable hooks on `default_engine()` using
  /// `default_environment()`
  /// @return Success or ERROR_EXTENSION_CONFLICT
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<void> install();
} // namespace freezer::ext::fn

#endif // !__HG_FREEZER_EXT_SERIALIZABLE_FN_EXTENSION
