/*****************************************************************/ /**
 * @file   codec.h
 * @brief  Contains the codec generator of callables.
 * A codec is a pair of routines specialized to one callable shape:
 * - named binding: only the canonical name (a `Symbol`) is written,
 *   thawing reads the current value of the binding.
 * - anonymous closure: the type identifier `[name, arity, fingerprint]`
 *   is written, followed by one value per captured field (in
 *   declaration order). Thawing checks the identifier against the
 *   currently registered type and calls its positional constructor.
 *
 * Codecs are built once (introspection and name resolution happen at
 * build time) and are immutable afterwards: encoding and decoding only
 * iterate over pre-resolved field accessors.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_SERIALIZABLE_FN_CODEC
#define __HG_FREEZER_EXT_SERIALIZABLE_FN_CODEC

#include <freezer_serializable_fn_export.h>
#include <freezer_engine/engine.h>
#include <freezer_runtime_type/binding_table.h>
#include <freezer_runtime_type/runtime_type.h>
#include <freezer_serializable_fn/resolver.h>
#include <freezer_value/value.h>
#include <freezer_vocabular/error.h>
#include <memory>
#include <string_view>

namespace freezer::ext::fn
{
  class CodecCache;

  /// @brief The collaborators used to build and run codecs
  struct Environment
  {
    /// @brief The global bindings (not null)
    rt::BindingTable* bindings;
    /// @brief The closure types (not null)
    rt::TypeRegistry* types;
    /// @brief The codec cache (not null)
    CodecCache* cache;
    /// @brief The name recovery strategy (nullptr for the default one)
    const NameRecovery* recovery = nullptr;

    /// @brief Returns the name recovery strategy to use
    const NameRecovery& name_recovery() const noexcept
    {
      return recovery ? *recovery : default_name_recovery();
    }
  };

  /// @brief Writes the shape payload of callables of one runtime type
  class FnEncoder
  {
  public:
    virtual ~FnEncoder() = default;

    /// @brief Writes the shape payload of `fn`
    /// @param engine The engine (to write nested values)
    /// @param fn The callable
    /// @param out The stream to write to
    /// @return Error of the failing field (propagated unchanged)
    virtual Result<void> encode(
        const Engine& engine, const Fn& fn, OutputStream& out) const = 0;
  };

  /// @brief Reads the shape payload of one canonical name or closure type
  class FnDecoder
  {
  public:
    virtual ~FnDecoder() = default;

    /// @brief Reads the shape payload after its head value
    /// @param engine The engine (to read nested values)
    /// @param head The first value of the payload (already read)
    /// @param in The stream to read from
    /// @return The callable or the error
    virtual Result<Value> decode(
        const Engine& engine, const Value& head, InputStream& in) const = 0;
  };

  /// @brief Shared pointer to an (immutable) encoder
  using FnEncoderPtr = std::shared_ptr<const FnEncoder>;
  /// @brief Shared pointer to an (immutable) decoder
  using FnDecoderPtr = std::shared_ptr<const FnDecoder>;

  /// @brief Builds the encoder of the runtime type of `fn`.
  /// Named bindings are preferred; a named encoder falls back to the
  /// closure encoding for instances the binding does not hold.
  /// @param env The environment
  /// @param fn An instance of the runtime type
  /// @return The encoder or ERROR_INTROSPECTION_FAILURE
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<FnEncoderPtr> build_encoder(const Environment& env, const Fn& fn);

  /// @brief Builds the decoder of a named binding.
  /// Loads the unit of the namespace of `symbol` if needed.
  /// @param env The environment
  /// @param symbol The canonical name
  /// @return The decoder or ERROR_UNRESOLVABLE_BINDING
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<FnDecoderPtr> build_named_decoder(const Environment& env, const Symbol& symbol);

  /// @brief Builds the decoder of a closure type
  /// @param env The environment
  /// @param type_name The name the closure type is registered with
  /// @return The decoder or ERROR_INTROSPECTION_FAILURE
  FREEZER_SERIALIZABLE_FN_EXPORT
  Result<FnDecoderPtr> build_closure_decoder(
      const Environment& env, std::string_view type_name);
} // namespace freezer::ext::fn

#endif // !__HG_FREEZER_EXT_SERIALIZABLE_FN_CODEC
