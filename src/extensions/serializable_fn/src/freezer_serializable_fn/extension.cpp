/*****************************************************************/ /**
 * @file   extension.cpp
 * @brief  Contains the implementation of `extension.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./extension.h"
#include <typeindex>
#include <freezer_contracts/contracts.h>
#include <freezer_runtime_type/binding_table.h>
#include <freezer_runtime_type/runtime_type.h>
#include <freezer_serializable_fn/codec_cache.h>
#include <freezer_serializable_fn/wrappers.h>

namespace freezer::ext::fn
{
  static EncodeFn make_encode(Environment env)
  {
    return [env](const Engine& engine, const Value& value, OutputStream& out) -> Result<void>
    {
      auto& fn     = **value.as_fn();
      auto encoder = env.cache->get_or_build_encoder(env, fn);
      if (encoder.is_error())
        return {unexpected, std::move(encoder).error()};
      return (*encoder)->encode(engine, fn, out);
    };
  }

  static DecodeFn make_decode(Environment env)
  {
    return [env](const Engine& engine, InputStream& in) -> Result<Value>
    {
      auto head = engine.thaw_from_stream(in);
      if (head.is_error())
        return head;

      Result<FnDecoderPtr> decoder = FnDecoderPtr{};
      if (auto symbol = head->as_symbol())
        decoder = env.cache->get_or_build_named_decoder(env, *symbol);
      else if (auto id = head->as_vector(); id && !id->empty() && (*id)[0].as_string())
        decoder = env.cache->get_or_build_closure_decoder(env, *(*id)[0].as_string());
      else
        return {
            unexpected, make_error(
                            ErrorKind::ERROR_MALFORMED_INPUT,
                            "a callable starts with a symbol or a type identifier, read "
                                + std::string{to_string(head->kind())})};

      if (decoder.is_error())
        return {unexpected, std::move(decoder).error()};
      return (*decoder)->decode(engine, *head, in);
    };
  }

  const Environment& default_environment() noexcept
  {
    static const Environment env{
        &rt::binding_table(), &rt::type_registry(), &codec_cache()};
    return env;
  }

  Result<void> install(Engine& engine, const Environment& env)
  {
    FREEZER_pre(
        env.bindings && env.types && env.cache, "environment must not be null");

    auto meta = engine.register_extension(
        FN_META_TAG, {ValueKind::KIND_FN, std::type_index{typeid(MetaFn)}},
        &encode_meta, &decode_meta);
    if (meta.is_error())
      return {unexpected, std::move(meta).error()};

    auto enclosing = engine.register_extension(
        FN_ENCLOSING_TAG, {ValueKind::KIND_FN, std::type_index{typeid(EnclosingFn)}},
        &encode_enclosing, &decode_enclosing);
    if (enclosing.is_error())
      return {unexpected, std::move(enclosing).error()};

    auto base = engine.register_extension(
        FN_TAG, {ValueKind::KIND_FN}, make_encode(env), make_decode(env));
    if (base.is_error())
      return {unexpected, std::move(base).error()};
    return {};
  }

  Result<void> install()
  {
    return install(default_engine(), default_environment());
  }
} // namespace freezer::ext::fn
