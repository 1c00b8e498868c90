/*****************************************************************/ /**
 * @file   wrappers.cpp
 * @brief  Contains the implementation of `wrappers.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./wrappers.h"
#include <typeinfo>
#include <freezer_contracts/contracts.h>

namespace freezer::ext::fn
{
  Result<void> encode_meta(const Engine& engine, const Value& value, OutputStream& out)
  {
    FREEZER_debug_pre(
        value.as_fn() && typeid(**value.as_fn()) == typeid(MetaFn),
        "expected a MetaFn");
    auto& fn = static_cast<const MetaFn&>(**value.as_fn());
    if (auto res = engine.freeze_to_stream(Value{*fn.meta()}, out); res.is_error())
      return res;
    return engine.freeze_to_stream(Value{fn.inner()}, out);
  }

  Result<Value> decode_meta(const Engine& engine, InputStream& in)
  {
    auto meta = engine.thaw_from_stream(in);
    if (meta.is_error())
      return meta;
    if (meta->as_map() == nullptr)
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_MALFORMED_INPUT,
                          "metadata must be a map, read "
                              + std::string{to_string(meta->kind())})};

    auto inner = engine.thaw_from_stream(in);
    if (inner.is_error())
      return inner;
    if (inner->as_fn() == nullptr)
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_MALFORMED_INPUT,
                          "metadata must wrap a callable, read "
                              + std::string{to_string(inner->kind())})};
    return Value{with_meta(*inner->as_fn(), *meta->as_map())};
  }

  Result<void> encode_enclosing(
      const Engine& engine, const Value& value, OutputStream& out)
  {
    FREEZER_debug_pre(
        value.as_fn() && typeid(**value.as_fn()) == typeid(EnclosingFn),
        "expected an EnclosingFn");
    auto& fn = static_cast<const EnclosingFn&>(**value.as_fn());
    return engine.freeze_to_stream(fn.enclosing(), out);
  }

  Result<Value> decode_enclosing(const Engine& engine, InputStream& in)
  {
    auto enclosing = engine.thaw_from_stream(in);
    if (enclosing.is_error())
      return enclosing;
    if (!is_invocable(*enclosing))
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_MALFORMED_INPUT,
                          "cannot enclose a value of kind "
                              + std::string{to_string(enclosing->kind())})};
    return Value{bind_enclosing(std::move(*enclosing))};
  }
} // namespace freezer::ext::fn
