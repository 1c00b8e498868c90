/*****************************************************************/ /**
 * @file   codec.cpp
 * @brief  Contains the implementation of `codec.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./codec.h"
#include <exception>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <freezer_contracts/contracts.h>
#include <freezer_tracing/tracing.h>

namespace freezer::ext::fn
{
  /// @brief Writes `[name, arity, fingerprint]` then each captured field
  class ClosureEncoder final : public FnEncoder
  {
    rt::ClosureTypePtr _type;
    /// @brief The type identifier
    Value _head;

  public:
    explicit ClosureEncoder(rt::ClosureTypePtr type)
        : _type(std::move(type))
        , _head(Vector{
              _type->name, static_cast<int64_t>(_type->arity()),
              static_cast<int64_t>(_type->fingerprint)})
    {
    }

    Result<void> encode(
        const Engine& engine, const Fn& fn, OutputStream& out) const override
    {
      if (auto res = engine.freeze_to_stream(_head, out); res.is_error())
        return res;
      for (auto& field : _type->fields)
      {
        if (auto res = engine.freeze_to_stream(field.read(fn), out); res.is_error())
          return res;
      }
      return {};
    }
  };

  /// @brief Writes the canonical name of the binding holding the callable.
  /// Other instances of the runtime type (interface methods share one)
  /// are resolved again, then written by the fallback.
  class NamedEncoder final : public FnEncoder
  {
    const rt::BindingTable* _bindings;
    const NameRecovery* _recovery;
    rt::VarPtr _var;
    /// @brief The canonical name
    Value _head;
    /// @brief Used for instances no binding holds (may be null)
    FnEncoderPtr _fallback;

  public:
    NamedEncoder(
        const rt::BindingTable* bindings, const NameRecovery* recovery,
        Resolution resolution, FnEncoderPtr fallback)
        : _bindings(bindings)
        , _recovery(recovery)
        , _var(std::move(resolution.var))
        , _head(std::move(resolution.symbol))
        , _fallback(std::move(fallback))
    {
    }

    Result<void> encode(
        const Engine& engine, const Fn& fn, OutputStream& out) const override
    {
      // the binding may have been removed and defined again
      auto var = _var->is_bound() ? _var : _bindings->find(*_head.as_symbol());
      if (var && var->holds(&fn))
        return engine.freeze_to_stream(_head, out);
      if (auto resolution = resolve(*_bindings, fn, *_recovery))
        return engine.freeze_to_stream(Value{std::move(resolution->symbol)}, out);
      if (_fallback)
        return _fallback->encode(engine, fn, out);
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_UNRESOLVABLE_BINDING,
                          "no global binding holds this instance of '"
                              + runtime_type_name(typeid(fn)) + "'")};
    }
  };

  /// @brief Reads the current value of a binding
  class NamedDecoder final : public FnDecoder
  {
    Symbol _symbol;
    const rt::BindingTable* _bindings;
    rt::VarPtr _var;

  public:
    NamedDecoder(Symbol symbol, const rt::BindingTable* bindings, rt::VarPtr var) noexcept
        : _symbol(std::move(symbol))
        , _bindings(bindings)
        , _var(std::move(var))
    {
    }

    Result<Value> decode(const Engine&, const Value&, InputStream&) const override
    {
      // the binding may have been removed and defined again
      auto var = _var->is_bound() ? _var : _bindings->find(_symbol);
      if (!var)
        return {
            unexpected, make_error(
                            ErrorKind::ERROR_UNRESOLVABLE_BINDING,
                            "binding '" + _symbol.str() + "' was removed")};
      auto value = var->get();
      if (value.as_fn() == nullptr)
        return {
            unexpected, make_error(
                            ErrorKind::ERROR_UNRESOLVABLE_BINDING,
                            "binding '" + _symbol.str() + "' holds a "
                                + std::string{to_string(value.kind())} + ", not a callable")};
      return value;
    }
  };

  /// @brief Reads the captured fields and calls the positional constructor
  class ClosureDecoder final : public FnDecoder
  {
    rt::ClosureTypePtr _type;

    FreezeError mismatch(std::string message) const
    {
      return make_error(
          ErrorKind::ERROR_SHAPE_MISMATCH, "'" + _type->name + "': " + message);
    }

  public:
    explicit ClosureDecoder(rt::ClosureTypePtr type) noexcept
        : _type(std::move(type))
    {
    }

    Result<Value> decode(
        const Engine& engine, const Value& head, InputStream& in) const override
    {
      auto id = head.as_vector();
      if (id == nullptr || id->size() != 3 || !(*id)[1].as_int() || !(*id)[2].as_int())
        return {
            unexpected, make_error(
                            ErrorKind::ERROR_MALFORMED_INPUT,
                            "malformed closure type identifier")};

      const auto arity = *(*id)[1].as_int();
      if (arity != static_cast<int64_t>(_type->arity()))
        return {
            unexpected, mismatch(
                            "expected " + std::to_string(_type->arity())
                            + " captured fields, read " + std::to_string(arity))};
      if (static_cast<uint64_t>(*(*id)[2].as_int()) != _type->fingerprint)
        return {unexpected, mismatch("the captured fields changed")};

      Vector args;
      args.reserve(_type->arity());
      for (auto& field : _type->fields)
      {
        auto value = engine.thaw_from_stream(in);
        if (value.is_error())
          return value;
        if (!rt::accepts(field.kind, *value))
          return {
              unexpected, mismatch(
                              "field '" + std::string{field.name} + "' expects "
                              + std::string{rt::to_string(field.kind)} + ", read "
                              + std::string{to_string(value->kind())})};
        args.push_back(std::move(*value));
      }

      try
      {
        auto fn = _type->construct(args);
        FREEZER_post(fn != nullptr, "positional constructors must not return null");
        return Value{std::move(fn)};
      }
      catch (const std::exception& e)
      {
        return {
            unexpected,
            make_error(
                ErrorKind::ERROR_INTROSPECTION_FAILURE,
                "constructor of '" + _type->name + "' failed: " + e.what())};
      }
    }
  };

  /// @brief Finds the binding of the runtime type of `fn`.
  /// A binding holding another instance of the same runtime type is
  /// accepted: the encoder is shared by every instance of the type.
  static std::optional<Resolution> resolve_type(const Environment& env, const Fn& fn)
  {
    if (auto resolution = resolve(*env.bindings, fn, env.name_recovery()))
      return resolution;
    for (auto& symbol : env.name_recovery().candidates(fn))
    {
      auto var = env.bindings->find(symbol);
      if (!var)
        continue;
      auto current = var->get();
      if (auto held = current.as_fn(); held && typeid(**held) == typeid(fn))
        return Resolution{std::move(symbol), std::move(var)};
    }
    return std::nullopt;
  }

  Result<FnEncoderPtr> build_encoder(const Environment& env, const Fn& fn)
  {
    FREEZER_TRACE_FN();
    FREEZER_pre(env.bindings && env.types, "environment must not be null");

    auto type = env.types->find(std::type_index{typeid(fn)});
    FnEncoderPtr closure =
        type ? std::make_shared<const ClosureEncoder>(std::move(type)) : nullptr;

    if (auto resolution = resolve_type(env, fn))
      return FnEncoderPtr{std::make_shared<const NamedEncoder>(
          env.bindings, &env.name_recovery(), std::move(*resolution), std::move(closure))};
    if (closure)
      return closure;
    return {
        unexpected,
        make_error(
            ErrorKind::ERROR_INTROSPECTION_FAILURE,
            "'" + runtime_type_name(typeid(fn))
                + "' is neither held by a global binding nor a registered closure type")};
  }

  Result<FnDecoderPtr> build_named_decoder(const Environment& env, const Symbol& symbol)
  {
    FREEZER_TRACE_FN();
    FREEZER_pre(env.bindings != nullptr, "environment must not be null");

    try
    {
      // bindings defined outside of any unit have no loader to run
      (void)env.bindings->require(symbol.ns);
    }
    catch (const std::exception& e)
    {
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_UNRESOLVABLE_BINDING,
                          "loading '" + symbol.ns + "' failed: " + e.what())};
    }

    auto var = env.bindings->find(symbol);
    if (!var)
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_UNRESOLVABLE_BINDING,
                          "cannot find binding '" + symbol.str() + "'")};
    return FnDecoderPtr{
        std::make_shared<const NamedDecoder>(symbol, env.bindings, std::move(var))};
  }

  Result<FnDecoderPtr> build_closure_decoder(
      const Environment& env, std::string_view type_name)
  {
    FREEZER_TRACE_FN();
    FREEZER_pre(env.types != nullptr, "environment must not be null");

    auto type = env.types->find(type_name);
    if (!type)
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_INTROSPECTION_FAILURE,
                          "closure type '" + std::string{type_name} + "' is not registered")};
    return FnDecoderPtr{std::make_shared<const ClosureDecoder>(std::move(type))};
  }
} // namespace freezer::ext::fn
