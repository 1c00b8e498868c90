/*****************************************************************/ /**
 * @file   engine.cpp
 * @brief  Contains the implementation of `engine.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./engine.h"
#include <algorithm>
#include <mutex>
#include <freezer_contracts/contracts.h>
#include <freezer_tracing/tracing.h>
#include <freezer_vocabular/hash.h>

namespace freezer
{
  static constexpr uint8_t HEADER[] = {'F', 'R', 'Z', FORMAT_VERSION};

  static FreezeError malformed(std::string message)
  {
    return make_error(ErrorKind::ERROR_MALFORMED_INPUT, std::move(message));
  }

  Engine::Engine(EngineOptions options) noexcept
      : _options(options)
  {
  }

  uint16_t Engine::extension_id(std::string_view tag_name) noexcept
  {
    auto h = mix64(hash_string(tag_name));
    return static_cast<uint16_t>(h ^ (h >> 16) ^ (h >> 32) ^ (h >> 48));
  }

  Result<uint16_t> Engine::register_extension(
      std::string_view tag_name, ExtensionTarget target, EncodeFn encode,
      DecodeFn decode)
  {
    FREEZER_pre(
        target.kind == ValueKind::KIND_FN || target.kind == ValueKind::KIND_OPAQUE,
        "extensions apply to callables or host objects");
    FREEZER_pre(encode && decode, "extension hooks must not be empty");

    const auto id = extension_id(tag_name);
    auto ext      = std::make_shared<const Extension>(Extension{
        std::string{tag_name}, id, target, std::move(encode), std::move(decode)});

    std::unique_lock lock{_mutex};
    if (auto it = _by_id.find(id); it != _by_id.end())
    {
      if (it->second->tag_name != tag_name)
        return {
            unexpected, make_error(
                            ErrorKind::ERROR_EXTENSION_CONFLICT,
                            "extension '" + std::string{tag_name}
                                + "' has the same id as '" + it->second->tag_name
                                + "'")};
      // replacing: drop the previous encode target
      auto& old = it->second->target;
      if (old.type)
        _by_type.erase(*old.type);
      else if (old.kind == ValueKind::KIND_FN)
        _fn_fallback.reset();
      else
        _opaque_fallback.reset();
    }
    _by_id[id] = ext;
    if (target.type)
      _by_type[*target.type] = ext;
    else if (target.kind == ValueKind::KIND_FN)
      _fn_fallback = ext;
    else
      _opaque_fallback = ext;
    return id;
  }

  bool Engine::has_extension(std::string_view tag_name) const noexcept
  {
    std::shared_lock lock{_mutex};
    auto it = _by_id.find(extension_id(tag_name));
    return it != _by_id.end() && it->second->tag_name == tag_name;
  }

  Result<void> Engine::freeze_extension(const Value& value, OutputStream& out) const
  {
    const bool is_fn = value.kind() == ValueKind::KIND_FN;
    const std::type_info& type =
        is_fn ? typeid(**value.as_fn()) : typeid(**value.as_opaque());

    ExtensionPtr ext;
    {
      std::shared_lock lock{_mutex};
      if (auto it = _by_type.find(std::type_index{type}); it != _by_type.end())
        ext = it->second;
      else
        ext = is_fn ? _fn_fallback : _opaque_fallback;
    }
    if (!ext)
      return {
          unexpected,
          make_error(
              ErrorKind::ERROR_UNFREEZABLE_VALUE,
              "no extension can freeze a value of type '" + runtime_type_name(type)
                  + "'")};

    out.write_u8(static_cast<uint8_t>(WireTag::TAG_EXTENSION));
    out.write_u16(ext->id);
    return ext->encode(*this, value, out);
  }

  Result<void> Engine::freeze_to_stream(const Value& value, OutputStream& out) const
  {
    DepthGuard guard{out, _options.max_depth};
    if (!guard)
      return {
          unexpected,
          make_error(ErrorKind::ERROR_UNFREEZABLE_VALUE, "value is nested too deeply")};

    switch (value.kind())
    {
    case ValueKind::KIND_NIL:
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_NIL));
      return {};
    case ValueKind::KIND_BOOL:
      out.write_u8(static_cast<uint8_t>(
          *value.as_bool() ? WireTag::TAG_TRUE : WireTag::TAG_FALSE));
      return {};
    case ValueKind::KIND_INT:
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_INT));
      out.write_int(*value.as_int());
      return {};
    case ValueKind::KIND_DOUBLE:
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_DOUBLE));
      out.write_double(*value.as_double());
      return {};
    case ValueKind::KIND_STRING:
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_STRING));
      out.write_string(*value.as_string());
      return {};
    case ValueKind::KIND_SYMBOL:
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_SYMBOL));
      out.write_string(value.as_symbol()->ns);
      out.write_string(value.as_symbol()->name);
      return {};
    case ValueKind::KIND_VECTOR:
    {
      auto& vec = *value.as_vector();
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_VECTOR));
      out.write_size(vec.size());
      for (auto& element : vec)
      {
        if (auto res = freeze_to_stream(element, out); res.is_error())
          return res;
      }
      return {};
    }
    case ValueKind::KIND_MAP:
    {
      auto& map = *value.as_map();
      out.write_u8(static_cast<uint8_t>(WireTag::TAG_MAP));
      out.write_size(map.size());
      for (auto& [key, val] : map)
      {
        if (auto res = freeze_to_stream(key, out); res.is_error())
          return res;
        if (auto res = freeze_to_stream(val, out); res.is_error())
          return res;
      }
      return {};
    }
    case ValueKind::KIND_FN:
    case ValueKind::KIND_OPAQUE:
      return freeze_extension(value, out);
    }
    contracts::unreachable();
  }

  Result<Value> Engine::thaw_extension(InputStream& in) const
  {
    auto id = in.read_u16();
    if (id.is_error())
      return {unexpected, std::move(id).error()};

    ExtensionPtr ext;
    {
      std::shared_lock lock{_mutex};
      if (auto it = _by_id.find(*id); it != _by_id.end())
        ext = it->second;
    }
    if (!ext)
      return {
          unexpected, make_error(
                          ErrorKind::ERROR_UNKNOWN_EXTENSION,
                          "no extension is registered with id " + std::to_string(*id))};
    return ext->decode(*this, in);
  }

  Result<Value> Engine::thaw_from_stream(InputStream& in) const
  {
    DepthGuard guard{in, _options.max_depth};
    if (!guard)
      return {unexpected, malformed("value is nested too deeply")};

    auto tag = in.read_u8();
    if (tag.is_error())
      return {unexpected, std::move(tag).error()};

    switch (static_cast<WireTag>(*tag))
    {
    case WireTag::TAG_NIL:
      return Value{};
    case WireTag::TAG_TRUE:
      return Value{true};
    case WireTag::TAG_FALSE:
      return Value{false};
    case WireTag::TAG_INT:
    {
      auto i = in.read_int();
      if (i.is_error())
        return {unexpected, std::move(i).error()};
      return Value{*i};
    }
    case WireTag::TAG_DOUBLE:
    {
      auto d = in.read_double();
      if (d.is_error())
        return {unexpected, std::move(d).error()};
      return Value{*d};
    }
    case WireTag::TAG_STRING:
    {
      auto s = in.read_string();
      if (s.is_error())
        return {unexpected, std::move(s).error()};
      return Value{std::move(*s)};
    }
    case WireTag::TAG_SYMBOL:
    {
      auto ns = in.read_string();
      if (ns.is_error())
        return {unexpected, std::move(ns).error()};
      auto name = in.read_string();
      if (name.is_error())
        return {unexpected, std::move(name).error()};
      return Value{Symbol{std::move(*ns), std::move(*name)}};
    }
    case WireTag::TAG_VECTOR:
    {
      auto size = in.read_size();
      if (size.is_error())
        return {unexpected, std::move(size).error()};
      // every element takes at least one byte
      if (*size > in.remaining())
        return {unexpected, malformed("vector size exceeds the input")};
      Vector vec;
      vec.reserve(*size);
      for (uint64_t i = 0; i < *size; i++)
      {
        auto element = thaw_from_stream(in);
        if (element.is_error())
          return element;
        vec.push_back(std::move(*element));
      }
      return Value{std::move(vec)};
    }
    case WireTag::TAG_MAP:
    {
      auto size = in.read_size();
      if (size.is_error())
        return {unexpected, std::move(size).error()};
      if (*size > in.remaining() / 2)
        return {unexpected, malformed("map size exceeds the input")};
      Map map;
      for (uint64_t i = 0; i < *size; i++)
      {
        auto key = thaw_from_stream(in);
        if (key.is_error())
          return key;
        auto val = thaw_from_stream(in);
        if (val.is_error())
          return val;
        if (!map.emplace(std::move(*key), std::move(*val)).second)
          return {unexpected, malformed("map contains a duplicate key")};
      }
      return Value{std::move(map)};
    }
    case WireTag::TAG_EXTENSION:
      return thaw_extension(in);
    }
    return {unexpected, malformed("unknown tag " + std::to_string(*tag))};
  }

  Result<Bytes> Engine::freeze(const Value& value) const
  {
    FREEZER_TRACE_FN();

    OutputStream out{Bytes(std::begin(HEADER), std::end(HEADER))};
    if (auto res = freeze_to_stream(value, out); res.is_error())
      return {unexpected, std::move(res).error()};
    return out.take();
  }

  Result<Value> Engine::thaw(std::span<const uint8_t> bytes) const
  {
    FREEZER_TRACE_FN();

    if (bytes.size() < sizeof(HEADER)
        || !std::equal(std::begin(HEADER), std::end(HEADER) - 1, bytes.begin()))
      return {unexpected, malformed("missing header")};
    if (bytes[sizeof(HEADER) - 1] != FORMAT_VERSION)
      return {
          unexpected,
          malformed("unsupported format version " + std::to_string(bytes[sizeof(HEADER) - 1]))};

    InputStream in{bytes.subspan(sizeof(HEADER))};
    auto ret = thaw_from_stream(in);
    if (ret.is_error())
      return ret;
    if (!in.at_end())
      return {
          unexpected,
          malformed(std::to_string(in.remaining()) + " trailing bytes after the value")};
    return ret;
  }

  Engine& default_engine() noexcept
  {
    static Engine engine;
    return engine;
  }

  Result<Bytes> freeze(const Value& value)
  {
    return default_engine().freeze(value);
  }

  Result<Value> thaw(std::span<const uint8_t> bytes)
  {
    return default_engine().thaw(bytes);
  }
} // namespace freezer
