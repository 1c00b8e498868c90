/*****************************************************************/ /**
 * @file   value.cpp
 * @brief  Contains the implementation of `value.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./value.h"
#include <algorithm>
#include <cmath>
#include <compare>
#include <functional>
#include <cpptrace/cpptrace.hpp>
#include <freezer_contracts/contracts.h>

namespace freezer
{
  std::string_view to_string(ValueKind kind) noexcept
  {
    switch (kind)
    {
    case ValueKind::KIND_NIL:
      return "nil";
    case ValueKind::KIND_BOOL:
      return "bool";
    case ValueKind::KIND_INT:
      return "int";
    case ValueKind::KIND_DOUBLE:
      return "double";
    case ValueKind::KIND_STRING:
      return "string";
    case ValueKind::KIND_SYMBOL:
      return "symbol";
    case ValueKind::KIND_VECTOR:
      return "vector";
    case ValueKind::KIND_MAP:
      return "map";
    case ValueKind::KIND_FN:
      return "fn";
    case ValueKind::KIND_OPAQUE:
      return "opaque";
    }
    return "unknown";
  }

  Symbol Symbol::parse(std::string_view qualified)
  {
    // "/" alone is a valid name
    auto slash = qualified.find('/');
    if (slash == std::string_view::npos || qualified.size() == 1)
      return Symbol{{}, std::string{qualified}};
    return Symbol{
        std::string{qualified.substr(0, slash)},
        std::string{qualified.substr(slash + 1)}};
  }

  std::string Symbol::str() const
  {
    if (ns.empty())
      return name;
    std::string ret;
    ret.reserve(ns.size() + 1 + name.size());
    ret.append(ns).append(1, '/').append(name);
    return ret;
  }

  /// @brief Total order of doubles: NaNs are equivalent to each other
  /// and greater than any other double, -0.0 is equivalent to 0.0
  static std::weak_ordering compare_doubles(double a, double b) noexcept
  {
    const bool a_nan = std::isnan(a);
    const bool b_nan = std::isnan(b);
    if (a_nan || b_nan)
      return a_nan <=> b_nan;
    if (a < b)
      return std::weak_ordering::less;
    if (b < a)
      return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
  }

  bool operator==(const Value& a, const Value& b) noexcept
  {
    if (a.kind() != b.kind())
      return false;
    switch (a.kind())
    {
    case ValueKind::KIND_NIL:
      return true;
    case ValueKind::KIND_BOOL:
      return *a.as_bool() == *b.as_bool();
    case ValueKind::KIND_INT:
      return *a.as_int() == *b.as_int();
    case ValueKind::KIND_DOUBLE:
      return compare_doubles(*a.as_double(), *b.as_double()) == 0;
    case ValueKind::KIND_STRING:
      return *a.as_string() == *b.as_string();
    case ValueKind::KIND_SYMBOL:
      return *a.as_symbol() == *b.as_symbol();
    case ValueKind::KIND_VECTOR:
      return a.as_vector() == b.as_vector() || *a.as_vector() == *b.as_vector();
    case ValueKind::KIND_MAP:
      return a.as_map() == b.as_map() || *a.as_map() == *b.as_map();
    case ValueKind::KIND_FN:
      return a.as_fn()->get() == b.as_fn()->get();
    case ValueKind::KIND_OPAQUE:
      return a.as_opaque()->get() == b.as_opaque()->get();
    }
    return false;
  }

  bool operator<(const Value& a, const Value& b) noexcept
  {
    if (a.kind() != b.kind())
      return a.kind() < b.kind();
    switch (a.kind())
    {
    case ValueKind::KIND_NIL:
      return false;
    case ValueKind::KIND_BOOL:
      return *a.as_bool() < *b.as_bool();
    case ValueKind::KIND_INT:
      return *a.as_int() < *b.as_int();
    case ValueKind::KIND_DOUBLE:
      return compare_doubles(*a.as_double(), *b.as_double()) < 0;
    case ValueKind::KIND_STRING:
      return *a.as_string() < *b.as_string();
    case ValueKind::KIND_SYMBOL:
      return *a.as_symbol() < *b.as_symbol();
    case ValueKind::KIND_VECTOR:
      return std::lexicographical_compare(
          a.as_vector()->begin(), a.as_vector()->end(), b.as_vector()->begin(),
          b.as_vector()->end());
    case ValueKind::KIND_MAP:
      return std::lexicographical_compare(
          a.as_map()->begin(), a.as_map()->end(), b.as_map()->begin(),
          b.as_map()->end(),
          [](const auto& x, const auto& y)
          {
            if (x.first < y.first)
              return true;
            if (y.first < x.first)
              return false;
            return x.second < y.second;
          });
    case ValueKind::KIND_FN:
      return std::less<const Fn*>{}(a.as_fn()->get(), b.as_fn()->get());
    case ValueKind::KIND_OPAQUE:
      return std::less<const Opaque*>{}(a.as_opaque()->get(), b.as_opaque()->get());
    }
    return false;
  }

  bool is_invocable(const Value& callee) noexcept
  {
    auto kind = callee.kind();
    return kind == ValueKind::KIND_FN || kind == ValueKind::KIND_MAP
           || kind == ValueKind::KIND_VECTOR;
  }

  Value invoke(const Value& callee, std::span<const Value> args)
  {
    switch (callee.kind())
    {
    case ValueKind::KIND_FN:
      return (*callee.as_fn())->invoke(args);
    case ValueKind::KIND_MAP:
    {
      FREEZER_pre(
          args.size() == 1 || args.size() == 2, "maps expect a key and a default");
      if (args.empty())
        return {};
      auto& map = *callee.as_map();
      if (auto it = map.find(args[0]); it != map.end())
        return it->second;
      return args.size() > 1 ? args[1] : Value{};
    }
    case ValueKind::KIND_VECTOR:
    {
      FREEZER_pre(
          args.size() == 1 || args.size() == 2,
          "vectors expect an index and a default");
      if (args.empty())
        return {};
      auto& vec  = *callee.as_vector();
      auto index = args[0].as_int();
      if (index && *index >= 0 && static_cast<uint64_t>(*index) < vec.size())
        return vec[static_cast<size_t>(*index)];
      return args.size() > 1 ? args[1] : Value{};
    }
    default:
      FREEZER_pre(false, "value is not invocable");
      return {};
    }
  }

  std::string runtime_type_name(const std::type_info& type)
  {
    return cpptrace::demangle(type.name());
  }
} // namespace freezer
