/*****************************************************************/ /**
 * @file   resolver.cpp
 * @brief  Contains the implementation of `resolver.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./resolver.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <typeinfo>
#include <freezer_runtime_type/interface.h>

namespace freezer::ext::fn
{
  /// @brief Splits a C++ name on the `::` that are not nested in
  /// parentheses, brackets, braces or template arguments.
  static std::vector<std::string_view> split_scopes(std::string_view name)
  {
    std::vector<std::string_view> ret;
    int depth    = 0;
    size_t start = 0;
    for (size_t i = 0; i < name.size(); i++)
    {
      switch (name[i])
      {
      case '(':
      case '<':
      case '{':
      case '[':
        ++depth;
        break;
      case ')':
      case '>':
      case '}':
      case ']':
        depth = std::max(depth - 1, 0);
        break;
      case ':':
        if (depth == 0 && i + 1 < name.size() && name[i + 1] == ':')
        {
          ret.push_back(name.substr(start, i - start));
          start = i + 2;
          ++i;
        }
        break;
      default:
        break;
      }
    }
    ret.push_back(name.substr(start));
    return ret;
  }

  static bool is_digits(std::string_view str) noexcept
  {
    return !str.empty()
           && std::all_of(
               str.begin(), str.end(),
               [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
  }

  /// @brief Segments that only exist because of how the code was compiled
  static bool is_artifact(std::string_view segment) noexcept
  {
    if (segment == "(anonymous namespace)")
      return true;
    // GCC: {lambda(long)#1}, {unnamed type#1}. Clang: 'lambda'(long), $_0
    if (segment.starts_with("{lambda(") || segment.starts_with("{unnamed type#")
        || segment.starts_with("'lambda") || segment.starts_with("'unnamed"))
      return true;
    return segment.starts_with("$_") && is_digits(segment.substr(2));
  }

  /// @brief Removes a `__<digits>` suffix
  static std::string_view strip_suffix(std::string_view segment) noexcept
  {
    auto pos = segment.rfind("__");
    if (pos != std::string_view::npos && pos != 0 && is_digits(segment.substr(pos + 2)))
      return segment.substr(0, pos);
    return segment;
  }

  static std::string join_scopes(std::span<const std::string_view> segments)
  {
    std::string ret;
    for (size_t i = 0; i < segments.size(); i++)
    {
      if (i != 0)
        ret.append("::");
      ret.append(segments[i]);
    }
    return ret;
  }

  std::optional<Symbol> DefaultNameRecovery::qualify(std::string_view cpp_name)
  {
    auto segments = split_scopes(cpp_name);
    if (segments.size() < 2 || segments.back().empty())
      return std::nullopt;
    auto ns = std::span<const std::string_view>{segments}.first(segments.size() - 1);
    return Symbol{join_scopes(ns), std::string{segments.back()}};
  }

  std::string DefaultNameRecovery::strip(std::string_view cpp_name)
  {
    std::vector<std::string_view> segments;
    for (auto segment : split_scopes(cpp_name))
    {
      if (!is_artifact(segment))
        segments.push_back(segment);
    }

    std::vector<std::string_view> kept;
    for (size_t i = 0; i < segments.size(); i++)
    {
      auto segment = segments[i];
      // function scope: `install()` or `install(int) const`
      if (auto paren = segment.find('('); paren != std::string_view::npos)
      {
        if (i + 1 != segments.size())
          continue;
        segment = segment.substr(0, paren);
      }
      segment = strip_suffix(segment);
      if (!segment.empty())
        kept.push_back(segment);
    }
    return join_scopes(kept);
  }

  std::vector<Symbol> DefaultNameRecovery::candidates(const Fn& fn) const
  {
    std::vector<Symbol> ret;
    auto add = [&ret](std::optional<Symbol> symbol)
    {
      if (symbol && std::find(ret.begin(), ret.end(), *symbol) == ret.end())
        ret.push_back(std::move(*symbol));
    };

    const auto cpp_name = runtime_type_name(typeid(fn));
    add(qualify(cpp_name));
    if (auto method = dynamic_cast<const rt::InterfaceMethod*>(&fn))
      add(method->symbol());
    add(qualify(strip(cpp_name)));
    return ret;
  }

  const NameRecovery& default_name_recovery() noexcept
  {
    static const DefaultNameRecovery recovery;
    return recovery;
  }

  std::optional<Resolution> resolve(
      const rt::BindingTable& table, const Fn& fn, const NameRecovery& recovery) noexcept
  {
    try
    {
      for (auto& symbol : recovery.candidates(fn))
      {
        auto var = table.find(symbol);
        if (var && var->holds(&fn))
          return Resolution{std::move(symbol), std::move(var)};
      }
    }
    catch (const std::exception&)
    {
      // candidates could not be computed: not a named binding
    }
    return std::nullopt;
  }
} // namespace freezer::ext::fn
