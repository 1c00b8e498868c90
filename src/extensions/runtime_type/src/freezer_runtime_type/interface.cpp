/*****************************************************************/ /**
 * @file   interface.cpp
 * @brief  Contains the implementation of `interface.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./interface.h"
#include <mutex>
#include <freezer_contracts/contracts.h>

namespace freezer::ext::rt
{
  InterfaceMethod::InterfaceMethod(Symbol symbol) noexcept
      : _symbol(std::move(symbol))
  {
  }

  void InterfaceMethod::extend(ValueKind kind, FnPtr impl)
  {
    FREEZER_pre(impl != nullptr, "implementation must not be null");
    std::unique_lock lock{_mutex};
    _impls[static_cast<size_t>(kind)] = std::move(impl);
  }

  FnPtr InterfaceMethod::implementation(ValueKind kind) const noexcept
  {
    std::shared_lock lock{_mutex};
    return _impls[static_cast<size_t>(kind)];
  }

  Value InterfaceMethod::invoke(std::span<const Value> args) const
  {
    FREEZER_pre(!args.empty(), "interface methods dispatch on their first argument");
    if (args.empty())
      return {};
    auto impl = implementation(args[0].kind());
    FREEZER_pre(impl != nullptr, "no implementation for the kind of the first argument");
    if (!impl)
      return {};
    return impl->invoke(args);
  }

  InterfaceMethodPtr Interface::method(std::string_view name) const noexcept
  {
    for (auto& m : methods)
    {
      if (m->symbol().name == name)
        return m;
    }
    return nullptr;
  }

  Interface define_interface(
      BindingTable& table, const Symbol& name,
      std::initializer_list<std::string_view> methods)
  {
    FREEZER_pre(!name.ns.empty(), "interfaces live in a namespace");

    Interface ret{name, {}};
    Vector symbols;
    for (auto method : methods)
    {
      auto m = std::make_shared<InterfaceMethod>(Symbol{name.ns, std::string{method}});
      table.def(m->symbol(), Value{m});
      symbols.emplace_back(m->symbol());
      ret.methods.push_back(std::move(m));
    }
    table.def(name, Map{{"methods", std::move(symbols)}});
    return ret;
  }
} // namespace freezer::ext::rt
