/*****************************************************************/ /**
 * @file   binding_table.cpp
 * @brief  Contains the implementation of `binding_table.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./binding_table.h"
#include <freezer_contracts/contracts.h>
#include <freezer_tracing/tracing.h>

namespace freezer::ext::rt
{
  Var::Var(Symbol symbol, Value value)
      : _symbol(std::move(symbol))
      , _value(std::make_shared<const Value>(std::move(value)))
  {
  }

  Value Var::get() const
  {
    auto ptr = _value.load(std::memory_order_acquire);
    return ptr ? *ptr : Value{};
  }

  bool Var::holds(const Fn* fn) const noexcept
  {
    auto ptr = _value.load(std::memory_order_acquire);
    if (!ptr)
      return false;
    auto current = ptr->as_fn();
    return current != nullptr && current->get() == fn;
  }

  void Var::set(Value value)
  {
    _value.store(
        std::make_shared<const Value>(std::move(value)), std::memory_order_release);
  }

  bool Var::is_bound() const noexcept
  {
    return _value.load(std::memory_order_acquire) != nullptr;
  }

  void Var::clear() noexcept
  {
    _value.store(nullptr, std::memory_order_release);
  }

  VarPtr BindingTable::def(const Symbol& symbol, Value value)
  {
    FREEZER_pre(!symbol.ns.empty(), "global bindings live in a namespace");

    std::unique_lock lock{_mutex};
    if (auto it = _vars.find(symbol); it != _vars.end())
    {
      it->second->set(std::move(value));
      return it->second;
    }
    auto var = std::make_shared<Var>(symbol, std::move(value));
    _vars.emplace(symbol, var);
    return var;
  }

  VarPtr BindingTable::find(const Symbol& symbol) const noexcept
  {
    std::shared_lock lock{_mutex};
    auto it = _vars.find(symbol);
    return it == _vars.end() ? nullptr : it->second;
  }

  bool BindingTable::unbind(const Symbol& symbol)
  {
    std::unique_lock lock{_mutex};
    auto it = _vars.find(symbol);
    if (it == _vars.end())
      return false;
    it->second->clear();
    _vars.erase(it);
    return true;
  }

  void BindingTable::register_unit(std::string_view ns, UnitLoader loader)
  {
    FREEZER_pre(loader != nullptr, "unit loaders must not be empty");

    auto unit    = std::make_shared<Unit>();
    unit->loader = std::move(loader);

    std::unique_lock lock{_mutex};
    if (auto it = _units.find(ns); it != _units.end())
      it->second = std::move(unit);
    else
      _units.emplace(std::string{ns}, std::move(unit));
  }

  bool BindingTable::require(std::string_view ns)
  {
    std::shared_ptr<Unit> unit;
    {
      std::shared_lock lock{_mutex};
      auto it = _units.find(ns);
      if (it == _units.end())
        return false;
      unit = it->second;
    }
    if (unit->is_loaded.load(std::memory_order_acquire))
      return true;

    std::lock_guard guard{unit->loading};
    if (!unit->is_loaded.load(std::memory_order_relaxed))
    {
      FREEZER_TRACE_BLOCK("load unit");
      unit->loader(*this);
      unit->is_loaded.store(true, std::memory_order_release);
    }
    return true;
  }

  bool BindingTable::is_loaded(std::string_view ns) const noexcept
  {
    std::shared_lock lock{_mutex};
    auto it = _units.find(ns);
    return it != _units.end() && it->second->is_loaded.load(std::memory_order_acquire);
  }

  BindingTable& binding_table() noexcept
  {
    static BindingTable table;
    return table;
  }
} // namespace freezer::ext::rt
