/*****************************************************************/ /**
 * @file   binding_table.h
 * @brief  Contains the global binding table.
 * A binding associates a symbol (`ns/name`) to a value through a
 * binding cell (`Var`). Redefining a binding replaces the value of
 * its cell: everything holding the cell sees the new value.
 * Bindings of a namespace are usually defined by a *unit*, a loader
 * function registered for the namespace and run (at most once) the
 * first time the namespace is required.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_RUNTIME_TYPE_BINDING_TABLE
#define __HG_FREEZER_EXT_RUNTIME_TYPE_BINDING_TABLE

#include <freezer_runtime_type_export.h>
#include <freezer_runtime_type/runtime_type.h>
#include <freezer_value/value.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace freezer::ext::rt
{
  class BindingTable;

  /// @brief A binding cell.
  /// The current value can be read and replaced concurrently.
  class FREEZER_RUNTIME_TYPE_EXPORT Var
  {
    /// @brief The symbol of the binding
    Symbol _symbol;
    /// @brief The current value (null once unbound)
    std::atomic<std::shared_ptr<const Value>> _value;

  public:
    /// @brief Constructs a binding cell
    /// @param symbol The symbol
    /// @param value The initial value
    Var(Symbol symbol, Value value);
    Var(const Var&)            = delete;
    Var& operator=(const Var&) = delete;

    /// @brief Returns the symbol of the binding
    const Symbol& symbol() const noexcept { return _symbol; }
    /// @brief Returns the current value (nil once unbound)
    Value get() const;
    /// @brief Check if the current value is the callable `fn`
    /// @param fn The callable
    /// @return True if the binding currently holds `fn`
    bool holds(const Fn* fn) const noexcept;
    /// @brief Replaces the current value
    /// @param value The new value
    void set(Value value);
    /// @brief Check if the binding was not removed
    bool is_bound() const noexcept;

  private:
    friend class BindingTable;
    void clear() noexcept;
  };

  /// @brief Shared pointer to a binding cell
  using VarPtr = std::shared_ptr<Var>;

  /// @brief Defines the bindings of a namespace
  using UnitLoader = std::function<void(BindingTable&)>;

  /// @brief Table of global bindings.
  class FREEZER_RUNTIME_TYPE_EXPORT BindingTable
  {
    /// @brief A registered unit
    struct Unit
    {
      UnitLoader loader;
      /// @brief Held while the loader runs
      std::mutex loading;
      std::atomic<bool> is_loaded = false;
    };

    /// @brief Protects the maps (never held while running a loader)
    mutable std::shared_mutex _mutex;
    /// @brief The bindings
    std::map<Symbol, VarPtr> _vars;
    /// @brief The units by namespace
    std::unordered_map<std::string, std::shared_ptr<Unit>, transparent_hash, std::equal_to<>>
        _units;

  public:
    BindingTable() = default;
    BindingTable(const BindingTable&)            = delete;
    BindingTable& operator=(const BindingTable&) = delete;

    /// @brief Defines (or redefines) a binding
    /// @param symbol The symbol (with a namespace)
    /// @param value The value
    /// @return The binding cell (the same cell on redefinition)
    VarPtr def(const Symbol& symbol, Value value);
    /// @brief Finds a binding
    /// @param symbol The symbol
    /// @return The binding cell or nullptr
    VarPtr find(const Symbol& symbol) const noexcept;
    /// @brief Removes a binding.
    /// Cells already handed out are marked as unbound.
    /// @param symbol The symbol
    /// @return True if the binding existed
    bool unbind(const Symbol& symbol);

    /// @brief Registers the loader of a namespace (replacing any previous one)
    /// @param ns The namespace
    /// @param loader The loader
    void register_unit(std::string_view ns, UnitLoader loader);
    /// @brief Runs the loader of a namespace if it did not run yet.
    /// Concurrent callers wait for the loader to finish. If the loader
    /// throws, the exception is propagated and a later call retries.
    /// @param ns The namespace
    /// @return False if no unit is registered for `ns`
    bool require(std::string_view ns);
    /// @brief Check if the unit of a namespace was loaded
    /// @param ns The namespace
    /// @return True if loaded
    bool is_loaded(std::string_view ns) const noexcept;
  };

  /// @brief Returns the process-wide binding table
  FREEZER_RUNTIME_TYPE_EXPORT
  BindingTable& binding_table() noexcept;
} // namespace freezer::ext::rt

#endif // !__HG_FREEZER_EXT_RUNTIME_TYPE_BINDING_TABLE
