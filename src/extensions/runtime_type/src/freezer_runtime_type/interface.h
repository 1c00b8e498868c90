/*****************************************************************/ /**
 * @file   interface.h
 * @brief  Contains interfaces: named sets of methods dispatching on
 * the kind of their first argument.
 * @code{.cpp}
 * auto shape = define_interface(binding_table(), {"demo", "Shape"}, {"area"});
 * shape.method("area")->extend(ValueKind::KIND_INT, square_area);
 * (*shape.method("area"))(4); // 16
 * @endcode
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_RUNTIME_TYPE_INTERFACE
#define __HG_FREEZER_EXT_RUNTIME_TYPE_INTERFACE

#include <freezer_runtime_type_export.h>
#include <freezer_runtime_type/binding_table.h>
#include <freezer_value/value.h>
#include <array>
#include <initializer_list>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace freezer::ext::rt
{
  /// @brief A method of an interface.
  /// The implementation cache maps the kind of the first argument to
  /// the implementation, and records the symbol the method is bound to.
  class FREEZER_RUNTIME_TYPE_EXPORT InterfaceMethod final : public Fn
  {
    /// @brief The symbol the method is bound to
    Symbol _symbol;
    /// @brief Protects the implementations
    mutable std::shared_mutex _mutex;
    /// @brief The implementations, by kind of the first argument
    std::array<FnPtr, VALUE_KIND_COUNT> _impls{};

  public:
    /// @brief Constructs a method without implementations
    /// @param symbol The symbol the method is bound to
    explicit InterfaceMethod(Symbol symbol) noexcept;

    /// @brief Returns the symbol recorded in the implementation cache
    const Symbol& symbol() const noexcept { return _symbol; }

    /// @brief Adds (or replaces) the implementation for a kind
    /// @param kind The kind of the first argument
    /// @param impl The implementation (not null)
    void extend(ValueKind kind, FnPtr impl);
    /// @brief Returns the implementation for a kind, or nullptr
    /// @param kind The kind of the first argument
    /// @return The implementation or nullptr
    FnPtr implementation(ValueKind kind) const noexcept;

    /// @brief Dispatches on the kind of `args[0]`
    /// @pre `args` is not empty, an implementation exists
    Value invoke(std::span<const Value> args) const override;
  };

  /// @brief Shared pointer to a method
  using InterfaceMethodPtr = std::shared_ptr<InterfaceMethod>;

  /// @brief A defined interface
  struct Interface
  {
    /// @brief The symbol of the interface
    Symbol symbol;
    /// @brief The methods, in definition order
    std::vector<InterfaceMethodPtr> methods;

    /// @brief Returns a method by name, or nullptr
    /// @param name The name of the method
    /// @return The method or nullptr
    FREEZER_RUNTIME_TYPE_EXPORT
    InterfaceMethodPtr method(std::string_view name) const noexcept;
  };

  /// @brief Defines an interface.
  /// Each method is bound to `ns/method` (`ns` being the namespace of
  /// `name`), the interface itself to a map listing the method symbols.
  /// @param table The binding table
  /// @param name The symbol of the interface
  /// @param methods The names of the methods
  /// @return The interface
  FREEZER_RUNTIME_TYPE_EXPORT
  Interface define_interface(
      BindingTable& table, const Symbol& name,
      std::initializer_list<std::string_view> methods);
} // namespace freezer::ext::rt

#endif // !__HG_FREEZER_EXT_RUNTIME_TYPE_INTERFACE
