/*****************************************************************/ /**
 * @file   resolver.h
 * @brief  Contains the global binding resolver.
 * The resolver recovers the canonical name (`ns/name`) of a callable
 * from its runtime type name: `demo::square` is the callable bound to
 * `demo/square`. A name is only accepted if the binding currently holds
 * the very callable being resolved.
 *
 * How candidate names are derived from a runtime type is a strategy
 * (`NameRecovery`). The default strategy tries, in order:
 * - the demangled runtime type name (`demo::square` -> `demo/square`)
 * - the symbol recorded by interface methods
 * - the demangled name without compiler artifacts: anonymous
 *   namespaces, enclosing function scopes, lambda segments and numeric
 *   disambiguation suffixes (`demo::(anonymous namespace)::cube`,
 *   `demo::install()::cube` and `demo::cube__12` -> `demo/cube`).
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_SERIALIZABLE_FN_RESOLVER
#define __HG_FREEZER_EXT_SERIALIZABLE_FN_RESOLVER

#include <freezer_serializable_fn_export.h>
#include <freezer_runtime_type/binding_table.h>
#include <freezer_value/value.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace freezer::ext::fn
{
  /// @brief Strategy deriving candidate canonical names from a callable
  class NameRecovery
  {
  public:
    virtual ~NameRecovery() = default;

    /// @brief Returns the candidate names of `fn`, most likely first
    /// @param fn The callable
    /// @return The candidates (may be empty)
    virtual std::vector<Symbol> candidates(const Fn& fn) const = 0;
  };

  /// @brief The default name recovery strategy
  class FREEZER_SERIALIZABLE_FN_EXPORT DefaultNameRecovery final : public NameRecovery
  {
  public:
    std::vector<Symbol> candidates(const Fn& fn) const override;

    /// @brief Turns the last `::` of a C++ name into a symbol
    /// @param cpp_name The C++ name (`demo::geometry::area`)
    /// @return The symbol (`demo::geometry/area`), or nullopt without namespace
    static std::optional<Symbol> qualify(std::string_view cpp_name);
    /// @brief Removes compiler artifacts from a C++ name
    /// @param cpp_name The demangled name
    /// @return The name without anonymous namespaces, function scopes,
    /// lambda segments and numeric suffixes
    static std::string strip(std::string_view cpp_name);
  };

  /// @brief Returns the default name recovery strategy
  FREEZER_SERIALIZABLE_FN_EXPORT
  const NameRecovery& default_name_recovery() noexcept;

  /// @brief A resolved global binding
  struct Resolution
  {
    /// @brief The canonical name
    Symbol symbol;
    /// @brief The binding cell
    rt::VarPtr var;
  };

  /// @brief Resolves the global binding holding `fn`.
  /// Never fails: any failure is reported as nullopt.
  /// @param table The binding table to look into
  /// @param fn The callable
  /// @param recovery The name recovery strategy
  /// @return The binding, or nullopt if no binding currently holds `fn`
  FREEZER_SERIALIZABLE_FN_EXPORT
  std::optional<Resolution> resolve(
      const rt::BindingTable& table, const Fn& fn,
      const NameRecovery& recovery = default_name_recovery()) noexcept;
} // namespace freezer::ext::fn

#endif // !__HG_FREEZER_EXT_SERIALIZABLE_FN_RESOLVER
