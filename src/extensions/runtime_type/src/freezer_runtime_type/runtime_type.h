/*****************************************************************/ /**
 * @file   runtime_type.h
 * @brief  Provides a runtime registry of closure types.
 * `C++` has no reflection over the state captured by a callable.
 * This extension lets closure types (classes deriving from `Fn` whose
 * captured values are data members) describe their captured fields
 * once, at registration: each field is described by a name, a kind and
 * a typed accessor, and the type provides a positional constructor
 * taking one value per field in declaration order.
 *
 * Registration is usually done through `bind_closure` (see bindings.h),
 * which builds the accessors and the constructor from pointers to
 * data members.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_RUNTIME_TYPE_RUNTIME_TYPE
#define __HG_FREEZER_EXT_RUNTIME_TYPE_RUNTIME_TYPE

#include <freezer_runtime_type_export.h>
#include <freezer_value/value.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace freezer::ext::rt
{
  /// @brief The kind of value a captured field holds
  enum class FieldKind : uint8_t
  {
    /// @brief `bool`
    KIND_BOOL,
    /// @brief `int64_t`
    KIND_INT,
    /// @brief `double`
    KIND_DOUBLE,
    /// @brief `std::string`
    KIND_STRING,
    /// @brief Any `Value`
    KIND_VALUE,
    /// @brief A nested callable (`FnPtr`, may be null)
    KIND_FN,
  };

  /// @brief Returns a human readable name for a field kind
  /// @param kind The field kind
  /// @return The name of the field kind
  FREEZER_RUNTIME_TYPE_EXPORT
  std::string_view to_string(FieldKind kind) noexcept;

  /// @brief Check if `value` may be stored in a field of kind `kind`
  /// @param kind The field kind
  /// @param value The value
  /// @return True if the value has the right kind
  FREEZER_RUNTIME_TYPE_EXPORT
  bool accepts(FieldKind kind, const Value& value) noexcept;

  /// @brief Reads one captured field of a closure.
  /// Accessors do not own anything and stay valid for the lifetime of
  /// the program.
  struct FieldAccessor
  {
    /// @brief The name of the field
    std::string_view name;
    /// @brief The description of the field
    std::string_view description;
    /// @brief The kind of the field
    FieldKind kind;
    /// @brief Reads the field of a closure (of the registered type!)
    Value (*read)(const Fn&);
  };

  /// @brief Positional constructor: one value per field, in order.
  /// The values were checked against the field kinds.
  using PositionalConstructor = FnPtr (*)(std::span<const Value>);

  /// @brief Description of a closure type
  struct ClosureType
  {
    /// @brief The name the type is registered with
    std::string name;
    /// @brief The runtime type
    std::type_index type;
    /// @brief The captured fields, in declaration order
    std::vector<FieldAccessor> fields;
    /// @brief Hash over the names and kinds of the fields (in order)
    uint64_t fingerprint;
    /// @brief The positional constructor
    PositionalConstructor construct;

    /// @brief Returns the number of captured fields
    size_t arity() const noexcept { return fields.size(); }
    /// @brief Returns the accessor of a field, or nullptr
    /// @param field_name The name of the field
    /// @return The accessor or nullptr
    FREEZER_RUNTIME_TYPE_EXPORT
    const FieldAccessor* field(std::string_view field_name) const noexcept;
  };

  /// @brief Shared pointer to a (never modified) closure type
  using ClosureTypePtr = std::shared_ptr<const ClosureType>;

  /// @brief Computes the layout fingerprint of a sequence of fields
  /// @param fields The fields
  /// @return The fingerprint
  FREEZER_RUNTIME_TYPE_EXPORT
  uint64_t fingerprint_of(std::span<const FieldAccessor> fields) noexcept;

  /// @brief Hash that accepts any string like type
  struct transparent_hash
  {
    using is_transparent = void;
    using hash_type      = std::hash<std::string_view>;

    size_t operator()(std::string_view sv) const noexcept { return hash_type{}(sv); }
    size_t operator()(const char* s) const noexcept
    {
      return hash_type{}(std::string_view{s});
    }
    size_t operator()(const std::string& s) const noexcept
    {
      return hash_type{}(std::string_view{s});
    }
  };

  /// @brief Registry of closure types, by runtime type and by name.
  class FREEZER_RUNTIME_TYPE_EXPORT TypeRegistry
  {
    /// @brief Protects the maps
    mutable std::shared_mutex _mutex;
    /// @brief Types by runtime type
    std::unordered_map<std::type_index, ClosureTypePtr> _by_type;
    /// @brief Types by name
    std::unordered_map<std::string, ClosureTypePtr, transparent_hash, std::equal_to<>>
        _by_name;

  public:
    TypeRegistry() = default;
    TypeRegistry(const TypeRegistry&)            = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// @brief Registers a closure type.
    /// Registering a name (or runtime type) a second time replaces the
    /// previous description. Descriptions already handed out stay valid.
    /// @param type The description (its fingerprint is recomputed)
    /// @return The registered description
    ClosureTypePtr bind(ClosureType type);
    /// @brief Removes a closure type
    /// @param name The name of the type
    /// @return True if the type was registered
    bool unbind(std::string_view name);

    /// @brief Finds a type by runtime type
    /// @param type The runtime type
    /// @return The description or nullptr
    ClosureTypePtr find(std::type_index type) const noexcept;
    /// @brief Finds a type by name
    /// @param name The name
    /// @return The description or nullptr
    ClosureTypePtr find(std::string_view name) const noexcept;

    /// @brief Returns the number of types registered
    size_t size() const noexcept;
  };

  /// @brief Returns the process-wide type registry
  FREEZER_RUNTIME_TYPE_EXPORT
  TypeRegistry& type_registry() noexcept;
} // namespace freezer::ext::rt

#endif // !__HG_FREEZER_EXT_RUNTIME_TYPE_RUNTIME_TYPE
