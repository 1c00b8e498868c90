/*****************************************************************/ /**
 * @file   value.h
 * @brief  Contains `Value`, the dynamic value frozen and thawed by the engine.
 * A `Value` is one of: nil, a boolean, a 64-bit integer, a double,
 * a string, a symbol, a vector, a map, a callable (`Fn`) or a host
 * object (`Opaque`).
 * Vectors and maps are immutable and shared between copies: copying
 * a `Value` never copies its elements.
 * Callables and host objects compare by identity, everything else
 * compares structurally.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_VALUE_VALUE
#define __HG_FREEZER_VALUE_VALUE

#include <freezer_value_export.h>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace freezer
{
  class Value;
  class Fn;
  class Opaque;

  /// @brief Shared pointer to a callable
  using FnPtr = std::shared_ptr<const Fn>;
  /// @brief Shared pointer to a host object
  using OpaquePtr = std::shared_ptr<const Opaque>;
  /// @brief A vector of values
  using Vector = std::vector<Value>;
  /// @brief An ordered map of values
  using Map = std::map<Value, Value>;

  /// @brief The kind of value stored in a `Value`
  enum class ValueKind : uint8_t
  {
    KIND_NIL,
    KIND_BOOL,
    KIND_INT,
    KIND_DOUBLE,
    KIND_STRING,
    KIND_SYMBOL,
    KIND_VECTOR,
    KIND_MAP,
    KIND_FN,
    KIND_OPAQUE,
  };

  /// @brief The number of `ValueKind`s
  inline constexpr size_t VALUE_KIND_COUNT = 10;

  /// @brief Returns a human readable name for a value kind
  /// @param kind The kind
  /// @return The name of the kind
  FREEZER_VALUE_EXPORT
  std::string_view to_string(ValueKind kind) noexcept;

  /// @brief A (possibly namespace qualified) symbolic name: `ns/name`.
  /// Canonical names of global bindings are symbols.
  struct Symbol
  {
    /// @brief The namespace (may be empty)
    std::string ns;
    /// @brief The name
    std::string name;

    /// @brief Parses `ns/name` (or `name`)
    /// @param qualified The qualified name
    /// @return Symbol
    FREEZER_VALUE_EXPORT
    static Symbol parse(std::string_view qualified);

    /// @brief Returns `ns/name`, or `name` if the namespace is empty
    /// @return The printed symbol
    FREEZER_VALUE_EXPORT
    std::string str() const;

    friend bool operator==(const Symbol&, const Symbol&) = default;
    friend auto operator<=>(const Symbol&, const Symbol&) = default;
  };

  /// @brief A callable value.
  /// Callables are immutable: every override of `invoke` must be const
  /// and must not mutate observable state.
  class Fn
  {
  public:
    virtual ~Fn() = default;

    /// @brief Invokes the callable
    /// @param args The arguments
    /// @return The result
    virtual Value invoke(std::span<const Value> args) const = 0;

    /// @brief Returns the metadata attached to the callable, or nullptr.
    /// Metadata is a side-channel: it never changes invocation behavior.
    /// @return The metadata or nullptr
    virtual const Map* meta() const noexcept { return nullptr; }

    /// @brief Invokes the callable
    /// @param ...args The arguments (each convertible to Value)
    /// @return The result
    template<typename... Args>
    Value operator()(Args&&... args) const;
  };

  /// @brief Base class of host objects (handles, locks...).
  /// Host objects have no data representation: they can only be frozen
  /// when an extension is registered for their exact runtime type.
  class Opaque
  {
  public:
    virtual ~Opaque() = default;
  };

  /// @brief Dynamic value
  class Value
  {
    /// @brief The stored value
    std::variant<
        std::monostate, bool, int64_t, double, std::string, Symbol,
        std::shared_ptr<const Vector>, std::shared_ptr<const Map>, FnPtr, OpaquePtr>
        _data;

  public:
    /// @brief Constructs nil
    Value() noexcept = default;
    /// @brief Constructs nil
    Value(std::nullptr_t) noexcept {}
    /// @brief Constructs a boolean
    Value(bool b) noexcept
        : _data(std::in_place_type<bool>, b)
    {
    }
    /// @brief Constructs an integer
    template<std::integral I>
      requires(!std::same_as<I, bool>)
    Value(I i) noexcept
        : _data(std::in_place_type<int64_t>, static_cast<int64_t>(i))
    {
    }
    /// @brief Constructs a double
    Value(double d) noexcept
        : _data(std::in_place_type<double>, d)
    {
    }
    /// @brief Constructs a string
    Value(std::string s) noexcept
        : _data(std::in_place_type<std::string>, std::move(s))
    {
    }
    /// @brief Constructs a string
    Value(std::string_view s)
        : _data(std::in_place_type<std::string>, s)
    {
    }
    /// @brief Constructs a string
    Value(const char* s)
        : _data(std::in_place_type<std::string>, s)
    {
    }
    /// @brief Constructs a symbol
    Value(Symbol s) noexcept
        : _data(std::in_place_type<Symbol>, std::move(s))
    {
    }
    /// @brief Constructs a vector
    Value(Vector v)
        : _data(std::make_shared<const Vector>(std::move(v)))
    {
    }
    /// @brief Constructs a map
    Value(Map m)
        : _data(std::make_shared<const Map>(std::move(m)))
    {
    }
    /// @brief Constructs a callable (nil if `fn` is null)
    template<std::derived_from<Fn> F>
    Value(std::shared_ptr<F> fn) noexcept
    {
      if (fn)
        _data.emplace<FnPtr>(std::move(fn));
    }
    /// @brief Constructs a host object (nil if `obj` is null)
    template<std::derived_from<Opaque> O>
    Value(std::shared_ptr<O> obj) noexcept
    {
      if (obj)
        _data.emplace<OpaquePtr>(std::move(obj));
    }

    /// @brief Returns the kind of the stored value
    ValueKind kind() const noexcept { return static_cast<ValueKind>(_data.index()); }
    /// @brief Check if the value is nil
    bool is_nil() const noexcept { return kind() == ValueKind::KIND_NIL; }

    const bool* as_bool() const noexcept { return std::get_if<bool>(&_data); }
    const int64_t* as_int() const noexcept { return std::get_if<int64_t>(&_data); }
    const double* as_double() const noexcept { return std::get_if<double>(&_data); }
    const std::string* as_string() const noexcept
    {
      return std::get_if<std::string>(&_data);
    }
    const Symbol* as_symbol() const noexcept { return std::get_if<Symbol>(&_data); }
    const Vector* as_vector() const noexcept
    {
      auto ptr = std::get_if<std::shared_ptr<const Vector>>(&_data);
      return ptr ? ptr->get() : nullptr;
    }
    const Map* as_map() const noexcept
    {
      auto ptr = std::get_if<std::shared_ptr<const Map>>(&_data);
      return ptr ? ptr->get() : nullptr;
    }
    const FnPtr* as_fn() const noexcept { return std::get_if<FnPtr>(&_data); }
    const OpaquePtr* as_opaque() const noexcept
    {
      return std::get_if<OpaquePtr>(&_data);
    }
  };

  /// @brief Structural equality (identity for callables and host objects)
  FREEZER_VALUE_EXPORT
  bool operator==(const Value& a, const Value& b) noexcept;
  /// @brief Total order: by kind, then by content
  FREEZER_VALUE_EXPORT
  bool operator<(const Value& a, const Value& b) noexcept;

  template<typename... Args>
  Value Fn::operator()(Args&&... args) const
  {
    std::array<Value, sizeof...(Args)> argv{Value(std::forward<Args>(args))...};
    return invoke(std::span<const Value>{argv.data(), argv.size()});
  }

  /// @brief Check if `callee` can be invoked (callables, maps and vectors)
  /// @param callee The value
  /// @return True if `invoke` accepts the value
  FREEZER_VALUE_EXPORT
  bool is_invocable(const Value& callee) noexcept;

  /// @brief Invokes a value.
  /// Callables are invoked, maps look up their first argument (the
  /// optional second argument is returned when the key is missing),
  /// vectors index by their first argument (same default rule).
  /// @pre `is_invocable(callee)`
  /// @param callee The value to invoke
  /// @param args The arguments
  /// @return The result
  FREEZER_VALUE_EXPORT
  Value invoke(const Value& callee, std::span<const Value> args);

  /// @brief Returns the demangled name of a runtime type
  /// @param type The runtime type
  /// @return Demangled name (`demo::Adder`)
  FREEZER_VALUE_EXPORT
  std::string runtime_type_name(const std::type_info& type);
} // namespace freezer

#endif // !__HG_FREEZER_VALUE_VALUE
