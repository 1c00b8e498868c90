/*****************************************************************/ /**
 * @file   bindings.h
 * @brief  Contains the C++ bindings of the closure type registry.
 * @code{.cpp}
 * struct Adder final : Fn
 * {
 *   int64_t y;
 *   explicit Adder(int64_t y) : y(y) {}
 *   Value invoke(std::span<const Value> args) const override;
 * };
 *
 * bind_closure<Adder>(type_registry(), "demo::Adder",
 *                     FREEZER_RT_FIELD(Adder, y, "y", "the addend"));
 * @endcode
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_RUNTIME_TYPE_BINDINGS
#define __HG_FREEZER_EXT_RUNTIME_TYPE_BINDINGS

#include <freezer_runtime_type/runtime_type.h>
#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace freezer::ext::rt
{
  /***********************/
  // FIELD TRAITS
  /***********************/

  /// @brief Maps a C++ field type to its FieldKind and converts to/from Value
  /// @tparam T The field type
  template<typename T>
  struct field_traits;

  template<>
  struct field_traits<bool>
  {
    static constexpr FieldKind kind = FieldKind::KIND_BOOL;
    static Value to_value(bool v) noexcept { return Value{v}; }
    static bool from_value(const Value& v) noexcept { return *v.as_bool(); }
  };
  template<>
  struct field_traits<int64_t>
  {
    static constexpr FieldKind kind = FieldKind::KIND_INT;
    static Value to_value(int64_t v) noexcept { return Value{v}; }
    static int64_t from_value(const Value& v) noexcept { return *v.as_int(); }
  };
  template<>
  struct field_traits<double>
  {
    static constexpr FieldKind kind = FieldKind::KIND_DOUBLE;
    static Value to_value(double v) noexcept { return Value{v}; }
    static double from_value(const Value& v) noexcept { return *v.as_double(); }
  };
  template<>
  struct field_traits<std::string>
  {
    static constexpr FieldKind kind = FieldKind::KIND_STRING;
    static Value to_value(const std::string& v) { return Value{v}; }
    static std::string from_value(const Value& v) { return *v.as_string(); }
  };
  template<>
  struct field_traits<Value>
  {
    static constexpr FieldKind kind = FieldKind::KIND_VALUE;
    static Value to_value(const Value& v) noexcept { return v; }
    static Value from_value(const Value& v) noexcept { return v; }
  };
  template<>
  struct field_traits<FnPtr>
  {
    static constexpr FieldKind kind = FieldKind::KIND_FN;
    static Value to_value(const FnPtr& v) noexcept { return Value{v}; }
    static FnPtr from_value(const Value& v) noexcept
    {
      return v.is_nil() ? nullptr : *v.as_fn();
    }
  };

  /// @brief Check if `T` can be the type of a captured field
  template<typename T>
  concept FieldType = requires { field_traits<T>::kind; };

  /***********************/
  // C++ BINDINGS
  /***********************/

  /// @brief Describes one captured field of `Owner`
  /// @tparam Owner The closure type
  /// @tparam Member Pointer to the data member
  template<typename Owner, auto Member>
  struct field
  {
    /// @brief The type of the field
    using field_type =
        std::remove_cvref_t<decltype(std::declval<const Owner&>().*Member)>;
    static_assert(FieldType<field_type>, "unsupported captured field type");

    std::string_view nm;
    std::string_view doc{};

    constexpr field(std::string_view n, std::string_view d = {})
        : nm(n)
        , doc(d)
    {
    }

    static Value read(const Fn& self)
    {
      return field_traits<field_type>::to_value(static_cast<const Owner&>(self).*Member);
    }

    FieldAccessor make_accessor() const noexcept
    {
      return FieldAccessor{
          .name        = nm,
          .description = doc,
          .kind        = field_traits<field_type>::kind,
          .read        = &field::read,
      };
    }
  };

  template<typename D>
  concept FieldDescriptor = requires(const D& d) {
    typename D::field_type;
    { d.make_accessor() } noexcept -> std::same_as<FieldAccessor>;
  };

  /// @brief Positional constructor of `T` from its field types
  template<typename T, typename... Fields>
  static FnPtr construct_T(std::span<const Value> args)
  {
    return [&]<size_t... I>(std::index_sequence<I...>)
    {
      return std::make_shared<const T>(
          field_traits<typename Fields::field_type>::from_value(args[I])...);
    }(std::index_sequence_for<Fields...>{});
  }

  /// @brief Registers `T` as a closure type.
  /// The field names given to the descriptors must outlive the registry
  /// (string literals).
  /// @tparam T The closure type (deriving from Fn)
  /// @tparam ...Ts The field descriptors (FREEZER_RT_FIELD)
  /// @param registry The registry
  /// @param name The name of the type
  /// @param ...ts The field descriptors, in declaration order
  /// @return The registered description
  template<std::derived_from<Fn> T, FieldDescriptor... Ts>
  ClosureTypePtr bind_closure(
      TypeRegistry& registry, std::string_view name, const Ts&... ts)
  {
    static_assert(
        std::is_constructible_v<T, typename Ts::field_type...>,
        "closure types must be constructible from their fields in order");

    ClosureType type{
        .name        = std::string{name},
        .type        = std::type_index{typeid(T)},
        .fields      = {ts.make_accessor()...},
        .fingerprint = 0,
        .construct   = &construct_T<T, Ts...>,
    };
    return registry.bind(std::move(type));
  }
} // namespace freezer::ext::rt

/// @brief Describes the captured field `member` of `Owner`
#define FREEZER_RT_FIELD(Owner, member, name, doc) \
  ::freezer::ext::rt::field<Owner, &Owner::member>       \
  {                                                      \
    (name), (doc)                                        \
  }

#endif // !__HG_FREEZER_EXT_RUNTIME_TYPE_BINDINGS
