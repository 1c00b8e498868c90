/*****************************************************************/ /**
 * @file   runtime_type.cpp
 * @brief  Contains the implementation of `runtime_type.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./runtime_type.h"
#include <mutex>
#include <freezer_contracts/contracts.h>
#include <freezer_vocabular/hash.h>

namespace freezer::ext::rt
{
  std::string_view to_string(FieldKind kind) noexcept
  {
    switch (kind)
    {
    case FieldKind::KIND_BOOL:
      return "bool";
    case FieldKind::KIND_INT:
      return "int";
    case FieldKind::KIND_DOUBLE:
      return "double";
    case FieldKind::KIND_STRING:
      return "string";
    case FieldKind::KIND_VALUE:
      return "value";
    case FieldKind::KIND_FN:
      return "fn";
    }
    return "unknown";
  }

  bool accepts(FieldKind kind, const Value& value) noexcept
  {
    switch (kind)
    {
    case FieldKind::KIND_BOOL:
      return value.kind() == ValueKind::KIND_BOOL;
    case FieldKind::KIND_INT:
      return value.kind() == ValueKind::KIND_INT;
    case FieldKind::KIND_DOUBLE:
      return value.kind() == ValueKind::KIND_DOUBLE;
    case FieldKind::KIND_STRING:
      return value.kind() == ValueKind::KIND_STRING;
    case FieldKind::KIND_VALUE:
      return true;
    case FieldKind::KIND_FN:
      // a null callable is stored as nil
      return value.kind() == ValueKind::KIND_FN || value.is_nil();
    }
    return false;
  }

  const FieldAccessor* ClosureType::field(std::string_view field_name) const noexcept
  {
    for (auto& accessor : fields)
    {
      if (accessor.name == field_name)
        return &accessor;
    }
    return nullptr;
  }

  uint64_t fingerprint_of(std::span<const FieldAccessor> fields) noexcept
  {
    uint64_t h = hash_string("freezer.rt/fields");
    for (auto& field : fields)
    {
      h = hash_combine(h, hash_string(field.name));
      h = hash_combine(h, static_cast<uint64_t>(field.kind));
    }
    return hash_combine(h, fields.size());
  }

  ClosureTypePtr TypeRegistry::bind(ClosureType type)
  {
    FREEZER_pre(type.construct != nullptr, "closure types need a constructor");
    FREEZER_pre(!type.name.empty(), "closure types need a name");

    type.fingerprint = fingerprint_of(type.fields);
    auto ptr         = std::make_shared<const ClosureType>(std::move(type));

    std::unique_lock lock{_mutex};
    if (auto it = _by_name.find(ptr->name); it != _by_name.end())
    {
      // the name now describes another runtime type
      if (auto old = _by_type.find(it->second->type);
          old != _by_type.end() && old->second == it->second)
        _by_type.erase(old);
      it->second = ptr;
    }
    else
      _by_name.emplace(ptr->name, ptr);

    if (auto old = _by_type.find(ptr->type); old != _by_type.end())
    {
      // the runtime type was registered under another name
      if (old->second->name != ptr->name)
        _by_name.erase(old->second->name);
      old->second = ptr;
    }
    else
      _by_type.emplace(ptr->type, ptr);
    return ptr;
  }

  bool TypeRegistry::unbind(std::string_view name)
  {
    std::unique_lock lock{_mutex};
    auto it = _by_name.find(name);
    if (it == _by_name.end())
      return false;
    if (auto old = _by_type.find(it->second->type);
        old != _by_type.end() && old->second == it->second)
      _by_type.erase(old);
    _by_name.erase(it);
    return true;
  }

  ClosureTypePtr TypeRegistry::find(std::type_index type) const noexcept
  {
    std::shared_lock lock{_mutex};
    auto it = _by_type.find(type);
    return it == _by_type.end() ? nullptr : it->second;
  }

  ClosureTypePtr TypeRegistry::find(std::string_view name) const noexcept
  {
    std::shared_lock lock{_mutex};
    auto it = _by_name.find(name);
    return it == _by_name.end() ? nullptr : it->second;
  }

  size_t TypeRegistry::size() const noexcept
  {
    std::shared_lock lock{_mutex};
    return _by_name.size();
  }

  TypeRegistry& type_registry() noexcept
  {
    static TypeRegistry registry;
    return registry;
  }
} // namespace freezer::ext::rt
