/*****************************************************************/ /**
 * @file   fn.cpp
 * @brief  Contains the implementation of `fn.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./fn.h"
#include <freezer_contracts/contracts.h>

namespace freezer
{
  MetaFn::MetaFn(FnPtr inner, Map meta) noexcept
      : _inner(std::move(inner))
      , _meta(std::move(meta))
  {
    FREEZER_pre(_inner != nullptr, "cannot attach metadata to null");
  }

  Value MetaFn::invoke(std::span<const Value> args) const
  {
    return _inner->invoke(args);
  }

  EnclosingFn::EnclosingFn(Value enclosing) noexcept
      : _enclosing(std::move(enclosing))
  {
    FREEZER_pre(is_invocable(_enclosing), "enclosing value is not invocable");
  }

  Value EnclosingFn::invoke(std::span<const Value> args) const
  {
    return freezer::invoke(_enclosing, args);
  }

  FnPtr with_meta(const FnPtr& fn, Map meta)
  {
    FREEZER_pre(fn != nullptr, "cannot attach metadata to null");
    if (auto wrapped = dynamic_cast<const MetaFn*>(fn.get()))
      return std::make_shared<const MetaFn>(wrapped->inner(), std::move(meta));
    return std::make_shared<const MetaFn>(fn, std::move(meta));
  }

  const Map* meta(const FnPtr& fn) noexcept
  {
    return fn ? fn->meta() : nullptr;
  }

  FnPtr bind_enclosing(Value enclosing)
  {
    return std::make_shared<const EnclosingFn>(std::move(enclosing));
  }
} // namespace freezer
