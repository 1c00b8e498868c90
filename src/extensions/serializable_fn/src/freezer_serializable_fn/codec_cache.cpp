/*****************************************************************/ /**
 * @file   codec_cache.cpp
 * @brief  Contains the implementation of `codec_cache.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./codec_cache.h"
#include <mutex>
#include <utility>
#include <freezer_tracing/tracing.h>

namespace freezer::ext::fn
{
  Result<FnEncoderPtr> CodecCache::get_or_build_encoder(
      const Environment& env, const Fn& fn)
  {
    const std::type_index key = typeid(fn);
    {
      std::shared_lock lock{_mutex};
      if (auto it = _encoders.find(key); it != _encoders.end())
        return it->second;
    }

    auto built = build_encoder(env, fn);
    if (built.is_error())
      return built;
    _encoders_built.fetch_add(1, std::memory_order_relaxed);
    FREEZER_TRACE_MESSAGE("encoder built");

    std::unique_lock lock{_mutex};
    auto [it, _] = _encoders.try_emplace(key, std::move(*built));
    return it->second;
  }

  Result<FnDecoderPtr> CodecCache::get_or_build_named_decoder(
      const Environment& env, const Symbol& symbol)
  {
    auto key = symbol.str();
    {
      std::shared_lock lock{_mutex};
      if (auto it = _named_decoders.find(key); it != _named_decoders.end())
        return it->second;
    }

    auto built = build_named_decoder(env, symbol);
    if (built.is_error())
      return built;
    _decoders_built.fetch_add(1, std::memory_order_relaxed);
    FREEZER_TRACE_MESSAGE("decoder built");

    std::unique_lock lock{_mutex};
    auto [it, _] = _named_decoders.try_emplace(std::move(key), std::move(*built));
    return it->second;
  }

  Result<FnDecoderPtr> CodecCache::get_or_build_closure_decoder(
      const Environment& env, std::string_view type_name)
  {
    {
      std::shared_lock lock{_mutex};
      if (auto it = _closure_decoders.find(type_name); it != _closure_decoders.end())
        return it->second;
    }

    auto built = build_closure_decoder(env, type_name);
    if (built.is_error())
      return built;
    _decoders_built.fetch_add(1, std::memory_order_relaxed);
    FREEZER_TRACE_MESSAGE("decoder built");

    std::unique_lock lock{_mutex};
    auto [it, _] =
        _closure_decoders.try_emplace(std::string{type_name}, std::move(*built));
    return it->second;
  }

  void CodecCache::clear()
  {
    FREEZER_TRACE_MESSAGE("codec cache cleared");
    // the codecs are destroyed outside of the lock
    decltype(_encoders) encoders;
    string_map<FnDecoderPtr> named;
    string_map<FnDecoderPtr> closures;
    {
      std::unique_lock lock{_mutex};
      _encoders.swap(encoders);
      _named_decoders.swap(named);
      _closure_decoders.swap(closures);
    }
    _clears.fetch_add(1, std::memory_order_relaxed);
  }

  size_t CodecCache::size() const noexcept
  {
    std::shared_lock lock{_mutex};
    return _encoders.size() + _named_decoders.size() + _closure_decoders.size();
  }

  CacheStats CodecCache::stats() const noexcept
  {
    return CacheStats{
        _encoders_built.load(std::memory_order_relaxed),
        _decoders_built.load(std::memory_order_relaxed),
        _clears.load(std::memory_order_relaxed)};
  }

  CodecCache& codec_cache() noexcept
  {
    static CodecCache cache;
    return cache;
  }

  void clear_codec_cache()
  {
    codec_cache().clear();
  }
} // namespace freezer::ext::fn
