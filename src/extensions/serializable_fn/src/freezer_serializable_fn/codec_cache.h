/*****************************************************************/ /**
 * @file   codec_cache.h
 * @brief  Contains `CodecCache`, the cache of generated codecs.
 * Encoders are keyed by the runtime type of the callable, named
 * decoders by canonical name and closure decoders by closure type name.
 * A codec is built at most once per key in steady state: builds happen
 * without holding the lock and the first inserted codec wins.
 * Failed builds are never cached.
 *
 * The cache is not invalidated when bindings or closure types change:
 * call `clear` after reloading code.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_EXT_SERIALIZABLE_FN_CODEC_CACHE
#define __HG_FREEZER_EXT_SERIALIZABLE_FN_CODEC_CACHE

#include <freezer_serializable_fn_export.h>
#include <freezer_serializable_fn/codec.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace freezer::ext::fn
{
  /// @brief Counters of a codec cache
  struct CacheStats
  {
    /// @brief Number of encoders built (including lost races)
    uint64_t encoders_built;
    /// @brief Number of decoders built (including lost races)
    uint64_t decoders_built;
    /// @brief Number of calls to `clear`
    uint64_t clears;
  };

  /// @brief Thread safe cache of codecs
  class FREEZER_SERIALIZABLE_FN_EXPORT CodecCache
  {
    template<typename T>
    using string_map =
        std::unordered_map<std::string, T, rt::transparent_hash, std::equal_to<>>;

    mutable std::shared_mutex _mutex;
    std::unordered_map<std::type_index, FnEncoderPtr> _encoders;
    string_map<FnDecoderPtr> _named_decoders;
    string_map<FnDecoderPtr> _closure_decoders;

    std::atomic<uint64_t> _encoders_built = 0;
    std::atomic<uint64_t> _decoders_built = 0;
    std::atomic<uint64_t> _clears         = 0;

  public:
    CodecCache() = default;
    CodecCache(const CodecCache&)            = delete;
    CodecCache& operator=(const CodecCache&) = delete;

    /// @brief Returns the encoder of the runtime type of `fn`
    /// @param env The environment (used on a miss)
    /// @param fn The callable
    /// @return The encoder or the build error
    Result<FnEncoderPtr> get_or_build_encoder(const Environment& env, const Fn& fn);
    /// @brief Returns the decoder of a named binding
    /// @param env The environment (used on a miss)
    /// @param symbol The canonical name
    /// @return The decoder or the build error
    Result<FnDecoderPtr> get_or_build_named_decoder(
        const Environment& env, const Symbol& symbol);
    /// @brief Returns the decoder of a closure type
    /// @param env The environment (used on a miss)
    /// @param type_name The closure type name
    /// @return The decoder or the build error
    Result<FnDecoderPtr> get_or_build_closure_decoder(
        const Environment& env, std::string_view type_name);

    /// @brief Drops every cached codec.
    /// Codecs currently in use stay valid until released.
    void clear();

    /// @brief Returns the number of cached codecs
    size_t size() const noexcept;
    /// @brief Returns the counters
    CacheStats stats() const noexcept;
  };

  /// @brief Returns the process-wide codec cache
  FREEZER_SERIALIZABLE_FN_EXPORT
  CodecCache& codec_cache() noexcept;

  /// @brief Clears the process-wide codec cache (after a code reload)
  FREEZER_SERIALIZABLE_FN_EXPORT
  void clear_codec_cache();
} // namespace freezer::ext::fn

#endif // !__HG_FREEZER_EXT_SERIALIZABLE_FN_CODEC_CACHE
