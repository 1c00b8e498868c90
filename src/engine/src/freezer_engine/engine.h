/*****************************************************************/ /**
 * @file   engine.h
 * @brief  Contains the serialization `Engine`.
 * The engine freezes a `Value` to bytes and thaws bytes back to a
 * `Value`. Plain data (nil, booleans, numbers, strings, symbols,
 * vectors and maps) is handled by the engine itself.
 * Callables and host objects have no data representation: they are
 * only frozen through *extensions*, registered hooks that write and
 * read a payload after an extension id.
 *
 * Wire format of a frozen value:
 * @code
 * header   := 'F' 'R' 'Z' version
 * value    := tag payload
 * extension:= TAG_EXTENSION u16(extension id) hook-payload
 * @endcode
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_ENGINE_ENGINE
#define __HG_FREEZER_ENGINE_ENGINE

#include <freezer_engine_export.h>
#include <freezer_engine/stream.h>
#include <freezer_value/value.h>
#include <freezer_vocabular/error.h>
#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace freezer
{
  /// @brief The tag preceding every value on the wire
  enum class WireTag : uint8_t
  {
    TAG_NIL,
    TAG_TRUE,
    TAG_FALSE,
    TAG_INT,
    TAG_DOUBLE,
    TAG_STRING,
    TAG_SYMBOL,
    TAG_VECTOR,
    TAG_MAP,
    TAG_EXTENSION,
  };

  /// @brief The version written in the header
  inline constexpr uint8_t FORMAT_VERSION = 1;

  /// @brief Runtime options of an engine
  struct EngineOptions
  {
    /// @brief The maximum nesting of values (on freeze and thaw)
    uint32_t max_depth = 512;
  };

  /// @brief The values an extension applies to.
  struct ExtensionTarget
  {
    /// @brief KIND_FN or KIND_OPAQUE
    ValueKind kind;
    /// @brief The exact runtime type, or empty for every value of `kind`
    std::optional<std::type_index> type = std::nullopt;
  };

  class Engine;

  /// @brief Writes the payload of a value (after the extension id)
  using EncodeFn =
      std::function<Result<void>(const Engine&, const Value&, OutputStream&)>;
  /// @brief Reads the payload written by the matching `EncodeFn`
  using DecodeFn = std::function<Result<Value>(const Engine&, InputStream&)>;

  /// @brief The serialization engine.
  /// Registration of extensions is expected to happen at start-up, but
  /// is safe to interleave with freeze/thaw calls.
  class FREEZER_ENGINE_EXPORT Engine
  {
    /// @brief Registered extension
    struct Extension
    {
      std::string tag_name;
      uint16_t id;
      ExtensionTarget target;
      EncodeFn encode;
      DecodeFn decode;
    };
    using ExtensionPtr = std::shared_ptr<const Extension>;

    /// @brief The options
    EngineOptions _options;
    /// @brief Protects the extension maps
    mutable std::shared_mutex _mutex;
    /// @brief Extensions by id (thaw)
    std::unordered_map<uint16_t, ExtensionPtr> _by_id;
    /// @brief Extensions by exact runtime type (freeze)
    std::unordered_map<std::type_index, ExtensionPtr> _by_type;
    /// @brief Kind-wide extension for callables (freeze)
    ExtensionPtr _fn_fallback;
    /// @brief Kind-wide extension for host objects (freeze)
    ExtensionPtr _opaque_fallback;

    Result<void> freeze_extension(const Value& value, OutputStream& out) const;
    Result<Value> thaw_extension(InputStream& in) const;

  public:
    /// @brief Constructs an engine without extensions
    /// @param options The options
    explicit Engine(EngineOptions options = {}) noexcept;
    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    /// @brief Returns the id an extension tag name is written with
    /// @param tag_name The extension tag name
    /// @return The extension id
    static uint16_t extension_id(std::string_view tag_name) noexcept;

    /// @brief Registers (or replaces) an extension.
    /// Registering an existing tag name replaces its hooks.
    /// @pre `target.kind` is KIND_FN or KIND_OPAQUE
    /// @param tag_name The tag name (`ns/name`)
    /// @param target The values the encode hook applies to
    /// @param encode The encode hook
    /// @param decode The decode hook
    /// @return The extension id or ERROR_EXTENSION_CONFLICT
    Result<uint16_t> register_extension(
        std::string_view tag_name, ExtensionTarget target, EncodeFn encode,
        DecodeFn decode);

    /// @brief Check if an extension is registered with `tag_name`
    /// @param tag_name The tag name
    /// @return True if registered
    bool has_extension(std::string_view tag_name) const noexcept;

    /// @brief Writes `value` (tag and payload) to `out`
    /// @param value The value to freeze
    /// @param out The stream to write to
    /// @return Error of the failing value (propagated unchanged)
    Result<void> freeze_to_stream(const Value& value, OutputStream& out) const;
    /// @brief Reads one value (tag and payload) from `in`
    /// @param in The stream to read from
    /// @return The value or the error
    Result<Value> thaw_from_stream(InputStream& in) const;

    /// @brief Freezes `value` to bytes (with header)
    /// @param value The value
    /// @return The bytes or the error
    Result<Bytes> freeze(const Value& value) const;
    /// @brief Thaws bytes produced by `freeze`.
    /// All the bytes must be consumed.
    /// @param bytes The bytes
    /// @return The value or the error
    Result<Value> thaw(std::span<const uint8_t> bytes) const;

    /// @brief Returns the options
    const EngineOptions& options() const noexcept { return _options; }
  };

  /// @brief Returns the process-wide engine
  FREEZER_ENGINE_EXPORT
  Engine& default_engine() noexcept;

  /// @brief Freezes `value` using `default_engine()`
  FREEZER_ENGINE_EXPORT
  Result<Bytes> freeze(const Value& value);
  /// @brief Thaws `bytes` using `default_engine()`
  FREEZER_ENGINE_EXPORT
  Result<Value> thaw(std::span<const uint8_t> bytes);
} // namespace freezer

#endif // !__HG_FREEZER_ENGINE_ENGINE
