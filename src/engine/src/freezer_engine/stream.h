/*****************************************************************/ /**
 * @file   stream.h
 * @brief  Contains the byte streams written and read by the engine.
 * Both streams wrap a cereal portable binary archive: every stream
 * starts with the archive's byte order flag, and integers and doubles
 * are written little-endian with a fixed width.
 * Reading past the end of an `InputStream` is reported as
 * `ERROR_MALFORMED_INPUT`, never as a contract violation: the bytes
 * come from outside the process.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_ENGINE_STREAM
#define __HG_FREEZER_ENGINE_STREAM

#include <freezer_engine_export.h>
#include <freezer_vocabular/error.h>
#include <cereal/archives/portable_binary.hpp>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <streambuf>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace freezer
{
  /// @brief Owned bytes
  using Bytes = std::vector<uint8_t>;

  namespace detail
  {
    /// @brief Stream buffer appending to owned bytes
    class FREEZER_ENGINE_EXPORT BytesBuffer final : public std::streambuf
    {
      Bytes _bytes;

    public:
      explicit BytesBuffer(Bytes prefix) noexcept
          : _bytes(std::move(prefix))
      {
      }

      Bytes& bytes() noexcept { return _bytes; }
      const Bytes& bytes() const noexcept { return _bytes; }

    protected:
      int_type overflow(int_type ch) override;
      std::streamsize xsputn(const char* str, std::streamsize count) override;
    };

    /// @brief Stream buffer reading borrowed bytes
    class FREEZER_ENGINE_EXPORT SpanBuffer final : public std::streambuf
    {
    public:
      explicit SpanBuffer(std::span<const uint8_t> bytes) noexcept;

      /// @brief Returns the number of bytes left to read
      size_t remaining() const noexcept
      {
        return static_cast<size_t>(egptr() - gptr());
      }
    };
  } // namespace detail

  /// @brief Append-only byte stream
  class FREEZER_ENGINE_EXPORT OutputStream
  {
    /// @brief The bytes written
    detail::BytesBuffer _buffer;
    /// @brief The stream the archive writes to
    std::ostream _sink;
    /// @brief The archive (writes its byte order flag on construction)
    cereal::PortableBinaryOutputArchive _archive;
    /// @brief The current nesting depth
    uint32_t _depth = 0;

  public:
    /// @brief Constructs a stream
    /// @param prefix Bytes written before the archive's byte order flag
    explicit OutputStream(Bytes prefix = {});
    OutputStream(const OutputStream&)            = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    void write_u8(uint8_t value);
    void write_u16(uint16_t value);
    /// @brief Writes a length (64-bit)
    void write_size(uint64_t value);
    void write_int(int64_t value);
    void write_double(double value);
    /// @brief Writes the length of `str` followed by its bytes
    void write_string(std::string_view str);

    /// @brief Returns the bytes written so far
    std::span<const uint8_t> bytes() const noexcept { return _buffer.bytes(); }
    /// @brief Returns the number of bytes written so far
    size_t size() const noexcept { return _buffer.bytes().size(); }
    /// @brief Moves the bytes out of the stream
    Bytes take() noexcept { return std::move(_buffer.bytes()); }

    /// @brief Enters a nested value
    /// @param max_depth The maximum depth
    /// @return False if entering would exceed `max_depth`
    bool enter(uint32_t max_depth) noexcept;
    /// @brief Leaves a nested value
    void leave() noexcept;
    /// @brief Returns the current nesting depth
    uint32_t depth() const noexcept { return _depth; }
  };

  /// @brief Read-only byte stream (does not own the bytes)
  class FREEZER_ENGINE_EXPORT InputStream
  {
    /// @brief The bytes to read
    detail::SpanBuffer _buffer;
    /// @brief The stream the archive reads from
    std::istream _source;
    /// @brief The archive, empty if the byte order flag is missing or invalid
    std::optional<cereal::PortableBinaryInputArchive> _archive;
    /// @brief The current nesting depth
    uint32_t _depth = 0;

    template<typename T>
    Result<T> read_value(const char* what) noexcept;

  public:
    /// @brief Constructs a stream reading `bytes`
    /// @param bytes The bytes (must outlive the stream)
    explicit InputStream(std::span<const uint8_t> bytes);
    InputStream(const InputStream&)            = delete;
    InputStream& operator=(const InputStream&) = delete;

    Result<uint8_t> read_u8() noexcept;
    Result<uint16_t> read_u16() noexcept;
    /// @brief Reads a length (64-bit)
    Result<uint64_t> read_size() noexcept;
    Result<int64_t> read_int() noexcept;
    Result<double> read_double() noexcept;
    /// @brief Reads a length followed by that many bytes
    Result<std::string> read_string();

    /// @brief Returns the number of bytes left to read
    size_t remaining() const noexcept { return _buffer.remaining(); }
    /// @brief Check if all the bytes were read
    bool at_end() const noexcept { return remaining() == 0; }

    /// @brief Enters a nested value
    /// @param max_depth The maximum depth
    /// @return False if entering would exceed `max_depth`
    bool enter(uint32_t max_depth) noexcept;
    /// @brief Leaves a nested value
    void leave() noexcept;
    /// @brief Returns the current nesting depth
    uint32_t depth() const noexcept { return _depth; }
  };

  /// @brief Enters a nesting level for the lifetime of the guard
  /// @tparam Stream OutputStream or InputStream
  template<typename Stream>
  class DepthGuard
  {
    Stream* _stream;

  public:
    /// @brief Enters a nesting level of `stream`
    /// @param stream The stream
    /// @param max_depth The maximum depth
    DepthGuard(Stream& stream, uint32_t max_depth) noexcept
        : _stream(stream.enter(max_depth) ? &stream : nullptr)
    {
    }
    DepthGuard(const DepthGuard&)            = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
    ~DepthGuard() noexcept
    {
      if (_stream)
        _stream->leave();
    }

    /// @brief Check if the nesting level was entered
    explicit operator bool() const noexcept { return _stream != nullptr; }
  };
} // namespace freezer

#endif // !__HG_FREEZER_ENGINE_STREAM
