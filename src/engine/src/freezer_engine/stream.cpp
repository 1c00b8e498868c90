/*****************************************************************/ /**
 * @file   stream.cpp
 * @brief  Contains the implementation of `stream.h`.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "./stream.h"
#include <freezer_contracts/contracts.h>

namespace freezer
{
  namespace detail
  {
    BytesBuffer::int_type BytesBuffer::overflow(int_type ch)
    {
      if (traits_type::eq_int_type(ch, traits_type::eof()))
        return traits_type::not_eof(ch);
      _bytes.push_back(static_cast<uint8_t>(traits_type::to_char_type(ch)));
      return ch;
    }

    std::streamsize BytesBuffer::xsputn(const char* str, std::streamsize count)
    {
      auto begin = reinterpret_cast<const uint8_t*>(str);
      _bytes.insert(_bytes.end(), begin, begin + count);
      return count;
    }

    SpanBuffer::SpanBuffer(std::span<const uint8_t> bytes) noexcept
    {
      // the get area is never written through
      auto begin = reinterpret_cast<char*>(const_cast<uint8_t*>(bytes.data()));
      setg(begin, begin, begin + bytes.size());
    }
  } // namespace detail

  static FreezeError truncated(const char* what)
  {
    return make_error(
        ErrorKind::ERROR_MALFORMED_INPUT, std::string("truncated input while reading ") + what);
  }

  OutputStream::OutputStream(Bytes prefix)
      : _buffer(std::move(prefix))
      , _sink(&_buffer)
      , _archive(_sink, cereal::PortableBinaryOutputArchive::Options::LittleEndian())
  {
  }

  void OutputStream::write_u8(uint8_t value)
  {
    _archive(value);
  }

  void OutputStream::write_u16(uint16_t value)
  {
    _archive(value);
  }

  void OutputStream::write_size(uint64_t value)
  {
    _archive(value);
  }

  void OutputStream::write_int(int64_t value)
  {
    _archive(value);
  }

  void OutputStream::write_double(double value)
  {
    _archive(value);
  }

  void OutputStream::write_string(std::string_view str)
  {
    write_size(str.size());
    _archive(cereal::binary_data(str.data(), str.size()));
  }

  bool OutputStream::enter(uint32_t max_depth) noexcept
  {
    if (_depth >= max_depth)
      return false;
    ++_depth;
    return true;
  }

  void OutputStream::leave() noexcept
  {
    FREEZER_debug_assert(_depth != 0, "unbalanced leave");
    --_depth;
  }

  InputStream::InputStream(std::span<const uint8_t> bytes)
      : _buffer(bytes)
      , _source(&_buffer)
  {
    // the archive reads the byte order flag on construction
    if (!bytes.empty() && bytes[0] <= 1)
      _archive.emplace(_source);
  }

  template<typename T>
  Result<T> InputStream::read_value(const char* what) noexcept
  {
    if (!_archive || remaining() < sizeof(T))
      return {unexpected, truncated(what)};
    try
    {
      T ret{};
      (*_archive)(ret);
      return ret;
    }
    catch (const cereal::Exception& e)
    {
      return {unexpected, make_error(ErrorKind::ERROR_MALFORMED_INPUT, e.what())};
    }
  }

  Result<uint8_t> InputStream::read_u8() noexcept
  {
    return read_value<uint8_t>("a byte");
  }

  Result<uint16_t> InputStream::read_u16() noexcept
  {
    return read_value<uint16_t>("a 16-bit integer");
  }

  Result<uint64_t> InputStream::read_size() noexcept
  {
    return read_value<uint64_t>("a length");
  }

  Result<int64_t> InputStream::read_int() noexcept
  {
    return read_value<int64_t>("an integer");
  }

  Result<double> InputStream::read_double() noexcept
  {
    return read_value<double>("a double");
  }

  Result<std::string> InputStream::read_string()
  {
    auto size = read_size();
    if (size.is_error())
      return {unexpected, std::move(size).error()};
    if (*size > remaining())
      return {unexpected, truncated("a string")};
    std::string ret(static_cast<size_t>(*size), '\0');
    try
    {
      (*_archive)(cereal::binary_data(ret.data(), ret.size()));
    }
    catch (const cereal::Exception& e)
    {
      return {unexpected, make_error(ErrorKind::ERROR_MALFORMED_INPUT, e.what())};
    }
    return ret;
  }

  bool InputStream::enter(uint32_t max_depth) noexcept
  {
    if (_depth >= max_depth)
      return false;
    ++_depth;
    return true;
  }

  void InputStream::leave() noexcept
  {
    FREEZER_debug_assert(_depth != 0, "unbalanced leave");
    --_depth;
  }
} // namespace freezer
