/* kmap
 * Copyright 2026 The kmap Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "kmap/persist/persist_fwd.hpp"
#include "kmap/persist/error/error.hpp"
#include "kmap/log/log.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/noncopyable.hpp>
#include <cstring>
#include <string>
#include <vector>
#include <type_traits>

namespace kmap::persist
{

// Types.

/**
 * Appends the binary encoding of values to a target byte string.  Integers are written little-endian at their own
 * width; text and blobs are preceded by a 4-byte signed length.  Per-type encoding is defined by Value_codec;
 * write() dispatches to it.
 *
 * An Encoder cannot fail: it only appends to memory.
 *
 * ### Thread safety ###
 * Same as any non-`const` object: not safe for concurrent use.
 */
class Encoder :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs Encoder appending to `*target`, which must exist at least as long as `*this`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param target
   *        String to which to append.  Existing contents are kept.
   */
  explicit Encoder(log::Logger* logger_ptr, std::string* target);

  // Methods.

  /**
   * Appends `val` as `sizeof(Int)` little-endian bytes.
   *
   * @tparam Int
   *         Integer type other than `bool`.
   * @param val
   *        Value.
   */
  template<typename Int>
  void write_int(Int val);

  /**
   * Appends the given bytes verbatim.
   *
   * @param bytes
   *        Bytes.
   */
  void write_bytes(util::String_view bytes);

  /**
   * Appends the length of `bytes` as a 4-byte signed integer, followed by the bytes.  `bytes.size()` must not
   * exceed #S_MAX_LENGTH_PREFIX, or behavior is undefined.
   *
   * @param bytes
   *        Bytes.
   */
  void write_length_prefixed(util::String_view bytes);

  /**
   * Appends `val` as encoded by `Value_codec<T>`.
   *
   * @tparam T
   *         Type with a Value_codec.
   * @param val
   *        Value.
   */
  template<typename T>
  void write(const T& val);

  /**
   * Returns the number of bytes in the target string.
   *
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// See ctor.
  std::string* const m_target;
}; // class Encoder

/**
 * Reads values, as written by Encoder, off the front of a byte range; the range itself is not owned and must
 * exist at least as long as `*this`.  Each `read*()` either consumes the value's bytes and returns `true`; or logs
 * a WARNING (including the offset of the problem), sets `*err_code`, and returns `false`.  The `err_code`
 * arguments must not be null.
 *
 * ### Thread safety ###
 * Same as any non-`const` object: not safe for concurrent use.
 */
class Decoder :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs Decoder positioned at the start of `source`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param source
   *        The bytes to decode.
   */
  explicit Decoder(log::Logger* logger_ptr, util::String_view source);

  // Methods.

  /**
   * Consumes exactly `n_bytes` bytes, pointing `*bytes` at them.  Error: persist::error::Code::S_TRUNCATED.
   *
   * @param n_bytes
   *        Number of bytes.
   * @param bytes
   *        On success, set to the bytes, which live inside the source range.
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  bool read_bytes(size_t n_bytes, util::String_view* bytes, Error_code* err_code);

  /**
   * Consumes a `sizeof(Int)`-byte little-endian integer.  Error: persist::error::Code::S_TRUNCATED.
   *
   * @tparam Int
   *         Integer type other than `bool`.
   * @param val
   *        On success, set to the value.
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  template<typename Int>
  bool read_int(Int* val, Error_code* err_code);

  /**
   * Consumes a 4-byte signed length and that many bytes.  Errors: persist::error::Code::S_INVALID_LENGTH if the
   * length is outside [0, #S_MAX_LENGTH_PREFIX]; persist::error::Code::S_TRUNCATED.
   *
   * @param bytes
   *        On success, set to the bytes, which live inside the source range.
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  bool read_length_prefixed(util::String_view* bytes, Error_code* err_code);

  /**
   * Consumes a value as encoded by `Value_codec<T>`.
   *
   * @tparam T
   *         Type with a Value_codec.
   * @param val
   *        On success, set to the value.  On error, its contents are unspecified.
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  template<typename T>
  bool read(T* val, Error_code* err_code);

  /**
   * Succeeds if and only if all bytes have been consumed.  Error: persist::error::Code::S_TRAILING_BYTES.
   *
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  bool expect_end(Error_code* err_code);

  /**
   * Logs a WARNING mentioning the current offset, and sets `*err_code` to `err_code_val`.  Used by `read*()` and
   * by Value_codec implementations that detect bad input.
   *
   * @param err_code_val
   *        The error.
   * @param err_code
   *        Target.  Not null.
   * @return `false`, for convenience.
   */
  bool emit_error(const Error_code& err_code_val, Error_code* err_code);

  /**
   * Returns the number of bytes consumed so far.
   *
   * @return See above.
   */
  size_t offset() const;

  /**
   * Returns the number of bytes not yet consumed.
   *
   * @return See above.
   */
  size_t remaining() const;

private:
  // Data.

  /// Size of the entire source range.
  const size_t m_source_size;

  /// The not-yet-consumed part of the source range.
  boost::asio::const_buffer m_buf;
}; // class Decoder

/**
 * The binary encoding of values of type `T`, as used for keys and values in an image.  Each specialization
 * provides:
 *   - `static void encode(Encoder* encoder, const T& val)`;
 *   - `static bool decode(Decoder* decoder, T* val, Error_code* err_code)`, with the same contract as
 *     Decoder::read().
 *
 * Built in:
 *   - Integers other than `bool`: `sizeof(T)` bytes, little-endian.
 *   - `bool`: 1 byte, 0 or 1.
 *   - `float`, `double`: their IEEE-754 bit pattern, as a 4- or 8-byte integer.
 *   - `enum`s: as their underlying integer type.
 *   - `std::string`: length-prefixed bytes.
 *   - `std::vector<E>`: a length-prefixed blob containing an 8-byte element count followed by the elements.
 *
 * This primary template handles any other type, as a length-prefixed blob produced and consumed by
 * the free functions `encode_blob(const T&, std::string*)` and `decode_blob(util::String_view, T*) -> bool`,
 * which must be findable by ADL.  `decode_blob()` returning `false` is persist::error::Code::S_BAD_BLOB.
 * Alternatively specialize Value_codec for the type.
 *
 * @tparam T
 *         The encoded type.
 * @tparam Enable
 *         Ignore; used for `enable_if`-style specialization.
 */
template<typename T, typename Enable>
struct Value_codec
{
  // Methods.

  /**
   * Encodes `val`.
   *
   * @param encoder
   *        Target.
   * @param val
   *        Value.
   */
  static void encode(Encoder* encoder, const T& val);

  /**
   * Decodes `*val`.
   *
   * @param decoder
   *        Source.
   * @param val
   *        Target.
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  static bool decode(Decoder* decoder, T* val, Error_code* err_code);
};

/**
 * Value_codec for integer types (except `bool`): `sizeof(T)` little-endian bytes.
 *
 * @tparam T
 *         See above.
 */
template<typename T>
struct Value_codec<T, std::enable_if_t<std::is_integral_v<T> && (!std::is_same_v<T, bool>)>>
{
  // Methods.

  /**
   * See Value_codec primary template.
   *
   * @param encoder
   *        See above.
   * @param val
   *        See above.
   */
  static void encode(Encoder* encoder, T val)
  {
    encoder->write_int(val);
  }

  /**
   * See Value_codec primary template.
   *
   * @param decoder
   *        See above.
   * @param val
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  static bool decode(Decoder* decoder, T* val, Error_code* err_code)
  {
    return decoder->read_int(val, err_code);
  }
};

/// Value_codec for `bool`: 1 byte.
template<>
struct Value_codec<bool>
{
  // Methods.

  /**
   * See Value_codec primary template.
   *
   * @param encoder
   *        See above.
   * @param val
   *        See above.
   */
  static void encode(Encoder* encoder, bool val);

  /**
   * See Value_codec primary template.  A byte other than 0 or 1 is persist::error::Code::S_BAD_BLOB.
   *
   * @param decoder
   *        See above.
   * @param val
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  static bool decode(Decoder* decoder, bool* val, Error_code* err_code);
};

/**
 * Value_codec for `float` and `double`: the bit pattern as a same-width integer.
 *
 * @tparam T
 *         See above.
 */
template<typename T>
struct Value_codec<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
  // Types.

  /// The integer type with our width.
  using Bits = std::conditional_t<sizeof(T) == sizeof(uint32_t), uint32_t, uint64_t>;

  static_assert(sizeof(T) == sizeof(Bits), "Only 4- and 8-byte floating point types are supported.");

  // Methods.

  /**
   * See Value_codec primary template.
   *
   * @param encoder
   *        See above.
   * @param val
   *        See above.
   */
  static void encode(Encoder* encoder, T val)
  {
    Bits bits;
    std::memcpy(&bits, &val, sizeof bits);
    encoder->write_int(bits);
  }

  /**
   * See Value_codec primary template.
   *
   * @param decoder
   *        See above.
   * @param val
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  static bool decode(Decoder* decoder, T* val, Error_code* err_code)
  {
    Bits bits;
    if (!decoder->read_int(&bits, err_code))
    {
      return false;
    }
    std::memcpy(val, &bits, sizeof bits);
    return true;
  }
};

/**
 * Value_codec for `enum`s: as the underlying integer.  The decoded integer is not checked against the
 * `enum`'s members.
 *
 * @tparam T
 *         See above.
 */
template<typename T>
struct Value_codec<T, std::enable_if_t<std::is_enum_v<T>>>
{
  // Types.

  /// The underlying integer type.
  using Raw = std::underlying_type_t<T>;

  // Methods.

  /**
   * See Value_codec primary template.
   *
   * @param encoder
   *        See above.
   * @param val
   *        See above.
   */
  static void encode(Encoder* encoder, T val)
  {
    encoder->write_int(static_cast<Raw>(val));
  }

  /**
   * See Value_codec primary template.
   *
   * @param decoder
   *        See above.
   * @param val
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  static bool decode(Decoder* decoder, T* val, Error_code* err_code)
  {
    Raw raw;
    if (!decoder->read_int(&raw, err_code))
    {
      return false;
    }
    *val = static_cast<T>(raw);
    return true;
  }
};

/// Value_codec for text: length-prefixed bytes.
template<>
struct Value_codec<std::string>
{
  // Methods.

  /**
   * See Value_codec primary template.
   *
   * @param encoder
   *        See above.
   * @param val
   *        See above.
   */
  static void encode(Encoder* encoder, const std::string& val);

  /**
   * See Value_codec primary template.
   *
   * @param decoder
   *        See above.
   * @param val
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  static bool decode(Decoder* decoder, std::string* val, Error_code* err_code);
};

/**
 * Value_codec for `vector`s: a length-prefixed blob with an 8-byte element count followed by the elements.
 * Within the blob, the count may not exceed the number of remaining bytes (every element takes at least 1),
 * and no bytes may follow the last element.
 *
 * @tparam Elem
 *         Element type, which must itself have a Value_codec and be default-constructible.
 * @tparam Allocator
 *         Allocator type.
 */
template<typename Elem, typename Allocator>
struct Value_codec<std::vector<Elem, Allocator>>
{
  // Methods.

  /**
   * See Value_codec primary template.
   *
   * @param encoder
   *        See above.
   * @param val
   *        See above.
   */
  static void encode(Encoder* encoder, const std::vector<Elem, Allocator>& val);

  /**
   * See Value_codec primary template.
   *
   * @param decoder
   *        See above.
   * @param val
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  static bool decode(Decoder* decoder, std::vector<Elem, Allocator>* val, Error_code* err_code);
};

// Template implementations.

template<typename Int>
void Encoder::write_int(Int val)
{
  using boost::endian::native_to_little;

  static_assert(std::is_integral_v<Int> && (!std::is_same_v<Int, bool>), "Integer types only.");

  const Int raw = native_to_little(val);
  m_target->append(reinterpret_cast<const char*>(&raw), sizeof raw);
}

template<typename T>
void Encoder::write(const T& val)
{
  Value_codec<T>::encode(this, val);
}

template<typename Int>
bool Decoder::read_int(Int* val, Error_code* err_code)
{
  using boost::endian::little_to_native;

  static_assert(std::is_integral_v<Int> && (!std::is_same_v<Int, bool>), "Integer types only.");

  util::String_view bytes;
  if (!read_bytes(sizeof(Int), &bytes, err_code))
  {
    return false;
  }
  // else

  Int raw;
  // The source is not necessarily aligned for Int; so no reinterpret_cast<>.
  std::memcpy(&raw, bytes.data(), sizeof raw);
  *val = little_to_native(raw);
  return true;
}

template<typename T>
bool Decoder::read(T* val, Error_code* err_code)
{
  return Value_codec<T>::decode(this, val, err_code);
}

template<typename T, typename Enable>
void Value_codec<T, Enable>::encode(Encoder* encoder, const T& val) // Static.
{
  std::string blob;
  encode_blob(val, &blob); // Found by ADL.
  encoder->write_length_prefixed(blob);
}

template<typename T, typename Enable>
bool Value_codec<T, Enable>::decode(Decoder* decoder, T* val, Error_code* err_code) // Static.
{
  util::String_view blob;
  if (!decoder->read_length_prefixed(&blob, err_code))
  {
    return false;
  }
  // else

  if (!decode_blob(blob, val)) // Found by ADL.
  {
    return decoder->emit_error(error::Code::S_BAD_BLOB, err_code);
  }
  // else
  return true;
}

template<typename Elem, typename Allocator>
void Value_codec<std::vector<Elem, Allocator>>::encode(Encoder* encoder,
                                                      const std::vector<Elem, Allocator>& val) // Static.
{
  std::string blob;
  {
    Encoder blob_encoder(encoder->get_logger(), &blob);
    blob_encoder.write_int(static_cast<int64_t>(val.size()));
    for (const auto& elem : val)
    {
      blob_encoder.write(elem);
    }
  }
  encoder->write_length_prefixed(blob);
}

template<typename Elem, typename Allocator>
bool Value_codec<std::vector<Elem, Allocator>>::decode(Decoder* decoder, std::vector<Elem, Allocator>* val,
                                                      Error_code* err_code) // Static.
{
  util::String_view blob;
  if (!decoder->read_length_prefixed(&blob, err_code))
  {
    return false;
  }
  // else

  Decoder blob_decoder(decoder->get_logger(), blob);
  int64_t count;
  if (!blob_decoder.read_int(&count, err_code))
  {
    return false;
  }
  // else
  if ((count < 0) || (static_cast<uint64_t>(count) > blob_decoder.remaining()))
  {
    return blob_decoder.emit_error(error::Code::S_INVALID_LENGTH, err_code);
  }
  // else

  val->clear();
  val->reserve(static_cast<size_t>(count));
  for (int64_t idx = 0; idx != count; ++idx)
  {
    Elem elem;
    if (!blob_decoder.read(&elem, err_code))
    {
      return false;
    }
    val->push_back(std::move(elem));
  }

  return blob_decoder.expect_end(err_code);
} // Value_codec<vector>::decode()

} // namespace kmap::persist
