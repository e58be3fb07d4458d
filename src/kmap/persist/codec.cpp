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
#include "kmap/persist/codec.hpp"
#include "kmap/error/error.hpp"
#include <cassert>

namespace kmap::persist
{

// Encoder implementations.

Encoder::Encoder(log::Logger* logger_ptr, std::string* target) :
  log::Log_context(logger_ptr, Kmap_log_component::S_PERSIST),
  m_target(target)
{
  // Nothing else.
}

void Encoder::write_bytes(util::String_view bytes)
{
  m_target->append(bytes.data(), bytes.size());
}

void Encoder::write_length_prefixed(util::String_view bytes)
{
  assert(bytes.size() <= size_t(S_MAX_LENGTH_PREFIX));

  write_int(static_cast<int32_t>(bytes.size()));
  write_bytes(bytes);
}

size_t Encoder::size() const
{
  return m_target->size();
}

// Decoder implementations.

Decoder::Decoder(log::Logger* logger_ptr, util::String_view source) :
  log::Log_context(logger_ptr, Kmap_log_component::S_PERSIST),
  m_source_size(source.size()),
  m_buf(source.data(), source.size())
{
  // Nothing else.
}

bool Decoder::read_bytes(size_t n_bytes, util::String_view* bytes, Error_code* err_code)
{
  if (n_bytes > m_buf.size())
  {
    KMAP_LOG_WARNING("Need [" << n_bytes << "] bytes, but only [" << m_buf.size() << "] remain.");
    return emit_error(error::Code::S_TRUNCATED, err_code);
  }
  // else

  *bytes = util::String_view(static_cast<const char*>(m_buf.data()), n_bytes);
  m_buf += n_bytes;
  return true;
}

bool Decoder::read_length_prefixed(util::String_view* bytes, Error_code* err_code)
{
  int32_t length;
  if (!read_int(&length, err_code))
  {
    return false;
  }
  // else

  if ((length < 0) || (length > S_MAX_LENGTH_PREFIX))
  {
    KMAP_LOG_WARNING("Length prefix [" << length << "] is outside [0, " << S_MAX_LENGTH_PREFIX << "].");
    return emit_error(error::Code::S_INVALID_LENGTH, err_code);
  }
  // else

  return read_bytes(size_t(length), bytes, err_code);
}

bool Decoder::expect_end(Error_code* err_code)
{
  if (m_buf.size() != 0)
  {
    KMAP_LOG_WARNING("[" << m_buf.size() << "] unexpected bytes follow the last expected value.");
    return emit_error(error::Code::S_TRAILING_BYTES, err_code);
  }
  // else
  return true;
}

bool Decoder::emit_error(const Error_code& err_code_val, Error_code* err_code)
{
  KMAP_LOG_WARNING("Decoding failed at offset [" << offset() << "] of [" << m_source_size << "].");
  KMAP_ERROR_EMIT_ERROR(err_code_val);
  return false;
}

size_t Decoder::offset() const
{
  return m_source_size - m_buf.size();
}

size_t Decoder::remaining() const
{
  return m_buf.size();
}

// Value_codec implementations.

void Value_codec<bool>::encode(Encoder* encoder, bool val) // Static.
{
  encoder->write_int(static_cast<uint8_t>(val ? 1 : 0));
}

bool Value_codec<bool>::decode(Decoder* decoder, bool* val, Error_code* err_code) // Static.
{
  uint8_t raw;
  if (!decoder->read_int(&raw, err_code))
  {
    return false;
  }
  // else
  if (raw > 1)
  {
    return decoder->emit_error(error::Code::S_BAD_BLOB, err_code);
  }
  // else

  *val = (raw == 1);
  return true;
}

void Value_codec<std::string>::encode(Encoder* encoder, const std::string& val) // Static.
{
  encoder->write_length_prefixed(val);
}

bool Value_codec<std::string>::decode(Decoder* decoder, std::string* val, Error_code* err_code) // Static.
{
  util::String_view bytes;
  if (!decoder->read_length_prefixed(&bytes, err_code))
  {
    return false;
  }
  // else

  val->assign(bytes.data(), bytes.size());
  return true;
}

} // namespace kmap::persist
