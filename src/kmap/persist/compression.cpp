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
#include "kmap/persist/compression.hpp"
#include "kmap/persist/error/error.hpp"
#include "kmap/error/error.hpp"
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/copy.hpp>
#include <ios>

namespace kmap::persist
{

bool is_gzip_compressed(util::String_view bytes)
{
  return (bytes.size() >= 2)
         && (static_cast<uint8_t>(bytes[0]) == 0x1f) && (static_cast<uint8_t>(bytes[1]) == 0x8b);
}

void gzip_compress(log::Logger* logger_ptr, util::String_view raw, int level, std::string* compressed,
                   Error_code* err_code)
{
  namespace bio = boost::iostreams;

  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { gzip_compress(logger_ptr, raw, level, compressed, actual_err_code); },
         err_code, "persist::gzip_compress()"))
  {
    return;
  }
  // else

  KMAP_LOG_SET_CONTEXT(logger_ptr, Kmap_log_component::S_PERSIST);

  if ((level < 0) || (level > bio::zlib::best_compression))
  {
    KMAP_LOG_WARNING("Compression level [" << level << "] is not in [0, " << bio::zlib::best_compression << "].");
    KMAP_ERROR_EMIT_ERROR(error::Code::S_INVALID_COMPRESSION_LEVEL);
    return;
  }
  // else

  compressed->clear();
  {
    bio::filtering_ostream os;
    os.push(bio::gzip_compressor(bio::gzip_params((level == 0) ? bio::zlib::default_compression : level)));
    os.push(bio::back_inserter(*compressed));
    os.write(raw.data(), raw.size());
    // Closes the chain: flushes the compressor and writes the gzip footer.
    os.reset();
  }

  KMAP_LOG_TRACE("Compressed [" << raw.size() << "] bytes to [" << compressed->size() << "] bytes "
                 "at level [" << level << "].");
  err_code->clear();
} // gzip_compress()

void gzip_decompress(log::Logger* logger_ptr, util::String_view compressed, std::string* raw,
                     Error_code* err_code)
{
  namespace bio = boost::iostreams;

  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { gzip_decompress(logger_ptr, compressed, raw, actual_err_code); },
         err_code, "persist::gzip_decompress()"))
  {
    return;
  }
  // else

  KMAP_LOG_SET_CONTEXT(logger_ptr, Kmap_log_component::S_PERSIST);

  raw->clear();
  try
  {
    bio::filtering_istream is;
    is.push(bio::gzip_decompressor());
    is.push(bio::array_source(compressed.data(), compressed.size()));
    bio::copy(is, bio::back_inserter(*raw));
  }
  catch (const std::ios_base::failure& exc) // Includes bio::gzip_error and bio::zlib_error.
  {
    KMAP_LOG_WARNING("Gzip stream of [" << compressed.size() << "] bytes could not be decompressed: "
                     "[" << exc.what() << "].");
    KMAP_ERROR_EMIT_ERROR(error::Code::S_DECOMPRESSION_FAILED);
    return;
  }

  KMAP_LOG_TRACE("Decompressed [" << compressed.size() << "] bytes to [" << raw->size() << "] bytes.");
  err_code->clear();
} // gzip_decompress()

} // namespace kmap::persist
