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
#include "kmap/persist/coordinator.hpp"
#include "kmap/persist/compression.hpp"
#include "kmap/persist/file_util.hpp"
#include "kmap/persist/save_options.hpp"
#include "kmap/persist/error/error.hpp"
#include "kmap/error/error.hpp"
#include <boost/make_shared.hpp>
#include <boost/system/system_error.hpp>
#include <exception>

namespace kmap::persist
{

Coordinator::Coordinator(log::Logger* logger_ptr, util::String_view nickname) :
  log::Log_context(logger_ptr, Kmap_log_component::S_PERSIST),
  m_loop(logger_ptr, nickname)
{
  KMAP_LOG_TRACE("Coordinator [" << this << "]: Created.");
}

Coordinator::~Coordinator()
{
  KMAP_LOG_TRACE("Coordinator [" << this << "]: Destroying; waiting for any background work first.");
  stop();
}

void Coordinator::write_image(const boost::filesystem::path& path, util::String_view image,
                              const Save_options& opts, Error_code* err_code)
{
  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_image(path, image, opts, actual_err_code); },
         err_code, "persist::Coordinator::write_image()"))
  {
    return;
  }
  // else

  if (!opts.m_compress)
  {
    write_file_atomically(get_logger(), path, image, err_code);
    return;
  }
  // else

  std::string compressed;
  gzip_compress(get_logger(), image, opts.m_compress_level, &compressed, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  write_file_atomically(get_logger(), path, compressed, err_code);
} // Coordinator::write_image()

void Coordinator::read_image(const boost::filesystem::path& path, std::string* image, Error_code* err_code)
{
  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { read_image(path, image, actual_err_code); },
         err_code, "persist::Coordinator::read_image()"))
  {
    return;
  }
  // else

  std::string file_bytes;
  read_file(get_logger(), path, &file_bytes, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  if (is_gzip_compressed(file_bytes))
  {
    KMAP_LOG_TRACE("[" << path << "] is gzip-compressed.");
    gzip_decompress(get_logger(), file_bytes, image, err_code);
    return;
  }
  // else

  *image = std::move(file_bytes);
} // Coordinator::read_image()

Async_result_ptr Coordinator::post(Work&& work)
{
  const auto result = boost::make_shared<Async_result>();

  m_loop.start(); // No-op after the first time (or after stop()).
  const bool posted = m_loop.post([this, result, work = std::move(work)]()
  {
    Error_code err_code;
    try
    {
      work(&err_code);
    }
    catch (const boost::system::system_error& exc)
    {
      KMAP_LOG_WARNING("Coordinator [" << this << "]: Background work threw [" << exc.what() << "].");
      err_code = exc.code();
    }
    catch (const std::exception& exc)
    {
      KMAP_LOG_WARNING("Coordinator [" << this << "]: Background work threw [" << exc.what() << "].");
      err_code = error::Code::S_ASYNC_WORK_FAILED;
    }
    KMAP_LOG_TRACE("Coordinator [" << this << "]: Background work finished with result [" << err_code << "] "
                   "[" << err_code.message() << "].");
    result->complete(err_code);
  });

  if (!posted)
  {
    KMAP_LOG_WARNING("Coordinator [" << this << "]: Background work posted after stop(); abandoning it.");
    result->complete(error::Code::S_ASYNC_ABANDONED);
  }

  return result;
} // Coordinator::post()

void Coordinator::stop()
{
  m_loop.stop();
}

} // namespace kmap::persist
