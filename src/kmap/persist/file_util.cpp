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
#include "kmap/persist/file_util.hpp"
#include "kmap/error/error.hpp"
#include <boost/filesystem/fstream.hpp>

namespace kmap::persist
{

void write_file_atomically(log::Logger* logger_ptr, const boost::filesystem::path& path, util::String_view bytes,
                           Error_code* err_code)
{
  namespace fs = boost::filesystem;
  using boost::system::errc::make_error_code;
  using boost::system::errc::io_error;

  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_file_atomically(logger_ptr, path, bytes, actual_err_code); },
         err_code, "persist::write_file_atomically()"))
  {
    return;
  }
  // else

  KMAP_LOG_SET_CONTEXT(logger_ptr, Kmap_log_component::S_PERSIST);

  Error_code sys_err_code;

  const auto parent = path.parent_path();
  if (!parent.empty())
  {
    fs::create_directories(parent, sys_err_code);
    if (sys_err_code)
    {
      KMAP_ERROR_SYS_ERROR_LOG_WARNING();
      KMAP_LOG_WARNING("Could not create directory [" << parent << "] for [" << path << "].");
      *err_code = sys_err_code;
      return;
    }
  }
  // else

  fs::path tmp_path = path;
  tmp_path += fs::unique_path(".%%%%-%%%%-%%%%.tmp");

  {
    fs::ofstream os(tmp_path, std::ios::binary | std::ios::trunc);
    if (os)
    {
      os.write(bytes.data(), bytes.size());
      os.close();
    }
    if (!os)
    {
      sys_err_code = make_error_code(io_error);
      KMAP_ERROR_SYS_ERROR_LOG_WARNING();
      KMAP_LOG_WARNING("Could not write [" << bytes.size() << "] bytes to [" << tmp_path << "].");
      Error_code ignored_err_code;
      fs::remove(tmp_path, ignored_err_code);
      *err_code = sys_err_code;
      return;
    }
  }

  fs::rename(tmp_path, path, sys_err_code);
  if (sys_err_code)
  {
    KMAP_ERROR_SYS_ERROR_LOG_WARNING();
    KMAP_LOG_WARNING("Could not rename [" << tmp_path << "] to [" << path << "].");
    Error_code ignored_err_code;
    fs::remove(tmp_path, ignored_err_code);
    *err_code = sys_err_code;
    return;
  }
  // else

  KMAP_LOG_TRACE("Wrote [" << bytes.size() << "] bytes to [" << path << "].");
  err_code->clear();
} // write_file_atomically()

void read_file(log::Logger* logger_ptr, const boost::filesystem::path& path, std::string* bytes,
               Error_code* err_code)
{
  namespace fs = boost::filesystem;
  using boost::system::errc::make_error_code;
  using boost::system::errc::io_error;

  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { read_file(logger_ptr, path, bytes, actual_err_code); },
         err_code, "persist::read_file()"))
  {
    return;
  }
  // else

  KMAP_LOG_SET_CONTEXT(logger_ptr, Kmap_log_component::S_PERSIST);

  Error_code sys_err_code;
  const auto file_size = fs::file_size(path, sys_err_code);
  if (sys_err_code)
  {
    KMAP_ERROR_SYS_ERROR_LOG_WARNING();
    KMAP_LOG_WARNING("Could not get the size of [" << path << "].");
    *err_code = sys_err_code;
    return;
  }
  // else

  bytes->resize(size_t(file_size));
  fs::ifstream is(path, std::ios::binary);
  if (!(is && is.read(&(*bytes)[0], bytes->size())))
  {
    sys_err_code = make_error_code(io_error);
    KMAP_ERROR_SYS_ERROR_LOG_WARNING();
    KMAP_LOG_WARNING("Could not read [" << file_size << "] bytes from [" << path << "].");
    *err_code = sys_err_code;
    return;
  }
  // else

  KMAP_LOG_TRACE("Read [" << bytes->size() << "] bytes from [" << path << "].");
  err_code->clear();
} // read_file()

} // namespace kmap::persist
