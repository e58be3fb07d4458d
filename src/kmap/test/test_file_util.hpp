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

#include "kmap/common.hpp"
#include <boost/filesystem.hpp>
#include <boost/noncopyable.hpp>

namespace kmap::test
{

/**
 * Returns whether a file exists.
 *
 * @param file_path The path to the file to check.
 * @param ec Any error that occurred.
 *
 * @return See above; a positive value is also an indicator that there was no error.
 */
bool does_file_exist(const boost::filesystem::path& file_path, Error_code& ec);

/**
 * Returns whether a directory exists.
 *
 * @param dir_path The path to check.
 * @param ec Any error that occurred.
 *
 * @return See above.
 */
bool does_dir_exist(const boost::filesystem::path& dir_path, Error_code& ec);

/**
 * Writes the given bytes to the given file, replacing it.  Fails the current test (gtest `ADD_FAILURE()`) on error.
 *
 * @param file_path Target path.
 * @param bytes Contents.
 */
void write_test_file(const boost::filesystem::path& file_path, const std::string& bytes);

/**
 * Reads the given file entirely.  Fails the current test on error.
 *
 * @param file_path Source path.
 *
 * @return The contents; empty on error.
 */
std::string read_test_file(const boost::filesystem::path& file_path);

/**
 * A uniquely named directory under the system temp directory, created by the constructor and removed (recursively)
 * by the destructor.
 */
class Temp_dir :
  private boost::noncopyable
{
public:
  /// Creates the directory.
  Temp_dir();

  /// Removes the directory and everything in it.
  ~Temp_dir();

  /**
   * Returns the directory's path.
   *
   * @return See above.
   */
  const boost::filesystem::path& path() const;

private:
  /// See path().
  const boost::filesystem::path m_path;
}; // class Temp_dir

} // namespace kmap::test
