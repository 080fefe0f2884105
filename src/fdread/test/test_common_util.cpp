/* fdread: Asynchronous descriptor reader
 * Copyright 2023 Akamai Technologies, Inc.
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

#include "fdread/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <fstream>
#include <cassert>
#include <fcntl.h>
#include <unistd.h>

namespace fdread::test
{

namespace
{

/**
 * Throws `flow::error::Runtime_error` for the current `errno`.
 *
 * @param context What failed.
 */
[[noreturn]] void throw_errno(util::String_view context)
{
  throw flow::error::Runtime_error(Error_code(errno, boost::system::system_category()), context);
}

} // namespace (anon)

std::string get_test_name()
{
  const auto test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  if (!test_info)
  {
    return "no-test";
  }
  // else
  return flow::util::ostream_op_string(test_info->test_suite_name(), '.', test_info->name());
}

Temp_file::Temp_file(util::String_view contents) :
  m_path(fs::temp_directory_path() / fs::unique_path("fdread-test-%%%%-%%%%-%%%%-%%%%"))
{
  std::ofstream os(m_path.string(), std::ios::binary | std::ios::trunc);
  os.write(contents.data(), contents.size());
  os.close();
  if (!os)
  {
    throw flow::error::Runtime_error(Error_code(boost::system::errc::io_error, boost::system::system_category()),
                                     "Temp_file::Temp_file()");
  }
}

Temp_file::~Temp_file()
{
  Error_code dummy; // Best effort.
  fs::remove(m_path, dummy);
}

const fs::path& Temp_file::path() const
{
  return m_path;
}

Pipe make_pipe()
{
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1)
  {
    throw_errno("pipe2()");
  }
  // else

  Pipe result;
  result.m_read_end = util::Native_handle(fds[0]);
  result.m_write_end = util::Native_handle(fds[1]);
  return result;
}

void write_all(const util::Native_handle& hndl, util::String_view data)
{
  size_t n_written = 0;
  while (n_written != data.size())
  {
    const auto rc = ::write(hndl.native_handle(), data.data() + n_written, data.size() - n_written);
    if (rc == -1)
    {
      if (errno == EINTR)
      {
        continue;
      }
      // else
      throw_errno("write()");
    }
    // else
    n_written += size_t(rc);
  }
}

util::Native_handle::handle_t unused_native_handle()
{
  // Well above any sane descriptor count yet below typical RLIMIT_NOFILE hard limits.
  const util::Native_handle::handle_t hndl = 1000123;
  assert((::fcntl(hndl, F_GETFD) == -1) && "Improbably, it is open.");
  return hndl;
}

} // namespace fdread::test
