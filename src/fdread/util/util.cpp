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

/// @file
#include "fdread/util/util_fwd.hpp"
#include "fdread/util/native_handle.hpp"
#include <flow/error/error.hpp>
#include <fcntl.h>

namespace fdread::util
{

Native_handle open_for_reading(flow::log::Logger* logger_ptr, const fs::path& path, Error_code* err_code)
{
  using boost::system::system_category;
  using ::open;
  // using ::O_RDONLY; // It's a macro apparently.
  // using ::errno; // It's a macro apparently.

  {
    Native_handle hndl; // Move-only; hence not FLOW_ERROR_EXEC_AND_THROW_ON_ERROR().
    if (flow::error::exec_void_and_throw_on_error
          ([&](Error_code* actual_err_code) { hndl = open_for_reading(logger_ptr, path, actual_err_code); },
           err_code, "util::open_for_reading()"))
    {
      return hndl;
    }
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  const auto native_handle = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (native_handle == -1)
  {
    const auto& sys_err_code = *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Tried to open file at [" << path << "] for reading but failed; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return Native_handle();
  }
  // else

  err_code->clear();
  Native_handle hndl(native_handle);
  FLOW_LOG_TRACE("Opened file at [" << path << "] for reading: [" << hndl << "].");
  return hndl;
} // open_for_reading()

} // namespace fdread::util
