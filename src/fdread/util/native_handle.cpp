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
#include "fdread/util/native_handle.hpp"
#include <flow/error/error.hpp>
#include <unistd.h>
#include <utility>

namespace fdread::util
{

// Static initializers.

// Reminder: We've assured via static_assert() that this is being built in Linux.
const Native_handle::handle_t Native_handle::S_NULL_HANDLE = -1;

// Native_handle implementations.

Native_handle::Native_handle(handle_t native_handle) :
  m_native_handle(native_handle)
{
  // Nope.
}

Native_handle::Native_handle(Native_handle&& src) :
  m_native_handle(src.release())
{
  // Yay.
}

Native_handle::~Native_handle()
{
  if (!null())
  {
    ::close(m_native_handle); // Nowhere to report it; close() is there for those who care.
  }
}

Native_handle& Native_handle::operator=(Native_handle&& src)
{
  if (&src != this)
  {
    Error_code dummy; // Same policy as dtor.
    close(&dummy);
    m_native_handle = src.release();
  }
  return *this;
}

bool Native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

Native_handle::handle_t Native_handle::native_handle() const
{
  return m_native_handle;
}

Native_handle::handle_t Native_handle::release()
{
  using std::swap;

  handle_t released = S_NULL_HANDLE;
  swap(released, m_native_handle);
  return released;
}

void Native_handle::close(Error_code* err_code)
{
  using boost::system::system_category;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "Native_handle::close()"))
  {
    return;
  }
  // else

  err_code->clear();
  if (null())
  {
    return;
  }
  // else

  // Per Linux close(2) do not retry on EINTR: the descriptor is released regardless.
  if (::close(release()) == -1)
  {
    *err_code = Error_code(errno, system_category());
  }
} // Native_handle::close()

std::ostream& operator<<(std::ostream& os, const Native_handle& val)
{
  os << "native_hndl[";
  if (val.null())
  {
    os << "NONE";
  }
  else
  {
    os << val.native_handle();
  }
  return os << ']';
}

} // namespace fdread::util
