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
#pragma once

#include "fdread/util/util_fwd.hpp"
#include <ostream>
#include <flow/common.hpp>

namespace fdread::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "fdread reads POSIX descriptors via boost.asio posix::stream_descriptor; build in Linux only.");
#endif

// Types.

/**
 * A thin, owning, move-only wrapper around a native handle, a/k/a descriptor a/k/a FD.
 * Initialize it, e.g., `Native_handle hndl(some_fd);`, where `some_fd` is an open descriptor (regular file, pipe,
 * FIFO, etc.) whose ownership passes to the new object.  Or initialize via no-arg construction which results in
 * a `null() == true` object.
 *
 * The descriptor is closed when the object is destroyed, when close() is called, or when a non-null handle is
 * move-assigned onto it.  release() gives up ownership without closing.  Copying is not allowed, as two owners of
 * one descriptor would close it twice.
 */
class Native_handle
{
public:
  // Types.

  /// The native handle type.
  using handle_t = int;

  // Constants.

  /// The value stored when `null() == true`.  No valid handle ever equals this.
  static const handle_t S_NULL_HANDLE;

  // Constructors/destructor.

  /**
   * Constructs with given payload, taking ownership of it; also subsumes no-args construction to mean constructing
   * an object with `null() == true`.
   *
   * @param native_handle
   *        Payload.
   */
  explicit Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Takes over `src`'s descriptor, while making `src.null() == true`.
   * @param src
   *        Source object.
   */
  Native_handle(Native_handle&& src);

  /// Disallow copying.
  Native_handle(const Native_handle&) = delete;

  /// Closes the descriptor, unless null().  Errors are ignored; use close() to observe them.
  ~Native_handle();

  // Methods.

  /**
   * Closes our descriptor (if any), then takes over `src`'s; no-op if `&src == this`.
   * @param src
   *        Source object which will be made `null() == true`.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /// Disallow copying.
  Native_handle& operator=(const Native_handle&) = delete;

  /**
   * Returns `true` if and only if no descriptor is owned.
   * @return See above.
   */
  bool null() const;

  /**
   * The owned descriptor, or #S_NULL_HANDLE.  Ownership is retained.
   * @return See above.
   */
  handle_t native_handle() const;

  /**
   * Gives up ownership of the descriptor without closing it: returns it and makes `null() == true`.
   * @return The formerly owned descriptor; #S_NULL_HANDLE if already null().
   */
  handle_t release();

  /**
   * Closes the descriptor (if any) and makes `null() == true`.  No-op if already null().
   * The handle becomes null() even if `close()` reports an error, as the descriptor is then no longer usable
   * regardless.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from `close()` (e.g., `boost::system::errc::bad_file_descriptor`).
   */
  void close(Error_code* err_code = 0);

private:
  // Data.

  /// The owned descriptor (possibly equal to #S_NULL_HANDLE).
  handle_t m_native_handle;
}; // class Native_handle

// Free functions.

/**
 * Prints string representation of the given Native_handle to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace fdread::util
