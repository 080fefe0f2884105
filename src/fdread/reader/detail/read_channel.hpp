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

#include "fdread/reader/reader_fwd.hpp"
#include "fdread/util/native_handle.hpp"
#include "fdread/util/default_init_allocator.hpp"
#include <flow/log/log.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>

namespace fdread::reader
{

// Types.

/**
 * Internally used by File_reader: the asynchronous I/O channel over a descriptor it does not own, streaming
 * what it reads to an on-data function and reporting its own closure exactly once to an on-close function.
 * It is a boost.asio `posix::stream_descriptor` with the logic of a streaming read of unbounded length
 * layered on top.
 *
 * ### Thread safety ###
 * Everything, including both user functions, executes in the thread(s) running the util::Task_engine
 * given to create(): it must be a serial engine (thread W).  Methods must be called from W as well.
 *
 * ### Delivery ###
 * Bytes accumulate until at least the low-water mark is available, then are delivered as one chunk (`done ==
 * false`).  When reading ends, the remainder (possibly empty) is delivered with `done == true`; then the on-close
 * function is called.  Reading ends upon (1) end-of-file; (2) a read error; or (3) close_now().  The on-close
 * function receives the error in case (2), success otherwise.
 *
 * Regular files and directories cannot be watched for readability via `epoll`; boost.asio handles that by
 * performing such reads speculatively and immediately, which is fine as they never block.
 *
 * ### Lifetime ###
 * A read in progress holds a ref-counted pointer to `*this`; hence the creator may drop its Ptr right after
 * close_now().  The descriptor is never closed by `*this`: once done, it is released from the
 * `stream_descriptor`.  boost.asio puts it in non-blocking mode (`O_NONBLOCK`) for the reads; that flag belongs to
 * the open file description, shared by `dup()`s and across `fork()`, so before releasing we put it back in
 * blocking mode if that is how we found it.
 */
class Read_channel :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Read_channel>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`.
  using Ptr = boost::shared_ptr<Read_channel>;

  /// Short-hand for the on-close function.
  using On_close_func = Function<void (const Error_code& err_code)>;

  /**
   * Short-hand for the on-data function.  `done` is `true` for the last call, which may carry an empty `data`;
   * then `err_code` is the same as what the on-close function will receive.
   */
  using On_data_func = Function<void (bool done, const util::Blob_const& data, const Error_code& err_code)>;

  // Constructors/destructor.

  /**
   * Creates the channel over the given descriptor, registering it with the given engine; reading does not begin
   * until read().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname, as shown in logs/etc.
   * @param task_engine
   *        The serial engine (thread W); must outlive `*this`.
   * @param native_handle
   *        Descriptor; must stay open at least until the on-close function has been called.
   * @param low_water
   *        Low-water mark in bytes; at least 1.
   * @param read_buf_size
   *        How many bytes to ask for per read (it is raised to `low_water` if less).
   * @param on_close_func
   *        See On_close_func.  Never called if this returns null.
   * @param err_code
   *        Must not be null.  #Error_code generated: system errors from registering the descriptor with
   *        boost.asio: e.g., `boost::asio::error::bad_descriptor`.
   * @return The channel; or null on error.
   */
  static Ptr create(flow::log::Logger* logger_ptr, util::String_view nickname_str, util::Task_engine* task_engine,
                    util::Native_handle::handle_t native_handle, size_t low_water, size_t read_buf_size,
                    On_close_func&& on_close_func, Error_code* err_code);

  /// Releases the descriptor (without closing it), if not yet done.
  ~Read_channel();

  // Methods.

  /**
   * Begins reading.  Call at most once.
   *
   * @param on_data_func
   *        See On_data_func.
   */
  void read(On_data_func&& on_data_func);

  /**
   * Requests closure: an outstanding read is canceled, and any bytes obtained so far are delivered, followed by
   * the on-close function (with success).  No-op if already closed or closing.  Depending on timing, the closure
   * may occur synchronously inside this call.
   */
  void close_now();

  /**
   * Returns `true` if and only if the on-close function has been called.
   * @return See above.
   */
  bool closed() const;

  /**
   * Returns nickname as passed to create().
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param nickname_str
   *        See create().
   * @param task_engine
   *        See create().
   * @param low_water
   *        See create().
   * @param read_buf_size
   *        See create().
   * @param on_close_func
   *        See create().
   */
  explicit Read_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                        util::Task_engine* task_engine, size_t low_water, size_t read_buf_size,
                        On_close_func&& on_close_func);

  // Methods.

  /// Starts an async read into the unused part of #m_buf.
  void async_read_more();

  /**
   * Completion handler for async_read_more().
   *
   * @param sys_err_code
   *        Result of the read.
   * @param n_rcvd
   *        Bytes read.
   */
  void on_read_some(const Error_code& sys_err_code, size_t n_rcvd);

  /**
   * Passes the #m_n_pending bytes in #m_buf (possibly zero) to the on-data function and empties #m_buf.
   *
   * @param done
   *        See On_data_func.
   * @param err_code
   *        See On_data_func.
   */
  void deliver(bool done, const Error_code& err_code);

  /**
   * Releases the descriptor from #m_peer (if not yet done), first restoring blocking mode if #m_restore_blocking.
   * Errors are logged but otherwise ignored.
   */
  void release_descriptor();

  /**
   * Marks `*this` closed, releases the descriptor, and calls the on-close function.
   * @param err_code
   *        What to pass to it.
   */
  void finish(const Error_code& err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The descriptor wrapper; open from successful create() until finish() or dtor.
  boost::asio::posix::stream_descriptor m_peer;

  /// See create().
  const size_t m_low_water;

  /// Read target; `m_buf.size()` is fixed after ctor.
  util::Read_buffer m_buf;

  /// Bytes at the start of #m_buf read but not yet delivered.
  size_t m_n_pending;

  /// See read(); null until then and after finish().
  On_data_func m_on_data_func;

  /// See create(); null after finish().
  On_close_func m_on_close_func;

  /// Whether `m_peer.async_read_some()` is outstanding (its completion handler has not yet run).
  bool m_read_in_progress;

  /// Whether close_now() has been called.
  bool m_stop_requested;

  /// See closed().
  bool m_closed;

  /// Whether the descriptor was in blocking mode when given to create(); if so release_descriptor() restores that.
  bool m_restore_blocking;
}; // class Read_channel

// Free functions.

/**
 * Prints string representation of the given Read_channel to the given `ostream`.
 *
 * @relatesalso Read_channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Read_channel& val);

} // namespace fdread::reader
