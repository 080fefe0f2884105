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

#include "fdread/reader/file_reader.hpp"
#include "fdread/reader/detail/read_channel.hpp"
#include <flow/async/single_thread_task_loop.hpp>

namespace fdread::reader
{

// Types.

/**
 * Internal, non-movable pImpl-lite implementation of File_reader class.
 * In and of itself it would have been directly and publicly usable; however File_reader adds the pImpl wrapper.
 *
 * @see File_reader doc header for the public API.
 *
 * ### Design ###
 * The session is modeled by two futures, both set up in the ctor:
 *   - #m_reading_ended: resolved by the Read_channel on-close handler: success, or the read error.  Its Promise is
 *     captured by that handler; nothing else resolves it.
 *   - #m_session_ended: async::Future::chain() off #m_reading_ended, on our engine.  The continuation delivers
 *     end-of-stream, closes the descriptor, and forwards #m_reading_ended's outcome.  Since a Promise resolves
 *     once, and the chain continuation is attached once, end-of-stream is delivered exactly once: no matter
 *     whether the channel closed due to EOF, an error, or stop_reading().  The continuation captures the consumer and
 *     the descriptor holder (#m_hndl), not `this`; so it can safely run even during our destruction.
 *
 * Everything else is driven by thread W (#m_worker): all mutable state is accessed only from there (or from the dtor
 * after W is gone), so there is no locking.  Public methods called from outside W post themselves onto W and await
 * completion; the `*_now()` counterparts do the work assuming they run in W.
 *
 * state() derives the state from the futures and from whether the descriptor has been closed yet.
 */
class File_reader::Impl :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * See File_reader counterpart.
   *
   * @param logger_ptr
   *        See File_reader counterpart.
   * @param nickname_str
   *        See File_reader counterpart.
   * @param hndl_moved
   *        See File_reader counterpart.
   * @param consumer
   *        See File_reader counterpart.
   * @param opts
   *        See File_reader counterpart.
   */
  explicit Impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, util::Native_handle&& hndl_moved,
                const Consumer_ptr& consumer, const Options& opts);

  /// See File_reader counterpart.
  ~Impl();

  // Methods.

  /**
   * See File_reader counterpart.
   * @param err_code
   *        See File_reader counterpart.
   */
  void start_reading(Error_code* err_code);

  /**
   * See File_reader counterpart.
   * @param err_code
   *        See File_reader counterpart.
   * @return See File_reader counterpart.
   */
  async::Future stop_reading(Error_code* err_code);

  /**
   * See File_reader counterpart.
   * @return See File_reader counterpart.
   */
  async::Future completed();

  /**
   * See File_reader counterpart.
   * @return See File_reader counterpart.
   */
  State state() const;

  /**
   * See File_reader counterpart.
   * @return See File_reader counterpart.
   */
  const std::string& nickname() const;

  /**
   * See File_reader counterpart.
   * @return See File_reader counterpart.
   */
  const Options& options() const;

private:
  // Methods.

  /**
   * start_reading() body, in thread W.
   * @param err_code
   *        Not null.
   */
  void start_reading_now(Error_code* err_code);

  /**
   * stop_reading() body, in thread W (or dtor's finisher thread).
   * @param err_code
   *        Not null.
   * @return See stop_reading().
   */
  async::Future stop_reading_now(Error_code* err_code);

  /**
   * state() body, in thread W.
   * @return See state().
   */
  State state_now() const;

  /**
   * Read_channel on-data handler.
   *
   * @param done
   *        See Read_channel::On_data_func.
   * @param data
   *        See Read_channel::On_data_func.
   */
  void on_channel_data(bool done, const util::Blob_const& data);

  /**
   * Read_channel on-close handler: resolves #m_reading_ended.
   * @param err_code
   *        See Read_channel::On_close_func.
   */
  void on_channel_close(const Error_code& err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See options().
  const Options m_opts;

  /// The consumer; also captured by #m_session_ended continuation.
  const Consumer_ptr m_consumer;

  /**
   * The descriptor; shared with #m_session_ended continuation which closes it (hence null() from then on).
   * Otherwise closed when the last owner is gone.
   */
  const boost::shared_ptr<util::Native_handle> m_hndl;

  /// Resolved by the channel on-close handler.  See class doc header.
  async::Promise m_reading_ended;

  /**
   * Thread W: single-thread engine doing all the work.  Must be declared before #m_session_ended whose ctor-time
   * setup uses its engine.  We stop() it explicitly in dtor.
   */
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_worker;

  /// Chained off #m_reading_ended.  See class doc header.
  async::Future m_session_ended;

  /// Whether start_reading_now() has got past the already-started check.
  bool m_start_attempted;

  /// Whether start_reading_now() failed to create #m_channel.
  bool m_start_failed;

  /// The read channel; non-null from successful start_reading() until stop_reading() or dtor.
  Read_channel::Ptr m_channel;
}; // class File_reader::Impl

// Free functions.

/**
 * Prints string representation of the given File_reader::Impl to the given `ostream`.
 *
 * @relatesalso File_reader::Impl
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const File_reader::Impl& val);

} // namespace fdread::reader
