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

#include "fdread/reader/consumer.hpp"
#include "fdread/async/future.hpp"
#include "fdread/util/native_handle.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <experimental/propagate_const>

namespace fdread::reader
{

// Types.

/**
 * Streams the bytes of one readable descriptor (regular file, pipe, FIFO, ...) to a Consumer, asynchronously
 * in a worker thread, reporting the end of the read session through an async::Future.
 *
 * ### How to use ###
 * Construct it from an open descriptor (or via create() from a path) and a Consumer.  Nothing happens until
 * start_reading().  From then on, as bytes arrive, they are fed to Consumer::consume_bytes() in order.
 * The read session ends when (1) end-of-file is reached; (2) a read error occurs; or (3) you call stop_reading().
 * Then Consumer::consume_end_of_stream() is called, exactly once; then the descriptor is closed.  After that
 * the session-end future is resolved: success in cases 1 and 3; in case 2 failure with the system #Error_code
 * (e.g., `boost::system::errc::is_a_directory`).  Get that future via completed() or as the result of
 * stop_reading().
 *
 * A File_reader reads at most one session.  Once start_reading() has been called, successfully or not, it cannot
 * be called again; create another File_reader.
 *
 * ### Cancellation ###
 * A future returned by completed() can be async::Future::cancel()ed.  Then, if the session is still active, it is
 * stopped as if by stop_reading(); but any error that would report (say, because the session was never started)
 * is not reported.  The canceled future itself becomes canceled; the session-end future it mirrors is not.
 * The future returned by async::Future::cancel() succeeds once the resulting stop is complete, i.e., once
 * end-of-stream has been delivered (assuming reading had started).
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other.  Internally all work happens in one worker
 * thread, W; a public method called from elsewhere executes in W while the caller waits.  The Consumer is invoked
 * from W.  Continuations you attach to futures we return run on whatever engine you attach them with
 * (or use async::Future::wait()).  Public methods may be called from W too, e.g., from a Consumer callback;
 * except the destructor.
 *
 * ### Destruction ###
 * The destructor stops an active session as if by stop_reading(), and the consumer still receives end-of-stream
 * (from the destructor's thread or W) before the destructor returns.  Do not invoke the destructor from W (i.e.,
 * from a Consumer callback).  Futures obtained earlier remain usable; those not yet resolved by then (e.g., if
 * reading never began) are never resolved.
 *
 * ### Error reporting ###
 * Synchronous errors follow the Flow convention: set `*err_code`, or throw `flow::error::Runtime_error` if
 * `err_code` is null.  Asynchronous outcomes go through the futures only.
 */
class File_reader :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`, as returned by create().
  using Ptr = boost::shared_ptr<File_reader>;

  /// Lifecycle state; see state().
  enum class State
  {
    /// start_reading() has not been called.
    S_IDLE,
    /// start_reading() succeeded; the read channel has not yet closed.
    S_READING,
    /// The read channel has closed; end-of-stream has not yet been delivered to the consumer.
    S_DRAINING,
    /// End-of-stream delivered; the session ended cleanly (end-of-file or stop request).
    S_COMPLETED,
    /// End-of-stream delivered; the session ended due to a read error.
    S_FAILED,
    /// start_reading() failed to create the read channel; no I/O ever took place.
    S_FAILED_TO_START
  };

  /// Options; the defaults are typically fine.
  struct Options
  {
    // Constructors/destructor.

    /// Sets the defaults, as documented on each member.
    Options();

    // Data.

    /**
     * Bytes that must be available before they are delivered to the consumer (except at end of session, when
     * whatever remains is delivered).  Must be at least 1, which is the default: deliver whatever arrives ASAP.
     */
    size_t m_low_water;

    /// Bytes to request per read; also the max size of a delivered chunk (unless below #m_low_water).  64Ki.
    size_t m_read_buf_size;
  }; // struct Options

  // Constants.

  /// Default for Options::m_low_water.
  static const size_t S_DEFAULT_LOW_WATER;

  /// Default for Options::m_read_buf_size.
  static const size_t S_DEFAULT_READ_BUF_SIZE;

  // Constructors/destructor.

  /**
   * Constructs the reader over an open descriptor, taking ownership of it.  No I/O occurs.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname, as shown in logs/etc.
   * @param hndl_moved
   *        The descriptor; becomes null().  It will be closed once the session ends, or when `*this` is
   *        destroyed.  If it is null or otherwise invalid, start_reading() will fail.
   * @param consumer
   *        Consumer; must not be null.
   * @param opts
   *        See Options.
   */
  explicit File_reader(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                       util::Native_handle&& hndl_moved, const Consumer_ptr& consumer,
                       const Options& opts = Options());

  /**
   * Opens the file at the given path read-only and constructs a reader over the resulting descriptor as by
   * the constructor.
   *
   * @param logger_ptr
   *        See ctor.
   * @param nickname_str
   *        See ctor.
   * @param path
   *        Path to the file.
   * @param consumer
   *        See ctor.
   * @param opts
   *        See ctor.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_READER_OPEN_FAILED (the system error is logged).
   * @return The reader; or null on error.
   */
  static Ptr create(flow::log::Logger* logger_ptr, util::String_view nickname_str, const fs::path& path,
                    const Consumer_ptr& consumer, const Options& opts = Options(), Error_code* err_code = 0);

  /// See "Destruction" in class doc header.
  ~File_reader();

  // Methods.

  /**
   * Starts the read session.  Success means reading has begun, not that anything has been read.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_READER_ALREADY_STARTED (no effect),
   *        error::Code::S_READER_CHANNEL_CREATION_FAILED (the descriptor could not be set up for async I/O;
   *        the session-end future will never be resolved).
   */
  void start_reading(Error_code* err_code = 0);

  /**
   * Requests that the active read session stop.  The session will end soon (bytes obtained meanwhile are still
   * delivered), and end-of-stream will be delivered exactly once, as usual.  If the session has already ended on its
   * own but stop_reading() was not called before, this is harmless; the returned future then resolves promptly, the same way.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_READER_NOT_STARTED (start_reading() has not succeeded, or stop_reading() has already
   *        been called).
   * @return A future mirroring the session-end future (canceling it affects only that mirror); null on error.
   */
  async::Future stop_reading(Error_code* err_code = 0);

  /**
   * Returns a future mirroring the session-end future; cancel it to stop reading.  See "Cancellation" in class doc
   * header.  Each call returns a distinct future.
   *
   * The cancellation handler runs in thread W.  Hence canceling a still-pending result after `*this` is destroyed
   * has no effect beyond the result itself becoming canceled: the future returned by async::Future::cancel()
   * is never resolved then.
   *
   * @return See above.
   */
  async::Future completed();

  /**
   * Current lifecycle state.  It may change immediately after this returns, unless called from W.
   * @return See above.
   */
  State state() const;

  /**
   * Returns nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Returns options as passed to ctor.
   * @return See above.
   */
  const Options& options() const;

private:
  // Types.

  /// Internally used class containing the implementation; see pImpl idiom.
  class Impl;

  /// Short-hand for `const`-respecting wrapper around File_reader::Impl for the pImpl idiom.
  using Impl_ptr = std::experimental::propagate_const<boost::movelib::unique_ptr<Impl>>;

  // Friends.

  /// Friend of File_reader.
  friend std::ostream& operator<<(std::ostream& os, const File_reader& val);
  /// Friend of File_reader.
  friend std::ostream& operator<<(std::ostream& os, const Impl& val);

  // Data.

  /// The true implementation of this class.  See also our class doc header.
  Impl_ptr m_impl;
}; // class File_reader

// Free functions.

/**
 * Prints string representation of the given File_reader::State to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, File_reader::State val);

} // namespace fdread::reader
