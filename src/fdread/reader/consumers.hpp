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
#include <flow/util/util.hpp>
#include <string>
#include <vector>

namespace fdread::reader
{

// Types.

/**
 * Consumer that stores everything it is given, for later inspection from any thread.  Handy for reading a whole
 * file into memory; and in tests.  All methods are thread-safe.
 */
class Accumulating_consumer :
  public Consumer
{
public:
  // Constructors/destructor.

  /// Constructs empty.
  Accumulating_consumer();

  // Methods.

  /**
   * Implements Consumer API: appends the bytes.
   * @param data
   *        See Consumer.
   */
  void consume_bytes(const util::Blob_const& data) override;

  /// Implements Consumer API: counts it and resolves end_of_stream() (the first time).
  void consume_end_of_stream() override;

  /**
   * Copy of all bytes received so far, concatenated.
   * @return See above.
   */
  std::string data() const;

  /**
   * Size of each chunk received so far, in order.
   * @return See above.
   */
  std::vector<size_t> chunk_sizes() const;

  /**
   * How many times consume_end_of_stream() has been called.
   * @return See above.
   */
  unsigned int end_of_stream_count() const;

  /**
   * Future that succeeds when consume_end_of_stream() is first called.
   * @return See above.
   */
  async::Future end_of_stream() const;

private:
  // Data.

  /// Protects the rest of the data.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// See data().
  std::string m_data;

  /// See chunk_sizes().
  std::vector<size_t> m_chunk_sizes;

  /// See end_of_stream_count().
  unsigned int m_n_end_of_stream;

  /// See end_of_stream().
  async::Promise m_end_of_stream;
}; // class Accumulating_consumer

/**
 * Consumer that splits the byte stream into lines, invoking a user function for each.  A line is terminated by
 * `'\n'`, which is not included in what is passed to the function; a final unterminated line is passed at
 * end-of-stream, if not empty.  The function is invoked from the reader's thread W.
 */
class Line_consumer :
  public Consumer
{
public:
  // Types.

  /// Short-hand for the function invoked for each line; the line's memory is valid only for the call's duration.
  using On_line_func = Function<void (util::String_view line)>;

  // Constructors/destructor.

  /**
   * Constructs.
   *
   * @param on_line_func
   *        See On_line_func.
   */
  explicit Line_consumer(On_line_func&& on_line_func);

  // Methods.

  /**
   * Implements Consumer API: emits each completed line.
   * @param data
   *        See Consumer.
   */
  void consume_bytes(const util::Blob_const& data) override;

  /// Implements Consumer API: emits the unterminated tail, if any.
  void consume_end_of_stream() override;

private:
  // Data.

  /// See ctor.
  const On_line_func m_on_line_func;

  /// Bytes since the last `'\n'`.
  std::string m_partial_line;
}; // class Line_consumer

/// Consumer that forwards each event to several other consumers, in the order given.
class Composite_consumer :
  public Consumer
{
public:
  // Constructors/destructor.

  /**
   * Constructs.
   *
   * @param consumers
   *        The consumers to forward to; none may be null.
   */
  explicit Composite_consumer(std::vector<Consumer_ptr>&& consumers);

  // Methods.

  /**
   * Implements Consumer API: forwards to each consumer.
   * @param data
   *        See Consumer.
   */
  void consume_bytes(const util::Blob_const& data) override;

  /// Implements Consumer API: forwards to each consumer.
  void consume_end_of_stream() override;

private:
  // Data.

  /// See ctor.
  const std::vector<Consumer_ptr> m_consumers;
}; // class Composite_consumer

} // namespace fdread::reader
