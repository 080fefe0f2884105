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

namespace fdread::reader
{

/**
 * Sink for the bytes of a read session: File_reader feeds each chunk, in order, to consume_bytes(), and then
 * exactly once calls consume_end_of_stream().  Both are invoked from the reader's worker thread (thread W), never
 * concurrently with each other for a given reader.  They should not block for long, as no further reading or
 * other reader work happens meanwhile; and they have no influence on how the reader proceeds.
 *
 * An implementation may be shared by several readers (see Composite_consumer for the opposite); then it will be
 * invoked from each reader's thread, and it must protect itself accordingly (see Accumulating_consumer).
 */
class Consumer
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Consumer();

  // Methods.

  /**
   * Called once per non-empty chunk of bytes read, in arrival order.
   *
   * @param data
   *        The chunk; `data.size() > 0`.  The memory is valid only until this method returns.
   */
  virtual void consume_bytes(const util::Blob_const& data) = 0;

  /**
   * Called exactly once, after the last consume_bytes(), once the read channel has closed (whether due to
   * end-of-file, an error, or a stop request).
   */
  virtual void consume_end_of_stream() = 0;
}; // class Consumer

} // namespace fdread::reader
