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

#include "fdread/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <vector>

/**
 * Miscellaneous building blocks used throughout fdread.  fdread::util::Native_handle, the owning descriptor wrapper,
 * is the most notable.
 */
namespace fdread::util
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename T, typename Allocator = std::allocator<T>>
class Default_init_allocator;

class Native_handle;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/// Short-hand for the boost.asio event loop (`io_context`) on which async work and continuations execute.
using Task_engine = flow::util::Task_engine;

/**
 * Short-hand for ref-counted pointer to a #Task_engine.  Objects that must be able to post work onto
 * an engine, possibly after the engine's original owner is gone, hold one of these.
 */
using Task_engine_ptr = flow::async::Task_engine_ptr;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stylistic short-hand, as it better suits how we use this type.
 * Notably a reader::Consumer receives each chunk of bytes as one of these; the pointed-to memory is valid only
 * for the duration of that call.
 */
using Blob_const = boost::asio::const_buffer;

/// Byte buffer used for reading into; it is not zero-filled on allocation or resize.
using Read_buffer = std::vector<uint8_t, Default_init_allocator<uint8_t>>;

// Free functions.

/**
 * Opens the file at the given path for reading (read-only, close-on-exec) and returns the owning
 * handle to the resulting descriptor.  On failure logs a WARNING with the path and the system error, and
 * returns a null handle.
 *
 * @param logger_ptr
 *        Logger to use for logging (null allowed).
 * @param path
 *        Path to open.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system errors from `open()`: e.g., `boost::system::errc::no_such_file_or_directory`.
 * @return Open handle; or null handle on error.
 */
Native_handle open_for_reading(flow::log::Logger* logger_ptr, const fs::path& path, Error_code* err_code = 0);

} // namespace fdread::util
