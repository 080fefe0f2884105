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

/**
 * Namespace containing fdread's extension of boost.system error conventions, so that its APIs can return
 * codes/messages from within its own set of error codes/messages.  Many errors fdread reports are system errors
 * and do not draw from this set but rather from `boost::asio::error` or `boost::system::errc`: notably a read
 * session that ends due to an I/O error reports the system #Error_code itself (its `.value()` being the
 * platform error number) through the session-end future.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace fdread::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by fdread functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::bad_descriptor`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_READER_NOT_STARTED => `"READER_NOT_STARTED"`.  This enables the consistent and human-friendly
 * serialization `<<` and deserialization `>>` of a Code w/r/t standard streams.
 *
 * Add new values to the end, but ahead of Code::S_END_SENTINEL.  Do not delete deprecated ones.
 *
 * Errors that indicate apparent logic bugs should be prefixed with `S_INTERNAL_ERROR_`, and their messages
 * should also indicate "Internal error: ".  This mirrors Flow's convention.
 */
enum class Code
{
  /// Reader could not be created: the file at the given path could not be opened for reading.
  S_READER_OPEN_FAILED = S_CODE_LOWEST_INT_VALUE,

  /// Reader cannot start reading: a read session has already been started on it.
  S_READER_ALREADY_STARTED,

  /// Reader cannot stop reading: no read session is active; one must start reading first.
  S_READER_NOT_STARTED,

  /**
   * Reader cannot start reading: the asynchronous I/O channel over the descriptor could not be created;
   * the reader can no longer be used to read.
   */
  S_READER_CHANNEL_CREATION_FAILED,

  /// The future was canceled before it was resolved.
  S_FUTURE_CANCELED,

  /// Internal error: A future continuation returned a null future instead of a future to await.
  S_INTERNAL_ERROR_NULL_FUTURE,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  It glues the
 * (completely general) #Error_code to the fdread-specific error code set, so that one can implicitly convert
 * from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes an error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "READER_NOT_STARTED" (or "reader_not_started" or...) for Code::S_READER_NOT_STARTED.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes an error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator: e.g., Code::S_READER_NOT_STARTED => `"READER_NOT_STARTED"`.  When printing an #Error_code
 * storing a Code, continue to output the #Error_code itself plus its `.message()`; this operator exists
 * for symbolic [de]serialization, e.g., in test scenarios.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace fdread::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.
 * This is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::fdread::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
