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

/* flow/common.hpp #defines FLOW_LOG_CFG_COMPONENT_ENUM_* for Flow's own use; fdread/detail/common.hpp
 * re-#defines them for ours.  Hence the order. */
#include <flow/util/util.hpp>

#include "fdread/detail/common.hpp"
#include <boost/filesystem.hpp>

/* We build in C++17 mode ourselves, and the header-inlined stuff (templates, constexprs) requires it of the
 * `#include`ing translation unit as well. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any fdread/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the fdread project: a small library that turns a readable OS descriptor (regular file,
 * pipe, FIFO) into a push-based stream of byte chunks delivered to a user-supplied consumer, together with
 * a future-like handle signaling when the read session has ended.
 *
 * Modules, bottom-up:
 *   - *fdread::util*: Basic building blocks.  Most notably fdread::util::Native_handle, an owning wrapper
 *     around a descriptor (FD).
 *   - *fdread::async*: A single-assignment, value-less future/promise pair (async::Future, async::Promise) whose
 *     continuations are posted onto a boost.asio `Task_engine`; it also supports cancellation with a registered
 *     cancellation handler.  This is how reader outcomes are reported.
 *   - *fdread::reader*: The point of the project.  reader::File_reader owns a descriptor, reads it asynchronously
 *     from a worker thread, and feeds reader::Consumer.  A few concrete consumers are supplied too.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * fdread requires Flow and Boost.  `flow::log` is the logging system, and `flow::Error_code` (a/k/a
 * `boost::system::error_code`) with the Flow error-reporting convention is used for errors: a method taking
 * `Error_code* err_code` sets `*err_code` on failure if `err_code` is not null; if it is null it throws
 * `flow::error::Runtime_error` instead.  Pass `Logger == null` anywhere to log nowhere.
 */
namespace fdread
{

// Types.  They're outside of `namespace ::fdread::util` for brevity due to their frequent use.

/**
 * @namespace fdread::fs
 * @brief Short-hand for `filesystem` namespace.  We use `boost::filesystem` which is rock-solid.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef FDREAD_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by fdread internal logging.
 * The user specifies it, rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The actual members are generated by `flow::log` macro magic; find them in
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in fdread::Log_component to its
 * string representation as used in log output and verbosity config.  If the `enum` member is called `S_SOME_NAME`,
 * its string counterpart is `"SOME_NAME"` (optionally prefixed as supplied to
 * `flow::log::Config::init_component_names()`).
 */
extern const boost::unordered_multimap<Log_component, std::string> S_FDREAD_LOG_COMPONENT_NAME_MAP;

#endif // FDREAD_DOXYGEN_ONLY

} // namespace fdread
