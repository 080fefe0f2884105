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

#include "fdread/async/async_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <ostream>

namespace fdread::async
{

// Types.

/**
 * Read side of a single-assignment asynchronous outcome: it is pending until resolved, exactly once, as
 * succeeded, failed (with an #Error_code), or canceled.  A Future is a light-weight, copyable handle to state
 * shared with its Promise and with any other copies; all operations on it are thread-safe.
 *
 * A default-constructed Future is null(): it refers to no state; calling anything but null() and `operator<<` on it
 * is a contract breach.  fdread APIs return a null Future together with a non-success #Error_code.
 *
 * ### Continuations ###
 * on_done() registers a function invoked with the resolved Future; it is always `post()`ed onto the
 * util::Task_engine given along with it, never invoked synchronously from on_done() or from the resolving call.
 * chain() builds on that: it returns a new Future resolved the same way as the Future that the given function
 * returns.  The engine is held via ref-counted pointer, so it may outlive whoever created it; but if it is stopped
 * and never run again, the functions posted onto it never execute.
 *
 * ### Cancellation ###
 * cancel() resolves a pending Future as canceled (#State::S_CANCELED with error::Code::S_FUTURE_CANCELED) and
 * invokes (via `post()`) every cancellation handler registered on it.  Such handlers are registered on a new
 * Future mirroring an existing one via respond_to_cancellation().  Cancellation does not propagate to the
 * Future from which the canceled one was derived: canceling a mirror or a chain() result leaves the source alone.
 */
class Future
{
public:
  // Types.

  /// Where the outcome is at.
  enum class State
  {
    /// Not yet resolved.
    S_PENDING,
    /// Resolved successfully.
    S_SUCCEEDED,
    /// Resolved with an error.
    S_FAILED,
    /// Canceled before it was otherwise resolved.
    S_CANCELED
  };

  /// Function invoked once `*this` is resolved; its arg is (an equal copy of) `*this`.
  using On_done_func = Function<void (const Future& resolved)>;

  /**
   * Function invoked once `*this` is resolved, returning the Future on which the chain() result shall depend.
   * Returning the arg itself forwards its outcome.
   */
  using Chain_func = Function<Future (const Future& resolved)>;

  /// Function invoked upon cancellation, returning a Future that resolves once it has done its work (null allowed).
  using Cancel_func = Function<Future ()>;

  // Constructors/destructor.

  /// Constructs a null() Future.
  Future();

  // Methods.

  /**
   * Returns a new, already succeeded Future.
   * @return See above.
   */
  static Future make_success();

  /**
   * Returns a new, already failed Future.
   *
   * @param err_code
   *        The (truthy) error.
   * @return See above.
   */
  static Future make_error(const Error_code& err_code);

  /**
   * Returns `true` if and only if `*this` refers to no state.
   * @return See above.
   */
  bool null() const;

  /**
   * Current state; it changes at most once, from #State::S_PENDING.
   * @return See above.
   */
  State state() const;

  /**
   * Returns `state() != State::S_PENDING`.
   * @return See above.
   */
  bool done() const;

  /**
   * The error if `state()` is `S_FAILED` or `S_CANCELED`; otherwise success (falsy).
   * @return See above.
   */
  Error_code error() const;

  /**
   * Arranges for `func(*this)` to be `post()`ed onto `*task_engine` once `*this` is resolved (immediately,
   * if it already is).
   *
   * @param task_engine
   *        Engine on which to invoke `func`.
   * @param func
   *        See above.
   */
  void on_done(const util::Task_engine_ptr& task_engine, On_done_func&& func) const;

  /**
   * Returns a new Future that, once `*this` is resolved and `func(*this)` has run on `*task_engine`, is resolved
   * the same way as the Future `func()` returned.  If `func()` returns a null Future, the result fails with
   * error::Code::S_INTERNAL_ERROR_NULL_FUTURE.
   *
   * @param task_engine
   *        Engine on which to invoke `func`.
   * @param func
   *        See above.
   * @return See above.
   */
  Future chain(const util::Task_engine_ptr& task_engine, Chain_func&& func) const;

  /**
   * Returns a new Future resolved the same way as `*this`, such that if *it* is canceled while pending, `func()`
   * is invoked on `*task_engine`.  `*this` is not affected by canceling the result.
   *
   * @param task_engine
   *        Engine on which to invoke `func`.
   * @param func
   *        See above.
   * @return See above.
   */
  Future respond_to_cancellation(const util::Task_engine_ptr& task_engine, Cancel_func&& func) const;

  /**
   * If pending, resolves `*this` as canceled and invokes registered cancellation handlers; otherwise no-op.
   *
   * @return Future that succeeds once all cancellation handlers have run and the Futures they returned (if any)
   *         have been resolved.  If nothing was pending, or there were no handlers, it is already succeeded.
   *         If a handler's engine is stopped and never run again, that handler never runs, and this Future stays
   *         pending.  (The queued handler does not keep the engine alive.)
   */
  Future cancel() const;

  /// Blocks until done().
  void wait() const;

  /**
   * Blocks until done() or the given time has passed, whichever happens first.
   *
   * @param timeout
   *        Max time to wait.
   * @return done() upon return.
   */
  bool wait(util::Fine_duration timeout) const;

private:
  // Friends.

  /// Promise creates the state and resolves it.
  friend class Promise;

  // Types.

  /// The shared state; defined in the .cpp.
  struct Shared_state;

  /// Short-hand for ref-counted pointer to Shared_state.
  using Shared_state_ptr = boost::shared_ptr<Shared_state>;

  // Constructors.

  /**
   * Constructs handle to the given state.
   * @param state
   *        The state.
   */
  explicit Future(const Shared_state_ptr& state);

  // Data.

  /// The shared state; null if and only if null().
  Shared_state_ptr m_state;
}; // class Future

/**
 * Write side of a Future: creates the pending state and resolves it exactly once.  Copies of a Promise refer to the
 * same state (so a Promise can be captured into a completion handler by value).  Unlike with `std::promise`,
 * destroying all Promise copies without resolving leaves the Future pending forever; there is no "broken promise."
 */
class Promise
{
public:
  // Constructors/destructor.

  /// Creates a fresh pending state.
  Promise();

  // Methods.

  /**
   * A Future referring to our state.
   * @return See above.
   */
  Future future() const;

  /**
   * Resolves successfully, unless already resolved (including canceled).
   * @return `true` if and only if we resolved it.
   */
  bool set_success();

  /**
   * Resolves with the given error, unless already resolved (including canceled).
   *
   * @param err_code
   *        The (truthy) error.
   * @return `true` if and only if we resolved it.
   */
  bool set_error(const Error_code& err_code);

  /**
   * Resolves the same way as the given resolved Future (`S_CANCELED` included), unless already resolved.
   *
   * @param src
   *        Resolved Future.
   * @return `true` if and only if we resolved it.
   */
  bool set_like(const Future& src);

private:
  // Friends.

  /// Future::respond_to_cancellation() registers cancellation handlers.
  friend class Future;

  // Data.

  /// The state; never null.
  Future::Shared_state_ptr m_state;
}; // class Promise

// Free functions.

/**
 * Prints string representation of the given Future::State to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Future::State val);

/**
 * Prints string representation of the given Future to the given `ostream`.
 *
 * @relatesalso Future
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Future& val);

} // namespace fdread::async
