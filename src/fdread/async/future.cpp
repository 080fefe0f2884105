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
#include "fdread/async/future.hpp"
#include "fdread/error.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/make_shared.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <utility>
#include <vector>

namespace fdread::async
{

// Types.

/**
 * The state shared among a Promise and the Future copies referring to it.  All access is under #m_mutex;
 * but no user function is ever invoked under it (they are `post()`ed).
 */
struct Future::Shared_state :
  public boost::enable_shared_from_this<Shared_state>,
  private boost::noncopyable
{
  // Types.

  /// A registered on-done function and the engine on which to invoke it.
  using Listener = std::pair<util::Task_engine_ptr, On_done_func>;

  /// A registered cancellation handler and the engine on which to invoke it.
  using Cancel_handler = std::pair<util::Task_engine_ptr, Cancel_func>;

  // Methods.

  /**
   * Resolves as specified, unless already resolved; then `post()`s all listeners, forgetting them.
   * Cancellation handlers are forgotten too; if `state` is `S_CANCELED` and `cancel_handlers` is not null
   * they are moved out into `*cancel_handlers` instead.
   *
   * @param state
   *        New state; not `S_PENDING`.
   * @param err_code
   *        Error to store.
   * @param cancel_handlers
   *        See above.
   * @return `true` if and only if we resolved it.
   */
  bool resolve(State state, const Error_code& err_code, std::vector<Cancel_handler>* cancel_handlers);

  // Data.

  /// Protects the rest of the data.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Notified when #m_state leaves `S_PENDING`.
  boost::condition_variable m_done_cond;

  /// See Future::state().
  State m_state = State::S_PENDING;

  /// See Future::error().
  Error_code m_err_code;

  /// Registered via on_done() while pending; emptied once resolved.
  std::vector<Listener> m_listeners;

  /// Registered via respond_to_cancellation() while pending; emptied once resolved.
  std::vector<Cancel_handler> m_cancel_handlers;
}; // struct Future::Shared_state

namespace
{

/// Counts down cancellation handlers outstanding in one Future::cancel() call.
struct Cancel_countdown
{
  /// Resolved when #m_n_left reaches zero.
  Promise m_all_done;
  /// Cancellation handlers (and their returned futures) not yet done.
  std::atomic<size_t> m_n_left;
};

} // namespace (anon)

// Future::Shared_state implementations.

bool Future::Shared_state::resolve(State state, const Error_code& err_code,
                                   std::vector<Cancel_handler>* cancel_handlers)
{
  using boost::asio::post;

  assert(state != State::S_PENDING);

  std::vector<Listener> listeners;
  {
    flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);

    if (m_state != State::S_PENDING)
    {
      return false;
    }
    // else

    m_state = state;
    m_err_code = err_code;
    listeners.swap(m_listeners);
    if (cancel_handlers && (state == State::S_CANCELED))
    {
      cancel_handlers->swap(m_cancel_handlers);
    }
    else
    {
      m_cancel_handlers.clear(); // Release whatever they captured.
    }
    m_done_cond.notify_all();
  } // lock

  const Future resolved(shared_from_this());
  for (auto& listener : listeners)
  {
    post(*listener.first, [func = std::move(listener.second), resolved]() { func(resolved); });
  }
  return true;
} // Future::Shared_state::resolve()

// Future implementations.

Future::Future() = default;

Future::Future(const Shared_state_ptr& state) :
  m_state(state)
{
  // Yay.
}

Future Future::make_success() // Static.
{
  Promise promise;
  promise.set_success();
  return promise.future();
}

Future Future::make_error(const Error_code& err_code) // Static.
{
  Promise promise;
  promise.set_error(err_code);
  return promise.future();
}

bool Future::null() const
{
  return !m_state;
}

Future::State Future::state() const
{
  assert((!null()) && "Disallowed per contract.");

  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_state->m_mutex);
  return m_state->m_state;
}

bool Future::done() const
{
  return state() != State::S_PENDING;
}

Error_code Future::error() const
{
  assert((!null()) && "Disallowed per contract.");

  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_state->m_mutex);
  return m_state->m_err_code;
}

void Future::on_done(const util::Task_engine_ptr& task_engine, On_done_func&& func) const
{
  using boost::asio::post;

  assert((!null()) && "Disallowed per contract.");
  assert(task_engine);

  {
    flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_state->m_mutex);
    if (m_state->m_state == State::S_PENDING)
    {
      m_state->m_listeners.emplace_back(task_engine, std::move(func));
      return;
    }
  } // lock
  // else: Already resolved.  Still never invoke synchronously.

  post(*task_engine, [func = std::move(func), resolved = *this]() { func(resolved); });
}

Future Future::chain(const util::Task_engine_ptr& task_engine, Chain_func&& func) const
{
  Promise result;
  on_done(task_engine, [result, task_engine, func = std::move(func)](const Future& resolved) mutable
  {
    const auto next = func(resolved);
    if (next.null())
    {
      result.set_error(error::Code::S_INTERNAL_ERROR_NULL_FUTURE);
      return;
    }
    // else
    if (next.done())
    {
      result.set_like(next); // Save a trip through the engine.
      return;
    }
    // else

    next.on_done(task_engine, [result](const Future& next_resolved) mutable { result.set_like(next_resolved); });
  });
  return result.future();
} // Future::chain()

Future Future::respond_to_cancellation(const util::Task_engine_ptr& task_engine, Cancel_func&& func) const
{
  assert(task_engine);

  Promise mirror;
  {
    flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(mirror.m_state->m_mutex);
    mirror.m_state->m_cancel_handlers.emplace_back(task_engine, std::move(func));
  }

  on_done(task_engine, [mirror](const Future& resolved) mutable { mirror.set_like(resolved); });
  return mirror.future();
}

Future Future::cancel() const
{
  using boost::asio::post;
  using boost::make_shared;

  assert((!null()) && "Disallowed per contract.");

  std::vector<Shared_state::Cancel_handler> handlers;
  if ((!m_state->resolve(State::S_CANCELED, error::Code::S_FUTURE_CANCELED, &handlers)) || handlers.empty())
  {
    return make_success();
  }
  // else

  const auto countdown = make_shared<Cancel_countdown>();
  countdown->m_n_left = handlers.size();
  const auto count_one = [countdown]()
  {
    if (--countdown->m_n_left == 0)
    {
      countdown->m_all_done.set_success();
    }
  };

  for (auto& handler : handlers)
  {
    /* The task, queued inside the engine, must not own the engine: if the engine is stopped for good, that would be
     * a cycle, and neither would ever be freed. */
    const boost::weak_ptr<util::Task_engine> task_engine_observer(handler.first);
    post(*handler.first, [task_engine_observer, func = std::move(handler.second), count_one]()
    {
      const auto task_engine = task_engine_observer.lock();
      if (!task_engine)
      {
        count_one(); // Engine being destroyed under us; nowhere to await the handler's Future.
        return;
      }
      // else

      const auto handler_done = func();
      if (handler_done.null())
      {
        count_one();
        return;
      }
      // else
      handler_done.on_done(task_engine, [count_one](const Future&) { count_one(); });
    });
  }

  return countdown->m_all_done.future();
} // Future::cancel()

void Future::wait() const
{
  assert((!null()) && "Disallowed per contract.");

  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_state->m_mutex);
  m_state->m_done_cond.wait(lock, [&]() -> bool { return m_state->m_state != State::S_PENDING; });
}

bool Future::wait(util::Fine_duration timeout) const
{
  assert((!null()) && "Disallowed per contract.");

  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_state->m_mutex);
  return m_state->m_done_cond.wait_for(lock, timeout,
                                       [&]() -> bool { return m_state->m_state != State::S_PENDING; });
}

// Promise implementations.

Promise::Promise() :
  m_state(boost::make_shared<Future::Shared_state>())
{
  // Yay.
}

Future Promise::future() const
{
  return Future(m_state);
}

bool Promise::set_success()
{
  return m_state->resolve(Future::State::S_SUCCEEDED, Error_code(), nullptr);
}

bool Promise::set_error(const Error_code& err_code)
{
  assert(err_code && "Use set_success() for success.");
  return m_state->resolve(Future::State::S_FAILED, err_code, nullptr);
}

bool Promise::set_like(const Future& src)
{
  assert(src.done());

  // Note: S_CANCELED src is mirrored as S_CANCELED; our cancellation handlers, if any, are dropped, not run.
  return m_state->resolve(src.state(), src.error(), nullptr);
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, Future::State val)
{
  switch (val)
  {
  case Future::State::S_PENDING:
    return os << "PENDING";
  case Future::State::S_SUCCEEDED:
    return os << "SUCCEEDED";
  case Future::State::S_FAILED:
    return os << "FAILED";
  case Future::State::S_CANCELED:
    return os << "CANCELED";
  }
  assert(false);
  return os;
}

std::ostream& operator<<(std::ostream& os, const Future& val)
{
  if (val.null())
  {
    return os << "future[NULL]";
  }
  // else

  const auto state = val.state();
  os << "future[" << state;
  if ((state == Future::State::S_FAILED) || (state == Future::State::S_CANCELED))
  {
    const auto err_code = val.error();
    os << ": " << err_code << " [" << err_code.message() << ']';
  }
  return os << ']';
}

} // namespace fdread::async
