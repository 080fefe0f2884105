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
#include "fdread/reader/detail/file_reader_impl.hpp"
#include "fdread/error.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/make_shared.hpp>

namespace fdread::reader
{

// Implementations.

File_reader::Impl::Impl(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                        util::Native_handle&& hndl_moved, const Consumer_ptr& consumer, const Options& opts) :
  flow::log::Log_context(logger_ptr, Log_component::S_READER),
  m_nickname(nickname_str),
  m_opts(opts),
  m_consumer(consumer),
  m_hndl(boost::make_shared<util::Native_handle>(std::move(hndl_moved))),
  m_worker(boost::movelib::make_unique<flow::async::Single_thread_task_loop>
             (get_logger(),
              // (Linux) OS thread name will truncate this to 15 chars; it's a decent attempt.
              flow::util::ostream_op_string("Rdr-", m_nickname))),
  m_start_attempted(false),
  m_start_failed(false)
{
  using flow::async::reset_this_thread_pinning;
  using async::Future;

  assert(m_consumer && "Disallowed per contract.");
  assert((m_opts.m_low_water >= 1) && "Disallowed per contract.");
  assert((m_opts.m_read_buf_size >= 1) && "Disallowed per contract.");

  m_worker->start(reset_this_thread_pinning); // Don't inherit any strange core-affinity!  Worker must float free.

  /* Attach the one and only end-of-session continuation.  It captures no `this`: see class doc header.
   * It runs in W (or in the dtor's finisher thread, after W is gone). */
  m_session_ended = m_reading_ended.future().chain
                      (m_worker->task_engine(),
                       [logger_ptr = get_logger(), nickname = m_nickname, consumer = m_consumer, hndl = m_hndl]
                         (const Future& reading_ended) -> Future
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_READER);

    FLOW_LOG_INFO("File_reader [" << nickname << "]: Read channel closed with outcome [" << reading_ended << "].  "
                  "Delivering end-of-stream to consumer; then closing [" << *hndl << "].");
    consumer->consume_end_of_stream();

    Error_code sys_err_code;
    hndl->close(&sys_err_code);
    if (sys_err_code)
    {
      // Nothing to do about it; the session outcome is determined by the read itself.
      FLOW_LOG_WARNING("File_reader [" << nickname << "]: Closing descriptor failed; details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }

    return reading_ended;
  });

  FLOW_LOG_INFO("File_reader [" << *this << "]: Created over [" << *m_hndl << "]; low-water mark "
                "[" << m_opts.m_low_water << "] bytes; read buffer size [" << m_opts.m_read_buf_size << "] bytes.");
} // File_reader::Impl::Impl()

File_reader::Impl::~Impl()
{
  using flow::async::Single_thread_task_loop;
  using flow::async::Synchronicity;
  using flow::async::reset_thread_pinning;
  using flow::util::ostream_op_string;

  // We are in thread U.  By contract in doc header, they must not call us from thread W.
  assert(!m_worker->in_thread());

  FLOW_LOG_INFO("File_reader [" << *this << "]: Shutting down.  An active read session (if any) will be stopped; "
                "worker thread will be joined.");

  /* Stop the session while W still runs.  The channel's closing (canceled read completion, on-close handler,
   * end-of-session continuation) may complete in W right away; or it may still be queued in the engine when we
   * stop() it below, in which case the finisher thread will run it. */
  m_worker->post([&]()
  {
    if (m_channel)
    {
      m_channel->close_now();
      m_channel.reset();
    }
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  /* This (1) stop()s the Task_engine thus possibly
   * preventing any more handlers from running at all (any handler possibly running now is the last one to run); (2)
   * at that point Task_engine::run() exits, hence thread W exits; (3) joins thread W (waits for it to
   * exit); (4) returns.  That's a lot, but it's non-blocking. */
  m_worker->stop();
  // Thread W is (synchronously!) no more.

  /* Run whatever handlers are ready but were not executed before stop(), as-if from thread W: restart() undoes the
   * stop(); poll() synchronously runs ready handlers, including those posted by them, but does not wait for
   * async work (there is none left: the channel, if any, is closing).  This is what delivers end-of-stream if the
   * session was still active.  Since the thread owning the m_* resources is finished, we can access them from the
   * new thread without issue. */
  FLOW_LOG_INFO("File_reader [" << *this << "]: Continuing shutdown.  Next we will run pending handlers from some "
                "other thread.  In this user thread we will await those handlers' completion and then return.");

  Single_thread_task_loop one_thread(get_logger(), ostream_op_string("RdrDeinit-", nickname()));
  one_thread.start([&]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity.  Float free.

    FLOW_LOG_INFO("File_reader [" << *this << "]: "
                  "In transient finisher thread: Shall run all pending internal handlers (typically none).");

    const auto task_engine = m_worker->task_engine();
    task_engine->restart();
    const auto count = task_engine->poll();
    if (count != 0)
    {
      FLOW_LOG_INFO("File_reader [" << *this << "]: "
                    "In transient finisher thread: Ran [" << count << "] internal handlers after all.");
    }
    task_engine->stop();

    FLOW_LOG_INFO("Transient finisher exiting.");
  }); // one_thread.start()
  // Here thread exits/joins synchronously.
} // File_reader::Impl::~Impl()

void File_reader::Impl::start_reading(Error_code* err_code)
{
  using flow::async::Synchronicity;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start_reading(actual_err_code); },
         err_code, "File_reader::start_reading()"))
  {
    return;
  }
  // else

  if (m_worker->in_thread())
  {
    start_reading_now(err_code);
    return;
  }
  // else
  m_worker->post([&]() { start_reading_now(err_code); },
                 Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
}

void File_reader::Impl::start_reading_now(Error_code* err_code)
{
  assert(err_code);

  if (m_start_attempted)
  {
    FLOW_LOG_WARNING("File_reader [" << *this << "]: Cannot start reading: reading was already started; "
                     "only one read session per reader is allowed.  Ignoring.");
    *err_code = error::Code::S_READER_ALREADY_STARTED;
    return;
  }
  // else

  m_start_attempted = true;

  FLOW_LOG_INFO("File_reader [" << *this << "]: Starting to read from [" << *m_hndl << "].");

  Error_code sys_err_code;
  m_channel = Read_channel::create(get_logger(), m_nickname, m_worker->task_engine().get(),
                                   m_hndl->native_handle(), m_opts.m_low_water, m_opts.m_read_buf_size,
                                   [this](const Error_code& channel_err_code)
                                     { on_channel_close(channel_err_code); },
                                   &sys_err_code);
  if (!m_channel)
  {
    FLOW_LOG_WARNING("File_reader [" << *this << "]: Cannot start reading: async I/O channel could not be created "
                     "over [" << *m_hndl << "] due to [" << sys_err_code << "] [" << sys_err_code.message() << "].  "
                     "This reader can no longer read.");
    m_start_failed = true;
    *err_code = error::Code::S_READER_CHANNEL_CREATION_FAILED;
    return;
  }
  // else

  m_channel->read([this](bool done, const util::Blob_const& data, const Error_code&)
                    { on_channel_data(done, data); });
  err_code->clear();
} // File_reader::Impl::start_reading_now()

void File_reader::Impl::on_channel_data(bool done, const util::Blob_const& data)
{
  FLOW_LOG_TRACE("File_reader [" << *this << "]: Got chunk of size [" << data.size() << "]; "
                 "last chunk? = [" << done << "].");

  // `done` is informational; the on-close handler is what drives the end of session.
  if (data.size() != 0)
  {
    m_consumer->consume_bytes(data);
  }
}

void File_reader::Impl::on_channel_close(const Error_code& err_code)
{
  if (err_code)
  {
    FLOW_LOG_WARNING("File_reader [" << *this << "]: Read channel closed with error "
                     "[" << err_code << "] [" << err_code.message() << "]; session will end in failure.");
    m_reading_ended.set_error(err_code);
  }
  else
  {
    FLOW_LOG_INFO("File_reader [" << *this << "]: Read channel closed cleanly.");
    m_reading_ended.set_success();
  }
}

async::Future File_reader::Impl::stop_reading(Error_code* err_code)
{
  using flow::async::Synchronicity;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(async::Future, stop_reading, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_worker->in_thread())
  {
    return stop_reading_now(err_code);
  }
  // else

  async::Future result;
  m_worker->post([&]() { result = stop_reading_now(err_code); },
                 Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
  return result;
}

async::Future File_reader::Impl::stop_reading_now(Error_code* err_code)
{
  assert(err_code);

  if (!m_channel)
  {
    FLOW_LOG_WARNING("File_reader [" << *this << "]: Cannot stop reading: not reading; start_reading() must "
                     "succeed first (and stop_reading() can be called only once).  Ignoring.");
    *err_code = error::Code::S_READER_NOT_STARTED;
    return async::Future();
  }
  // else

  FLOW_LOG_INFO("File_reader [" << *this << "]: Stopping reading (channel already closed? = "
                "[" << m_channel->closed() << "]).");

  m_channel->close_now(); // No-op if it has closed on its own already.
  m_channel.reset(); // It will live on until its read (if any) completes.

  err_code->clear();

  /* Never hand out m_session_ended itself: cancel() on it would resolve it as canceled, hiding the true outcome from
   * every other observer.  A mirror's cancel() affects only the mirror; and the stop is already under way. */
  return m_session_ended.respond_to_cancellation(m_worker->task_engine(),
                                                 []() -> async::Future { return async::Future::make_success(); });
}

async::Future File_reader::Impl::completed()
{
  using async::Future;

  /* The handler runs in W (or the dtor's finisher thread); so it must use the *_now() variant, not post-and-await.
   * Capturing `this` is safe: once our dtor has run, the engine is stopped for good, so the handler never executes.
   * A cancel() after that merely queues it there; cancel()'s result then stays pending (documented in the header),
   * and the queued handler does not keep the engine alive. */
  return m_session_ended.respond_to_cancellation(m_worker->task_engine(), [this]() -> Future
  {
    FLOW_LOG_INFO("File_reader [" << *this << "]: A completion future was canceled; stopping reading if active.");

    Error_code err_code;
    const auto stopped = stop_reading_now(&err_code);
    if (err_code)
    {
      FLOW_LOG_TRACE("File_reader [" << *this << "]: Stop on cancellation was not possible "
                     "([" << err_code << "] [" << err_code.message() << "]); ignoring that.");
      return Future::make_success();
    }
    // else
    return stopped;
  });
} // File_reader::Impl::completed()

File_reader::State File_reader::Impl::state() const
{
  using flow::async::Synchronicity;

  if (m_worker->in_thread())
  {
    return state_now();
  }
  // else

  auto result = State::S_IDLE; // Will be overwritten.
  m_worker->post([&]() { result = state_now(); }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
  return result;
}

File_reader::State File_reader::Impl::state_now() const
{
  using async::Future;

  if (!m_start_attempted)
  {
    return State::S_IDLE;
  }
  // else
  if (m_start_failed)
  {
    return State::S_FAILED_TO_START;
  }
  // else

  const auto reading_ended = m_reading_ended.future();
  if (!reading_ended.done())
  {
    return State::S_READING;
  }
  // else
  if (!m_hndl->null())
  {
    return State::S_DRAINING; // End-of-session continuation has not yet run.
  }
  // else

  return (reading_ended.state() == Future::State::S_SUCCEEDED) ? State::S_COMPLETED : State::S_FAILED;
}

const std::string& File_reader::Impl::nickname() const
{
  return m_nickname;
}

const File_reader::Options& File_reader::Impl::options() const
{
  return m_opts;
}

std::ostream& operator<<(std::ostream& os, const File_reader::Impl& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace fdread::reader
