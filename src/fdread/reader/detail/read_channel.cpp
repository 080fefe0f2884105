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
#include "fdread/reader/detail/read_channel.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <fcntl.h>

namespace fdread::reader
{

// Implementations.

Read_channel::Read_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           util::Task_engine* task_engine, size_t low_water, size_t read_buf_size,
                           On_close_func&& on_close_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_READER),
  m_nickname(nickname_str),
  m_peer(*task_engine),
  m_low_water(low_water),
  m_buf(std::max(read_buf_size, low_water)), // Not zero-filled.
  m_n_pending(0),
  m_on_close_func(std::move(on_close_func)),
  m_read_in_progress(false),
  m_stop_requested(false),
  m_closed(false),
  m_restore_blocking(false)
{
  assert(m_low_water >= 1);
  assert(m_on_close_func);
}

Read_channel::Ptr Read_channel::create(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                       util::Task_engine* task_engine, util::Native_handle::handle_t native_handle,
                                       size_t low_water, size_t read_buf_size,
                                       On_close_func&& on_close_func, Error_code* err_code) // Static.
{
  assert(err_code);

  Ptr channel(new Read_channel(logger_ptr, nickname_str, task_engine, low_water, read_buf_size,
                               std::move(on_close_func)));
  FLOW_LOG_SET_CONTEXT(channel->get_logger(), channel->get_log_component());

  // If F_GETFL fails then so will assign() (bad descriptor).
  const auto flags = ::fcntl(native_handle, F_GETFL);
  channel->m_restore_blocking = (flags != -1) && ((flags & O_NONBLOCK) == 0);

  // If assign() fails it does not take the descriptor; so nothing to undo (and dtor will find !is_open()).
  Error_code sys_err_code;
  channel->m_peer.assign(native_handle, sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Read_channel [" << *channel << "]: Could not create async I/O channel over "
                     "native handle [" << native_handle << "]; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return Ptr();
  }
  // else

  FLOW_LOG_INFO("Read_channel [" << *channel << "]: Created over native handle [" << native_handle << "]; "
                "low-water mark [" << channel->m_low_water << "] bytes; buffer size "
                "[" << channel->m_buf.size() << "] bytes.");
  err_code->clear();
  return channel;
} // Read_channel::create()

Read_channel::~Read_channel()
{
  release_descriptor(); // Not our descriptor to close.
  FLOW_LOG_TRACE("Read_channel [" << *this << "]: Destroyed.");
}

void Read_channel::read(On_data_func&& on_data_func)
{
  assert((!m_on_data_func) && "read() must be called at most once.");
  assert(on_data_func);

  if (m_closed)
  {
    FLOW_LOG_TRACE("Read_channel [" << *this << "]: Asked to begin reading, but already closed.  Ignoring.");
    return;
  }
  // else

  m_on_data_func = std::move(on_data_func);
  FLOW_LOG_TRACE("Read_channel [" << *this << "]: Beginning to read.");
  async_read_more();
}

void Read_channel::async_read_more()
{
  using boost::asio::buffer;

  assert(m_n_pending < m_buf.size());
  assert(!m_read_in_progress);

  m_read_in_progress = true;
  m_peer.async_read_some(buffer(m_buf.data() + m_n_pending, m_buf.size() - m_n_pending),
                         [this, self = shared_from_this()](const Error_code& sys_err_code, size_t n_rcvd)
  {
    on_read_some(sys_err_code, n_rcvd);
  });
}

void Read_channel::on_read_some(const Error_code& sys_err_code, size_t n_rcvd)
{
  m_read_in_progress = false;
  m_n_pending += n_rcvd;

  FLOW_LOG_TRACE("Read_channel [" << *this << "]: Read [" << n_rcvd << "] bytes; [" << m_n_pending << "] bytes "
                 "pending delivery; result [" << sys_err_code << "] [" << sys_err_code.message() << "].");

  if (sys_err_code)
  {
    Error_code err_code; // Success unless truly an error.
    if (sys_err_code == boost::asio::error::eof)
    {
      FLOW_LOG_INFO("Read_channel [" << *this << "]: End-of-file reached.");
    }
    else if ((sys_err_code == boost::asio::error::operation_aborted) && m_stop_requested)
    {
      FLOW_LOG_INFO("Read_channel [" << *this << "]: Read canceled on request.");
    }
    else
    {
      FLOW_LOG_WARNING("Read_channel [" << *this << "]: Read failed; details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      err_code = sys_err_code;
    }

    deliver(true, err_code);
    finish(err_code);
    return;
  }
  // else

  if (m_n_pending >= m_low_water)
  {
    deliver(false, Error_code());
  }

  // (The on-data function may have called close_now(); hence check now.)
  if (m_stop_requested)
  {
    FLOW_LOG_INFO("Read_channel [" << *this << "]: Stop requested while read was completing; not reading further.");
    deliver(true, Error_code());
    finish(Error_code());
    return;
  }
  // else

  async_read_more();
} // Read_channel::on_read_some()

void Read_channel::deliver(bool done, const Error_code& err_code)
{
  using util::Blob_const;

  const auto n_pending = m_n_pending;
  m_n_pending = 0;
  m_on_data_func(done, Blob_const(m_buf.data(), n_pending), err_code);
}

void Read_channel::close_now()
{
  if (m_closed || m_stop_requested)
  {
    FLOW_LOG_TRACE("Read_channel [" << *this << "]: Close requested, but already closed or closing.  Ignoring.");
    return;
  }
  // else

  m_stop_requested = true;

  if (m_read_in_progress)
  {
    FLOW_LOG_INFO("Read_channel [" << *this << "]: Close requested; canceling outstanding read.");

    /* If the read has in fact already completed (its handler just hasn't run yet), this does nothing; and the
     * handler will see m_stop_requested.  Either way on_read_some() will finish(). */
    Error_code sys_err_code;
    m_peer.cancel(sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Read_channel [" << *this << "]: Cancel failed (the outstanding read will still end "
                       "the session once it completes); details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
    return;
  }
  // else: Reading never began (or we are inside on_read_some(), which checks m_stop_requested itself).

  if (!m_on_data_func)
  {
    FLOW_LOG_INFO("Read_channel [" << *this << "]: Close requested before reading began; closing now.");
    finish(Error_code());
  }
} // Read_channel::close_now()

void Read_channel::release_descriptor()
{
  if (!m_peer.is_open())
  {
    return;
  }
  // else

  if (m_restore_blocking)
  {
    Error_code sys_err_code;
    m_peer.native_non_blocking(false, sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Read_channel [" << *this << "]: Could not restore blocking mode of native handle "
                       "[" << m_peer.native_handle() << "]; details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
  }

  m_peer.release();
}

void Read_channel::finish(const Error_code& err_code)
{
  assert(!m_closed);
  m_closed = true;

  release_descriptor();

  FLOW_LOG_INFO("Read_channel [" << *this << "]: Closed with result "
                "[" << err_code << "] [" << err_code.message() << "]; invoking on-close handler.");

  m_on_data_func = On_data_func();
  const auto on_close_func = std::move(m_on_close_func);
  m_on_close_func = On_close_func();
  on_close_func(err_code);
} // Read_channel::finish()

bool Read_channel::closed() const
{
  return m_closed;
}

const std::string& Read_channel::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Read_channel& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace fdread::reader
