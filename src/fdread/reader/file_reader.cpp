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

// Include File_reader::Impl class body to complete that type and enable pImpl forwarding.
#include "fdread/reader/detail/file_reader_impl.hpp"
#include "fdread/error.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/make_shared.hpp>

namespace fdread::reader
{

// Initializers.

const size_t File_reader::S_DEFAULT_LOW_WATER = 1;
const size_t File_reader::S_DEFAULT_READ_BUF_SIZE = 64 * 1024;

// File_reader::Options implementations.

File_reader::Options::Options() :
  m_low_water(S_DEFAULT_LOW_WATER),
  m_read_buf_size(S_DEFAULT_READ_BUF_SIZE)
{
  // Yay.
}

// Implementations (strict pImpl-idiom style).

File_reader::File_reader(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                         util::Native_handle&& hndl_moved, const Consumer_ptr& consumer, const Options& opts) :
  m_impl(boost::movelib::make_unique<Impl>(logger_ptr, nickname_str, std::move(hndl_moved), consumer, opts))
{
  // Yay.
}

File_reader::Ptr File_reader::create(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                     const fs::path& path, const Consumer_ptr& consumer, const Options& opts,
                                     Error_code* err_code) // Static.
{
  {
    Ptr reader;
    if (flow::error::exec_void_and_throw_on_error
          ([&](Error_code* actual_err_code)
             { reader = create(logger_ptr, nickname_str, path, consumer, opts, actual_err_code); },
           err_code, "File_reader::create()"))
    {
      return reader;
    }
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_READER);

  Error_code sys_err_code;
  auto hndl = util::open_for_reading(logger_ptr, path, &sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("File_reader [" << nickname_str << "]: Failed to open file for reading: [" << path << "]: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].  No reader created.");
    *err_code = error::Code::S_READER_OPEN_FAILED;
    return Ptr();
  }
  // else

  err_code->clear();
  return boost::make_shared<File_reader>(logger_ptr, nickname_str, std::move(hndl), consumer, opts);
} // File_reader::create()

File_reader::~File_reader() = default; // It's only explicitly defined to formally document it.

// The rest is strict forwarding to m_impl.

void File_reader::start_reading(Error_code* err_code)
{
  m_impl->start_reading(err_code);
}

async::Future File_reader::stop_reading(Error_code* err_code)
{
  return m_impl->stop_reading(err_code);
}

async::Future File_reader::completed()
{
  return m_impl->completed();
}

File_reader::State File_reader::state() const
{
  return m_impl->state();
}

const std::string& File_reader::nickname() const
{
  return m_impl->nickname();
}

const File_reader::Options& File_reader::options() const
{
  return m_impl->options();
}

std::ostream& operator<<(std::ostream& os, const File_reader& val)
{
  return os << *val.m_impl;
}

std::ostream& operator<<(std::ostream& os, File_reader::State val)
{
  switch (val)
  {
  case File_reader::State::S_IDLE:
    return os << "IDLE";
  case File_reader::State::S_READING:
    return os << "READING";
  case File_reader::State::S_DRAINING:
    return os << "DRAINING";
  case File_reader::State::S_COMPLETED:
    return os << "COMPLETED";
  case File_reader::State::S_FAILED:
    return os << "FAILED";
  case File_reader::State::S_FAILED_TO_START:
    return os << "FAILED_TO_START";
  }
  assert(false);
  return os;
}

} // namespace fdread::reader
