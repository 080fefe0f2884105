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
#include "fdread/reader/consumers.hpp"
#include <algorithm>

namespace fdread::reader
{

// Consumer implementations.

Consumer::~Consumer() = default;

// Accumulating_consumer implementations.

Accumulating_consumer::Accumulating_consumer() :
  m_n_end_of_stream(0)
{
  // Yay.
}

void Accumulating_consumer::consume_bytes(const util::Blob_const& data)
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  m_data.append(static_cast<const char*>(data.data()), data.size());
  m_chunk_sizes.push_back(data.size());
}

void Accumulating_consumer::consume_end_of_stream()
{
  {
    flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
    ++m_n_end_of_stream;
  }
  m_end_of_stream.set_success(); // No-op after the 1st time.
}

std::string Accumulating_consumer::data() const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  return m_data;
}

std::vector<size_t> Accumulating_consumer::chunk_sizes() const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  return m_chunk_sizes;
}

unsigned int Accumulating_consumer::end_of_stream_count() const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  return m_n_end_of_stream;
}

async::Future Accumulating_consumer::end_of_stream() const
{
  return m_end_of_stream.future();
}

// Line_consumer implementations.

Line_consumer::Line_consumer(On_line_func&& on_line_func) :
  m_on_line_func(std::move(on_line_func))
{
  assert(m_on_line_func);
}

void Line_consumer::consume_bytes(const util::Blob_const& data)
{
  const auto begin = static_cast<const char*>(data.data());
  const auto end = begin + data.size();

  auto line_begin = begin;
  for (auto newline = std::find(line_begin, end, '\n');
       newline != end;
       line_begin = newline + 1, newline = std::find(line_begin, end, '\n'))
  {
    if (m_partial_line.empty())
    {
      m_on_line_func(util::String_view(line_begin, newline - line_begin)); // Skip the copy.
    }
    else
    {
      m_partial_line.append(line_begin, newline);
      m_on_line_func(m_partial_line);
      m_partial_line.clear();
    }
  }

  m_partial_line.append(line_begin, end);
} // Line_consumer::consume_bytes()

void Line_consumer::consume_end_of_stream()
{
  if (!m_partial_line.empty())
  {
    m_on_line_func(m_partial_line);
    m_partial_line.clear();
  }
}

// Composite_consumer implementations.

Composite_consumer::Composite_consumer(std::vector<Consumer_ptr>&& consumers) :
  m_consumers(std::move(consumers))
{
  assert(std::none_of(m_consumers.begin(), m_consumers.end(),
                      [](const Consumer_ptr& consumer) -> bool { return !consumer; }));
}

void Composite_consumer::consume_bytes(const util::Blob_const& data)
{
  for (const auto& consumer : m_consumers)
  {
    consumer->consume_bytes(data);
  }
}

void Composite_consumer::consume_end_of_stream()
{
  for (const auto& consumer : m_consumers)
  {
    consumer->consume_end_of_stream();
  }
}

} // namespace fdread::reader
