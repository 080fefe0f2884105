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

#include "fdread/reader/file_reader.hpp"
#include "fdread/reader/consumers.hpp"
#include "fdread/error.hpp"
#include "fdread/test/test_common_util.hpp"
#include "fdread/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/make_shared.hpp>
#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

namespace fdread::reader::test
{

namespace
{

using fdread::test::Test_logger;
using fdread::test::Temp_file;
using fdread::test::get_test_name;
using fdread::test::make_pipe;
using fdread::test::write_all;
using async::Future;
using State = File_reader::State;

const util::Fine_duration S_TIMEOUT = boost::chrono::seconds(5);
const util::Fine_duration S_SHORT_WAIT = boost::chrono::milliseconds(100);

/// Consumer that asks its reader to stop upon the first chunk; and records like Accumulating_consumer.
class Stopping_consumer : public Accumulating_consumer
{
public:
  void consume_bytes(const util::Blob_const& data) override
  {
    Accumulating_consumer::consume_bytes(data);
    if (m_reader && (!m_stop_requested))
    {
      m_stop_requested = true;
      m_reader->stop_reading(&m_stop_err_code);
    }
  }

  /// Set before start_reading().
  File_reader* m_reader = nullptr;
  /// Whether stop_reading() was called.
  bool m_stop_requested = false;
  /// What stop_reading() emitted.
  Error_code m_stop_err_code;
};

/// Consumer whose end-of-stream handling waits until the test opens the gate; and records like Accumulating_consumer.
class Gated_consumer : public Accumulating_consumer
{
public:
  void consume_end_of_stream() override
  {
    m_entered.set_success();
    m_gate.future().wait(S_TIMEOUT);
    Accumulating_consumer::consume_end_of_stream();
  }

  /// Resolved once consume_end_of_stream() is entered.
  async::Promise m_entered;
  /// consume_end_of_stream() proceeds once this is resolved (or after a long timeout).
  async::Promise m_gate;
};

} // namespace (anon)

/// Tests reading a small regular file to its end.
TEST(File_reader, Read_file)
{
  Test_logger logger;
  const Temp_file file("hello");
  const auto consumer = boost::make_shared<Accumulating_consumer>();

  Error_code err_code;
  const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer,
                                          File_reader::Options(), &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_TRUE(reader);
  EXPECT_EQ(reader->nickname(), get_test_name());
  EXPECT_EQ(reader->options().m_low_water, File_reader::S_DEFAULT_LOW_WATER);
  EXPECT_EQ(reader->state(), State::S_IDLE);

  const auto completed = reader->completed();
  EXPECT_FALSE(completed.wait(S_SHORT_WAIT)) << "Nothing should happen until start_reading().";
  EXPECT_EQ(consumer->end_of_stream_count(), 0u);

  reader->start_reading(&err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(completed.wait(S_TIMEOUT));
  EXPECT_EQ(completed.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(consumer->data(), "hello");
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
  EXPECT_EQ(reader->state(), State::S_COMPLETED);

  // A completed() obtained after the end is resolved the same way.
  const auto completed_later = reader->completed();
  ASSERT_TRUE(completed_later.wait(S_TIMEOUT));
  EXPECT_EQ(completed_later.state(), Future::State::S_SUCCEEDED);
}

/// Tests an empty file: end-of-stream, but no bytes.
TEST(File_reader, Empty_file)
{
  Test_logger logger;
  const Temp_file file("");
  const auto consumer = boost::make_shared<Accumulating_consumer>();

  const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer);
  reader->start_reading();
  ASSERT_TRUE(consumer->end_of_stream().wait(S_TIMEOUT));
  ASSERT_TRUE(reader->completed().wait(S_TIMEOUT));
  EXPECT_TRUE(consumer->chunk_sizes().empty());
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
}

/// Tests a file larger than the read buffer, and the low-water mark.
TEST(File_reader, Large_file_and_low_water)
{
  Test_logger logger;

  std::string contents(1000 * 1000 + 7, '\0');
  std::mt19937 gen(42);
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto& c : contents)
  {
    c = char(dist(gen));
  }
  const Temp_file file(contents);

  {
    const auto consumer = boost::make_shared<Accumulating_consumer>();
    const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer);
    reader->start_reading();
    ASSERT_TRUE(reader->completed().wait(S_TIMEOUT));
    EXPECT_EQ(consumer->data(), contents);
    EXPECT_GT(consumer->chunk_sizes().size(), 1u);
    for (const auto size : consumer->chunk_sizes())
    {
      EXPECT_LE(size, File_reader::S_DEFAULT_READ_BUF_SIZE);
    }
  }

  File_reader::Options opts;
  opts.m_low_water = 1000;
  opts.m_read_buf_size = 10; // Raised to the low-water mark.
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer, opts);
  reader->start_reading();
  ASSERT_TRUE(reader->completed().wait(S_TIMEOUT));
  EXPECT_EQ(consumer->data(), contents);
  const auto sizes = consumer->chunk_sizes();
  ASSERT_FALSE(sizes.empty());
  for (size_t idx = 0; idx != sizes.size() - 1; ++idx)
  {
    EXPECT_GE(sizes[idx], opts.m_low_water);
  }
  EXPECT_EQ(sizes.back(), size_t(7)) << "Only the final chunk may fall short of the low-water mark.";
}

/// Tests streaming a pipe: chunks arrive as written; end-of-file ends the session.
TEST(File_reader, Read_pipe)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Accumulating_consumer>();

  File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
  EXPECT_TRUE(pipe.m_read_end.null());
  reader.start_reading();
  EXPECT_EQ(reader.state(), State::S_READING);

  write_all(pipe.m_write_end, "abc");
  const auto deadline = flow::Fine_clock::now() + S_TIMEOUT;
  while ((consumer->data().size() < 3) && (flow::Fine_clock::now() < deadline))
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(consumer->data(), "abc");
  EXPECT_EQ(consumer->end_of_stream_count(), 0u);

  write_all(pipe.m_write_end, "def");
  pipe.m_write_end.close();
  ASSERT_TRUE(reader.completed().wait(S_TIMEOUT));
  EXPECT_EQ(consumer->data(), "abcdef");
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
  EXPECT_EQ(reader.state(), State::S_COMPLETED);
}

/// Tests start/stop misuse and stopping after the session ended on its own.
TEST(File_reader, Start_stop_errors)
{
  Test_logger logger;
  const Temp_file file("xyz");
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer);

  Error_code err_code;
  const auto not_stopped = reader->stop_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_NOT_STARTED);
  EXPECT_TRUE(not_stopped.null());
  EXPECT_THROW(reader->stop_reading(), flow::error::Runtime_error);

  reader->start_reading(&err_code);
  EXPECT_FALSE(err_code);
  reader->start_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_ALREADY_STARTED);
  EXPECT_THROW(reader->start_reading(), flow::error::Runtime_error);

  ASSERT_TRUE(reader->completed().wait(S_TIMEOUT));

  // Stopping after the natural end: harmless; no second end-of-stream.
  const auto stopped = reader->stop_reading(&err_code);
  EXPECT_FALSE(err_code);
  ASSERT_FALSE(stopped.null());
  ASSERT_TRUE(stopped.wait(S_TIMEOUT));
  EXPECT_EQ(stopped.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);

  // But only once.
  reader->stop_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_NOT_STARTED);
  EXPECT_EQ(consumer->data(), "xyz");
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
}

/// Tests stop_reading() on a live pipe.
TEST(File_reader, Stop_reading)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
  reader.start_reading();

  const auto completed = reader.completed();
  EXPECT_FALSE(completed.wait(S_SHORT_WAIT));

  Error_code err_code;
  const auto stopped = reader.stop_reading(&err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(stopped.wait(S_TIMEOUT));
  EXPECT_EQ(stopped.state(), Future::State::S_SUCCEEDED);
  ASSERT_TRUE(completed.wait(S_TIMEOUT));
  EXPECT_EQ(completed.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
  EXPECT_EQ(reader.state(), State::S_COMPLETED);
}

/// Tests that canceling the future returned by stop_reading() does not alter the outcome others observe.
TEST(File_reader, Cancel_stop_future)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Gated_consumer>();
  File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
  reader.start_reading();
  const auto completed_before = reader.completed();

  Error_code err_code;
  const auto stopped = reader.stop_reading(&err_code);
  ASSERT_FALSE(err_code);

  // End-of-stream delivery is held up; so the session has surely not ended yet.
  ASSERT_TRUE(consumer->m_entered.future().wait(S_TIMEOUT));
  EXPECT_EQ(stopped.state(), Future::State::S_PENDING);
  stopped.cancel();
  EXPECT_EQ(stopped.state(), Future::State::S_CANCELED);

  consumer->m_gate.set_success();

  const auto completed_after = reader.completed();
  for (const auto& completed : { completed_before, completed_after })
  {
    ASSERT_TRUE(completed.wait(S_TIMEOUT));
    EXPECT_EQ(completed.state(), Future::State::S_SUCCEEDED);
    EXPECT_FALSE(completed.error());
  }
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
  EXPECT_EQ(reader.state(), State::S_COMPLETED);
}

/// Same but the session fails: the read error still reaches observers.
TEST(File_reader, Cancel_stop_future_error)
{
  Test_logger logger;
  const Temp_file file("");
  const auto consumer = boost::make_shared<Gated_consumer>();
  const auto reader = File_reader::create(&logger, get_test_name(), file.path().parent_path(), consumer);
  ASSERT_TRUE(reader);
  reader->start_reading();

  // The read fails right away; but end-of-stream delivery (hence the end of the session) is held up.
  Error_code err_code;
  const auto stopped = reader->stop_reading(&err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(consumer->m_entered.future().wait(S_TIMEOUT));
  ASSERT_FALSE(stopped.null());
  stopped.cancel();

  consumer->m_gate.set_success();

  const auto completed = reader->completed();
  ASSERT_TRUE(completed.wait(S_TIMEOUT));
  EXPECT_EQ(completed.state(), Future::State::S_FAILED);
  EXPECT_EQ(completed.error(), boost::system::errc::is_a_directory);
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
}

/// Tests that stop_reading() may be invoked from the consumer, i.e., from the worker thread.
TEST(File_reader, Stop_from_consumer)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Stopping_consumer>();
  File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
  consumer->m_reader = &reader;
  reader.start_reading();

  write_all(pipe.m_write_end, "stop");
  ASSERT_TRUE(reader.completed().wait(S_TIMEOUT));
  EXPECT_TRUE(consumer->m_stop_requested);
  EXPECT_FALSE(consumer->m_stop_err_code);
  EXPECT_EQ(consumer->data(), "stop");
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
}

/// Tests canceling the completed() future: it stops the session; the session itself still succeeds.
TEST(File_reader, Cancel_completed)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
  reader.start_reading();
  write_all(pipe.m_write_end, "partial");

  const auto completed = reader.completed();
  const auto other_completed = reader.completed();
  const auto canceled = completed.cancel();
  ASSERT_TRUE(canceled.wait(S_TIMEOUT));
  EXPECT_EQ(canceled.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(completed.state(), Future::State::S_CANCELED);
  EXPECT_EQ(completed.error(), error::Code::S_FUTURE_CANCELED);
  EXPECT_EQ(consumer->end_of_stream_count(), 1u) << "Stop completes only once end-of-stream is delivered.";

  ASSERT_TRUE(other_completed.wait(S_TIMEOUT));
  EXPECT_EQ(other_completed.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(reader.state(), State::S_COMPLETED);

  // Reading has been stopped; so this is as if stop_reading() were called twice.
  Error_code err_code;
  reader.stop_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_NOT_STARTED);

  // Canceling after the end does nothing.
  const auto late = reader.completed();
  ASSERT_TRUE(late.wait(S_TIMEOUT));
  EXPECT_EQ(late.cancel().state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(late.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
}

/// Tests that canceling completed() before start_reading() is harmless.
TEST(File_reader, Cancel_before_start)
{
  Test_logger logger;
  const Temp_file file("abc");
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer);

  const auto canceled = reader->completed().cancel();
  ASSERT_TRUE(canceled.wait(S_TIMEOUT));
  EXPECT_EQ(canceled.state(), Future::State::S_SUCCEEDED);
  EXPECT_EQ(reader->state(), State::S_IDLE);
  EXPECT_EQ(consumer->end_of_stream_count(), 0u);

  reader->start_reading();
  ASSERT_TRUE(reader->completed().wait(S_TIMEOUT));
  EXPECT_EQ(consumer->data(), "abc");
}

/// Tests a read error: the session fails; end-of-stream is still delivered.
TEST(File_reader, Read_error)
{
  Test_logger logger;
  const Temp_file file("");
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  const auto reader = File_reader::create(&logger, get_test_name(), file.path().parent_path(), consumer);
  ASSERT_TRUE(reader);

  Error_code err_code;
  reader->start_reading(&err_code);
  EXPECT_FALSE(err_code);

  const auto completed = reader->completed();
  ASSERT_TRUE(completed.wait(S_TIMEOUT));
  EXPECT_EQ(completed.state(), Future::State::S_FAILED);
  EXPECT_EQ(completed.error(), boost::system::errc::is_a_directory);
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
  EXPECT_TRUE(consumer->chunk_sizes().empty());
  EXPECT_EQ(reader->state(), State::S_FAILED);
}

/// Tests create() on a path that cannot be opened.
TEST(File_reader, Open_failed)
{
  Test_logger logger;
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  const auto path = fs::temp_directory_path() / fs::unique_path("fdread-test-missing-%%%%-%%%%-%%%%");

  Error_code err_code;
  const auto reader = File_reader::create(&logger, get_test_name(), path, consumer, File_reader::Options(),
                                          &err_code);
  EXPECT_FALSE(reader);
  EXPECT_EQ(err_code, error::Code::S_READER_OPEN_FAILED);

  EXPECT_THROW(File_reader::create(&logger, get_test_name(), path, consumer), flow::error::Runtime_error);
}

/// Tests a descriptor that cannot be set up for async I/O.
TEST(File_reader, Channel_creation_failed)
{
  Test_logger logger;
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  File_reader reader(&logger, get_test_name(), util::Native_handle(fdread::test::unused_native_handle()), consumer);

  Error_code err_code;
  reader.start_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_CHANNEL_CREATION_FAILED);
  EXPECT_EQ(reader.state(), State::S_FAILED_TO_START);

  reader.start_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_ALREADY_STARTED);
  reader.stop_reading(&err_code);
  EXPECT_EQ(err_code, error::Code::S_READER_NOT_STARTED);

  EXPECT_FALSE(reader.completed().wait(S_SHORT_WAIT));
  EXPECT_EQ(consumer->end_of_stream_count(), 0u);
}

/// Tests that destroying a reader mid-session delivers end-of-stream exactly once and resolves its futures.
TEST(File_reader, Destroy_while_reading)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Accumulating_consumer>();

  Future completed;
  {
    File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
    reader.start_reading();
    completed = reader.completed();
    write_all(pipe.m_write_end, "bye");
    EXPECT_FALSE(consumer->end_of_stream().wait(S_SHORT_WAIT));
  }

  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
  ASSERT_TRUE(completed.wait(S_TIMEOUT));
  EXPECT_EQ(completed.state(), Future::State::S_SUCCEEDED);
}

/// Tests canceling a completed() future that outlived its (never started) reader: harmless.
TEST(File_reader, Cancel_after_destroy)
{
  Test_logger logger;
  auto pipe = make_pipe();
  const auto consumer = boost::make_shared<Accumulating_consumer>();

  Future completed;
  {
    File_reader reader(&logger, get_test_name(), std::move(pipe.m_read_end), consumer);
    completed = reader.completed();
  }

  const auto cancel_done = completed.cancel();
  EXPECT_EQ(completed.state(), Future::State::S_CANCELED);
  EXPECT_FALSE(cancel_done.wait(S_SHORT_WAIT)) << "The reader's engine is gone; the handler cannot run.";
  EXPECT_EQ(consumer->end_of_stream_count(), 0u);
}

/// Tests that concurrent start_reading() calls start exactly one session.
TEST(File_reader, Concurrent_start)
{
  Test_logger logger;
  const Temp_file file("concurrent");
  const auto consumer = boost::make_shared<Accumulating_consumer>();
  const auto reader = File_reader::create(&logger, get_test_name(), file.path(), consumer);

  std::atomic<int> n_ok(0);
  std::atomic<int> n_already(0);
  std::vector<std::thread> threads;
  for (int idx = 0; idx != 8; ++idx)
  {
    threads.emplace_back([&]()
    {
      Error_code err_code;
      reader->start_reading(&err_code);
      if (!err_code)
      {
        ++n_ok;
      }
      else if (err_code == error::Code::S_READER_ALREADY_STARTED)
      {
        ++n_already;
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_EQ(n_ok.load(), 1);
  EXPECT_EQ(n_already.load(), 7);
  ASSERT_TRUE(reader->completed().wait(S_TIMEOUT));
  EXPECT_EQ(consumer->data(), "concurrent");
  EXPECT_EQ(consumer->end_of_stream_count(), 1u);
}

/// Tests printing.
TEST(File_reader, Print)
{
  EXPECT_EQ(flow::util::ostream_op_string(State::S_DRAINING), "DRAINING");
  EXPECT_EQ(flow::util::ostream_op_string(State::S_FAILED_TO_START), "FAILED_TO_START");

  Test_logger logger;
  const Temp_file file("");
  const auto reader = File_reader::create(&logger, "printable", file.path(),
                                          boost::make_shared<Accumulating_consumer>());
  EXPECT_EQ(flow::util::ostream_op_string(*reader).find("[printable]@"), size_t(0));
}

} // namespace fdread::reader::test
