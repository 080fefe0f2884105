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

#include "fdread/test/test_config.hpp"
#include <gtest/gtest.h>
#include <csignal>

int main(int argc, char** argv)
{
  using fdread::test::Test_config;

  ::testing::InitGoogleTest(&argc, argv);

  // Tests write into pipes whose read end may be gone by then; get EPIPE instead of dying.
  std::signal(SIGPIPE, SIG_IGN);

  // Parse the environment now, so a bad value is reported once, up-front.
  Test_config::get_singleton();

  return RUN_ALL_TESTS();
}
