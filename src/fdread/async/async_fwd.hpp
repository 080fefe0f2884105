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

#include "fdread/util/util_fwd.hpp"

/**
 * fdread's minimal future/promise facility: a value-less, single-assignment outcome (success, error, or
 * canceled) with continuations posted onto a boost.asio event loop and with cancellation propagated to
 * registered handlers.  fdread::reader reports read-session outcomes through it.
 */
namespace fdread::async
{

// Types.

// Find doc headers near the bodies of these compound types.

class Future;
class Promise;

} // namespace fdread::async
