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
#include <boost/shared_ptr.hpp>

/**
 * The reading module: reader::File_reader streams a descriptor's bytes to a reader::Consumer.
 * reader::Accumulating_consumer, reader::Line_consumer, and reader::Composite_consumer are ready-made consumers.
 */
namespace fdread::reader
{

// Types.

// Find doc headers near the bodies of these compound types.

class Consumer;
class Accumulating_consumer;
class Line_consumer;
class Composite_consumer;
class File_reader;
class Read_channel;

/// Short-hand for ref-counted pointer to a Consumer; a File_reader shares its consumer with the user.
using Consumer_ptr = boost::shared_ptr<Consumer>;

// Free functions.

/**
 * Prints string representation of the given File_reader to the given `ostream`.
 *
 * @relatesalso File_reader
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const File_reader& val);

} // namespace fdread::reader
