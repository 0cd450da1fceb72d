/* Flow-GELF: Client
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

#include "gelf/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>
#include <string>
#include <vector>

/**
 * Flow-GELF module containing miscellaneous general-use facilities that are ubiquitously used by ~all Flow-GELF
 * modules and/or do not fit into any other Flow-GELF module.
 *
 * Each symbol therein is typically used by at least 1 other Flow-GELF module; but all public symbols (except ones
 * under a detail/ subdirectory) are intended for use by Flow-GELF user as well.
 */
namespace gelf::util
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Item>
class Bounded_channel;

template<typename Pooled>
class Object_pool;

class Worker_ctl;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stylistic short-hand, as it better suits various APIs that deal in
 * payloads (serialized messages, compressed output, wire frames).  Mutable memory is not needed anywhere in our
 * API, so there is no mutable counterpart.
 */
using Blob_const = boost::asio::const_buffer;

/// Short-hand for a resizable contiguous byte buffer, used to accumulate payloads before they hit the wire.
using Byte_buffer = std::vector<uint8_t>;

// Constants.

/// Empty string, for accessors returning `const std::string&` when there is nothing to return.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Returns `Blob_const` over the given `string`'s bytes.  The result is valid only as long as `str` is alive and
 * not modified.
 *
 * @param str
 *        The string.
 * @return See above.
 */
Blob_const to_blob(const std::string& str);

/**
 * Obtains the local machine's host name, as reported by the OS.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_HOSTNAME_UNAVAILABLE if `gethostname()` fails (the system error is logged) or the
 *        name obtained is empty.
 * @return The host name; or empty string on error.
 */
std::string local_host_name(flow::log::Logger* logger_ptr, Error_code* err_code = 0);

} // namespace gelf::util
