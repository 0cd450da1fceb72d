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

/**
 * Namespace containing Flow-GELF's extension of boost.system error conventions, so that its APIs can return
 * codes/messages from within its own new set of error codes/messages.  Note that many errors Flow-GELF might report
 * are system errors and would not draw from this set of codes/messages but rather from `boost::asio::error` or
 * `boost::system::errc` (name resolution, connect, send, and close failures are reported that way).
 *
 */
namespace gelf::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by Flow-GELF functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::connection_refused`.
 * Each converts implicitly to #Error_code (category name `"gelf"`), so the library reports them alongside system and
 * boost.asio errors through the same `Error_code*` out-arg.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message().  This
 * description must be identical to the description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's Category::code_symbol().
 * This string must be identical to the symbol, minus the `S_`; e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 * This enables the consistent and human-friendly serialization `<<` and deserialization `>>` of a Code w/r/t
 * standard streams.
 *
 * If you add a value to this `enum`, add it to the end, but ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// User called an API with 1 or more arguments in violation of the API contract.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Could not determine local host name, or it was empty; it is required for the GELF host field.
  S_HOSTNAME_UNAVAILABLE,

  /// Maximum frame size must exceed the GELF chunk header size, so that every chunk can carry payload.
  S_INVALID_FRAME_SIZE,

  /// Dial URI could not be parsed: expected form is scheme://host[:port][?compress=...].
  S_URI_MALFORMED,

  /// Dial URI scheme is not supported: only udp and tcp are.
  S_URI_UNSUPPORTED_SCHEME,

  /// Client already has an active connection; close it before dialing again.
  S_ALREADY_CONNECTED,

  /// Operation requires an open connection, but it has been closed (or was never opened).
  S_NOT_CONNECTED,

  /// Message too large: it would need more GELF chunks than the protocol maximum of 128.
  S_CHUNK_COUNT_EXCEEDED,

  /// Message could not be serialized to JSON (for example a field holds invalid UTF-8).
  S_MESSAGE_SERIALIZATION_FAILED,

  /// zlib reported an error while compressing a message.
  S_COMPRESSION_FAILED,

  /// Not an error: marks the end of the range and is the `>>` result for unknown input.  No API emits it.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Wraps a Code into an #Error_code of the Flow-GELF category.  boost.system finds this via ADL when converting a
 * Code to #Error_code, which is what makes `*err_code = error::Code::S_URI_MALFORMED` and the like work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes an error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "INVALID_ARGUMENT" (or "invalid_argument" or "Invalid_argument" or...) for Code::S_INVALID_ARGUMENT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes an error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  E.g., Code::S_URI_MALFORMED => `"URI_MALFORMED"`.
 *
 * When printing an #Error_code storing a Code, continue to do the standard thing: output the #Error_code itself
 * (category name `"gelf"` plus numeric value) and its `.message()`.  The present operator is for symbolic
 * [de]serialization, e.g., in tests ("expect CHUNK_COUNT_EXCEEDED").
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace gelf::error

/**
 * Small group of miscellaneous utilities to ease work with boost.system, joining its `boost::system` namespace.
 * It contains only the `is_error_code_enum<>` specialization to properly extend the `boost::system` error-code system.
 */
namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system uses it as authorization to make `enum` `Code` convertible to
 * `Error_code`.  The non-specialized version sets `value` to `false`, so that random arbitary `enum`s can't just be
 * used as `Error_code`s.  This is the offical way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::gelf::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
