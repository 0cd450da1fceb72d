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
#include <boost/chrono/system_clocks.hpp>
#include <boost/shared_ptr.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace gelf
{

// Types.

/**
 * One log record to be delivered: a set of caller-supplied fields (a JSON object) plus a creation timestamp.
 * Client::queue_msg() assigns the current time to the timestamp if it is not set; once queued, the record is
 * immutable (the client holds it via #Const_ptr).
 *
 * The fields are conventionally those of GELF 1.1 (`short_message`, `full_message`, `level`, additional fields
 * prefixed by `_`, ...), but Message does not validate them; whatever is in the object is serialized as-is.
 * See serialize_message() for what is added on the way out.
 */
class Message
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to mutable Message.  Client::queue_msg() takes this.
  using Ptr = boost::shared_ptr<Message>;

  /// Short-hand for ref-counted pointer to immutable Message.  The client holds queued messages this way.
  using Const_ptr = boost::shared_ptr<const Message>;

  /// Type of the fields: a JSON value, expected to be an object.
  using Fields = nlohmann::json;

  /// Clock the timestamp is from: wall time.
  using Clock = boost::chrono::system_clock;

  /// Short-hand for the timestamp type.
  using Time_point = Clock::time_point;

  // Constructors/destructor.

  /// Constructs message with no fields (an empty JSON object) and no timestamp.
  Message();

  /**
   * Constructs message with the given fields and no timestamp.
   *
   * @param fields
   *        Fields; should be a JSON object, or serialize_message() will fail.
   */
  explicit Message(Fields fields);

  // Methods.

  /**
   * Sets field `key` to `value`, replacing any previous value.  Convenience for `fields()[key] = value`.
   *
   * @param key
   *        Field name.
   * @param value
   *        Field value.
   * @return `*this`.
   */
  Message& set_field(const std::string& key, Fields value);

  /**
   * Mutable access to the fields.
   *
   * @return See above.
   */
  Fields& fields();

  /**
   * Immutable access to the fields.
   *
   * @return See above.
   */
  const Fields& fields() const;

  /**
   * The timestamp, if set.
   *
   * @return See above.
   */
  const std::optional<Time_point>& timestamp() const;

  /**
   * Sets the timestamp.
   *
   * @param time_pt
   *        The time.
   */
  void set_timestamp(const Time_point& time_pt);

private:
  // Data.

  /// See fields().
  Fields m_fields;

  /// See timestamp().
  std::optional<Time_point> m_timestamp;
}; // class Message

// Free functions.

/**
 * Encodes the message as GELF JSON text: the message's fields, plus
 *   - `"timestamp"`: the message timestamp as seconds since the Unix epoch, with millisecond precision (a JSON number
 *     like `1700000000.123`), if the timestamp is set; it replaces a caller-supplied `timestamp` field;
 *   - if `fill_defaults`: `"version":"1.1"` and `"host":<host>`, unless the caller supplied these fields.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param msg
 *        The message.
 * @param host
 *        Value for `host` if filled in.
 * @param fill_defaults
 *        Whether to fill in `version` and `host`.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_MESSAGE_SERIALIZATION_FAILED (fields not a JSON object; or a string is not valid UTF-8).
 * @return The JSON text; or empty string on error.
 */
std::string serialize_message(flow::log::Logger* logger_ptr, const Message& msg, const std::string& host,
                              bool fill_defaults, Error_code* err_code = 0);

/**
 * Converts a timestamp to the GELF representation: seconds since the Unix epoch, with millisecond precision.
 *
 * @param time_pt
 *        The time.
 * @return See above.
 */
double to_gelf_timestamp(const Message::Time_point& time_pt);

/**
 * Prints string representation of the given Message to the given `ostream`: its fields as JSON (invalid UTF-8
 * replaced) and timestamp.  For logging.
 *
 * @relatesalso Message
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Message& val);

} // namespace gelf
