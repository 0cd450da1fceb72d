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
#include "gelf/message.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>

namespace gelf
{

// Message implementations.

Message::Message() :
  m_fields(Fields::object())
{
  // Yay.
}

Message::Message(Fields fields) :
  m_fields(std::move(fields))
{
  // Yay.
}

Message& Message::set_field(const std::string& key, Fields value)
{
  m_fields[key] = std::move(value);
  return *this;
}

Message::Fields& Message::fields()
{
  return m_fields;
}

const Message::Fields& Message::fields() const
{
  return m_fields;
}

const std::optional<Message::Time_point>& Message::timestamp() const
{
  return m_timestamp;
}

void Message::set_timestamp(const Time_point& time_pt)
{
  m_timestamp = time_pt;
}

// Free function implementations.

double to_gelf_timestamp(const Message::Time_point& time_pt)
{
  using boost::chrono::duration_cast;
  using boost::chrono::milliseconds;

  return double(duration_cast<milliseconds>(time_pt.time_since_epoch()).count()) / 1000.0;
}

std::string serialize_message(flow::log::Logger* logger_ptr, const Message& msg, const std::string& host,
                              bool fill_defaults, Error_code* err_code)
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, serialize_message, logger_ptr, flow::util::bind_ns::cref(msg),
                                     flow::util::bind_ns::cref(host), fill_defaults, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CLIENT);

  const auto& fields = msg.fields();
  if (!(fields.is_object() || fields.is_null()))
  {
    FLOW_LOG_WARNING("Message fields are a JSON [" << fields.type_name() << "], not an object; cannot encode "
                     "as GELF.");
    *err_code = error::Code::S_MESSAGE_SERIALIZATION_FAILED;
    return string();
  }
  // else

  auto out = fields.is_null() ? Message::Fields::object() : fields;
  if (fill_defaults)
  {
    if (!out.contains("version"))
    {
      out["version"] = "1.1";
    }
    if (!out.contains("host"))
    {
      out["host"] = host;
    }
  }
  if (msg.timestamp())
  {
    out["timestamp"] = to_gelf_timestamp(*msg.timestamp());
  }

  string json_str;
  try
  {
    json_str = out.dump();
  }
  catch (const nlohmann::json::type_error& exc)
  {
    // dump() throws this on invalid UTF-8 in a string.  Nothing else in there can throw it.
    FLOW_LOG_WARNING("Message could not be encoded as JSON: [" << exc.what() << "].");
    *err_code = error::Code::S_MESSAGE_SERIALIZATION_FAILED;
    return string();
  }

  FLOW_LOG_DATA("Message encoded as: [" << json_str << "].");
  err_code->clear();
  return json_str;
} // serialize_message()

std::ostream& operator<<(std::ostream& os, const Message& val)
{
  using nlohmann::json;

  // Replace bad UTF-8 (with U+FFFD) instead of throwing: this is for logging.
  os << "fields[" << val.fields().dump(-1, ' ', false, json::error_handler_t::replace) << "] timestamp[";
  if (val.timestamp())
  {
    os << std::fixed << to_gelf_timestamp(*val.timestamp()) << std::defaultfloat;
  }
  else
  {
    os << "unset";
  }
  return os << ']';
}

} // namespace gelf
