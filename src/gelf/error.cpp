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
#include "gelf/error.hpp"
#include "gelf/util/util_fwd.hpp"

namespace gelf::error
{

// Types.

/**
 * boost.system category to which every error::Code belongs.  Any #Error_code holding a Code refers to the single
 * instance, Category::S_CATEGORY; that is how `ec.message()` and `ec.category().name()` find the Flow-GELF strings.
 * Only this .cpp sees the class; the rest of the world gets at it through make_error_code().
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// Singleton instance.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Category name, as shown by `ostream << Error_code` for our codes.
   *
   * @return `"gelf"`.
   */
  const char* name() const noexcept override;

  /**
   * Human-readable text for a #Code (given as `int`).
   *
   * @param val
   *        A #Code cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Symbolic name of a #Code without the `S_` prefix (e.g., `"URI_MALFORMED"`); used by both `<<` and `>>`.
   *
   * @param code
   *        A Code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Only S_CATEGORY is ever constructed.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "gelf";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments in violation of the API contract.";
  case Code::S_HOSTNAME_UNAVAILABLE:
    return "Could not determine local host name, or it was empty; it is required for the GELF host field.";
  case Code::S_INVALID_FRAME_SIZE:
    return "Maximum frame size must exceed the GELF chunk header size, so that every chunk can carry payload.";
  case Code::S_URI_MALFORMED:
    return "Dial URI could not be parsed: expected form is scheme://host[:port][?compress=...].";
  case Code::S_URI_UNSUPPORTED_SCHEME:
    return "Dial URI scheme is not supported: only udp and tcp are.";
  case Code::S_ALREADY_CONNECTED:
    return "Client already has an active connection; close it before dialing again.";
  case Code::S_NOT_CONNECTED:
    return "Operation requires an open connection, but it has been closed (or was never opened).";
  case Code::S_CHUNK_COUNT_EXCEEDED:
    return "Message too large: it would need more GELF chunks than the protocol maximum of 128.";
  case Code::S_MESSAGE_SERIALIZATION_FAILED:
    return "Message could not be serialized to JSON (for example a field holds invalid UTF-8).";
  case Code::S_COMPRESSION_FAILED:
    return "zlib reported an error while compressing a message.";

  case Code::S_END_SENTINEL:
    assert(false && "END_SENTINEL exists for symbolic I/O only; no API emits it.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_HOSTNAME_UNAVAILABLE:
    return "HOSTNAME_UNAVAILABLE";
  case Code::S_INVALID_FRAME_SIZE:
    return "INVALID_FRAME_SIZE";
  case Code::S_URI_MALFORMED:
    return "URI_MALFORMED";
  case Code::S_URI_UNSUPPORTED_SCHEME:
    return "URI_UNSUPPORTED_SCHEME";
  case Code::S_ALREADY_CONNECTED:
    return "ALREADY_CONNECTED";
  case Code::S_NOT_CONNECTED:
    return "NOT_CONNECTED";
  case Code::S_CHUNK_COUNT_EXCEEDED:
    return "CHUNK_COUNT_EXCEEDED";
  case Code::S_MESSAGE_SERIALIZATION_FAILED:
    return "MESSAGE_SERIALIZATION_FAILED";
  case Code::S_COMPRESSION_FAILED:
    return "COMPRESSION_FAILED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  // Accepts a symbol (any case) or the integer value; anything unrecognized yields S_END_SENTINEL.
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace gelf::error
