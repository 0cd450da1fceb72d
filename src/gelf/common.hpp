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

/* flow/common.hpp needs to #undef a couple things before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*);
 * so it must come ahead of our own detail/common.hpp. */
#include <flow/util/util.hpp>

#include "gelf/detail/common.hpp"

/* The APIs and header-inlined stuff (templates, constexprs) require C++17 or newer; and that applies to the
 * linking user's `#include`ing .cpp file(s) too.  Therefore enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any gelf/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-GELF project: a library/API in modern C++17 that delivers structured log records
 * to a remote GELF (Graylog Extended Log Format) log-aggregation endpoint, asynchronously, over UDP or TCP.
 *
 * From the user's perspective the namespace consists of:
 *   - Symbols directly in `gelf`: gelf::Client (the facade), gelf::Client_config, gelf::Message, and the most
 *     basic aliases (such as gelf::Error_code).
 *     - In particular this includes `enum class` gelf::Log_component which defines the set of possible
 *       `flow::log::Component` values logged from within all modules of Flow-GELF.
 *   - Sub-namespaces:
 *     - *gelf::transport*: everything between a serialized message and the wire.  The GELF chunk encoder
 *       (transport::Chunk_encoder), the pooled zlib/gzip compressors (transport::Compressor_pools), the connected
 *       socket (transport::Asio_socket_sink), and parsing of the dial URI (transport::parse_dial_uri()).
 *     - *gelf::util*: small concurrency building blocks (a bounded channel, a generic object pool, and the
 *       request/acknowledge worker-control handshake used to drain workers on shutdown).
 *     - *gelf::error*: the boost.system error code set for Flow-GELF-specific failures.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-GELF requires Flow and Boost, both internally and in its APIs.  `flow::log` is the assumed logging system;
 * `flow::Error_code` and related conventions are used for error reporting.  In addition zlib does the compression,
 * and nlohmann_json does the JSON encoding of each message.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow: a fallible API takes
 * a trailing `Error_code* err_code` argument defaulting to null; if null, failure is reported by throwing
 * `flow::error::Runtime_error`; otherwise `*err_code` is set (to falsy on success).
 *
 * ### Logging ###
 * Pass a `flow::log::Logger` into the various APIs in order to enable logging; null means log nowhere.
 */
namespace gelf
{

// Types.  They're outside of `namespace ::gelf::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef GELF_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-GELF internal
 * logging.  The actual members are generated by `flow::log` macro magic from `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see `log_component_enum_declare.macros.hpp`.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in gelf::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_GELF_LOG_COMPONENT_NAME_MAP;

#endif // GELF_DOXYGEN_ONLY

} // namespace gelf
