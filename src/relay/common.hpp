/* Flow-Relay
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

/* flow/common.hpp must come first: it #undef-s and #define-s FLOW_LOG_CFG_COMPONENT_ENUM_* for its own
 * component enum, and relay/detail/common.hpp then re-points them at ours. */
#include <flow/util/util.hpp>

#include "relay/detail/common.hpp"
#include <boost/asio.hpp>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any relay/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-Relay project: a reverse-tunnel TCP relay.  A backend process (the *daemon*),
 * which cannot itself be reached by clients, connects *outbound* to the relay over one long-lived *control channel*
 * and registers a named service.  The relay then opens a public listening port on the daemon's behalf, advertises
 * it over the control channel, and -- for each client that connects there -- coordinates with the daemon, again over
 * the control channel, so that the daemon connects back on a fresh single-use port.  The two resulting sockets
 * (client, daemon) are then handed to a data-relay worker which pipes bytes between them.
 *
 * Modules overview
 * ----------------
 * Bottom-up:
 *   -# relay::util: Basic building blocks.  relay::util::Native_handle is a trivial wrapper around a socket FD
 *      and is how a connected socket is handed from one thread (and boost.asio `io_context`) to another.
 *      - Dependents: everything else.
 *   -# relay::transport: The wire level.  TCP socket aliases and helpers, including `host:port` formatting and
 *      parsing (relay::transport::asio_tcp_stream_socket); the project's error code set
 *      (relay::transport::error::Code); the line-oriented control-channel exchange (transport::Control_channel);
 *      and the byte-pumping data relay (transport::Data_relay, transport::Data_relay_engine).
 *      - Dependents: relay::session.
 *   -# relay::session: The coordination protocol proper.  session::Service is the Control-Channel Session plus
 *      the Public Listener for one registered service; session::Relay_server is the bootstrap that accepts
 *      daemons' control connections and makes a Service for each.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-Relay requires Flow and Boost.  `flow::log` is the logging system; `flow::Error_code` (boost.system) and
 * Flow's error-reporting conventions are used for errors; `flow::async::Single_thread_task_loop` supplies the
 * worker threads; boost.asio supplies the sockets.  Identifier style (`snake_case`, `S_` constants, `m_` members)
 * and doc style are inherited from Flow.
 *
 * ### Error reporting ###
 * See `namespace flow` doc header's "Error reporting" section; it applies verbatim.  In short: an API that can fail
 * takes a trailing `Error_code* err_code = 0`; if null, failure throws `flow::error::Runtime_error`.
 *
 * ### Logging ###
 * Every object that logs takes a `flow::log::Logger*` (null means: log nowhere) and logs under a
 * relay::Log_component.
 */
namespace relay
{

// Types.  They're outside of `namespace ::relay::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef RELAY_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-Relay internal
 * logging.  The members are generated via `flow::log` macro magic from `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; find the actual members in log_component_enum_declare.macros.hpp.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in relay::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_RELAY_LOG_COMPONENT_NAME_MAP;

#endif // RELAY_DOXYGEN_ONLY

} // namespace relay
