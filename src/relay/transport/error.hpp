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

#include "relay/common.hpp"

/**
 * Namespace containing the relay::transport module's extension of boost.system error conventions, so that Flow-Relay
 * APIs can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * Flow-Relay might report are system errors and would not draw from this set of codes/messages but rather
 * from `boost::asio::error` or `boost::system::errc` (possibly others); e.g., a refused connection or a reset
 * data socket.  relay::session reports its errors from this same set too.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace relay::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by relay::transport and relay::session functions/methods
 * *outside of* system-triggered errors such as `boost::asio::error::connection_refused`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's
 * Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 *
 * Add new values at the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Control channel was closed by the opposing side (end-of-stream) before a complete line arrived.
  S_CONTROL_CHANNEL_CLOSED = S_CODE_LOWEST_INT_VALUE,

  /// Incoming control-channel line exceeded the configured maximum line size; the channel can no longer be trusted.
  S_CONTROL_LINE_TOO_LONG,

  /// Daemon registration failed: the service-name line was missing or empty; the service cannot operate.
  S_REGISTRATION_NO_SERVICE_NAME,

  /// Daemon did not acknowledge a per-request callback signal; the client request is dropped.
  S_REQUEST_NOT_ACKNOWLEDGED,

  /// A (usually user-specified) timeout period has elapsed before an operation completed.
  S_TIMEOUT,

  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT,

  /// User called an API in an object state that does not allow it (e.g., `start()` twice).
  S_INVALID_STATE,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// Internal error: A control-channel exchange was attempted while another one in the same direction was in progress.
  S_CONTROL_CHANNEL_BUSY,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  Or, slightly more in English,
 * it glues the (completely general) #Error_code to the (Flow-Relay-specific) error code set
 * relay::transport::error::Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If none is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "TIMEOUT" (or "timeout" or "Timeout" or...) for Code::S_TIMEOUT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  E.g., Code::S_TIMEOUT => `"TIMEOUT"`.  When printing an #Error_code storing
 * a Code, continue to do the standard thing: output the #Error_code itself plus its `.message()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace relay::transport::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system uses this as authorization to make `enum` `Code` convertible
 * to `Error_code`.  The non-specialized version of this sets `value` to `false`, so that random arbitary `enum`s
 * can't just be used as `Error_code`s.
 */
template<>
struct is_error_code_enum<::relay::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
