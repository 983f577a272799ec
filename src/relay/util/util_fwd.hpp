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

#include "relay/util/native_handle.hpp"
#include "relay/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>

/**
 * Flow-Relay module containing miscellaneous general-use facilities used by ~all other Flow-Relay modules.
 *
 * relay::util::Native_handle is the thing to know here: it is how an open socket leaves one boost.asio
 * `io_context` (and thread) and enters another, e.g., when the session::Service hands a freshly paired
 * (client, daemon) socket pair to the transport::Data_relay_engine.
 */
namespace relay::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for boost.asio event loop (a/k/a `io_context`) as named by Flow.
using Task_engine = flow::util::Task_engine;

/// Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
using Blob_const = boost::asio::const_buffer;

/// Short-hand for a mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
using Blob_mutable = boost::asio::mutable_buffer;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

/**
 * A #Fine_duration value, namely zero, used in all `*_timeout` knobs throughout Flow-Relay to mean "no deadline:
 * wait as long as it takes."
 */
extern const Fine_duration NO_TIMEOUT;

// Free functions.

/**
 * Returns `true` if and only if the given `*_timeout` knob value specifies an actual deadline (i.e., it is not
 * #NO_TIMEOUT and not negative).
 *
 * @param timeout
 *        The knob value.
 * @return See above.
 */
bool timeout_enabled(Fine_duration timeout);

/**
 * Closes the given native handle (`::close()`), if not `null()`, and nullifies it.  Failure to close is logged
 * as a WARNING and otherwise ignored: closing is best-effort everywhere in Flow-Relay.
 *
 * @param logger_ptr
 *        Logger to use for logging (WARNING on error only).
 * @param hndl
 *        The handle; becomes `null()` upon return.
 */
void close_native_handle(flow::log::Logger* logger_ptr, Native_handle* hndl);

} // namespace relay::util
