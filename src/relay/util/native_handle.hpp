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

#include <ostream>
#include <flow/common.hpp>

namespace relay::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "Flow-Relay hands sockets between event loops as raw POSIX FDs; build in Linux only.");
#endif

// Types.

/**
 * A monolayer-thin wrapper around a native handle, a/k/a descriptor a/k/a FD; in Flow-Relay always a TCP socket.
 *
 * ### Why it exists ###
 * A boost.asio socket is permanently attached to the `io_context` (a/k/a `Task_engine`) with which it was
 * constructed, and that `io_context` is run by one particular thread.  When a socket must change hands -- e.g., the
 * session::Service accept thread has paired a client socket with a daemon socket, and the pair must now be pumped
 * by the transport::Data_relay_engine thread -- the socket is `release()`d into a Native_handle, the Native_handle
 * is moved across, and the receiving side constructs a new socket around it on its own `io_context`.
 *
 * Moving a Native_handle nullifies the source; copying does not.  Hence: move it, and the "who closes it" question
 * always has exactly one answer.  A Native_handle itself does not close anything in its destructor; whoever holds
 * it last is responsible (see util::close_native_handle()).
 */
struct Native_handle
{
  // Types.

  /// The native handle type.  Much logic relies on this type being light-weight (fast to copy).
  using handle_t = int;

  // Constants.

  /// The value for #m_native_handle such that `null() == true`; else it is `false`.
  static const handle_t S_NULL_HANDLE;

  // Data.

  /// The native handle (possibly equal to #S_NULL_HANDLE), the exact payload of this Native_handle.
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Constructs with given payload; also subsumes no-args construction to mean constructing an object with
   * `null() == true`.
   *
   * @param native_handle
   *        Payload.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Constructs object equal to `src`, while making `src == null()`.
   *
   * @param src
   *        Source object which will be made `null() == true`.
   */
  Native_handle(Native_handle&& src);

  /**
   * Copy constructor.
   * @param src
   *        Source object.
   */
  Native_handle(const Native_handle& src);

  // Methods.

  /**
   * Move assignment; acts similarly to move ctor; but no-op if `*this == src`.
   * @param src
   *        Source object which will be made `null() == true`, unless `*this == src`.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /**
   * Copy assignment; acts similarly to copy ctor.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Native_handle& operator=(const Native_handle& src);

  /**
   * Returns `true` if and only if #m_native_handle equals #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

// Free functions.

/**
 * Returns `true` if and only if the two Native_handle objects are the same underlying handle.
 *
 * @relatesalso Native_handle
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(Native_handle val1, Native_handle val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Native_handle
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(Native_handle val1, Native_handle val2);

/**
 * Prints string representation of the given Native_handle to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace relay::util
