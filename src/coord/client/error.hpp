/* Coordinator client: Sessions
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

#include "coord/common.hpp"
#include <iosfwd>

/**
 * Namespace containing the coord::client module's extension of boost.system error conventions, so that its API
 * can return codes/messages from within its own new set of error codes/messages.
 *
 * Two families live here.  The first (S_INVALID_ARGUMENT, S_CONN_ID_EXHAUSTED) is emitted by the client core
 * itself.  The rest are *request-level* failures: the coordinator computes them while servicing a request and
 * hands them back (alongside the session) in a Response; the client core merely forwards them to the caller.
 * Both families are recoverable.  Protocol violations (coordinator gone, reply dropped, session leaked) are
 * deliberately absent: those are fatal and never reach the user as an #Error_code.
 */
namespace coord::client::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by coord::client functions/methods, or reported by
 * the coordinator in a Response.
 */
enum class Code
{
  /// User called an API with 1 or more arguments that violate its documented contract.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Connection creation: every connection identifier in the configured range is in use.
  S_CONN_ID_EXHAUSTED,

  /// Coordinator: session startup was refused (e.g., unknown user); the session was not bound.
  S_STARTUP_REJECTED,

  /// Coordinator: the named prepared statement does not exist in the session.
  S_UNKNOWN_PREPARED_STATEMENT,

  /// Coordinator: a prepared statement of that name already exists in the session.
  S_DUPLICATE_PREPARED_STATEMENT,

  /// Coordinator: the named portal does not exist in the session.
  S_UNKNOWN_PORTAL,

  /// Coordinator: a portal of that name already exists in the session.
  S_DUPLICATE_PORTAL,

  /// Coordinator: the statement could not be parsed or planned.
  S_STATEMENT_INVALID,

  /// Coordinator: the statement was planned but failed during execution.
  S_EXECUTION_FAILED,

  /// Coordinator: end-transaction requested, but the session has no explicit transaction open.
  S_NO_ACTIVE_TRANSACTION,

  /// Coordinator: the request was abandoned, because a cancellation request targeted this connection.
  S_OPERATION_CANCELED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * flow::Error_code to the (coord::client-specific) error code set, so that one can implicitly covert from
 * the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return The #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a Code from a standard input stream: the symbolic form (e.g., "CONN_ID_EXHAUSTED",
 * case-insensitive) or the numeric form.  On no match, `val` becomes Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a Code to a standard output stream, in the symbolic form readable by `operator>>()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace coord::client::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::coord::client::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
