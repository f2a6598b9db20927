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

#include "coord/client/detail/client_fwd.hpp"
#include "coord/common.hpp"
#include <iosfwd>
#include <cstdint>

/**
 * Coordinator-client module: the client-side protocol layer that lets many concurrent connections talk to a
 * single, serially-executing database *coordinator* over asynchronous message passing.  The coordinator itself
 * (SQL parsing, planning, catalog, transactions) is an external collaborator reached only via the command/response
 * vocabulary in command.hpp.  What lives here is the hard part around it: lifecycle and ownership.
 *
 * ### Basic concepts ###
 * A *connection* is one client application's link to the coordinator, as accepted by some listener.  Each live
 * connection holds a unique *connection identifier* (#Connection_id), reclaimed when the connection goes away.
 * Once a connection completes a startup handshake it has a *session*: a Session object holding all its
 * per-connection execution state (prepared statements, portals, transaction status).
 *
 * A Session is never shared and never copied.  At any observable time exactly one party owns it: the
 * Session_client, the coordinator, or the command channel between them while a request is in transit.  Each request
 * hands the Session to the coordinator and gets it back, always, together with that request's result.
 *
 * ### The handle hierarchy ###
 * Three types, each reached from the previous one only (never the other way):
 *   - Client: cheaply copyable entry point a listener holds; a command channel endpoint plus the shared
 *     Id_allocator.  Client::new_conn() mints...
 *   - Conn_client: bound to one allocated #Connection_id, which it releases exactly once when destroyed.
 *     Conn_client::startup() upgrades it to...
 *   - Session_client: owns the Session and a cancellation signal; issues typed requests.  It must be consumed via
 *     Session_client::terminate(); destroying one that still owns its Session is a fatal error.
 *
 * Handle, optionally, owns the coordinator's thread itself and supplies the first Client.
 *
 * ### Error handling ###
 * Recoverable errors -- connection identifier exhaustion; request-level failures computed by the coordinator --
 * are emitted via the usual Flow convention: a trailing `Error_code* err_code` argument; if null, a
 * `flow::error::Runtime_error` is thrown instead.  Protocol violations -- the coordinator vanished, a reply slot
 * was dropped unanswered, an unterminated Session_client was destroyed -- are not errors but bugs in the
 * surrounding system; they are logged at FATAL severity and abort the process.
 *
 * ### Cancellation ###
 * The coordinator writes Cancelled::S_CANCELLED into a connection's single-slot cancellation signal upon
 * receiving a valid cancel request for that connection.  The owning Session_client observes it via
 * Session_client::canceled() at points of its choosing; the signal is advisory and never aborts a request in flight.
 */
namespace coord::client
{

// Types.

/// Unique (while live) identifier of a connection.
using Connection_id = uint32_t;

/// Per-session secret presented in a cancel request, so that one connection cannot cancel another's work at will.
using Secret_key = uint32_t;

// Find doc headers near the bodies of these compound types.

struct Client_config;
class Id_allocator;
class Session;
struct Statement;
struct Startup_response;
struct Execute_response;
template<typename Result_t>
struct Response;
class Command_tx;
class Command_rx;
class Cancel_sender;
class Cancel_receiver;
class Cancel_waiter;
class Client;
class Conn_client;
class Session_client;
class Handle;

/**
 * Value of a cancellation signal (Cancel_sender, Cancel_receiver).  Not a queue: only the latest value is kept.
 */
enum class Cancelled
{
  /// Nothing to abandon.  Initial value; also the value written by Session_client::reset_canceled().
  S_NOT_CANCELLED,

  /// The current operation should be abandoned.
  S_CANCELLED
};

/// How to close the current transaction: see Session_client::end_transaction().
enum class End_transaction_action
{
  /// Make the transaction's effects durable.
  S_COMMIT,

  /// Discard the transaction's effects.
  S_ROLLBACK
};

/// Status of a Session's transaction, maintained by the coordinator.
enum class Transaction_status
{
  /// No explicit transaction open.
  S_IDLE,

  /// Inside an explicit transaction.
  S_IN_TRANSACTION,

  /// Inside an explicit transaction in which a statement failed; only end-transaction will be accepted.
  S_FAILED
};

/// Parameter type hint supplied with a statement; absence (an empty `optional`) means "infer it."
enum class Param_type
{
  S_BOOL,
  S_INT4,
  S_INT8,
  S_FLOAT8,
  S_NUMERIC,
  S_TEXT,
  S_BYTEA,
  S_DATE,
  S_TIMESTAMP,
  S_JSONB
};

// Free functions.

/**
 * Prints string representation of the given Cancelled value to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Cancelled val);

/**
 * Prints string representation of the given End_transaction_action to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, End_transaction_action val);

/**
 * Prints string representation of the given Transaction_status to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Transaction_status val);

/**
 * Prints string representation of the given Param_type to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Param_type val);

/**
 * Prints string representation of the given `Client_config` to the given `ostream`.
 *
 * @relatesalso Client_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client_config& val);

/**
 * Prints string representation of the given `Session` to the given `ostream`.
 *
 * @relatesalso Session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session& val);

/**
 * Prints string representation of the given `Execute_response` to the given `ostream`.
 *
 * @relatesalso Execute_response
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Execute_response& val);

/**
 * Prints string representation of the given `Client` to the given `ostream`.
 *
 * @relatesalso Client
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client& val);

/**
 * Prints string representation of the given `Conn_client` to the given `ostream`.
 *
 * @relatesalso Conn_client
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Conn_client& val);

/**
 * Prints string representation of the given `Session_client` to the given `ostream`.
 *
 * @relatesalso Session_client
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session_client& val);

/**
 * Prints string representation of the given `Handle` to the given `ostream`.
 *
 * @relatesalso Handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Handle& val);

} // namespace coord::client
