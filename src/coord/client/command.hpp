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

#include "coord/client/session.hpp"
#include "coord/client/cancel_signal.hpp"
#include <boost/thread/future.hpp>
#include <boost/shared_ptr.hpp>
#include <variant>

namespace coord::client
{

// Types.

/// What the coordinator reports upon a successful Conn_client::startup(), besides the session itself.
struct Startup_response
{
  /// Notices (parameter status messages and the like) to relay to the client application, in order.
  std::vector<std::string> m_notices;
};

/**
 * Outcome of a successful Session_client::execute() or Session_client::end_transaction().
 * Which data members are meaningful depends on #m_kind.
 */
struct Execute_response
{
  // Types.

  /// What happened.
  enum class Kind
  {
    /// A row-returning statement ran: see #m_column_names, #m_rows.
    S_ROWS,

    /// A data-modifying statement ran: see #m_n_rows_affected.
    S_ROWS_AFFECTED,

    /// A statement that returns neither rows nor a count ran (e.g., DDL).  See #m_tag.
    S_COMMAND_COMPLETE,

    /// The transaction ended (commit or rollback).  See #m_tag.
    S_TRANSACTION_EXITED,

    /// The coordinator abandoned the statement due to a cancel request.
    S_CANCELED,

    /// The portal's statement was the empty query.
    S_EMPTY_QUERY
  };

  /// One row: one value per column, text-formatted; empty `optional` for SQL NULL.
  using Row = std::vector<std::optional<std::string>>;

  // Data.

  /// What happened.
  Kind m_kind = Kind::S_EMPTY_QUERY;

  /// Command tag as reported to the client application, e.g., "INSERT", "COMMIT".
  std::string m_tag;

  /// For Kind::S_ROWS_AFFECTED: the count.
  uint64_t m_n_rows_affected = 0;

  /// For Kind::S_ROWS: column names.
  std::vector<std::string> m_column_names;

  /// For Kind::S_ROWS: the rows.
  std::vector<Row> m_rows;
}; // struct Execute_response

/// Result type of requests that succeed or fail but yield nothing else: Session_client::describe(), declare().
struct No_result
{
};

/**
 * What the coordinator sends back for every session-bearing request: the session, unconditionally, plus the
 * outcome.  This is the reply-slot payload; see Command.
 *
 * @tparam Result_t
 *         Request-specific result type.
 */
template<typename Result_t>
struct Response
{
  // Types.

  /// Short-hand for template parameter.
  using Result = Result_t;

  // Data.

  /// The session, as left by the coordinator (its changes, e.g., a new prepared statement, applied).
  Session m_session;

  /// Falsy on success; else the request-level failure (e.g., error::Code::S_STATEMENT_INVALID).
  Error_code m_err_code;

  /// Result; meaningful if and only if `!m_err_code`.
  Result m_result;
}; // struct Response

/**
 * The command vocabulary: one `struct` per request kind sent from a Session_client (or Conn_client) to the
 * coordinator.  Each session-bearing command carries the Session itself -- the sender no longer has it -- and a
 * single-use reply slot (`boost::promise`) through which the coordinator must hand it back along with the outcome.
 * A coordinator that destroys such a command without fulfilling the promise breaks it; the waiting requester
 * treats that as fatal.
 */
namespace command
{

/// Connection handshake.  Reply: the session and Startup_response; an error rejects the connection.
struct Startup
{
  /// The new connection's session.
  Session m_session;

  /// Write end of the connection's cancellation signal; the coordinator keeps it for routing Cancel_request.
  boost::shared_ptr<Cancel_sender> m_cancel_tx;

  /// Reply slot.
  boost::promise<Response<Startup_response>> m_reply;
};

/// Register a named prepared statement (replacing any of that name).  Reply: session and success or error.
struct Describe
{
  /// Statement name; empty for the unnamed statement.
  std::string m_name;

  /// The statement; empty `optional` for the empty query.
  std::optional<Statement> m_stmt;

  /// Parameter type hints.
  Param_types m_param_types;

  /// The session.
  Session m_session;

  /// Reply slot.
  boost::promise<Response<No_result>> m_reply;
};

/// Bind a statement with parameters to a named portal.  Reply: session and success or error.
struct Declare
{
  /// Portal name.
  std::string m_name;

  /// The statement.
  Statement m_stmt;

  /// Parameter type hints.
  Param_types m_param_types;

  /// The session.
  Session m_session;

  /// Reply slot.
  boost::promise<Response<No_result>> m_reply;
};

/// Run a previously declared portal.  Reply: session and Execute_response or error.
struct Execute
{
  /// Portal name.
  std::string m_portal_name;

  /// The session.
  Session m_session;

  /// Reply slot.
  boost::promise<Response<Execute_response>> m_reply;
};

/// End the current transaction.  Reply: session and Execute_response or error.
struct Commit
{
  /// Commit or roll back.
  End_transaction_action m_action;

  /// The session.
  Session m_session;

  /// Reply slot.
  boost::promise<Response<Execute_response>> m_reply;
};

/// Snapshot of the coordinator's catalog.  Reply: session and catalog text or error.
struct Dump_catalog
{
  /// The session.
  Session m_session;

  /// Reply slot.
  boost::promise<Response<std::string>> m_reply;
};

/// Final command of a session.  No reply.
struct Terminate
{
  /// The session, surrendered for good.
  Session m_session;
};

/// Cancel whatever another connection is doing.  Not session-bearing; no reply.
struct Cancel_request
{
  /// Target connection.
  Connection_id m_conn_id;

  /// Must equal the target session's Session::secret_key(), else the coordinator ignores the request.
  Secret_key m_secret_key;
};

} // namespace command

/// A command: see namespace `command`.
using Command = std::variant<command::Startup, command::Describe, command::Declare, command::Execute,
                             command::Commit, command::Dump_catalog, command::Terminate, command::Cancel_request>;

// Free functions.

namespace command
{

/**
 * Prints string representation of the given command: its kind and the key parts of its payload (never
 * the secret key).  It lives in this namespace, so that argument-dependent lookup finds it for #Command.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Command& val);

} // namespace command

/**
 * Prints string representation of the given Execute_response::Kind.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Execute_response::Kind val);

} // namespace coord::client
