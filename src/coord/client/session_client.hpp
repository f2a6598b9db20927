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

#include "coord/client/conn_client.hpp"
#include "coord/client/cancel_signal.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <optional>
#include <string>

namespace coord::client
{

// Types.

/**
 * Coordinator client bound to a connection that has completed startup: the object through which a connection
 * issues every session-bearing request (describe(), declare(), execute(), end_transaction(), dump_catalog()) and,
 * finally, terminate()s.  Obtain one from Conn_client::startup().
 *
 * ### Session ownership; state machine ###
 * The connection's Session is owned by exactly one party at a time.  Between requests `*this` owns it: State
 * S_ACTIVE, and session() gives access to it.  A request moves it into the Command, along with a fresh reply slot,
 * sends that to the coordinator (State S_IN_REQUEST) and blocks until the coordinator hands it back in the
 * Response; then `*this` is S_ACTIVE again -- whether the request succeeded or failed.  terminate() surrenders it for
 * good (State S_TERMINATED).
 *
 * Every request requires S_ACTIVE.  Violating that, or destroying (or move-assigning over) an S_ACTIVE object,
 * is a logic error and is fatal: the process aborts after a FLOW_LOG_FATAL().  In other words one must terminate()
 * every successfully started-up Session_client.  A NULL Session_client -- default-constructed, moved-from, or
 * returned by a failed Conn_client::startup() -- holds nothing and may be simply destroyed.
 *
 * Request-level failures (bad SQL, unknown portal, ...) are not fatal: they are reported via the usual
 * `Error_code* err_code` argument, and the session remains usable.  By contrast, if the coordinator is gone (command
 * channel closed) or drops a request without replying (reply slot broken), that is fatal: the coordinator must
 * outlive all clients.
 *
 * ### Cancellation ###
 * The coordinator flags Cancelled::S_CANCELLED on the connection's cancellation signal upon a valid cancel
 * request targeting it (see cancel_request()).  That does not interrupt a blocked request; rather, the connection
 * checks canceled() at points of its choosing (e.g., from another thread while execute() is blocked, or between
 * result rows) and resets the signal via reset_canceled() before its next statement.
 *
 * ### Thread safety ###
 * Not safe for concurrent use of one object, with the exception of the Cancel_waiter returned by canceled(),
 * which is independent of `*this`.
 */
class Session_client :
  public flow::log::Log_context
{
public:
  // Types.

  /// State: see class doc header.
  enum class State
  {
    /// Holds nothing; destruction is silent.
    S_NULL,

    /// Holds the session; ready for a request.  Destruction is fatal.
    S_ACTIVE,

    /// Session is with the coordinator, a request being in flight.
    S_IN_REQUEST,

    /// terminate() was called; destruction is silent.
    S_TERMINATED
  };

  // Constructors/destructor.

  /// Constructs in NULL state.
  Session_client();

  /**
   * Move-constructs.
   * @param src
   *        Moved-from object; it becomes NULL.
   */
  Session_client(Session_client&& src);

  /// Disallow copying: the session exists once.
  Session_client(const Session_client&) = delete;

  /// Releases resources; fatal if S_ACTIVE or S_IN_REQUEST (see class doc header).
  ~Session_client();

  // Methods.

  /**
   * Move-assigns.  Fatal if `*this` is S_ACTIVE or S_IN_REQUEST.
   *
   * @param src
   *        See move ctor.
   * @return `*this`.
   */
  Session_client& operator=(Session_client&& src);

  /// Disallow copying: the session exists once.
  Session_client& operator=(const Session_client&) = delete;

  /**
   * Current state.
   * @return See above.
   */
  State state() const;

  /**
   * Whether in NULL state.
   * @return See above.
   */
  bool null() const;

  /**
   * Identifier of the connection.  Must not be NULL.
   * @return See above.
   */
  Connection_id conn_id() const;

  /**
   * The session, for inspection or modification between requests.  Fatal unless S_ACTIVE.
   * @return See above.
   */
  Session& session();

  /**
   * Registers the prepared statement `name`, replacing any of that name.  Blocks until the coordinator replies.
   *
   * @param name
   *        Statement name; empty for the unnamed statement.
   * @param stmt
   *        The statement; empty `optional` for the empty query.
   * @param param_types
   *        Parameter type hints.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the coordinator replies with; e.g., error::Code::S_STATEMENT_INVALID.
   */
  void describe(const std::string& name, const std::optional<Statement>& stmt, const Param_types& param_types,
                Error_code* err_code = 0);

  /**
   * Binds the statement `stmt` to the portal `name`.  Blocks until the coordinator replies.
   *
   * @param name
   *        Portal name.
   * @param stmt
   *        The statement.
   * @param param_types
   *        Parameter type hints.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the coordinator replies with; e.g., error::Code::S_DUPLICATE_PORTAL.
   */
  void declare(const std::string& name, const Statement& stmt, const Param_types& param_types,
               Error_code* err_code = 0);

  /**
   * Runs the portal `portal_name`.  Blocks until the coordinator replies.
   *
   * @param portal_name
   *        Portal name.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the coordinator replies with; e.g., error::Code::S_UNKNOWN_PORTAL.
   * @return The outcome; default-constructed on error.
   */
  Execute_response execute(const std::string& portal_name, Error_code* err_code = 0);

  /**
   * Commits or rolls back the current transaction.  Blocks until the coordinator replies.
   *
   * @param action
   *        What to do.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the coordinator replies with; e.g., error::Code::S_NO_ACTIVE_TRANSACTION.
   * @return The outcome; default-constructed on error.
   */
  Execute_response end_transaction(End_transaction_action action, Error_code* err_code = 0);

  /**
   * Obtains a text snapshot of the coordinator's catalog.  Blocks until the coordinator replies.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the coordinator replies with.
   * @return The catalog text; empty on error.
   */
  std::string dump_catalog(Error_code* err_code = 0);

  /**
   * Identical to Conn_client::cancel_request().  Does not touch the session, so it is allowed in S_ACTIVE;
   * must not be NULL or S_TERMINATED.
   *
   * @param conn_id
   *        Target connection.
   * @param secret_key
   *        Target connection's secret.
   */
  void cancel_request(Connection_id conn_id, Secret_key secret_key) const;

  /**
   * Sends the session to the coordinator as the connection's final command, and enters S_TERMINATED.  No reply
   * is awaited.  Fatal unless S_ACTIVE.
   */
  void terminate();

  /**
   * Returns an observation of the cancellation signal which resolves once Cancelled::S_CANCELLED is written to
   * it after the last reset_canceled() (or startup).  A cancellation already flagged since then resolves it at once.
   * Must be S_ACTIVE or S_IN_REQUEST.
   *
   * @return See above.
   */
  Cancel_waiter canceled() const;

  /// Resets the cancellation signal to Cancelled::S_NOT_CANCELLED.  Must be S_ACTIVE.
  void reset_canceled();

private:
  // Friends.

  /// Conn_client::startup() creates non-NULL objects and performs handshake().
  friend class Conn_client;

  // Constructors.

  /**
   * Constructs S_ACTIVE object owning the given items.
   *
   * @param conn
   *        The Conn_client; becomes NULL.
   * @param session
   *        The session.
   * @param cancel_tx
   *        Write end of the cancellation signal.
   */
  explicit Session_client(Conn_client&& conn, Session&& session,
                          const boost::shared_ptr<Cancel_sender>& cancel_tx);

  // Methods.

  /**
   * Performs the startup exchange (see Conn_client::startup()).  On failure: becomes NULL (releasing the
   * connection ID).
   *
   * @param cancel_tx
   *        Write end of the cancellation signal to hand to the coordinator.
   * @param startup_rsp
   *        See Conn_client::startup().
   * @param err_code
   *        Not null.
   */
  void handshake(const boost::shared_ptr<Cancel_sender>& cancel_tx, Startup_response* startup_rsp,
                 Error_code* err_code);

  /**
   * The request engine: moves the session into the Command made by `make_cmd_func`, sends that, blocks until
   * the Response arrives, and puts back the session.  See class doc header regarding fatal conditions.
   *
   * @tparam Result_t
   *         Result type of the request.
   * @tparam Make_cmd_func
   *         Function type with signature `Command F(Session&&, boost::promise<Response<Result_t>>&&)`.
   * @param make_cmd_func
   *        Makes the command from the session and the reply slot.
   * @param context
   *        Request name for logging.
   * @param err_code
   *        Not null.  Set from the Response.
   * @return The result from the Response; default-constructed on error.
   */
  template<typename Result_t, typename Make_cmd_func>
  Result_t request(const Make_cmd_func& make_cmd_func, flow::util::String_view context, Error_code* err_code);

  /**
   * Aborts unless `m_state == S_ACTIVE`.
   *
   * @param context
   *        Operation name for logging.
   */
  void ensure_active(flow::util::String_view context) const;

  // Data.

  /// See state().
  State m_state;

  /// The conn client, holding the connection ID and the command channel; NULL if and only if `*this` is S_NULL.
  Conn_client m_conn;

  /// The session; non-empty if and only if S_ACTIVE.
  std::optional<Session> m_session;

  /// Write end of the cancellation signal; null if and only if S_NULL.
  boost::shared_ptr<Cancel_sender> m_cancel_tx;

  /// Read end of the cancellation signal, having seen every write until the last reset_canceled() (or startup).
  std::optional<Cancel_receiver> m_cancel_rx;
}; // class Session_client

} // namespace coord::client
