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

#include "coord/client/handle.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/lock_types.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <optional>
#include <string>

namespace coord::client::test
{

/**
 * A scripted coordinator for exercising the client core.  Feed serve() to a Handle.
 *
 * Behavior, by command:
 *   - Startup: rejected (S_STARTUP_REJECTED) if the user is #S_BAD_USER; else accepted with one notice, and the
 *     connection's cancellation signal is remembered (for Cancel_request).
 *   - Describe/Declare: SQL containing "bogus" is S_STATEMENT_INVALID; a duplicate portal is S_DUPLICATE_PORTAL.
 *     Describe of a named statement: with SQL, S_DUPLICATE_PREPARED_STATEMENT if the name is taken; without SQL,
 *     S_UNKNOWN_PREPARED_STATEMENT unless the name exists.  The unnamed ("") statement is always replaced.
 *   - Execute: unknown portal is S_UNKNOWN_PORTAL.  In a failed transaction every portal is S_EXECUTION_FAILED.
 *     Portal SQL #S_SLOW_SQL parks the request until a matching Cancel_request arrives; then the reply is
 *     Execute_response::Kind::S_CANCELED outside a transaction, or S_OPERATION_CANCELED (failing the transaction)
 *     inside one.  Portal SQL #S_DROP_SQL makes the coordinator destroy the request without replying.  Portal SQL
 *     #S_FAIL_SQL is S_EXECUTION_FAILED, failing the transaction if any.  Empty SQL is
 *     Execute_response::Kind::S_EMPTY_QUERY.  "BEGIN" opens a transaction; "INSERT ..." affects 1 row; anything
 *     else yields one row echoing the SQL.
 *   - Commit: S_NO_ACTIVE_TRANSACTION unless in a transaction; else exits it, dropping portals.  A failed
 *     transaction is rolled back whatever the action.
 *   - Dump_catalog: a one-line summary of the session's prepared statements and portals.
 *   - Terminate: forgets the connection.
 *   - Cancel_request: if the secret matches, flags S_CANCELLED on the target's signal and answers its parked
 *     Execute, if any; else ignored.
 *
 * Statistics accessors are thread-safe.
 */
class Test_coordinator :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Startup for this user is rejected.
  static const std::string S_BAD_USER;

  /// Executing a portal with this SQL blocks until canceled.
  static const std::string S_SLOW_SQL;

  /// Executing a portal with this SQL drops the request.
  static const std::string S_DROP_SQL;

  /// Executing a portal with this SQL fails.
  static const std::string S_FAIL_SQL;

  // Constructors/destructor.

  /**
   * Constructs.
   * @param logger_ptr
   *        Logger.
   */
  explicit Test_coordinator(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Processes commands until the channel closes.
   * @param cmd_rx
   *        Receive end.
   */
  void serve(Command_rx& cmd_rx);

  /**
   * Blocks until an Execute of #S_SLOW_SQL from connection `conn_id` is parked.
   * @param conn_id
   *        Connection.
   */
  void await_parked(Connection_id conn_id) const;

  /**
   * Number of Terminate commands received.
   * @return See above.
   */
  size_t n_terminated() const;

  /**
   * Number of Cancel_request commands received that matched a live connection's secret.
   * @return See above.
   */
  size_t n_cancels_honored() const;

  /**
   * Number of Cancel_request commands received that were ignored.
   * @return See above.
   */
  size_t n_cancels_ignored() const;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// What we remember about a started-up connection.
  struct Conn_state
  {
    /// Its secret.
    Secret_key m_secret_key;

    /// Its cancellation signal write end.
    boost::shared_ptr<Cancel_sender> m_cancel_tx;

    /// Its parked Execute, if any.
    std::optional<command::Execute> m_parked;
  };

  /// Visitor dispatching each Command to the handlers below.
  struct Dispatcher;

  // Methods.

  /**
   * Handles a command.  The remaining overloads are similar.
   * @param cmd
   *        Command.
   */
  void on_cmd(command::Startup& cmd);
  void on_cmd(command::Describe& cmd);
  void on_cmd(command::Declare& cmd);
  void on_cmd(command::Execute& cmd);
  void on_cmd(command::Commit& cmd);
  void on_cmd(command::Dump_catalog& cmd);
  void on_cmd(command::Terminate& cmd);
  void on_cmd(command::Cancel_request& cmd);

  // Data.

  /// Protects the following (only the stats and #m_parked_conns are accessed from outside the serve() thread).
  mutable Mutex m_mutex;

  /// Signaled when #m_parked_conns changes.
  mutable boost::condition_variable_any m_parked_cond;

  /// Started-up connections.
  boost::unordered_map<Connection_id, Conn_state> m_conns;

  /// Connections whose Execute is parked.
  boost::unordered_set<Connection_id> m_parked_conns;

  /// See n_terminated().
  size_t m_n_terminated;

  /// See n_cancels_honored().
  size_t m_n_cancels_honored;

  /// See n_cancels_ignored().
  size_t m_n_cancels_ignored;
}; // class Test_coordinator

} // namespace coord::client::test
