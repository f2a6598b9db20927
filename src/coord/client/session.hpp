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

#include "coord/client/client_fwd.hpp"
#include <boost/unordered_map.hpp>
#include <optional>
#include <string>
#include <vector>

namespace coord::client
{

// Types.

/// Sequence of parameter type hints, one per statement parameter ($1, $2, ...).
using Param_types = std::vector<std::optional<Param_type>>;

/**
 * A statement as received from the client application, not yet parsed.  Parsing and planning are the
 * coordinator's business; to this layer a statement is cargo.
 */
struct Statement
{
  /// The SQL text.
  std::string m_sql;
};

/// A named prepared statement stored in a Session (see Session_client::describe()).
struct Prepared_statement
{
  /// The statement; empty for the empty query.
  std::optional<Statement> m_stmt;

  /// Parameter type hints as supplied by the client application.
  Param_types m_param_types;
};

/// A named portal stored in a Session (see Session_client::declare()): a statement bound for execution.
struct Portal
{
  /// The statement.
  Statement m_stmt;

  /// Parameter type hints as supplied by the client application.
  Param_types m_param_types;
};

/**
 * All per-connection execution state: identity, transaction status, prepared statements, portals.
 *
 * A Session is *movable, never copyable*.  It is created by the connection listener, handed to
 * Conn_client::startup(), and from then on is owned by exactly one party at a time: the Session_client, the
 * coordinator, or a Command/Response in transit between them.  The client core itself never looks inside; the
 * accessors/mutators below are for the coordinator (and for the connection, between requests, via
 * Session_client::session()).
 *
 * ### Thread safety ###
 * None; but by construction only one thread at a time can reach a given Session (its owner).
 */
class Session
{
public:
  // Types.

  /// Prepared statements by name.
  using Prepared_statements = boost::unordered_map<std::string, Prepared_statement>;

  /// Portals by name.
  using Portals = boost::unordered_map<std::string, Portal>;

  // Constructors/destructor.

  /**
   * Constructs a fresh session: no prepared statements or portals; transaction status idle.
   *
   * @param conn_id
   *        Identifier of the connection to which this session belongs: Conn_client::conn_id().
   * @param user
   *        Name of the user on whose behalf the connection operates.
   * @param secret_key
   *        Secret that a cancel request targeting this connection must present.
   */
  explicit Session(Connection_id conn_id, std::string user, Secret_key secret_key);

  /**
   * Move-constructs.
   * @param src
   *        Moved-from object; it becomes a shell usable only for destruction or being moved-to.
   */
  Session(Session&& src);

  /// Disallow copying: a session is never duplicated.
  Session(const Session&) = delete;

  // Methods.

  /**
   * Move-assigns.
   * @param src
   *        See move ctor.
   * @return `*this`.
   */
  Session& operator=(Session&& src);

  /// Disallow copying: a session is never duplicated.
  Session& operator=(const Session&) = delete;

  /**
   * Connection identifier given at construction.
   * @return See above.
   */
  Connection_id conn_id() const;

  /**
   * User name given at construction.
   * @return See above.
   */
  const std::string& user() const;

  /**
   * Secret key given at construction.
   * @return See above.
   */
  Secret_key secret_key() const;

  /**
   * Current transaction status.
   * @return See above.
   */
  Transaction_status transaction_status() const;

  /**
   * Sets transaction status.
   * @param status
   *        New value.
   */
  void set_transaction_status(Transaction_status status);

  /**
   * Stores a prepared statement under `name`, replacing any existing one of that name (the unnamed statement,
   * `name == ""`, is routinely replaced this way).
   *
   * @param name
   *        Statement name.
   * @param stmt
   *        The statement.
   */
  void set_prepared_statement(const std::string& name, Prepared_statement&& stmt);

  /**
   * Returns pointer to the prepared statement named `name` or null if none.
   *
   * @param name
   *        Statement name.
   * @return See above.
   */
  const Prepared_statement* prepared_statement(const std::string& name) const;

  /**
   * Stores a portal under `name` unless one of that name exists already.
   *
   * @param name
   *        Portal name.
   * @param portal
   *        The portal.
   * @return `false` if and only if a portal of that name existed; then `*this` is unchanged.
   */
  bool set_portal(const std::string& name, Portal&& portal);

  /**
   * Returns pointer to the portal named `name` or null if none.
   *
   * @param name
   *        Portal name.
   * @return See above.
   */
  const Portal* portal(const std::string& name) const;

  /**
   * All prepared statements.
   * @return See above.
   */
  const Prepared_statements& prepared_statements() const;

  /**
   * All portals.
   * @return See above.
   */
  const Portals& portals() const;

  /**
   * Drops all portals; as done at transaction end.
   */
  void clear_portals();

private:
  // Data.

  /// See conn_id().
  Connection_id m_conn_id;

  /// See user().
  std::string m_user;

  /// See secret_key().
  Secret_key m_secret_key;

  /// See transaction_status().
  Transaction_status m_transaction_status;

  /// See prepared_statements().
  Prepared_statements m_prepared_statements;

  /// See portals().
  Portals m_portals;
}; // class Session

// Free functions: in *_fwd.hpp.

} // namespace coord::client
