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

#include "coord/client/command_channel.hpp"
#include "coord/client/id_alloc.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <optional>

namespace coord::client
{

// Types.

/**
 * Coordinator client bound to one incoming connection: minted by Client::new_conn(), which allocates the
 * connection's identifier, and upgraded by startup() to a Session_client once the connection negotiates its
 * parameters.
 *
 * ### Identifier lifetime ###
 * The identifier returned by conn_id() belongs to `*this` until `*this` (or whatever it is moved into) is
 * destroyed; then it is returned to the Id_allocator.  This happens exactly once per identifier, whether or not
 * startup() was ever invoked or succeeded: startup() moves the identifier into the Session_client, which releases it
 * in turn -- or, on failed startup, releases it right away.  Hence a Conn_client is movable but never copyable.
 *
 * ### NULL state ###
 * A default-constructed or moved-from Conn_client is in NULL state: it holds no identifier, and the only
 * methods allowed are null(), destruction, and being moved-to.  startup() leaves `*this` in NULL state.
 *
 * ### Thread safety ###
 * Not safe for concurrent use of one object.
 */
class Conn_client :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /// Constructs in NULL state.
  Conn_client();

  /**
   * Move-constructs.
   * @param src
   *        Moved-from object; it becomes NULL.
   */
  Conn_client(Conn_client&& src);

  /// Disallow copying: the identifier must be released once.
  Conn_client(const Conn_client&) = delete;

  /// Releases the identifier, unless in NULL state.
  ~Conn_client();

  // Methods.

  /**
   * Move-assigns.  Any identifier held by `*this` is released first.
   *
   * @param src
   *        See move ctor.
   * @return `*this`.
   */
  Conn_client& operator=(Conn_client&& src);

  /// Disallow copying: the identifier must be released once.
  Conn_client& operator=(const Conn_client&) = delete;

  /**
   * The connection identifier.  Must not be in NULL state.
   * @return See above.
   */
  Connection_id conn_id() const;

  /**
   * Whether in NULL state.
   * @return See above.
   */
  bool null() const;

  /**
   * Performs the connection handshake with the coordinator: creates the connection's cancellation signal,
   * sends a `command::Startup` carrying `session` and the signal's write end, and blocks until the coordinator
   * replies.  `*this` becomes NULL.
   *
   * On success the returned Session_client is Active: it owns `session` (as updated by the coordinator), the
   * signal, and the identifier; it must eventually be Session_client::terminate()d.  On failure the returned
   * Session_client is NULL (so discarding it is fine), `session` is discarded, and the identifier is released.
   *
   * If the coordinator is gone or drops the request, this is a fatal error: the process aborts.
   * Invoking this in NULL state is likewise fatal.
   *
   * @param session
   *        The connection's fresh session; typically Session::conn_id() equals conn_id().  Moved-from.
   * @param startup_rsp
   *        If not null: on success, set to the coordinator's startup details.  Untouched on failure.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the coordinator replies with; e.g., error::Code::S_STARTUP_REJECTED.
   * @return See above.
   */
  Session_client startup(Session&& session, Startup_response* startup_rsp, Error_code* err_code = 0);

  /**
   * Asks the coordinator to cancel whatever the connection `conn_id` is currently doing.  Fire-and-forget: no
   * reply; the coordinator ignores the request unless `secret_key` matches that connection's session.
   * Fatal if the coordinator is gone.  Must not be in NULL state.
   *
   * @param conn_id
   *        Target connection; not necessarily ours (typically not).
   * @param secret_key
   *        Target connection's secret.
   */
  void cancel_request(Connection_id conn_id, Secret_key secret_key) const;

private:
  // Friends.

  /// Client::new_conn() creates non-NULL objects.
  friend class Client;

  /// Session_client::cancel_request() uses our cancel_request().
  friend class Session_client;

  // Constructors.

  /**
   * Constructs non-NULL object holding `conn_id`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param cmd_tx
   *        Send end of the command channel.
   * @param id_alloc
   *        Allocator from which `conn_id` was obtained; it shall be returned there.
   * @param conn_id
   *        The identifier.
   */
  explicit Conn_client(flow::log::Logger* logger_ptr, const Command_tx& cmd_tx,
                       const boost::shared_ptr<Id_allocator>& id_alloc, Connection_id conn_id);

  // Methods.

  /// Releases the identifier and becomes NULL; no-op if NULL.
  void release();

  /**
   * Sends `cmd`; fatal if the coordinator is gone.
   *
   * @param cmd
   *        Command.
   */
  void send_or_abort(Command&& cmd) const;

  // Data.

  /// Send end of the command channel; empty if and only if NULL.
  std::optional<Command_tx> m_cmd_tx;

  /// Allocator owning #m_conn_id; null if and only if NULL.
  boost::shared_ptr<Id_allocator> m_id_alloc;

  /// See conn_id().
  Connection_id m_conn_id;
}; // class Conn_client

} // namespace coord::client
