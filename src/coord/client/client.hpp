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

#include "coord/client/session_client.hpp"
#include "coord/client/client_config.hpp"
#include <flow/log/log.hpp>

namespace coord::client
{

// Types.

/**
 * The coordinator client as held by the connection listener: a cheap, copyable handle whose only job is to mint
 * a Conn_client per incoming connection via new_conn().  The first Client is typically obtained from a Handle;
 * copy it for each listener thread as desired.
 *
 * All copies share the command channel to the coordinator and the Id_allocator of connection identifiers.
 * The coordinator's receive loop ends only once every Client copy (and every Conn_client/Session_client,
 * which hold the command channel too) is gone.
 *
 * ### Thread safety ###
 * new_conn() may be invoked concurrently on the same or different objects.
 */
class Client :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs a client sending commands via `cmd_tx` and allocating identifiers per `config`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (including by the Conn_client and Session_client objects
   *        minted from `*this`).
   * @param config
   *        Configuration.  Copied.
   * @param cmd_tx
   *        Send end of the command channel.
   * @throws flow::error::Runtime_error
   *         With error::Code::S_INVALID_ARGUMENT if `config` specifies an empty identifier range.
   */
  explicit Client(flow::log::Logger* logger_ptr, const Client_config& config, const Command_tx& cmd_tx);

  // Methods.

  /**
   * Allocates a connection identifier and returns a Conn_client holding it.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONN_ID_EXHAUSTED (too many live connections).
   * @return The Conn_client; NULL (see Conn_client::null()) on error.
   */
  Conn_client new_conn(Error_code* err_code = 0) const;

  /**
   * Configuration given to the constructor.
   * @return See above.
   */
  const Client_config& config() const;

  /**
   * How many connection identifiers are currently held, by all Conn_client and Session_client objects minted
   * by `*this` or its copies.
   *
   * @return See above.
   */
  size_t n_live_conns() const;

private:
  // Data.

  /// See config().
  Client_config m_config;

  /// Send end of the command channel; copied into each Conn_client.
  Command_tx m_cmd_tx;

  /// Identifier allocator, shared with all copies of `*this` and all Conn_client objects minted from them.
  boost::shared_ptr<Id_allocator> m_id_alloc;
}; // class Client

} // namespace coord::client
