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

#include "coord/client/client.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/noncopyable.hpp>
#include <optional>

namespace coord::client
{

// Types.

/**
 * Owner of a running coordinator: its serial execution thread, its cluster ID, and the first Client
 * connected to it.
 *
 * The coordinator itself is a user-supplied serve function: it is given the Command_rx of a fresh command channel
 * and runs, in a thread owned by `*this`, until it returns.  A typical one loops on Command_rx::recv() until that
 * reports the channel closed, which happens after every Client (and every Conn_client and Session_client minted
 * from them) is gone.
 *
 * Destroying `*this` waits for the serve function to return.  Hence one must destroy all outstanding clients
 * before (or concurrently with) the Handle; else the destructor blocks forever.
 *
 * ### Thread safety ###
 * client() and cluster_id() may be invoked concurrently.
 */
class Handle :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Coordinator body: see class doc header.  The Command_rx is destroyed after it returns.
  using Serve_func = Function<void (Command_rx& cmd_rx)>;

  // Constructors/destructor.

  /**
   * Creates the command channel and the first Client connected to it, generates a cluster ID, and starts the
   * coordinator thread running `serve_func`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (including by the Client objects).
   * @param config
   *        Client configuration.
   * @param serve_func
   *        Coordinator body.
   * @throws flow::error::Runtime_error
   *         See Client::Client().
   */
  explicit Handle(flow::log::Logger* logger_ptr, const Client_config& config, Serve_func&& serve_func);

  /// Releases the first Client, then waits for the serve function to return.
  ~Handle();

  // Methods.

  /**
   * A Client connected to the coordinator; copy it as needed.
   * @return See above.
   */
  const Client& client() const;

  /**
   * The cluster ID: unique to this coordinator instance.
   * @return See above.
   */
  const boost::uuids::uuid& cluster_id() const;

private:
  // Data.

  /// See cluster_id().
  const boost::uuids::uuid m_cluster_id;

  /// See client().  Emptied first thing in the destructor, so that it does not keep the coordinator running.
  std::optional<Client> m_client;

  /// The coordinator thread, executing the serve function.
  flow::async::Single_thread_task_loop m_coord_thread;
}; // class Handle

} // namespace coord::client
