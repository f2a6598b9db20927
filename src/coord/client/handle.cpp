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
#include "coord/client/handle.hpp"
#include <flow/util/util.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/make_shared.hpp>

namespace coord::client
{

// Implementations.

Handle::Handle(flow::log::Logger* logger_ptr, const Client_config& config, Serve_func&& serve_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_CLIENT),
  m_cluster_id(boost::uuids::random_generator()()),
  m_coord_thread(get_logger(), flow::util::ostream_op_string("coord[", m_cluster_id, ']'))
{
  using flow::async::Synchronicity;

  auto channel = make_command_channel();
  m_client.emplace(get_logger(), config, channel.first);

  /* Task must be copyable, while Command_rx is not; hence the shared_ptr.  Serve_func is copyable but could be
   * heavy; move it in the same way. */
  auto cmd_rx = boost::make_shared<Command_rx>(std::move(channel.second));
  auto serve = boost::make_shared<Serve_func>(std::move(serve_func));

  FLOW_LOG_INFO("Handle [" << *this << "]: Starting coordinator thread; client config [" << config << "].");

  /* Do not return until the serve task has begun: stop() in our dtor waits for a running task but discards a
   * queued one, and with it everything already sent on the channel. */
  m_coord_thread.start();
  m_coord_thread.post([this, cmd_rx = std::move(cmd_rx), serve = std::move(serve)]() mutable
  {
    FLOW_LOG_INFO("Handle [" << *this << "]: Coordinator serving.");
    (*serve)(*cmd_rx);

    /* Close the channel now, from this thread, rather than whenever the task object happens to be destroyed:
     * anything still queued gets dropped (its requester finds out) and senders start failing. */
    cmd_rx.reset();
    FLOW_LOG_INFO("Handle [" << *this << "]: Coordinator done serving.");
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_START); // m_coord_thread.post()
}

Handle::~Handle()
{
  FLOW_LOG_INFO("Handle [" << *this << "]: Shutting down: waiting for all clients to go away and the coordinator "
                "to finish serving.");

  m_client.reset();
  m_coord_thread.stop(); // Blocks until the serve function returns.

  FLOW_LOG_INFO("Handle [" << *this << "]: Coordinator thread joined.");
}

const Client& Handle::client() const
{
  return *m_client;
}

const boost::uuids::uuid& Handle::cluster_id() const
{
  return m_cluster_id;
}

std::ostream& operator<<(std::ostream& os, const Handle& val)
{
  return os << "cluster[" << val.cluster_id() << "]@" << &val;
}

} // namespace coord::client
