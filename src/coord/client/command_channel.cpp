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
#include "coord/client/command_channel.hpp"
#include <boost/make_shared.hpp>

namespace coord::client
{

// Command_tx implementations.

Command_tx::Command_tx(boost::shared_ptr<detail::Command_tx_token> token) :
  m_token(std::move(token))
{
  // That's it.
}

bool Command_tx::send(Command&& cmd) const
{
  auto& queue = *(m_token->queue());
  {
    detail::Command_queue::Lock_guard lock(queue.m_mutex);
    if (queue.m_rx_gone)
    {
      return false;
    }
    // else
    queue.m_cmds.emplace_back(std::move(cmd));
  }
  queue.m_cond.notify_one();
  return true;
}

// Command_rx implementations.

Command_rx::Command_rx(boost::shared_ptr<detail::Command_queue> queue) :
  m_queue(std::move(queue))
{
  // That's it.
}

Command_rx::Command_rx(Command_rx&& src) :
  m_queue(std::move(src.m_queue))
{
  // That's it.
}

Command_rx::~Command_rx()
{
  close();
}

Command_rx& Command_rx::operator=(Command_rx&& src)
{
  if (&src != this)
  {
    close();
    m_queue = std::move(src.m_queue);
  }
  return *this;
}

void Command_rx::close()
{
  if (!m_queue)
  {
    return;
  }
  // else

  /* Pull the leftovers out under the lock but destroy them outside it: destroying a command breaks its reply
   * slot, which wakes up its requester; no need to hold our lock meanwhile. */
  std::deque<Command> dropped;
  {
    detail::Command_queue::Lock_guard lock(m_queue->m_mutex);
    m_queue->m_rx_gone = true;
    dropped.swap(m_queue->m_cmds);
  }
  dropped.clear();
  m_queue.reset();
}

std::optional<Command> Command_rx::recv()
{
  detail::Command_queue::Unique_lock lock(m_queue->m_mutex);
  while (m_queue->m_cmds.empty() && (!m_queue->m_tx_gone))
  {
    m_queue->m_cond.wait(lock);
  }

  if (m_queue->m_cmds.empty())
  {
    return std::nullopt; // Senders gone; queue drained.
  }
  // else

  std::optional<Command> cmd(std::move(m_queue->m_cmds.front()));
  m_queue->m_cmds.pop_front();
  return cmd;
}

std::optional<Command> Command_rx::try_recv()
{
  detail::Command_queue::Lock_guard lock(m_queue->m_mutex);
  if (m_queue->m_cmds.empty())
  {
    return std::nullopt;
  }
  // else

  std::optional<Command> cmd(std::move(m_queue->m_cmds.front()));
  m_queue->m_cmds.pop_front();
  return cmd;
}

size_t Command_rx::n_pending() const
{
  detail::Command_queue::Lock_guard lock(m_queue->m_mutex);
  return m_queue->m_cmds.size();
}

// Free function implementations.

std::pair<Command_tx, Command_rx> make_command_channel()
{
  auto queue = boost::make_shared<detail::Command_queue>();
  return { Command_tx(boost::make_shared<detail::Command_tx_token>(queue)), Command_rx(queue) };
}

namespace detail
{

// Command_tx_token implementations.

Command_tx_token::Command_tx_token(boost::shared_ptr<Command_queue> queue) :
  m_queue(std::move(queue))
{
  // That's it.
}

Command_tx_token::~Command_tx_token()
{
  {
    Command_queue::Lock_guard lock(m_queue->m_mutex);
    m_queue->m_tx_gone = true;
  }
  m_queue->m_cond.notify_all();
}

Command_queue* Command_tx_token::queue() const
{
  return m_queue.get();
}

} // namespace detail

} // namespace coord::client
