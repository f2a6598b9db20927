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

#include "coord/client/command.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/lock_types.hpp>
#include <boost/noncopyable.hpp>
#include <deque>
#include <optional>
#include <utility>

namespace coord::client
{

// Types.

/**
 * Send end of the command channel: the one path from every Conn_client and Session_client to the coordinator.
 * The channel is an unbounded multi-producer/single-consumer FIFO of Command; hence send() never blocks (beyond
 * a brief internal lock).
 *
 * Copy it freely; copies share the same channel.  Once the last copy is destroyed, the Command_rx learns that no
 * more commands can ever arrive (after draining the queue).
 *
 * ### Thread safety ###
 * send() may be invoked concurrently on the same or different objects.
 */
class Command_tx
{
public:
  // Methods.

  /**
   * Enqueues `cmd` for the coordinator.  On success `cmd` is moved-from; on failure it is untouched.
   *
   * @param cmd
   *        Command to send.
   * @return `false` if and only if the Command_rx is gone (coordinator no longer consuming).
   */
  bool send(Command&& cmd) const;

private:
  // Friends.

  /// The factory.
  friend std::pair<Command_tx, Command_rx> make_command_channel();

  // Constructors.

  /**
   * Constructs send end.
   * @param token
   *        Token shared by all copies of the send end.
   */
  explicit Command_tx(boost::shared_ptr<detail::Command_tx_token> token);

  // Data.

  /// The token; its destruction (when the last Command_tx goes away) closes the sending side.
  boost::shared_ptr<detail::Command_tx_token> m_token;
}; // class Command_tx

/**
 * Receive end of the command channel: see Command_tx.  Exactly one exists per channel; it belongs to the
 * coordinator (typically the serve function given to Handle).
 *
 * Destroying it closes the channel for senders (their Command_tx::send() starts failing) and destroys any
 * commands still queued -- which breaks their reply slots, so that requesters waiting on them find out (fatally).
 *
 * ### Thread safety ###
 * Not safe for concurrent use of one object.
 */
class Command_rx :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Move-constructs.
   * @param src
   *        Moved-from object; it becomes usable only for destruction or being moved-to.
   */
  Command_rx(Command_rx&& src);

  /// Closes the channel; see class doc header.
  ~Command_rx();

  // Methods.

  /**
   * Move-assigns.  Any channel held by `*this` is closed first.
   *
   * @param src
   *        See move ctor.
   * @return `*this`.
   */
  Command_rx& operator=(Command_rx&& src);

  /**
   * Blocks until a command is available and dequeues it; or until no command can ever arrive (queue empty, all
   * Command_tx gone).
   *
   * @return The command; or empty `optional` if the channel is closed and drained.
   */
  std::optional<Command> recv();

  /**
   * Dequeues a command if one is available immediately.
   *
   * @return The command; or empty `optional` if none is queued.
   */
  std::optional<Command> try_recv();

  /**
   * Number of commands in queue.
   * @return See above.
   */
  size_t n_pending() const;

private:
  // Friends.

  /// The factory.
  friend std::pair<Command_tx, Command_rx> make_command_channel();

  // Constructors.

  /**
   * Constructs receive end.
   * @param queue
   *        The queue.
   */
  explicit Command_rx(boost::shared_ptr<detail::Command_queue> queue);

  // Methods.

  /// Closes the channel and drops queued commands if `*this` is not moved-from; otherwise no-op.
  void close();

  // Data.

  /// The queue; null if moved-from.
  boost::shared_ptr<detail::Command_queue> m_queue;
}; // class Command_rx

// Free functions.

/**
 * Creates a fresh command channel and returns its two ends.
 *
 * @return The send end (copy it for each sender) and the receive end (give it to the coordinator).
 */
std::pair<Command_tx, Command_rx> make_command_channel();

namespace detail
{

/// The state shared between all Command_tx copies and the Command_rx of a channel.
struct Command_queue
{
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for #Mutex lock that can be waited on via #m_cond.
  using Unique_lock = boost::unique_lock<Mutex>;

  // Data.

  /// Protects the following.
  mutable Mutex m_mutex;

  /// Signaled upon each enqueue and upon the senders going away.
  boost::condition_variable_any m_cond;

  /// The commands, oldest first.
  std::deque<Command> m_cmds;

  /// Whether every Command_tx is gone.
  bool m_tx_gone = false;

  /// Whether the Command_rx is gone.
  bool m_rx_gone = false;
}; // struct Command_queue

/// Shared by all copies of a Command_tx: when the last one goes away, so does this, marking the senders gone.
class Command_tx_token :
  private boost::noncopyable
{
public:
  /**
   * Constructs token.
   * @param queue
   *        The queue.
   */
  explicit Command_tx_token(boost::shared_ptr<Command_queue> queue);

  /// Marks senders gone and wakes up a blocked Command_rx::recv().
  ~Command_tx_token();

  /**
   * The queue.
   * @return See above.
   */
  Command_queue* queue() const;

private:
  /// The queue.
  boost::shared_ptr<Command_queue> m_queue;
}; // class Command_tx_token

} // namespace detail

} // namespace coord::client
