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
#include <flow/util/util.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/lock_types.hpp>

namespace coord::client
{

// Types.

/**
 * Write end of a cancellation signal: a single-slot, last-value-wins broadcast of a Cancelled value.  Each write
 * overwrites the slot; nothing is queued.  A reader that was not looking while two writes happened sees only the
 * second.
 *
 * There is exactly one Cancel_sender per signal.  It is shared (via `boost::shared_ptr`) between the
 * Session_client -- which writes Cancelled::S_NOT_CANCELLED to reset the signal -- and the coordinator, which
 * receives it in the Startup command and writes Cancelled::S_CANCELLED upon a valid cancel request.  When it is
 * destroyed, readers blocked waiting for a change wake up and learn the signal is closed.
 *
 * ### Thread safety ###
 * All methods may be invoked concurrently with each other and with any Cancel_receiver methods.
 */
class Cancel_sender :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Creates the signal, holding `initial`.
   *
   * @param initial
   *        Initial value.
   */
  explicit Cancel_sender(Cancelled initial);

  /// Closes the signal: readers blocked in Cancel_receiver::changed() wake with Cancel_receiver::Change::S_CLOSED.
  ~Cancel_sender();

  // Methods.

  /**
   * Overwrites the value and wakes up all readers waiting for a change.  A write always counts as a change, even
   * if `val` equals the existing value.
   *
   * @param val
   *        New value.
   */
  void send(Cancelled val);

  /**
   * Returns the current value.
   * @return See above.
   */
  Cancelled current() const;

  /**
   * Returns a new read end, which regards the current value as already seen.
   *
   * @return See above.
   */
  Cancel_receiver subscribe() const;

private:
  // Data.

  /// The slot itself, shared with all Cancel_receiver objects.
  boost::shared_ptr<detail::Cancel_slot> m_slot;
}; // class Cancel_sender

/**
 * Read end of a cancellation signal: see Cancel_sender.  Copy it freely: each copy tracks, independently, which
 * write it saw last, starting with whatever the source had seen.
 *
 * ### Thread safety ###
 * A given Cancel_receiver object must not be used concurrently; different copies may.
 */
class Cancel_receiver
{
public:
  // Types.

  /// Outcome of waiting for a change.
  enum class Change
  {
    /// A write not yet seen by `*this` exists; it is now marked seen.
    S_CHANGED,

    /// No unseen write exists, and none ever will: the Cancel_sender is gone.
    S_CLOSED,

    /// Deadline reached without an unseen write.
    S_TIMED_OUT
  };

  // Constructors/destructor.

  /// Copy-constructs.  Generated.
  Cancel_receiver(const Cancel_receiver&) = default;

  // Methods.

  /// Copy-assigns.  Generated.
  Cancel_receiver& operator=(const Cancel_receiver&) = default;

  /**
   * Returns the current value, without marking it seen.
   * @return See above.
   */
  Cancelled current() const;

  /**
   * Blocks until there is a write that `*this` has not seen (maybe immediately), and marks it seen; or until the
   * signal closes.  Note: "changed" means "written to since last seen," not "now holds a different value";
   * the caller should check the value and loop, if it cares about a particular one.
   *
   * @param seen_val_or_null
   *        If not null, and the result is Change::S_CHANGED, `*seen_val_or_null` is set to the value marked seen,
   *        read together with the version.  (A later current() may already report a newer write.)
   * @return Change::S_CHANGED or Change::S_CLOSED.
   */
  Change changed(Cancelled* seen_val_or_null = 0);

  /**
   * Identical to changed() but gives up at `deadline`.
   *
   * @param deadline
   *        When to give up.
   * @param seen_val_or_null
   *        See changed().
   * @return Any Change value.
   */
  Change changed_until(const Fine_time_pt& deadline, Cancelled* seen_val_or_null = 0);

private:
  // Friends.

  /// Only the sender can create the first receiver.
  friend class Cancel_sender;

  // Constructors.

  /**
   * Constructs read end of `slot`, regarding `seen_version` as seen.
   *
   * @param slot
   *        The slot.
   * @param seen_version
   *        Version of the latest write regarded as seen.
   */
  explicit Cancel_receiver(boost::shared_ptr<detail::Cancel_slot> slot, uint64_t seen_version);

  // Methods.

  /**
   * Implements changed() and changed_until().
   *
   * @param deadline_or_null
   *        Deadline or null meaning wait indefinitely.
   * @param seen_val_or_null
   *        See changed().
   * @return See callers.
   */
  Change changed_impl(const Fine_time_pt* deadline_or_null, Cancelled* seen_val_or_null);

  // Data.

  /// The slot itself, shared with the Cancel_sender and other receivers.
  boost::shared_ptr<detail::Cancel_slot> m_slot;

  /// Version of the latest write `*this` has seen.
  uint64_t m_seen_version;
}; // class Cancel_receiver

/**
 * A pending observation of a connection's cancellation signal, as returned by Session_client::canceled().
 * It *resolves* when the signal is found to hold Cancelled::S_CANCELLED after a write not seen at the time the
 * Cancel_waiter was created (or a write pending, unseen, at that time).  Writes of Cancelled::S_NOT_CANCELLED --
 * spurious from the waiter's point of view -- are skipped over.
 *
 * The Cancel_waiter is independent of the Session_client that made it; e.g., it can be handed to another thread
 * which waits on it while the Session_client is blocked in a request.
 *
 * Since the signal keeps only the latest value, a cancellation overwritten by a reset before the waiter wakes up
 * is never observed: e.g., Cancelled::S_CANCELLED then Cancelled::S_NOT_CANCELLED, both written while the waiter
 * was not looking, leave it unresolved.  Resetting is the Session_client owner's act, so this only happens if
 * that owner calls Session_client::reset_canceled() while another thread still waits on an older observation.
 */
class Cancel_waiter
{
public:
  // Constructors/destructor.

  /**
   * Constructs waiter observing via a copy of `rx`.
   *
   * @param rx
   *        Read end of the signal.
   */
  explicit Cancel_waiter(const Cancel_receiver& rx);

  // Methods.

  /**
   * Blocks until resolution (see class doc header).
   *
   * @return `true` on resolution; `false` if the signal closed first, so that it can never resolve.
   */
  bool wait();

  /**
   * Blocks until resolution (see class doc header) but no longer than `timeout`.
   *
   * @param timeout
   *        Maximum time to wait.
   * @return `true` on resolution; `false` on timeout or if the signal closed first.
   */
  bool wait_for(const Fine_duration& timeout);

private:
  // Data.

  /// Our private read end.
  Cancel_receiver m_rx;

  /// Whether resolution was already observed; then further waits return immediately.
  bool m_resolved;
}; // class Cancel_waiter

namespace detail
{

/**
 * The state shared between a Cancel_sender and its Cancel_receiver objects.
 */
struct Cancel_slot
{
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for #Mutex lock that can be waited on via #m_changed_cond.
  using Unique_lock = boost::unique_lock<Mutex>;

  // Data.

  /// Protects the following.
  mutable Mutex m_mutex;

  /// Signaled upon each write and upon closing.
  boost::condition_variable_any m_changed_cond;

  /// The value.
  Cancelled m_value;

  /// Incremented upon each write; 0 for the initial value.
  uint64_t m_version;

  /// Whether the Cancel_sender is gone.
  bool m_closed;
}; // struct Cancel_slot

} // namespace detail

} // namespace coord::client
