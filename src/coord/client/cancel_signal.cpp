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
#include "coord/client/cancel_signal.hpp"
#include <boost/make_shared.hpp>
#include <ostream>

namespace coord::client
{

// Cancel_sender implementations.

Cancel_sender::Cancel_sender(Cancelled initial) :
  m_slot(boost::make_shared<detail::Cancel_slot>())
{
  m_slot->m_value = initial;
  m_slot->m_version = 0;
  m_slot->m_closed = false;
}

Cancel_sender::~Cancel_sender()
{
  {
    detail::Cancel_slot::Lock_guard lock(m_slot->m_mutex);
    m_slot->m_closed = true;
  }
  m_slot->m_changed_cond.notify_all();
}

void Cancel_sender::send(Cancelled val)
{
  {
    detail::Cancel_slot::Lock_guard lock(m_slot->m_mutex);
    m_slot->m_value = val;
    ++m_slot->m_version;
  }
  m_slot->m_changed_cond.notify_all();
}

Cancelled Cancel_sender::current() const
{
  detail::Cancel_slot::Lock_guard lock(m_slot->m_mutex);
  return m_slot->m_value;
}

Cancel_receiver Cancel_sender::subscribe() const
{
  uint64_t version;
  {
    detail::Cancel_slot::Lock_guard lock(m_slot->m_mutex);
    version = m_slot->m_version;
  }
  return Cancel_receiver(m_slot, version);
}

// Cancel_receiver implementations.

Cancel_receiver::Cancel_receiver(boost::shared_ptr<detail::Cancel_slot> slot, uint64_t seen_version) :
  m_slot(std::move(slot)),
  m_seen_version(seen_version)
{
  // That's it.
}

Cancelled Cancel_receiver::current() const
{
  detail::Cancel_slot::Lock_guard lock(m_slot->m_mutex);
  return m_slot->m_value;
}

Cancel_receiver::Change Cancel_receiver::changed(Cancelled* seen_val_or_null)
{
  return changed_impl(nullptr, seen_val_or_null);
}

Cancel_receiver::Change Cancel_receiver::changed_until(const Fine_time_pt& deadline, Cancelled* seen_val_or_null)
{
  return changed_impl(&deadline, seen_val_or_null);
}

Cancel_receiver::Change Cancel_receiver::changed_impl(const Fine_time_pt* deadline_or_null,
                                                      Cancelled* seen_val_or_null)
{
  detail::Cancel_slot::Unique_lock lock(m_slot->m_mutex);

  /* An unseen write takes precedence over closure: a value written just before the sender went away
   * is still delivered. */
  while ((m_slot->m_version == m_seen_version) && (!m_slot->m_closed))
  {
    if (!deadline_or_null)
    {
      m_slot->m_changed_cond.wait(lock);
    }
    else if (m_slot->m_changed_cond.wait_until(lock, *deadline_or_null) == boost::cv_status::timeout)
    {
      if (m_slot->m_version == m_seen_version)
      {
        return m_slot->m_closed ? Change::S_CLOSED : Change::S_TIMED_OUT;
      }
      // else: a write raced with the timeout; take it.
      break;
    }
  }

  if (m_slot->m_version == m_seen_version)
  {
    return Change::S_CLOSED;
  }
  // else

  m_seen_version = m_slot->m_version;
  if (seen_val_or_null)
  {
    *seen_val_or_null = m_slot->m_value;
  }
  return Change::S_CHANGED;
} // Cancel_receiver::changed_impl()

// Cancel_waiter implementations.

Cancel_waiter::Cancel_waiter(const Cancel_receiver& rx) :
  m_rx(rx),
  m_resolved(false)
{
  // That's it.
}

bool Cancel_waiter::wait()
{
  /* The signal tells us "it was written," not "it now says X."  So a write of NOT_CANCELLED (a reset) wakes us
   * just the same; skip those and keep going until CANCELLED is observed. */
  Cancelled seen_val;
  while (!m_resolved)
  {
    if (m_rx.changed(&seen_val) == Cancel_receiver::Change::S_CLOSED)
    {
      return false;
    }
    // else
    m_resolved = seen_val == Cancelled::S_CANCELLED;
  }
  return true;
}

bool Cancel_waiter::wait_for(const Fine_duration& timeout)
{
  const auto deadline = Fine_clock::now() + timeout;

  Cancelled seen_val;
  while (!m_resolved)
  {
    if (m_rx.changed_until(deadline, &seen_val) != Cancel_receiver::Change::S_CHANGED)
    {
      return false;
    }
    // else
    m_resolved = seen_val == Cancelled::S_CANCELLED;
  }
  return true;
}

std::ostream& operator<<(std::ostream& os, Cancelled val)
{
  return os << ((val == Cancelled::S_CANCELLED) ? "CANCELLED" : "NOT_CANCELLED");
}

} // namespace coord::client
