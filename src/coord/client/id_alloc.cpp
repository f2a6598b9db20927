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
#include "coord/client/id_alloc.hpp"
#include "coord/client/error.hpp"
#include <flow/error/error.hpp>

namespace coord::client
{

// Implementations.

Id_allocator::Id_allocator(flow::log::Logger* logger_ptr, Connection_id first, Connection_id end) :
  flow::log::Log_context(logger_ptr, Log_component::S_ID_ALLOC),
  m_first(first),
  m_end(end),
  m_cursor(first)
{
  using flow::error::Runtime_error;

  if (m_end <= m_first)
  {
    FLOW_LOG_WARNING("Id_allocator [" << this << "]: Range [" << m_first << ", " << m_end << ") is empty.");
    throw Runtime_error(error::Code::S_INVALID_ARGUMENT, "Id_allocator::Id_allocator()");
  }
  // else

  FLOW_LOG_TRACE("Id_allocator [" << this << "]: Created; range [" << m_first << ", " << m_end << ").");
}

Connection_id Id_allocator::alloc(Error_code* err_code)
{
  Connection_id id;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Connection_id { return alloc(actual_err_code); },
         &id, err_code, "Id_allocator::alloc()"))
  {
    return id;
  }
  // else

  const uint64_t range_sz = uint64_t(m_end) - uint64_t(m_first);

  Lock_guard lock(m_mutex);

  if (m_in_use.size() >= range_sz)
  {
    *err_code = error::Code::S_CONN_ID_EXHAUSTED;
    FLOW_LOG_WARNING("Id_allocator [" << this << "]: All [" << range_sz << "] values of range "
                     "[" << m_first << ", " << m_end << ") are in use.  Emitting error.");
    return 0;
  }
  // else

  /* There's at least 1 free value, so the scan terminates within range_sz steps.  Typically the cursor's
   * value is itself free, and we're done right away. */
  id = m_cursor;
  while (m_in_use.count(id) != 0)
  {
    id = (id + 1 == m_end) ? m_first : (id + 1);
  }

  m_in_use.insert(id);
  m_cursor = (id + 1 == m_end) ? m_first : (id + 1);

  err_code->clear();
  FLOW_LOG_TRACE("Id_allocator [" << this << "]: Allocated [" << id << "]; "
                 "[" << m_in_use.size() << "] of [" << range_sz << "] now in use.");
  return id;
} // Id_allocator::alloc()

void Id_allocator::free(Connection_id id)
{
  Lock_guard lock(m_mutex);

  if (m_in_use.erase(id) == 0)
  {
    FLOW_LOG_WARNING("Id_allocator [" << this << "]: Asked to free [" << id << "] which is not allocated.  "
                     "Caller bug?  Ignoring.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Id_allocator [" << this << "]: Freed [" << id << "]; "
                 "[" << m_in_use.size() << "] now in use.");
}

bool Id_allocator::allocated(Connection_id id) const
{
  Lock_guard lock(m_mutex);
  return m_in_use.count(id) != 0;
}

size_t Id_allocator::n_allocated() const
{
  Lock_guard lock(m_mutex);
  return m_in_use.size();
}

Connection_id Id_allocator::first() const
{
  return m_first;
}

Connection_id Id_allocator::end() const
{
  return m_end;
}

} // namespace coord::client
