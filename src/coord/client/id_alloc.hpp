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
#include <boost/unordered_set.hpp>
#include <boost/noncopyable.hpp>

namespace coord::client
{

// Types.

/**
 * Hands out, and takes back, connection identifiers from a fixed range [`first`, `end`).  No value is ever
 * allocated to two holders at once; a freed value eventually becomes allocatable again.
 *
 * ### Allocation policy ###
 * A cursor walks the range round-robin: alloc() returns the first value at or after the cursor (wrapping)
 * that is not in use, then moves the cursor past it.  So a just-freed identifier is reused last rather than
 * first -- any stale reference to it (say, a late cancel request) is then unlikely to hit a brand-new
 * connection.  Worst case alloc() is linear in the range size (nearly-full range); typical case is constant.
 *
 * ### Thread safety ###
 * alloc() and free() may be invoked concurrently from any threads; they are internally synchronized.  Typically
 * one Id_allocator is shared (via `shared_ptr`) among all copies of a Client and all Conn_client objects minted
 * from them, which create and release identifiers from arbitrary connection-handling threads.
 */
class Id_allocator :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs allocator of the range [`first`, `end`) with nothing allocated.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param first
   *        Lowest allocatable value.
   * @param end
   *        One past the highest allocatable value.
   * @throws flow::error::Runtime_error
   *         With error::Code::S_INVALID_ARGUMENT if `end <= first` (empty range).
   */
  explicit Id_allocator(flow::log::Logger* logger_ptr, Connection_id first, Connection_id end);

  // Methods.

  /**
   * Allocates a value not currently allocated.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONN_ID_EXHAUSTED (every value in range is in use).
   * @return The value; or 0 on error (if `err_code` is not null); 0 may well be a valid value, so check
   *         `*err_code`.
   */
  Connection_id alloc(Error_code* err_code = 0);

  /**
   * Returns a value, previously returned by alloc(), to the pool.  It is a caller bug to free a value not
   * currently allocated (or not from this allocator); `*this` logs a WARNING and otherwise ignores such a call,
   * leaving its state intact.
   *
   * @param id
   *        Value to free.
   */
  void free(Connection_id id);

  /**
   * Returns `true` if and only if `id` is currently allocated.
   *
   * @param id
   *        Value to check.
   * @return See above.
   */
  bool allocated(Connection_id id) const;

  /**
   * Returns how many values are currently allocated.
   *
   * @return See above.
   */
  size_t n_allocated() const;

  /**
   * Returns the lowest allocatable value.
   * @return See above.
   */
  Connection_id first() const;

  /**
   * Returns one past the highest allocatable value.
   * @return See above.
   */
  Connection_id end() const;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See first().
  const Connection_id m_first;

  /// See end().
  const Connection_id m_end;

  /// Protects the following mutable state.
  mutable Mutex m_mutex;

  /// Values currently allocated.  Protected by #m_mutex.
  boost::unordered_set<Connection_id> m_in_use;

  /// Where the next alloc() begins its scan; always in [#m_first, #m_end).  Protected by #m_mutex.
  Connection_id m_cursor;
}; // class Id_allocator

} // namespace coord::client
