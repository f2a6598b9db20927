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

namespace coord::client
{

// Types.

/**
 * Configuration of a Client (and thus every Conn_client and Session_client minted from it, as well as the
 * Handle that creates the first Client).  This is a data store (and a simple one): fill it out, then pass it
 * by `const` reference; the Client copies what it needs.
 *
 * ### Connection identifier range ###
 * Each live Conn_client holds a unique #Connection_id from the range [#m_conn_id_first, #m_conn_id_end).  The
 * range bounds how many connections can be live at once; once all are taken Client::new_conn() fails with
 * error::Code::S_CONN_ID_EXHAUSTED until some Conn_client goes away.  It must be non-empty.  The default
 * range is large (tens of thousands), so that in practice identifiers remain unique across the lifetimes of all
 * overlapping connections; 0 is excluded by default, as some wire protocols reserve it.
 */
struct Client_config
{
  // Constants.

  /// Default for #m_conn_id_first.
  static constexpr Connection_id S_DEFAULT_CONN_ID_FIRST = 1;

  /// Default for #m_conn_id_end.
  static constexpr Connection_id S_DEFAULT_CONN_ID_END = Connection_id(1) << 16;

  // Data.

  /// Lowest allocatable connection identifier (inclusive).
  Connection_id m_conn_id_first = S_DEFAULT_CONN_ID_FIRST;

  /// One past the highest allocatable connection identifier (exclusive).  Must exceed #m_conn_id_first.
  Connection_id m_conn_id_end = S_DEFAULT_CONN_ID_END;
}; // struct Client_config

// Free functions: in *_fwd.hpp.

} // namespace coord::client
