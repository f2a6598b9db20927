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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/unordered_map.hpp>
#include <string>
#include <cstdint>

/**
 * Catch-all namespace for the coordinator client project.  The one module, coord::client, is the client-side
 * protocol layer through which many concurrent connections talk to a single serially-executing database
 * *coordinator*: see that namespace's doc header.  This namespace itself holds only the few items shared by all
 * of it: error-code short-hands and the logging component enumeration.
 */
namespace coord
{

// Types.

/// Short-hand for the boost.system error code used throughout; identical to Flow's.
using Error_code = flow::Error_code;

/// Short-hand for the high-res duration type used for bounded waits.
using Fine_duration = flow::Fine_duration;

/// Short-hand for the high-res clock's time point.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for the high-res clock.
using Fine_clock = flow::Fine_clock;

/// Short-hand for polymorphic function object (loosely, std::function).
template<typename Signature>
using Function = flow::Function<Signature>;

/**
 * The `flow::log` components used by this project.  Pass to `flow::log::Log_context` ctor (or
 * `FLOW_LOG_SET_CONTEXT()`), and register names for it via #S_COORD_LOG_COMPONENT_NAME_MAP in your
 * `flow::log::Config`.
 */
enum class Log_component
{
  /// Catch-all.
  S_UNCAT = 0,

  /// The client handles and their lifecycles: Client, Conn_client, Handle.
  S_CLIENT,

  /// Connection-identifier allocation.
  S_ID_ALLOC,

  /// Requests to the coordinator: Session_client traffic.
  S_COMMAND,

  /// SENTINEL: Not a component.  Keep last.
  S_END_SENTINEL
}; // enum class Log_component

// Data.

/**
 * Names of #Log_component values, for `flow::log::Config::init_component_names()`.  E.g., after giving
 * it prefix "coord-" the S_CLIENT component shows up in logs as "coord-client".
 */
extern const boost::unordered_multimap<Log_component, std::string> S_COORD_LOG_COMPONENT_NAME_MAP;

} // namespace coord
