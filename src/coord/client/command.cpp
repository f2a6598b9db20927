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
#include "coord/client/command.hpp"
#include <ostream>

namespace coord::client
{

namespace
{

/// Visitor for `operator<<(ostream&, const Command&)`.
struct Command_printer
{
  /// Target stream.
  std::ostream& m_os;

  void operator()(const command::Startup& cmd) const
  {
    m_os << "STARTUP{session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Describe& cmd) const
  {
    m_os << "DESCRIBE{name[" << cmd.m_name << "] sql[";
    if (cmd.m_stmt)
    {
      m_os << cmd.m_stmt->m_sql;
    }
    m_os << "] n_params[" << cmd.m_param_types.size() << "] session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Declare& cmd) const
  {
    m_os << "DECLARE{name[" << cmd.m_name << "] sql[" << cmd.m_stmt.m_sql << "] "
            "n_params[" << cmd.m_param_types.size() << "] session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Execute& cmd) const
  {
    m_os << "EXECUTE{portal[" << cmd.m_portal_name << "] session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Commit& cmd) const
  {
    m_os << "COMMIT{action[" << cmd.m_action << "] session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Dump_catalog& cmd) const
  {
    m_os << "DUMP_CATALOG{session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Terminate& cmd) const
  {
    m_os << "TERMINATE{session[" << cmd.m_session << "]}";
  }

  void operator()(const command::Cancel_request& cmd) const
  {
    m_os << "CANCEL_REQUEST{conn[" << cmd.m_conn_id << "]}";
  }
}; // struct Command_printer

} // namespace (anon)

std::ostream& command::operator<<(std::ostream& os, const Command& val)
{
  std::visit(Command_printer{os}, val);
  return os;
}

std::ostream& operator<<(std::ostream& os, Execute_response::Kind val)
{
  using Kind = Execute_response::Kind;
  switch (val)
  {
  case Kind::S_ROWS:
    return os << "ROWS";
  case Kind::S_ROWS_AFFECTED:
    return os << "ROWS_AFFECTED";
  case Kind::S_COMMAND_COMPLETE:
    return os << "COMMAND_COMPLETE";
  case Kind::S_TRANSACTION_EXITED:
    return os << "TRANSACTION_EXITED";
  case Kind::S_CANCELED:
    return os << "CANCELED";
  case Kind::S_EMPTY_QUERY:
    return os << "EMPTY_QUERY";
  }
  return os << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, const Execute_response& val)
{
  using Kind = Execute_response::Kind;

  os << val.m_kind;
  switch (val.m_kind)
  {
  case Kind::S_ROWS:
    return os << " cols[" << val.m_column_names.size() << "] rows[" << val.m_rows.size() << ']';
  case Kind::S_ROWS_AFFECTED:
    return os << " tag[" << val.m_tag << "] n[" << val.m_n_rows_affected << ']';
  case Kind::S_COMMAND_COMPLETE:
  case Kind::S_TRANSACTION_EXITED:
    return os << " tag[" << val.m_tag << ']';
  case Kind::S_CANCELED:
  case Kind::S_EMPTY_QUERY:
    break;
  }
  return os;
}

} // namespace coord::client
