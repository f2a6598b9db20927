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
#include "test_coordinator.hpp"
#include "coord/client/error.hpp"
#include <sstream>
#include <variant>

namespace coord::client::test
{

// Static initializers.

const std::string Test_coordinator::S_BAD_USER = "mallory";
const std::string Test_coordinator::S_SLOW_SQL = "SELECT pg_sleep(3600)";
const std::string Test_coordinator::S_DROP_SQL = "SELECT crash()";
const std::string Test_coordinator::S_FAIL_SQL = "SELECT 1/0";

// Types.

struct Test_coordinator::Dispatcher
{
  Test_coordinator* m_coord;

  template<typename Cmd>
  void operator()(Cmd& cmd) const
  {
    m_coord->on_cmd(cmd);
  }
};

// Implementations.

Test_coordinator::Test_coordinator(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_UNCAT),
  m_n_terminated(0),
  m_n_cancels_honored(0),
  m_n_cancels_ignored(0)
{
  // That's it.
}

void Test_coordinator::serve(Command_rx& cmd_rx)
{
  while (auto cmd = cmd_rx.recv())
  {
    FLOW_LOG_TRACE("Test_coordinator: Got [" << *cmd << "].");
    std::visit(Dispatcher{ this }, *cmd);
  }

  /* Anything still parked belongs to a connection that went away without terminating; can't happen in a correct
   * test.  Dropping it breaks its reply slot, as would a real coordinator. */
  Lock_guard lock(m_mutex);
  m_conns.clear();
}

void Test_coordinator::on_cmd(command::Startup& cmd)
{
  if (cmd.m_session.user() == S_BAD_USER)
  {
    cmd.m_reply.set_value({ std::move(cmd.m_session), error::Code::S_STARTUP_REJECTED, {} });
    return;
  }
  // else

  {
    Lock_guard lock(m_mutex);
    m_conns[cmd.m_session.conn_id()] = Conn_state{ cmd.m_session.secret_key(), cmd.m_cancel_tx, std::nullopt };
  }

  Startup_response rsp;
  rsp.m_notices.push_back("server_version=coord-test");
  cmd.m_reply.set_value({ std::move(cmd.m_session), {}, std::move(rsp) });
}

void Test_coordinator::on_cmd(command::Describe& cmd)
{
  const bool named = !cmd.m_name.empty();
  const bool exists = cmd.m_session.prepared_statement(cmd.m_name) != nullptr;

  Error_code err_code;
  if (cmd.m_stmt && (cmd.m_stmt->m_sql.find("bogus") != std::string::npos))
  {
    err_code = error::Code::S_STATEMENT_INVALID;
  }
  else if (named && cmd.m_stmt && exists)
  {
    err_code = error::Code::S_DUPLICATE_PREPARED_STATEMENT;
  }
  else if (named && (!cmd.m_stmt))
  {
    if (!exists)
    {
      err_code = error::Code::S_UNKNOWN_PREPARED_STATEMENT;
    }
    // else: Describing an existing statement changes nothing.
  }
  else
  {
    cmd.m_session.set_prepared_statement(cmd.m_name, Prepared_statement{ cmd.m_stmt, cmd.m_param_types });
  }
  cmd.m_reply.set_value({ std::move(cmd.m_session), err_code, {} });
}

void Test_coordinator::on_cmd(command::Declare& cmd)
{
  Error_code err_code;
  if (cmd.m_stmt.m_sql.find("bogus") != std::string::npos)
  {
    err_code = error::Code::S_STATEMENT_INVALID;
  }
  else if (!cmd.m_session.set_portal(cmd.m_name, Portal{ cmd.m_stmt, cmd.m_param_types }))
  {
    err_code = error::Code::S_DUPLICATE_PORTAL;
  }
  cmd.m_reply.set_value({ std::move(cmd.m_session), err_code, {} });
}

void Test_coordinator::on_cmd(command::Execute& cmd)
{
  const auto portal = cmd.m_session.portal(cmd.m_portal_name);
  if (!portal)
  {
    cmd.m_reply.set_value({ std::move(cmd.m_session), error::Code::S_UNKNOWN_PORTAL, {} });
    return;
  }
  // else

  if (cmd.m_session.transaction_status() == Transaction_status::S_FAILED)
  {
    cmd.m_reply.set_value({ std::move(cmd.m_session), error::Code::S_EXECUTION_FAILED, {} });
    return;
  }
  // else

  const std::string sql = portal->m_stmt.m_sql;
  if (sql == S_FAIL_SQL)
  {
    if (cmd.m_session.transaction_status() == Transaction_status::S_IN_TRANSACTION)
    {
      cmd.m_session.set_transaction_status(Transaction_status::S_FAILED);
    }
    cmd.m_reply.set_value({ std::move(cmd.m_session), error::Code::S_EXECUTION_FAILED, {} });
    return;
  }
  // else

  if (sql == S_DROP_SQL)
  {
    FLOW_LOG_INFO("Test_coordinator: Dropping request on the floor as instructed.");
    return; // `cmd` dies with its promise unfulfilled.
  }
  // else

  if (sql == S_SLOW_SQL)
  {
    const auto conn_id = cmd.m_session.conn_id();
    {
      Lock_guard lock(m_mutex);
      m_conns.at(conn_id).m_parked.emplace(std::move(cmd));
      m_parked_conns.insert(conn_id);
    }
    m_parked_cond.notify_all();
    return;
  }
  // else

  Execute_response rsp;
  if (sql.empty())
  {
    rsp.m_kind = Execute_response::Kind::S_EMPTY_QUERY;
  }
  else if (sql == "BEGIN")
  {
    cmd.m_session.set_transaction_status(Transaction_status::S_IN_TRANSACTION);
    rsp.m_kind = Execute_response::Kind::S_COMMAND_COMPLETE;
    rsp.m_tag = "BEGIN";
  }
  else if (sql.compare(0, 6, "INSERT") == 0)
  {
    rsp.m_kind = Execute_response::Kind::S_ROWS_AFFECTED;
    rsp.m_tag = "INSERT";
    rsp.m_n_rows_affected = 1;
  }
  else
  {
    rsp.m_kind = Execute_response::Kind::S_ROWS;
    rsp.m_column_names.push_back("echo");
    rsp.m_rows.push_back(Execute_response::Row{ sql });
  }
  cmd.m_reply.set_value({ std::move(cmd.m_session), {}, std::move(rsp) });
} // Test_coordinator::on_cmd(Execute)

void Test_coordinator::on_cmd(command::Commit& cmd)
{
  if (cmd.m_session.transaction_status() == Transaction_status::S_IDLE)
  {
    cmd.m_reply.set_value({ std::move(cmd.m_session), error::Code::S_NO_ACTIVE_TRANSACTION, {} });
    return;
  }
  // else

  Execute_response rsp;
  rsp.m_kind = Execute_response::Kind::S_TRANSACTION_EXITED;
  rsp.m_tag = ((cmd.m_action == End_transaction_action::S_COMMIT)
                && (cmd.m_session.transaction_status() == Transaction_status::S_IN_TRANSACTION))
                 ? "COMMIT" : "ROLLBACK";

  cmd.m_session.set_transaction_status(Transaction_status::S_IDLE);
  cmd.m_session.clear_portals();
  cmd.m_reply.set_value({ std::move(cmd.m_session), {}, std::move(rsp) });
}

void Test_coordinator::on_cmd(command::Dump_catalog& cmd)
{
  std::ostringstream os;
  os << "prepared_statements=" << cmd.m_session.prepared_statements().size()
     << " portals=" << cmd.m_session.portals().size();
  cmd.m_reply.set_value({ std::move(cmd.m_session), {}, os.str() });
}

void Test_coordinator::on_cmd(command::Terminate& cmd)
{
  Lock_guard lock(m_mutex);
  m_conns.erase(cmd.m_session.conn_id());
  ++m_n_terminated;
}

void Test_coordinator::on_cmd(command::Cancel_request& cmd)
{
  std::optional<command::Execute> parked;
  {
    Lock_guard lock(m_mutex);

    const auto it = m_conns.find(cmd.m_conn_id);
    if ((it == m_conns.end()) || (it->second.m_secret_key != cmd.m_secret_key))
    {
      FLOW_LOG_INFO("Test_coordinator: Ignoring cancel request for conn [" << cmd.m_conn_id << "]: no such "
                    "connection or wrong secret.");
      ++m_n_cancels_ignored;
      return;
    }
    // else

    ++m_n_cancels_honored;
    it->second.m_cancel_tx->send(Cancelled::S_CANCELLED);
    parked.swap(it->second.m_parked);
    m_parked_conns.erase(cmd.m_conn_id);
  }

  if (!parked)
  {
    return;
  }
  // else

  auto& session = parked->m_session;
  if (session.transaction_status() == Transaction_status::S_IN_TRANSACTION)
  {
    session.set_transaction_status(Transaction_status::S_FAILED);
    parked->m_reply.set_value({ std::move(session), error::Code::S_OPERATION_CANCELED, {} });
    return;
  }
  // else

  Execute_response rsp;
  rsp.m_kind = Execute_response::Kind::S_CANCELED;
  parked->m_reply.set_value({ std::move(session), {}, std::move(rsp) });
}

void Test_coordinator::await_parked(Connection_id conn_id) const
{
  boost::unique_lock<Mutex> lock(m_mutex);
  while (m_parked_conns.count(conn_id) == 0)
  {
    m_parked_cond.wait(lock);
  }
}

size_t Test_coordinator::n_terminated() const
{
  Lock_guard lock(m_mutex);
  return m_n_terminated;
}

size_t Test_coordinator::n_cancels_honored() const
{
  Lock_guard lock(m_mutex);
  return m_n_cancels_honored;
}

size_t Test_coordinator::n_cancels_ignored() const
{
  Lock_guard lock(m_mutex);
  return m_n_cancels_ignored;
}

} // namespace coord::client::test
