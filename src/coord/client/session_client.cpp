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
#include "coord/client/session_client.hpp"
#include <flow/error/error.hpp>
#include <boost/thread/future.hpp>
#include <cstdlib>

namespace coord::client
{

// Implementations.

Session_client::Session_client() :
  m_state(State::S_NULL)
{
  // That's it.
}

Session_client::Session_client(Conn_client&& conn, Session&& session,
                               const boost::shared_ptr<Cancel_sender>& cancel_tx) :
  flow::log::Log_context(conn.get_logger(), Log_component::S_COMMAND),
  m_state(State::S_ACTIVE),
  m_conn(std::move(conn)),
  m_session(std::move(session)),
  m_cancel_tx(cancel_tx),
  m_cancel_rx(cancel_tx->subscribe())
{
  // That's it.
}

Session_client::Session_client(Session_client&& src) :
  Session_client()
{
  operator=(std::move(src));
}

Session_client::~Session_client()
{
  if ((m_state == State::S_ACTIVE) || (m_state == State::S_IN_REQUEST))
  {
    FLOW_LOG_FATAL("Session_client [" << *this << "]: Destroyed without terminate().  Every started-up "
                   "session must be terminated.  Aborting.");
    std::abort();
  }
}

Session_client& Session_client::operator=(Session_client&& src)
{
  if (&src == this)
  {
    return *this;
  }
  // else

  if ((m_state == State::S_ACTIVE) || (m_state == State::S_IN_REQUEST))
  {
    FLOW_LOG_FATAL("Session_client [" << *this << "]: Move-assigned-to without terminate().  Every started-up "
                   "session must be terminated.  Aborting.");
    std::abort();
  }
  // else

  flow::log::Log_context::operator=(static_cast<const flow::log::Log_context&>(src));
  m_state = src.m_state;
  m_conn = std::move(src.m_conn);
  m_session = std::move(src.m_session);
  m_cancel_tx = std::move(src.m_cancel_tx);
  m_cancel_rx = std::move(src.m_cancel_rx);

  src.m_state = State::S_NULL;
  src.m_session.reset();
  src.m_cancel_tx.reset();
  src.m_cancel_rx.reset();

  return *this;
} // Session_client::operator=(move)

Session_client::State Session_client::state() const
{
  return m_state;
}

bool Session_client::null() const
{
  return m_state == State::S_NULL;
}

Connection_id Session_client::conn_id() const
{
  return m_conn.conn_id();
}

Session& Session_client::session()
{
  ensure_active("session()");
  return *m_session;
}

void Session_client::ensure_active(flow::util::String_view context) const
{
  if (m_state != State::S_ACTIVE)
  {
    FLOW_LOG_FATAL("Session_client [" << *this << "]: " << context << " invoked in state [" << int(m_state) << "]; "
                   "only allowed when active (holding the session).  Aborting.");
    std::abort();
  }
}

template<typename Result_t, typename Make_cmd_func>
Result_t Session_client::request(const Make_cmd_func& make_cmd_func, flow::util::String_view context,
                                 Error_code* err_code)
{
  using Rsp = Response<Result_t>;

  ensure_active(context);

  boost::promise<Rsp> reply;
  auto reply_future = reply.get_future();

  Command cmd = make_cmd_func(std::move(*m_session), std::move(reply));
  m_session.reset();
  m_state = State::S_IN_REQUEST;

  FLOW_LOG_TRACE("Session_client [" << *this << "]: " << context << ": Sending [" << cmd << "]; awaiting reply.");
  m_conn.send_or_abort(std::move(cmd));

  std::optional<Rsp> rsp;
  try
  {
    rsp.emplace(reply_future.get());
  }
  catch (const boost::future_error& exc)
  {
    FLOW_LOG_FATAL("Session_client [" << *this << "]: " << context << ": Coordinator unexpectedly dropped the "
                   "request without replying [" << exc.what() << "].  Aborting.");
    std::abort();
  }

  m_session.emplace(std::move(rsp->m_session));
  m_state = State::S_ACTIVE;

  *err_code = rsp->m_err_code;
  if (*err_code)
  {
    FLOW_LOG_WARNING("Session_client [" << *this << "]: " << context << ": Coordinator reports failure "
                     "[" << *err_code << "] [" << err_code->message() << "].  Session remains usable.");
    return Result_t();
  }
  // else

  FLOW_LOG_TRACE("Session_client [" << *this << "]: " << context << ": Success.");
  return std::move(rsp->m_result);
} // Session_client::request()

void Session_client::handshake(const boost::shared_ptr<Cancel_sender>& cancel_tx, Startup_response* startup_rsp,
                               Error_code* err_code)
{
  using Reply = boost::promise<Response<Startup_response>>;

  auto rsp = request<Startup_response>([&](Session&& session, Reply&& reply) -> Command
  {
    return command::Startup{ std::move(session), cancel_tx, std::move(reply) };
  }, "startup", err_code);

  if (*err_code)
  {
    /* No session client was ever really born: drop the session (no terminate() needed) and release the ID
     * now.  Then we are NULL; destruction will be silent. */
    FLOW_LOG_WARNING("Session_client [" << *this << "]: Startup rejected; discarding session and releasing ID.");
    m_state = State::S_NULL;
    m_session.reset();
    m_conn.release();
    m_cancel_rx.reset();
    m_cancel_tx.reset();
    return;
  }
  // else

  FLOW_LOG_INFO("Session_client [" << *this << "]: Startup done; session [" << *m_session << "]; "
                "[" << rsp.m_notices.size() << "] notices.");
  if (startup_rsp)
  {
    *startup_rsp = std::move(rsp);
  }
} // Session_client::handshake()

void Session_client::describe(const std::string& name, const std::optional<Statement>& stmt,
                              const Param_types& param_types, Error_code* err_code)
{
  using Reply = boost::promise<Response<No_result>>;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { describe(name, stmt, param_types, actual_err_code); },
         err_code, "Session_client::describe()"))
  {
    return;
  }
  // else

  request<No_result>([&](Session&& session, Reply&& reply) -> Command
  {
    return command::Describe{ name, stmt, param_types, std::move(session), std::move(reply) };
  }, "describe", err_code);
}

void Session_client::declare(const std::string& name, const Statement& stmt, const Param_types& param_types,
                             Error_code* err_code)
{
  using Reply = boost::promise<Response<No_result>>;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { declare(name, stmt, param_types, actual_err_code); },
         err_code, "Session_client::declare()"))
  {
    return;
  }
  // else

  request<No_result>([&](Session&& session, Reply&& reply) -> Command
  {
    return command::Declare{ name, stmt, param_types, std::move(session), std::move(reply) };
  }, "declare", err_code);
}

Execute_response Session_client::execute(const std::string& portal_name, Error_code* err_code)
{
  using Reply = boost::promise<Response<Execute_response>>;

  Execute_response rsp;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Execute_response { return execute(portal_name, actual_err_code); },
         &rsp, err_code, "Session_client::execute()"))
  {
    return rsp;
  }
  // else

  return request<Execute_response>([&](Session&& session, Reply&& reply) -> Command
  {
    return command::Execute{ portal_name, std::move(session), std::move(reply) };
  }, "execute", err_code);
}

Execute_response Session_client::end_transaction(End_transaction_action action, Error_code* err_code)
{
  using Reply = boost::promise<Response<Execute_response>>;

  Execute_response rsp;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Execute_response { return end_transaction(action, actual_err_code); },
         &rsp, err_code, "Session_client::end_transaction()"))
  {
    return rsp;
  }
  // else

  return request<Execute_response>([&](Session&& session, Reply&& reply) -> Command
  {
    return command::Commit{ action, std::move(session), std::move(reply) };
  }, "end_transaction", err_code);
}

std::string Session_client::dump_catalog(Error_code* err_code)
{
  using Reply = boost::promise<Response<std::string>>;

  std::string catalog;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> std::string { return dump_catalog(actual_err_code); },
         &catalog, err_code, "Session_client::dump_catalog()"))
  {
    return catalog;
  }
  // else

  return request<std::string>([&](Session&& session, Reply&& reply) -> Command
  {
    return command::Dump_catalog{ std::move(session), std::move(reply) };
  }, "dump_catalog", err_code);
}

void Session_client::cancel_request(Connection_id conn_id, Secret_key secret_key) const
{
  m_conn.cancel_request(conn_id, secret_key); // Fatal if NULL (so, also if we are NULL or terminated).
}

void Session_client::terminate()
{
  ensure_active("terminate()");

  FLOW_LOG_INFO("Session_client [" << *this << "]: Terminating session [" << *m_session << "].");

  Command cmd = command::Terminate{ std::move(*m_session) };
  m_session.reset();
  m_state = State::S_TERMINATED;

  m_conn.send_or_abort(std::move(cmd));
  m_conn.release();
}

Cancel_waiter Session_client::canceled() const
{
  if ((m_state != State::S_ACTIVE) && (m_state != State::S_IN_REQUEST))
  {
    FLOW_LOG_FATAL("Session_client [" << *this << "]: canceled() invoked in state [" << int(m_state) << "]; "
                   "only allowed when active.  Aborting.");
    std::abort();
  }
  // else

  return Cancel_waiter(*m_cancel_rx);
}

void Session_client::reset_canceled()
{
  ensure_active("reset_canceled()");

  m_cancel_tx->send(Cancelled::S_NOT_CANCELLED);
  // Everything up to and including our reset is now old news for future canceled() observations.
  m_cancel_rx = m_cancel_tx->subscribe();
}

std::ostream& operator<<(std::ostream& os, const Session_client& val)
{
  using State = Session_client::State;

  switch (val.state())
  {
  case State::S_NULL:
    return os << "NULL@" << &val;
  case State::S_ACTIVE:
    return os << "conn[" << val.conn_id() << "] ACTIVE@" << &val;
  case State::S_IN_REQUEST:
    return os << "conn[" << val.conn_id() << "] IN_REQUEST@" << &val;
  case State::S_TERMINATED:
    return os << "TERMINATED@" << &val;
  }
  return os << "UNKNOWN@" << &val;
}

} // namespace coord::client
