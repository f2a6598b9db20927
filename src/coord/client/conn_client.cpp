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
#include "coord/client/conn_client.hpp"
#include "coord/client/session_client.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <cstdlib>

namespace coord::client
{

// Implementations.

Conn_client::Conn_client() :
  m_conn_id(0)
{
  // That's it.  NULL.
}

Conn_client::Conn_client(flow::log::Logger* logger_ptr, const Command_tx& cmd_tx,
                         const boost::shared_ptr<Id_allocator>& id_alloc, Connection_id conn_id) :
  flow::log::Log_context(logger_ptr, Log_component::S_CLIENT),
  m_cmd_tx(cmd_tx),
  m_id_alloc(id_alloc),
  m_conn_id(conn_id)
{
  FLOW_LOG_INFO("Conn_client [" << *this << "]: Created.");
}

Conn_client::Conn_client(Conn_client&& src) :
  Conn_client()
{
  operator=(std::move(src));
}

Conn_client::~Conn_client()
{
  release();
}

Conn_client& Conn_client::operator=(Conn_client&& src)
{
  if (&src != this)
  {
    release();

    flow::log::Log_context::operator=(static_cast<const flow::log::Log_context&>(src));
    m_cmd_tx = std::move(src.m_cmd_tx);
    m_id_alloc = std::move(src.m_id_alloc);
    m_conn_id = src.m_conn_id;

    src.m_cmd_tx.reset();
    src.m_id_alloc.reset();
    src.m_conn_id = 0;
  }
  return *this;
}

void Conn_client::release()
{
  if (null())
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Conn_client [" << *this << "]: Releasing connection ID.");
  m_id_alloc->free(m_conn_id);

  m_cmd_tx.reset();
  m_id_alloc.reset();
  m_conn_id = 0;
}

Connection_id Conn_client::conn_id() const
{
  return m_conn_id;
}

bool Conn_client::null() const
{
  return !m_id_alloc;
}

Session_client Conn_client::startup(Session&& session, Startup_response* startup_rsp, Error_code* err_code)
{
  Session_client sess_client;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Session_client
           { return startup(std::move(session), startup_rsp, actual_err_code); },
         &sess_client, err_code, "Conn_client::startup()"))
  {
    return sess_client;
  }
  // else

  if (null())
  {
    FLOW_LOG_FATAL("Conn_client [" << *this << "]: startup() invoked on NULL object.  Aborting.");
    std::abort();
  }
  // else

  FLOW_LOG_INFO("Conn_client [" << *this << "]: Starting up session [" << session << "].");

  /* The coordinator holds the write end (to flag CANCELLED upon a valid cancel request); the Session_client holds
   * it too (to reset it) plus the read end. */
  auto cancel_tx = boost::make_shared<Cancel_sender>(Cancelled::S_NOT_CANCELLED);

  // We become NULL here.  Henceforth the Session_client owns the ID.
  sess_client = Session_client(std::move(*this), std::move(session), cancel_tx);
  sess_client.handshake(cancel_tx, startup_rsp, err_code);
  return sess_client;
} // Conn_client::startup()

void Conn_client::cancel_request(Connection_id conn_id, Secret_key secret_key) const
{
  if (null())
  {
    FLOW_LOG_FATAL("Conn_client [" << *this << "]: cancel_request() invoked on NULL object.  Aborting.");
    std::abort();
  }
  // else

  FLOW_LOG_INFO("Conn_client [" << *this << "]: Requesting cancellation of conn [" << conn_id << "].");
  send_or_abort(command::Cancel_request{ conn_id, secret_key });
}

void Conn_client::send_or_abort(Command&& cmd) const
{
  FLOW_LOG_TRACE("Conn_client [" << *this << "]: Sending command [" << cmd << "].");
  if (!m_cmd_tx->send(std::move(cmd)))
  {
    FLOW_LOG_FATAL("Conn_client [" << *this << "]: Coordinator unexpectedly gone; command channel closed.  "
                   "Aborting.");
    std::abort();
  }
}

std::ostream& operator<<(std::ostream& os, const Conn_client& val)
{
  if (val.null())
  {
    return os << "NULL@" << &val;
  }
  // else
  return os << "conn[" << val.conn_id() << "]@" << &val;
}

} // namespace coord::client
