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
#include "coord/client/client.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>

namespace coord::client
{

// Implementations.

Client::Client(flow::log::Logger* logger_ptr, const Client_config& config, const Command_tx& cmd_tx) :
  flow::log::Log_context(logger_ptr, Log_component::S_CLIENT),
  m_config(config),
  m_cmd_tx(cmd_tx),
  m_id_alloc(boost::make_shared<Id_allocator>(logger_ptr, m_config.m_conn_id_first, m_config.m_conn_id_end))
{
  FLOW_LOG_INFO("Client [" << *this << "]: Created; config [" << m_config << "].");
}

Conn_client Client::new_conn(Error_code* err_code) const
{
  Conn_client conn;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Conn_client { return new_conn(actual_err_code); },
         &conn, err_code, "Client::new_conn()"))
  {
    return conn;
  }
  // else

  const auto conn_id = m_id_alloc->alloc(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Client [" << *this << "]: Cannot mint connection client: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return conn;
  }
  // else

  return Conn_client(get_logger(), m_cmd_tx, m_id_alloc, conn_id);
}

const Client_config& Client::config() const
{
  return m_config;
}

size_t Client::n_live_conns() const
{
  return m_id_alloc->n_allocated();
}

std::ostream& operator<<(std::ostream& os, const Client& val)
{
  return os << "live_conns[" << val.n_live_conns() << "]@" << &val;
}

} // namespace coord::client
