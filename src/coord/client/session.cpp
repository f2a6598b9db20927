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
#include "coord/client/session.hpp"
#include <ostream>

namespace coord::client
{

// Implementations.

Session::Session(Connection_id conn_id, std::string user, Secret_key secret_key) :
  m_conn_id(conn_id),
  m_user(std::move(user)),
  m_secret_key(secret_key),
  m_transaction_status(Transaction_status::S_IDLE)
{
  // That's it.
}

Session::Session(Session&&) = default;

Session& Session::operator=(Session&&) = default;

Connection_id Session::conn_id() const
{
  return m_conn_id;
}

const std::string& Session::user() const
{
  return m_user;
}

Secret_key Session::secret_key() const
{
  return m_secret_key;
}

Transaction_status Session::transaction_status() const
{
  return m_transaction_status;
}

void Session::set_transaction_status(Transaction_status status)
{
  m_transaction_status = status;
}

void Session::set_prepared_statement(const std::string& name, Prepared_statement&& stmt)
{
  m_prepared_statements[name] = std::move(stmt);
}

const Prepared_statement* Session::prepared_statement(const std::string& name) const
{
  const auto it = m_prepared_statements.find(name);
  return (it == m_prepared_statements.end()) ? nullptr : &it->second;
}

bool Session::set_portal(const std::string& name, Portal&& portal)
{
  return m_portals.emplace(name, std::move(portal)).second;
}

const Portal* Session::portal(const std::string& name) const
{
  const auto it = m_portals.find(name);
  return (it == m_portals.end()) ? nullptr : &it->second;
}

const Session::Prepared_statements& Session::prepared_statements() const
{
  return m_prepared_statements;
}

const Session::Portals& Session::portals() const
{
  return m_portals;
}

void Session::clear_portals()
{
  m_portals.clear();
}

std::ostream& operator<<(std::ostream& os, const Session& val)
{
  return os << "conn[" << val.conn_id() << "] user[" << val.user() << "] txn[" << val.transaction_status() << "] "
               "prepared_stmts[" << val.prepared_statements().size() << "] portals[" << val.portals().size() << ']';
}

std::ostream& operator<<(std::ostream& os, End_transaction_action val)
{
  switch (val)
  {
  case End_transaction_action::S_COMMIT:
    return os << "COMMIT";
  case End_transaction_action::S_ROLLBACK:
    return os << "ROLLBACK";
  }
  return os << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, Transaction_status val)
{
  switch (val)
  {
  case Transaction_status::S_IDLE:
    return os << "IDLE";
  case Transaction_status::S_IN_TRANSACTION:
    return os << "IN_TRANSACTION";
  case Transaction_status::S_FAILED:
    return os << "FAILED";
  }
  return os << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, Param_type val)
{
  switch (val)
  {
  case Param_type::S_BOOL:
    return os << "bool";
  case Param_type::S_INT4:
    return os << "int4";
  case Param_type::S_INT8:
    return os << "int8";
  case Param_type::S_FLOAT8:
    return os << "float8";
  case Param_type::S_NUMERIC:
    return os << "numeric";
  case Param_type::S_TEXT:
    return os << "text";
  case Param_type::S_BYTEA:
    return os << "bytea";
  case Param_type::S_DATE:
    return os << "date";
  case Param_type::S_TIMESTAMP:
    return os << "timestamp";
  case Param_type::S_JSONB:
    return os << "jsonb";
  }
  return os << "unknown";
}

} // namespace coord::client
