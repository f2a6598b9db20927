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
#include "coord/client/error.hpp"
#include <flow/util/string_view.hpp>
#include <flow/util/util.hpp>
#include <istream>
#include <ostream>
#include <cassert>

namespace coord::client::error
{

// Types.

/// The boost.system category for errors returned by the coord::client module.
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's name/identity.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error code value.
   *
   * @param val
   *        Value of a Code cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns brief symbolic form of the given Code; satisfies `flow::util::istream_to_enum()` requirements.
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static flow::util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glue together Category::name()/message() with the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "coord/client";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments that violate its documented contract.";
  case Code::S_CONN_ID_EXHAUSTED:
    return "Connection creation: every connection identifier in the configured range is in use.";
  case Code::S_STARTUP_REJECTED:
    return "Coordinator: session startup was refused (e.g., unknown user); the session was not bound.";
  case Code::S_UNKNOWN_PREPARED_STATEMENT:
    return "Coordinator: the named prepared statement does not exist in the session.";
  case Code::S_DUPLICATE_PREPARED_STATEMENT:
    return "Coordinator: a prepared statement of that name already exists in the session.";
  case Code::S_UNKNOWN_PORTAL:
    return "Coordinator: the named portal does not exist in the session.";
  case Code::S_DUPLICATE_PORTAL:
    return "Coordinator: a portal of that name already exists in the session.";
  case Code::S_STATEMENT_INVALID:
    return "Coordinator: the statement could not be parsed or planned.";
  case Code::S_EXECUTION_FAILED:
    return "Coordinator: the statement was planned but failed during execution.";
  case Code::S_NO_ACTIVE_TRANSACTION:
    return "Coordinator: end-transaction requested, but the session has no explicit transaction open.";
  case Code::S_OPERATION_CANCELED:
    return "Coordinator: the request was abandoned, because a cancellation request targeted this connection.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

flow::util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_CONN_ID_EXHAUSTED:
    return "CONN_ID_EXHAUSTED";
  case Code::S_STARTUP_REJECTED:
    return "STARTUP_REJECTED";
  case Code::S_UNKNOWN_PREPARED_STATEMENT:
    return "UNKNOWN_PREPARED_STATEMENT";
  case Code::S_DUPLICATE_PREPARED_STATEMENT:
    return "DUPLICATE_PREPARED_STATEMENT";
  case Code::S_UNKNOWN_PORTAL:
    return "UNKNOWN_PORTAL";
  case Code::S_DUPLICATE_PORTAL:
    return "DUPLICATE_PORTAL";
  case Code::S_STATEMENT_INVALID:
    return "STATEMENT_INVALID";
  case Code::S_EXECUTION_FAILED:
    return "EXECUTION_FAILED";
  case Code::S_NO_ACTIVE_TRANSACTION:
    return "NO_ACTIVE_TRANSACTION";
  case Code::S_OPERATION_CANCELED:
    return "OPERATION_CANCELED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace coord::client::error
