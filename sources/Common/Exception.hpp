/**************************************************************************
 *   Created: May 19, 2012 2:48:53 AM
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include <exception>
#include <iosfwd>
#include <string>
#include <utility>

namespace ecosys {
namespace Lib {

//! Base of all connector errors.
class Exception : public std::exception {
 public:
  explicit Exception(std::string what);
  ~Exception() noexcept override = default;

  const char* what() const noexcept override { return m_what.c_str(); }

 private:
  std::string m_what;
};

std::ostream& operator<<(std::ostream&, const Exception&);

//! OS call failure, the message carries the system error code and text.
class SystemException : public Exception {
 public:
  SystemException(const std::string& what, int errorCode);

  int GetErrorCode() const noexcept { return m_errorCode; }

 private:
  int m_errorCode;
};

class CommunicationError : public Exception {
 public:
  explicit CommunicationError(std::string what)
      : Exception(std::move(what)) {}
};

//! Gateway connection can't be established.
class ConnectError : public CommunicationError {
 public:
  explicit ConnectError(std::string what)
      : CommunicationError(std::move(what)) {}
};

}  // namespace Lib
}  // namespace ecosys
