/**************************************************************************
 *   Created: May 19, 2012 2:49:10 AM
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Exception.hpp"

using namespace ecosys::Lib;

Exception::Exception(std::string what) : m_what(std::move(what)) {}

std::ostream& ecosys::Lib::operator<<(std::ostream& os, const Exception& ex) {
  return os << ex.what();
}

namespace {
std::string FormatSystemError(const std::string& what, int errorCode) {
  boost::format result("%1% (system error %2%: \"%3%\")");
  result % what % errorCode % std::strerror(errorCode);
  return result.str();
}
}  // namespace

SystemException::SystemException(const std::string& what, int errorCode)
    : Exception(FormatSystemError(what, errorCode)), m_errorCode(errorCode) {}
