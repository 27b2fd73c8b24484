/**************************************************************************
 *   Created: 2012/07/22 23:41:35
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Assert.hpp"
#include "Exception.hpp"
#include "Core/EventsLog.hpp"

using namespace ecosys;

namespace {

std::string DescribeCurrentException() {
  try {
    throw;
  } catch (const Lib::Exception &ex) {
    return std::string("connector error \"") + ex.what() + "\"";
  } catch (const std::exception &ex) {
    return std::string("standard exception \"") + ex.what() + "\"";
  } catch (...) {
    return "unknown exception";
  }
}
}  // namespace

void Debug::ReportUnexpectedException(const char *function,
                                      const char *file,
                                      long line) noexcept {
  try {
    boost::format message("Unexpected %1% in %2% (%3%:%4%).");
    message % DescribeCurrentException() % function % file % line;
    EventsLog::BroadcastError(message.str());
  } catch (const std::exception &ex) {
    std::cerr << "Failed to report unexpected exception: \"" << ex.what()
              << "\"." << std::endl;
  }
}

#if !defined(BOOST_DISABLE_ASSERTS) && defined(BOOST_ENABLE_ASSERT_HANDLER)

namespace {
void ReportAssertionFail(const std::string &message) {
  std::cerr << message << std::endl;
  EventsLog::BroadcastError(message);
  std::abort();
}
}  // namespace

void boost::assertion_failed(const char *expr,
                             const char *function,
                             const char *file,
                             long line) {
  boost::format message("Assertion \"%1%\" failed in %2% (%3%:%4%).");
  message % expr % function % file % line;
  ReportAssertionFail(message.str());
}

void boost::assertion_failed_msg(const char *expr,
                                 const char *details,
                                 const char *function,
                                 const char *file,
                                 long line) {
  boost::format message("Assertion \"%1%\" failed in %2% (%3%:%4%): %5%.");
  message % expr % function % file % line % details;
  ReportAssertionFail(message.str());
}

#endif
