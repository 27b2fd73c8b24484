/**************************************************************************
 *   Created: 2017/08/14 01:12:44
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include <string>

namespace ecosys {
namespace Interaction {
namespace InteractiveBrokers {

//! Log severity of a message which gateway sends through the "error"
//! callback. Most of them are not errors at all.
enum MessageSeverity {
  MESSAGE_SEVERITY_SILENT,
  MESSAGE_SEVERITY_DEBUG,
  MESSAGE_SEVERITY_INFO,
  MESSAGE_SEVERITY_WARN,
  MESSAGE_SEVERITY_ERROR
};

MessageSeverity GetMessageSeverity(int code);

//! Replaces line breaks by spaces to keep one message on one log line.
std::string FormatMessageText(const std::string &);

//! Connectivity between IB and TWS has been lost.
bool IsLinkLostCode(int code);
//! Connectivity between IB and TWS has been restored, with or without data
//! loss.
bool IsLinkRestoredCode(int code);
//! TWS has dropped this API connection.
bool IsConnectionDroppedCode(int code);

}  // namespace InteractiveBrokers
}  // namespace Interaction
}  // namespace ecosys
