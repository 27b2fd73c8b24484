/**************************************************************************
 *   Created: 2017/08/14 01:13:02
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Messages.hpp"

using namespace ecosys;
using namespace ecosys::Interaction::InteractiveBrokers;

namespace ib = ecosys::Interaction::InteractiveBrokers;

MessageSeverity ib::GetMessageSeverity(int code) {
  switch (code) {
    case 2104:  // A market data farm is connected.
    case 2106:  // A historical data farm is connected.
    case 2158:  // A secure definition data farm is connected.
      return MESSAGE_SEVERITY_DEBUG;
    case 202:   // Order canceled - Reason:
    case 2105:  // A historical data farm is disconnected.
    case 2107:  // A historical data farm connection has become inactive
                // but should be available upon demand.
    case 2108:  // A market data farm connection has become inactive but
                // should be available upon demand.
      return MESSAGE_SEVERITY_SILENT;
    case 1101:  // Connectivity between IB and TWS has been restored - data
                // lost.
    case 1102:  // Connectivity between IB and TWS has been restored - data
                // maintained.
      return MESSAGE_SEVERITY_INFO;
    case 1100:  // Connectivity between IB and TWS has been lost.
    case 2103:  // A market data farm is disconnected.
    case 2109:  // Order Event Warning: Attribute "Outside Regular Trading
                // Hours" is ignored based on the order type and
                // destination.
    case 2110:  // Connectivity between TWS and server is broken. It will
                // be restored automatically.
    case 2137:  // The closing order quantity is greater than your current
                // position.
    case 10148:  // Order that needs to be cancelled can not be cancelled.
      return MESSAGE_SEVERITY_WARN;
    case 502:  // Couldn't connect to TWS.
    default:
      return MESSAGE_SEVERITY_ERROR;
  }
}

std::string ib::FormatMessageText(const std::string &source) {
  std::string result(source);
  std::for_each(result.begin(), result.end(), [](char &ch) {
    if (ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  });
  return result;
}

bool ib::IsLinkLostCode(int code) { return code == 1100; }

bool ib::IsLinkRestoredCode(int code) { return code == 1101 || code == 1102; }

bool ib::IsConnectionDroppedCode(int code) {
  switch (code) {
    case 504:   // Not connected.
    case 1300:  // TWS socket port has been reset and this connection is
                // being dropped.
      return true;
    default:
      return false;
  }
}
