/**************************************************************************
 *   Created: 2017/08/13 22:31:09
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Common/Ini.hpp"
#include "Core/Fwd.hpp"
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <string>

namespace ecosys {
namespace Interaction {
namespace InteractiveBrokers {

//! Gateway connection settings.
struct Settings {
  std::string host;
  unsigned short port;
  int clientId;
  //! Period between server time requests.
  boost::posix_time::time_duration pingPeriod;
  //! Time to wait for a response or for the first order ID.
  boost::posix_time::time_duration timeout;

  //! Default settings: local TWS paper trading port.
  Settings();
  explicit Settings(const Lib::IniSectionRef &);

  void Log(ModuleEventsLog &) const;
};

}  // namespace InteractiveBrokers
}  // namespace Interaction
}  // namespace ecosys
