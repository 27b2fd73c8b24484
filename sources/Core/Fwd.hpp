/**************************************************************************
 *   Created: 2012/09/16 14:48:58
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

namespace ecosys {

class Log;
class EventsLog;
class ModuleEventsLog;

}  // namespace ecosys
