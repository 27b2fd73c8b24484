/**************************************************************************
 *   Created: 2013/04/23 16:00:37
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

namespace ecosys {
namespace Interaction {
namespace InteractiveBrokers {

class Connector;
class Session;
struct Settings;

}  // namespace InteractiveBrokers
}  // namespace Interaction
}  // namespace ecosys
