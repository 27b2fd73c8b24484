/**************************************************************************
 *   Created: 2012/07/09 14:36:05
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Common/Common.hpp"
#include "Fwd.hpp"
#include <CommissionReport.h>
#include <Contract.h>
#include <EPosixClientSocket.h>
#include <EWrapper.h>
#include <Execution.h>
#include <Order.h>
#include <OrderState.h>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread.hpp>
#include <algorithm>
#include <limits>
#include <sys/select.h>

#include "Common/Assert.hpp"
