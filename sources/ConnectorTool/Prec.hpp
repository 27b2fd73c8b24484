/**************************************************************************
 *   Created: 2013/02/02 21:01:12
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Common/Common.hpp"
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <fstream>
#include <iostream>
#include <ostream>

#include "Common/Assert.hpp"
