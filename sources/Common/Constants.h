/**************************************************************************
 *   Created: 2013/01/31 01:04:25
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

////////////////////////////////////////////////////////////////////////////////

#include "Version/Version.h"

////////////////////////////////////////////////////////////////////////////////

#define _STR(a) #a
#define _XSTR(a) _STR(a)

////////////////////////////////////////////////////////////////////////////////

#define ECOSYS_VERSION_FULL     \
  _XSTR(ECOSYS_VERSION_RELEASE) \
  "." _XSTR(ECOSYS_VERSION_BUILD) "." _XSTR(ECOSYS_VERSION_STATUS)

#if defined(_DEBUG)
#define ECOSYS_BUILD_IDENTITY \
  ECOSYS_VERSION_BRANCH "." ECOSYS_VERSION_FULL ".DEBUG"
#elif defined(_TEST)
#define ECOSYS_BUILD_IDENTITY \
  ECOSYS_VERSION_BRANCH "." ECOSYS_VERSION_FULL ".TEST"
#else
#define ECOSYS_BUILD_IDENTITY ECOSYS_VERSION_BRANCH "." ECOSYS_VERSION_FULL
#endif

////////////////////////////////////////////////////////////////////////////////

