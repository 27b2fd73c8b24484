/**************************************************************************
 *   Created: 2012/11/14 22:07:12
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#if defined(ECOSYS_CORE_SHARED) && defined(__GNUC__)
#define ECOSYS_CORE_API __attribute__((visibility("default")))
#endif

#if !defined(ECOSYS_CORE_API)
#define ECOSYS_CORE_API
#endif
