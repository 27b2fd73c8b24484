/**************************************************************************
 *   Created: 2016/04/05 07:20:12
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#define ECOSYS_VERSION_RELEASE 1
#define ECOSYS_VERSION_BUILD 0
#define ECOSYS_VERSION_STATUS 0

#define ECOSYS_VERSION_BRANCH "master"

#define ECOSYS_NAME "Ecosystem Connector"

#define ECOSYS_COPYRIGHT \
  "Copyright 2016 (C) Eugene V. Palchukovsky, robotdk.com. All rights reserved."
