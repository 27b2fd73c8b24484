/**************************************************************************
 *   Created: 2017/08/13 22:31:27
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Settings.hpp"

using namespace ecosys;
using namespace ecosys::Lib;
using namespace ecosys::Interaction::InteractiveBrokers;

namespace pt = boost::posix_time;

namespace {
const char *const defaultHost = "127.0.0.1";
const long defaultPort = 7497;
const int defaultClientId = 0;
const long defaultPingPeriodSec = 120;
const long defaultTimeoutSec = 10;

pt::time_duration ReadSeconds(const IniSectionRef &conf,
                              const char *key,
                              long defaultValue) {
  const auto value = conf.ReadTypedKey<long>(key, defaultValue);
  if (value <= 0) {
    boost::format message(
        "Wrong INI-key (\"%1%:%2%\") format: \"value must be positive\"");
    message % conf % key;
    throw Ini::KeyFormatError(message.str());
  }
  return pt::seconds(value);
}

unsigned short ReadPort(const IniSectionRef &conf) {
  const auto value = conf.ReadTypedKey<long>("port", defaultPort);
  if (value < 1 || value > std::numeric_limits<unsigned short>::max()) {
    boost::format message(
        "Wrong INI-key (\"%1%:port\") format:"
        " \"port must be in the range 1-65535\"");
    message % conf;
    throw Ini::KeyFormatError(message.str());
  }
  return static_cast<unsigned short>(value);
}
}  // namespace

Settings::Settings()
    : host(defaultHost),
      port(static_cast<unsigned short>(defaultPort)),
      clientId(defaultClientId),
      pingPeriod(pt::seconds(defaultPingPeriodSec)),
      timeout(pt::seconds(defaultTimeoutSec)) {}

Settings::Settings(const IniSectionRef &conf)
    : host(conf.ReadKey("ip_address", defaultHost)),
      port(ReadPort(conf)),
      clientId(conf.ReadTypedKey<int>("client_id", defaultClientId)),
      pingPeriod(ReadSeconds(conf, "ping_period", defaultPingPeriodSec)),
      timeout(ReadSeconds(conf, "timeout", defaultTimeoutSec)) {
  if (pingPeriod <= timeout) {
    boost::format message(
        "Wrong INI-key (\"%1%:ping_period\") format:"
        " \"ping period must be greater than timeout\"");
    message % conf;
    throw Ini::KeyFormatError(message.str());
  }
}

void Settings::Log(ModuleEventsLog &log) const {
  log.Info(
      "Gateway: \"%1%:%2%\", client ID: %3%, ping period: %4%,"
      " timeout: %5%.",
      host, port, clientId, pingPeriod, timeout);
}
