/**************************************************************************
 *   Created: 2012/09/16 14:49:29
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "EventsLog.hpp"

using namespace ecosys;

namespace lt = boost::local_time;

namespace {

typedef boost::mutex RegistryMutex;
typedef RegistryMutex::scoped_lock RegistryLock;

//! Live logs for broadcasting.
struct Registry {
  RegistryMutex mutex;
  std::set<EventsLog *> logs;
};

Registry &GetRegistry() {
  static Registry result;
  return result;
}
}  // namespace

EventsLog::EventsLog(const lt::time_zone_ptr &timeZone) : Log(timeZone) {
  auto &registry = GetRegistry();
  const RegistryLock lock(registry.mutex);
  registry.logs.emplace(this);
}

EventsLog::~EventsLog() {
  auto &registry = GetRegistry();
  const RegistryLock lock(registry.mutex);
  registry.logs.erase(this);
}

boost::signals2::connection EventsLog::Subscribe(const RecordSlot &slot) {
  return m_signal.connect(slot);
}

void EventsLog::Emit(const char *tag,
                     const std::string *module,
                     const std::string &message) {
  const auto &time = GetTime();
  Write(tag, time, module, message);
  m_signal(tag, time, module, message);
}

void EventsLog::ReportBrokenRecord(const char *format,
                                   const std::exception &ex) noexcept {
  std::cerr << "Failed to write log record \"" << format << "\": \""
            << ex.what() << "\"." << std::endl;
}

void EventsLog::BroadcastError(const std::string &message) noexcept {
  auto &registry = GetRegistry();
  const RegistryLock lock(registry.mutex);
  if (registry.logs.empty()) {
    std::cerr << message << std::endl;
    return;
  }
  for (auto *log : registry.logs) {
    try {
      log->Emit("Error", nullptr, message);
    } catch (const std::exception &ex) {
      ReportBrokenRecord(message.c_str(), ex);
    }
  }
}
