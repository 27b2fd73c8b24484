/**************************************************************************
 *   Created: 2014/09/15 19:52:19
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Log.hpp"

using namespace ecosys;

namespace pt = boost::posix_time;
namespace lt = boost::local_time;

namespace {
typedef boost::mutex::scoped_lock Lock;

void WriteRecord(const char *tag,
                 const pt::ptime &time,
                 const std::string *module,
                 const std::string &message,
                 std::ostream &os) {
  os << time << '\t' << tag << "\t[" << boost::this_thread::get_id()
     << "]\t";
  if (module) {
    os << *module << ": ";
  }
  os << message << std::endl;
}
}  // namespace

Log::Log(const lt::time_zone_ptr &timeZone)
    : m_timeZone(timeZone), m_stream(nullptr), m_isStdOutEnabled(false) {
  Assert(m_timeZone);
}

bool Log::IsEnabled() const {
  const Lock lock(m_mutex);
  return m_stream || m_isStdOutEnabled;
}

void Log::EnableStream(std::ostream &stream, bool writeStartInfo) {
  {
    const Lock lock(m_mutex);
    m_stream = &stream;
  }
  if (!writeStartInfo) {
    return;
  }
  boost::format message(ECOSYS_NAME " " ECOSYS_BUILD_IDENTITY
                        ", time zone: %1%, UTC: %2%.");
  message % m_timeZone->to_posix_string() %
      pt::microsec_clock::universal_time();
  Write("Start", GetTime(), nullptr, message.str());
}

void Log::DisableStream() {
  const Lock lock(m_mutex);
  m_stream = nullptr;
}

void Log::EnableStdOut() {
  const Lock lock(m_mutex);
  m_isStdOutEnabled = true;
}

pt::ptime Log::GetTime() const {
  return lt::local_microsec_clock::local_time(m_timeZone).local_time();
}

void Log::Write(const char *tag,
                const pt::ptime &time,
                const std::string *module,
                const std::string &message) {
  const Lock lock(m_mutex);
  if (m_stream) {
    WriteRecord(tag, time, module, message, *m_stream);
  }
  if (m_isStdOutEnabled) {
    WriteRecord(tag, time, module, message, std::cout);
  }
}
