/**************************************************************************
 *   Created: 2012/09/16 14:49:11
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Api.h"
#include "Log.hpp"
#include <boost/format.hpp>
#include <boost/function.hpp>
#include <boost/signals2/signal.hpp>
#include <string>
#include <utility>

namespace ecosys {

//! Application events log.
/** Message arguments are inserted into "%1%"-style placeholders by
  * boost::format. Each record is also delivered to subscribers. Writing
  * never throws, a broken record is reported to std::cerr.
  */
class ECOSYS_CORE_API EventsLog : public Log {
 public:
  typedef void(RecordSlotSignature)(const char *tag,
                                    const boost::posix_time::ptime &,
                                    const std::string *module,
                                    const std::string &message);
  typedef boost::function<RecordSlotSignature> RecordSlot;

 public:
  explicit EventsLog(const boost::local_time::time_zone_ptr &);
  ~EventsLog();

 public:
  boost::signals2::connection Subscribe(const RecordSlot &);

  template <typename... Args>
  void Debug(const char *format, const Args &... args) noexcept {
    Record("Debug", nullptr, format, args...);
  }
  template <typename... Args>
  void Info(const char *format, const Args &... args) noexcept {
    Record("Info", nullptr, format, args...);
  }
  template <typename... Args>
  void Warn(const char *format, const Args &... args) noexcept {
    Record("Warn", nullptr, format, args...);
  }
  template <typename... Args>
  void Error(const char *format, const Args &... args) noexcept {
    Record("Error", nullptr, format, args...);
  }

  template <typename... Args>
  void Record(const char *tag,
              const std::string *module,
              const char *format,
              const Args &... args) noexcept {
    try {
      Emit(tag, module, Format(format, args...));
    } catch (const std::exception &ex) {
      ReportBrokenRecord(format, ex);
    }
  }

  //! Writes error into each existing events log, or into std::cerr if
  //! there is no one.
  static void BroadcastError(const std::string &) noexcept;

 private:
  static std::string Format(const char *format) { return format; }
  template <typename... Args>
  static std::string Format(const char *format, const Args &... args) {
    boost::format result(format);
    using Expander = int[];
    static_cast<void>(Expander{0, (static_cast<void>(result % args), 0)...});
    return result.str();
  }

  void Emit(const char *tag,
            const std::string *module,
            const std::string &message);
  static void ReportBrokenRecord(const char *format,
                                 const std::exception &) noexcept;

 private:
  boost::signals2::signal<RecordSlotSignature> m_signal;
};

////////////////////////////////////////////////////////////////////////////////

//! Events log view which marks records with the module name.
class ECOSYS_CORE_API ModuleEventsLog : private boost::noncopyable {
 public:
  explicit ModuleEventsLog(std::string name, EventsLog &log)
      : m_name(std::move(name)), m_log(log) {}

 public:
  const std::string &GetName() const { return m_name; }

  template <typename... Args>
  void Debug(const char *format, const Args &... args) noexcept {
    m_log.Record("Debug", &m_name, format, args...);
  }
  template <typename... Args>
  void Info(const char *format, const Args &... args) noexcept {
    m_log.Record("Info", &m_name, format, args...);
  }
  template <typename... Args>
  void Warn(const char *format, const Args &... args) noexcept {
    m_log.Record("Warn", &m_name, format, args...);
  }
  template <typename... Args>
  void Error(const char *format, const Args &... args) noexcept {
    m_log.Record("Error", &m_name, format, args...);
  }

 private:
  const std::string m_name;
  EventsLog &m_log;
};

}  // namespace ecosys
