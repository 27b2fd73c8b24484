/**************************************************************************
 *   Created: 2014/09/15 19:52:01
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Api.h"
#include <boost/date_time/local_time/local_time_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <iosfwd>
#include <string>

namespace ecosys {

//! Record sink: optional stream and standard output.
/** Records are stamped with the time in the log time zone and with the
  * writer thread ID.
  */
class ECOSYS_CORE_API Log : private boost::noncopyable {
 public:
  explicit Log(const boost::local_time::time_zone_ptr &);

 public:
  bool IsEnabled() const;

  //! The stream has to live until it is disabled or until the log is
  //! destroyed.
  void EnableStream(std::ostream &, bool writeStartInfo);
  void DisableStream();

  void EnableStdOut();

  boost::posix_time::ptime GetTime() const;

 protected:
  void Write(const char *tag,
             const boost::posix_time::ptime &,
             const std::string *module,
             const std::string &message);

 private:
  const boost::local_time::time_zone_ptr m_timeZone;

  mutable boost::mutex m_mutex;
  std::ostream *m_stream;
  bool m_isStdOutEnabled;
};
}  // namespace ecosys
