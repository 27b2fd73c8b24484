/**************************************************************************
 *   Created: 2017/08/15 11:20:05
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"

using namespace testing;

namespace lt = boost::local_time;
namespace pt = boost::posix_time;

////////////////////////////////////////////////////////////////////////////////

namespace {

class EventsLogSubscriber {
 public:
  MOCK_METHOD3(OnRecord,
               void(const std::string &tag,
                    const std::string &module,
                    const std::string &message));

 public:
  void Subscribe(ecosys::EventsLog &log) {
    m_connection = log.Subscribe(
        [this](const char *tag, const pt::ptime &, const std::string *module,
               const std::string &message) {
          OnRecord(tag, module ? *module : std::string(), message);
        });
  }

 private:
  boost::signals2::scoped_connection m_connection;
};

lt::time_zone_ptr GetTimeZone() {
  return boost::make_shared<lt::posix_time_zone>("GMT");
}
}  // namespace

////////////////////////////////////////////////////////////////////////////////

namespace Core {

TEST(EventsLog, Signal) {
  ecosys::EventsLog log(GetTimeZone());
  EXPECT_FALSE(log.IsEnabled());

  EventsLogSubscriber subscriber;
  subscriber.Subscribe(log);

  {
    InSequence sequence;
    EXPECT_CALL(subscriber, OnRecord("Debug", "", "Plain message"));
    EXPECT_CALL(subscriber, OnRecord("Info", "", "Value 1 and \"two\"."));
    EXPECT_CALL(subscriber, OnRecord("Warn", "", "Warning 3"));
    EXPECT_CALL(subscriber, OnRecord("Error", "", "Error"));
  }

  log.Debug("Plain message");
  log.Info("Value %1% and \"%2%\".", 1, std::string("two"));
  log.Warn("Warning %1%", 3);
  log.Error("Error");
}

TEST(EventsLog, Module) {
  ecosys::EventsLog log(GetTimeZone());
  ecosys::ModuleEventsLog moduleLog("InteractiveBrokers", log);
  EXPECT_EQ("InteractiveBrokers", moduleLog.GetName());

  EventsLogSubscriber subscriber;
  subscriber.Subscribe(log);

  {
    InSequence sequence;
    EXPECT_CALL(subscriber,
                OnRecord("Info", "InteractiveBrokers",
                         "Connected to \"127.0.0.1:7497\" with client ID 0."));
    EXPECT_CALL(subscriber,
                OnRecord("Error", "InteractiveBrokers", "Connection TIMEOUT!"));
  }

  moduleLog.Info("Connected to \"%1%:%2%\" with client ID %3%.",
                 std::string("127.0.0.1"), 7497, 0);
  moduleLog.Error("Connection TIMEOUT!");
}

TEST(EventsLog, Stream) {
  ecosys::EventsLog log(GetTimeZone());
  ecosys::ModuleEventsLog moduleLog("InteractiveBrokers", log);

  std::ostringstream stream;
  log.EnableStream(stream, false);
  EXPECT_TRUE(log.IsEnabled());

  moduleLog.Warn("Server current time arrived without request: %1%.", 123);
  log.Info("Work time is over.");
  log.DisableStream();
  moduleLog.Warn("Not written.");
  EXPECT_FALSE(log.IsEnabled());

  std::vector<std::string> lines;
  boost::split(lines, stream.str(), boost::is_any_of("\n"));
  ASSERT_EQ(3, lines.size()) << stream.str();
  EXPECT_TRUE(lines[2].empty());

  std::vector<std::string> fields;
  boost::split(fields, lines[0], boost::is_any_of("\t"));
  ASSERT_EQ(4, fields.size()) << lines[0];
  EXPECT_FALSE(fields[0].empty());
  EXPECT_EQ("Warn", fields[1]);
  EXPECT_TRUE(boost::starts_with(fields[2], "[")) << fields[2];
  EXPECT_EQ(
      "InteractiveBrokers: Server current time arrived without request: 123.",
      fields[3]);

  boost::split(fields, lines[1], boost::is_any_of("\t"));
  ASSERT_EQ(4, fields.size()) << lines[1];
  EXPECT_EQ("Info", fields[1]);
  EXPECT_EQ("Work time is over.", fields[3]);
  EXPECT_EQ(std::string::npos, stream.str().find("Not written."));
}

TEST(EventsLog, StreamStartInfo) {
  ecosys::EventsLog log(GetTimeZone());
  std::ostringstream stream;
  log.EnableStream(stream, true);
  log.DisableStream();
  const auto &record = stream.str();
  EXPECT_NE(std::string::npos, record.find("\tStart\t")) << record;
  EXPECT_NE(std::string::npos,
            record.find(ECOSYS_NAME " " ECOSYS_BUILD_IDENTITY
                                    ", time zone: GMT"))
      << record;
}

TEST(EventsLog, WrongFormat) {
  ecosys::EventsLog log(GetTimeZone());
  EventsLogSubscriber subscriber;
  subscriber.Subscribe(log);

  EXPECT_CALL(subscriber, OnRecord(_, _, _)).Times(0);
  EXPECT_NO_THROW(log.Info("Two arguments %1% and %2%.", 1));
  EXPECT_NO_THROW(log.Info("One argument %1%.", 1, 2));
}

TEST(EventsLog, BroadcastError) {
  ecosys::EventsLog log1(GetTimeZone());
  ecosys::EventsLog log2(GetTimeZone());

  EventsLogSubscriber subscriber1;
  subscriber1.Subscribe(log1);
  EventsLogSubscriber subscriber2;
  subscriber2.Subscribe(log2);

  EXPECT_CALL(subscriber1, OnRecord("Error", "", "Failure"));
  EXPECT_CALL(subscriber2, OnRecord("Error", "", "Failure"));

  ecosys::EventsLog::BroadcastError("Failure");
}

TEST(EventsLog, UnexpectedException) {
  ecosys::EventsLog log(GetTimeZone());
  EventsLogSubscriber subscriber;
  subscriber.Subscribe(log);

  {
    InSequence sequence;
    EXPECT_CALL(subscriber,
                OnRecord("Error", "",
                         StartsWith("Unexpected connector error \"Connection"
                                    " doesn't exist\" in ")));
    EXPECT_CALL(subscriber,
                OnRecord("Error", "",
                         StartsWith("Unexpected standard exception"
                                    " \"Standard\" in ")));
    EXPECT_CALL(subscriber, OnRecord("Error", "",
                                     AllOf(StartsWith("Unexpected unknown"
                                                      " exception in "),
                                           HasSubstr("EventsLogTest.cpp:"))));
  }

  try {
    throw ecosys::Lib::CommunicationError("Connection doesn't exist");
  } catch (const std::exception &) {
    AssertFailNoException();
  }
  try {
    throw std::runtime_error("Standard");
  } catch (const std::exception &) {
    AssertFailNoException();
  }
  try {
    throw 1;
  } catch (int) {
    AssertFailNoException();
  }
}
}  // namespace Core
