/**************************************************************************
 *   Created: 2013/02/02 21:02:42
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "CommandLine.hpp"
#include "Interaction/InteractiveBrokers/Connector.hpp"
#include "Interaction/InteractiveBrokers/Session.hpp"
#include "Interaction/InteractiveBrokers/Settings.hpp"

using namespace ecosys;
using namespace ecosys::Lib;

namespace ib = ecosys::Interaction::InteractiveBrokers;
namespace fs = boost::filesystem;
namespace pt = boost::posix_time;
namespace lt = boost::local_time;

using namespace ecosys::ConnectorTool;

////////////////////////////////////////////////////////////////////////////////

namespace {

//! Blocks stop signals in all threads, main thread waits for them.
sigset_t BlockOsSignals() {
  sigset_t signalSet;
  sigemptyset(&signalSet);
  sigaddset(&signalSet, SIGINT);
  sigaddset(&signalSet, SIGTERM);
  sigaddset(&signalSet, SIGPIPE);
  const auto status = pthread_sigmask(SIG_BLOCK, &signalSet, nullptr);
  if (status != 0) {
    throw SystemException("Failed to install OS signal mask", status);
  }
  sigdelset(&signalSet, SIGPIPE);
  return signalSet;
}

//! Returns false if time is over, true if stop signal is received.
bool WaitStopSignal(const sigset_t &signalSet,
                    const pt::time_duration &duration,
                    EventsLog &log) {
  const auto &endTime = duration != pt::not_a_date_time
                            ? pt::microsec_clock::universal_time() + duration
                            : pt::ptime(pt::not_a_date_time);
  for (;;) {
    timespec waitTime = {1, 0};
    if (endTime != pt::not_a_date_time) {
      const auto &now = pt::microsec_clock::universal_time();
      if (now >= endTime) {
        log.Info("Work time is over.");
        return false;
      }
      const auto &rest = endTime - now;
      if (rest < pt::seconds(1)) {
        waitTime.tv_sec = 0;
        waitTime.tv_nsec = rest.total_microseconds() * 1000;
      }
    }
    const auto signalNumber = sigtimedwait(&signalSet, nullptr, &waitTime);
    if (signalNumber > 0) {
      log.Info("OS Signal %1% received, stopping...", signalNumber);
      return true;
    }
    if (errno != EAGAIN && errno != EINTR) {
      throw SystemException("Failed to wait for OS signal", errno);
    }
  }
}

bool Work(const CommandLine::Params &params,
          const sigset_t &signalSet,
          std::ofstream &logFile,
          EventsLog &log) {
  const IniFile ini(params.iniFilePath);
  const IniSectionRef conf(ini, params.section);
  if (!conf) {
    log.Error("Failed to find INI-section \"%1%\" in %2%.", params.section,
              params.iniFilePath);
    return false;
  }

  if (conf.IsKeyExist("log_file")) {
    const auto &logFilePath = conf.ReadFileSystemPath("log_file");
    if (logFilePath.has_parent_path()) {
      fs::create_directories(logFilePath.parent_path());
    }
    logFile.open(logFilePath.string().c_str(),
                 std::ios::out | std::ios::ate | std::ios::app);
    if (!logFile) {
      log.Error("Failed to open log file %1%.", logFilePath);
      return false;
    }
    log.EnableStream(logFile, true);
  }

  ModuleEventsLog ibLog(CommandLine::defaultSection, log);

  const ib::Settings settings(conf);
  settings.Log(ibLog);

  ib::Connector connector;
  ib::Session session(connector, settings, ibLog);
  session.Connect();
  session.Start();

  WaitStopSignal(signalSet, params.duration, log);

  session.Stop();
  return true;
}

bool Run(const CommandLine::Params &params) {
  const auto &signalSet = BlockOsSignals();

  // Has to be destroyed after the log.
  std::ofstream logFile;
  EventsLog log(boost::make_shared<lt::posix_time_zone>("UTC"));
  log.EnableStdOut();

  try {
    return Work(params, signalSet, logFile, log);
  } catch (const Exception &ex) {
    log.Error("Failed to run connector: \"%1%\".", ex);
  } catch (const std::exception &ex) {
    log.Error("Failed to run connector: \"%1%\".", ex.what());
  }
  return false;
}
}  // namespace

////////////////////////////////////////////////////////////////////////////////

int main(int argc, char *argv[]) {
  int result = RESULT_USAGE_ERROR;

  try {
    const auto &commandResult =
        CommandLine::ExecuteCommand(argc, argv, std::cout);
    if (commandResult) {
      return *commandResult;
    }

    const auto &params = CommandLine::Parse(argc, argv, std::cerr);
    if (!params) {
      CommandLine::ShowHelp(argv[0], std::cout);
      return result;
    }

    result = RESULT_ERROR;
    if (Run(*params)) {
      result = RESULT_SUCCESS;
    }

  } catch (const Exception &ex) {
    std::cerr << "Failed to run connector: \"" << ex << "\"." << std::endl;
  } catch (const std::exception &ex) {
    std::cerr << "Failed to run connector: \"" << ex.what() << "\"."
              << std::endl;
  } catch (...) {
    AssertFailNoException();
  }

  return result;
}
