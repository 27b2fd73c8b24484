/**************************************************************************
 *   Created: 2017/08/19 12:40:03
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <iosfwd>
#include <string>

namespace ecosys {
namespace ConnectorTool {

//! Process exit code.
enum Result { RESULT_SUCCESS = 0, RESULT_ERROR = 1, RESULT_USAGE_ERROR = 2 };

namespace CommandLine {

namespace Commands {
const char *const help = "--help";
const char *const helpShort = "-h";
const char *const version = "--version";
const char *const versionShort = "-v";
}  // namespace Commands

namespace Options {
const char *const section = "--section";
const char *const duration = "--duration";
}  // namespace Options

const char *const defaultSection = "InteractiveBrokers";

struct Params {
  boost::filesystem::path iniFilePath;
  std::string section;
  //! Not a date time if not set, works until OS signal.
  boost::posix_time::time_duration duration;

  Params();
};

void ShowVersion(std::ostream &);
void ShowHelp(const char *exe, std::ostream &);

//! Executes "help" or "version" command if it is the first argument.
/** @return exit code if the command has been executed.
  */
boost::optional<Result> ExecuteCommand(int argc,
                                       const char *const argv[],
                                       std::ostream &);

//! Reads INI-file path and options, reports wrong arguments to errors.
boost::optional<Params> Parse(int argc,
                              const char *const argv[],
                              std::ostream &errors);

}  // namespace CommandLine
}  // namespace ConnectorTool
}  // namespace ecosys
