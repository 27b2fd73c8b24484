/**************************************************************************
 *   Created: 2017/08/19 12:40:17
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "CommandLine.hpp"

using namespace ecosys;
using namespace ecosys::ConnectorTool;
using namespace ecosys::ConnectorTool::CommandLine;

namespace pt = boost::posix_time;

CommandLine::Params::Params()
    : section(defaultSection), duration(pt::not_a_date_time) {}

void CommandLine::ShowVersion(std::ostream &os) {
  os << ECOSYS_NAME " " ECOSYS_BUILD_IDENTITY << std::endl;
}

void CommandLine::ShowHelp(const char *exe, std::ostream &os) {
  using namespace Commands;
  using namespace Options;
  os << std::endl;
  ShowVersion(os);
  os << std::endl
     << "Usage: " << exe << " \"path to INI-file\""
     << " [ --options [options-args] ]" << std::endl
     << std::endl
     << "Options:" << std::endl
     << std::endl
     << "    " << section << " \"INI-section with gateway settings,"
     << " default: " << defaultSection << "\"" << std::endl
     << std::endl
     << "    " << duration << " \"number of seconds to work before"
     << " stop, default: until SIGINT or SIGTERM\"" << std::endl
     << std::endl
     << "    " << help << " (or " << helpShort << ")" << std::endl
     << std::endl
     << "    " << version << " (or " << versionShort << ")" << std::endl
     << std::endl
     << ECOSYS_COPYRIGHT << std::endl
     << std::endl;
}

boost::optional<Result> CommandLine::ExecuteCommand(int argc,
                                                    const char *const argv[],
                                                    std::ostream &os) {
  using namespace Commands;
  if (argc < 2) {
    return boost::none;
  }
  const std::string command = argv[1];
  if (command == help || command == helpShort) {
    ShowHelp(argv[0], os);
    return RESULT_SUCCESS;
  } else if (command == version || command == versionShort) {
    ShowVersion(os);
    return RESULT_SUCCESS;
  }
  return boost::none;
}

namespace {
boost::optional<pt::time_duration> ParseDuration(const char *source,
                                                 std::ostream &errors) {
  long value;
  try {
    value = boost::lexical_cast<long>(source);
  } catch (const boost::bad_lexical_cast &ex) {
    errors << "Failed to read " << Options::duration << " value \"" << source
           << "\": \"" << ex.what() << "\"." << std::endl;
    return boost::none;
  }
  if (value <= 0) {
    errors << "Option " << Options::duration
           << " has to be a positive number of seconds, but \"" << source
           << "\" is given." << std::endl;
    return boost::none;
  }
  return pt::time_duration(pt::seconds(value));
}
}  // namespace

boost::optional<Params> CommandLine::Parse(int argc,
                                           const char *const argv[],
                                           std::ostream &errors) {
  using namespace Options;

  if (argc < 2 || !strlen(argv[1])) {
    errors << "No configuration file specified." << std::endl;
    return boost::none;
  }

  Params result;
  result.iniFilePath = argv[1];

  for (auto i = 2; i < argc; i += 2) {
    const std::string option = argv[i];
    const auto valueArgIndex = i + 1;
    if (option != section && option != duration) {
      errors << "Unknown option \"" << option << "\"." << std::endl;
      return boost::none;
    }
    if (valueArgIndex >= argc || !strlen(argv[valueArgIndex])) {
      errors << "Option " << option << " has no value." << std::endl;
      return boost::none;
    }
    if (option == section) {
      result.section = argv[valueArgIndex];
      continue;
    }
    const auto &value = ParseDuration(argv[valueArgIndex], errors);
    if (!value) {
      return boost::none;
    }
    result.duration = *value;
  }

  return result;
}
