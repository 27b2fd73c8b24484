/**************************************************************************
 *   Created: 2017/08/19 13:05:44
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "ConnectorTool/CommandLine.hpp"

namespace tool = ecosys::ConnectorTool;
namespace cmd = ecosys::ConnectorTool::CommandLine;
namespace fs = boost::filesystem;
namespace pt = boost::posix_time;

////////////////////////////////////////////////////////////////////////////////

namespace {

class CommandLineTest : public testing::Test {
 protected:
  boost::optional<cmd::Params> Parse(std::vector<const char *> args) {
    args.insert(args.begin(), "EcosystemConnector");
    return cmd::Parse(static_cast<int>(args.size()), &args[0], m_errors);
  }

  boost::optional<tool::Result> Execute(std::vector<const char *> args) {
    args.insert(args.begin(), "EcosystemConnector");
    return cmd::ExecuteCommand(static_cast<int>(args.size()), &args[0],
                               m_output);
  }

 protected:
  std::ostringstream m_errors;
  std::ostringstream m_output;
};
}  // namespace

////////////////////////////////////////////////////////////////////////////////

namespace ConnectorTool {

TEST_F(CommandLineTest, ResultCodes) {
  EXPECT_EQ(0, tool::RESULT_SUCCESS);
  EXPECT_EQ(1, tool::RESULT_ERROR);
  EXPECT_EQ(2, tool::RESULT_USAGE_ERROR);
}

TEST_F(CommandLineTest, Help) {
  for (const auto &command : {"--help", "-h"}) {
    m_output.str(std::string());
    const auto &result = Execute({command});
    ASSERT_TRUE(result) << command;
    EXPECT_EQ(tool::RESULT_SUCCESS, *result);
    EXPECT_NE(std::string::npos, m_output.str().find("Usage: "));
    EXPECT_NE(std::string::npos, m_output.str().find("--section"));
    EXPECT_NE(std::string::npos, m_output.str().find("--duration"));
  }
}

TEST_F(CommandLineTest, Version) {
  for (const auto &command : {"--version", "-v"}) {
    m_output.str(std::string());
    const auto &result = Execute({command});
    ASSERT_TRUE(result) << command;
    EXPECT_EQ(tool::RESULT_SUCCESS, *result);
    EXPECT_EQ(ECOSYS_NAME " " ECOSYS_BUILD_IDENTITY "\n", m_output.str());
  }
}

TEST_F(CommandLineTest, NotCommand) {
  EXPECT_FALSE(Execute({}));
  EXPECT_FALSE(Execute({"connector.ini"}));
  EXPECT_FALSE(Execute({"connector.ini", "--help"}));
  EXPECT_TRUE(m_output.str().empty());
}

TEST_F(CommandLineTest, Defaults) {
  const auto &params = Parse({"etc/connector.ini"});
  ASSERT_TRUE(params);
  EXPECT_EQ(fs::path("etc/connector.ini"), params->iniFilePath);
  EXPECT_EQ("InteractiveBrokers", params->section);
  EXPECT_EQ(pt::time_duration(pt::not_a_date_time), params->duration);
  EXPECT_TRUE(m_errors.str().empty());
}

TEST_F(CommandLineTest, Options) {
  const auto &params = Parse(
      {"connector.ini", "--section", "IbGateway", "--duration", "90"});
  ASSERT_TRUE(params);
  EXPECT_EQ(fs::path("connector.ini"), params->iniFilePath);
  EXPECT_EQ("IbGateway", params->section);
  EXPECT_EQ(pt::seconds(90), params->duration);

  const auto &reordered =
      Parse({"connector.ini", "--duration", "1", "--section", "Tws"});
  ASSERT_TRUE(reordered);
  EXPECT_EQ("Tws", reordered->section);
  EXPECT_EQ(pt::seconds(1), reordered->duration);
}

TEST_F(CommandLineTest, NoConfig) {
  EXPECT_FALSE(Parse({}));
  EXPECT_FALSE(Parse({""}));
  EXPECT_NE(std::string::npos,
            m_errors.str().find("No configuration file specified."));
}

TEST_F(CommandLineTest, UnknownOption) {
  EXPECT_FALSE(Parse({"connector.ini", "--port", "7497"}));
  EXPECT_NE(std::string::npos, m_errors.str().find("Unknown option \"--port\""));
}

TEST_F(CommandLineTest, NoOptionValue) {
  EXPECT_FALSE(Parse({"connector.ini", "--section"}));
  EXPECT_FALSE(Parse({"connector.ini", "--duration", ""}));
  EXPECT_NE(std::string::npos,
            m_errors.str().find("Option --section has no value."));
  EXPECT_NE(std::string::npos,
            m_errors.str().find("Option --duration has no value."));
}

TEST_F(CommandLineTest, WrongDuration) {
  EXPECT_FALSE(Parse({"connector.ini", "--duration", "-5"}));
  EXPECT_FALSE(Parse({"connector.ini", "--duration", "0"}));
  EXPECT_FALSE(Parse({"connector.ini", "--duration", "-4294967295"}));
  EXPECT_NE(std::string::npos,
            m_errors.str().find("has to be a positive number of seconds,"
                                " but \"-5\" is given."));

  EXPECT_FALSE(Parse({"connector.ini", "--duration", "ten"}));
  EXPECT_FALSE(Parse({"connector.ini", "--duration", "10s"}));
  EXPECT_NE(std::string::npos,
            m_errors.str().find("Failed to read --duration value \"ten\""));
}
}  // namespace ConnectorTool
