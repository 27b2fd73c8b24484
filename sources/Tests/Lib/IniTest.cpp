/**************************************************************************
 *   Created: 2017/08/15 10:14:40
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"

namespace lib = ecosys::Lib;
namespace fs = boost::filesystem;

////////////////////////////////////////////////////////////////////////////////

namespace {
const char *const source =
    "; Settings for tests.\n"
    "[Common]\n"
    "name = Ecosystem   \n"
    "  number=42\n"
    "wrong_number = 4x2\n"
    "query = a=b&c=d\n"
    "url = http://localhost:7497/path\n"
    "path = some/dir/../file.log\n"
    "empty =\n"
    "\n"
    "# Second section\n"
    "[ InteractiveBrokers ]\n"
    "Port = 7496\n"
    "ip_address = 10.0.0.1 ; gateway\n"
    "client_id = 3 # trader\n"
    "[Common]\n"
    "number = 43\n";
}  // namespace

////////////////////////////////////////////////////////////////////////////////

namespace Lib {

TEST(Ini, Keys) {
  const lib::IniString ini(source);

  EXPECT_EQ("Ecosystem", ini.ReadKey("Common", "name"));
  EXPECT_EQ("Ecosystem", ini.ReadKey("COMMON", "NAME"));
  EXPECT_EQ("a=b&c=d", ini.ReadKey("Common", "query"));
  EXPECT_EQ("http://localhost:7497/path", ini.ReadKey("Common", "url"));
  EXPECT_EQ("10.0.0.1", ini.ReadKey("InteractiveBrokers", "ip_address"));
  EXPECT_EQ("3", ini.ReadKey("InteractiveBrokers", "client_id"));
  EXPECT_EQ("7496", ini.ReadKey("InteractiveBrokers", "port"));
  // Repeated section continues the first one.
  EXPECT_EQ("43", ini.ReadKey("Common", "number"));

  EXPECT_TRUE(ini.IsKeyExist("Common", "number"));
  EXPECT_FALSE(ini.IsKeyExist("Common", "port"));
  EXPECT_FALSE(ini.IsKeyExist("Common", "empty"));
  EXPECT_FALSE(ini.IsKeyExist("Absent", "name"));

  EXPECT_THROW(ini.ReadKey("Common", "port"), lib::Ini::KeyNotExistsError);
  EXPECT_THROW(ini.ReadKey("Common", "empty"), lib::Ini::KeyNotExistsError);
  EXPECT_EQ("default", ini.ReadKey("Common", "empty", "default"));
  EXPECT_EQ("default", ini.ReadKey("Common", "port", "default"));
  EXPECT_THROW(ini.ReadKey("Absent", "name"),
               lib::Ini::SectionNotExistsError);
  EXPECT_THROW(ini.ReadKey("Absent", "name", "default"),
               lib::Ini::SectionNotExistsError);
}

TEST(Ini, WrongSource) {
  EXPECT_THROW(lib::IniString("key = value\n[Section]\n"), lib::Ini::Error);
  EXPECT_THROW(lib::IniString("[Section]\nkey\n"), lib::Ini::Error);
  EXPECT_THROW(lib::IniString("[Section]\n= value\n"), lib::Ini::Error);
  EXPECT_THROW(lib::IniString("[Section\nkey = value\n"), lib::Ini::Error);
  EXPECT_THROW(lib::IniString("[]\n"), lib::Ini::Error);
  EXPECT_NO_THROW(lib::IniString(""));
}

TEST(Ini, SectionRef) {
  const lib::IniString ini(source);

  const lib::IniSectionRef section(ini, "InteractiveBrokers");
  EXPECT_TRUE(section);
  EXPECT_EQ("InteractiveBrokers", section.GetName());
  EXPECT_TRUE(section.IsKeyExist("ip_address"));
  EXPECT_FALSE(section.IsKeyExist("timeout"));
  EXPECT_EQ("10.0.0.1", section.ReadKey("ip_address"));
  EXPECT_EQ("10.0.0.1", section.ReadKey("ip_address", "127.0.0.1"));
  EXPECT_EQ("127.0.0.1", section.ReadKey("host", "127.0.0.1"));

  std::ostringstream os;
  os << section;
  EXPECT_EQ("InteractiveBrokers", os.str());

  const lib::IniSectionRef absent(ini, "Absent");
  EXPECT_FALSE(absent);
  EXPECT_FALSE(absent.IsKeyExist("name"));
  EXPECT_THROW(absent.ReadTypedKey<int>("port", 1),
               lib::Ini::SectionNotExistsError);
}

TEST(Ini, TypedKeys) {
  const lib::IniString ini(source);
  const lib::IniSectionRef common(ini, "Common");
  const lib::IniSectionRef ib(ini, "InteractiveBrokers");

  EXPECT_EQ(43, common.ReadTypedKey<int>("number"));
  EXPECT_EQ(7496, ib.ReadTypedKey<long>("port"));
  EXPECT_EQ(10, common.ReadTypedKey<int>("absent", 10));
  EXPECT_EQ(10, common.ReadTypedKey<int>("empty", 10));
  EXPECT_THROW(common.ReadTypedKey<int>("absent"),
               lib::Ini::KeyNotExistsError);
  EXPECT_THROW(common.ReadTypedKey<int>("wrong_number"),
               lib::Ini::KeyFormatError);
  EXPECT_THROW(common.ReadTypedKey<int>("wrong_number", 1),
               lib::Ini::KeyFormatError);
  EXPECT_EQ(-1, lib::IniSectionRef(lib::IniString("[A]\nkey = -1\n"), "A")
                    .ReadTypedKey<long>("key"));

  try {
    common.ReadTypedKey<int>("wrong_number");
  } catch (const lib::Ini::KeyFormatError &ex) {
    EXPECT_STREQ(
        "Wrong INI-key (\"Common:wrong_number\") format:"
        " \"failed to convert \"4x2\"\"",
        ex.what());
  }

  EXPECT_EQ(fs::path("some/file.log"), common.ReadFileSystemPath("path"));
  EXPECT_THROW(common.ReadFileSystemPath("absent"),
               lib::Ini::KeyNotExistsError);
}

TEST(Ini, File) {
  const auto &path = fs::temp_directory_path() /
                     fs::unique_path("EcosystemTests-%%%%-%%%%.ini");
  {
    std::ofstream file(path.string().c_str(), std::ios::trunc);
    ASSERT_TRUE(static_cast<bool>(file));
    file << source;
  }
  {
    const lib::IniFile ini(path);
    EXPECT_EQ(path, ini.GetPath());
    const lib::IniSectionRef section(ini, "InteractiveBrokers");
    EXPECT_EQ(7496, section.ReadTypedKey<int>("port"));
    EXPECT_EQ("10.0.0.1", section.ReadKey("ip_address"));
  }
  fs::remove(path);

  EXPECT_THROW(lib::IniFile ini(path), lib::IniFile::FileOpenError);
}
}  // namespace Lib
