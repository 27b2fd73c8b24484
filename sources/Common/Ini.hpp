/**************************************************************************
 *   Created: 2012/07/09 08:37:07
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#pragma once

#include "Exception.hpp"
#include <boost/filesystem/path.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/noncopyable.hpp>
#include <iosfwd>
#include <map>
#include <string>

namespace ecosys {
namespace Lib {

////////////////////////////////////////////////////////////////////////////////

//! Configuration source parsed into sections of "key = value" pairs.
/** Section and key names are case-insensitive. Lines started with ";" or
  * "#" are comments, as well as the rest of a line after " ;" or " #".
  * A key with an empty value is treated as absent.
  */
class Ini : private boost::noncopyable {
 public:
  class Error : public Exception {
   public:
    explicit Error(std::string what) : Exception(std::move(what)) {}
  };
  class KeyNotExistsError : public Error {
   public:
    explicit KeyNotExistsError(std::string what) : Error(std::move(what)) {}
  };
  class SectionNotExistsError : public Error {
   public:
    explicit SectionNotExistsError(std::string what)
        : Error(std::move(what)) {}
  };
  class KeyFormatError : public Error {
   public:
    explicit KeyFormatError(std::string what) : Error(std::move(what)) {}
  };

 protected:
  Ini() = default;

 public:
  virtual ~Ini() = default;

 public:
  bool IsSectionExist(const std::string &section) const;
  bool IsKeyExist(const std::string &section, const std::string &key) const;

  std::string ReadKey(const std::string &section,
                      const std::string &key) const;
  std::string ReadKey(const std::string &section,
                      const std::string &key,
                      const std::string &defaultValue) const;

 protected:
  //! Parses source, throws Error with line number at wrong line.
  void Load(std::istream &);

 private:
  typedef std::map<std::string, std::string> Section;
  const Section &GetSection(const std::string &) const;

 private:
  std::map<std::string, Section> m_sections;
};

////////////////////////////////////////////////////////////////////////////////

class IniString : public Ini {
 public:
  explicit IniString(const std::string &source);
};

////////////////////////////////////////////////////////////////////////////////

class IniFile : public Ini {
 public:
  class FileOpenError : public Error {
   public:
    explicit FileOpenError(std::string what) : Error(std::move(what)) {}
  };

 public:
  explicit IniFile(const boost::filesystem::path &);

 public:
  const boost::filesystem::path &GetPath() const { return m_path; }

 private:
  const boost::filesystem::path m_path;
};

////////////////////////////////////////////////////////////////////////////////

class IniSectionRef {
 public:
  explicit IniSectionRef(const Ini &, std::string name);

  operator bool() const { return IsExist(); }

 public:
  const std::string &GetName() const { return m_name; }

  bool IsExist() const;
  bool IsKeyExist(const std::string &key) const;

  std::string ReadKey(const std::string &key) const;
  std::string ReadKey(const std::string &key,
                      const std::string &defaultValue) const;

  template <typename T>
  T ReadTypedKey(const std::string &key) const {
    return Convert<T>(key, ReadKey(key));
  }
  template <typename T>
  T ReadTypedKey(const std::string &key, const T &defaultValue) const {
    const auto &value = ReadKey(key, std::string());
    return value.empty() ? defaultValue : Convert<T>(key, value);
  }

  //! Reads path in lexically normal form.
  boost::filesystem::path ReadFileSystemPath(const std::string &key) const;

 private:
  template <typename T>
  T Convert(const std::string &key, const std::string &value) const {
    try {
      return boost::lexical_cast<T>(value);
    } catch (const boost::bad_lexical_cast &) {
      boost::format message(
          "Wrong INI-key (\"%1%:%2%\") format: \"failed to convert \"%3%\"\"");
      message % m_name % key % value;
      throw Ini::KeyFormatError(message.str());
    }
  }

 private:
  const Ini *m_base;
  std::string m_name;
};

std::ostream &operator<<(std::ostream &, const IniSectionRef &);

////////////////////////////////////////////////////////////////////////////////
}  // namespace Lib
}  // namespace ecosys
