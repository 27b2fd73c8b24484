/**************************************************************************
 *   Created: 2012/07/09 08:49:56
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"
#include "Ini.hpp"

using namespace ecosys;
using namespace ecosys::Lib;

namespace fs = boost::filesystem;

namespace {

bool IsCommentMark(char ch) { return ch == ';' || ch == '#'; }

//! Cuts the comment tail, the mark has to follow a space.
void RemoveComment(std::string &line) {
  for (size_t i = 1; i < line.size(); ++i) {
    if (IsCommentMark(line[i]) &&
        std::isspace(static_cast<unsigned char>(line[i - 1]))) {
      line.resize(i);
      return;
    }
  }
}

std::string MakeName(const std::string &source) {
  return boost::to_lower_copy(boost::trim_copy(source));
}
}  // namespace

////////////////////////////////////////////////////////////////////////////////

void Ini::Load(std::istream &source) {
  Section *section = nullptr;
  std::string line;
  for (size_t lineNo = 1; std::getline(source, line); ++lineNo) {
    boost::trim(line);
    if (line.empty() || IsCommentMark(line.front())) {
      continue;
    }
    RemoveComment(line);
    boost::trim(line);

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        boost::format message("Wrong INI section name at line %1%: \"%2%\"");
        message % lineNo % line;
        throw Error(message.str());
      }
      section = &m_sections[MakeName(line.substr(1, line.size() - 2))];
      continue;
    }

    const auto delimiter = line.find('=');
    if (!section || delimiter == std::string::npos || delimiter == 0) {
      boost::format message("Wrong INI line %1%: \"%2%\"");
      message % lineNo % line;
      throw Error(message.str());
    }
    auto value = boost::trim_copy(line.substr(delimiter + 1));
    (*section)[MakeName(line.substr(0, delimiter))] = std::move(value);
  }
}

const Ini::Section &Ini::GetSection(const std::string &name) const {
  const auto &it = m_sections.find(MakeName(name));
  if (it == m_sections.cend()) {
    boost::format message("INI section \"%1%\" does not exist");
    message % name;
    throw SectionNotExistsError(message.str());
  }
  return it->second;
}

bool Ini::IsSectionExist(const std::string &section) const {
  return m_sections.count(MakeName(section)) > 0;
}

bool Ini::IsKeyExist(const std::string &section,
                     const std::string &key) const {
  const auto &sectionIt = m_sections.find(MakeName(section));
  if (sectionIt == m_sections.cend()) {
    return false;
  }
  const auto &it = sectionIt->second.find(MakeName(key));
  return it != sectionIt->second.cend() && !it->second.empty();
}

std::string Ini::ReadKey(const std::string &section,
                         const std::string &key) const {
  const auto &keys = GetSection(section);
  const auto &it = keys.find(MakeName(key));
  if (it == keys.cend() || it->second.empty()) {
    boost::format message("INI key \"%1%:%2%\" does not exist");
    message % section % key;
    throw KeyNotExistsError(message.str());
  }
  return it->second;
}

std::string Ini::ReadKey(const std::string &section,
                         const std::string &key,
                         const std::string &defaultValue) const {
  const auto &keys = GetSection(section);
  const auto &it = keys.find(MakeName(key));
  return it == keys.cend() || it->second.empty() ? defaultValue : it->second;
}

////////////////////////////////////////////////////////////////////////////////

IniString::IniString(const std::string &source) {
  std::istringstream stream(source);
  Load(stream);
}

IniFile::IniFile(const fs::path &path) : m_path(path) {
  std::ifstream file(m_path.string().c_str());
  if (!file) {
    boost::format message("Failed to open INI-file %1%");
    message % m_path;
    throw FileOpenError(message.str());
  }
  Load(file);
}

////////////////////////////////////////////////////////////////////////////////

IniSectionRef::IniSectionRef(const Ini &base, std::string name)
    : m_base(&base), m_name(std::move(name)) {}

bool IniSectionRef::IsExist() const {
  return m_base->IsSectionExist(m_name);
}

bool IniSectionRef::IsKeyExist(const std::string &key) const {
  return m_base->IsKeyExist(m_name, key);
}

std::string IniSectionRef::ReadKey(const std::string &key) const {
  return m_base->ReadKey(m_name, key);
}

std::string IniSectionRef::ReadKey(const std::string &key,
                                   const std::string &defaultValue) const {
  return m_base->ReadKey(m_name, key, defaultValue);
}

fs::path IniSectionRef::ReadFileSystemPath(const std::string &key) const {
  return fs::path(ReadKey(key)).lexically_normal();
}

std::ostream &Lib::operator<<(std::ostream &os, const IniSectionRef &section) {
  return os << section.GetName();
}
