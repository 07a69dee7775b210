/// \file SettingsTree.h
/// \brief Read-only access to XML and TOML settings files.

#ifndef SETTINGS_TREE_H_
#define SETTINGS_TREE_H_

#include <memory>
#include <string>

#include <toml.hpp>

#include "soltran/enum_types.h"
#include "soltran/xml_utils.h"

namespace soltran {

///---------------------------------------------------------------------
/// \class SettingsTree
/// \brief A settings file made of root options and one level of sections
/// \details Options are looked up by section and key. The root section
///          has an empty name. Missing sections and keys are not errors.
///---------------------------------------------------------------------
class SettingsTree {

public:

  virtual ~SettingsTree() = default;

  /// \brief Creates an empty tree for a file format.
  static std::unique_ptr<SettingsTree> create(settingsFormat format);

  /// \brief Loads a settings file.
  /// \return False if the file has no usable root.
  virtual bool load(const std::string &file) = 0;

  /// \brief Looks up an option.
  /// \param section Name of the section, or "" for the root.
  /// \param key Name of the option.
  /// \param value The option value as a trimmed string.
  /// \return True if the option was found.
  virtual bool find(const std::string &section, const std::string &key,
                    std::string &value) const = 0;

};


///---------------------------------------------------------------------
/// \class SettingsTreeXML
/// \details The root element is <settings>. Sections are sub-elements,
///          options are either attributes or sub-elements.
///---------------------------------------------------------------------
class SettingsTreeXML : public SettingsTree {

public:

  bool load(const std::string &file) override;
  bool find(const std::string &section, const std::string &key,
            std::string &value) const override;

private:

  XMLDocument _doc;
  XMLElement *_root = nullptr;

};


///---------------------------------------------------------------------
/// \class SettingsTreeTOML
/// \details Sections are tables. Arrays become comma-separated lists.
///---------------------------------------------------------------------
class SettingsTreeTOML : public SettingsTree {

public:

  bool load(const std::string &file) override;
  bool find(const std::string &section, const std::string &key,
            std::string &value) const override;

private:

  toml::value _root;

};


} // namespace soltran

#endif  // SETTINGS_TREE_H_
