#include "soltran/SettingsTree.h"
#include "soltran/errors.h"
#include "soltran/log.h"
#include "soltran/string_utils.h"
#include "soltran/toml_utils.h"

namespace soltran {


std::unique_ptr<SettingsTree> SettingsTree::create(settingsFormat format) {
  switch (format) {
    case settingsFormat::XML:
      return std::unique_ptr<SettingsTree>(new SettingsTreeXML());
    case settingsFormat::TOML:
      return std::unique_ptr<SettingsTree>(new SettingsTreeTOML());
  }
  log::error("Unknown settings format");
}


//----------------------------------------------------------------------
// SettingsTreeXML
//----------------------------------------------------------------------
bool SettingsTreeXML::load(const std::string &file) {
  loadFileXML(_doc, file, true);
  _root = queryFirstChild(&_doc, "settings");
  return _root != nullptr;
}


bool SettingsTreeXML::find(const std::string &section, const std::string &key,
                           std::string &value) const {

  XMLElement *parent = _root;
  if (parent && !section.empty())
    parent = queryFirstChild(parent, section);

  if (!parent)
    return false;

  auto text = queryNodeString(parent, key);
  if (!text)
    return false;

  value = stringutils::trim(std::string(text));
  log::debug("Settings: found '{}' in section '{}'", key, section);
  return true;
}


//----------------------------------------------------------------------
// SettingsTreeTOML
//----------------------------------------------------------------------
bool SettingsTreeTOML::load(const std::string &file) {
  try {
    _root = toml::parse(file);
  }
  catch (const std::exception &e) {
    log::raise<ConfigurationError>("Failed to parse TOML file '{}':\n{}", file, e.what());
  }
  return _root.is_table();
}


bool SettingsTreeTOML::find(const std::string &section, const std::string &key,
                            std::string &value) const {

  const toml::value *parent = &_root;

  if (!section.empty()) {
    if (!_root.contains(section))
      return false;

    parent = &_root.at(section);
    if (!parent->is_table())
      log::raise<ConfigurationError>("TOML node '{}' must be a table", section);
  }

  if (!parent->contains(key))
    return false;

  const auto &node = parent->at(key);
  if (node.is_table())
    log::raise<ConfigurationError>("TOML node '{}' must not be a table", key);

  value = stringutils::trim(tomlutils::toString(node));
  log::debug("Settings: found '{}' in section '{}'", key, section);
  return true;
}


} // namespace soltran
