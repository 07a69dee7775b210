#include "soltran/xml_utils.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"
#include "soltran/log.h"

namespace soltran {


inline namespace xmlutils {


namespace {

/// \brief Shared by the document and element overloads
template <typename T>
XMLElement* firstChild(T *parent, const char *parent_name,
                       const std::string &child, bool enforced,
                       const std::string &info) {
  if (!parent)
    log::error("Could not query '{}' of an empty XML object", child);

  auto e = parent->FirstChildElement(child.c_str());
  if (enforced && !e)
    log::raise<ConfigurationError>("Missing sub-element '{}' of '{}' {}",
                                   child, parent_name, info);
  return e;
}

} // anonymous namespace


void loadFileXML(XMLDocument &doc, const std::string &file, bool enforced) {

  if (!fileutils::existsFile(file)) {
    if (enforced)
      log::raise<ConfigurationError>("Cannot find XML file '{}'", file);
    return;
  }

  if (doc.LoadFile(file.c_str()) != tinyxml2::XML_SUCCESS && enforced)
    log::raise<ConfigurationError>("Failed to load XML file '{}':\n{}",
                                   file, doc.ErrorStr());
}


XMLElement* queryFirstChild(XMLDocument *doc, const std::string &child,
                            bool enforced, const std::string &info) {
  return firstChild(doc, "document", child, enforced, info);
}


XMLElement* queryFirstChild(XMLElement *parent, const std::string &child,
                            bool enforced, const std::string &info) {
  return firstChild(parent, parent ? parent->Name() : "", child, enforced, info);
}


bool existNode(const XMLElement *parent, const std::string &child) {

  auto attr = parent->Attribute(child.c_str());
  auto elem = parent->FirstChildElement(child.c_str());

  if (elem && (attr || elem->NextSiblingElement(child.c_str())))
    log::raise<ConfigurationError>("Duplicated attribute or sub-element '{}' in '{}'",
                                   child, parent->Name());

  return attr || elem;
}


const char* queryNodeString(XMLElement *parent, const std::string &child,
                            bool enforced, const std::string &info) {

  if (!existNode(parent, child)) {
    if (enforced)
      log::raise<ConfigurationError>("Missing attribute or sub-element '{}' of '{}' {}",
                                     child, parent->Name(), info);
    return nullptr;
  }

  if (auto attr = parent->Attribute(child.c_str()))
    return attr;

  auto text = parent->FirstChildElement(child.c_str())->GetText();
  return text ? text : "";
}


} // inline namespace xmlutils


} // namespace soltran
