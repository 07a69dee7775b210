/// \file xml_utils.h
/// \brief Helpers for reading settings from XML documents.

#ifndef XML_UTILS_H_
#define XML_UTILS_H_

#include <string>

#include <tinyxml2.h>

namespace soltran
{

using tinyxml2::XMLElement;
using tinyxml2::XMLDocument;


inline namespace xmlutils {

  /// \brief Loads an XML file into a document.
  /// \param enforced Whether a missing or malformed file throws
  ///                 ConfigurationError.
  void loadFileXML(XMLDocument &doc, const std::string &file, bool enforced = false);

  /// \brief Returns the first child element with the given name.
  /// \param enforced Whether a missing child throws ConfigurationError.
  /// \param info Extra text attached to error messages.
  /// \return The child element, or nullptr if it does not exist.
  XMLElement* queryFirstChild(XMLDocument *doc, const std::string &child,
                              bool enforced = false, const std::string &info = "");
  XMLElement* queryFirstChild(XMLElement *parent, const std::string &child,
                              bool enforced = false, const std::string &info = "");

  /// \brief Checks whether an attribute or a sub-element exists.
  /// \details A name used by both an attribute and a sub-element, or by
  ///          two sub-elements, throws ConfigurationError.
  bool existNode(const XMLElement *parent, const std::string &child);

  /// \brief Returns the text of an attribute or a sub-element.
  /// \details An empty sub-element yields an empty string.
  /// \return The text, or nullptr if the node does not exist.
  const char* queryNodeString(XMLElement *parent, const std::string &child,
                              bool enforced = false, const std::string &info = "");

} // inline namespace xmlutils


} // namespace soltran

#endif  // XML_UTILS_H_
