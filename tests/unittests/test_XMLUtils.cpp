/// \file test_XMLUtils.cpp
/// \brief Test xml utility

#include "testing/test_utils.h"
#include "soltran/errors.h"
#include "soltran/xml_utils.h"

using namespace soltran;

namespace {

/// Testing fixture
class test_XMLUtils : public testing::Test {
 protected:
  tinyxml2::XMLDocument doc;  ///< XML document object
};


TEST_F(test_XMLUtils, queryFirstChild) {
  doc.Parse("<settings><grid axial='4'/></settings>");

  auto root = queryFirstChild(&doc, "settings", true);
  ASSERT_NE(nullptr, root);
  EXPECT_STREQ("grid", queryFirstChild(root, "grid")->Name());
}


/// Query for a nonexisting element
TEST_F(test_XMLUtils, queryFirstChildRobust) {
  doc.Parse("<settings/>");
  auto root = doc.RootElement();

  EXPECT_EQ(nullptr, queryFirstChild(root, "grid", false));
  EXPECT_THROW(queryFirstChild(root, "grid", true), ConfigurationError);

  XMLElement *empty = nullptr;
  EXPECT_ANY_THROW(queryFirstChild(empty, "grid"));
}


/// Nodes are either attributes or sub-elements
TEST_F(test_XMLUtils, queryNodeString) {
  doc.Parse("<grid axial='4'><radial>3</radial><nuclides/></grid>");
  auto root = doc.RootElement();

  EXPECT_TRUE(existNode(root, "axial"));
  EXPECT_TRUE(existNode(root, "radial"));
  EXPECT_FALSE(existNode(root, "height"));

  EXPECT_STREQ("4", queryNodeString(root, "axial", true));
  EXPECT_STREQ("3", queryNodeString(root, "radial", true));
  EXPECT_STREQ("", queryNodeString(root, "nuclides", true));
}


TEST_F(test_XMLUtils, queryNodeStringRobust) {
  doc.Parse("<grid/>");
  auto root = doc.RootElement();

  // No exceptions because enforced == false
  EXPECT_EQ(nullptr, queryNodeString(root, "axial", false));
  EXPECT_THROW(queryNodeString(root, "axial", true), ConfigurationError);
}


TEST_F(test_XMLUtils, rejectDuplicatedNodes) {
  doc.Parse("<grid axial='4'><axial>3</axial><radial>1</radial><radial>2</radial></grid>");
  auto root = doc.RootElement();

  EXPECT_THROW(existNode(root, "axial"), ConfigurationError);
  EXPECT_THROW(queryNodeString(root, "radial"), ConfigurationError);
}


TEST_F(test_XMLUtils, loadFileXML) {
  auto dir = testutils::makeTemporaryDirectory("soltran_xml_");
  ASSERT_FALSE(dir.empty());

  testutils::writeTextFile(dir + "/good.xml", "<settings><dt>0.001</dt></settings>\n");
  testutils::writeTextFile(dir + "/bad.xml", "<settings><dt>\n");

  loadFileXML(doc, dir + "/good.xml", true);
  EXPECT_STREQ("0.001", queryNodeString(doc.RootElement(), "dt"));

  tinyxml2::XMLDocument bad;
  EXPECT_NO_THROW(loadFileXML(bad, dir + "/bad.xml", false));
  EXPECT_THROW(loadFileXML(bad, dir + "/bad.xml", true), ConfigurationError);
  EXPECT_NO_THROW(loadFileXML(bad, dir + "/missing.xml", false));
  EXPECT_THROW(loadFileXML(bad, dir + "/missing.xml", true), ConfigurationError);

  testutils::removeTemporaryDirectory(dir);
}

} // namespace
