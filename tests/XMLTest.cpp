#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "json_to_xml.hpp"
#include "pugixml.hpp"

namespace {

class XMLWriterTest : public testing::Test {
 protected:
  std::string write(const std::vector<XMLToken>& tokens, Status expected = STATUS_OK) {
    std::ostringstream out;
    XMLWriter writer(out, sep_);
    Status ret = STATUS_OK;
    for (size_t i = 0; i < tokens.size() && ret == STATUS_OK; i++) {
      ret = writer.put(tokens[i]);
    }
    EXPECT_EQ(expected, ret);
    return out.str();
  }

  std::string sep_;
};

TEST_F(XMLWriterTest, elements) {
  EXPECT_EQ(
      "<object><number name=\"Longitude\">-1.8262</number><null></null></object>",
      write({XMLToken::start("object"),
             XMLToken::start("number", "Longitude"),
             XMLToken::charData("-1.8262"),
             XMLToken::end("number"),
             XMLToken::start("null"),
             XMLToken::end("null"),
             XMLToken::end("object")}));
}

TEST_F(XMLWriterTest, charDataIsEscaped) {
  EXPECT_EQ(
      "<string>a &lt;b&gt; &amp; \"c\" 'd'&#xD;\n</string>",
      write({XMLToken::start("string"), XMLToken::charData("a <b> & \"c\" 'd'\r\n"), XMLToken::end("string")}));
}

TEST_F(XMLWriterTest, attributeIsEscaped) {
  EXPECT_EQ(
      "<null name=\"&quot;k&quot; &lt;&amp;&gt;&#x9;&#xA;\"></null>",
      write({XMLToken::start("null", "\"k\" <&>\t\n"), XMLToken::end("null")}));
}

TEST_F(XMLWriterTest, emptyAttributeIsKept) {
  EXPECT_EQ("<null name=\"\"></null>", write({XMLToken::start("null", ""), XMLToken::end("null")}));
}

TEST_F(XMLWriterTest, invalidCharactersAreReplaced) {
  EXPECT_EQ(
      "<string name=\"k\xef\xbf\xbd\">a\xef\xbf\xbd" "b\xef\xbf\xbd\xef\xbf\xbd\xc3\xa9</string>",
      write({XMLToken::start("string", std::string("k\0", 2)),
             XMLToken::charData("a\x01" "b\xff\xfe\xc3\xa9"),
             XMLToken::end("string")}));
}

TEST_F(XMLWriterTest, truncatedSequenceIsReplaced) {
  EXPECT_EQ(
      "<string>\xef\xbf\xbd\xef\xbf\xbd" "x\xef\xbf\xbd</string>",
      write({XMLToken::start("string"), XMLToken::charData("\xe2\x82" "x\xef\xbf\xbf"), XMLToken::end("string")}));
}

TEST_F(XMLWriterTest, separatorAfterTopLevelElements) {
  sep_ = "\n";
  EXPECT_EQ(
      "<array><null></null></array>\n<boolean>true</boolean>\n",
      write({XMLToken::start("array"),
             XMLToken::start("null"),
             XMLToken::end("null"),
             XMLToken::end("array"),
             XMLToken::start("boolean"),
             XMLToken::charData("true"),
             XMLToken::end("boolean")}));
}

TEST_F(XMLWriterTest, mismatchedEnd) {
  EXPECT_EQ(
      "<array>",
      write({XMLToken::start("array"), XMLToken::end("object")}, STATUS_MISMATCHED_END));
  EXPECT_EQ("", write({XMLToken::end("object")}, STATUS_MISMATCHED_END));
}

TEST_F(XMLWriterTest, unknownToken) {
  EXPECT_EQ("", write({XMLToken()}, STATUS_UNKNOWN_TOKEN));
}

TEST_F(XMLWriterTest, failedStream) {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  XMLWriter writer(out);
  EXPECT_EQ(STATUS_WRITE_ERROR, writer.put(XMLToken::start("object")));
  EXPECT_EQ(STATUS_WRITE_ERROR, writer.flush());
}

TEST(XMLTreeBuilderTest, buildsTree) {
  pugi::xml_document doc;
  pugi::xml_node root = doc.append_child("json");
  XMLTreeBuilder builder(root);
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::start("object")));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::start("string", "a&b")));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::charData("x<y")));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::end("string")));
  EXPECT_EQ(std::string("object"), builder.current().name());
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::start("null")));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::end("null")));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::end("object")));
  EXPECT_TRUE(root == builder.current());

  pugi::xml_node str = root.child("object").child("string");
  EXPECT_STREQ("a&b", str.attribute("name").value());
  EXPECT_STREQ("x<y", str.child_value());

  std::ostringstream out;
  root.print(out, "", pugi::format_raw | pugi::format_no_empty_element_tags);
  EXPECT_EQ(
      "<json><object><string name=\"a&amp;b\">x&lt;y</string><null></null></object></json>",
      out.str());
}

TEST(XMLTreeBuilderTest, mismatchedEnd) {
  pugi::xml_document doc;
  pugi::xml_node root = doc.append_child("json");
  XMLTreeBuilder builder(root);
  EXPECT_EQ(STATUS_MISMATCHED_END, builder.put(XMLToken::end("json")));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::start("array")));
  EXPECT_EQ(STATUS_MISMATCHED_END, builder.put(XMLToken::end("object")));
}

TEST(XMLTreeBuilderTest, invalidRoot) {
  XMLTreeBuilder builder((pugi::xml_node()));
  EXPECT_EQ(STATUS_WRITE_ERROR, builder.put(XMLToken::start("object")));
}

TEST(XMLTreeBuilderTest, nulDoesNotTruncate) {
  pugi::xml_document doc;
  pugi::xml_node root = doc.append_child("json");
  XMLTreeBuilder builder(root);
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::start("string", std::string("a\0b", 3))));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::charData(std::string("x\0y\x01", 4))));
  ASSERT_EQ(STATUS_OK, builder.put(XMLToken::end("string")));

  pugi::xml_node str = root.child("string");
  EXPECT_STREQ("a\xef\xbf\xbd" "b", str.attribute("name").value());
  EXPECT_STREQ("x\xef\xbf\xbd" "y\xef\xbf\xbd", str.child_value());
}

class ConvertTextTest : public testing::Test {
 protected:
  Status convertText(const std::string& json, std::string& xml, bool useNumber = true) {
    std::istringstream in(json);
    std::ostringstream out;
    JSONTokenizer tokenizer(in, useNumber);
    XMLWriter writer(out);
    Status ret = convert(tokenizer, writer);
    xml = out.str();
    return ret;
  }

  std::string convertText(const std::string& json) {
    std::string xml;
    EXPECT_EQ(STATUS_OK, convertText(json, xml));
    return xml;
  }
};

TEST_F(ConvertTextTest, emptyContainers) {
  EXPECT_EQ("<object></object>", convertText("{}"));
  EXPECT_EQ("<array></array>", convertText("[]"));
}

TEST_F(ConvertTextTest, scalars) {
  EXPECT_EQ("<boolean>true</boolean>", convertText("true"));
  EXPECT_EQ("<boolean>false</boolean>", convertText("false"));
  EXPECT_EQ("<null></null>", convertText("null"));
  EXPECT_EQ("<number>-12.50</number>", convertText("-12.50"));
  EXPECT_EQ("<string>a &lt;&amp;&gt; b</string>", convertText("\"a <&> b\""));
}

TEST_F(ConvertTextTest, location) {
  EXPECT_EQ(
      "<object><object name=\"Location\">"
      "<number name=\"Longitude\">-1.8262</number>"
      "<number name=\"Latitude\">51.1789</number>"
      "</object></object>",
      convertText("{\n"
                  "  \"Location\": {\n"
                  "    \"Longitude\": -1.8262,\n"
                  "    \"Latitude\": 51.1789\n"
                  "  }\n"
                  "}\n"));
}

TEST_F(ConvertTextTest, mixedDocument) {
  EXPECT_EQ("<array><object></object></array>", convertText("[{}]"));
  EXPECT_EQ(
      "<object><array name=\"list\"><number>1</number><string>two</string>"
      "<array><null></null></array></array><boolean name=\"ok\">true</boolean></object>",
      convertText("{\"list\": [1, \"two\", [null]], \"ok\": true}"));
}

TEST_F(ConvertTextTest, floatNumbers) {
  std::string xml;
  ASSERT_EQ(STATUS_OK, convertText("[1.50, 1e3, -0.000001]", xml, false));
  EXPECT_EQ(
      "<array><number>1.5</number><number>1000</number><number>-0.000001</number></array>",
      xml);
}

TEST_F(ConvertTextTest, numberTextSurvivesRoundTrip) {
  const char* literals[] = {"0", "-0", "1.10", "2.5E+3", "-1.8262", "123456789012345678901234567890", "1e-400"};
  for (size_t i = 0; i < sizeof(literals) / sizeof(literals[0]); i++) {
    std::string xml = convertText(literals[i]);
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(xml.c_str()));
    std::string text = doc.child("number").child_value();
    EXPECT_EQ(literals[i], text);
    EXPECT_EQ(xml, convertText(text));
  }
}

TEST_F(ConvertTextTest, syntaxErrorStopsConversion) {
  std::string xml;
  EXPECT_EQ(STATUS_SYNTAX_ERROR, convertText("[true, }", xml));
  EXPECT_EQ("<array><boolean>true</boolean>", xml);
}

TEST_F(ConvertTextTest, invalidXmlCharactersAreReplaced) {
  std::string xml;
  ASSERT_EQ(STATUS_OK, convertText("[\"a\\u0001b\", {\"k\\u0000\": 1}, \"\xff\xfe\"]", xml));
  EXPECT_EQ(
      "<array><string>a\xef\xbf\xbd" "b</string>"
      "<object><number name=\"k\xef\xbf\xbd\">1</number></object>"
      "<string>\xef\xbf\xbd\xef\xbf\xbd</string></array>",
      xml);

  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(xml.c_str()));
  pugi::xml_node array = doc.child("array");
  EXPECT_STREQ("a\xef\xbf\xbd" "b", array.child("string").child_value());
  EXPECT_STREQ("k\xef\xbf\xbd", array.child("object").child("number").attribute("name").value());
  EXPECT_STREQ("\xef\xbf\xbd\xef\xbf\xbd", array.last_child().child_value());
}

TEST_F(ConvertTextTest, treeOutput) {
  std::istringstream in("{\"a\": [null, \"x\"]}");
  JSONTokenizer tokenizer(in);
  pugi::xml_document doc;
  pugi::xml_node root = doc.append_child("json");
  XMLTreeBuilder builder(root);
  ASSERT_EQ(STATUS_OK, convert(tokenizer, builder));

  std::ostringstream out;
  root.print(out, "", pugi::format_raw | pugi::format_no_empty_element_tags);
  EXPECT_EQ(
      "<json><object><array name=\"a\"><null></null><string>x</string></array></object></json>",
      out.str());
}

} // namespace
