//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include <gtest/gtest.h>

#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptXml.h"
#include "ptNumericConvert.h"

using namespace pt;

class XmlTest : public testing::Test
{
protected:
  virtual void TearDown() override
  {
    if( _root != nullptr )
      _root->free();
  }

  xml::node_t* _root = nullptr;
};

TEST_F(XmlTest, ElementsAttributesAndText)
{
  const char* s =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE score-partwise PUBLIC \"-//Recordare//DTD MusicXML 3.1 Partwise//EN\" \"http://www.musicxml.org/dtds/partwise.dtd\">\n"
    "<!-- comment -->\n"
    "<score-partwise version=\"3.1\">\n"
    "  <part id='P1'>\n"
    "    <measure number=\"1\"><note><pitch><step> C </step></pitch></note></measure>\n"
    "    <measure number=\"2\"/>\n"
    "  </part>\n"
    "</score-partwise>\n";

  ASSERT_EQ(xml::parse(s,_root),kOkRC);
  ASSERT_NE(_root,nullptr);
  EXPECT_STREQ(_root->label,"score-partwise");
  EXPECT_STREQ(_root->attr("version"),"3.1");
  EXPECT_EQ(_root->attr("missing"),nullptr);

  const xml::node_t* part = _root->find_child("part");
  ASSERT_NE(part,nullptr);
  EXPECT_STREQ(part->attr("id"),"P1");
  EXPECT_EQ(part->child_count(),2u);

  const xml::node_t* m1 = part->next_child("measure",nullptr);
  const xml::node_t* m2 = part->next_child("measure",m1);
  ASSERT_NE(m1,nullptr);
  ASSERT_NE(m2,nullptr);
  EXPECT_STREQ(m2->attr("number"),"2");
  EXPECT_EQ(part->next_child("measure",m2),nullptr);
  EXPECT_EQ(m2->parent,part);

  const xml::node_t* step = _root->find_descendant("step");
  ASSERT_NE(step,nullptr);
  EXPECT_STREQ(step->trimmed_text(),"C");
  EXPECT_STREQ(step->parent->child_text("step"),"C");
  EXPECT_EQ(step->parent->child_text("octave"),nullptr);
  EXPECT_STREQ(m2->trimmed_text(),"");
}

TEST_F(XmlTest, EntitiesAndCData)
{
  const char* s = "<work><work-title>Bach &amp; Sons &lt;&#65;&#x42;&gt; <![CDATA[<raw>]]></work-title></work>";

  ASSERT_EQ(xml::parse(s,_root),kOkRC);
  EXPECT_STREQ(_root->child_text("work-title"),"Bach & Sons <AB> <raw>");
}

TEST_F(XmlTest, Utf8NamesAndText)
{
  // bytes >= 0x80 are name characters and never whitespace
  const char* s =
    "<work>"
    "<work-title> F\xc3\xbc" "r Elise </work-title>"
    "<\xc3\xa9tude n\xc3\xb8=\"\xc3\xa5\">x</\xc3\xa9tude>"
    "</work>";

  ASSERT_EQ(xml::parse(s,_root),kOkRC);
  EXPECT_STREQ(_root->find_child("work-title")->trimmed_text(),"F\xc3\xbc" "r Elise");

  const xml::node_t* e = _root->find_child("\xc3\xa9tude");
  ASSERT_NE(e,nullptr);
  EXPECT_STREQ(e->attr("n\xc3\xb8"),"\xc3\xa5");
  EXPECT_STREQ(e->trimmed_text(),"x");
}

TEST_F(XmlTest, InvalidDocuments)
{
  EXPECT_EQ(xml::parse(nullptr,_root),kInvalidArgRC);
  EXPECT_EQ(xml::parse("  \n ",_root),kInvalidArgRC);
  EXPECT_EQ(xml::parse("<a><b></a>",_root),kSyntaxErrorRC);
  EXPECT_EQ(xml::parse("<a>",_root),kSyntaxErrorRC);
  EXPECT_EQ(xml::parse("<a x=1/>",_root),kSyntaxErrorRC);
  EXPECT_EQ(xml::parse("not markup",_root),kSyntaxErrorRC);
  EXPECT_EQ(_root,nullptr);
}

TEST_F(XmlTest, MissingFile)
{
  EXPECT_EQ(xml::parseFile("/nonexistent/score.musicxml",_root),kOpenFailRC);
  EXPECT_EQ(xml::parseFile(nullptr,_root),kInvalidArgRC);
}

TEST(NumericConvertTest, StringToNumber)
{
  int      i = 0;
  unsigned u = 0;
  double   d = 0;

  EXPECT_EQ(string_to_number(" 42 ",i),kOkRC);
  EXPECT_EQ(i,42);
  EXPECT_EQ(string_to_number("-1",i),kOkRC);
  EXPECT_EQ(i,-1);

  // out of range values are rejected and the destination is unchanged
  EXPECT_EQ(string_to_number("-1",u),kInvalidArgRC);
  EXPECT_EQ(u,0u);

  EXPECT_EQ(string_to_number("",i),kInvalidArgRC);
  EXPECT_EQ(string_to_number(nullptr,i),kInvalidArgRC);
  EXPECT_EQ(string_to_number("4x",i),kSyntaxErrorRC);
  EXPECT_EQ(string_to_number("x",i),kSyntaxErrorRC);

  EXPECT_EQ(string_to_number("96.5",d),kOkRC);
  EXPECT_DOUBLE_EQ(d,96.5);
  EXPECT_EQ(string_to_number("1.5.2",d),kSyntaxErrorRC);

  EXPECT_EQ(string_to_number_or<int>("abc",4),4);
  EXPECT_EQ(string_to_number_or<int>("3",4),3);
  EXPECT_DOUBLE_EQ(string_to_number_or<double>(nullptr,120.0),120.0);
}
