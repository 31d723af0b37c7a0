#include <ima-pkg/error.h>
#include <ima-pkg/xmltree.h>

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(XMLTreeTest, RoundTrip)
{
   std::string const Input =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<!-- generated -->\n"
      "<repomd xmlns=\"http://linux.duke.edu/metadata/repo\" xmlns:rpm=\"http://linux.duke.edu/metadata/rpm\">\n"
      "  <revision>1700000000</revision>\n"
      "  <tags><content>a &amp; b &lt;c&gt;</content></tags>\n"
      "  <!-- the primary data -->\n"
      "  <data type=\"primary\">\n"
      "    <location href=\"repodata/x&amp;y&quot;.xml.gz\"/>\n"
      "    <rpm:extra><![CDATA[raw <text>]]></rpm:extra>\n"
      "    <?hint keep me?>\n"
      "  </data>\n"
      "</repomd>";

   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXML(Input, Doc));
   EXPECT_EQ(Input + "\n", IMA::SerializeXML(Doc));

   // a second pass is stable
   IMA::XMLDocument Again;
   ASSERT_TRUE(IMA::ParseXML(IMA::SerializeXML(Doc), Again));
   EXPECT_EQ(IMA::SerializeXML(Doc), IMA::SerializeXML(Again));
}
TEST(XMLTreeTest, DeclarationIsRewritten)
{
   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXML("<?xml version='1.0' encoding='utf-8'?>\n\n<a x='1'>text</a>\n\n", Doc));
   EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<a x=\"1\">text</a>\n", IMA::SerializeXML(Doc));

   ASSERT_TRUE(IMA::ParseXML("<a/>", Doc));
   EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<a/>\n", IMA::SerializeXML(Doc));
}
TEST(XMLTreeTest, Escaping)
{
   IMA::XMLDocument Doc;
   Doc.AppendChild(std::unique_ptr<IMA::XMLNode>(new IMA::XMLNode(IMA::XMLNode::Element, "root")));
   IMA::XMLNode &Child = Doc.Root()->AppendElement("child");
   Child.SetAttribute("value", "a&b<c>\"d\"\te\nf");
   Child.SetText("1 < 2 & 3 > 2 \"quoted\"");
   EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	     "<root><child value=\"a&amp;b&lt;c&gt;&quot;d&quot;&#09;e&#10;f\">1 &lt; 2 &amp; 3 &gt; 2 \"quoted\"</child></root>\n",
	     IMA::SerializeXML(Doc));

   // and it comes back as it went in
   IMA::XMLDocument Parsed;
   ASSERT_TRUE(IMA::ParseXML(IMA::SerializeXML(Doc), Parsed));
   IMA::XMLNode const * const Back = Parsed.Root()->LastChildElement();
   ASSERT_NE(nullptr, Back);
   EXPECT_EQ("a&b<c>\"d\"\te\nf", Back->Attribute("value"));
   EXPECT_EQ("1 < 2 & 3 > 2 \"quoted\"", Back->Text());
}
TEST(XMLTreeTest, Namespaces)
{
   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXML(
	 "<repo:repomd xmlns:repo=\"http://linux.duke.edu/metadata/repo\" xmlns=\"urn:other\">"
	 "<repo:data type=\"primary\"><inner xmlns:repo=\"urn:shadow\"/></repo:data>"
	 "<plain/>"
	 "</repo:repomd>", Doc));

   IMA::XMLNode const * const Root = Doc.Root();
   ASSERT_NE(nullptr, Root);
   EXPECT_EQ("repo:repomd", Root->Name());
   EXPECT_EQ("repomd", Root->LocalName());
   EXPECT_EQ("repo", Root->Prefix());
   EXPECT_EQ("http://linux.duke.edu/metadata/repo", Root->NamespaceURI());
   EXPECT_EQ("urn:other", Root->NamespaceURI(""));
   EXPECT_EQ("http://www.w3.org/XML/1998/namespace", Root->NamespaceURI("xml"));
   EXPECT_EQ("", Root->NamespaceURI("rpm"));

   std::string Prefix;
   EXPECT_TRUE(Root->FindPrefix("http://linux.duke.edu/metadata/repo", Prefix));
   EXPECT_EQ("repo", Prefix);
   EXPECT_TRUE(Root->FindPrefix("urn:other", Prefix));
   EXPECT_EQ("", Prefix);
   EXPECT_FALSE(Root->FindPrefix("urn:missing", Prefix));

   auto const Children = Root->ChildElements();
   ASSERT_EQ(2u, Children.size());
   EXPECT_EQ("urn:other", Children[1]->NamespaceURI());
   EXPECT_EQ("plain", Children[1]->LocalName());
   EXPECT_EQ("", Children[1]->Prefix());

   // the prefix is rebound below data
   IMA::XMLNode const * const Inner = Children[0]->LastChildElement();
   ASSERT_NE(nullptr, Inner);
   EXPECT_EQ("urn:shadow", Inner->NamespaceURI("repo"));
   EXPECT_FALSE(Inner->FindPrefix("http://linux.duke.edu/metadata/repo", Prefix));
   EXPECT_TRUE(Inner->FindPrefix("urn:shadow", Prefix));
   EXPECT_EQ("repo", Prefix);
}
TEST(XMLTreeTest, Accessors)
{
   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXML("<r>lead<a k=\"v\">x<![CDATA[y]]></a>tail<b/></r>", Doc));
   IMA::XMLNode * const Root = Doc.Root();
   ASSERT_NE(nullptr, Root);
   ASSERT_EQ(4u, Root->Children().size());
   EXPECT_EQ(IMA::XMLNode::Text, Root->Children()[0]->Type());
   EXPECT_EQ("leadtail", Root->Text());

   IMA::XMLNode * const A = Root->ChildElements()[0];
   EXPECT_EQ(Root, A->Parent());
   EXPECT_TRUE(A->HasAttribute("k"));
   EXPECT_FALSE(A->HasAttribute("missing"));
   EXPECT_EQ("v", A->Attribute("k"));
   EXPECT_EQ("default", A->Attribute("missing", "default"));
   EXPECT_EQ("xy", A->Text());
   EXPECT_EQ("tail", A->Tail());

   A->SetAttribute("k", "w");
   A->SetAttribute("n", "1");
   ASSERT_EQ(2u, A->Attributes().size());
   EXPECT_EQ("k", A->Attributes()[0].Name);
   EXPECT_EQ("w", A->Attributes()[0].Value);
   EXPECT_EQ("n", A->Attributes()[1].Name);

   A->SetText("replaced");
   ASSERT_EQ(1u, A->Children().size());
   EXPECT_EQ("replaced", A->Text());
   A->SetTail("\n");
   EXPECT_EQ("\n", A->Tail());

   IMA::XMLNode * const B = Root->LastChildElement();
   ASSERT_NE(nullptr, B);
   EXPECT_EQ("b", B->Name());
   EXPECT_EQ("", B->Tail());
   B->SetTail("\n");
   EXPECT_EQ("\n", B->Tail());
   B->SetLeadingText("inside");
   EXPECT_EQ("inside", B->Text());
   B->SetLeadingText("changed");
   EXPECT_EQ("changed", B->Text());

   // nothing follows the document element
   Root->SetTail("ignored");
   EXPECT_EQ("", Root->Tail());

   EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	     "<r>lead<a k=\"w\" n=\"1\">replaced</a>\n<b>changed</b>\n</r>\n", IMA::SerializeXML(Doc));
}
TEST(XMLTreeTest, Indent)
{
   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXML("<repomd>\n  <data type=\"primary\"/>\n</repomd>", Doc));
   IMA::XMLNode * const Root = Doc.Root();
   Root->LastChildElement()->SetTail("\n  ");

   IMA::XMLNode &Data = Root->AppendElement("data");
   Data.SetAttribute("type", "x");
   Data.AppendElement("a").SetText("1");
   IMA::XMLNode &B = Data.AppendElement("b");
   B.AppendElement("c");
   IMA::Indent(Data, 1);

   EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	     "<repomd>\n"
	     "  <data type=\"primary\"/>\n"
	     "  <data type=\"x\">\n"
	     "    <a>1</a>\n"
	     "    <b>\n"
	     "      <c/>\n"
	     "    </b>\n"
	     "  </data>\n"
	     "</repomd>\n", IMA::SerializeXML(Doc));
}
TEST(XMLTreeTest, IndentDocumentElement)
{
   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXML("<a><d/><b><c>text</c></b></a>", Doc));
   IMA::Indent(*Doc.Root());
   EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	     "<a>\n"
	     "  <d/>\n"
	     "  <b>\n"
	     "    <c>text</c>\n"
	     "  </b>\n"
	     "</a>\n", IMA::SerializeXML(Doc));
}
TEST(XMLTreeTest, ParseErrors)
{
   IMA::XMLDocument Doc;
   EXPECT_FALSE(IMA::ParseXML("<repomd><data></repomd>", Doc, "repomd.xml"));
   std::string msg;
   ASSERT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ(0u, msg.find("Unable to parse repomd.xml at offset ")) << msg;
   _error->Discard();

   EXPECT_FALSE(IMA::ParseXML("", Doc));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   EXPECT_FALSE(IMA::ParseXML("<!-- only a comment -->", Doc));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   EXPECT_EQ(nullptr, Doc.Root());

   EXPECT_FALSE(IMA::ParseXMLFile("/does/not/exist/repomd.xml", Doc));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
TEST(XMLTreeTest, ParseFile)
{
   auto const file = createTemporaryFile("xmlfile", "<?xml version=\"1.0\"?>\n<x><y>1</y></x>\n");
   IMA::XMLDocument Doc;
   ASSERT_TRUE(IMA::ParseXMLFile(file.Name(), Doc));
   ASSERT_NE(nullptr, Doc.Root());
   EXPECT_EQ("x", Doc.Root()->Name());
   EXPECT_EQ("1", Doc.Root()->LastChildElement()->Text());
}
