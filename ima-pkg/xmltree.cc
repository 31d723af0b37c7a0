// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   XML Tree - an editable XML document which keeps its formatting

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/xmltree.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <pugixml.hpp>
									/*}}}*/

using namespace std;

namespace IMA {

// XMLNode::XMLNode - Constructor					/*{{{*/
XMLNode::XMLNode(NodeType const Type, std::string const &Name, std::string const &Value) :
   Kind(Type), Tag(Name), Content(Value), Up(nullptr)
{
}
									/*}}}*/
// XMLNode::LocalName / Prefix - split the qualified name		/*{{{*/
std::string XMLNode::LocalName() const
{
   std::string::size_type const Colon = Tag.find(':');
   if (Colon == std::string::npos)
      return Tag;
   return Tag.substr(Colon + 1);
}
std::string XMLNode::Prefix() const
{
   std::string::size_type const Colon = Tag.find(':');
   if (Colon == std::string::npos)
      return "";
   return Tag.substr(0, Colon);
}
									/*}}}*/
// XMLNode::NamespaceURI - resolve a prefix				/*{{{*/
std::string XMLNode::NamespaceURI(std::string const &Prefix) const
{
   std::string const Decl = Prefix.empty() ? std::string("xmlns") : "xmlns:" + Prefix;
   for (XMLNode const *N = this; N != nullptr; N = N->Up)
   {
      if (N->Kind != Element)
	 continue;
      for (auto const &A : N->Attrs)
	 if (A.Name == Decl)
	    return A.Value;
   }
   if (Prefix == "xml")
      return "http://www.w3.org/XML/1998/namespace";
   return "";
}
									/*}}}*/
// XMLNode::FindPrefix - find a prefix bound to a namespace		/*{{{*/
// ---------------------------------------------------------------------
/* The nearest declaration wins, a prefix which is redeclared closer
   to this element for another namespace is not usable. */
bool XMLNode::FindPrefix(std::string const &URI, std::string &Prefix) const
{
   for (XMLNode const *N = this; N != nullptr; N = N->Up)
   {
      if (N->Kind != Element)
	 continue;
      for (auto const &A : N->Attrs)
      {
	 std::string Candidate;
	 if (A.Name == "xmlns")
	    Candidate = "";
	 else if (A.Name.compare(0, 6, "xmlns:") == 0)
	    Candidate = A.Name.substr(6);
	 else
	    continue;
	 if (A.Value != URI || NamespaceURI(Candidate) != URI)
	    continue;
	 Prefix = Candidate;
	 return true;
      }
   }
   return false;
}
									/*}}}*/
// XMLNode::*Attribute - attribute access				/*{{{*/
bool XMLNode::HasAttribute(std::string const &Name) const
{
   return std::any_of(Attrs.begin(), Attrs.end(), [&](XMLAttribute const &A) { return A.Name == Name; });
}
std::string XMLNode::Attribute(std::string const &Name, std::string const &Default) const
{
   for (auto const &A : Attrs)
      if (A.Name == Name)
	 return A.Value;
   return Default;
}
void XMLNode::SetAttribute(std::string const &Name, std::string const &Value)
{
   for (auto &A : Attrs)
      if (A.Name == Name)
      {
	 A.Value = Value;
	 return;
      }
   Attrs.push_back(XMLAttribute{Name, Value});
}
									/*}}}*/
// XMLNode::AppendChild - add a node at the end				/*{{{*/
XMLNode &XMLNode::AppendChild(std::unique_ptr<XMLNode> Node)
{
   return InsertChild(Nodes.size(), std::move(Node));
}
XMLNode &XMLNode::InsertChild(size_t const Pos, std::unique_ptr<XMLNode> Node)
{
   Node->Up = this;
   XMLNode &Res = *Node;
   Nodes.insert(Nodes.begin() + std::min(Pos, Nodes.size()), std::move(Node));
   return Res;
}
XMLNode &XMLNode::AppendElement(std::string const &Name)
{
   return AppendChild(std::unique_ptr<XMLNode>(new XMLNode(Element, Name)));
}
									/*}}}*/
// XMLNode::ChildElements - the element children in order		/*{{{*/
std::vector<XMLNode *> XMLNode::ChildElements() const
{
   std::vector<XMLNode *> Res;
   for (auto const &N : Nodes)
      if (N->Kind == Element)
	 Res.push_back(N.get());
   return Res;
}
XMLNode *XMLNode::LastChildElement() const
{
   for (auto N = Nodes.rbegin(); N != Nodes.rend(); ++N)
      if ((*N)->Kind == Element)
	 return N->get();
   return nullptr;
}
									/*}}}*/
// XMLNode::Text - the direct character data				/*{{{*/
std::string XMLNode::Text() const
{
   std::string Res;
   for (auto const &N : Nodes)
      if (N->Kind == Text || N->Kind == CData)
	 Res.append(N->Content);
   return Res;
}
void XMLNode::SetText(std::string const &Value)
{
   Nodes.clear();
   if (Value.empty() == false)
      AppendChild(std::unique_ptr<XMLNode>(new XMLNode(Text, "", Value)));
}
									/*}}}*/
// XMLNode::SetLeadingText - text in front of the first child		/*{{{*/
void XMLNode::SetLeadingText(std::string const &Value)
{
   if (Nodes.empty() == false && Nodes.front()->Kind == Text)
      Nodes.front()->Content = Value;
   else
      InsertChild(0, std::unique_ptr<XMLNode>(new XMLNode(Text, "", Value)));
}
									/*}}}*/
// XMLNode::Tail - text following a node				/*{{{*/
size_t XMLNode::IndexInParent() const
{
   auto const &Siblings = Up->Nodes;
   auto const I = std::find_if(Siblings.begin(), Siblings.end(),
			       [this](std::unique_ptr<XMLNode> const &N) { return N.get() == this; });
   return I - Siblings.begin();
}
std::string XMLNode::Tail() const
{
   if (Up == nullptr)
      return "";
   size_t const Next = IndexInParent() + 1;
   if (Next < Up->Nodes.size() && Up->Nodes[Next]->Kind == Text)
      return Up->Nodes[Next]->Content;
   return "";
}
void XMLNode::SetTail(std::string const &Value)
{
   // the tail of the document element is not part of the tree
   if (Up == nullptr)
      return;
   size_t const Next = IndexInParent() + 1;
   if (Next < Up->Nodes.size() && Up->Nodes[Next]->Kind == Text)
      Up->Nodes[Next]->Content = Value;
   else
      Up->InsertChild(Next, std::unique_ptr<XMLNode>(new XMLNode(Text, "", Value)));
}
									/*}}}*/
// XMLDocument								/*{{{*/
XMLNode *XMLDocument::Root() const
{
   for (auto const &N : Nodes)
      if (N->Type() == XMLNode::Element)
	 return N.get();
   return nullptr;
}
XMLNode &XMLDocument::AppendChild(std::unique_ptr<XMLNode> Node)
{
   XMLNode &Res = *Node;
   Nodes.push_back(std::move(Node));
   return Res;
}
									/*}}}*/
// ConvertChildren - copy the pugixml children of From into To		/*{{{*/
template<class Target>
static void ConvertChildren(pugi::xml_node const &From, Target &To)
{
   for (pugi::xml_node Child = From.first_child(); Child; Child = Child.next_sibling())
   {
      std::unique_ptr<XMLNode> Node;
      switch (Child.type())
      {
	 case pugi::node_element:
	    Node.reset(new XMLNode(XMLNode::Element, Child.name()));
	    for (pugi::xml_attribute A = Child.first_attribute(); A; A = A.next_attribute())
	       Node->SetAttribute(A.name(), A.value());
	    ConvertChildren(Child, *Node);
	    break;
	 case pugi::node_pcdata:
	    Node.reset(new XMLNode(XMLNode::Text, "", Child.value()));
	    break;
	 case pugi::node_cdata:
	    Node.reset(new XMLNode(XMLNode::CData, "", Child.value()));
	    break;
	 case pugi::node_comment:
	    Node.reset(new XMLNode(XMLNode::Comment, "", Child.value()));
	    break;
	 case pugi::node_pi:
	    Node.reset(new XMLNode(XMLNode::ProcessingInstruction, Child.name(), Child.value()));
	    break;
	 case pugi::node_doctype:
	    Node.reset(new XMLNode(XMLNode::Doctype, "", Child.value()));
	    break;
	 default:
	    // the declaration is written fresh
	    continue;
      }
      To.AppendChild(std::move(Node));
   }
}
									/*}}}*/
// ParseXML - parse a document from memory				/*{{{*/
bool ParseXML(std::string const &Buffer, XMLDocument &Doc, std::string const &Name)
{
   Doc.Clear();
   pugi::xml_document Parsed;
   pugi::xml_parse_result const Res = Parsed.load_buffer(Buffer.data(), Buffer.size(),
	 pugi::parse_full | pugi::parse_ws_pcdata, pugi::encoding_utf8);
   if (!Res)
      return _error->Error("Unable to parse %s at offset %lld: %s", Name.c_str(),
			   static_cast<long long>(Res.offset), Res.description());

   ConvertChildren(Parsed, Doc);
   if (Doc.Root() == nullptr)
      return _error->Error("Unable to parse %s: no document element", Name.c_str());
   return true;
}
									/*}}}*/
// ParseXMLFile - parse a document from a file				/*{{{*/
bool ParseXMLFile(std::string const &FileName, XMLDocument &Doc)
{
   std::string Buffer;
   if (ReadFile(FileName, Buffer) == false)
      return false;
   return ParseXML(Buffer, Doc, FileName);
}
									/*}}}*/
// Escape* - escape character data for output				/*{{{*/
static void EscapeText(std::string &Out, std::string const &Text)
{
   for (char const c : Text)
   {
      switch (c)
      {
	 case '&': Out.append("&amp;"); break;
	 case '<': Out.append("&lt;"); break;
	 case '>': Out.append("&gt;"); break;
	 case '\r': Out.append("&#13;"); break;
	 default: Out.push_back(c); break;
      }
   }
}
static void EscapeAttribute(std::string &Out, std::string const &Text)
{
   for (char const c : Text)
   {
      switch (c)
      {
	 case '&': Out.append("&amp;"); break;
	 case '<': Out.append("&lt;"); break;
	 case '>': Out.append("&gt;"); break;
	 case '"': Out.append("&quot;"); break;
	 case '\n': Out.append("&#10;"); break;
	 case '\r': Out.append("&#13;"); break;
	 case '\t': Out.append("&#09;"); break;
	 default: Out.push_back(c); break;
      }
   }
}
									/*}}}*/
// Serialize - write a node and its subtree				/*{{{*/
static void Serialize(std::string &Out, XMLNode const &Node)
{
   switch (Node.Type())
   {
      case XMLNode::Element:
	 Out.append("<").append(Node.Name());
	 for (auto const &A : Node.Attributes())
	 {
	    Out.append(" ").append(A.Name).append("=\"");
	    EscapeAttribute(Out, A.Value);
	    Out.append("\"");
	 }
	 if (Node.Children().empty() == true)
	 {
	    Out.append("/>");
	    break;
	 }
	 Out.append(">");
	 for (auto const &Child : Node.Children())
	    Serialize(Out, *Child);
	 Out.append("</").append(Node.Name()).append(">");
	 break;
      case XMLNode::Text:
	 EscapeText(Out, Node.Value());
	 break;
      case XMLNode::CData:
	 Out.append("<![CDATA[").append(Node.Value()).append("]]>");
	 break;
      case XMLNode::Comment:
	 Out.append("<!--").append(Node.Value()).append("-->");
	 break;
      case XMLNode::ProcessingInstruction:
	 Out.append("<?").append(Node.Name());
	 if (Node.Value().empty() == false)
	    Out.append(" ").append(Node.Value());
	 Out.append("?>");
	 break;
      case XMLNode::Doctype:
	 Out.append("<!DOCTYPE ").append(Node.Value()).append(">");
	 break;
   }
}
									/*}}}*/
// SerializeXML - write the document					/*{{{*/
// ---------------------------------------------------------------------
/* Whitespace outside of the document element is not kept, each node
   on the top level gets a line of its own. */
std::string SerializeXML(XMLDocument const &Doc)
{
   std::string Out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
   for (auto const &Node : Doc.Children())
   {
      if (Node->Type() == XMLNode::Text)
	 continue;
      Serialize(Out, *Node);
      Out.append("\n");
   }
   return Out;
}
									/*}}}*/
// Indent - reformat a subtree						/*{{{*/
static std::string IndentString(int const Level)
{
   return "\n" + std::string(2 * std::max(Level, 0), ' ');
}
void Indent(XMLNode &Elem, int const Level)
{
   std::vector<XMLNode *> const Children = Elem.ChildElements();
   if (Children.empty() == false)
   {
      Elem.SetLeadingText(IndentString(Level + 1));
      Elem.SetTail(IndentString(Level - 1));
      for (auto const Child : Children)
	 Indent(*Child, Level + 1);
      Children.back()->SetTail(IndentString(Level));
   }
   else
      Elem.SetTail(IndentString(Level));
}
									/*}}}*/

}
