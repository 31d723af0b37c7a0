// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   XML Tree - an editable XML document which keeps its formatting

   All nodes of a document are kept in document order, including the
   whitespace between elements as text nodes, so a parsed document is
   written back unchanged apart from the places which were edited.
   Parsing is done with pugixml, writing is done here.

   In the terms of other tree APIs the "text" of an element is the text
   node in front of its first child and the "tail" of an element is the
   text node right behind it in its parent.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_XMLTREE_H
#define IMAPKG_XMLTREE_H

#include <ima-pkg/macros.h>

#include <memory>
#include <string>
#include <vector>

namespace IMA {

struct XMLAttribute
{
   std::string Name;
   std::string Value;
};

class IMA_PUBLIC XMLNode
{
   public:
   enum NodeType { Element, Text, CData, Comment, ProcessingInstruction, Doctype };

   private:
   NodeType const Kind;
   std::string Tag;
   std::string Content;
   std::vector<XMLAttribute> Attrs;
   std::vector<std::unique_ptr<XMLNode>> Nodes;
   XMLNode *Up;

   size_t IndexInParent() const;

   public:
   NodeType Type() const { return Kind; };
   // qualified name of an element or target of a processing instruction
   std::string const &Name() const { return Tag; };
   // content of all nodes but elements
   std::string const &Value() const { return Content; };
   XMLNode *Parent() const { return Up; };
   std::vector<std::unique_ptr<XMLNode>> const &Children() const { return Nodes; };
   std::vector<XMLAttribute> const &Attributes() const { return Attrs; };

   // the name without its namespace prefix
   std::string LocalName() const;
   std::string Prefix() const;

   /** \brief the namespace bound to Prefix at this element
    *
    *  Looks at the xmlns declarations of this element and its
    *  ancestors, the empty prefix is the default namespace. */
   std::string NamespaceURI(std::string const &Prefix) const;
   inline std::string NamespaceURI() const { return NamespaceURI(Prefix()); };
   /** \brief find a prefix bound to URI in scope of this element
    *  \return \b false if URI is not declared at all */
   bool FindPrefix(std::string const &URI, std::string &Prefix) const;

   bool HasAttribute(std::string const &Name) const;
   std::string Attribute(std::string const &Name, std::string const &Default = "") const;
   // replaces the value of an existing attribute in place
   void SetAttribute(std::string const &Name, std::string const &Value);

   XMLNode &AppendChild(std::unique_ptr<XMLNode> Node);
   XMLNode &InsertChild(size_t const Pos, std::unique_ptr<XMLNode> Node);
   XMLNode &AppendElement(std::string const &Name);
   std::vector<XMLNode *> ChildElements() const;
   XMLNode *LastChildElement() const;

   // concatenated direct text and cdata children
   std::string Text() const;
   // replace all children by a single text node
   void SetText(std::string const &Text);

   /** \brief set the text in front of the first child */
   void SetLeadingText(std::string const &Text);
   /** \brief the text following this node in its parent */
   std::string Tail() const;
   void SetTail(std::string const &Text);

   XMLNode(NodeType const Type, std::string const &Name, std::string const &Value = "");
   XMLNode(XMLNode const &) = delete;
   XMLNode &operator=(XMLNode const &) = delete;
};

class IMA_PUBLIC XMLDocument
{
   std::vector<std::unique_ptr<XMLNode>> Nodes;

   public:
   // the document element, NULL for an empty document
   XMLNode *Root() const;
   std::vector<std::unique_ptr<XMLNode>> const &Children() const { return Nodes; };
   XMLNode &AppendChild(std::unique_ptr<XMLNode> Node);
   void Clear() { Nodes.clear(); };
};

/** \brief parse Buffer into Doc
 *  \param Name used in error messages */
IMA_PUBLIC bool ParseXML(std::string const &Buffer, XMLDocument &Doc,
			 std::string const &Name = "buffer");
IMA_PUBLIC bool ParseXMLFile(std::string const &FileName, XMLDocument &Doc);

/** \brief the document as UTF-8 text with a leading XML declaration */
IMA_PUBLIC std::string SerializeXML(XMLDocument const &Doc);

/** \brief reformat Elem and its subtree for an element nested Level deep
 *
 *  An element with element children gets its text set to a newline
 *  plus Level+1 indentation steps and its tail to a newline plus
 *  Level-1 steps; its children are indented at Level+1 and the last
 *  one's tail is set to a newline plus Level steps. An element
 *  without element children just gets a tail of a newline plus
 *  Level steps. A step is two spaces. */
IMA_PUBLIC void Indent(XMLNode &Elem, int const Level = 0);

}

#endif
