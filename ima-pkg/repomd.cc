// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   repomd.xml - register a metadata artifact in the master index of
   a repository

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/repomd.h>

#include <iostream>
#include <string>
#include <sys/stat.h>
									/*}}}*/

using namespace std;

namespace IMA {

char const * const RepoNamespace = "http://linux.duke.edu/metadata/repo";

// QualifiedName - name of an element in the repository namespace	/*{{{*/
// ---------------------------------------------------------------------
/* Documents without the namespace declaration get plain names */
static std::string QualifiedName(XMLNode const &Root, std::string const &Local)
{
   std::string Prefix;
   if (Root.FindPrefix(RepoNamespace, Prefix) == false || Prefix.empty() == true)
      return Local;
   return Prefix + ":" + Local;
}
static bool IsRepoElement(XMLNode const &Node, std::string const &Local)
{
   if (Node.Type() != XMLNode::Element || Node.LocalName() != Local)
      return false;
   std::string const URI = Node.NamespaceURI();
   std::string Unused;
   if (URI.empty() == true)
      return Node.FindPrefix(RepoNamespace, Unused) == false;
   return URI == RepoNamespace;
}
									/*}}}*/
// HasDataType - shallow search for an entry of a type			/*{{{*/
bool HasDataType(XMLDocument const &Doc, std::string const &Type)
{
   XMLNode const * const Root = Doc.Root();
   if (Root == nullptr)
      return false;
   for (auto const * const Child : Root->ChildElements())
      if (IsRepoElement(*Child, "data") == true && Child->Attribute("type") == Type)
	 return true;
   return false;
}
									/*}}}*/
// AddDataEntry - append and indent the new entry			/*{{{*/
bool AddDataEntry(XMLDocument &Doc, ArtifactInfo const &Info, std::string const &Type,
		  std::string const &LocationDir)
{
   XMLNode * const Root = Doc.Root();
   if (Root == nullptr)
      return _error->Error("Master index has no document element");
   if (HasDataType(Doc, Type) == true)
      return _error->Error("data type %s already present", Type.c_str());

   // keep the new entry on a line of its own
   XMLNode * const Last = Root->LastChildElement();
   if (Last != nullptr)
      Last->SetTail("\n  ");
   else
      Root->SetLeadingText("\n  ");

   auto const Name = [&](char const * const Local) { return QualifiedName(*Root, Local); };
   XMLNode &Data = Root->AppendElement(Name("data"));
   Data.SetAttribute("type", Type);

   XMLNode &Checksum = Data.AppendElement(Name("checksum"));
   Checksum.SetAttribute("type", Info.ChecksumType);
   Checksum.SetText(Info.Checksum);

   XMLNode &OpenChecksum = Data.AppendElement(Name("open-checksum"));
   OpenChecksum.SetAttribute("type", Info.ChecksumType);
   OpenChecksum.SetText(Info.OpenChecksum);

   std::string Location = LocationDir;
   if (Location.empty() == false && Location.back() != '/')
      Location.append("/");
   Location.append(Info.Checksum).append("_").append(Info.Name);
   Data.AppendElement(Name("location")).SetAttribute("href", Location);

   Data.AppendElement(Name("timestamp")).SetText(std::to_string(Info.Timestamp));
   Data.AppendElement(Name("size")).SetText(std::to_string(Info.Size));
   Data.AppendElement(Name("open-size")).SetText(std::to_string(Info.OpenSize));

   Indent(Data, 1);
   return true;
}
									/*}}}*/
// PatchRepoMD - register an artifact in repomd.xml			/*{{{*/
bool PatchRepoMD(std::string const &RepoMDPath, ArtifactInfo const &Info,
		 std::string const &Type, std::string const &LocationDir)
{
   bool const Debug = _config->FindB("Debug::IMA::RepoMD", false);

   XMLDocument Doc;
   if (ParseXMLFile(RepoMDPath, Doc) == false)
      return false;

   if (HasDataType(Doc, Type) == true)
      return _error->Error("data type %s already present in %s", Type.c_str(), RepoMDPath.c_str());
   if (AddDataEntry(Doc, Info, Type, LocationDir) == false)
      return false;

   // keep the permissions of the file we replace
   struct stat Buf;
   if (StatFile("stat", RepoMDPath, Buf) == false)
      return false;

   std::string const Output = SerializeXML(Doc);
   FileFd Fd;
   if (Fd.Open(RepoMDPath, FileFd::WriteAtomic, Buf.st_mode & 07777) == false)
      return false;
   if (Fd.Write(Output) == false || Fd.Sync() == false)
   {
      Fd.OpFail();
      Fd.Close();
      return false;
   }
   if (Fd.Close() == false)
      return false;

   if (Debug == true)
      std::clog << "Registered " << Type << " in " << RepoMDPath << " ("
		<< Output.size() << " bytes)" << std::endl;
   return true;
}
									/*}}}*/

}
