// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   All runtime settings of the tool, keyed by scoped names like
     IMA::Repodata::Jobs
   Names are matched case-insensitively. A scope is not an item of its
   own, but its value serves as base directory for FindFile.

   ReadConfigFile parses the familiar braces format:
     IMA::Repodata { Jobs "4"; Checksum-Type "sha512"; };
     Dir::Repodata "meta";
     #include "other.conf";
     #clear IMA::Repodata::Jobs;

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_CONFIGURATION_H
#define IMAPKG_CONFIGURATION_H

#include <ima-pkg/macros.h>

#include <iostream>
#include <map>
#include <string>

class IMA_PUBLIC Configuration
{
   struct Item
   {
      // as given by the first Set
      std::string Name;
      std::string Value;
   };
   std::map<std::string, Item> Items;

   Item const *Lookup(std::string const &Name) const;

   public:
   std::string Find(std::string const &Name, std::string const &Default = "") const;
   /** \brief a file name, completed by the values of the parent scopes
    *
    *  Parents are prepended until the name is absolute or starts with
    *  ./ or ../ so Dir::Repodata "repodata" and Dir::Repodata::RepoMD
    *  "repomd.xml" give repodata/repomd.xml. */
   std::string FindFile(std::string const &Name, std::string const &Default = "") const;
   /** \brief \b Default if unset or not a decimal integer */
   int FindI(std::string const &Name, int const Default = 0) const;
   bool FindB(std::string const &Name, bool const Default = false) const;

   void Set(std::string const &Name, std::string const &Value);
   void Set(std::string const &Name, int const Value);
   /** \brief set only if nothing is set yet */
   void CndSet(std::string const &Name, std::string const &Value);
   void CndSet(std::string const &Name, int const Value);

   /** \brief the item or anything in its scope is set */
   bool Exists(std::string const &Name) const;

   /** \brief remove the item and everything in its scope */
   void Clear(std::string const &Name);
   void Clear();

   /** \brief print all items in config file syntax, sorted by name */
   void Dump(std::ostream &Out = std::clog) const;
};

IMA_PUBLIC extern Configuration *_config;

IMA_PUBLIC bool ReadConfigFile(Configuration &Conf, std::string const &FName,
			       unsigned int const Depth = 0);

#endif
