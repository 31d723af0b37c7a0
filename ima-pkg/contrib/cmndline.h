// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - map options into the configuration space

   Each option is described by an Args entry naming the configuration
   item it sets:

 CommandLine::Args Args[] =
 {{'q',"quiet","quiet",CommandLine::IntLevel},
  {'j',"jobs","IMA::Repodata::Jobs",CommandLine::HasArg},
  {0,0,0,0}};

   Boolean (also Flags 0): -m, --modify, --no-modify, --modify=false
   IntLevel: every -q adds one, -q5 and -q=5 set the level
   HasArg: -j 4, -j4, -j=4, --jobs 4 and --jobs=4
   ConfigFile: reads the named file with ReadConfigFile
   ArbItem: -o Name=Value sets any item

   Everything which is not an option ends up in FileList, as does
   everything after a lone --.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_CMNDLINE_H
#define IMAPKG_CMNDLINE_H

#include <ima-pkg/macros.h>

#include <string>
#include <vector>

class Configuration;

class IMA_PUBLIC CommandLine
{
   public:
   struct Args;
   enum AFlags
   {
      HasArg = (1 << 0),
      IntLevel = (1 << 1),
      Boolean = (1 << 2),
      ConfigFile = (1 << 3) | HasArg,
      ArbItem = (1 << 4) | HasArg
   };

   /** \brief the non-option arguments, terminated by a nullptr */
   const char **FileList;

   bool Parse(int argc,const char **argv);
   unsigned int FileSize() const;

   CommandLine(Args *AList,Configuration *Conf);
   CommandLine(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine const &) = delete;

   private:
   Args *ArgList;
   Configuration *Conf;
   std::vector<const char *> Files;

   Args const *FindShort(char const Opt) const;
   Args const *FindLong(std::string const &Opt) const;
   bool Apply(Args const &A,const char *Given,const char *Value,bool const Attached);
};

struct CommandLine::Args
{
   char ShortOpt;
   const char *LongOpt;
   const char *ConfName;
   unsigned long Flags;

   inline bool end() const {return ShortOpt == 0 && LongOpt == 0;};
   inline bool IsBoolean() const {return Flags == 0 || (Flags & Boolean) == Boolean;};
};

#endif
