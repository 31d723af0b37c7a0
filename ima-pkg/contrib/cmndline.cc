// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - map options into the configuration space

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <ima-pkg/cmndline.h>
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/strutl.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
									/*}}}*/

CommandLine::CommandLine(Args *AList,Configuration *Conf) : FileList(nullptr),
				 ArgList(AList), Conf(Conf)
{
}
// CommandLine::FindShort - the entry of a single letter option		/*{{{*/
CommandLine::Args const *CommandLine::FindShort(char const Opt) const
{
   for (Args const *A = ArgList; A->end() == false; ++A)
      if (A->ShortOpt == Opt)
	 return A;
   return nullptr;
}
									/*}}}*/
// CommandLine::FindLong - the entry of a long option, any case		/*{{{*/
CommandLine::Args const *CommandLine::FindLong(std::string const &Opt) const
{
   for (Args const *A = ArgList; A->end() == false; ++A)
      if (A->LongOpt != nullptr && strcasecmp(A->LongOpt, Opt.c_str()) == 0)
	 return A;
   return nullptr;
}
									/*}}}*/
// CommandLine::Parse - split argv into options and files		/*{{{*/
bool CommandLine::Parse(int argc,const char **argv)
{
   Files.clear();
   FileList = nullptr;

   int I = 1;
   for (; I < argc; ++I)
   {
      const char * const Opt = argv[I];
      if (Opt[0] != '-' || Opt[1] == '\0')
      {
	 Files.push_back(Opt);
	 continue;
      }
      if (strcmp(Opt, "--") == 0)
      {
	 ++I;
	 break;
      }
      // the argument of an option, if it can be found in the next word
      auto const NextWord = [&]() -> const char * {
	 if (I + 1 < argc && argv[I + 1][0] != '-')
	    return argv[++I];
	 return nullptr;
      };

      if (Opt[1] == '-')
      {
	 const char * const Equal = strchr(Opt + 2, '=');
	 std::string const Name = (Equal == nullptr) ? std::string(Opt + 2) : std::string(Opt + 2, Equal);
	 Args const *A = FindLong(Name);
	 if (A == nullptr && Name.compare(0, 3, "no-") == 0)
	 {
	    A = FindLong(Name.substr(3));
	    if (A == nullptr && Name.length() == 4)
	       A = FindShort(Name[3]);
	    if (A == nullptr)
	       return _error->Error("Command line option %s is not understood in combination with the other options", Opt);
	    if (A->IsBoolean() == false || Equal != nullptr)
	       return _error->Error("Command line option %s is not boolean", Opt);
	    Conf->Set(A->ConfName, 0);
	    continue;
	 }
	 if (A == nullptr)
	    return _error->Error("Command line option %s is not understood in combination with the other options", Opt);

	 const char *Value = (Equal == nullptr) ? nullptr : Equal + 1;
	 if (Value == nullptr && (A->Flags & HasArg) == HasArg)
	    Value = NextWord();
	 if (Apply(*A, Opt, Value, Equal != nullptr) == false)
	    return false;
	 continue;
      }

      // a cluster of short options like -qq or -j4
      for (const char *Letter = Opt + 1; *Letter != '\0'; ++Letter)
      {
	 Args const * const A = FindShort(*Letter);
	 if (A == nullptr)
	    return _error->Error("Command line option '%c' [from %s] is not understood in combination with the other options.", *Letter, Opt);

	 const char * const Rest = Letter + 1;
	 if (*Rest == '=')
	 {
	    if (Apply(*A, Opt, Rest + 1, true) == false)
	       return false;
	    break;
	 }
	 if ((A->Flags & HasArg) == HasArg)
	 {
	    if (Apply(*A, Opt, *Rest != '\0' ? Rest : NextWord(), false) == false)
	       return false;
	    break;
	 }
	 if ((A->Flags & IntLevel) == IntLevel && isdigit(static_cast<unsigned char>(*Rest)) != 0)
	 {
	    if (Apply(*A, Opt, Rest, true) == false)
	       return false;
	    break;
	 }
	 if (Apply(*A, Opt, nullptr, false) == false)
	    return false;
      }
   }

   for (; I < argc; ++I)
      Files.push_back(argv[I]);
   Files.push_back(nullptr);
   FileList = Files.data();
   return true;
}
									/*}}}*/
// CommandLine::Apply - store the value of one option			/*{{{*/
// ---------------------------------------------------------------------
/* Value is nullptr if none was given, Attached if it came with an = */
bool CommandLine::Apply(Args const &A,const char *Given,const char *Value,bool const Attached)
{
   if ((A.Flags & HasArg) == HasArg)
   {
      if (Value == nullptr)
	 return _error->Error("Option %s requires an argument.", Given);
      if ((A.Flags & ConfigFile) == ConfigFile)
	 return ReadConfigFile(*Conf, Value);
      if ((A.Flags & ArbItem) == ArbItem)
      {
	 const char * const Equal = strchr(Value, '=');
	 if (Equal == nullptr)
	    return _error->Error("Option %s: Configuration item specification must have an =<val>.", Given);
	 Conf->Set(std::string(Value, Equal), Equal + 1);
	 return true;
      }
      Conf->Set(A.ConfName, Value);
      return true;
   }

   if ((A.Flags & IntLevel) == IntLevel)
   {
      if (Value == nullptr)
      {
	 Conf->Set(A.ConfName, Conf->FindI(A.ConfName) + 1);
	 return true;
      }
      char *End = nullptr;
      errno = 0;
      long const Level = strtol(Value, &End, 10);
      if (*Value == '\0' || *End != '\0' || errno != 0)
	 return _error->Error("Option %s requires an integer argument, not '%s'", Given, Value);
      Conf->Set(A.ConfName, static_cast<int>(Level));
      return true;
   }

   if (Attached == false || Value == nullptr)
   {
      Conf->Set(A.ConfName, 1);
      return true;
   }
   int const Sense = StringToBool(Value);
   if (Sense < 0)
      return _error->Error("Sense %s is not understood, try true or false.", Value);
   Conf->Set(A.ConfName, Sense);
   return true;
}
									/*}}}*/
// CommandLine::FileSize - number of non-option arguments		/*{{{*/
unsigned int CommandLine::FileSize() const
{
   if (FileList == nullptr)
      return 0;
   return Files.size() - 1;
}
									/*}}}*/
