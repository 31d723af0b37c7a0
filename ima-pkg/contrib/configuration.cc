// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Items live in a map keyed by the lowercased name, so a scope and
   everything in it form one contiguous range of the map.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/strutl.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
									/*}}}*/

Configuration *_config = new Configuration;

static std::string ConfigKey(std::string const &Name)
{
   std::string Key;
   Key.reserve(Name.length());
   for (char const c : Name)
      Key.push_back(tolower_ascii(c));
   return Key;
}
// ParentScope - Dir::Repodata::RepoMD -> Dir::Repodata			/*{{{*/
static bool ParentScope(std::string &Name)
{
   std::string::size_type const Pos = Name.rfind("::");
   if (Pos == std::string::npos)
      return false;
   Name.erase(Pos);
   return true;
}
									/*}}}*/

// Configuration::Lookup - the item itself, not its scope		/*{{{*/
Configuration::Item const *Configuration::Lookup(std::string const &Name) const
{
   auto const I = Items.find(ConfigKey(Name));
   if (I == Items.end())
      return nullptr;
   return &I->second;
}
									/*}}}*/
// Configuration::Find - the value of an item				/*{{{*/
std::string Configuration::Find(std::string const &Name, std::string const &Default) const
{
   Item const * const I = Lookup(Name);
   if (I == nullptr)
      return Default;
   return I->Value;
}
									/*}}}*/
// Configuration::FindFile - the value completed by its scopes		/*{{{*/
std::string Configuration::FindFile(std::string const &Name, std::string const &Default) const
{
   Item const * const I = Lookup(Name);
   if (I == nullptr || I->Value.empty() == true)
      return Default;

   std::string Value = I->Value;
   std::string Scope = Name;
   while (Value[0] != '/' && Value.compare(0, 2, "./") != 0 && Value.compare(0, 3, "../") != 0)
   {
      if (ParentScope(Scope) == false)
	 break;
      std::string const Base = Find(Scope);
      if (Base.empty() == false)
	 Value = flCombine(Base, Value);
   }
   return Value;
}
									/*}}}*/
// Configuration::FindI - an integer value				/*{{{*/
int Configuration::FindI(std::string const &Name, int const Default) const
{
   Item const * const I = Lookup(Name);
   if (I == nullptr || I->Value.empty() == true)
      return Default;

   char *End = nullptr;
   errno = 0;
   long const Res = strtol(I->Value.c_str(), &End, 10);
   if (*End != '\0' || errno != 0 || Res != static_cast<int>(Res))
      return Default;
   return Res;
}
									/*}}}*/
// Configuration::FindB - a boolean value				/*{{{*/
bool Configuration::FindB(std::string const &Name, bool const Default) const
{
   Item const * const I = Lookup(Name);
   if (I == nullptr || I->Value.empty() == true)
      return Default;
   return StringToBool(I->Value, Default) == 1;
}
									/*}}}*/
// Configuration::Set - set or replace a value				/*{{{*/
void Configuration::Set(std::string const &Name, std::string const &Value)
{
   auto const Res = Items.emplace(ConfigKey(Name), Item{Name, Value});
   if (Res.second == false)
      Res.first->second.Value = Value;
}
void Configuration::Set(std::string const &Name, int const Value)
{
   Set(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::CndSet - set a value unless there is one		/*{{{*/
void Configuration::CndSet(std::string const &Name, std::string const &Value)
{
   Items.emplace(ConfigKey(Name), Item{Name, Value});
}
void Configuration::CndSet(std::string const &Name, int const Value)
{
   if (Lookup(Name) == nullptr)
      Set(Name, Value);
}
									/*}}}*/
// Configuration::Exists - an item or scope of this name		/*{{{*/
bool Configuration::Exists(std::string const &Name) const
{
   std::string const Key = ConfigKey(Name);
   auto const I = Items.lower_bound(Key);
   if (I == Items.end())
      return false;
   if (I->first == Key)
      return true;
   return I->first.compare(0, Key.length() + 2, Key + "::") == 0;
}
									/*}}}*/
// Configuration::Clear - drop an item and its scope			/*{{{*/
void Configuration::Clear(std::string const &Name)
{
   std::string const Key = ConfigKey(Name);
   std::string const Scope = Key + "::";
   Items.erase(Key);
   auto I = Items.lower_bound(Scope);
   while (I != Items.end() && I->first.compare(0, Scope.length(), Scope) == 0)
      I = Items.erase(I);
}
void Configuration::Clear()
{
   Items.clear();
}
									/*}}}*/
// Configuration::Dump - write the items in config file syntax		/*{{{*/
void Configuration::Dump(std::ostream &Out) const
{
   for (auto const &I : Items)
      Out << I.second.Name << " \"" << I.second.Value << "\";" << std::endl;
}
									/*}}}*/

namespace {
// ConfigTokenizer - split a config file into its tokens		/*{{{*/
class ConfigTokenizer
{
   public:
   enum Kind { End, Word, String, Open, Close, Semicolon, Include, ClearDirective, Bad };
   struct Token
   {
      Kind Type;
      std::string Text;
      unsigned int Line;
   };

   private:
   std::string const &Data;
   std::string::size_type Pos = 0;
   unsigned int Line = 1;

   bool StartsWith(char const * const Word) const
   {
      return Data.compare(Pos, strlen(Word), Word) == 0;
   }
   void SkipUntil(char const * const Stop)
   {
      std::string::size_type const Found = Data.find(Stop, Pos);
      std::string::size_type const Until = (Found == std::string::npos) ? Data.length() : Found;
      for (; Pos < Until; ++Pos)
	 if (Data[Pos] == '\n')
	    ++Line;
      Pos = (Found == std::string::npos) ? Data.length() : Found + strlen(Stop);
   }
   void SkipLine()
   {
      SkipUntil("\n");
      ++Line;
   }
   bool IsDirective(char const * const Name) const
   {
      size_t const Length = strlen(Name);
      return StartsWith(Name) && Pos + Length < Data.length() &&
	 (Data[Pos + Length] == ' ' || Data[Pos + Length] == '\t');
   }

   public:
   Token Next()
   {
      for (;;)
      {
	 while (Pos < Data.length() && isspace(static_cast<unsigned char>(Data[Pos])) != 0)
	 {
	    if (Data[Pos] == '\n')
	       ++Line;
	    ++Pos;
	 }
	 if (Pos >= Data.length())
	    return {End, "", Line};

	 if (StartsWith("//"))
	    SkipLine();
	 else if (StartsWith("/*"))
	    SkipUntil("*/");
	 else if (Data[Pos] == '#')
	 {
	    if (IsDirective("#include"))
	    {
	       Pos += strlen("#include");
	       return {Include, "#include", Line};
	    }
	    if (IsDirective("#clear"))
	    {
	       Pos += strlen("#clear");
	       return {ClearDirective, "#clear", Line};
	    }
	    SkipLine();
	 }
	 else
	    break;
      }

      char const c = Data[Pos];
      switch (c)
      {
	 case '{': ++Pos; return {Open, "{", Line};
	 case '}': ++Pos; return {Close, "}", Line};
	 case ';': ++Pos; return {Semicolon, ";", Line};
	 case '"':
	 {
	    std::string::size_type const Quote = Data.find('"', Pos + 1);
	    if (Quote == std::string::npos)
	       return {Bad, "Unterminated quoted string", Line};
	    Token T{String, Data.substr(Pos + 1, Quote - Pos - 1), Line};
	    for (char const q : T.Text)
	       if (q == '\n')
		  ++Line;
	    Pos = Quote + 1;
	    return T;
	 }
      }

      std::string::size_type Stop = Pos;
      while (Stop < Data.length() && isspace(static_cast<unsigned char>(Data[Stop])) == 0 &&
	     Data[Stop] != '"' && Data[Stop] != '{' && Data[Stop] != '}' && Data[Stop] != ';')
	 ++Stop;
      Token T{Word, Data.substr(Pos, Stop - Pos), Line};
      Pos = Stop;
      return T;
   }

   explicit ConfigTokenizer(std::string const &Data) : Data(Data) {}
};
									/*}}}*/
}

// ReadConfigFile - read a configuration file				/*{{{*/
// ---------------------------------------------------------------------
/* Items in a block are named relative to the block. #include names a
   file relative to the including one. */
bool ReadConfigFile(Configuration &Conf, std::string const &FName, unsigned int const Depth)
{
   if (Depth > 100)
      return _error->Error("Syntax error %s: Too many nested includes", FName.c_str());

   std::string Data;
   if (ReadFile(FName, Data) == false)
      return _error->Error("Unable to read config file %s", FName.c_str());

   typedef ConfigTokenizer::Token Token;
   ConfigTokenizer Tokens(Data);
   std::vector<std::string> Scopes;
   auto const SyntaxError = [&](Token const &T, char const * const What) {
      return _error->Error("Syntax error %s:%u: %s", FName.c_str(), T.Line, What);
   };
   auto const FullName = [&](std::string const &Name) {
      if (Scopes.empty() == true)
	 return Name;
      return Scopes.back() + "::" + Name;
   };

   for (;;)
   {
      Token const T = Tokens.Next();
      switch (T.Type)
      {
	 case ConfigTokenizer::End:
	    if (Scopes.empty() == false)
	       return SyntaxError(T, "Unmatched opening brace");
	    return true;
	 case ConfigTokenizer::Bad:
	    return SyntaxError(T, T.Text.c_str());
	 case ConfigTokenizer::Semicolon:
	    continue;
	 case ConfigTokenizer::Open:
	    return SyntaxError(T, "Block starts with no name");
	 case ConfigTokenizer::Close:
	    if (Scopes.empty() == true)
	       return SyntaxError(T, "Extra closing brace");
	    Scopes.pop_back();
	    continue;
	 case ConfigTokenizer::Include:
	 case ConfigTokenizer::ClearDirective:
	 {
	    Token const Arg = Tokens.Next();
	    if (Arg.Type != ConfigTokenizer::Word && Arg.Type != ConfigTokenizer::String)
	       return SyntaxError(Arg, "Directive without argument");
	    if (Tokens.Next().Type != ConfigTokenizer::Semicolon)
	       return SyntaxError(Arg, "Directive not terminated by ;");
	    if (T.Type == ConfigTokenizer::ClearDirective)
	    {
	       Conf.Clear(Arg.Text);
	       continue;
	    }
	    if (ReadConfigFile(Conf, flCombine(flNotFile(FName), Arg.Text), Depth + 1) == false)
	       return false;
	    continue;
	 }
	 case ConfigTokenizer::Word:
	 case ConfigTokenizer::String:
	    break;
      }

      std::string const Name = FullName(T.Text);
      Token N = Tokens.Next();
      if (N.Type == ConfigTokenizer::Word || N.Type == ConfigTokenizer::String)
      {
	 Conf.Set(Name, N.Text);
	 N = Tokens.Next();
	 if (N.Type == ConfigTokenizer::Semicolon)
	    continue;
	 if (N.Type != ConfigTokenizer::Open)
	    return SyntaxError(N, N.Type == ConfigTokenizer::Bad ? N.Text.c_str() : "Extra junk after value");
      }
      else if (N.Type == ConfigTokenizer::Semicolon)
      {
	 Conf.Set(Name, "");
	 continue;
      }
      else if (N.Type != ConfigTokenizer::Open)
	 return SyntaxError(N, N.Type == ConfigTokenizer::Bad ? N.Text.c_str() : "Missing ; after name");
      Scopes.push_back(Name);
   }
}
									/*}}}*/
