// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - formatting and parsing of short strings

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <ima-pkg/strutl.h>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <strings.h>
									/*}}}*/

// SizeToStr - Convert a byte count into a human readable size		/*{{{*/
// ---------------------------------------------------------------------
/* Up to 9999 of a unit are shown before switching to the next one,
   below 100 of a unit one decimal is added. */
std::string SizeToStr(double Size)
{
   static char const * const Units[] = {"", "k", "M", "G", "T", "P", "E"};
   static size_t const UnitCount = sizeof(Units) / sizeof(Units[0]);

   double Value = Size < 0 ? -Size : Size;
   char Buf[64];
   for (size_t U = 0; U != UnitCount; ++U)
   {
      bool const Last = (U + 1 == UnitCount);
      if (U != 0 && Value < 100)
      {
	 snprintf(Buf, sizeof(Buf), "%.1f %s", Value, Units[U]);
	 break;
      }
      if (Value < 10000 || Last == true)
      {
	 snprintf(Buf, sizeof(Buf), "%.0f %s", Value, Units[U]);
	 break;
      }
      Value /= 1000.0;
   }
   return Buf;
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
int StringToBool(const std::string &Text,int Default)
{
   if (Text == "1")
      return 1;
   if (Text == "0")
      return 0;

   static char const * const Yes[] = {"yes", "true", "with", "on", "enable"};
   static char const * const No[] = {"no", "false", "without", "off", "disable"};
   for (auto const Word : Yes)
      if (strcasecmp(Text.c_str(), Word) == 0)
	 return 1;
   for (auto const Word : No)
      if (strcasecmp(Text.c_str(), Word) == 0)
	 return 0;
   return Default;
}
									/*}}}*/
// XMLEscape - Replace the characters with a meaning in markup		/*{{{*/
std::string XMLEscape(std::string const &Str)
{
   if (Str.find_first_of("&<>\"'") == std::string::npos)
      return Str;

   std::string Res;
   Res.reserve(Str.length() + 16);
   for (char const C : Str)
   {
      switch (C)
      {
	 case '&': Res.append("&amp;"); break;
	 case '<': Res.append("&lt;"); break;
	 case '>': Res.append("&gt;"); break;
	 case '"': Res.append("&quot;"); break;
	 case '\'': Res.append("&apos;"); break;
	 default: Res.push_back(C); break;
      }
   }
   return Res;
}
									/*}}}*/
// ioprintf - printf to a stream					/*{{{*/
void ioprintf(std::ostream &out,const char *format,...)
{
   va_list args;
   va_start(args, format);
   va_list copy;
   va_copy(copy, args);
   int const length = vsnprintf(nullptr, 0, format, copy);
   va_end(copy);
   if (length >= 0)
   {
      std::vector<char> buf(length + 1);
      vsnprintf(buf.data(), buf.size(), format, args);
      out.write(buf.data(), length);
   }
   va_end(args);
}
									/*}}}*/
// tolower_ascii - tolower() function that ignores the locale		/*{{{*/
int tolower_ascii(int const c)
{
   if (c >= 'A' && c <= 'Z')
      return c - 'A' + 'a';
   return c;
}
									/*}}}*/
