// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Global error mechanism

   The list is a FIFO, PendingFlag is kept in sync with the presence
   of an ERROR item so that PendingError() is cheap.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/error.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <errno.h>
									/*}}}*/

// _GetErrorObj - the list of the calling thread			/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// VFormat - printf into a std::string					/*{{{*/
static std::string VFormat(const char *Description, va_list Args)
{
   va_list Copy;
   va_copy(Copy, Args);
   int const Length = vsnprintf(nullptr, 0, Description, Copy);
   va_end(Copy);
   if (Length < 0)
      return Description;

   std::vector<char> Buf(Length + 1);
   vsnprintf(Buf.data(), Buf.size(), Description, Args);
   return std::string(Buf.data(), Length);
}
									/*}}}*/
// WithErrno - append the errno description to a message		/*{{{*/
static std::string WithErrno(std::string Text, const char *Function, int const Errsv)
{
   Text.append(" - ").append(Function);
   Text.append(" (").append(std::to_string(Errsv)).append(": ");
   Text.append(strerror(Errsv)).append(")");
   return Text;
}
									/*}}}*/
GlobalError::GlobalError() : PendingFlag(false) {}

// GlobalError::Errno - queue an error with errno			/*{{{*/
bool GlobalError::Errno(const char *Function, const char *Description, ...)
{
   int const Errsv = errno;
   va_list Args;
   va_start(Args, Description);
   std::string Text = VFormat(Description, Args);
   va_end(Args);
   return Queue(ERROR, WithErrno(std::move(Text), Function, Errsv));
}
									/*}}}*/
// GlobalError::WarningE - queue a warning with errno			/*{{{*/
bool GlobalError::WarningE(const char *Function, const char *Description, ...)
{
   int const Errsv = errno;
   va_list Args;
   va_start(Args, Description);
   std::string Text = VFormat(Description, Args);
   va_end(Args);
   return Queue(WARNING, WithErrno(std::move(Text), Function, Errsv));
}
									/*}}}*/
// GlobalError::Error - queue an error					/*{{{*/
bool GlobalError::Error(const char *Description, ...)
{
   va_list Args;
   va_start(Args, Description);
   std::string Text = VFormat(Description, Args);
   va_end(Args);
   return Queue(ERROR, std::move(Text));
}
									/*}}}*/
// GlobalError::Warning - queue a warning				/*{{{*/
bool GlobalError::Warning(const char *Description, ...)
{
   va_list Args;
   va_start(Args, Description);
   std::string Text = VFormat(Description, Args);
   va_end(Args);
   return Queue(WARNING, std::move(Text));
}
									/*}}}*/
// GlobalError::Queue - append an item					/*{{{*/
bool GlobalError::Queue(MsgType const Type, std::string Text)
{
   Messages.push_back(Item{Type, std::move(Text)});
   if (Type == ERROR)
      PendingFlag = true;
   return false;
}
									/*}}}*/
// GlobalError::PopMessage - take the oldest item			/*{{{*/
bool GlobalError::PopMessage(std::string &Text)
{
   if (Messages.empty() == true)
      return false;

   Item const Front = std::move(Messages.front());
   Messages.pop_front();
   Text = Front.Text;

   if (Front.Type == ERROR)
      PendingFlag = std::any_of(Messages.begin(), Messages.end(),
				[](Item const &I) { return I.Type == ERROR; });
   return Front.Type == ERROR;
}
									/*}}}*/
// GlobalError::empty - is anything at or above Threshold queued?	/*{{{*/
bool GlobalError::empty(MsgType const Threshold) const
{
   return std::none_of(Messages.begin(), Messages.end(),
		       [&](Item const &I) { return I.Type >= Threshold; });
}
									/*}}}*/
// GlobalError::Discard - forget everything				/*{{{*/
void GlobalError::Discard()
{
   Messages.clear();
   PendingFlag = false;
}
									/*}}}*/
// GlobalError::DumpErrors - print E: and W: lines			/*{{{*/
// ---------------------------------------------------------------------
/* Messages spanning several lines get their continuation lines
   indented below the text of the first one. */
void GlobalError::DumpErrors(std::ostream &Out, MsgType const Threshold)
{
   for (auto const &I : Messages)
   {
      if (I.Type < Threshold)
	 continue;
      Out << (I.Type == ERROR ? "E: " : "W: ");
      for (char const c : I.Text)
      {
	 if (c == '\n')
	    Out << "\n   ";
	 else
	    Out << c;
      }
      Out << std::endl;
   }
   Discard();
}
									/*}}}*/
// GlobalError::MergeWith - take over the items of another list		/*{{{*/
void GlobalError::MergeWith(GlobalError &Other)
{
   if (this == &Other)
      return;
   for (auto &I : Other.Messages)
      Messages.push_back(std::move(I));
   PendingFlag = PendingFlag || Other.PendingFlag;
   Other.Discard();
}
									/*}}}*/
