// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Global error mechanism

   A function which fails pushes a message onto the error list and
   returns false, its callers pass the false on until the front-end
   prints all collected messages with DumpErrors:
     if (rename(From, To) != 0)
        return _error->Errno("rename", "Unable to rename %s", From);

   Warnings are queued as well but never make PendingError true.

   Each thread has its own list. Work done on other threads returns
   its messages to the waiting thread with MergeWith.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_ERROR_H
#define IMAPKG_ERROR_H

#include <ima-pkg/macros.h>

#include <deque>
#include <iostream>
#include <string>

class IMA_PUBLIC GlobalError						/*{{{*/
{
   public:
   enum MsgType {
      /** \brief the current run can not succeed */
      ERROR = 30,
      /** \brief something is odd, the run continues */
      WARNING = 20
   };

   /** \brief queue an error, the text is followed by the current errno
    *
    *  \param Function name of the failed system call
    *  \return \b false */
   bool Errno(const char *Function,const char *Description,...) IMA_PRINTF(3) IMA_COLD;
   /** \brief queue a warning, the text is followed by the current errno
    *
    *  \return \b false */
   bool WarningE(const char *Function,const char *Description,...) IMA_PRINTF(3) IMA_COLD;
   /** \return \b false */
   bool Error(const char *Description,...) IMA_PRINTF(2) IMA_COLD;
   /** \return \b false */
   bool Warning(const char *Description,...) IMA_PRINTF(2) IMA_COLD;

   /** \brief is an error queued? */
   bool PendingError() const { return PendingFlag; };
   /** \brief \b true if nothing at or above \b Threshold is queued */
   bool empty(MsgType const Threshold = WARNING) const IMA_PURE;

   /** \brief take the oldest message off the list
    *
    *  \param[out] Text of the message
    *  \return \b true if it was an error */
   bool PopMessage(std::string &Text);

   /** \brief forget all queued messages */
   void Discard();

   /** \brief print and forget all queued messages
    *
    *  Messages below \b Threshold are dropped without being printed. */
   void DumpErrors(std::ostream &Out, MsgType const Threshold = WARNING);
   void DumpErrors() { DumpErrors(std::cerr); };

   /** \brief append all messages of \b Other to this list
    *
    *  \b Other is empty afterwards. */
   void MergeWith(GlobalError &Other);

   GlobalError();
									/*}}}*/
   private:								/*{{{*/
   struct Item
   {
      MsgType Type;
      std::string Text;
   };
   std::deque<Item> Messages;
   bool PendingFlag;

   IMA_HIDDEN bool Queue(MsgType const Type, std::string Text);
									/*}}}*/
};
									/*}}}*/

IMA_PUBLIC GlobalError *_GetErrorObj();
static struct {
   inline GlobalError *operator->() { return _GetErrorObj(); }
} _error IMA_UNUSED;

#endif
