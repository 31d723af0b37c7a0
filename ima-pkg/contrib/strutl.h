// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - formatting and parsing of short strings

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_STRUTL_H
#define IMAPKG_STRUTL_H

#include <ima-pkg/macros.h>

#include <iostream>
#include <string>

/** \brief human readable size with at most four digits, "12.3 k" */
IMA_PUBLIC std::string SizeToStr(double Bytes);
/** \brief interpret yes/no, true/false, on/off, 1/0 and friends
 *
 *  \return 1 or 0, \b Default if the text is none of these */
IMA_PUBLIC int StringToBool(const std::string &Text,int Default = -1);

/** \brief escape a string for use as XML character data or attribute value
 *
 * The five predefined entities are substituted; everything else,
 * including non-ASCII UTF-8 sequences, is passed through unchanged.
 */
IMA_PUBLIC std::string XMLEscape(std::string const &Str);

IMA_PUBLIC void ioprintf(std::ostream &out,const char *format,...) IMA_PRINTF(2);

// Locale independent character classes
IMA_PUBLIC int tolower_ascii(int const c) IMA_PURE;

#endif
