// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the ima library

   This function must be called to configure the config class before
   the command line is parsed.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_INIT_H
#define IMAPKG_INIT_H

#include <ima-pkg/macros.h>

class Configuration;

IMA_PUBLIC extern const char *imaVersion;

IMA_PUBLIC bool imaInitConfig(Configuration &Cnf);

#endif
