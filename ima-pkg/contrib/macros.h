// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Compiler attributes and small helpers shared by the
   ima-pkg library, its tools and its tests.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_MACROS_H
#define IMAPKG_MACROS_H

#if defined(__GNUC__) || defined(__clang__)
	#define IMA_PURE	__attribute__((pure))
	#define IMA_COLD	__attribute__((cold))
	#define IMA_UNUSED	__attribute__((unused))
	#define IMA_PRINTF(fmt)	__attribute__((format(printf, fmt, fmt + 1)))
	#define IMA_PUBLIC	__attribute__((visibility("default")))
	#define IMA_HIDDEN	__attribute__((visibility("hidden")))
#else
	#define IMA_PURE
	#define IMA_COLD
	#define IMA_UNUSED
	#define IMA_PRINTF(fmt)
	#define IMA_PUBLIC
	#define IMA_HIDDEN
#endif

// chunk size for copying and hashing files, a multiple of the page size
static constexpr unsigned long long IMA_BUFFER_SIZE = 64 * 1024;

// DEFER(lambda) runs lambda when the enclosing scope is left
template <class F>
struct ImaDeferred {
   F Run;
   ~ImaDeferred() { Run(); }
};
template <class F>
ImaDeferred(F) -> ImaDeferred<F>;
#define IMA_CONCAT_(a, b) a##b
#define IMA_CONCAT(a, b) IMA_CONCAT_(a, b)
#define DEFER(lambda) ImaDeferred IMA_CONCAT(deferred_, __LINE__){lambda};

#endif
