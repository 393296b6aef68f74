// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Various useful macro definitions

   ##################################################################### */
									/*}}}*/
// Private header
#ifndef PARTLIB_MACROS_H
#define PARTLIB_MACROS_H

#ifdef __GNUC__
#define PARTIAL_GCC_VERSION (__GNUC__ << 8 | __GNUC_MINOR__)
#else
#define PARTIAL_GCC_VERSION 0
#endif

/* likely() and unlikely() can be used to mark boolean expressions
   as (not) likely true which will help the compiler to optimise */
#if PARTIAL_GCC_VERSION >= 0x0300
	#define likely(x)	__builtin_expect (!!(x), 1)
	#define unlikely(x)	__builtin_expect (!!(x), 0)
	#define PARTIAL_PURE	__attribute__((pure))
	#define PARTIAL_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define PARTIAL_UNUSED	__attribute__((unused))
	#define PARTIAL_PUBLIC __attribute__ ((visibility ("default")))
	#define PARTIAL_HIDDEN __attribute__ ((visibility ("hidden")))
	#define PARTIAL_COLD	__attribute__ ((__cold__))
#else
	#define likely(x)	(x)
	#define unlikely(x)	(x)
	#define PARTIAL_PURE
	#define PARTIAL_PRINTF(n)
	#define PARTIAL_UNUSED
	#define PARTIAL_PUBLIC
	#define PARTIAL_HIDDEN
	#define PARTIAL_COLD
#endif

#define PARTIAL_PKG_MAJOR 1
#define PARTIAL_PKG_MINOR 0
#define PARTIAL_PKG_RELEASE 0

/* Should be a multiple of the common page size (4096) */
static constexpr unsigned long long PARTIAL_BUFFER_SIZE = 64 * 1024;

#endif
