// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - One message list for the whole run

   Library code never prints. A function that runs into trouble records
   a message here and returns false, so the usual shape of a call is
     if (Fd.Open(...) == false)
        return false;
   and the front end dumps the collected messages before it exits.

   Warnings are stored the same way but don't make the run fail: a
   package whose source is unknown or an oversized package that is
   left out are reported and the partitioning goes on.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_ERROR_H
#define PARTLIB_ERROR_H

#include <partial-pkg/macros.h>

#include <iostream>
#include <string>
#include <vector>

#include <cstdarg>

class PARTIAL_PUBLIC GlobalError					/*{{{*/
{
public:
	/** \brief severity of a message, ordered for threshold checks */
	enum MsgType {
		/** \brief the run is aborted, printed as soon as it is added */
		FATAL = 40,
		/** \brief the run fails */
		ERROR = 30,
		/** \brief the result may differ from what was asked for */
		WARNING = 20,
		NOTICE = 10,
		/** \brief printed as soon as it is added */
		DEBUG = 0
	};

	/** \brief record a message followed by the text for errno
	 *
	 *  \param Function the failing call, e.g. "open"
	 *  \return always \b false
	 */
	bool Errno(const char *Function,const char *Description,...) PARTIAL_PRINTF(3) PARTIAL_COLD;
	bool FatalE(const char *Function,const char *Description,...) PARTIAL_PRINTF(3) PARTIAL_COLD;
	bool WarningE(const char *Function,const char *Description,...) PARTIAL_PRINTF(3) PARTIAL_COLD;

	/** \brief record a message, all of these return \b false */
	bool Fatal(const char *Description,...) PARTIAL_PRINTF(2) PARTIAL_COLD;
	bool Error(const char *Description,...) PARTIAL_PRINTF(2) PARTIAL_COLD;
	bool Warning(const char *Description,...) PARTIAL_PRINTF(2) PARTIAL_COLD;
	bool Notice(const char *Description,...) PARTIAL_PRINTF(2) PARTIAL_COLD;
	bool Debug(const char *Description,...) PARTIAL_PRINTF(2) PARTIAL_COLD;

	/** \brief va_list flavours for wrappers with their own varargs
	 *
	 *  The caller owns args (va_start/va_end). errsv is the errno value
	 *  saved before anything could clobber it.
	 */
	bool Insert(MsgType type, const char *Description, va_list args) PARTIAL_COLD;
	bool InsertErrno(MsgType type, const char *Function, const char *Description,
			 va_list args, int const errsv) PARTIAL_COLD;

	/** \brief was an error or fatal error recorded? */
	inline bool PendingError() const PARTIAL_PURE {return PendingFlag;};

	/** \brief \b true if no message of at least threshold is stored */
	bool empty(MsgType const &threshold = WARNING) const PARTIAL_PURE;

	/** \brief remove the oldest message
	 *
	 *  \return \b true if it was an error or fatal error
	 */
	bool PopMessage(std::string &Text);

	void Discard();

	/** \brief print the messages of at least threshold, then discard all */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING);
	void DumpErrors(MsgType const &threshold = WARNING) { DumpErrors(std::cerr, threshold); }

	GlobalError();

private:
	struct Item {
		std::string Text;
		MsgType Type;
	};
	PARTIAL_HIDDEN static void Print(std::ostream &out, Item const &I);
	bool Add(MsgType type, std::string &&Text);

	std::vector<Item> Messages;
	bool PendingFlag;
};
									/*}}}*/

PARTIAL_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error PARTIAL_UNUSED;

#endif
