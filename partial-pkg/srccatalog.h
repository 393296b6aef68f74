// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Source Catalog - Sizes of the source packages in an archive

   The size of a source is the sum of all files listed for it. Files are
   identified by Directory plus name, so a source listed in the Sources
   files of several distributions is counted only once. The catalog also
   remembers which source builds which binary package.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_SRCCATALOG_H
#define PARTLIB_SRCCATALOG_H

#include <partial-pkg/macros.h>

#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class FileFd;
class SourceIndex;

class PARTIAL_PUBLIC SourceCatalog
{
   std::unordered_map<std::string, unsigned long long> Sizes;
   std::vector<std::string> Order;
   std::unordered_set<std::string> Registered;
   std::unordered_map<std::string, std::string> Binaries;
   std::unordered_set<std::string> Reported;

   public:
   typedef std::function<void(std::string const &Binary)> NotFoundCallback;

   /** \brief account the file Name in Directory for Source
    *
    *  \return \b false if the file was already counted before */
   bool AddFile(std::string const &Source, std::string const &Directory,
	 std::string const &Name, unsigned long long const Size);
   void AddBinary(std::string const &Binary, std::string const &Source);

   /** \brief read all stanzas of a Sources file
    *
    *  The files are taken from the Files field, or from Checksums-Sha256
    *  if there is none. If Index is given every stanza and its binaries
    *  are stored there as well.
    *  \return \b false only if the file could not be read */
   bool Parse(FileFd &Fd, SourceIndex * const Index = nullptr);

   /** \brief size of a source, 0 if it is unknown */
   unsigned long long Size(std::string const &Name) const;
   unsigned long long TotalSize(std::vector<std::string> const &Names) const;
   bool Contains(std::string const &Name) const;
   bool SourceOf(std::string const &Binary, std::string &Source) const;

   /** \brief the sources building the given binaries, without duplicates
    *
    *  NotFound is called for binaries without a known source, but only
    *  the first time a binary is asked for in the lifetime of the catalog.
    */
   std::vector<std::string> SourcesOf(std::vector<std::string> const &Bins, NotFoundCallback const &NotFound);
   /** \brief as above, reporting unknown binaries as warnings */
   std::vector<std::string> SourcesOf(std::vector<std::string> const &Bins);

   inline std::vector<std::string> const &Names() const { return Order; };
   inline size_t size() const { return Order.size(); };
};

#endif
