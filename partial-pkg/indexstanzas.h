// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Index Stanzas - The records of a single Packages or Sources file

   Every stanza is kept verbatim under the name of the package it
   describes, so the subset belonging to a partition can be written out
   again exactly as it was read. Later stanzas replace earlier ones of
   the same name.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_INDEXSTANZAS_H
#define PARTLIB_INDEXSTANZAS_H

#include <partial-pkg/macros.h>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class FileFd;

class PARTIAL_PUBLIC IndexStanzas
{
   std::unordered_map<std::string, std::string> Stanzas;

   public:
   void Add(std::string const &Name, std::string const &Stanza);
   bool Exists(std::string const &Name) const;
   inline size_t size() const { return Stanzas.size(); };

   /** \brief write the stanzas of the given names in the given order
    *
    *  Names without a stanza are skipped, as are those the Filter (if
    *  any) rejects. Each stanza is followed by an empty line.
    *
    *  \param Count is set to the number of stanzas written */
   bool Write(FileFd &Out, std::vector<std::string> const &Names, unsigned long &Count,
	 std::function<bool(std::string const &)> const &Filter = nullptr) const;

   virtual ~IndexStanzas() = default;
};

/** \brief the stanzas of one Sources file together with the binaries
 *  they build, so the sources of a partition can be found per file */
class PARTIAL_PUBLIC SourceIndex : public IndexStanzas
{
   std::unordered_map<std::string, std::string> Binaries;

   public:
   void AddBinary(std::string const &Binary, std::string const &Source);

   /** \brief the sources building the given binaries, without duplicates
    *
    *  Binaries not built by a source in this file are silently skipped. */
   std::vector<std::string> SourcesOf(std::vector<std::string> const &Bins) const;
};

#endif
