// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Package Catalog - Sizes of the binary packages in an archive

   The catalog collects the Size of every package from any number of
   Packages files. A .deb shared by several architectures or sections
   is listed in each of their Packages files with the same Filename,
   but it occupies space only once, so every Filename is counted once.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_PKGCATALOG_H
#define PARTLIB_PKGCATALOG_H

#include <partial-pkg/macros.h>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class FileFd;
class IndexStanzas;

class PARTIAL_PUBLIC PackageCatalog
{
   std::unordered_map<std::string, unsigned long long> Sizes;
   std::vector<std::string> Order;
   std::unordered_set<std::string> Registered;

   public:
   /** \brief account the file of a package
    *
    *  \return \b false if FileName was already counted before */
   bool Insert(std::string const &Name, std::string const &FileName, unsigned long long const Size);

   /** \brief read all stanzas of a Packages file
    *
    *  Stanzas without a Package or Size field are not counted. If Stanzas
    *  is given every stanza is stored there as well.
    *  \return \b false only if the file could not be read */
   bool Parse(FileFd &Fd, IndexStanzas * const Stanzas = nullptr);

   /** \brief size of a package, 0 if it is unknown */
   unsigned long long Size(std::string const &Name) const;
   unsigned long long TotalSize(std::vector<std::string> const &Names) const;
   bool Contains(std::string const &Name) const;

   /** \brief all known packages in the order they were first seen */
   inline std::vector<std::string> const &Names() const { return Order; };
   inline size_t size() const { return Order.size(); };
};

/** \brief the packages to partition, in order
 *
 *  Names from Include are warned about if the catalog doesn't know
 *  them, unknown lines in the file IncludeFrom are skipped silently.
 *  Without any known package all packages of the catalog are selected.
 *  Every package is selected only once. */
PARTIAL_PUBLIC bool SelectPackages(PackageCatalog const &Catalog, std::vector<std::string> const &Include,
      std::string const &IncludeFrom, std::vector<std::string> &Selected);

#endif
