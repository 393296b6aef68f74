// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Archive - Layout and indices of a Debian archive

   ArchiveLayout knows which distributions, sections and architectures
   are handled and how the files of the archive and of the partitions
   are named. ArchiveIndices reads the Packages and Sources files of an
   archive into the catalogs and keeps their stanzas for writing the
   partial indices.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_ARCHIVE_H
#define PARTLIB_ARCHIVE_H

#include <partial-pkg/indexstanzas.h>
#include <partial-pkg/macros.h>
#include <partial-pkg/pkgcatalog.h>
#include <partial-pkg/srccatalog.h>

#include <map>
#include <string>
#include <vector>

class Configuration;

class PARTIAL_PUBLIC ArchiveLayout
{
   public:
   std::vector<std::string> Dists;
   std::vector<std::string> Sections;
   std::vector<std::string> Archs;
   std::vector<std::string> DirMap;
   std::string DirPrefix;
   std::string DirSrcPrefix;

   /** \brief read the Partial:: options describing the layout */
   bool FromConfig(Configuration const &Cnf);

   /** \brief dists/<dist>/<section>/binary-<arch>/Packages */
   static std::string PackagesIndex(std::string const &Dist, std::string const &Section, std::string const &Arch);
   /** \brief dists/<dist>/<section>/source/Sources */
   static std::string SourcesIndex(std::string const &Dist, std::string const &Section);

   /** \brief name of the partition with the given index
    *
    *  This is the entry of DirMap for it if there is one, otherwise
    *  the index itself. */
   std::string TopDir(size_t const Index) const;

   ArchiveLayout() : DirPrefix("Debian"), DirSrcPrefix("Debian-Src") {};
};

class PARTIAL_PUBLIC ArchiveIndices
{
   std::map<std::string, IndexStanzas> PkgIndices;
   std::map<std::string, SourceIndex> SrcIndices;

   public:
   PackageCatalog Packages;
   SourceCatalog Sources;

   /** \brief read a Packages file, compressed or not, below Base */
   bool LoadPackages(std::string const &Base, std::string const &Dist,
	 std::string const &Section, std::string const &Arch);
   /** \brief read a Sources file, compressed or not, below Base */
   bool LoadSources(std::string const &Base, std::string const &Dist,
	 std::string const &Section);

   /** \return the stanzas of a loaded Packages file or \b nullptr */
   IndexStanzas const *FindPackages(std::string const &Dist, std::string const &Section,
	 std::string const &Arch) const;
   /** \return the stanzas of a loaded Sources file or \b nullptr */
   SourceIndex const *FindSources(std::string const &Dist, std::string const &Section) const;
};

#endif
