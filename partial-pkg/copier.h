// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Copier - Fill a partial archive with the files its indices list

   All Packages and Sources files below <dest>/dists are read and every
   file mentioned in them is copied from the full archive, or linked to
   it with a relative symlink. Files already present in the destination
   are left alone.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_COPIER_H
#define PARTLIB_COPIER_H

#include <partial-pkg/macros.h>

#include <string>
#include <vector>

class PARTIAL_PUBLIC ArchiveCopier
{
   std::string const Source;
   std::string const Dest;
   bool const Symlink;
   unsigned long Copied;
   unsigned long Ignored;
   unsigned long NotFound;

   public:
   /** \brief find the Packages and Sources files below Dest/dists
    *
    *  Compressed variants are found, too. Both lists are sorted. */
   bool FindIndexFiles(std::vector<std::string> &Packages, std::vector<std::string> &Sources) const;

   /** \brief copy the files of all stanzas in a Packages file */
   bool ProcessPackages(std::string const &File);
   /** \brief copy the files of all stanzas in a Sources file */
   bool ProcessSources(std::string const &File);

   /** \brief copy (or link) one file given relative to the archive root
    *
    *  A file missing in the source is reported as a warning only. */
   bool Copy(std::string const &Path);

   inline unsigned long CopiedFiles() const { return Copied; };
   inline unsigned long IgnoredFiles() const { return Ignored; };
   inline unsigned long MissingFiles() const { return NotFound; };

   ArchiveCopier(std::string source, std::string dest, bool const symlink);
};

/** \brief the path leading from the directory From to the directory To
 *
 *  Both have to exist. If they have no common top directory the
 *  absolute path of To is returned. */
PARTIAL_PUBLIC std::string RelativePath(std::string const &From, std::string const &To);

#endif
