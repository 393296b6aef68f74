// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Index Writer - Write the Packages and Sources files of the partitions

   Every partition becomes a directory <prefix><topdir> below the
   destination with the usual dists/ hierarchy in it. The Packages files
   there list the binaries of the partition for every architecture. The
   sources go either next to them (merge mode) or into partitions of
   their own. A source is listed only in the first partition it is
   written to.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_INDEXWRITER_H
#define PARTLIB_INDEXWRITER_H

#include <partial-pkg/macros.h>
#include <partial-pkg/partialconfiguration.h>

#include <functional>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

class ArchiveIndices;
class ArchiveLayout;
class IndexStanzas;
struct Partition;

class PARTIAL_PUBLIC IndexWriter
{
   ArchiveLayout const &Layout;
   ArchiveIndices const &Indices;
   std::string const Dest;
   Partial::Configuration::Compressor const Compressor;
   std::map<std::string, std::unordered_set<std::string>> WrittenSources;

   PARTIAL_HIDDEN bool WriteSources(std::string const &Name, std::string const &Dist,
	 std::string const &Section, std::string const &Dir, std::vector<std::string> const &Srcs);

   protected:
   /** \brief called before an index file is written
    *
    *  \param File is the base name of the file, e.g. Packages.gz
    *  \param Name is the name of the partition
    *  \param Target describes the dist, section and arch */
   virtual void Start(std::string const &File, std::string const &Name, std::string const &Target);
   /** \brief called after an index file was written with Count stanzas */
   virtual void Done(unsigned long const Count);

   public:
   /** \brief write a single index file
    *
    *  The directories below the destination are created as needed and
    *  the file is replaced atomically. Base is the uncompressed name, the
    *  compressor extension is appended to it. */
   bool WriteIndex(std::string const &Dir, std::string const &Base, IndexStanzas const &Stanzas,
	 std::vector<std::string> const &Names, unsigned long &Count,
	 std::function<bool(std::string const &)> const &Filter = nullptr);

   /** \brief write the indices of all partitions
    *
    *  \param Packages are the package partitions
    *  \param Sources are the source partitions, empty in merge mode
    *  \param Merge whether the sources of a partition are written into it */
   bool Write(std::vector<Partition> const &Packages, std::vector<Partition> const &Sources,
	 bool const Merge);

   IndexWriter(ArchiveLayout const &layout, ArchiveIndices const &indices,
	 std::string dest, Partial::Configuration::Compressor const &compressor);
   virtual ~IndexWriter() = default;
};

#endif
