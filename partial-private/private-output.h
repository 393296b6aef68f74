#ifndef PARTIAL_PRIVATE_OUTPUT_H
#define PARTIAL_PRIVATE_OUTPUT_H

#include <partial-pkg/macros.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

class ArchiveLayout;
struct Partition;

PARTIAL_PUBLIC extern std::ostream c0out;
PARTIAL_PUBLIC extern std::ostream c1out;
PARTIAL_PUBLIC extern std::ostream c2out;
PARTIAL_PUBLIC extern std::ofstream devnull;

PARTIAL_PUBLIC bool InitOutput(std::basic_streambuf<char> * const out = std::cout.rdbuf());

/** \brief one line per partition with its package count, size and first package */
PARTIAL_PUBLIC void ShowPackagePartitions(std::ostream &out, ArchiveLayout const &Layout,
      std::vector<Partition> const &Parts, bool const Merge);
/** \brief one line per source partition, numbered after the package partitions
 *  if both share their prefix */
PARTIAL_PUBLIC void ShowSourcePartitions(std::ostream &out, ArchiveLayout const &Layout,
      std::vector<Partition> const &Parts, size_t const PackageParts);

#endif
