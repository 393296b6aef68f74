// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/** \class Partial::Configuration
 *  \brief Access methods for settings shared by the library users
 *
 *  The methods wrap the usual _config lookups so that defaults are set
 *  in one place instead of at every caller.
 */
									/*}}}*/
#ifndef PARTIAL_CONFIGURATION_H
#define PARTIAL_CONFIGURATION_H
// Include Files							/*{{{*/
#include <partial-pkg/macros.h>
#include <limits>
#include <string>
#include <vector>
									/*}}}*/
namespace Partial {
namespace Configuration {							/*{{{*/
	/** \brief Representation of supported compressors
	 *
	 *  All compressors are implemented by linked libraries, the special
	 *  name "." stands for uncompressed files.
	 */
	struct PARTIAL_PUBLIC Compressor {
		std::string Name;
		std::string Extension;
		int Level;
		unsigned short Cost;

		Compressor(char const *name, char const *extension,
			   int const level, unsigned short const cost);
		Compressor() : Level(0), Cost(std::numeric_limits<unsigned short>::max()) {};
	};

	/** \brief Return a vector of Compressors usable by FileFd
	 *
	 *  The vector is sorted by cost, so probing for compressed variants
	 *  of a file tries the cheap ones first.
	 *
	 *  \param Cached saves the result so we need to calculated it only once
	 *                this parameter should only be used for testing purposes.
	 */
	PARTIAL_PUBLIC std::vector<Compressor> const getCompressors(bool const Cached = true);

	/** \brief Return the extensions of all real compressors, ".gz" style */
	PARTIAL_PUBLIC std::vector<std::string> const getCompressorExtensions();

	/** \brief find the compressor with the given name
	 *
	 *  \return \b false with an error on the stack if it is unknown */
	PARTIAL_PUBLIC bool findCompressor(std::string const &Name, Compressor &Found);
	/*}}}*/
}
									/*}}}*/
}
#endif
