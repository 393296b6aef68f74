// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Provide access methods to various configuration settings,
   setup defaults and returns validate settings.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/partialconfiguration.h>

#include <algorithm>
#include <string>
#include <vector>
									/*}}}*/
namespace Partial {
// getCompressors - Return Vector of usable compressors			/*{{{*/
// ---------------------------------------------------------------------
/* Only the compressors this build links against are offered */
std::vector<Partial::Configuration::Compressor>
const Configuration::getCompressors(bool const Cached) {
	static std::vector<Partial::Configuration::Compressor> compressors;
	if (compressors.empty() == false) {
		if (Cached == true)
			return compressors;
		else
			compressors.clear();
	}

	compressors.emplace_back(".", "", 0, 0);
#ifdef HAVE_LZ4
	compressors.emplace_back("lz4", ".lz4", 1, 50);
#endif
#ifdef HAVE_ZLIB
	compressors.emplace_back("gzip", ".gz", 9, 100);
#endif
#ifdef HAVE_LZMA
	compressors.emplace_back("xz", ".xz", 6, 200);
#endif
#ifdef HAVE_BZ2
	compressors.emplace_back("bzip2", ".bz2", 9, 300);
#endif
#ifdef HAVE_LZMA
	compressors.emplace_back("lzma", ".lzma", 6, 400);
#endif

	std::stable_sort(compressors.begin(), compressors.end(),
		[](Compressor const &a, Compressor const &b) { return a.Cost < b.Cost; });
	return compressors;
}
									/*}}}*/
// getCompressorExtensions - supported index file extensions		/*{{{*/
std::vector<std::string> const Configuration::getCompressorExtensions() {
	std::vector<std::string> ext;
	for (auto const &c : getCompressors())
		if (c.Extension.empty() == false && c.Extension != ".")
			ext.push_back(c.Extension);
	return ext;
}
									/*}}}*/
// findCompressor - lookup a compressor by name				/*{{{*/
bool Configuration::findCompressor(std::string const &Name, Compressor &Found) {
	std::string const name = (Name == "none" || Name == "uncompressed") ? "." : Name;
	std::vector<Compressor> const compressors = getCompressors();
	auto const c = std::find_if(compressors.begin(), compressors.end(),
		[&](Compressor const &comp) { return comp.Name == name; });
	if (c == compressors.end())
		return _error->Error("Unknown compressor '%s'", Name.c_str());
	Found = *c;
	return true;
}
									/*}}}*/
// Compressor constructor						/*{{{*/
// ---------------------------------------------------------------------
/* Everything can be overridden below Partial::Compressor::NAME */
Configuration::Compressor::Compressor(char const *name, char const *extension,
				      int const level, unsigned short const cost) {
	std::string const config = std::string("Partial::Compressor::").append(name).append("::");
	Name = name;
	Extension = _config->Find(std::string(config).append("Extension"), extension);
	Level = _config->FindI(std::string(config).append("Level"), level);
	Cost = _config->FindI(std::string(config).append("Cost"), cost);
}
									/*}}}*/
}
