/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_ENTITIES_H_INCLUDED
#define MDAST_ENTITIES_H_INCLUDED

#include <string>

namespace mdast {

using std::string;

// Decodes the character reference starting at src[pos], which must be an
// '&'. Appends the decoded text to `tgt` and returns the number of source
// bytes used, or zero (leaving `tgt` alone) if there is no well-formed
// reference there. Numeric references to code point zero, to surrogates or
// beyond U+10FFFF decode to U+FFFD.
size_t decodeEntity(const string& src, size_t pos, string& tgt);

// Resolves backslash escapes of ASCII punctuation and character references.
// Used on link destinations, link titles and fenced code info strings.
string unescapeString(const string& src);

} // namespace mdast

#endif
