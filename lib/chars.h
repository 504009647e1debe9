/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_CHARS_H_INCLUDED
#define MDAST_CHARS_H_INCLUDED

#include <cstdint>
#include <string>

namespace mdast {

using std::string;

const uint32_t cReplacementCharacter=0xFFFD;

// Decodes the UTF-8 sequence starting at `pos`. Malformed input decodes to
// U+FFFD with a length of one byte so scanning always makes progress.
uint32_t decodeUtf8(const string& src, size_t pos, size_t *length=0);

// The code point ending just before `pos`, or a newline at the start of the
// text (start and end of text count as whitespace for flanking).
uint32_t codepointBefore(const string& src, size_t pos);
uint32_t codepointAt(const string& src, size_t pos);

void appendUtf8(string& tgt, uint32_t cp);

bool isAsciiPunctuation(char c);
bool isUnicodeWhitespace(uint32_t cp);
bool isUnicodePunctuation(uint32_t cp);

inline bool isSpaceOrTab(char c) { return c==' ' || c=='\t'; }

} // namespace mdast

#endif
