/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "chars.h"

#include <algorithm>
#include <cstring>

namespace mdast {

namespace {

struct Range {
    uint32_t low, high;
};

// Non-ASCII punctuation (Unicode P* and S* categories), in ascending order.
// Covers the blocks prose actually uses rather than the whole database.
const Range cPunctuation[]= {
    { 0x00A1, 0x00A9 }, { 0x00AB, 0x00AC }, { 0x00AE, 0x00B1 },
    { 0x00B4, 0x00B4 }, { 0x00B6, 0x00B8 }, { 0x00BB, 0x00BB },
    { 0x00BF, 0x00BF }, { 0x00D7, 0x00D7 }, { 0x00F7, 0x00F7 },
    { 0x02C2, 0x02C5 }, { 0x02D2, 0x02DF }, { 0x037E, 0x037E },
    { 0x0387, 0x0387 }, { 0x055A, 0x055F }, { 0x0589, 0x058A },
    { 0x05BE, 0x05BE }, { 0x05C0, 0x05C0 }, { 0x05C3, 0x05C3 },
    { 0x05C6, 0x05C6 }, { 0x05F3, 0x05F4 }, { 0x0609, 0x060D },
    { 0x061B, 0x061B }, { 0x061D, 0x061F }, { 0x066A, 0x066D },
    { 0x06D4, 0x06D4 }, { 0x0964, 0x0965 }, { 0x0970, 0x0970 },
    { 0x0E4F, 0x0E4F }, { 0x0E5A, 0x0E5B }, { 0x10FB, 0x10FB },
    { 0x1360, 0x1368 }, { 0x166E, 0x166E }, { 0x169B, 0x169C },
    { 0x16EB, 0x16ED }, { 0x17D4, 0x17D6 }, { 0x17D8, 0x17DA },
    { 0x1800, 0x180A }, { 0x2010, 0x2027 }, { 0x2030, 0x205E },
    { 0x207A, 0x207E }, { 0x208A, 0x208E }, { 0x20A0, 0x20C0 },
    { 0x2100, 0x214F }, { 0x2190, 0x23FF }, { 0x2400, 0x2426 },
    { 0x2440, 0x244A }, { 0x2500, 0x2775 }, { 0x2794, 0x2BFF },
    { 0x2CF9, 0x2CFC }, { 0x2CFE, 0x2CFF }, { 0x2E00, 0x2E5D },
    { 0x2E80, 0x2FFB }, { 0x3001, 0x3004 }, { 0x3008, 0x3020 },
    { 0x3030, 0x3030 }, { 0x303D, 0x303F }, { 0x309B, 0x309C },
    { 0x30A0, 0x30A0 }, { 0x30FB, 0x30FB }, { 0xA4FE, 0xA4FF },
    { 0xA60D, 0xA60F }, { 0xA673, 0xA673 }, { 0xA67E, 0xA67E },
    { 0xFD3E, 0xFD3F }, { 0xFE10, 0xFE19 }, { 0xFE30, 0xFE52 },
    { 0xFE54, 0xFE66 }, { 0xFE68, 0xFE6B }, { 0xFF01, 0xFF0F },
    { 0xFF1A, 0xFF20 }, { 0xFF3B, 0xFF40 }, { 0xFF5B, 0xFF65 },
    { 0xFFE0, 0xFFEE }, { 0x1F000, 0x1FAFF }
};

bool rangeLess(const Range& r, uint32_t cp) {
    return r.high<cp;
}

} // namespace

uint32_t decodeUtf8(const string& src, size_t pos, size_t *length) {
    size_t len=1;
    uint32_t cp=cReplacementCharacter;
    unsigned char c=static_cast<unsigned char>(src[pos]);

    size_t need=0;
    if (c<0x80) cp=c;
    else if ((c & 0xE0)==0xC0) { need=1; cp=c & 0x1F; }
    else if ((c & 0xF0)==0xE0) { need=2; cp=c & 0x0F; }
    else if ((c & 0xF8)==0xF0) { need=3; cp=c & 0x07; }

    if (need>0) {
        if (pos+need<src.size()) {
            bool valid=true;
            for (size_t x=1; x<=need; ++x) {
                unsigned char cc=static_cast<unsigned char>(src[pos+x]);
                if ((cc & 0xC0)!=0x80) { valid=false; break; }
                cp=(cp << 6) | (cc & 0x3F);
            }
            if (valid) len=need+1;
            else cp=cReplacementCharacter;
        } else cp=cReplacementCharacter;
    } else if (c>=0x80) cp=cReplacementCharacter;

    if (length) *length=len;
    return cp;
}

uint32_t codepointBefore(const string& src, size_t pos) {
    if (pos==0) return '\n';
    size_t start=pos-1;
    while (start>0 && pos-start<4
            && (static_cast<unsigned char>(src[start]) & 0xC0)==0x80)
        --start;
    size_t len;
    uint32_t cp=decodeUtf8(src, start, &len);
    if (start+len!=pos) return cReplacementCharacter;
    return cp;
}

uint32_t codepointAt(const string& src, size_t pos) {
    if (pos>=src.size()) return '\n';
    return decodeUtf8(src, pos);
}

void appendUtf8(string& tgt, uint32_t cp) {
    if (cp>0x10FFFF || (cp>=0xD800 && cp<=0xDFFF)) cp=cReplacementCharacter;
    if (cp<0x80) {
        tgt.push_back(static_cast<char>(cp));
    } else if (cp<0x800) {
        tgt.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        tgt.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp<0x10000) {
        tgt.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        tgt.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        tgt.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        tgt.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        tgt.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        tgt.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        tgt.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool isAsciiPunctuation(char c) {
    return c!=0 && std::strchr("!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~", c)!=0;
}

bool isUnicodeWhitespace(uint32_t cp) {
    switch (cp) {
        case ' ': case '\t': case '\n': case '\r': case '\f':
        case 0x00A0: case 0x1680: case 0x202F: case 0x205F: case 0x3000:
            return true;
    }
    return cp>=0x2000 && cp<=0x200A;
}

bool isUnicodePunctuation(uint32_t cp) {
    if (cp<0x80) return isAsciiPunctuation(static_cast<char>(cp));
    const Range *end=cPunctuation+sizeof(cPunctuation)/sizeof(cPunctuation[0]);
    const Range *i=std::lower_bound(cPunctuation, end, cp, rangeLess);
    return i!=end && i->low<=cp;
}

} // namespace mdast
