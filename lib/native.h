/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_NATIVE_H_INCLUDED
#define MDAST_NATIVE_H_INCLUDED

#include <iostream>
#include <string>

#include <boost/noncopyable.hpp>

#include "format.h"

namespace mdast {

// Pandoc's native form: the tree as Haskell's `show` prints it, e.g.
//   Pandoc (Meta {unMeta = fromList []}) [Para [Str "hi",Space,Str "there"]]
// Whatever NativeWriter writes, NativeReader reads back into an equal tree.
class NativeWriter: public Writer {
public:
    using Writer::write;
    void write(const Document& doc, std::ostream& out) override;
};

// Also accepts a bare block list, the way Pandoc writes a fragment, and any
// whitespace between tokens. Malformed input raises ReadError.
class NativeReader: public Reader, private boost::noncopyable {
public:
    using Reader::read;
    Document read(std::istream& in) override;

    Document parse(const string& text);
};

// A string literal in Haskell syntax.
string showString(const string& str);

} // namespace mdast

#endif
