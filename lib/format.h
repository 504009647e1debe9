/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_FORMAT_H_INCLUDED
#define MDAST_FORMAT_H_INCLUDED

#include <iostream>
#include <sstream>
#include <string>

#include "ast.h"

namespace mdast {

// Something that turns text in one format into a document tree.
class Reader {
public:
    virtual ~Reader() { }

    virtual Document read(std::istream& in)=0;

    Document read(const string& text) {
        std::istringstream in(text);
        return read(in);
    }
};

// Something that turns a document tree into text in one format.
class Writer {
public:
    virtual ~Writer() { }

    virtual void write(const Document& doc, std::ostream& out)=0;

    string write(const Document& doc) {
        std::ostringstream out;
        write(doc, out);
        return out.str();
    }
};

} // namespace mdast

#endif
