/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_TYPST_WRITER_H_INCLUDED
#define MDAST_TYPST_WRITER_H_INCLUDED

#include <iostream>
#include <string>

#include "format.h"
#include "options.h"

namespace mdast {

// Escapes Typst markup characters, and a leading digit that could start a
// numbered list.
string escapeTypst(const string& src);

// Writes Typst markup for the constructs GFM produces. A standalone document
// starts with a `#set document` rule carrying the title.
class TypstWriter: public Writer {
public:
    explicit TypstWriter(const WriterOptions& options=WriterOptions());

    using Writer::write;
    void write(const Document& doc, std::ostream& out) override;

private:
    WriterOptions mOptions;
};

} // namespace mdast

#endif
