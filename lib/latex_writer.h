/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_LATEX_WRITER_H_INCLUDED
#define MDAST_LATEX_WRITER_H_INCLUDED

#include <iostream>
#include <string>

#include "format.h"
#include "options.h"

namespace mdast {

// Escapes the characters TeX treats specially.
string escapeLatex(const string& src);

// Writes an `article`. Ordered lists nest at most four deep, which is as
// many enumerate counters as LaTeX has.
class LatexWriter: public Writer {
public:
    explicit LatexWriter(const WriterOptions& options=WriterOptions(true));

    using Writer::write;
    void write(const Document& doc, std::ostream& out) override;

private:
    WriterOptions mOptions;
};

} // namespace mdast

#endif
