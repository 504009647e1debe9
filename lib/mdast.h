/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_MDAST_H_INCLUDED
#define MDAST_MDAST_H_INCLUDED

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include "ast.h"
#include "errors.h"
#include "format.h"
#include "html_writer.h"
#include "latex_writer.h"
#include "markdown.h"
#include "native.h"
#include "options.h"
#include "typst_writer.h"

namespace mdast {

// Picks a reader and a writer by format name. Readers are "markdown" (or
// "gfm") and "native"; writers are "html", "latex", "native" and "typst".
// Unknown names raise UnknownFormat.
class Converter: private boost::noncopyable {
public:
    Converter(const string& from, const string& to,
              const ReaderOptions& readerOptions=ReaderOptions(),
              const WriterOptions& writerOptions=WriterOptions(),
              SyntaxHighlighter *highlighter=0);

    Document read(const string& text);
    Document read(std::istream& in);
    void write(const Document& doc, std::ostream& out);

    // Reads all of `in` and writes it to `out`.
    void convert(std::istream& in, std::ostream& out);
    string convert(const string& text);

    static std::vector<string> readers();
    static std::vector<string> writers();

    static std::unique_ptr<Reader> makeReader(const string& name,
            const ReaderOptions& options=ReaderOptions());
    static std::unique_ptr<Writer> makeWriter(const string& name,
            const WriterOptions& options=WriterOptions(),
            SyntaxHighlighter *highlighter=0);

private:
    std::unique_ptr<Reader> mReader;
    std::unique_ptr<Writer> mWriter;
};

} // namespace mdast

#endif
