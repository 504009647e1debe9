/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_HTML_WRITER_H_INCLUDED
#define MDAST_HTML_WRITER_H_INCLUDED

#include <iostream>
#include <string>

#include "format.h"
#include "options.h"

namespace mdast {

// Writes the body of a code block that names a language. The default
// writes the code HTML-escaped, with no highlighting at all.
class SyntaxHighlighter {
public:
    SyntaxHighlighter() { }
    virtual ~SyntaxHighlighter() { }
    virtual void highlight(const string& code, const string& lang, std::ostream& out);
};

enum EncodingFlags { cAmps=0x01, cDoubleAmps=0x02, cAngles=0x04, cQuotes=0x08 };

// With cAmps, ampersands that already start a character reference are left
// alone; cDoubleAmps escapes every one.
string encodeString(const string& src, int encodingFlags);

class HtmlWriter: public Writer {
public:
    explicit HtmlWriter(const WriterOptions& options=WriterOptions(),
                        SyntaxHighlighter *highlighter=0);

    using Writer::write;
    void write(const Document& doc, std::ostream& out) override;

private:
    WriterOptions mOptions;
    SyntaxHighlighter *mHighlighter;
};

} // namespace mdast

#endif
