/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "mdast.h"

#include <sstream>

#include <spdlog/spdlog.h>

namespace mdast {

Converter::Converter(const string& from, const string& to,
                     const ReaderOptions& readerOptions,
                     const WriterOptions& writerOptions,
                     SyntaxHighlighter *highlighter)
    : mReader(makeReader(from, readerOptions)),
      mWriter(makeWriter(to, writerOptions, highlighter))
{
    spdlog::debug("converting {} to {}", from, to);
}

Document Converter::read(const string& text) {
    return mReader->read(text);
}

Document Converter::read(std::istream& in) {
    return mReader->read(in);
}

void Converter::write(const Document& doc, std::ostream& out) {
    mWriter->write(doc, out);
}

void Converter::convert(std::istream& in, std::ostream& out) {
    write(read(in), out);
}

string Converter::convert(const string& text) {
    std::ostringstream out;
    write(read(text), out);
    return out.str();
}

std::vector<string> Converter::readers() {
    std::vector<string> r;
    r.push_back("gfm");
    r.push_back("markdown");
    r.push_back("native");
    return r;
}

std::vector<string> Converter::writers() {
    std::vector<string> r;
    r.push_back("html");
    r.push_back("latex");
    r.push_back("native");
    r.push_back("typst");
    return r;
}

std::unique_ptr<Reader> Converter::makeReader(const string& name,
        const ReaderOptions& options)
{
    if (name=="markdown" || name=="gfm") {
        return std::unique_ptr<Reader>(new MarkdownReader(options));
    } else if (name=="native") {
        return std::unique_ptr<Reader>(new NativeReader());
    }
    throw UnknownFormat(name);
}

std::unique_ptr<Writer> Converter::makeWriter(const string& name,
        const WriterOptions& options, SyntaxHighlighter *highlighter)
{
    if (name=="html") {
        return std::unique_ptr<Writer>(new HtmlWriter(options, highlighter));
    } else if (name=="latex") {
        return std::unique_ptr<Writer>(new LatexWriter(options));
    } else if (name=="native") {
        return std::unique_ptr<Writer>(new NativeWriter());
    } else if (name=="typst") {
        return std::unique_ptr<Writer>(new TypstWriter(options));
    }
    throw UnknownFormat(name);
}

} // namespace mdast
