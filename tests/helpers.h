/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_TESTS_HELPERS_H_INCLUDED
#define MDAST_TESTS_HELPERS_H_INCLUDED

#include <string>

#include "mdast.h"

namespace test {

using std::string;

// The native form of a block list, without the Pandoc/Meta wrapper, which
// keeps expected values short and failures readable.
inline string native(const mdast::Blocks& blocks) {
    static const string cPrefix="Pandoc (Meta {unMeta = fromList []}) ";
    mdast::Document doc;
    doc.blocks=blocks;
    mdast::NativeWriter writer;
    string r=writer.write(doc);
    if (r.compare(0, cPrefix.size(), cPrefix)==0) r.erase(0, cPrefix.size());
    if (!r.empty() && r[r.size()-1]=='\n') r.erase(r.size()-1);
    return r;
}

inline mdast::Blocks parse(const string& text,
                           const mdast::ReaderOptions& options=mdast::ReaderOptions())
{
    mdast::MarkdownReader reader(options);
    return reader.read(text).blocks;
}

inline string md(const string& text,
                 const mdast::ReaderOptions& options=mdast::ReaderOptions())
{
    return native(parse(text, options));
}

inline string html(const string& text) {
    mdast::HtmlWriter writer;
    mdast::MarkdownReader reader;
    return writer.write(reader.read(text));
}

inline string cellText(const mdast::Cell& cell) {
    string r;
    for (auto i=cell.content.cbegin(), ie=cell.content.cend(); i!=ie; ++i)
        if (const mdast::Plain *p=boost::get<mdast::Plain>(&*i)) r+=mdast::stringify(p->content);
    return r;
}

inline mdast::Inline str(const string& text) {
    mdast::Str s;
    s.text=text;
    return s;
}

} // namespace test

#endif
