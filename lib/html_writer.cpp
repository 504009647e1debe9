/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "html_writer.h"
#include "errors.h"

#include <boost/regex.hpp>

using boost::regex;
using boost::regex_search;

namespace mdast {

namespace {

const char *cFormat="html";

class InlineWriter: public boost::static_visitor<> {
public:
    explicit InlineWriter(std::ostream& out): mOut(out) { }

    void operator()(const Str& s) const {
        mOut << encodeString(s.text, cDoubleAmps | cAngles | cQuotes);
    }
    void operator()(const Emph& e) const { _tag("em", e.content); }
    void operator()(const Strong& s) const { _tag("strong", s.content); }
    void operator()(const Strikeout& s) const { _tag("del", s.content); }

    void operator()(const Code& c) const {
        mOut << "<code>" << encodeString(c.text, cDoubleAmps | cAngles | cQuotes) << "</code>";
    }

    void operator()(const Space&) const { mOut << ' '; }
    void operator()(const SoftBreak&) const { mOut << '\n'; }
    void operator()(const LineBreak&) const { mOut << "<br />\n"; }

    void operator()(const Link& l) const {
        mOut << "<a href=\"" << encodeString(l.target.url, cDoubleAmps | cAngles | cQuotes) << '"';
        _title(l.target.title);
        mOut << '>';
        all(l.content);
        mOut << "</a>";
    }

    void operator()(const Image& i) const {
        mOut << "<img src=\"" << encodeString(i.target.url, cDoubleAmps | cAngles | cQuotes)
            << "\" alt=\"" << encodeString(stringify(i.content), cDoubleAmps | cAngles | cQuotes)
            << '"';
        _title(i.target.title);
        mOut << " />";
    }

    void operator()(const Underline&) const { throw UnsupportedConstruct(cFormat, "Underline"); }
    void operator()(const Superscript&) const { throw UnsupportedConstruct(cFormat, "Superscript"); }
    void operator()(const Subscript&) const { throw UnsupportedConstruct(cFormat, "Subscript"); }
    void operator()(const SmallCaps&) const { throw UnsupportedConstruct(cFormat, "SmallCaps"); }
    void operator()(const Quoted&) const { throw UnsupportedConstruct(cFormat, "Quoted"); }
    void operator()(const Cite&) const { throw UnsupportedConstruct(cFormat, "Cite"); }
    void operator()(const Math&) const { throw UnsupportedConstruct(cFormat, "Math"); }
    void operator()(const RawInline&) const { throw UnsupportedConstruct(cFormat, "RawInline"); }
    void operator()(const Note&) const { throw UnsupportedConstruct(cFormat, "Note"); }
    void operator()(const Span&) const { throw UnsupportedConstruct(cFormat, "Span"); }

    void all(const Inlines& content) const {
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i)
            boost::apply_visitor(*this, *i);
    }

private:
    void _tag(const char *tag, const Inlines& content) const {
        mOut << '<' << tag << '>';
        all(content);
        mOut << "</" << tag << '>';
    }

    void _title(const string& title) const {
        if (!title.empty())
            mOut << " title=\"" << encodeString(title, cDoubleAmps | cAngles | cQuotes) << '"';
    }

    std::ostream& mOut;
};

class BlockWriter: public boost::static_visitor<> {
public:
    BlockWriter(std::ostream& out, SyntaxHighlighter *highlighter)
        : mOut(out), mInlines(out), mHighlighter(highlighter) { }

    void operator()(const Plain& p) const {
        mInlines.all(p.content);
        mOut << '\n';
    }

    void operator()(const Para& p) const {
        mOut << "<p>";
        mInlines.all(p.content);
        mOut << "</p>\n";
    }

    void operator()(const Header& h) const {
        mOut << "<h" << h.level << '>';
        mInlines.all(h.content);
        mOut << "</h" << h.level << ">\n";
    }

    void operator()(const HorizontalRule&) const { mOut << "<hr />\n"; }

    void operator()(const CodeBlock& c) const {
        string text=c.text;
        if (!text.empty()) text.push_back('\n');

        if (c.attr.classes.empty()) {
            mOut << "<pre><code>" << encodeString(text, cDoubleAmps | cAngles | cQuotes);
        } else {
            const string& lang=c.attr.classes.front();
            mOut << "<pre><code class=\"language-"
                << encodeString(lang, cDoubleAmps | cAngles | cQuotes) << "\">";
            if (mHighlighter) mHighlighter->highlight(text, lang, mOut);
            else mOut << encodeString(text, cDoubleAmps | cAngles | cQuotes);
        }
        mOut << "</code></pre>\n";
    }

    void operator()(const BlockQuote& q) const {
        mOut << "<blockquote>\n";
        all(q.content);
        mOut << "</blockquote>\n";
    }

    void operator()(const BulletList& l) const {
        mOut << "<ul>\n";
        _items(l.items);
        mOut << "</ul>\n";
    }

    void operator()(const OrderedList& l) const {
        if (l.attributes.start==1) mOut << "<ol>\n";
        else mOut << "<ol start=\"" << l.attributes.start << "\">\n";
        _items(l.items);
        mOut << "</ol>\n";
    }

    void operator()(const Table& t) const {
        mOut << "<table>\n";
        if (!t.head.rows.empty()) {
            mOut << "<thead>\n";
            _rows(t.head.rows, "th", t.colSpecs);
            mOut << "</thead>\n";
        }
        for (auto b=t.bodies.cbegin(), be=t.bodies.cend(); b!=be; ++b) {
            if (b->body.empty()) continue;
            mOut << "<tbody>\n";
            _rows(b->body, "td", t.colSpecs);
            mOut << "</tbody>\n";
        }
        mOut << "</table>\n";
    }

    void operator()(const LineBlock&) const { throw UnsupportedConstruct(cFormat, "LineBlock"); }
    void operator()(const RawBlock&) const { throw UnsupportedConstruct(cFormat, "RawBlock"); }
    void operator()(const DefinitionList&) const {
        throw UnsupportedConstruct(cFormat, "DefinitionList");
    }
    void operator()(const Figure&) const { throw UnsupportedConstruct(cFormat, "Figure"); }
    void operator()(const Div&) const { throw UnsupportedConstruct(cFormat, "Div"); }

    void all(const Blocks& content) const {
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i)
            boost::apply_visitor(*this, *i);
    }

private:
    // Plain content sits directly inside the <li>; any other block starts on
    // a line of its own.
    void _items(const std::vector<Blocks>& items) const {
        for (auto i=items.cbegin(), ie=items.cend(); i!=ie; ++i) {
            mOut << "<li>";
            for (auto b=i->cbegin(), be=i->cend(); b!=be; ++b) {
                if (const Plain *p=boost::get<Plain>(&*b)) {
                    mInlines.all(p->content);
                    if (b+1!=be) mOut << '\n';
                } else {
                    if (b==i->cbegin()) mOut << '\n';
                    boost::apply_visitor(*this, *b);
                }
            }
            mOut << "</li>\n";
        }
    }

    void _rows(const std::vector<Row>& rows, const char *tag,
               const std::vector<ColSpec>& specs) const
    {
        for (auto r=rows.cbegin(), re=rows.cend(); r!=re; ++r) {
            mOut << "<tr>\n";
            size_t column=0;
            for (auto c=r->cells.cbegin(), ce=r->cells.cend(); c!=ce; ++c, ++column) {
                Alignment a=(column<specs.size() ? specs[column].alignment : cAlignDefault);
                mOut << '<' << tag;
                if (a==cAlignLeft) mOut << " style=\"text-align: left;\"";
                else if (a==cAlignRight) mOut << " style=\"text-align: right;\"";
                else if (a==cAlignCenter) mOut << " style=\"text-align: center;\"";
                mOut << '>';
                for (auto b=c->content.cbegin(), be=c->content.cend(); b!=be; ++b) {
                    if (const Plain *p=boost::get<Plain>(&*b)) mInlines.all(p->content);
                    else boost::apply_visitor(*this, *b);
                }
                mOut << "</" << tag << ">\n";
            }
            mOut << "</tr>\n";
        }
    }

    std::ostream& mOut;
    InlineWriter mInlines;
    SyntaxHighlighter *mHighlighter;
};

} // namespace

void SyntaxHighlighter::highlight(const string& code, const string&, std::ostream& out) {
    out << encodeString(code, cDoubleAmps | cAngles | cQuotes);
}

string encodeString(const string& src, int encodingFlags) {
    bool amps=(encodingFlags & cAmps)!=0,
         doubleAmps=(encodingFlags & cDoubleAmps)!=0,
         angleBrackets=(encodingFlags & cAngles)!=0,
         quotes=(encodingFlags & cQuotes)!=0;

    string tgt;
    for (auto i=src.cbegin(), ie=src.cend(); i!=ie; ++i) {
        if (*i=='&' && amps) {
            static const regex cIgnore("&(?:[A-Za-z][A-Za-z0-9]{1,31}|#[0-9]{1,7}|#[xX][0-9a-fA-F]{1,6});");
            if (regex_search(i, ie, cIgnore, boost::match_continuous)) {
                tgt.push_back(*i);
            } else {
                tgt+="&amp;";
            }
        }
        else if (*i=='&' && doubleAmps) tgt+="&amp;";
        else if (*i=='<' && angleBrackets) tgt+="&lt;";
        else if (*i=='>' && angleBrackets) tgt+="&gt;";
        else if (*i=='\"' && quotes) tgt+="&quot;";
        else tgt.push_back(*i);
    }
    return tgt;
}

HtmlWriter::HtmlWriter(const WriterOptions& options, SyntaxHighlighter *highlighter)
    : mOptions(options), mHighlighter(highlighter)
{
}

void HtmlWriter::write(const Document& doc, std::ostream& out) {
    if (mOptions.standalone) {
        out << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\" />\n<title>"
            << encodeString(documentTitle(doc.meta), cDoubleAmps | cAngles | cQuotes)
            << "</title>\n</head>\n<body>\n";
    }

    BlockWriter writer(out, mHighlighter);
    writer.all(doc.blocks);

    if (mOptions.standalone) out << "</body>\n</html>\n";
}

} // namespace mdast
