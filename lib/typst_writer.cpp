/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "typst_writer.h"
#include "errors.h"

#include <algorithm>
#include <sstream>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace mdast {

namespace {

const char *cFormat="typst";

// A Typst string literal.
string quote(const string& src) {
    string tgt("\"");
    for (auto i=src.cbegin(), ie=src.cend(); i!=ie; ++i) {
        switch (*i) {
            case '\\': tgt+="\\\\"; break;
            case '"': tgt+="\\\""; break;
            case '\n': tgt+="\\n"; break;
            case '\r': tgt+="\\r"; break;
            case '\t': tgt+="\\t"; break;
            default: tgt.push_back(*i);
        }
    }
    tgt.push_back('"');
    return tgt;
}

size_t longestBacktickRun(const string& text) {
    size_t longest=0, run=0;
    for (auto i=text.cbegin(), ie=text.cend(); i!=ie; ++i) {
        if (*i=='`') longest=std::max(longest, ++run);
        else run=0;
    }
    return longest;
}

// Indents every non-empty line after the first.
string indentLines(const string& text, size_t width) {
    string tgt;
    for (size_t x=0; x<text.size(); ++x) {
        tgt.push_back(text[x]);
        if (text[x]=='\n' && x+1<text.size() && text[x+1]!='\n') tgt.append(width, ' ');
    }
    return tgt;
}

class InlineWriter: public boost::static_visitor<> {
public:
    explicit InlineWriter(std::ostream& out): mOut(out), mInEmph(false), mInStrong(false) { }

    void operator()(const Str& s) { mOut << escapeTypst(s.text); }
    void operator()(const Emph& e) { _markup('_', mInEmph, e.content); }
    void operator()(const Strong& s) { _markup('*', mInStrong, s.content); }

    void operator()(const Strikeout& s) {
        mOut << "#strike[";
        all(s.content);
        mOut << ']';
    }

    void operator()(const Code& c) {
        // Inline raw text can't hold a backtick.
        if (c.text.find('`')==string::npos) mOut << '`' << c.text << '`';
        else mOut << "#raw(" << quote(c.text) << ')';
    }

    void operator()(const Space&) { mOut << ' '; }
    void operator()(const SoftBreak&) { mOut << ' '; }
    void operator()(const LineBreak&) { mOut << "\\\n"; }

    void operator()(const Link& l) {
        mOut << "#link(" << quote(l.target.url) << ")[";
        all(l.content);
        mOut << ']';
    }

    void operator()(const Image& i) {
        mOut << "#box(image(" << quote(i.target.url);
        const string alt=stringify(i.content);
        if (!alt.empty()) mOut << ", alt: " << quote(alt);
        mOut << "))";
    }

    void operator()(const Underline&) { throw UnsupportedConstruct(cFormat, "Underline"); }
    void operator()(const Superscript&) { throw UnsupportedConstruct(cFormat, "Superscript"); }
    void operator()(const Subscript&) { throw UnsupportedConstruct(cFormat, "Subscript"); }
    void operator()(const SmallCaps&) { throw UnsupportedConstruct(cFormat, "SmallCaps"); }
    void operator()(const Quoted&) { throw UnsupportedConstruct(cFormat, "Quoted"); }
    void operator()(const Cite&) { throw UnsupportedConstruct(cFormat, "Cite"); }
    void operator()(const Math&) { throw UnsupportedConstruct(cFormat, "Math"); }
    void operator()(const RawInline&) { throw UnsupportedConstruct(cFormat, "RawInline"); }
    void operator()(const Note&) { throw UnsupportedConstruct(cFormat, "Note"); }
    void operator()(const Span&) { throw UnsupportedConstruct(cFormat, "Span"); }

    void all(const Inlines& content) {
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i)
            boost::apply_visitor(*this, *i);
    }

private:
    // Typst toggles on each delimiter, so emphasis inside emphasis is
    // written without one.
    void _markup(char delimiter, bool& inside, const Inlines& content) {
        if (inside) {
            all(content);
            return;
        }
        mOut << delimiter;
        inside=true;
        all(content);
        inside=false;
        mOut << delimiter;
    }

    std::ostream& mOut;
    bool mInEmph, mInStrong;
};

class BlockWriter: public boost::static_visitor<> {
public:
    explicit BlockWriter(std::ostream& out): mOut(out), mInlines(out) { }

    void operator()(const Plain& p) {
        mInlines.all(p.content);
        mOut << '\n';
    }

    void operator()(const Para& p) {
        mInlines.all(p.content);
        mOut << "\n\n";
    }

    void operator()(const Header& h) {
        int level=(h.level<1 ? 1 : h.level>6 ? 6 : h.level);
        mOut << string(level, '=') << ' ';
        mInlines.all(h.content);
        mOut << "\n\n";
    }

    void operator()(const HorizontalRule&) { mOut << "#line(length: 100%)\n\n"; }

    void operator()(const CodeBlock& c) {
        const string fence(std::max<size_t>(3, longestBacktickRun(c.text)+1), '`');
        mOut << fence;
        if (!c.attr.classes.empty()) mOut << c.attr.classes.front();
        mOut << '\n' << c.text << '\n' << fence << "\n\n";
    }

    void operator()(const BlockQuote& q) {
        mOut << "#quote(block: true)[\n";
        all(q.content);
        mOut << "]\n\n";
    }

    void operator()(const BulletList& l) { _items(l.items, 0, false); }
    void operator()(const OrderedList& l) { _items(l.items, l.attributes.start, true); }

    void operator()(const Table& t) {
        mOut << "#table(\n  columns: " << t.colSpecs.size() << ",\n  align: (";
        for (auto c=t.colSpecs.cbegin(), ce=t.colSpecs.cend(); c!=ce; ++c) {
            if (c!=t.colSpecs.cbegin()) mOut << ' ';
            if (c->alignment==cAlignLeft) mOut << "left,";
            else if (c->alignment==cAlignRight) mOut << "right,";
            else if (c->alignment==cAlignCenter) mOut << "center,";
            else mOut << "auto,";
        }
        mOut << "),\n";

        _rows(t.head.rows);
        for (auto b=t.bodies.cbegin(), be=t.bodies.cend(); b!=be; ++b) _rows(b->body);
        mOut << ")\n\n";
    }

    void operator()(const LineBlock&) { throw UnsupportedConstruct(cFormat, "LineBlock"); }
    void operator()(const RawBlock&) { throw UnsupportedConstruct(cFormat, "RawBlock"); }
    void operator()(const DefinitionList&) { throw UnsupportedConstruct(cFormat, "DefinitionList"); }
    void operator()(const Figure&) { throw UnsupportedConstruct(cFormat, "Figure"); }
    void operator()(const Div&) { throw UnsupportedConstruct(cFormat, "Div"); }

    void all(const Blocks& content) {
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i)
            boost::apply_visitor(*this, *i);
    }

private:
    // Item bodies are written on their own and then indented under the
    // marker, so nested blocks continue the item.
    void _items(const std::vector<Blocks>& items, int start, bool ordered) {
        bool tight=true;
        for (auto i=items.cbegin(), ie=items.cend(); i!=ie; ++i)
            if (!i->empty() && boost::get<Para>(&i->front())) tight=false;

        int number=start;
        for (auto i=items.cbegin(), ie=items.cend(); i!=ie; ++i) {
            const string marker=(ordered ? boost::lexical_cast<string>(number++) + "."
                                 : string("-"));
            std::ostringstream body;
            BlockWriter writer(body);
            writer.all(*i);
            string text=body.str();
            boost::algorithm::trim_right_if(text, boost::algorithm::is_any_of("\n"));

            mOut << marker;
            if (!text.empty()) mOut << ' ' << indentLines(text, marker.size()+1);
            mOut << (tight ? "\n" : "\n\n");
        }
        if (tight) mOut << '\n';
    }

    void _rows(const std::vector<Row>& rows) {
        for (auto r=rows.cbegin(), re=rows.cend(); r!=re; ++r) {
            mOut << ' ';
            for (auto c=r->cells.cbegin(), ce=r->cells.cend(); c!=ce; ++c) {
                mOut << " [";
                for (auto b=c->content.cbegin(), be=c->content.cend(); b!=be; ++b) {
                    if (const Plain *p=boost::get<Plain>(&*b)) mInlines.all(p->content);
                    else throw UnsupportedConstruct(cFormat, "table cell with block content");
                }
                mOut << "],";
            }
            mOut << '\n';
        }
    }

    std::ostream& mOut;
    InlineWriter mInlines;
};

} // namespace

string escapeTypst(const string& src) {
    string tgt;
    for (auto i=src.cbegin(), ie=src.cend(); i!=ie; ++i) {
        switch (*i) {
            case '\\': case '#': case '$': case '*': case '_': case '`':
            case '[': case ']': case '<': case '>': case '@': case '~':
            case '=': case '-': case '+': case '/':
                tgt.push_back('\\');
                break;
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                if (i==src.cbegin()) tgt.push_back('\\');
                break;
        }
        tgt.push_back(*i);
    }
    return tgt;
}

TypstWriter::TypstWriter(const WriterOptions& options): mOptions(options) {
}

void TypstWriter::write(const Document& doc, std::ostream& out) {
    if (mOptions.standalone) {
        const string title=documentTitle(doc.meta);
        if (!title.empty()) out << "#set document(title: " << quote(title) << ")\n\n";
    }

    BlockWriter writer(out);
    writer.all(doc.blocks);
}

} // namespace mdast
