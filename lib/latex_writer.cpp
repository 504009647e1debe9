/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "latex_writer.h"
#include "errors.h"

namespace mdast {

namespace {

const char *cFormat="latex";
const int cMaxOrderedDepth=4;

const char *cPreamble=
    "\\documentclass{article}\n"
    "\\usepackage[T1]{fontenc}\n"
    "\\usepackage[utf8]{inputenc}\n"
    "\\usepackage{graphicx}\n"
    "\\usepackage{listings}\n"
    "\\usepackage[normalem]{ulem}\n"
    "\\usepackage{hyperref}\n"
    "\\providecommand{\\tightlist}{%\n"
    "  \\setlength{\\itemsep}{0pt}\\setlength{\\parskip}{0pt}}\n"
    "\\begin{document}\n";

// Only '%', '#' and backslashes need care inside \href and \includegraphics.
string escapeUrl(const string& src) {
    string tgt;
    for (auto i=src.cbegin(), ie=src.cend(); i!=ie; ++i) {
        if (*i=='%' || *i=='#' || *i=='\\') tgt.push_back('\\');
        tgt.push_back(*i);
    }
    return tgt;
}

class InlineWriter: public boost::static_visitor<> {
public:
    explicit InlineWriter(std::ostream& out): mOut(out) { }

    void operator()(const Str& s) const { mOut << escapeLatex(s.text); }
    void operator()(const Emph& e) const { _command("emph", e.content); }
    void operator()(const Strong& s) const { _command("textbf", s.content); }
    void operator()(const Strikeout& s) const { _command("sout", s.content); }
    void operator()(const Code& c) const { mOut << "\\texttt{" << escapeLatex(c.text) << '}'; }
    void operator()(const Space&) const { mOut << ' '; }
    void operator()(const SoftBreak&) const { mOut << '\n'; }
    void operator()(const LineBreak&) const { mOut << "\\\\\n"; }

    void operator()(const Link& l) const {
        mOut << "\\href{" << escapeUrl(l.target.url) << "}{";
        all(l.content);
        mOut << '}';
    }

    void operator()(const Image& i) const {
        mOut << "\\includegraphics{" << escapeUrl(i.target.url) << '}';
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
    void _command(const char *name, const Inlines& content) const {
        mOut << '\\' << name << '{';
        all(content);
        mOut << '}';
    }

    std::ostream& mOut;
};

class BlockWriter: public boost::static_visitor<> {
public:
    explicit BlockWriter(std::ostream& out): mOut(out), mInlines(out), mOrderedDepth(0) { }

    void operator()(const Plain& p) {
        mInlines.all(p.content);
        mOut << '\n';
    }

    void operator()(const Para& p) {
        mInlines.all(p.content);
        mOut << "\n\n";
    }

    void operator()(const Header& h) {
        static const char *cCommands[]={ "section", "subsection", "subsubsection",
                                         "paragraph", "subparagraph", "subparagraph" };
        int level=(h.level<1 ? 1 : h.level>6 ? 6 : h.level);
        mOut << '\\' << cCommands[level-1] << '{';
        mInlines.all(h.content);
        mOut << "}\n\n";
    }

    void operator()(const HorizontalRule&) {
        mOut << "\\begin{center}\\rule{0.5\\linewidth}{0.5pt}\\end{center}\n\n";
    }

    void operator()(const CodeBlock& c) {
        mOut << "\\begin{lstlisting}";
        if (!c.attr.classes.empty()) mOut << "[language=" << c.attr.classes.front() << ']';
        mOut << '\n' << c.text << "\n\\end{lstlisting}\n\n";
    }

    void operator()(const BlockQuote& q) {
        mOut << "\\begin{quote}\n";
        all(q.content);
        mOut << "\\end{quote}\n\n";
    }

    void operator()(const BulletList& l) {
        mOut << "\\begin{itemize}\n";
        _items(l.items);
        mOut << "\\end{itemize}\n\n";
    }

    void operator()(const OrderedList& l) {
        if (mOrderedDepth>=cMaxOrderedDepth)
            throw UnsupportedConstruct(cFormat, "OrderedList nested more than four deep");

        static const char *cCounters[]={ "enumi", "enumii", "enumiii", "enumiv" };
        const char *counter=cCounters[mOrderedDepth];
        ++mOrderedDepth;
        mOut << "\\begin{enumerate}\n";
        if (l.attributes.start!=1)
            mOut << "\\setcounter{" << counter << "}{" << l.attributes.start-1 << "}\n";
        _items(l.items);
        mOut << "\\end{enumerate}\n\n";
        --mOrderedDepth;
    }

    void operator()(const Table& t) {
        mOut << "\\begin{tabular}{";
        for (auto c=t.colSpecs.cbegin(), ce=t.colSpecs.cend(); c!=ce; ++c) {
            if (c->alignment==cAlignCenter) mOut << 'c';
            else if (c->alignment==cAlignRight) mOut << 'r';
            else mOut << 'l';
        }
        mOut << "}\n";

        _rows(t.head.rows);
        if (!t.head.rows.empty()) mOut << "\\hline\n";
        for (auto b=t.bodies.cbegin(), be=t.bodies.cend(); b!=be; ++b) _rows(b->body);
        mOut << "\\end{tabular}\n\n";
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
    void _items(const std::vector<Blocks>& items) {
        // Tight lists come out of the reader with Plain items.
        bool tight=true;
        for (auto i=items.cbegin(), ie=items.cend(); i!=ie; ++i)
            if (!i->empty() && boost::get<Para>(&i->front())) tight=false;
        if (tight) mOut << "\\tightlist\n";

        for (auto i=items.cbegin(), ie=items.cend(); i!=ie; ++i) {
            mOut << "\\item";
            if (!i->empty()) mOut << ' ';
            else mOut << '\n';
            all(*i);
        }
    }

    void _rows(const std::vector<Row>& rows) {
        for (auto r=rows.cbegin(), re=rows.cend(); r!=re; ++r) {
            for (auto c=r->cells.cbegin(), ce=r->cells.cend(); c!=ce; ++c) {
                if (c!=r->cells.cbegin()) mOut << " & ";
                for (auto b=c->content.cbegin(), be=c->content.cend(); b!=be; ++b) {
                    if (const Plain *p=boost::get<Plain>(&*b)) mInlines.all(p->content);
                    else throw UnsupportedConstruct(cFormat, "table cell with block content");
                }
            }
            mOut << " \\\\\n";
        }
    }

    std::ostream& mOut;
    InlineWriter mInlines;
    int mOrderedDepth;
};

} // namespace

string escapeLatex(const string& src) {
    string tgt;
    for (auto i=src.cbegin(), ie=src.cend(); i!=ie; ++i) {
        switch (*i) {
            case '{': tgt+="\\{"; break;
            case '}': tgt+="\\}"; break;
            case '\\': tgt+="\\textbackslash{}"; break;
            case '#': tgt+="\\#"; break;
            case '$': tgt+="\\$"; break;
            case '%': tgt+="\\%"; break;
            case '&': tgt+="\\&"; break;
            case '_': tgt+="\\_"; break;
            case '~': tgt+="\\textasciitilde{}"; break;
            case '^': tgt+="\\textasciicircum{}"; break;
            case '<': tgt+="\\textless{}"; break;
            case '>': tgt+="\\textgreater{}"; break;
            default: tgt.push_back(*i);
        }
    }
    return tgt;
}

LatexWriter::LatexWriter(const WriterOptions& options): mOptions(options) {
}

void LatexWriter::write(const Document& doc, std::ostream& out) {
    if (mOptions.standalone) out << cPreamble;

    BlockWriter writer(out);
    writer.all(doc.blocks);

    if (mOptions.standalone) out << "\\end{document}\n";
}

} // namespace mdast
