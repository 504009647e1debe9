/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "native.h"

#include <boost/lexical_cast.hpp>

namespace mdast {

namespace {

// Negative numbers are parenthesized in constructor argument position.
string showArgument(int n) {
    string r=boost::lexical_cast<string>(n);
    return (n<0 ? "("+r+")" : r);
}

const char *styleName(ListNumberStyle s) {
    switch (s) {
        case cDefaultStyle: return "DefaultStyle";
        case cExample: return "Example";
        case cDecimal: return "Decimal";
        case cLowerRoman: return "LowerRoman";
        case cUpperRoman: return "UpperRoman";
        case cLowerAlpha: return "LowerAlpha";
        case cUpperAlpha: return "UpperAlpha";
    }
    return "DefaultStyle";
}

const char *delimName(ListNumberDelim d) {
    switch (d) {
        case cDefaultDelim: return "DefaultDelim";
        case cPeriod: return "Period";
        case cOneParen: return "OneParen";
        case cTwoParens: return "TwoParens";
    }
    return "DefaultDelim";
}

const char *citationModeName(CitationMode m) {
    switch (m) {
        case cAuthorInText: return "AuthorInText";
        case cSuppressAuthor: return "SuppressAuthor";
        case cNormalCitation: return "NormalCitation";
    }
    return "NormalCitation";
}

class Shower: public boost::static_visitor<> {
public:
    explicit Shower(std::ostream& out): mOut(out) { }

    void document(const Document& doc) {
        mOut << "Pandoc (Meta {unMeta = ";
        meta(doc.meta);
        mOut << "}) ";
        blocks(doc.blocks);
    }

    void meta(const Meta& m) {
        mOut << "fromList [";
        for (auto i=m.cbegin(), ie=m.cend(); i!=ie; ++i) {
            if (i!=m.cbegin()) mOut << ',';
            mOut << '(' << showString(i->first) << ',';
            boost::apply_visitor(*this, i->second);
            mOut << ')';
        }
        mOut << ']';
    }

    void operator()(const MetaMap& m) {
        mOut << "MetaMap (";
        meta(m.entries);
        mOut << ')';
    }

    void operator()(const MetaList& m) {
        mOut << "MetaList [";
        for (auto i=m.items.cbegin(), ie=m.items.cend(); i!=ie; ++i) {
            if (i!=m.items.cbegin()) mOut << ',';
            boost::apply_visitor(*this, *i);
        }
        mOut << ']';
    }

    void operator()(const MetaBool& m) { mOut << "MetaBool " << (m.value ? "True" : "False"); }
    void operator()(const MetaString& m) { mOut << "MetaString " << showString(m.text); }
    void operator()(const MetaInlines& m) { mOut << "MetaInlines "; inlines(m.content); }
    void operator()(const MetaBlocks& m) { mOut << "MetaBlocks "; blocks(m.content); }

    // Blocks

    void operator()(const Plain& b) { mOut << "Plain "; inlines(b.content); }
    void operator()(const Para& b) { mOut << "Para "; inlines(b.content); }

    void operator()(const LineBlock& b) {
        mOut << "LineBlock [";
        for (auto i=b.lines.cbegin(), ie=b.lines.cend(); i!=ie; ++i) {
            if (i!=b.lines.cbegin()) mOut << ',';
            inlines(*i);
        }
        mOut << ']';
    }

    void operator()(const CodeBlock& b) {
        mOut << "CodeBlock ";
        attr(b.attr);
        mOut << ' ' << showString(b.text);
    }

    void operator()(const RawBlock& b) {
        mOut << "RawBlock (Format " << showString(b.format) << ") " << showString(b.text);
    }

    void operator()(const BlockQuote& b) { mOut << "BlockQuote "; blocks(b.content); }

    void operator()(const OrderedList& b) {
        mOut << "OrderedList (" << b.attributes.start << ',' << styleName(b.attributes.style)
            << ',' << delimName(b.attributes.delim) << ") ";
        items(b.items);
    }

    void operator()(const BulletList& b) { mOut << "BulletList "; items(b.items); }

    void operator()(const DefinitionList& b) {
        mOut << "DefinitionList [";
        for (auto i=b.items.cbegin(), ie=b.items.cend(); i!=ie; ++i) {
            if (i!=b.items.cbegin()) mOut << ',';
            mOut << '(';
            inlines(i->term);
            mOut << ',';
            items(i->definitions);
            mOut << ')';
        }
        mOut << ']';
    }

    void operator()(const Header& b) {
        mOut << "Header " << showArgument(b.level) << ' ';
        attr(b.attr);
        mOut << ' ';
        inlines(b.content);
    }

    void operator()(const HorizontalRule&) { mOut << "HorizontalRule"; }

    void operator()(const Table& t) {
        mOut << "Table ";
        attr(t.attr);
        mOut << ' ';
        caption(t.caption);
        mOut << " [";
        for (auto i=t.colSpecs.cbegin(), ie=t.colSpecs.cend(); i!=ie; ++i) {
            if (i!=t.colSpecs.cbegin()) mOut << ',';
            mOut << '(' << alignmentName(i->alignment) << ',';
            if (i->width.isDefault) mOut << "ColWidthDefault";
            else mOut << "ColWidth " << boost::lexical_cast<string>(i->width.width);
            mOut << ')';
        }
        mOut << "] (TableHead ";
        attr(t.head.attr);
        mOut << ' ';
        rows(t.head.rows);
        mOut << ") [";
        for (auto i=t.bodies.cbegin(), ie=t.bodies.cend(); i!=ie; ++i) {
            if (i!=t.bodies.cbegin()) mOut << ',';
            mOut << "TableBody ";
            attr(i->attr);
            mOut << " (RowHeadColumns " << showArgument(i->rowHeadColumns) << ") ";
            rows(i->head);
            mOut << ' ';
            rows(i->body);
        }
        mOut << "] (TableFoot ";
        attr(t.foot.attr);
        mOut << ' ';
        rows(t.foot.rows);
        mOut << ')';
    }

    void operator()(const Figure& b) {
        mOut << "Figure ";
        attr(b.attr);
        mOut << ' ';
        caption(b.caption);
        mOut << ' ';
        blocks(b.content);
    }

    void operator()(const Div& b) {
        mOut << "Div ";
        attr(b.attr);
        mOut << ' ';
        blocks(b.content);
    }

    // Inlines

    void operator()(const Str& i) { mOut << "Str " << showString(i.text); }
    void operator()(const Emph& i) { _wrapper("Emph", i.content); }
    void operator()(const Underline& i) { _wrapper("Underline", i.content); }
    void operator()(const Strong& i) { _wrapper("Strong", i.content); }
    void operator()(const Strikeout& i) { _wrapper("Strikeout", i.content); }
    void operator()(const Superscript& i) { _wrapper("Superscript", i.content); }
    void operator()(const Subscript& i) { _wrapper("Subscript", i.content); }
    void operator()(const SmallCaps& i) { _wrapper("SmallCaps", i.content); }

    void operator()(const Quoted& i) {
        mOut << "Quoted " << (i.type==cSingleQuote ? "SingleQuote" : "DoubleQuote") << ' ';
        inlines(i.content);
    }

    void operator()(const Cite& i) {
        mOut << "Cite [";
        for (auto c=i.citations.cbegin(), ce=i.citations.cend(); c!=ce; ++c) {
            if (c!=i.citations.cbegin()) mOut << ',';
            mOut << "Citation {citationId = " << showString(c->id) << ", citationPrefix = ";
            inlines(c->prefix);
            mOut << ", citationSuffix = ";
            inlines(c->suffix);
            mOut << ", citationMode = " << citationModeName(c->mode)
                << ", citationNoteNum = " << c->noteNum
                << ", citationHash = " << c->hash << '}';
        }
        mOut << "] ";
        inlines(i.content);
    }

    void operator()(const Code& i) {
        mOut << "Code ";
        attr(i.attr);
        mOut << ' ' << showString(i.text);
    }

    void operator()(const Space&) { mOut << "Space"; }
    void operator()(const SoftBreak&) { mOut << "SoftBreak"; }
    void operator()(const LineBreak&) { mOut << "LineBreak"; }

    void operator()(const Math& i) {
        mOut << "Math " << (i.type==cDisplayMath ? "DisplayMath" : "InlineMath") << ' '
            << showString(i.text);
    }

    void operator()(const RawInline& i) {
        mOut << "RawInline (Format " << showString(i.format) << ") " << showString(i.text);
    }

    void operator()(const Link& i) { _linkLike("Link", i.attr, i.content, i.target); }
    void operator()(const Image& i) { _linkLike("Image", i.attr, i.content, i.target); }
    void operator()(const Note& i) { mOut << "Note "; blocks(i.content); }

    void operator()(const Span& i) {
        mOut << "Span ";
        attr(i.attr);
        mOut << ' ';
        inlines(i.content);
    }

    void blocks(const Blocks& content) {
        mOut << '[';
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i) {
            if (i!=content.cbegin()) mOut << ',';
            boost::apply_visitor(*this, *i);
        }
        mOut << ']';
    }

    void inlines(const Inlines& content) {
        mOut << '[';
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i) {
            if (i!=content.cbegin()) mOut << ',';
            boost::apply_visitor(*this, *i);
        }
        mOut << ']';
    }

private:
    void items(const std::vector<Blocks>& content) {
        mOut << '[';
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i) {
            if (i!=content.cbegin()) mOut << ',';
            blocks(*i);
        }
        mOut << ']';
    }

    void rows(const std::vector<Row>& content) {
        mOut << '[';
        for (auto r=content.cbegin(), re=content.cend(); r!=re; ++r) {
            if (r!=content.cbegin()) mOut << ',';
            mOut << "Row ";
            attr(r->attr);
            mOut << " [";
            for (auto c=r->cells.cbegin(), ce=r->cells.cend(); c!=ce; ++c) {
                if (c!=r->cells.cbegin()) mOut << ',';
                mOut << "Cell ";
                attr(c->attr);
                mOut << ' ' << alignmentName(c->alignment)
                    << " (RowSpan " << showArgument(c->rowSpan)
                    << ") (ColSpan " << showArgument(c->colSpan) << ") ";
                blocks(c->content);
            }
            mOut << ']';
        }
        mOut << ']';
    }

    void caption(const Caption& c) {
        mOut << "(Caption ";
        if (c.shortCaption) {
            mOut << "(Just ";
            inlines(*c.shortCaption);
            mOut << ')';
        } else {
            mOut << "Nothing";
        }
        mOut << ' ';
        blocks(c.content);
        mOut << ')';
    }

    void attr(const Attr& a) {
        mOut << '(' << showString(a.identifier) << ",[";
        for (auto i=a.classes.cbegin(), ie=a.classes.cend(); i!=ie; ++i) {
            if (i!=a.classes.cbegin()) mOut << ',';
            mOut << showString(*i);
        }
        mOut << "],[";
        for (auto i=a.attributes.cbegin(), ie=a.attributes.cend(); i!=ie; ++i) {
            if (i!=a.attributes.cbegin()) mOut << ',';
            mOut << '(' << showString(i->first) << ',' << showString(i->second) << ')';
        }
        mOut << "])";
    }

    void _wrapper(const char *name, const Inlines& content) {
        mOut << name << ' ';
        inlines(content);
    }

    void _linkLike(const char *name, const Attr& a, const Inlines& content,
                   const Target& target)
    {
        mOut << name << ' ';
        attr(a);
        mOut << ' ';
        inlines(content);
        mOut << " (" << showString(target.url) << ',' << showString(target.title) << ')';
    }

    std::ostream& mOut;
};

} // namespace

string showString(const string& str) {
    string r("\"");
    for (size_t x=0; x<str.size(); ++x) {
        unsigned char c=static_cast<unsigned char>(str[x]);
        switch (c) {
            case '"': r+="\\\""; break;
            case '\\': r+="\\\\"; break;
            case '\n': r+="\\n"; break;
            case '\t': r+="\\t"; break;
            default:
                if (c<0x20 || c==0x7F) {
                    r+="\\"+boost::lexical_cast<string>(static_cast<int>(c));
                    // Keeps a following digit out of the escape.
                    if (x+1<str.size() && str[x+1]>='0' && str[x+1]<='9') r+="\\&";
                } else {
                    r.push_back(static_cast<char>(c));
                }
        }
    }
    r.push_back('"');
    return r;
}

void NativeWriter::write(const Document& doc, std::ostream& out) {
    Shower shower(out);
    shower.document(doc);
    out << '\n';
}

} // namespace mdast
