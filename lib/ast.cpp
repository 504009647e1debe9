/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "ast.h"

namespace mdast {

Block makeHeader(int level, const Inlines& content) {
    Header h;
    h.level=level;
    h.content=content;
    return h;
}

Block makeCodeBlock(const string& info, const string& text) {
    CodeBlock c;
    if (!info.empty()) c.attr.classes.push_back(info);
    c.text=text;
    return c;
}

ListAttributes makeListAttributes(int start, char closing) {
    ListAttributes r;
    r.start=start;
    r.style=cDecimal;
    r.delim=(closing==')' ? cOneParen : cPeriod);
    return r;
}

Cell makeCell(const Inlines& content) {
    Cell c;
    if (!content.empty()) {
        Plain p;
        p.content=content;
        c.content.push_back(p);
    }
    return c;
}

namespace {

Row makeRow(const std::vector<Inlines>& cells, size_t size) {
    Row r;
    for (size_t x=0; x<size; ++x)
        r.cells.push_back(x<cells.size() ? makeCell(cells[x]) : Cell());
    return r;
}

} // namespace

Block makeTable(const std::vector<std::vector<Inlines> >& rows,
                const std::vector<Alignment>& alignments)
{
    Table t;
    const size_t size=alignments.size();
    for (auto i=alignments.cbegin(), ie=alignments.cend(); i!=ie; ++i)
        t.colSpecs.push_back(ColSpec(*i, ColWidth()));

    auto ri=rows.cbegin(), rie=rows.cend();
    if (ri!=rie) {
        t.head.rows.push_back(makeRow(*ri, size));
        ++ri;
    }
    TableBody body;
    for (; ri!=rie; ++ri) body.body.push_back(makeRow(*ri, size));
    t.bodies.push_back(body);
    return t;
}

const char *alignmentName(Alignment a) {
    switch (a) {
        case cAlignLeft: return "AlignLeft";
        case cAlignRight: return "AlignRight";
        case cAlignCenter: return "AlignCenter";
        case cAlignDefault: return "AlignDefault";
    }
    return "AlignDefault";
}

namespace {

class Stringify: public boost::static_visitor<> {
public:
    explicit Stringify(string& tgt): mTgt(tgt) { }

    void operator()(const Str& s) const { mTgt+=s.text; }
    void operator()(const Code& c) const { mTgt+=c.text; }
    void operator()(const Math& m) const { mTgt+=m.text; }
    void operator()(const RawInline&) const { }
    void operator()(const Space&) const { mTgt.push_back(' '); }
    void operator()(const SoftBreak&) const { mTgt.push_back(' '); }
    void operator()(const LineBreak&) const { mTgt.push_back(' '); }
    void operator()(const Note&) const { }
    void operator()(const Cite& c) const { _all(c.content); }
    void operator()(const Quoted& q) const {
        const char *mark=(q.type==cSingleQuote ? "'" : "\"");
        mTgt+=mark;
        _all(q.content);
        mTgt+=mark;
    }

    // Everything else wraps a list of inlines.
    template <typename T>
    void operator()(const T& node) const { _all(node.content); }

private:
    void _all(const Inlines& content) const {
        for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i)
            boost::apply_visitor(*this, *i);
    }

    string& mTgt;
};

} // namespace

string stringify(const Inlines& content) {
    string r;
    Stringify visitor(r);
    for (auto i=content.cbegin(), ie=content.cend(); i!=ie; ++i)
        boost::apply_visitor(visitor, *i);
    return r;
}

string documentTitle(const Meta& meta) {
    Meta::const_iterator i=meta.find("title");
    if (i==meta.end()) return string();
    if (const MetaString *s=boost::get<MetaString>(&i->second)) return s->text;
    if (const MetaInlines *s=boost::get<MetaInlines>(&i->second)) return stringify(s->content);
    return string();
}

bool operator==(const Attr& a, const Attr& b) {
    return a.identifier==b.identifier && a.classes==b.classes
        && a.attributes==b.attributes;
}

bool operator==(const Target& a, const Target& b) {
    return a.url==b.url && a.title==b.title;
}

bool operator==(const ListAttributes& a, const ListAttributes& b) {
    return a.start==b.start && a.style==b.style && a.delim==b.delim;
}

bool operator==(const Str& a, const Str& b) { return a.text==b.text; }
bool operator==(const Space&, const Space&) { return true; }
bool operator==(const SoftBreak&, const SoftBreak&) { return true; }
bool operator==(const LineBreak&, const LineBreak&) { return true; }

bool operator==(const Code& a, const Code& b) {
    return a.attr==b.attr && a.text==b.text;
}

bool operator==(const Math& a, const Math& b) {
    return a.type==b.type && a.text==b.text;
}

bool operator==(const RawInline& a, const RawInline& b) {
    return a.format==b.format && a.text==b.text;
}

bool operator==(const Emph& a, const Emph& b) { return a.content==b.content; }
bool operator==(const Underline& a, const Underline& b) { return a.content==b.content; }
bool operator==(const Strong& a, const Strong& b) { return a.content==b.content; }
bool operator==(const Strikeout& a, const Strikeout& b) { return a.content==b.content; }
bool operator==(const Superscript& a, const Superscript& b) { return a.content==b.content; }
bool operator==(const Subscript& a, const Subscript& b) { return a.content==b.content; }
bool operator==(const SmallCaps& a, const SmallCaps& b) { return a.content==b.content; }

bool operator==(const Quoted& a, const Quoted& b) {
    return a.type==b.type && a.content==b.content;
}

bool operator==(const Citation& a, const Citation& b) {
    return a.id==b.id && a.prefix==b.prefix && a.suffix==b.suffix
        && a.mode==b.mode && a.noteNum==b.noteNum && a.hash==b.hash;
}

bool operator==(const Cite& a, const Cite& b) {
    return a.citations==b.citations && a.content==b.content;
}

bool operator==(const Link& a, const Link& b) {
    return a.attr==b.attr && a.content==b.content && a.target==b.target;
}

bool operator==(const Image& a, const Image& b) {
    return a.attr==b.attr && a.content==b.content && a.target==b.target;
}

bool operator==(const Note& a, const Note& b) { return a.content==b.content; }

bool operator==(const Span& a, const Span& b) {
    return a.attr==b.attr && a.content==b.content;
}

bool operator==(const Plain& a, const Plain& b) { return a.content==b.content; }
bool operator==(const Para& a, const Para& b) { return a.content==b.content; }
bool operator==(const LineBlock& a, const LineBlock& b) { return a.lines==b.lines; }

bool operator==(const CodeBlock& a, const CodeBlock& b) {
    return a.attr==b.attr && a.text==b.text;
}

bool operator==(const RawBlock& a, const RawBlock& b) {
    return a.format==b.format && a.text==b.text;
}

bool operator==(const Header& a, const Header& b) {
    return a.level==b.level && a.attr==b.attr && a.content==b.content;
}

bool operator==(const HorizontalRule&, const HorizontalRule&) { return true; }

bool operator==(const BlockQuote& a, const BlockQuote& b) { return a.content==b.content; }

bool operator==(const OrderedList& a, const OrderedList& b) {
    return a.attributes==b.attributes && a.items==b.items;
}

bool operator==(const BulletList& a, const BulletList& b) { return a.items==b.items; }

bool operator==(const DefinitionItem& a, const DefinitionItem& b) {
    return a.term==b.term && a.definitions==b.definitions;
}

bool operator==(const DefinitionList& a, const DefinitionList& b) { return a.items==b.items; }

bool operator==(const ColWidth& a, const ColWidth& b) {
    if (a.isDefault || b.isDefault) return a.isDefault==b.isDefault;
    return a.width==b.width;
}

bool operator==(const ColSpec& a, const ColSpec& b) {
    return a.alignment==b.alignment && a.width==b.width;
}

bool operator==(const Cell& a, const Cell& b) {
    return a.attr==b.attr && a.alignment==b.alignment && a.rowSpan==b.rowSpan
        && a.colSpan==b.colSpan && a.content==b.content;
}

bool operator==(const Row& a, const Row& b) {
    return a.attr==b.attr && a.cells==b.cells;
}

bool operator==(const TableHead& a, const TableHead& b) {
    return a.attr==b.attr && a.rows==b.rows;
}

bool operator==(const TableBody& a, const TableBody& b) {
    return a.attr==b.attr && a.rowHeadColumns==b.rowHeadColumns
        && a.head==b.head && a.body==b.body;
}

bool operator==(const TableFoot& a, const TableFoot& b) {
    return a.attr==b.attr && a.rows==b.rows;
}

bool operator==(const Caption& a, const Caption& b) {
    return a.shortCaption==b.shortCaption && a.content==b.content;
}

bool operator==(const Table& a, const Table& b) {
    return a.attr==b.attr && a.caption==b.caption && a.colSpecs==b.colSpecs
        && a.head==b.head && a.bodies==b.bodies && a.foot==b.foot;
}

bool operator==(const Figure& a, const Figure& b) {
    return a.attr==b.attr && a.caption==b.caption && a.content==b.content;
}

bool operator==(const Div& a, const Div& b) {
    return a.attr==b.attr && a.content==b.content;
}

bool operator==(const MetaMap& a, const MetaMap& b) { return a.entries==b.entries; }
bool operator==(const MetaList& a, const MetaList& b) { return a.items==b.items; }
bool operator==(const MetaBool& a, const MetaBool& b) { return a.value==b.value; }
bool operator==(const MetaString& a, const MetaString& b) { return a.text==b.text; }
bool operator==(const MetaInlines& a, const MetaInlines& b) { return a.content==b.content; }
bool operator==(const MetaBlocks& a, const MetaBlocks& b) { return a.content==b.content; }

bool operator==(const Document& a, const Document& b) {
    return a.meta==b.meta && a.blocks==b.blocks;
}

bool operator!=(const Document& a, const Document& b) {
    return !(a==b);
}

} // namespace mdast
