/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_AST_H_INCLUDED
#define MDAST_AST_H_INCLUDED

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace mdast {

using std::string;

// The document tree. Constructors and field order follow Pandoc's native
// representation, so a tree can be written out and read back unchanged.

struct Attr {
    string identifier;
    std::vector<string> classes;
    std::vector<std::pair<string, string> > attributes;

    bool empty() const {
        return identifier.empty() && classes.empty() && attributes.empty();
    }
};

// Destination and title.
struct Target {
    string url, title;
};

enum Alignment { cAlignLeft, cAlignRight, cAlignCenter, cAlignDefault };
enum ListNumberStyle { cDefaultStyle, cExample, cDecimal, cLowerRoman,
                       cUpperRoman, cLowerAlpha, cUpperAlpha };
enum ListNumberDelim { cDefaultDelim, cPeriod, cOneParen, cTwoParens };
enum QuoteType { cSingleQuote, cDoubleQuote };
enum MathType { cDisplayMath, cInlineMath };
enum CitationMode { cAuthorInText, cSuppressAuthor, cNormalCitation };

struct ListAttributes {
    int start;
    ListNumberStyle style;
    ListNumberDelim delim;
};

// --- Inlines ---------------------------------------------------------------

struct Str { string text; };
struct Space {};
struct SoftBreak {};
struct LineBreak {};
struct Code { Attr attr; string text; };
struct Math { MathType type; string text; };
struct RawInline { string format, text; };

struct Emph;
struct Underline;
struct Strong;
struct Strikeout;
struct Superscript;
struct Subscript;
struct SmallCaps;
struct Quoted;
struct Cite;
struct Link;
struct Image;
struct Note;
struct Span;

typedef boost::variant<
    Str,
    boost::recursive_wrapper<Emph>,
    boost::recursive_wrapper<Underline>,
    boost::recursive_wrapper<Strong>,
    boost::recursive_wrapper<Strikeout>,
    boost::recursive_wrapper<Superscript>,
    boost::recursive_wrapper<Subscript>,
    boost::recursive_wrapper<SmallCaps>,
    boost::recursive_wrapper<Quoted>,
    boost::recursive_wrapper<Cite>,
    Code,
    Space,
    SoftBreak,
    LineBreak,
    Math,
    RawInline,
    boost::recursive_wrapper<Link>,
    boost::recursive_wrapper<Image>,
    boost::recursive_wrapper<Note>,
    boost::recursive_wrapper<Span>
> Inline;

typedef std::vector<Inline> Inlines;

// --- Blocks ----------------------------------------------------------------

struct Plain { Inlines content; };
struct Para { Inlines content; };
struct LineBlock { std::vector<Inlines> lines; };
struct CodeBlock { Attr attr; string text; };
struct RawBlock { string format, text; };
struct Header { int level; Attr attr; Inlines content; };
struct HorizontalRule {};

struct BlockQuote;
struct OrderedList;
struct BulletList;
struct DefinitionList;
struct Table;
struct Figure;
struct Div;

typedef boost::variant<
    Plain,
    Para,
    LineBlock,
    CodeBlock,
    RawBlock,
    boost::recursive_wrapper<BlockQuote>,
    boost::recursive_wrapper<OrderedList>,
    boost::recursive_wrapper<BulletList>,
    boost::recursive_wrapper<DefinitionList>,
    Header,
    HorizontalRule,
    boost::recursive_wrapper<Table>,
    boost::recursive_wrapper<Figure>,
    boost::recursive_wrapper<Div>
> Block;

typedef std::vector<Block> Blocks;

// --- Recursive inline alternatives ------------------------------------------

struct Emph { Inlines content; };
struct Underline { Inlines content; };
struct Strong { Inlines content; };
struct Strikeout { Inlines content; };
struct Superscript { Inlines content; };
struct Subscript { Inlines content; };
struct SmallCaps { Inlines content; };
struct Quoted { QuoteType type; Inlines content; };

struct Citation {
    string id;
    Inlines prefix, suffix;
    CitationMode mode;
    int noteNum, hash;
};

struct Cite { std::vector<Citation> citations; Inlines content; };
struct Link { Attr attr; Inlines content; Target target; };
struct Image { Attr attr; Inlines content; Target target; };
struct Note { Blocks content; };
struct Span { Attr attr; Inlines content; };

// --- Recursive block alternatives -------------------------------------------

struct BlockQuote { Blocks content; };
struct OrderedList { ListAttributes attributes; std::vector<Blocks> items; };
struct BulletList { std::vector<Blocks> items; };

struct DefinitionItem {
    Inlines term;
    std::vector<Blocks> definitions;
};

struct DefinitionList { std::vector<DefinitionItem> items; };

// A ColWidth is either a fraction of the text width or the default.
struct ColWidth {
    ColWidth(): isDefault(true), width(0) { }
    explicit ColWidth(double w): isDefault(false), width(w) { }

    bool isDefault;
    double width;
};

struct ColSpec {
    ColSpec(): alignment(cAlignDefault) { }
    ColSpec(Alignment a, ColWidth w): alignment(a), width(w) { }

    Alignment alignment;
    ColWidth width;
};

struct Cell {
    Cell(): alignment(cAlignDefault), rowSpan(1), colSpan(1) { }

    Attr attr;
    Alignment alignment;
    int rowSpan, colSpan;
    Blocks content;
};

struct Row { Attr attr; std::vector<Cell> cells; };
struct TableHead { Attr attr; std::vector<Row> rows; };

struct TableBody {
    TableBody(): rowHeadColumns(0) { }

    Attr attr;
    int rowHeadColumns;
    std::vector<Row> head, body;
};

struct TableFoot { Attr attr; std::vector<Row> rows; };

struct Caption {
    boost::optional<Inlines> shortCaption;
    Blocks content;
};

struct Table {
    Attr attr;
    Caption caption;
    std::vector<ColSpec> colSpecs;
    TableHead head;
    std::vector<TableBody> bodies;
    TableFoot foot;
};

struct Figure { Attr attr; Caption caption; Blocks content; };
struct Div { Attr attr; Blocks content; };

// --- Metadata and document --------------------------------------------------

struct MetaMap;
struct MetaList;
struct MetaInlines;
struct MetaBlocks;
struct MetaBool { bool value; };
struct MetaString { string text; };

typedef boost::variant<
    boost::recursive_wrapper<MetaMap>,
    boost::recursive_wrapper<MetaList>,
    MetaBool,
    MetaString,
    boost::recursive_wrapper<MetaInlines>,
    boost::recursive_wrapper<MetaBlocks>
> MetaValue;

typedef std::map<string, MetaValue> Meta;

struct MetaMap { Meta entries; };
struct MetaList { std::vector<MetaValue> items; };
struct MetaInlines { Inlines content; };
struct MetaBlocks { Blocks content; };

struct Document {
    Meta meta;
    Blocks blocks;
};

// --- Construction helpers ---------------------------------------------------

Block makeHeader(int level, const Inlines& content);
Block makeCodeBlock(const string& info, const string& text);
ListAttributes makeListAttributes(int start, char closing);
Cell makeCell(const Inlines& content);

// Builds a table whose first row is the head and whose remaining rows form a
// single body. Rows are padded or truncated to the number of alignments.
Block makeTable(const std::vector<std::vector<Inlines> >& rows,
                const std::vector<Alignment>& alignments);

const char *alignmentName(Alignment a);

// The text of the inlines with all markup dropped, as used for image
// descriptions.
string stringify(const Inlines& content);

// The "title" metadata entry as plain text, or an empty string.
string documentTitle(const Meta& meta);

// --- Structural equality ----------------------------------------------------

bool operator==(const Attr& a, const Attr& b);
bool operator==(const Target& a, const Target& b);
bool operator==(const ListAttributes& a, const ListAttributes& b);

bool operator==(const Str& a, const Str& b);
bool operator==(const Space&, const Space&);
bool operator==(const SoftBreak&, const SoftBreak&);
bool operator==(const LineBreak&, const LineBreak&);
bool operator==(const Code& a, const Code& b);
bool operator==(const Math& a, const Math& b);
bool operator==(const RawInline& a, const RawInline& b);
bool operator==(const Emph& a, const Emph& b);
bool operator==(const Underline& a, const Underline& b);
bool operator==(const Strong& a, const Strong& b);
bool operator==(const Strikeout& a, const Strikeout& b);
bool operator==(const Superscript& a, const Superscript& b);
bool operator==(const Subscript& a, const Subscript& b);
bool operator==(const SmallCaps& a, const SmallCaps& b);
bool operator==(const Quoted& a, const Quoted& b);
bool operator==(const Citation& a, const Citation& b);
bool operator==(const Cite& a, const Cite& b);
bool operator==(const Link& a, const Link& b);
bool operator==(const Image& a, const Image& b);
bool operator==(const Note& a, const Note& b);
bool operator==(const Span& a, const Span& b);

bool operator==(const Plain& a, const Plain& b);
bool operator==(const Para& a, const Para& b);
bool operator==(const LineBlock& a, const LineBlock& b);
bool operator==(const CodeBlock& a, const CodeBlock& b);
bool operator==(const RawBlock& a, const RawBlock& b);
bool operator==(const Header& a, const Header& b);
bool operator==(const HorizontalRule&, const HorizontalRule&);
bool operator==(const BlockQuote& a, const BlockQuote& b);
bool operator==(const OrderedList& a, const OrderedList& b);
bool operator==(const BulletList& a, const BulletList& b);
bool operator==(const DefinitionItem& a, const DefinitionItem& b);
bool operator==(const DefinitionList& a, const DefinitionList& b);
bool operator==(const ColWidth& a, const ColWidth& b);
bool operator==(const ColSpec& a, const ColSpec& b);
bool operator==(const Cell& a, const Cell& b);
bool operator==(const Row& a, const Row& b);
bool operator==(const TableHead& a, const TableHead& b);
bool operator==(const TableBody& a, const TableBody& b);
bool operator==(const TableFoot& a, const TableFoot& b);
bool operator==(const Caption& a, const Caption& b);
bool operator==(const Table& a, const Table& b);
bool operator==(const Figure& a, const Figure& b);
bool operator==(const Div& a, const Div& b);

bool operator==(const MetaMap& a, const MetaMap& b);
bool operator==(const MetaList& a, const MetaList& b);
bool operator==(const MetaBool& a, const MetaBool& b);
bool operator==(const MetaString& a, const MetaString& b);
bool operator==(const MetaInlines& a, const MetaInlines& b);
bool operator==(const MetaBlocks& a, const MetaBlocks& b);

bool operator==(const Document& a, const Document& b);
bool operator!=(const Document& a, const Document& b);

} // namespace mdast

#endif
