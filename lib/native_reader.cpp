/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "native.h"
#include "chars.h"
#include "errors.h"

#include <cctype>
#include <iterator>

#include <boost/lexical_cast.hpp>

namespace mdast {

namespace {

// Recursive descent over the text `show` produces. Every value may be
// wrapped in redundant parentheses.
class NativeParser {
public:
    explicit NativeParser(const string& text): mText(text), mPos(0) { }

    Document document() {
        Document doc;
        _skipSpace();
        if (_peek()=='[') {
            doc.blocks=_blocks();
        } else {
            _keyword("Pandoc");
            _open();
            _keyword("Meta");
            _expect('{');
            _keyword("unMeta");
            _expect('=');
            doc.meta=_meta();
            _expect('}');
            _close();
            doc.blocks=_blocks();
        }
        _skipSpace();
        if (mPos!=mText.size()) _fail("trailing text");
        return doc;
    }

private:
    typedef std::vector<Blocks> BlockLists;

    // Parses "[a,b,...]" using `item` for each element.
    template <typename T>
    std::vector<T> _list(T (NativeParser::*item)()) {
        std::vector<T> r;
        _expect('[');
        if (_accept(']')) return r;
        do {
            r.push_back((this->*item)());
        } while (_accept(','));
        _expect(']');
        return r;
    }

    Meta _meta() {
        bool parens=_accept('(');
        _keyword("fromList");
        Meta r;
        _expect('[');
        if (!_accept(']')) {
            do {
                _expect('(');
                string key=_string();
                _expect(',');
                MetaValue value=_metaValue();
                _expect(')');
                r.insert(std::make_pair(key, value));
            } while (_accept(','));
            _expect(']');
        }
        if (parens) _expect(')');
        return r;
    }

    MetaValue _metaValue() {
        if (_accept('(')) {
            MetaValue r=_metaValue();
            _expect(')');
            return r;
        }

        size_t at=_position();
        string name=_word();
        if (name=="MetaMap") {
            MetaMap m;
            m.entries=_meta();
            return m;
        } else if (name=="MetaList") {
            MetaList m;
            m.items=_list(&NativeParser::_metaValue);
            return m;
        } else if (name=="MetaBool") {
            MetaBool m;
            m.value=_bool();
            return m;
        } else if (name=="MetaString") {
            MetaString m;
            m.text=_string();
            return m;
        } else if (name=="MetaInlines") {
            MetaInlines m;
            m.content=_inlines();
            return m;
        } else if (name=="MetaBlocks") {
            MetaBlocks m;
            m.content=_blocks();
            return m;
        }
        throw ReadError("unknown metadata constructor "+name, at);
    }

    Blocks _blocks() { return _list(&NativeParser::_block); }
    Inlines _inlines() { return _list(&NativeParser::_inline); }
    BlockLists _blockLists() { return _list(&NativeParser::_blocks); }
    Inlines _inlineList() { return _inlines(); }

    Block _block() {
        if (_accept('(')) {
            Block r=_block();
            _expect(')');
            return r;
        }

        size_t at=_position();
        string name=_word();
        if (name=="Plain") {
            Plain b;
            b.content=_inlines();
            return b;
        } else if (name=="Para") {
            Para b;
            b.content=_inlines();
            return b;
        } else if (name=="LineBlock") {
            LineBlock b;
            b.lines=_list(&NativeParser::_inlineList);
            return b;
        } else if (name=="CodeBlock") {
            CodeBlock b;
            b.attr=_attr();
            b.text=_string();
            return b;
        } else if (name=="RawBlock") {
            RawBlock b;
            b.format=_format();
            b.text=_string();
            return b;
        } else if (name=="BlockQuote") {
            BlockQuote b;
            b.content=_blocks();
            return b;
        } else if (name=="OrderedList") {
            OrderedList b;
            b.attributes=_listAttributes();
            b.items=_blockLists();
            return b;
        } else if (name=="BulletList") {
            BulletList b;
            b.items=_blockLists();
            return b;
        } else if (name=="DefinitionList") {
            DefinitionList b;
            b.items=_list(&NativeParser::_definitionItem);
            return b;
        } else if (name=="Header") {
            Header b;
            b.level=_int();
            b.attr=_attr();
            b.content=_inlines();
            return b;
        } else if (name=="HorizontalRule") {
            return HorizontalRule();
        } else if (name=="Table") {
            return _table();
        } else if (name=="Figure") {
            Figure b;
            b.attr=_attr();
            b.caption=_caption();
            b.content=_blocks();
            return b;
        } else if (name=="Div") {
            Div b;
            b.attr=_attr();
            b.content=_blocks();
            return b;
        }
        throw ReadError("unknown block constructor "+name, at);
    }

    Inline _inline() {
        if (_accept('(')) {
            Inline r=_inline();
            _expect(')');
            return r;
        }

        size_t at=_position();
        string name=_word();
        if (name=="Str") {
            Str i;
            i.text=_string();
            return i;
        } else if (name=="Emph") {
            Emph i;
            i.content=_inlines();
            return i;
        } else if (name=="Underline") {
            Underline i;
            i.content=_inlines();
            return i;
        } else if (name=="Strong") {
            Strong i;
            i.content=_inlines();
            return i;
        } else if (name=="Strikeout") {
            Strikeout i;
            i.content=_inlines();
            return i;
        } else if (name=="Superscript") {
            Superscript i;
            i.content=_inlines();
            return i;
        } else if (name=="Subscript") {
            Subscript i;
            i.content=_inlines();
            return i;
        } else if (name=="SmallCaps") {
            SmallCaps i;
            i.content=_inlines();
            return i;
        } else if (name=="Quoted") {
            Quoted i;
            string type=_word();
            if (type=="SingleQuote") i.type=cSingleQuote;
            else if (type=="DoubleQuote") i.type=cDoubleQuote;
            else throw ReadError("unknown quote type "+type, at);
            i.content=_inlines();
            return i;
        } else if (name=="Cite") {
            Cite i;
            i.citations=_list(&NativeParser::_citation);
            i.content=_inlines();
            return i;
        } else if (name=="Code") {
            Code i;
            i.attr=_attr();
            i.text=_string();
            return i;
        } else if (name=="Space") {
            return Space();
        } else if (name=="SoftBreak") {
            return SoftBreak();
        } else if (name=="LineBreak") {
            return LineBreak();
        } else if (name=="Math") {
            Math i;
            string type=_word();
            if (type=="DisplayMath") i.type=cDisplayMath;
            else if (type=="InlineMath") i.type=cInlineMath;
            else throw ReadError("unknown math type "+type, at);
            i.text=_string();
            return i;
        } else if (name=="RawInline") {
            RawInline i;
            i.format=_format();
            i.text=_string();
            return i;
        } else if (name=="Link") {
            Link i;
            i.attr=_attr();
            i.content=_inlines();
            i.target=_target();
            return i;
        } else if (name=="Image") {
            Image i;
            i.attr=_attr();
            i.content=_inlines();
            i.target=_target();
            return i;
        } else if (name=="Note") {
            Note i;
            i.content=_blocks();
            return i;
        } else if (name=="Span") {
            Span i;
            i.attr=_attr();
            i.content=_inlines();
            return i;
        }
        throw ReadError("unknown inline constructor "+name, at);
    }

    Block _table() {
        Table t;
        t.attr=_attr();
        t.caption=_caption();
        t.colSpecs=_list(&NativeParser::_colSpec);

        _open();
        _keyword("TableHead");
        t.head.attr=_attr();
        t.head.rows=_rows();
        _close();

        t.bodies=_list(&NativeParser::_tableBody);

        _open();
        _keyword("TableFoot");
        t.foot.attr=_attr();
        t.foot.rows=_rows();
        _close();
        return t;
    }

    ColSpec _colSpec() {
        _expect('(');
        ColSpec r;
        r.alignment=_alignment();
        _expect(',');
        bool parens=_accept('(');
        size_t at=_position();
        string name=_word();
        if (name=="ColWidth") r.width=ColWidth(_double());
        else if (name!="ColWidthDefault") throw ReadError("unknown column width "+name, at);
        if (parens) _expect(')');
        _expect(')');
        return r;
    }

    TableBody _tableBody() {
        bool parens=_accept('(');
        _keyword("TableBody");
        TableBody r;
        r.attr=_attr();
        r.rowHeadColumns=_wrappedInt("RowHeadColumns");
        r.head=_rows();
        r.body=_rows();
        if (parens) _expect(')');
        return r;
    }

    std::vector<Row> _rows() { return _list(&NativeParser::_row); }

    Row _row() {
        bool parens=_accept('(');
        _keyword("Row");
        Row r;
        r.attr=_attr();
        r.cells=_list(&NativeParser::_cell);
        if (parens) _expect(')');
        return r;
    }

    Cell _cell() {
        bool parens=_accept('(');
        _keyword("Cell");
        Cell r;
        r.attr=_attr();
        r.alignment=_alignment();
        r.rowSpan=_wrappedInt("RowSpan");
        r.colSpan=_wrappedInt("ColSpan");
        r.content=_blocks();
        if (parens) _expect(')');
        return r;
    }

    Caption _caption() {
        _open();
        _keyword("Caption");
        Caption r;
        bool parens=_accept('(');
        size_t at=_position();
        string name=_word();
        if (name=="Just") r.shortCaption=_inlines();
        else if (name!="Nothing") throw ReadError("expected Just or Nothing", at);
        if (parens) _expect(')');
        r.content=_blocks();
        _close();
        return r;
    }

    DefinitionItem _definitionItem() {
        _expect('(');
        DefinitionItem r;
        r.term=_inlines();
        _expect(',');
        r.definitions=_blockLists();
        _expect(')');
        return r;
    }

    Citation _citation() {
        bool parens=_accept('(');
        _keyword("Citation");
        _expect('{');
        Citation r;
        _field("citationId");
        r.id=_string();
        _expect(',');
        _field("citationPrefix");
        r.prefix=_inlines();
        _expect(',');
        _field("citationSuffix");
        r.suffix=_inlines();
        _expect(',');
        _field("citationMode");
        size_t at=_position();
        string mode=_word();
        if (mode=="AuthorInText") r.mode=cAuthorInText;
        else if (mode=="SuppressAuthor") r.mode=cSuppressAuthor;
        else if (mode=="NormalCitation") r.mode=cNormalCitation;
        else throw ReadError("unknown citation mode "+mode, at);
        _expect(',');
        _field("citationNoteNum");
        r.noteNum=_int();
        _expect(',');
        _field("citationHash");
        r.hash=_int();
        _expect('}');
        if (parens) _expect(')');
        return r;
    }

    Attr _attr() {
        _expect('(');
        Attr r;
        r.identifier=_string();
        _expect(',');
        r.classes=_list(&NativeParser::_string);
        _expect(',');
        r.attributes=_list(&NativeParser::_keyValue);
        _expect(')');
        return r;
    }

    std::pair<string, string> _keyValue() {
        _expect('(');
        string key=_string();
        _expect(',');
        string value=_string();
        _expect(')');
        return std::make_pair(key, value);
    }

    Target _target() {
        _expect('(');
        Target r;
        r.url=_string();
        _expect(',');
        r.title=_string();
        _expect(')');
        return r;
    }

    ListAttributes _listAttributes() {
        _expect('(');
        ListAttributes r;
        r.start=_int();
        _expect(',');

        size_t at=_position();
        string style=_word();
        if (style=="DefaultStyle") r.style=cDefaultStyle;
        else if (style=="Example") r.style=cExample;
        else if (style=="Decimal") r.style=cDecimal;
        else if (style=="LowerRoman") r.style=cLowerRoman;
        else if (style=="UpperRoman") r.style=cUpperRoman;
        else if (style=="LowerAlpha") r.style=cLowerAlpha;
        else if (style=="UpperAlpha") r.style=cUpperAlpha;
        else throw ReadError("unknown list number style "+style, at);
        _expect(',');

        at=_position();
        string delim=_word();
        if (delim=="DefaultDelim") r.delim=cDefaultDelim;
        else if (delim=="Period") r.delim=cPeriod;
        else if (delim=="OneParen") r.delim=cOneParen;
        else if (delim=="TwoParens") r.delim=cTwoParens;
        else throw ReadError("unknown list number delimiter "+delim, at);
        _expect(')');
        return r;
    }

    Alignment _alignment() {
        size_t at=_position();
        string name=_word();
        if (name=="AlignLeft") return cAlignLeft;
        if (name=="AlignRight") return cAlignRight;
        if (name=="AlignCenter") return cAlignCenter;
        if (name=="AlignDefault") return cAlignDefault;
        throw ReadError("unknown alignment "+name, at);
    }

    string _format() {
        _open();
        _keyword("Format");
        string r=_string();
        _close();
        return r;
    }

    // "(Name n)", as in (RowSpan 1).
    int _wrappedInt(const char *name) {
        _open();
        _keyword(name);
        int r=_int();
        _close();
        return r;
    }

    bool _bool() {
        size_t at=_position();
        string name=_word();
        if (name=="True") return true;
        if (name=="False") return false;
        throw ReadError("expected True or False", at);
    }

    int _int() {
        if (_accept('(')) {
            int r=_int();
            _expect(')');
            return r;
        }
        size_t at=_position();
        size_t end=mPos;
        if (end<mText.size() && mText[end]=='-') ++end;
        while (end<mText.size() && std::isdigit(static_cast<unsigned char>(mText[end]))) ++end;
        try {
            int r=boost::lexical_cast<int>(mText.substr(mPos, end-mPos));
            mPos=end;
            return r;
        } catch (boost::bad_lexical_cast&) {
            throw ReadError("expected a number", at);
        }
    }

    double _double() {
        size_t at=_position();
        size_t end=mText.find_first_not_of("0123456789.eE+-", mPos);
        if (end==string::npos) end=mText.size();
        try {
            double r=boost::lexical_cast<double>(mText.substr(mPos, end-mPos));
            mPos=end;
            return r;
        } catch (boost::bad_lexical_cast&) {
            throw ReadError("expected a number", at);
        }
    }

    string _string() {
        size_t at=_position();
        if (mPos>=mText.size() || mText[mPos]!='"') throw ReadError("expected a string", at);

        string r;
        size_t i=mPos+1;
        while (true) {
            if (i>=mText.size()) throw ReadError("unterminated string", at);
            char c=mText[i];
            if (c=='"') break;
            if (c!='\\') {
                r.push_back(c);
                ++i;
                continue;
            }

            if (++i>=mText.size()) throw ReadError("unterminated string", at);
            c=mText[i];
            switch (c) {
                case '"': r.push_back('"'); ++i; break;
                case '\\': r.push_back('\\'); ++i; break;
                case '\'': r.push_back('\''); ++i; break;
                case 'n': r.push_back('\n'); ++i; break;
                case 't': r.push_back('\t'); ++i; break;
                case 'r': r.push_back('\r'); ++i; break;
                case 'a': r.push_back('\a'); ++i; break;
                case 'b': r.push_back('\b'); ++i; break;
                case 'f': r.push_back('\f'); ++i; break;
                case 'v': r.push_back('\v'); ++i; break;
                case '&': ++i; break;
                case 'x':
                case 'o': {
                    const int base=(c=='x' ? 16 : 8);
                    const char *digits=(c=='x' ? "0123456789abcdefABCDEF" : "01234567");
                    size_t end=mText.find_first_not_of(digits, i+1);
                    if (end==string::npos) end=mText.size();
                    if (end==i+1) throw ReadError("malformed escape", i);
                    appendUtf8(r, _codepoint(mText.substr(i+1, end-i-1), base, i));
                    i=end;
                    break;
                }
                default:
                    if (std::isdigit(static_cast<unsigned char>(c))) {
                        size_t end=mText.find_first_not_of("0123456789", i);
                        if (end==string::npos) end=mText.size();
                        appendUtf8(r, _codepoint(mText.substr(i, end-i), 10, i));
                        i=end;
                    } else if (mText.compare(i, 3, "DEL")==0) {
                        r.push_back('\x7F');
                        i+=3;
                    } else if (mText.compare(i, 3, "NUL")==0) {
                        appendUtf8(r, cReplacementCharacter);
                        i+=3;
                    } else {
                        throw ReadError("unknown escape", i);
                    }
            }
        }
        mPos=i+1;
        return r;
    }

    uint32_t _codepoint(const string& digits, int base, size_t at) {
        unsigned long cp=0;
        for (auto d=digits.cbegin(), de=digits.cend(); d!=de; ++d) {
            int value=(*d>='a' ? *d-'a'+10 : *d>='A' ? *d-'A'+10 : *d-'0');
            cp=cp*base+value;
            if (cp>0x10FFFF) throw ReadError("character out of range", at);
        }
        if (cp==0) return cReplacementCharacter;
        return static_cast<uint32_t>(cp);
    }

    string _word() {
        _skipSpace();
        size_t end=mPos;
        while (end<mText.size() && std::isalnum(static_cast<unsigned char>(mText[end]))) ++end;
        if (end==mPos) _fail("expected a constructor");
        string r=mText.substr(mPos, end-mPos);
        mPos=end;
        return r;
    }

    void _keyword(const char *word) {
        size_t at=_position();
        if (_word()!=word) throw ReadError(string("expected ")+word, at);
    }

    void _field(const char *name) {
        _keyword(name);
        _expect('=');
    }

    void _open() { _expect('('); }
    void _close() { _expect(')'); }

    void _expect(char c) {
        if (!_accept(c)) _fail(string("expected '")+c+"'");
    }

    bool _accept(char c) {
        _skipSpace();
        if (mPos<mText.size() && mText[mPos]==c) {
            ++mPos;
            return true;
        }
        return false;
    }

    char _peek() {
        _skipSpace();
        return (mPos<mText.size() ? mText[mPos] : 0);
    }

    size_t _position() {
        _skipSpace();
        return mPos;
    }

    void _skipSpace() {
        while (mPos<mText.size() && std::isspace(static_cast<unsigned char>(mText[mPos]))) ++mPos;
    }

    void _fail(const string& message) {
        throw ReadError(message, mPos);
    }

    const string& mText;
    size_t mPos;
};

} // namespace

Document NativeReader::read(std::istream& in) {
    string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}

Document NativeReader::parse(const string& text) {
    NativeParser parser(text);
    return parser.document();
}

} // namespace mdast
