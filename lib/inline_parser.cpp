/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "inline_parser.h"
#include "chars.h"
#include "entities.h"

#include <map>
#include <vector>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

using boost::regex;
using boost::regex_match;

namespace mdast {

namespace {

const size_t cMaxLabelLength=999;

// A run of '*', '_' or '~' still on the delimiter stack. The run shrinks
// from its inner side as emphasis consumes it: an opener gives up characters
// at `end`, a closer at `start`.
struct Delimiter {
    size_t start, end;
    char ch;
    size_t originalLength;
    bool canOpen, canClose, removed;

    size_t length() const { return end-start; }
};

// An unmatched "[" or "![".
struct Bracket {
    size_t pos, end;
    bool image, active;
    size_t delimiterBottom;
};

void appendInline(Inlines& tgt, const Inline& node) {
    if (const Str *s=boost::get<Str>(&node)) {
        if (!tgt.empty()) {
            if (Str *last=boost::get<Str>(&tgt.back())) {
                last->text+=s->text;
                return;
            }
        }
    }
    tgt.push_back(node);
}

Str makeStr(const string& text) {
    Str s;
    s.text=text;
    return s;
}

bool looksLikeUri(const string& str) {
    static const regex cExpression("[A-Za-z][A-Za-z0-9+.-]{1,31}:[^\\s<>]*");
    return regex_match(str, cExpression);
}

bool looksLikeEmailAddress(const string& str) {
    static const regex cExpression("[a-zA-Z0-9.!#$%&'*+/=?^_`{|}~-]+"
        "@[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?"
        "(?:\\.[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*");
    return regex_match(str, cExpression);
}

// One run of the resolver over one block's text. Finished pieces are kept
// in a map keyed by their source offset, so wrapping a range into a node is
// a matter of collecting the keys between two offsets.
class Resolver {
public:
    Resolver(const string& text, const LinkIds& ids, const ReaderOptions& options)
        : mText(text), mIdTable(ids), mOptions(options) { }

    Inlines run();

private:
    typedef std::map<size_t, Inline> Pieces;

    size_t _escape(size_t pos);
    size_t _entity(size_t pos);
    size_t _codeSpan(size_t pos);
    size_t _delimiterRun(size_t pos);
    size_t _whitespace(size_t pos);
    size_t _openBracket(size_t pos, bool image);
    size_t _closeBracket(size_t pos);
    size_t _autolink(size_t pos);
    size_t _text(size_t pos);
    size_t _skipLineStart(size_t pos) const;

    bool _inlineTarget(size_t pos, Target& target, size_t& after) const;
    bool _referenceTarget(const Bracket& opener, size_t pos, Target& target,
                          size_t& after) const;

    void _processEmphasis(size_t bottom);
    bool _oddMatch(const Delimiter& opener, const Delimiter& closer) const;
    void _match(size_t opener, size_t closer);
    void _literalize(Delimiter& d);
    Inlines _takeRange(size_t from, size_t to);

    const string& mText;
    const LinkIds& mIdTable;
    const ReaderOptions& mOptions;

    Pieces mPieces;
    std::vector<Delimiter> mDelimiters;
    std::vector<Bracket> mBrackets;
};

Inlines Resolver::run() {
    size_t pos=0;
    const size_t end=mText.size();
    while (pos<end) {
        char c=mText[pos];
        switch (c) {
            case '\\': pos=_escape(pos); break;
            case '&': pos=_entity(pos); break;
            case '`': pos=_codeSpan(pos); break;
            case '*':
            case '_': pos=_delimiterRun(pos); break;
            case '~':
                if (mOptions.strikethrough) pos=_delimiterRun(pos);
                else pos=_text(pos);
                break;
            case ' ':
            case '\t':
            case '\n': pos=_whitespace(pos); break;
            case '[': pos=_openBracket(pos, false); break;
            case '!':
                if (pos+1<end && mText[pos+1]=='[') pos=_openBracket(pos, true);
                else pos=_text(pos);
                break;
            case ']': pos=_closeBracket(pos); break;
            case '<':
                if (mOptions.autolinks) pos=_autolink(pos);
                else pos=_text(pos);
                break;
            default: pos=_text(pos);
        }
    }

    _processEmphasis(0);
    return _takeRange(0, end);
}

size_t Resolver::_escape(size_t pos) {
    if (pos+1<mText.size()) {
        char next=mText[pos+1];
        if (next=='\n') {
            mPieces[pos]=LineBreak();
            return _skipLineStart(pos+2);
        }
        if (isAsciiPunctuation(next)) {
            mPieces[pos]=makeStr(string(1, next));
            return pos+2;
        }
    }
    mPieces[pos]=makeStr("\\");
    return pos+1;
}

size_t Resolver::_entity(size_t pos) {
    string decoded;
    size_t used=decodeEntity(mText, pos, decoded);
    if (used==0) {
        mPieces[pos]=makeStr("&");
        return pos+1;
    }
    mPieces[pos]=makeStr(decoded);
    return pos+used;
}

size_t Resolver::_codeSpan(size_t pos) {
    const size_t end=mText.size();
    size_t open=mText.find_first_not_of('`', pos);
    if (open==string::npos) open=end;
    const size_t length=open-pos;

    size_t i=open;
    while (i<end) {
        size_t run=mText.find('`', i);
        if (run==string::npos) break;
        size_t runEnd=mText.find_first_not_of('`', run);
        if (runEnd==string::npos) runEnd=end;
        if (runEnd-run==length) {
            string content=mText.substr(open, run-open);
            for (auto c=content.begin(), ce=content.end(); c!=ce; ++c)
                if (*c=='\n') *c=' ';
            if (content.size()>=2 && content[0]==' ' && content[content.size()-1]==' '
                && content.find_first_not_of(' ')!=string::npos)
            {
                content=content.substr(1, content.size()-2);
            }
            Code code;
            code.text=content;
            mPieces[pos]=code;
            return runEnd;
        }
        i=runEnd;
    }

    // No closing run of the same length; the backticks are literal.
    mPieces[pos]=makeStr(mText.substr(pos, length));
    return open;
}

size_t Resolver::_delimiterRun(size_t pos) {
    const char c=mText[pos];
    size_t end=mText.find_first_not_of(c, pos);
    if (end==string::npos) end=mText.size();

    uint32_t before=codepointBefore(mText, pos), after=codepointAt(mText, end);
    bool beforeSpace=isUnicodeWhitespace(before), afterSpace=isUnicodeWhitespace(after);
    bool beforePunct=isUnicodePunctuation(before), afterPunct=isUnicodePunctuation(after);

    bool left=!afterSpace && (!afterPunct || beforeSpace || beforePunct);
    bool right=!beforeSpace && (!beforePunct || afterSpace || afterPunct);

    Delimiter d;
    d.start=pos;
    d.end=end;
    d.ch=c;
    d.originalLength=end-pos;
    d.removed=false;
    if (c=='_') {
        d.canOpen=left && (!right || beforePunct);
        d.canClose=right && (!left || afterPunct);
    } else {
        d.canOpen=left;
        d.canClose=right;
    }
    mDelimiters.push_back(d);
    return end;
}

size_t Resolver::_whitespace(size_t pos) {
    const size_t end=mText.size();
    size_t i=pos, spaces=0;
    for (; i<end && isSpaceOrTab(mText[i]); ++i)
        if (mText[i]==' ') ++spaces;

    if (i<end && mText[i]=='\n') {
        if (spaces>=2) mPieces[pos]=LineBreak();
        else mPieces[pos]=SoftBreak();
        return _skipLineStart(i+1);
    }
    if (i<end) mPieces[pos]=Space();
    return i;
}

size_t Resolver::_skipLineStart(size_t pos) const {
    while (pos<mText.size() && isSpaceOrTab(mText[pos])) ++pos;
    return pos;
}

size_t Resolver::_openBracket(size_t pos, bool image) {
    Bracket b;
    b.pos=pos;
    b.end=pos+(image ? 2 : 1);
    b.image=image;
    b.active=true;
    b.delimiterBottom=mDelimiters.size();
    mBrackets.push_back(b);
    mPieces[pos]=makeStr(image ? "![" : "[");
    return b.end;
}

size_t Resolver::_closeBracket(size_t pos) {
    if (mBrackets.empty()) {
        mPieces[pos]=makeStr("]");
        return pos+1;
    }

    const Bracket opener=mBrackets.back();
    mBrackets.pop_back();
    if (!opener.active) {
        mPieces[pos]=makeStr("]");
        return pos+1;
    }

    Target target;
    size_t after=0;
    if (!_inlineTarget(pos+1, target, after)
        && !_referenceTarget(opener, pos, target, after))
    {
        mPieces[pos]=makeStr("]");
        return pos+1;
    }

    _processEmphasis(opener.delimiterBottom);
    Inlines content=_takeRange(opener.end, pos);
    mPieces.erase(opener.pos);

    if (opener.image) {
        Image image;
        image.content=content;
        image.target=target;
        mPieces[opener.pos]=image;
    } else {
        Link link;
        link.content=content;
        link.target=target;
        mPieces[opener.pos]=link;

        // Links may not contain other links.
        for (auto i=mBrackets.begin(), ie=mBrackets.end(); i!=ie; ++i)
            if (!i->image) i->active=false;
    }
    return after;
}

bool Resolver::_inlineTarget(size_t pos, Target& target, size_t& after) const {
    const size_t end=mText.size();
    if (pos>=end || mText[pos]!='(') return false;

    size_t i=pos+1;
    while (i<end && (isSpaceOrTab(mText[i]) || mText[i]=='\n')) ++i;
    if (i<end && mText[i]==')') {
        target=Target();
        after=i+1;
        return true;
    }

    string url, title;
    optional<size_t> q=scanLinkDestination(mText, i, url);
    if (!q) return false;

    size_t j=*q;
    while (j<end && (isSpaceOrTab(mText[j]) || mText[j]=='\n')) ++j;
    if (j>*q) {
        optional<size_t> t=scanLinkTitle(mText, j, title);
        if (t) {
            j=*t;
            while (j<end && (isSpaceOrTab(mText[j]) || mText[j]=='\n')) ++j;
        }
    }
    if (j>=end || mText[j]!=')') return false;

    target.url=url;
    target.title=title;
    after=j+1;
    return true;
}

bool Resolver::_referenceTarget(const Bracket& opener, size_t pos, Target& target,
                                size_t& after) const
{
    string label;
    optional<size_t> q;
    if (pos+1<mText.size() && mText[pos+1]=='[') q=scanLinkLabel(mText, pos+1, label);

    if (q) {
        after=*q;
    } else {
        // Collapsed ("[foo][]") and shortcut ("[foo]") references use the
        // link text as the label.
        label=mText.substr(opener.end, pos-opener.end);
        if (label.size()>cMaxLabelLength) return false;
        bool collapsed=(pos+2<mText.size() && mText[pos+1]=='[' && mText[pos+2]==']');
        after=pos+(collapsed ? 3 : 1);
    }

    optional<LinkIds::Target> found=mIdTable.find(label);
    if (!found) {
        spdlog::debug("no link definition for [{}]", label);
        return false;
    }
    target.url=found->url;
    target.title=(found->title ? *found->title : string());
    return true;
}

void Resolver::_processEmphasis(size_t bottom) {
    // Lower bounds for the opener search, by delimiter character, closer
    // length modulo three and whether the closer can also open.
    size_t openersBottom[3][3][2];
    for (size_t c=0; c<3; ++c)
        for (size_t m=0; m<3; ++m)
            openersBottom[c][m][0]=openersBottom[c][m][1]=bottom;

    size_t ci=bottom;
    while (ci<mDelimiters.size()) {
        Delimiter& closer=mDelimiters[ci];
        if (closer.removed || !closer.canClose || closer.length()==0) {
            ++ci;
            continue;
        }

        const size_t charIndex=(closer.ch=='*' ? 0 : closer.ch=='_' ? 1 : 2);
        size_t& lowest=openersBottom[charIndex][closer.originalLength % 3][closer.canOpen ? 1 : 0];

        bool found=false;
        size_t oi=ci;
        while (oi>lowest) {
            --oi;
            const Delimiter& o=mDelimiters[oi];
            if (o.removed || o.ch!=closer.ch || !o.canOpen || o.length()==0) continue;
            if (closer.ch=='~') {
                if (o.length()!=closer.length() || closer.length()>2) continue;
            } else if (_oddMatch(o, closer)) {
                continue;
            }
            found=true;
            break;
        }

        if (found) {
            _match(oi, ci);
            if (closer.length()==0) {
                closer.removed=true;
                ++ci;
            }
        } else {
            lowest=ci;
            if (!closer.canOpen) _literalize(closer);
            ++ci;
        }
    }

    for (size_t x=bottom; x<mDelimiters.size(); ++x) _literalize(mDelimiters[x]);
    if (bottom<mDelimiters.size()) mDelimiters.resize(bottom);
}

bool Resolver::_oddMatch(const Delimiter& opener, const Delimiter& closer) const {
    if (!closer.canOpen && !opener.canClose) return false;
    const size_t o=opener.originalLength, c=closer.originalLength;
    return (o+c) % 3==0 && !(o % 3==0 && c % 3==0);
}

void Resolver::_match(size_t oi, size_t ci) {
    Delimiter& opener=mDelimiters[oi];
    Delimiter& closer=mDelimiters[ci];

    size_t used=1;
    if (opener.ch=='~') used=opener.length();
    else if (opener.length()>=2 && closer.length()>=2) used=2;

    for (size_t x=oi+1; x<ci; ++x) _literalize(mDelimiters[x]);

    Inlines content=_takeRange(opener.end, closer.start);
    opener.end-=used;
    closer.start+=used;

    if (opener.ch=='~') {
        Strikeout s;
        s.content=content;
        mPieces[opener.end]=s;
    } else if (used==2) {
        Strong s;
        s.content=content;
        mPieces[opener.end]=s;
    } else {
        Emph e;
        e.content=content;
        mPieces[opener.end]=e;
    }

    if (opener.length()==0) opener.removed=true;
}

void Resolver::_literalize(Delimiter& d) {
    if (d.removed) return;
    if (d.length()) mPieces[d.start]=makeStr(mText.substr(d.start, d.length()));
    d.removed=true;
}

Inlines Resolver::_takeRange(size_t from, size_t to) {
    Inlines r;
    Pieces::iterator i=mPieces.lower_bound(from), ie=mPieces.lower_bound(to);
    for (Pieces::iterator x=i; x!=ie; ++x) appendInline(r, x->second);
    mPieces.erase(i, ie);
    return r;
}

size_t Resolver::_autolink(size_t pos) {
    size_t close=mText.find_first_of("<> \t\n", pos+1);
    if (close!=string::npos && mText[close]=='>') {
        string inner=mText.substr(pos+1, close-pos-1);
        Link link;
        if (looksLikeUri(inner)) {
            link.attr.classes.push_back("uri");
            link.target.url=inner;
        } else if (looksLikeEmailAddress(inner)) {
            link.attr.classes.push_back("email");
            link.target.url="mailto:"+inner;
        }
        if (!link.attr.classes.empty()) {
            link.content.push_back(makeStr(inner));
            mPieces[pos]=link;
            return close+1;
        }
    }
    mPieces[pos]=makeStr("<");
    return pos+1;
}

size_t Resolver::_text(size_t pos) {
    static const char *cSpecial="\\&`*_~ \t\n[]!<";
    size_t end=mText.find_first_of(cSpecial, pos+1);
    if (end==string::npos) end=mText.size();
    mPieces[pos]=makeStr(mText.substr(pos, end-pos));
    return end;
}

} // namespace

InlineParser::InlineParser(const LinkIds& ids, const ReaderOptions& options)
    : mIdTable(ids), mOptions(options)
{
}

Inlines InlineParser::parse(const string& text) const {
    Resolver resolver(text, mIdTable, mOptions);
    return resolver.run();
}

} // namespace mdast
