/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "blocks.h"
#include "chars.h"
#include "entities.h"
#include "inline_parser.h"

#include <boost/algorithm/string/trim.hpp>
#include <spdlog/spdlog.h>

namespace mdast {
namespace block {

namespace {

bool isBlankText(string_view text) {
    for (size_t x=0; x<text.size(); ++x)
        if (!isSpaceOrTab(text[x])) return false;
    return true;
}

string_view trimSpaces(string_view text) {
    while (!text.empty() && isSpaceOrTab(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpaceOrTab(text.back())) text.remove_suffix(1);
    return text;
}

// A run of one character followed by nothing but whitespace.
bool isUnderline(string_view text, char c) {
    size_t n=text.find_first_not_of(c);
    return n==string_view::npos || isBlankText(text.substr(n));
}

} // namespace

LineResult CheckResult::toLineResult(bool finishCurrent) {
    switch (kind) {
        case cNew:
            return LineResult(finishCurrent ? LineResult::cFinishedAndReplaced
                              : LineResult::cReplaced, std::move(*block));
        case cDone:
            return LineResult(finishCurrent ? LineResult::cFinishedAndAlsoFinished
                              : LineResult::cProduced, std::move(*block));
        case cText:
            break;
    }
    return LineResult();
}

LineResult CheckResult::toParagraphResult(bool finishCurrent, const ScannedLine& line) {
    if (kind!=cText) return toLineResult(finishCurrent);
    return LineResult(finishCurrent ? LineResult::cFinishedAndReplaced
                      : LineResult::cReplaced, Paragraph(line));
}

bool isThematicBreak(const ScannedLine& line) {
    char c=line.first();
    if (c!='*' && c!='-' && c!='_') return false;

    string_view text=line.text();
    size_t count=0;
    for (size_t x=0; x<text.size(); ++x) {
        if (text[x]==c) ++count;
        else if (!isSpaceOrTab(text[x])) return false;
    }
    return count>=3;
}

CheckResult checkAtxHeading(const ScannedLine& line) {
    string_view text=line.text();
    size_t level=text.find_first_not_of('#');
    if (level==string_view::npos) level=text.size();
    if (level>6) return CheckResult();

    AtxHeading heading;
    heading.level=static_cast<int>(level);
    string_view rest=text.substr(level);
    if (!rest.empty()) {
        if (!isSpaceOrTab(rest[0])) return CheckResult();
        rest=trimSpaces(rest);

        // An optional closing sequence, which must be preceded by a space.
        size_t hashes=rest.find_last_not_of('#');
        if (hashes==string_view::npos) rest=string_view();
        else if (hashes+1<rest.size() && isSpaceOrTab(rest[hashes]))
            rest=trimSpaces(rest.substr(0, hashes));
        heading.content=rest.to_string();
    }
    return CheckResult(CheckResult::cDone, heading);
}

CheckResult checkFence(const ScannedLine& line) {
    char fence=line.first();
    string_view text=line.text();
    size_t length=text.find_first_not_of(fence);
    if (length==string_view::npos) length=text.size();
    if (length<3) return CheckResult();

    string_view info=trimSpaces(text.substr(length));
    if (fence=='`' && info.find('`')!=string_view::npos) return CheckResult();
    return CheckResult(CheckResult::cNew,
                       FencedCode(line.indent(), length, fence, info.to_string()));
}

CheckResult checkBlock(const ScannedLine& line) {
    if (line.indent()>=4) return CheckResult(CheckResult::cNew, IndentedCode(line));
    return checkBlockKnownIndent(line);
}

CheckResult checkBlockKnownIndent(const ScannedLine& line) {
    switch (line.first()) {
        case '#':
            return checkAtxHeading(line);
        case '_':
            if (isThematicBreak(line)) return CheckResult(CheckResult::cDone, ThematicBreak());
            break;
        case '`':
        case '~':
            return checkFence(line);
        case '>':
            return CheckResult(CheckResult::cNew, BlockQuote(line));
        case '*':
        case '-':
            if (isThematicBreak(line)) return CheckResult(CheckResult::cDone, ThematicBreak());
        // Fall through
        case '+':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9': {
            optional<ListMarker> marker=scanListMarker(line);
            if (marker) return CheckResult(CheckResult::cNew, List(*marker));
            break;
        }
    }
    return CheckResult();
}

CheckResult checkInterrupt(const ScannedLine& line) {
    switch (line.first()) {
        case '#':
        case '_':
        case '`':
        case '~':
        case '>':
            return checkBlockKnownIndent(line);
        case '*':
        case '-':
            if (isThematicBreak(line)) return CheckResult(CheckResult::cDone, ThematicBreak());
        // Fall through
        case '+':
        case '0':
        case '1': {
            optional<ListMarker> marker=scanListMarker(line);
            if (marker && !marker->empty && (marker->bullet!=0 || marker->start==1))
                return CheckResult(CheckResult::cNew, List(*marker));
            break;
        }
    }
    return CheckResult();
}



Paragraph::Paragraph(const ScannedLine& line)
    : mContent(line.text().to_string()), mLineStart(0),
      mTableColumns(Table::countHeaderColumns(line.text())), mSetextLevel(0)
{
}

LineResult Paragraph::next(const ScannedLine& line, const ReaderOptions& options) {
    if (line.indent()>=4) {
        _push(line.text(), true);
        return LineResult();
    }

    char c=line.first();
    if ((c=='=' || c=='-') && isUnderline(line.text(), c))
        return _setext(line, options);

    CheckResult checked=checkInterrupt(line);
    if (!checked.text()) return checked.toLineResult(true);
    return _pushChecked(line, options);
}

LineResult Paragraph::nextContinuation(const ScannedLine& line) {
    CheckResult checked=checkInterrupt(line);
    if (!checked.text()) return checked.toLineResult(true);
    _push(line.text(), false);
    return LineResult();
}

void Paragraph::nextIndentedContinuation(const ScannedLine& line) {
    _push(line.text(), false);
}

void Paragraph::collectLinks(LinkIds& ids) {
    size_t used=parseLinkDefinitions(mContent, ids);
    if (used) mContent.erase(0, used);
}

optional<Block> Paragraph::finish(const InlineParser& inlines) const {
    string text=boost::algorithm::trim_right_copy(mContent);
    if (text.empty()) return none;

    Inlines content=inlines.parse(text);
    if (mSetextLevel) return makeHeader(mSetextLevel, content);
    Para p;
    p.content=content;
    return Block(p);
}

LineResult Paragraph::_setext(const ScannedLine& line, const ReaderOptions& options) {
    // Text made only of link definitions has no heading content, so the
    // underline is read as an ordinary line.
    LinkIds scratch;
    size_t used=parseLinkDefinitions(mContent, scratch);
    if (used>0 && mContent.find_first_not_of(" \t\n", used)==string::npos) {
        if (isThematicBreak(line))
            return LineResult(LineResult::cFinishedAndAlsoFinished, ThematicBreak());
        return _pushChecked(line, options);
    }

    mSetextLevel=(line.first()=='=' ? 1 : 2);
    return LineResult(LineResult::cFinished);
}

LineResult Paragraph::_pushChecked(const ScannedLine& line, const ReaderOptions& options) {
    if (options.tables && mTableColumns>0) {
        optional<std::vector<Alignment> > alignments=
            Table::parseDelimiterRow(line.text(), mTableColumns);
        if (alignments) {
            spdlog::debug("table with {} columns", alignments->size());
            Table table(*alignments, string_view(mContent).substr(mLineStart));
            if (mLineStart==0) return LineResult(LineResult::cReplaced, table);

            // The header row leaves the paragraph; what came before it stays.
            mContent.erase(mLineStart-1);
            return LineResult(LineResult::cFinishedAndReplaced, table);
        }
    }
    _push(line.text(), true);
    return LineResult();
}

void Paragraph::_push(string_view text, bool headerCandidate) {
    mContent.push_back('\n');
    mLineStart=mContent.size();
    mContent.append(text.data(), text.size());
    mTableColumns=(headerCandidate ? Table::countHeaderColumns(text) : 0);
}



IndentedCode::IndentedCode(ScannedLine line) {
    line.moveIndent(4);
    mLines.push_back(line.full());
}

LineResult IndentedCode::next(const ScannedLine& line) {
    if (line.indent()<4) return checkBlockKnownIndent(line).toParagraphResult(true, line);
    ScannedLine content=line;
    content.moveIndent(4);
    mLines.push_back(content.full());
    return LineResult();
}

void IndentedCode::nextBlank(size_t indent) {
    mLines.push_back(string(indent>4 ? indent-4 : 0, ' '));
}

Block IndentedCode::finish() const {
    // Blank lines are only kept between lines of code.
    size_t end=mLines.size();
    while (end>0 && isBlankText(mLines[end-1])) --end;

    string text;
    for (size_t x=0; x<end; ++x) {
        if (x) text.push_back('\n');
        text+=mLines[x];
    }
    return makeCodeBlock(string(), text);
}



FencedCode::FencedCode(size_t indent, size_t fenceLength, char fence, const string& info)
    : mIndent(indent), mFenceLength(fenceLength), mFence(fence), mInfo(info)
{
}

LineResult FencedCode::next(const ScannedLine& line) {
    if (line.indent()<4 && line.first()==mFence) {
        string_view text=line.text();
        size_t length=text.find_first_not_of(mFence);
        if (length==string_view::npos) length=text.size();
        if (length>=mFenceLength && isBlankText(text.substr(length)))
            return LineResult(LineResult::cFinished);
    }

    ScannedLine content=line;
    content.moveIndent(mIndent);
    mContent+=content.full();
    mContent.push_back('\n');
    return LineResult();
}

void FencedCode::nextBlank(size_t indent) {
    mContent.append(indent>mIndent ? indent-mIndent : 0, ' ');
    mContent.push_back('\n');
}

Block FencedCode::finish() const {
    string text=mContent;
    if (!text.empty()) text.erase(text.size()-1);

    string info=mInfo.substr(0, mInfo.find_first_of(" \t"));
    return makeCodeBlock(unescapeString(info), text);
}

} // namespace block
} // namespace mdast
