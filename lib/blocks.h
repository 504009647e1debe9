/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_BLOCKS_H_INCLUDED
#define MDAST_BLOCKS_H_INCLUDED

#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "ast.h"
#include "line_scanner.h"
#include "link_ids.h"
#include "options.h"

namespace mdast {

class InlineParser;

// Blocks that are still accepting lines. Each kind has a transition function
// that consumes one line and reports, through a LineResult, what happened to
// the block and whether another one started or finished on that line.
namespace block {

struct LineResult;
struct CheckResult;

struct Empty { };

class Paragraph {
public:
    explicit Paragraph(const ScannedLine& line);

    LineResult next(const ScannedLine& line, const ReaderOptions& options);

    // A line without its container's prefix ("lazy" continuation).
    LineResult nextContinuation(const ScannedLine& line);
    void nextIndentedContinuation(const ScannedLine& line);

    void collectLinks(LinkIds& ids);
    optional<Block> finish(const InlineParser& inlines) const;

    const string& content() const { return mContent; }

private:
    LineResult _setext(const ScannedLine& line, const ReaderOptions& options);
    LineResult _pushChecked(const ScannedLine& line, const ReaderOptions& options);
    void _push(string_view text, bool headerCandidate);

    string mContent;
    size_t mLineStart;
    size_t mTableColumns; // Of the last line, if it were a table header
    int mSetextLevel;
};

struct AtxHeading {
    int level;
    string content;
};

struct ThematicBreak { };

class IndentedCode {
public:
    explicit IndentedCode(ScannedLine line);

    LineResult next(const ScannedLine& line);
    void nextBlank(size_t indent);
    Block finish() const;

private:
    std::vector<string> mLines;
};

class FencedCode {
public:
    FencedCode(size_t indent, size_t fenceLength, char fence, const string& info);

    LineResult next(const ScannedLine& line);
    void nextBlank(size_t indent);
    Block finish() const;

private:
    size_t mIndent, mFenceLength;
    char mFence;
    string mInfo, mContent;
};

class Table {
public:
    Table(const std::vector<Alignment>& alignments, string_view header);

    LineResult next(const ScannedLine& line);
    Block finish(const InlineParser& inlines) const;

    size_t columns() const { return mAlignments.size(); }
    const std::vector<std::vector<string> >& rows() const { return mRows; }

    // Cells a header row would have: unescaped pipes that separate content,
    // ignoring one leading and one trailing pipe. Zero for a lone "|".
    static size_t countHeaderColumns(string_view line);

    // Parses a delimiter row such as "| :-- | --: |" that has exactly
    // `columns` cells.
    static optional<std::vector<Alignment> > parseDelimiterRow(string_view line,
            size_t columns);

    // Splits a row on unescaped pipes into at most `columns` cells; "\|"
    // becomes a literal pipe.
    static std::vector<string> splitRow(string_view line, size_t columns);

private:
    void _push(string_view line);

    std::vector<Alignment> mAlignments;
    std::vector<std::vector<string> > mRows;
};

class BlockQuote;
class List;

typedef boost::variant<
    Empty,
    Paragraph,
    AtxHeading,
    ThematicBreak,
    IndentedCode,
    FencedCode,
    Table,
    boost::recursive_wrapper<BlockQuote>,
    boost::recursive_wrapper<List>
> OpenBlock;

struct LineResult {
    enum Kind {
        cUnchanged,               // The line was absorbed by the open block
        cReplaced,                // The open block is replaced by `block`
        cFinished,                // The open block is finished
        cProduced,                // `block` is finished; the open block stays
        cFinishedAndReplaced,     // The open block finishes, `block` opens
        cFinishedAndAlsoFinished  // Both the open block and `block` finish
    };

    LineResult(Kind k=cUnchanged): kind(k) { }
    LineResult(Kind k, OpenBlock b): kind(k), block(std::move(b)) { }

    Kind kind;
    optional<OpenBlock> block;
};

// What a recognizer made of a line: a block that stays open (cNew), a
// single-line block that is already complete (cDone), or ordinary text.
struct CheckResult {
    enum Kind { cNew, cDone, cText };

    CheckResult(): kind(cText) { }
    CheckResult(Kind k, OpenBlock b): kind(k), block(std::move(b)) { }

    bool text() const { return kind==cText; }

    // Turns a cNew or cDone result into a transition. With `finishCurrent`
    // set the block that was open is finished as well. The recognized block
    // is moved into the transition.
    LineResult toLineResult(bool finishCurrent);

    // As toLineResult, but text starts a new paragraph.
    LineResult toParagraphResult(bool finishCurrent, const ScannedLine& line);

    Kind kind;
    optional<OpenBlock> block;
};

// A list item marker and where the item's content begins.
struct ListMarker {
    char bullet;       // '-', '*' or '+'; zero for ordered markers
    int start;         // Ordered markers only
    char closing;      // '.' or ')', ordered markers only
    size_t indent;     // Of the marker itself
    size_t width;      // From the marker to the item's content column
    bool empty;        // Nothing follows the marker on its line
    ScannedLine content;
};

optional<ListMarker> scanListMarker(const ScannedLine& line);
bool isThematicBreak(const ScannedLine& line);
CheckResult checkAtxHeading(const ScannedLine& line);
CheckResult checkFence(const ScannedLine& line);

// Recognizers in priority order for a line at any indent, for a line known
// to be indented less than four columns, and for a line following paragraph
// text (where an empty list item, or an ordered one not starting at 1, does
// not interrupt).
CheckResult checkBlock(const ScannedLine& line);
CheckResult checkBlockKnownIndent(const ScannedLine& line);
CheckResult checkInterrupt(const ScannedLine& line);

// One level of block structure: a single open block plus the blocks that
// finished before it. Block quotes and list items each own one.
class BlockParser {
public:
    // Opens the first block of an empty parser. Nothing on a first line
    // depends on reader options.
    void start(const ScannedLine& line);

    // Feeds a blank or non-blank line and applies the result.
    void feed(const ScannedLine& line, const ReaderOptions& options);

    LineResult next(const ScannedLine& line, const ReaderOptions& options);

    // Returns true if the blank line left a gap: it closed a paragraph or
    // followed nothing at all. Lists use this for loose detection.
    bool nextBlank(size_t indent);

    LineResult nextContinuation(const ScannedLine& line);
    LineResult nextIndentedContinuation(const ScannedLine& line);

    void apply(LineResult& result);

    bool empty() const;
    const OpenBlock& current() const { return mCurrent; }

    void collectLinks(LinkIds& ids);
    Blocks finish(const InlineParser& inlines) const;

private:
    void _finishCurrent();

    OpenBlock mCurrent;
    std::vector<OpenBlock> mFinished;
};

class BlockQuote {
public:
    explicit BlockQuote(const ScannedLine& line);

    LineResult next(const ScannedLine& line, const ReaderOptions& options);

    BlockParser& parser() { return mParser; }
    void collectLinks(LinkIds& ids) { mParser.collectLinks(ids); }
    Block finish(const InlineParser& inlines) const;

private:
    void _feedContent(const ScannedLine& line, const ReaderOptions& options);

    BlockParser mParser;
};

class ListItem {
public:
    explicit ListItem(const ListMarker& marker);

    void nextLine(const ScannedLine& line, const ReaderOptions& options);

    // Returns true if the item is still empty, which ends it.
    bool nextBlank(size_t indent);

    size_t contentColumn() const { return mIndent+mWidth; }
    bool endsWithGap() const;
    bool loose() const { return mLoose; }

    BlockParser& parser() { return mParser; }
    void collectLinks(LinkIds& ids) { mParser.collectLinks(ids); }
    Blocks finish(bool loose, const InlineParser& inlines) const;

private:
    BlockParser mParser;
    size_t mWidth, mIndent;
    bool mGap, mLoose;
};

class List {
public:
    explicit List(const ListMarker& marker);

    LineResult next(const ScannedLine& line, const ReaderOptions& options);
    void nextBlank(size_t indent);

    bool endsWithGap() const;
    bool ordered() const { return mBullet==0; }

    // The item still accepting lines; none after an empty item met a blank.
    optional<ListItem>& current() { return mCurrent; }

    void collectLinks(LinkIds& ids);
    Block finish(const InlineParser& inlines) const;

private:
    bool _sameKind(const ListMarker& marker) const;
    void _addItem(const ListMarker& marker);

    char mBullet, mClosing;
    int mStart;
    std::vector<ListItem> mItems;
    optional<ListItem> mCurrent;
    bool mLoose;
};

} // namespace block
} // namespace mdast

#endif
