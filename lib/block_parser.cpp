/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "blocks.h"
#include "inline_parser.h"

#include <spdlog/spdlog.h>

namespace mdast {
namespace block {

namespace {

class NextLine: public boost::static_visitor<LineResult> {
public:
    NextLine(const ScannedLine& line, const ReaderOptions& options)
        : mLine(line), mOptions(options) { }

    LineResult operator()(Empty&) const {
        return checkBlock(mLine).toParagraphResult(false, mLine);
    }
    LineResult operator()(Paragraph& p) const { return p.next(mLine, mOptions); }
    LineResult operator()(IndentedCode& c) const { return c.next(mLine); }
    LineResult operator()(FencedCode& c) const { return c.next(mLine); }
    LineResult operator()(Table& t) const { return t.next(mLine); }
    LineResult operator()(BlockQuote& q) const { return q.next(mLine, mOptions); }
    LineResult operator()(List& l) const { return l.next(mLine, mOptions); }

    // Single-line blocks are never left open.
    template <typename T>
    LineResult operator()(T&) const {
        return checkBlock(mLine).toParagraphResult(true, mLine);
    }

private:
    const ScannedLine& mLine;
    const ReaderOptions& mOptions;
};

// Returns true if the blank line closes the block.
class NextBlank: public boost::static_visitor<bool> {
public:
    explicit NextBlank(size_t indent): mIndent(indent) { }

    bool operator()(IndentedCode& c) const { c.nextBlank(mIndent); return false; }
    bool operator()(FencedCode& c) const { c.nextBlank(mIndent); return false; }
    bool operator()(List& l) const { l.nextBlank(mIndent); return false; }

    template <typename T>
    bool operator()(T&) const { return true; }

private:
    size_t mIndent;
};

class NextContinuation: public boost::static_visitor<LineResult> {
public:
    explicit NextContinuation(const ScannedLine& line): mLine(line) { }

    LineResult operator()(Paragraph& p) const { return p.nextContinuation(mLine); }
    LineResult operator()(BlockQuote& q) const {
        return q.parser().nextContinuation(mLine);
    }
    LineResult operator()(List& l) const {
        if (l.current()) return l.current()->parser().nextContinuation(mLine);
        return _reclassify();
    }

    template <typename T>
    LineResult operator()(T&) const { return _reclassify(); }

private:
    LineResult _reclassify() const {
        return checkBlockKnownIndent(mLine).toParagraphResult(true, mLine);
    }

    const ScannedLine& mLine;
};

class NextIndentedContinuation: public boost::static_visitor<LineResult> {
public:
    explicit NextIndentedContinuation(const ScannedLine& line): mLine(line) { }

    LineResult operator()(Paragraph& p) const {
        p.nextIndentedContinuation(mLine);
        return LineResult();
    }
    LineResult operator()(BlockQuote& q) const {
        return q.parser().nextIndentedContinuation(mLine);
    }
    LineResult operator()(List& l) const {
        if (l.current()) return l.current()->parser().nextIndentedContinuation(mLine);
        return _code();
    }

    template <typename T>
    LineResult operator()(T&) const { return _code(); }

private:
    LineResult _code() const {
        return LineResult(LineResult::cFinishedAndReplaced, IndentedCode(mLine));
    }

    const ScannedLine& mLine;
};

class CollectLinks: public boost::static_visitor<> {
public:
    explicit CollectLinks(LinkIds& ids): mIds(ids) { }

    void operator()(Paragraph& p) const { p.collectLinks(mIds); }
    void operator()(BlockQuote& q) const { q.collectLinks(mIds); }
    void operator()(List& l) const { l.collectLinks(mIds); }

    template <typename T>
    void operator()(T&) const { }

private:
    LinkIds& mIds;
};

class FinishBlock: public boost::static_visitor<optional<Block> > {
public:
    explicit FinishBlock(const InlineParser& inlines): mInlines(inlines) { }

    optional<Block> operator()(const Empty&) const { return none; }
    optional<Block> operator()(const Paragraph& p) const { return p.finish(mInlines); }

    optional<Block> operator()(const AtxHeading& h) const {
        return makeHeader(h.level, mInlines.parse(h.content));
    }

    optional<Block> operator()(const ThematicBreak&) const {
        return Block(HorizontalRule());
    }

    optional<Block> operator()(const IndentedCode& c) const { return c.finish(); }
    optional<Block> operator()(const FencedCode& c) const { return c.finish(); }
    optional<Block> operator()(const Table& t) const { return t.finish(mInlines); }
    optional<Block> operator()(const BlockQuote& q) const { return q.finish(mInlines); }
    optional<Block> operator()(const List& l) const { return l.finish(mInlines); }

private:
    const InlineParser& mInlines;
};

const char *containerName(const OpenBlock& block) {
    if (boost::get<BlockQuote>(&block)) return "block quote";
    if (const List *l=boost::get<List>(&block))
        return l->ordered() ? "ordered list" : "bullet list";
    return 0;
}

} // namespace

void BlockParser::start(const ScannedLine& line) {
    LineResult result=checkBlock(line).toParagraphResult(false, line);
    apply(result);
}

void BlockParser::feed(const ScannedLine& line, const ReaderOptions& options) {
    if (line.blank()) {
        nextBlank(line.indent());
    } else {
        LineResult result=next(line, options);
        apply(result);
    }
}

LineResult BlockParser::next(const ScannedLine& line, const ReaderOptions& options) {
    NextLine visitor(line, options);
    return boost::apply_visitor(visitor, mCurrent);
}

bool BlockParser::nextBlank(size_t indent) {
    if (mCurrent.which()==0) return true;

    NextBlank visitor(indent);
    if (!boost::apply_visitor(visitor, mCurrent)) return false;
    _finishCurrent();
    return true;
}

LineResult BlockParser::nextContinuation(const ScannedLine& line) {
    NextContinuation visitor(line);
    return boost::apply_visitor(visitor, mCurrent);
}

LineResult BlockParser::nextIndentedContinuation(const ScannedLine& line) {
    NextIndentedContinuation visitor(line);
    return boost::apply_visitor(visitor, mCurrent);
}

void BlockParser::apply(LineResult& result) {
    switch (result.kind) {
        case LineResult::cUnchanged:
            break;
        case LineResult::cReplaced:
            mCurrent=std::move(*result.block);
            break;
        case LineResult::cFinished:
            _finishCurrent();
            break;
        case LineResult::cProduced:
            mFinished.push_back(std::move(*result.block));
            break;
        case LineResult::cFinishedAndReplaced:
            _finishCurrent();
            mCurrent=std::move(*result.block);
            break;
        case LineResult::cFinishedAndAlsoFinished:
            _finishCurrent();
            mFinished.push_back(std::move(*result.block));
            break;
    }
}

bool BlockParser::empty() const {
    return mCurrent.which()==0 && mFinished.empty();
}

void BlockParser::collectLinks(LinkIds& ids) {
    CollectLinks visitor(ids);
    for (auto i=mFinished.begin(), ie=mFinished.end(); i!=ie; ++i)
        boost::apply_visitor(visitor, *i);
    boost::apply_visitor(visitor, mCurrent);
}

Blocks BlockParser::finish(const InlineParser& inlines) const {
    FinishBlock visitor(inlines);
    Blocks r;
    for (auto i=mFinished.cbegin(), ie=mFinished.cend(); i!=ie; ++i) {
        optional<Block> b=boost::apply_visitor(visitor, *i);
        if (b) r.push_back(*b);
    }
    optional<Block> b=boost::apply_visitor(visitor, mCurrent);
    if (b) r.push_back(*b);
    return r;
}

void BlockParser::_finishCurrent() {
    if (mCurrent.which()!=0) {
        const char *name=containerName(mCurrent);
        if (name) spdlog::debug("closing {}", name);
        mFinished.push_back(std::move(mCurrent));
    }
    mCurrent=Empty();
}

} // namespace block
} // namespace mdast
