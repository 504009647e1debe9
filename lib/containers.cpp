/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "blocks.h"
#include "chars.h"
#include "inline_parser.h"

#include <boost/lexical_cast.hpp>

namespace mdast {
namespace block {

namespace {

const size_t cMaxOrdinalDigits=9;

// Tight list items hold their paragraphs as Plain.
Blocks tighten(const Blocks& blocks) {
    Blocks r;
    for (auto i=blocks.cbegin(), ie=blocks.cend(); i!=ie; ++i) {
        if (const Para *p=boost::get<Para>(&*i)) {
            Plain plain;
            plain.content=p->content;
            r.push_back(plain);
        } else {
            r.push_back(*i);
        }
    }
    return r;
}

} // namespace

optional<ListMarker> scanListMarker(const ScannedLine& line) {
    if (line.blank()) return none;

    string_view text=line.text();
    ListMarker marker;
    marker.indent=line.indent();
    marker.start=0;
    marker.closing=0;

    size_t markerWidth=0;
    char c=line.first();
    if (c=='-' || c=='*' || c=='+') {
        marker.bullet=c;
        markerWidth=1;
    } else {
        size_t digits=0;
        while (digits<text.size() && text[digits]>='0' && text[digits]<='9') ++digits;
        if (digits==0 || digits>cMaxOrdinalDigits || digits>=text.size()) return none;
        if (text[digits]!='.' && text[digits]!=')') return none;

        marker.bullet=0;
        marker.start=boost::lexical_cast<int>(text.substr(0, digits).to_string());
        marker.closing=text[digits];
        markerWidth=digits+1;
    }

    if (markerWidth<text.size() && !isSpaceOrTab(text[markerWidth])) return none;

    ScannedLine rest=line.scanRest(markerWidth);
    marker.empty=rest.blank();
    if (marker.empty) {
        marker.width=markerWidth+1;
    } else if (rest.indent()<=4) {
        marker.width=markerWidth+rest.indent();
        rest.setIndent(0);
    } else {
        // The content is indented code; only one column belongs to the marker.
        marker.width=markerWidth+1;
        rest.moveIndent(1);
    }
    marker.content=rest;
    return marker;
}



BlockQuote::BlockQuote(const ScannedLine& line) {
    ScannedLine content=line.scanRest(1);
    content.moveIndent(1);
    if (!content.blank()) mParser.start(content);
}

LineResult BlockQuote::next(const ScannedLine& line, const ReaderOptions& options) {
    if (line.first()=='>' && line.indent()<4) {
        _feedContent(line, options);
        return LineResult();
    }
    if (line.indent()>=4) return mParser.nextIndentedContinuation(line);
    return mParser.nextContinuation(line);
}

Block BlockQuote::finish(const InlineParser& inlines) const {
    mdast::BlockQuote r;
    r.content=mParser.finish(inlines);
    return r;
}

void BlockQuote::_feedContent(const ScannedLine& line, const ReaderOptions& options) {
    ScannedLine content=line.scanRest(1);
    content.moveIndent(1);
    mParser.feed(content, options);
}



ListItem::ListItem(const ListMarker& marker)
    : mWidth(marker.width), mIndent(marker.indent), mGap(false), mLoose(false)
{
    if (!marker.empty) mParser.start(marker.content);
}

void ListItem::nextLine(const ScannedLine& line, const ReaderOptions& options) {
    LineResult result=mParser.next(line, options);
    switch (result.kind) {
        case LineResult::cReplaced:
        case LineResult::cProduced:
            if (mGap) mLoose=true;
            break;
        case LineResult::cFinishedAndReplaced:
        case LineResult::cFinishedAndAlsoFinished:
            if (mGap) mLoose=true;
            else if (const List *list=boost::get<List>(&mParser.current()))
                if (list->endsWithGap()) mLoose=true;
            break;
        default:
            break;
    }
    mGap=false;
    mParser.apply(result);
}

bool ListItem::nextBlank(size_t indent) {
    if (mParser.empty()) return true;
    mGap=mParser.nextBlank(indent>contentColumn() ? indent-contentColumn() : 0);
    return false;
}

bool ListItem::endsWithGap() const {
    if (mGap) return true;
    const List *list=boost::get<List>(&mParser.current());
    return list && list->endsWithGap();
}

Blocks ListItem::finish(bool loose, const InlineParser& inlines) const {
    Blocks r=mParser.finish(inlines);
    if (!loose) return tighten(r);
    return r;
}



List::List(const ListMarker& marker)
    : mBullet(marker.bullet), mClosing(marker.closing), mStart(marker.start),
      mCurrent(ListItem(marker)), mLoose(false)
{
}

LineResult List::next(const ScannedLine& line, const ReaderOptions& options) {
    if (mCurrent && line.indent()>=mCurrent->contentColumn()) {
        ScannedLine content=line;
        content.moveIndent(mCurrent->contentColumn());
        mCurrent->nextLine(content, options);
        return LineResult();
    }

    if (line.indent()>=4) {
        if (mCurrent) return mCurrent->parser().nextIndentedContinuation(line);
        return LineResult(LineResult::cFinishedAndReplaced, IndentedCode(line));
    }

    if (!ordered() && line.first()==mBullet && isThematicBreak(line))
        return LineResult(LineResult::cFinishedAndAlsoFinished, ThematicBreak());

    optional<ListMarker> marker=scanListMarker(line);
    if (marker) {
        if (_sameKind(*marker)) {
            _addItem(*marker);
            return LineResult();
        }
        return checkBlockKnownIndent(line).toParagraphResult(true, line);
    }

    if (mCurrent) return mCurrent->parser().nextContinuation(line);
    return checkBlockKnownIndent(line).toParagraphResult(true, line);
}

void List::nextBlank(size_t indent) {
    if (mCurrent && mCurrent->nextBlank(indent)) {
        mItems.push_back(std::move(*mCurrent));
        mCurrent=none;
    }
}

bool List::endsWithGap() const {
    return mCurrent && mCurrent->endsWithGap();
}

void List::collectLinks(LinkIds& ids) {
    for (auto i=mItems.begin(), ie=mItems.end(); i!=ie; ++i) i->collectLinks(ids);
    if (mCurrent) mCurrent->collectLinks(ids);
}

Block List::finish(const InlineParser& inlines) const {
    const bool loose=mLoose || (mCurrent && mCurrent->loose());

    std::vector<Blocks> items;
    for (auto i=mItems.cbegin(), ie=mItems.cend(); i!=ie; ++i)
        items.push_back(i->finish(loose, inlines));
    if (mCurrent) items.push_back(mCurrent->finish(loose, inlines));

    if (ordered()) {
        OrderedList r;
        r.attributes=makeListAttributes(mStart, mClosing);
        r.items=items;
        return r;
    }
    BulletList r;
    r.items=items;
    return r;
}

bool List::_sameKind(const ListMarker& marker) const {
    if (ordered()) return marker.bullet==0 && marker.closing==mClosing;
    return marker.bullet==mBullet;
}

void List::_addItem(const ListMarker& marker) {
    if (mCurrent) {
        if (mCurrent->loose() || mCurrent->endsWithGap()) mLoose=true;
        mItems.push_back(std::move(*mCurrent));
    } else if (!mItems.empty()) {
        // The previous item ended on a blank line.
        mLoose=true;
    }
    mCurrent=ListItem(marker);
}

} // namespace block
} // namespace mdast
