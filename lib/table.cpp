/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "blocks.h"
#include "chars.h"
#include "inline_parser.h"

namespace mdast {
namespace block {

namespace {

string_view trimRow(string_view line) {
    while (!line.empty() && isSpaceOrTab(line.front())) line.remove_prefix(1);
    while (!line.empty() && isSpaceOrTab(line.back())) line.remove_suffix(1);
    return line;
}

bool escapedAt(string_view line, size_t pos) {
    size_t slashes=0;
    while (pos>slashes && line[pos-slashes-1]=='\\') ++slashes;
    return (slashes % 2)==1;
}

// Strips one leading pipe and one unescaped trailing pipe.
string_view stripOuterPipes(string_view line) {
    if (!line.empty() && line.front()=='|') line.remove_prefix(1);
    if (!line.empty() && line.back()=='|' && !escapedAt(line, line.size()-1))
        line.remove_suffix(1);
    return line;
}

} // namespace

Table::Table(const std::vector<Alignment>& alignments, string_view header)
    : mAlignments(alignments)
{
    _push(header);
}

LineResult Table::next(const ScannedLine& line) {
    if (line.indent()<4) {
        CheckResult checked=checkBlockKnownIndent(line);
        if (!checked.text()) return checked.toLineResult(true);
    }
    _push(line.text());
    return LineResult();
}

Block Table::finish(const InlineParser& inlines) const {
    std::vector<std::vector<Inlines> > rows;
    for (auto i=mRows.cbegin(), ie=mRows.cend(); i!=ie; ++i) {
        std::vector<Inlines> cells;
        for (auto c=i->cbegin(), ce=i->cend(); c!=ce; ++c)
            cells.push_back(inlines.parse(*c));
        rows.push_back(cells);
    }
    return makeTable(rows, mAlignments);
}

size_t Table::countHeaderColumns(string_view line) {
    line=trimRow(line);
    if (line.empty() || line=="|") return 0;

    size_t pipes=0;
    for (size_t x=0; x<line.size(); ++x)
        if (line[x]=='|' && !escapedAt(line, x)) ++pipes;
    if (pipes==0) return 0;

    string_view inner=stripOuterPipes(line);
    size_t columns=1;
    for (size_t x=0; x<inner.size(); ++x)
        if (inner[x]=='|' && !escapedAt(inner, x)) ++columns;
    return columns;
}

optional<std::vector<Alignment> > Table::parseDelimiterRow(string_view line,
        size_t columns)
{
    line=trimRow(line);
    if (line.empty()) return none;
    for (size_t x=0; x<line.size(); ++x) {
        char c=line[x];
        if (c!='|' && c!='-' && c!=':' && !isSpaceOrTab(c)) return none;
    }

    std::vector<Alignment> r;
    string_view inner=stripOuterPipes(line);
    while (true) {
        size_t bar=inner.find('|');
        string_view cell=trimRow(inner.substr(0, bar));

        bool left=false, right=false;
        if (!cell.empty() && cell.front()==':') {
            left=true;
            cell.remove_prefix(1);
        }
        if (!cell.empty() && cell.back()==':') {
            right=true;
            cell.remove_suffix(1);
        }
        if (cell.empty() || cell.find_first_not_of('-')!=string_view::npos)
            return none;

        if (left && right) r.push_back(cAlignCenter);
        else if (left) r.push_back(cAlignLeft);
        else if (right) r.push_back(cAlignRight);
        else r.push_back(cAlignDefault);

        if (bar==string_view::npos) break;
        inner=inner.substr(bar+1);
    }

    if (r.size()!=columns) return none;
    return r;
}

std::vector<string> Table::splitRow(string_view line, size_t columns) {
    line=trimRow(line);
    if (!line.empty() && line.front()=='|') line.remove_prefix(1);

    std::vector<string> r;
    string cell;
    bool pending=false;
    for (size_t x=0; x<line.size(); ++x) {
        char c=line[x];
        if (c=='\\' && x+1<line.size() && line[x+1]=='|') {
            cell.push_back('|');
            pending=true;
            ++x;
        } else if (c=='|') {
            r.push_back(trimRow(cell).to_string());
            cell.clear();
            pending=false;
        } else {
            cell.push_back(c);
            pending=true;
        }
    }
    if (pending) r.push_back(trimRow(cell).to_string());

    if (r.size()>columns) r.resize(columns);
    return r;
}

void Table::_push(string_view line) {
    mRows.push_back(splitRow(line, columns()));
}

} // namespace block
} // namespace mdast
