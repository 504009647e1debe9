/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_LINE_SCANNER_H_INCLUDED
#define MDAST_LINE_SCANNER_H_INCLUDED

#include <string>

#include <boost/utility/string_view.hpp>

namespace mdast {

using std::string;
using boost::string_view;

// One source line with its leading whitespace measured. Tabs advance to the
// next multiple of cTabStop of the running column, so a line that starts
// partway through a container (after "> " or a list marker) measures its
// indent from the column the container left off at.
class ScannedLine {
public:
    static const size_t cTabStop=4;

    ScannedLine(): mBlank(true), mIndent(0), mColumn(0) { }

    static ScannedLine scan(string_view line, size_t column=0);

    bool blank() const { return mBlank; }

    // First non-space/tab byte, or zero for a blank line.
    char first() const { return mBlank ? 0 : mText[0]; }

    // Width of the leading whitespace, after any adjustment by a container.
    size_t indent() const { return mIndent; }
    void setIndent(size_t indent) { mIndent=indent; }
    void moveIndent(size_t n) { mIndent=(n>mIndent ? 0 : mIndent-n); }

    // Absolute column of first().
    size_t column() const { return mColumn; }

    // The line from first() on; empty when blank.
    string_view text() const { return mText; }

    // Re-scans the text following the first `skip` bytes of text(), at the
    // column those bytes end on. Used after "#", ">" and list markers.
    ScannedLine scanRest(size_t skip=1) const;

    // The text with the remaining indent put back as spaces.
    string full() const;

private:
    bool mBlank;
    size_t mIndent, mColumn;
    string_view mText;
};

} // namespace mdast

#endif
