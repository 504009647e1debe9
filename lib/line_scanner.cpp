/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "line_scanner.h"

namespace mdast {

const size_t ScannedLine::cTabStop;

ScannedLine ScannedLine::scan(string_view line, size_t column) {
    ScannedLine r;
    size_t total=column;
    for (size_t x=0; x<line.size(); ++x) {
        char c=line[x];
        if (c==' ') ++total;
        else if (c=='\t') total+=cTabStop-(total % cTabStop);
        else {
            r.mBlank=false;
            r.mIndent=total-column;
            r.mColumn=total;
            r.mText=line.substr(x);
            return r;
        }
    }
    r.mIndent=total-column;
    r.mColumn=total;
    return r;
}

ScannedLine ScannedLine::scanRest(size_t skip) const {
    if (mBlank) return *this;
    if (skip>mText.size()) skip=mText.size();
    return scan(mText.substr(skip), mColumn+skip);
}

string ScannedLine::full() const {
    string r(mIndent, ' ');
    r.append(mText.data(), mText.size());
    return r;
}

} // namespace mdast
