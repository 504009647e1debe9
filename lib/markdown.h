/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_MARKDOWN_H_INCLUDED
#define MDAST_MARKDOWN_H_INCLUDED

#include <iostream>
#include <string>

#include <boost/noncopyable.hpp>

#include "format.h"
#include "options.h"

namespace mdast {

// Reads GitHub-Flavoured Markdown. Reading never fails: anything that isn't
// recognized as markup ends up as text.
class MarkdownReader: public Reader, private boost::noncopyable {
public:
    explicit MarkdownReader(const ReaderOptions& options=ReaderOptions());

    using Reader::read;
    Document read(std::istream& in) override;

    const ReaderOptions& options() const { return mOptions; }

private:
    static bool _getline(std::istream& in, string& line);

    ReaderOptions mOptions;
};

} // namespace mdast

#endif
