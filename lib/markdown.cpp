/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "markdown.h"
#include "blocks.h"
#include "chars.h"
#include "inline_parser.h"
#include "line_scanner.h"
#include "link_ids.h"

#include <vector>

#include <spdlog/spdlog.h>

namespace mdast {

MarkdownReader::MarkdownReader(const ReaderOptions& options): mOptions(options) {
}

Document MarkdownReader::read(std::istream& in) {
    // The block parser keeps views into these until the tree is built.
    std::vector<string> lines;
    string line;
    while (_getline(in, line)) lines.push_back(line);

    block::BlockParser parser;
    for (auto i=lines.cbegin(), ie=lines.cend(); i!=ie; ++i)
        parser.feed(ScannedLine::scan(*i), mOptions);

    // Every definition has to be known before any reference is resolved.
    LinkIds ids;
    parser.collectLinks(ids);
    spdlog::debug("read {} lines, {} link definitions", lines.size(), ids.size());

    InlineParser inlines(ids, mOptions);
    Document doc;
    doc.blocks=parser.finish(inlines);
    return doc;
}

bool MarkdownReader::_getline(std::istream& in, string& line) {
    // Handles \n, \r and \r\n on any system. NUL characters are replaced
    // here, since this is the one place every byte passes through.
    line.clear();

    char c;
    while (in.get(c)) {
        if (c=='\r') {
            if ((in.get(c)) && c!='\n') in.unget();
            return true;
        } else if (c=='\n') {
            return true;
        } else if (c==0) {
            appendUtf8(line, cReplacementCharacter);
        } else {
            line.push_back(c);
        }
    }
    return !line.empty();
}

} // namespace mdast
