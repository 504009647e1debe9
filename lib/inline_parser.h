/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_INLINE_PARSER_H_INCLUDED
#define MDAST_INLINE_PARSER_H_INCLUDED

#include <string>

#include "ast.h"
#include "link_ids.h"
#include "options.h"

namespace mdast {

// Turns the text of one leaf block into inline nodes: code spans, escapes,
// entity references, links and images (inline and by reference),
// autolinks, emphasis and strikethrough. Lines of the text are separated by
// '\n' and become soft or hard line breaks.
class InlineParser {
public:
    InlineParser(const LinkIds& ids, const ReaderOptions& options);

    Inlines parse(const string& text) const;

private:
    const LinkIds& mIdTable;
    ReaderOptions mOptions;
};

} // namespace mdast

#endif
