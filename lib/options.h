/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_OPTIONS_H_INCLUDED
#define MDAST_OPTIONS_H_INCLUDED

namespace mdast {

// GFM extensions the Markdown reader recognizes.
struct ReaderOptions {
    ReaderOptions(): tables(true), strikethrough(true), autolinks(true) { }

    bool tables;
    bool strikethrough;
    bool autolinks;
};

struct WriterOptions {
    WriterOptions(): standalone(false) { }
    explicit WriterOptions(bool s): standalone(s) { }

    // Wrap the output in a complete document (HTML page, LaTeX preamble).
    bool standalone;
};

} // namespace mdast

#endif
