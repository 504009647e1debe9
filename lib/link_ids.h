/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_LINK_IDS_H_INCLUDED
#define MDAST_LINK_IDS_H_INCLUDED

#include <string>
#include <unordered_map>

#include <boost/optional.hpp>

namespace mdast {

using std::string;
using boost::optional;
using boost::none;

// The link reference table. Labels are matched case-insensitively with runs
// of whitespace collapsed; the first definition of a label wins.
class LinkIds {
public:
    struct Target {
        Target(const string& url_, const optional<string>& title_)
            : url(url_), title(title_) { }

        string url;
        optional<string> title;
    };

    optional<Target> find(const string& id) const;

    // Returns false, leaving the table alone, if the label is already defined.
    bool add(const string& id, const string& url, const optional<string>& title);

    size_t size() const { return mTable.size(); }

    static string scrubKey(const string& str);

private:
    typedef std::unordered_map<string, Target> Table;

    Table mTable;
};

// Link syntax scanners shared by definitions and inline links. Each one
// starts at `pos`, stores what it read in its output argument and returns
// the position just past the construct, or none if there is none there.

// A bracketed label: at most 999 characters, no unescaped brackets inside and
// at least one non-whitespace character. The label is returned raw.
optional<size_t> scanLinkLabel(const string& src, size_t pos, string& label);

// A destination in angle brackets (possibly empty) or a bare run of
// non-space characters with balanced parentheses. Escapes and entity
// references are resolved.
optional<size_t> scanLinkDestination(const string& src, size_t pos, string& url);

// A title in double quotes, single quotes or parentheses. It may span lines.
optional<size_t> scanLinkTitle(const string& src, size_t pos, string& title);

// Reads link reference definitions off the front of a paragraph's text and
// adds them to `ids`. Returns the number of bytes they took up.
size_t parseLinkDefinitions(const string& text, LinkIds& ids);

} // namespace mdast

#endif
