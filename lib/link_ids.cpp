/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "link_ids.h"
#include "chars.h"
#include "entities.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <spdlog/spdlog.h>

namespace mdast {

namespace {

const size_t cMaxLabelLength=999;
const size_t cMaxParenDepth=32;

size_t skipSpaces(const string& src, size_t pos) {
    while (pos<src.size() && isSpaceOrTab(src[pos])) ++pos;
    return pos;
}

} // namespace

optional<LinkIds::Target> LinkIds::find(const string& id) const {
    Table::const_iterator i=mTable.find(scrubKey(id));
    if (i!=mTable.end()) return i->second;
    else return none;
}

bool LinkIds::add(const string& id, const string& url, const optional<string>& title) {
    return mTable.insert(std::make_pair(scrubKey(id), Target(url, title))).second;
}

string LinkIds::scrubKey(const string& str) {
    string r;
    bool space=false;
    for (auto i=str.cbegin(), ie=str.cend(); i!=ie; ++i) {
        if (*i==' ' || *i=='\t' || *i=='\n' || *i=='\r') {
            space=true;
        } else {
            if (space && !r.empty()) r.push_back(' ');
            space=false;
            r.push_back(*i);
        }
    }
    boost::algorithm::to_lower(r);
    return r;
}

optional<size_t> scanLinkLabel(const string& src, size_t pos, string& label) {
    if (pos>=src.size() || src[pos]!='[') return none;
    bool content=false;
    size_t i=pos+1;
    for (; i<src.size(); ++i) {
        char c=src[i];
        if (i-pos-1>cMaxLabelLength) return none;
        if (c=='\\' && i+1<src.size() && isAsciiPunctuation(src[i+1])) {
            content=true;
            ++i;
        } else if (c=='[') {
            return none;
        } else if (c==']') {
            if (!content) return none;
            label=src.substr(pos+1, i-pos-1);
            return i+1;
        } else if (!isSpaceOrTab(c) && c!='\n') {
            content=true;
        }
    }
    return none;
}

optional<size_t> scanLinkDestination(const string& src, size_t pos, string& url) {
    const size_t end=src.size();
    if (pos<end && src[pos]=='<') {
        for (size_t i=pos+1; i<end; ++i) {
            char c=src[i];
            if (c=='\\' && i+1<end && isAsciiPunctuation(src[i+1])) ++i;
            else if (c=='\n' || c=='<') return none;
            else if (c=='>') {
                url=unescapeString(src.substr(pos+1, i-pos-1));
                return i+1;
            }
        }
        return none;
    }

    size_t depth=0, i=pos;
    for (; i<end; ++i) {
        unsigned char c=static_cast<unsigned char>(src[i]);
        if (c=='\\' && i+1<end && isAsciiPunctuation(src[i+1])) ++i;
        else if (c<=' ' || c==0x7F) break;
        else if (c=='(') {
            if (++depth>cMaxParenDepth) return none;
        } else if (c==')') {
            if (depth==0) break;
            --depth;
        }
    }
    if (i==pos || depth!=0) return none;
    url=unescapeString(src.substr(pos, i-pos));
    return i;
}

optional<size_t> scanLinkTitle(const string& src, size_t pos, string& title) {
    if (pos>=src.size()) return none;
    char open=src[pos], close=open;
    if (open=='(') close=')';
    else if (open!='"' && open!='\'') return none;

    for (size_t i=pos+1; i<src.size(); ++i) {
        char c=src[i];
        if (c=='\\' && i+1<src.size() && isAsciiPunctuation(src[i+1])) ++i;
        else if (c==close) {
            title=unescapeString(src.substr(pos+1, i-pos-1));
            return i+1;
        } else if (open=='(' && c=='(') return none;
    }
    return none;
}

size_t parseLinkDefinitions(const string& text, LinkIds& ids) {
    size_t done=0;
    const size_t end=text.size();
    while (done<end) {
        string label, url, title;
        optional<size_t> q=scanLinkLabel(text, done, label);
        if (!q || *q>=end || text[*q]!=':') break;

        size_t i=skipSpaces(text, *q+1);
        if (i<end && text[i]=='\n') i=skipSpaces(text, i+1);
        q=scanLinkDestination(text, i, url);
        if (!q) break;

        // Where the definition ends if it turns out to have no title.
        optional<size_t> lineEnd;
        i=skipSpaces(text, *q);
        bool separated=(i>*q);
        if (i==end) lineEnd=end;
        else if (text[i]=='\n') {
            lineEnd=i+1;
            i=skipSpaces(text, i+1);
            separated=true;
        }

        optional<string> foundTitle;
        size_t next=0;
        if (separated) {
            optional<size_t> t=scanLinkTitle(text, i, title);
            if (t) {
                size_t after=skipSpaces(text, *t);
                if (after==end || text[after]=='\n') {
                    foundTitle=title;
                    next=(after==end ? end : after+1);
                }
            }
        }
        if (!foundTitle) {
            if (!lineEnd) break;
            next=*lineEnd;
        }

        if (ids.add(label, url, foundTitle))
            spdlog::debug("link definition [{}] -> {}", label, url);
        else
            spdlog::debug("ignoring duplicate link definition [{}]", label);
        done=next;
    }
    return done;
}

} // namespace mdast
