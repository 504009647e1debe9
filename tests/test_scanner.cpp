/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "chars.h"
#include "entities.h"
#include "line_scanner.h"

using namespace mdast;

TEST_CASE("blank and indented lines are measured", "[scanner]") {
    ScannedLine blank=ScannedLine::scan("   ");
    CHECK(blank.blank());
    CHECK(blank.first()==0);
    CHECK(blank.indent()==3);
    CHECK(blank.text().empty());

    ScannedLine line=ScannedLine::scan("  foo bar ");
    CHECK_FALSE(line.blank());
    CHECK(line.first()=='f');
    CHECK(line.indent()==2);
    CHECK(line.column()==2);
    CHECK(line.text()=="foo bar ");
}

TEST_CASE("tabs advance to the next tab stop", "[scanner]") {
    CHECK(ScannedLine::scan("\tfoo").indent()==4);
    CHECK(ScannedLine::scan("  \tfoo").indent()==4);
    CHECK(ScannedLine::scan("    \tfoo").indent()==8);

    // A tab after "> " measures from the column the marker left off at.
    ScannedLine quote=ScannedLine::scan(">\tfoo");
    ScannedLine rest=quote.scanRest(1);
    CHECK(rest.column()==4);
    CHECK(rest.indent()==3);
    CHECK(rest.text()=="foo");
}

TEST_CASE("indent can be consumed and put back", "[scanner]") {
    ScannedLine line=ScannedLine::scan("      code");
    line.moveIndent(4);
    CHECK(line.indent()==2);
    CHECK(line.full()=="  code");

    line.moveIndent(10);
    CHECK(line.indent()==0);
    CHECK(line.full()=="code");

    line.setIndent(1);
    CHECK(line.full()==" code");
}

TEST_CASE("scanRest clamps past the end of the text", "[scanner]") {
    ScannedLine line=ScannedLine::scan("#");
    ScannedLine rest=line.scanRest(5);
    CHECK(rest.blank());
}

TEST_CASE("UTF-8 decoding recovers from malformed input", "[scanner]") {
    size_t length=0;
    CHECK(decodeUtf8("\xC3\xA9", 0, &length)==0xE9);
    CHECK(length==2);
    CHECK(decodeUtf8("\xE2\x80\x94", 0, &length)==0x2014);
    CHECK(length==3);
    CHECK(decodeUtf8("\xF0\x9F\x98\x80", 0, &length)==0x1F600);
    CHECK(length==4);

    CHECK(decodeUtf8("\xC3", 0, &length)==cReplacementCharacter);
    CHECK(length==1);
    CHECK(decodeUtf8("\x80x", 0, &length)==cReplacementCharacter);
    CHECK(length==1);

    string out;
    appendUtf8(out, 0x20AC);
    CHECK(out=="\xE2\x82\xAC");
}

TEST_CASE("the ends of the text count as whitespace", "[scanner]") {
    const string text="a\xC3\xA9";
    CHECK(isUnicodeWhitespace(codepointBefore(text, 0)));
    CHECK(codepointBefore(text, 1)=='a');
    CHECK(codepointBefore(text, 3)==0xE9);
    CHECK(isUnicodeWhitespace(codepointAt(text, 3)));
}

TEST_CASE("character classes", "[scanner]") {
    CHECK(isAsciiPunctuation('!'));
    CHECK(isAsciiPunctuation('~'));
    CHECK_FALSE(isAsciiPunctuation('a'));
    CHECK_FALSE(isAsciiPunctuation(' '));

    CHECK(isUnicodeWhitespace(' '));
    CHECK(isUnicodeWhitespace('\t'));
    CHECK(isUnicodeWhitespace(0xA0));
    CHECK(isUnicodeWhitespace(0x3000));
    CHECK_FALSE(isUnicodeWhitespace('x'));

    CHECK(isUnicodePunctuation('*'));
    CHECK(isUnicodePunctuation(0x2014));
    CHECK(isUnicodePunctuation(0x3001));
    CHECK_FALSE(isUnicodePunctuation(0xE9));
    CHECK_FALSE(isUnicodePunctuation('a'));
}

TEST_CASE("named and numeric character references", "[scanner]") {
    string out;
    CHECK(decodeEntity("&amp;", 0, out)==5);
    CHECK(out=="&");

    out.clear();
    CHECK(decodeEntity("x &copy; y", 2, out)==6);
    CHECK(out=="\xC2\xA9");

    out.clear();
    CHECK(decodeEntity("&#35;", 0, out)==5);
    CHECK(out=="#");

    out.clear();
    CHECK(decodeEntity("&#X22;", 0, out)==6);
    CHECK(out=="\"");

    out.clear();
    CHECK(decodeEntity("&#0;", 0, out)==4);
    CHECK(out=="\xEF\xBF\xBD");
}

TEST_CASE("malformed references are left alone", "[scanner]") {
    string out;
    CHECK(decodeEntity("&bogus;", 0, out)==0);
    CHECK(decodeEntity("&amp", 0, out)==0);
    CHECK(decodeEntity("&#12345678;", 0, out)==0);
    CHECK(decodeEntity("&#;", 0, out)==0);
    CHECK(decodeEntity("&#xg;", 0, out)==0);
    CHECK(out.empty());
}

TEST_CASE("unescapeString resolves escapes and references", "[scanner]") {
    CHECK(unescapeString("a\\*b")=="a*b");
    CHECK(unescapeString("a\\qb")=="a\\qb");
    CHECK(unescapeString("&lt;x&gt;")=="<x>");
    CHECK(unescapeString("plain")=="plain");
}
