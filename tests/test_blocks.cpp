/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "helpers.h"

using test::md;

TEST_CASE("thematic breaks", "[blocks]") {
    CHECK(md("***")=="[HorizontalRule]");
    CHECK(md("---")=="[HorizontalRule]");
    CHECK(md("___")=="[HorizontalRule]");
    CHECK(md(" ***")=="[HorizontalRule]");
    CHECK(md("* * *")=="[HorizontalRule]");
    CHECK(md("- - - -")=="[HorizontalRule]");
}

TEST_CASE("four spaces of indent make code, not a break", "[blocks]") {
    CHECK(md("    ***")==R"([CodeBlock ("",[],[]) "***"])");
}

TEST_CASE("too few or mixed characters are not a break", "[blocks]") {
    CHECK(md("**")==R"([Para [Str "**"]])");
    CHECK(md("*-*")==R"([Para [Emph [Str "-"]]])");
}

TEST_CASE("ATX headings", "[blocks]") {
    CHECK(md("# foo")==R"([Header 1 ("",[],[]) [Str "foo"]])");
    CHECK(md("###### foo")==R"([Header 6 ("",[],[]) [Str "foo"]])");
    CHECK(md("####### foo")==R"([Para [Str "#######",Space,Str "foo"]])");
    CHECK(md("#5 bolt")==R"([Para [Str "#5",Space,Str "bolt"]])");
    CHECK(md("#")==R"([Header 1 ("",[],[]) []])");
}

TEST_CASE("closing hashes of ATX headings", "[blocks]") {
    CHECK(md("## foo ##")==R"([Header 2 ("",[],[]) [Str "foo"]])");
    CHECK(md("### foo ###   ")==R"([Header 3 ("",[],[]) [Str "foo"]])");
    CHECK(md("# foo#")==R"([Header 1 ("",[],[]) [Str "foo#"]])");
}

TEST_CASE("setext headings", "[blocks]") {
    CHECK(md("Foo\n====")==R"([Header 1 ("",[],[]) [Str "Foo"]])");
    CHECK(md("Foo\n----")==R"([Header 2 ("",[],[]) [Str "Foo"]])");
    CHECK(md("Foo\nbar\n===")==R"([Header 1 ("",[],[]) [Str "Foo",SoftBreak,Str "bar"]])");
}

TEST_CASE("an underline with inner spaces is paragraph text", "[blocks]") {
    CHECK(md("Foo\n= =")==R"([Para [Str "Foo",SoftBreak,Str "=",Space,Str "="]])");
}

TEST_CASE("paragraphs are separated by blank lines", "[blocks]") {
    CHECK(md("aaa\n\nbbb")==R"([Para [Str "aaa"],Para [Str "bbb"]])");
    CHECK(md("aaa\n   bbb")==R"([Para [Str "aaa",SoftBreak,Str "bbb"]])");
    CHECK(md("\n\n  \n")=="[]");
    CHECK(md("")=="[]");
}

TEST_CASE("indented code cannot interrupt a paragraph", "[blocks]") {
    CHECK(md("foo\n    bar")==R"([Para [Str "foo",SoftBreak,Str "bar"]])");
}

TEST_CASE("indented code keeps interior blank lines", "[blocks]") {
    CHECK(md("    a\n\n    b\n")==R"([CodeBlock ("",[],[]) "a\n\nb"])");
    CHECK(md("    a\n\n\nb")==R"([CodeBlock ("",[],[]) "a"],Para [Str "b"]])");
    CHECK(md("      indented")==R"([CodeBlock ("",[],[]) "  indented"])");
}

TEST_CASE("fenced code", "[blocks]") {
    CHECK(md("```\ncode\n```")==R"([CodeBlock ("",[],[]) "code"])");
    CHECK(md("```python extra\nx = 1\n```")==R"([CodeBlock ("",["python"],[]) "x = 1"])");
    CHECK(md("~~~\na\n\nb")==R"([CodeBlock ("",[],[]) "a\n\nb"])");
    CHECK(md("````\na\n```\n````")==R"([CodeBlock ("",[],[]) "a\n```"])");
}

TEST_CASE("a backtick fence rejects backticks in its info string", "[blocks]") {
    CHECK(md("``` a`b")==R"([Para [Str "```",Space,Str "a`b"]])");
}

TEST_CASE("block quotes", "[blocks]") {
    CHECK(md("> a\n> b")==R"([BlockQuote [Para [Str "a",SoftBreak,Str "b"]]])");
    CHECK(md(">\n> a")==R"([BlockQuote [Para [Str "a"]]])");
    CHECK(md("> # h\n> text")
          ==R"([BlockQuote [Header 1 ("",[],[]) [Str "h"],Para [Str "text"]]])");
}

TEST_CASE("a tab after the quote marker keeps its column", "[blocks]") {
    CHECK(md(">\t\tfoo")==R"([BlockQuote [CodeBlock ("",[],[]) "  foo"]])");
}

TEST_CASE("lazy continuation of a quoted paragraph", "[blocks]") {
    CHECK(md("> a\nb")==R"([BlockQuote [Para [Str "a",SoftBreak,Str "b"]]])");
    CHECK(md("> a\n\nb")==R"([BlockQuote [Para [Str "a"]],Para [Str "b"]])");
}

TEST_CASE("a thematic break ends a quote instead of underlining it", "[blocks]") {
    CHECK(md("> a\n---")==R"([BlockQuote [Para [Str "a"]],HorizontalRule])");
}

TEST_CASE("line endings and NUL bytes", "[blocks]") {
    CHECK(md("a\r\nb\rc")==R"([Para [Str "a",SoftBreak,Str "b",SoftBreak,Str "c"]])");
    CHECK(md(std::string("a\0b", 3))=="[Para [Str \"a\xEF\xBF\xBD" "b\"]]");
}

TEST_CASE("deeply nested quotes", "[blocks]") {
    const size_t depth=500;
    std::string expected="[";
    for (size_t x=0; x<depth; ++x) expected+="BlockQuote [";
    expected+="Para [Str \"x\"]";
    expected+=std::string(depth, ']');
    expected+="]";
    CHECK(md(std::string(depth, '>') + " x")==expected);
}
