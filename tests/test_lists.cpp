/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "helpers.h"

using test::md;

TEST_CASE("tight bullet list", "[lists]") {
    CHECK(md("- a\n- b")==R"([BulletList [[Plain [Str "a"]],[Plain [Str "b"]]]])");
    CHECK(md("* a\n* b\n\n")==R"([BulletList [[Plain [Str "a"]],[Plain [Str "b"]]]])");
}

TEST_CASE("a blank line between items makes the list loose", "[lists]") {
    CHECK(md("- a\n\n- b")==R"([BulletList [[Para [Str "a"]],[Para [Str "b"]]]])");
}

TEST_CASE("a blank line inside an item makes the list loose", "[lists]") {
    CHECK(md("- a\n\n  b\n- c")
          ==R"([BulletList [[Para [Str "a"],Para [Str "b"]],[Para [Str "c"]]]])");
}

TEST_CASE("ordered lists keep their start number and delimiter", "[lists]") {
    CHECK(md("1. a\n2. b")
          ==R"([OrderedList (1,Decimal,Period) [[Plain [Str "a"]],[Plain [Str "b"]]]])");
    CHECK(md("3. a")==R"([OrderedList (3,Decimal,Period) [[Plain [Str "a"]]]])");
    CHECK(md("1) a")==R"([OrderedList (1,Decimal,OneParen) [[Plain [Str "a"]]]])");
}

TEST_CASE("a different marker starts a new list", "[lists]") {
    CHECK(md("1) a\n2. b")==R"([OrderedList (1,Decimal,OneParen) [[Plain [Str "a"]]],)"
                             R"(OrderedList (2,Decimal,Period) [[Plain [Str "b"]]]])");
    CHECK(md("- a\n+ b")==R"([BulletList [[Plain [Str "a"]]],BulletList [[Plain [Str "b"]]]])");
}

TEST_CASE("ordinals have at most nine digits", "[lists]") {
    CHECK(md("123456789. x")==R"([OrderedList (123456789,Decimal,Period) [[Plain [Str "x"]]]])");
    CHECK(md("1234567890. x")==R"([Para [Str "1234567890.",Space,Str "x"]])");
}

TEST_CASE("nested lists", "[lists]") {
    CHECK(md("- a\n  - b\n- c")
          ==R"([BulletList [[Plain [Str "a"],BulletList [[Plain [Str "b"]]]],[Plain [Str "c"]]]])");
    CHECK(md("1. a\n\n   > q")
          ==R"([OrderedList (1,Decimal,Period) [[Para [Str "a"],BlockQuote [Para [Str "q"]]]]])");
}

TEST_CASE("lazy continuation of an item's paragraph", "[lists]") {
    CHECK(md("- a\nb")==R"([BulletList [[Plain [Str "a",SoftBreak,Str "b"]]]])");
}

TEST_CASE("unindented text after a blank line ends the list", "[lists]") {
    CHECK(md("- a\n\nb")==R"([BulletList [[Plain [Str "a"]]],Para [Str "b"]])");
}

TEST_CASE("a thematic break ends the list", "[lists]") {
    CHECK(md("- a\n- - -")==R"([BulletList [[Plain [Str "a"]]],HorizontalRule])");
    CHECK(md("- a\n***")==R"([BulletList [[Plain [Str "a"]]],HorizontalRule])");
}

TEST_CASE("empty list items", "[lists]") {
    CHECK(md("-\n\n  foo")==R"([BulletList [[]],Para [Str "foo"]])");
    CHECK(md("- a\n-\n- c")==R"([BulletList [[Plain [Str "a"]],[],[Plain [Str "c"]]]])");
}

TEST_CASE("code inside list items", "[lists]") {
    CHECK(md("-     code")==R"([BulletList [[CodeBlock ("",[],[]) "code"]]])");
    CHECK(md("- foo\n\n      bar")
          ==R"([BulletList [[Para [Str "foo"],CodeBlock ("",[],[]) "bar"]]])");
}

TEST_CASE("what may interrupt a paragraph", "[lists]") {
    CHECK(md("foo\n- bar")==R"([Para [Str "foo"],BulletList [[Plain [Str "bar"]]]])");
    CHECK(md("foo\n2. bar")==R"([Para [Str "foo",SoftBreak,Str "2.",Space,Str "bar"]])");
    CHECK(md("foo\n*")==R"([Para [Str "foo",SoftBreak,Str "*"]])");
    CHECK(md("a\n01. b")==R"([Para [Str "a"],OrderedList (1,Decimal,Period) [[Plain [Str "b"]]]])");
    CHECK(md("a\n02. b")==R"([Para [Str "a",SoftBreak,Str "02.",Space,Str "b"]])");
}

TEST_CASE("tab stops carry into list items", "[lists]") {
    CHECK(md("-\tfoo\n\n\tbar")==R"([BulletList [[Para [Str "foo"],Para [Str "bar"]]]])");
    CHECK(md("  - foo\n\n\tbar")==R"([BulletList [[Para [Str "foo"],Para [Str "bar"]]]])");
}
