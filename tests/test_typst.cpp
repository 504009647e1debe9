/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "helpers.h"

using namespace mdast;

namespace {

string typst(const string& text) {
    MarkdownReader reader;
    TypstWriter writer;
    return writer.write(reader.read(text));
}

} // namespace

TEST_CASE("escaping Typst markup", "[typst]") {
    CHECK(escapeTypst("a*b_c #d")=="a\\*b\\_c \\#d");
    CHECK(escapeTypst("1. x-y")=="\\1. x\\-y");
    CHECK(escapeTypst("a//b")=="a\\/\\/b");
    CHECK(escapeTypst("plain")=="plain");
}

TEST_CASE("Typst headings and inline markup", "[typst]") {
    CHECK(typst("# T\n\n*a* **b** ~~c~~ `d`")=="= T\n\n_a_ *b* #strike[c] `d`\n\n");
    CHECK(typst("### x")=="=== x\n\n");
    CHECK(typst("a-b")=="a\\-b\n\n");
    CHECK(typst("a  \nb")=="a\\\nb\n\n");
}

TEST_CASE("emphasis inside emphasis has no inner delimiters", "[typst]") {
    CHECK(typst("*a _b_ c*")=="_a b c_\n\n");
}

TEST_CASE("code spans with backticks become raw calls", "[typst]") {
    CHECK(typst("`` a`b ``")=="#raw(\"a`b\")\n\n");
}

TEST_CASE("Typst links and images", "[typst]") {
    CHECK(typst("[a](/u) ![i](/p.png)")
          =="#link(\"/u\")[a] #box(image(\"/p.png\", alt: \"i\"))\n\n");
}

TEST_CASE("code blocks, quotes and rules", "[typst]") {
    CHECK(typst("```c\nx\n```")=="```c\nx\n```\n\n");
    CHECK(typst("````\n```\n````")=="````\n```\n````\n\n");
    CHECK(typst("> q")=="#quote(block: true)[\nq\n\n]\n\n");
    CHECK(typst("***")=="#line(length: 100%)\n\n");
}

TEST_CASE("Typst lists", "[typst]") {
    CHECK(typst("- a\n- b")=="- a\n- b\n\n");
    CHECK(typst("3. a\n4. b")=="3. a\n4. b\n\n");
    CHECK(typst("- a\n\n- b")=="- a\n\n- b\n\n");
    CHECK(typst("- a\n  - b")=="- a\n  - b\n\n");
}

TEST_CASE("Typst tables", "[typst]") {
    CHECK(typst("| a | b |\n|:-:|--:|\n| 1 | 2 |")
          =="#table(\n  columns: 2,\n  align: (center, right,),\n"
            "  [a], [b],\n  [\\1], [\\2],\n)\n\n");
}

TEST_CASE("a standalone document sets its title", "[typst]") {
    Document doc;
    Para p;
    p.content.push_back(test::str("x"));
    doc.blocks.push_back(p);

    TypstWriter writer((WriterOptions(true)));
    CHECK(writer.write(doc)=="x\n\n");

    doc.meta["title"]=MetaString{ "A \"B\"" };
    CHECK(writer.write(doc)=="#set document(title: \"A \\\"B\\\"\")\n\nx\n\n");
}

TEST_CASE("constructs without a Typst rendering are rejected", "[typst]") {
    TypstWriter writer;

    Document withDiv;
    withDiv.blocks.push_back(Div());
    try {
        writer.write(withDiv);
        FAIL("no exception");
    } catch (UnsupportedConstruct& e) {
        CHECK(e.format()=="typst");
        CHECK(e.construct()=="Div");
    }

    Document withMath;
    Para p;
    p.content.push_back(Math{ cInlineMath, "x" });
    withMath.blocks.push_back(p);
    CHECK_THROWS_AS(writer.write(withMath), UnsupportedConstruct);
}
