/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "helpers.h"

using namespace mdast;
using test::html;

namespace {

class BracketHighlighter: public SyntaxHighlighter {
public:
    void highlight(const string& code, const string& lang, std::ostream& out) override {
        out << '[' << lang << ':' << code << ']';
    }
};

} // namespace

TEST_CASE("encodeString flags", "[html]") {
    CHECK(encodeString("a & b &amp; <c> \"d\"", cAmps | cAngles | cQuotes)
          =="a &amp; b &amp; &lt;c&gt; &quot;d&quot;");
    CHECK(encodeString("&amp; &#35; &x", cDoubleAmps)=="&amp;amp; &amp;#35; &amp;x");
    CHECK(encodeString("<&>", 0)=="<&>");
}

TEST_CASE("headings, paragraphs and emphasis", "[html]") {
    CHECK(html("# Hi\n\nSome *em* and **strong**.")
          =="<h1>Hi</h1>\n<p>Some <em>em</em> and <strong>strong</strong>.</p>\n");
    CHECK(html("~~x~~ `a<b`")=="<p><del>x</del> <code>a&lt;b</code></p>\n");
    CHECK(html("a & b < c")=="<p>a &amp; b &lt; c</p>\n");
}

TEST_CASE("quotes, breaks and rules", "[html]") {
    CHECK(html("> a  \n> b\n\n---")
          =="<blockquote>\n<p>a<br />\nb</p>\n</blockquote>\n<hr />\n");
}

TEST_CASE("tight and loose lists", "[html]") {
    CHECK(html("- a\n- b")=="<ul>\n<li>a</li>\n<li>b</li>\n</ul>\n");
    CHECK(html("- a\n\n- b")=="<ul>\n<li>\n<p>a</p>\n</li>\n<li>\n<p>b</p>\n</li>\n</ul>\n");
    CHECK(html("3. x")=="<ol start=\"3\">\n<li>x</li>\n</ol>\n");
    CHECK(html("1. x")=="<ol>\n<li>x</li>\n</ol>\n");
}

TEST_CASE("code blocks", "[html]") {
    CHECK(html("```c\na<b\n```")=="<pre><code class=\"language-c\">a&lt;b\n</code></pre>\n");
    CHECK(html("    x")=="<pre><code>x\n</code></pre>\n");
}

TEST_CASE("a highlighter writes the body of named code blocks", "[html]") {
    BracketHighlighter highlighter;
    HtmlWriter writer(WriterOptions(), &highlighter);
    MarkdownReader reader;
    CHECK(writer.write(reader.read("```py\nx\n```"))
          =="<pre><code class=\"language-py\">[py:x\n]</code></pre>\n");
    CHECK(writer.write(reader.read("```\nx\n```"))=="<pre><code>x\n</code></pre>\n");
}

TEST_CASE("HTML links and images", "[html]") {
    CHECK(html("[a](/u \"t\") ![i *j*](/p.png)")
          =="<p><a href=\"/u\" title=\"t\">a</a> <img src=\"/p.png\" alt=\"i j\" /></p>\n");
    CHECK(html("<http://x.org/?a=1&b=2>")
          =="<p><a href=\"http://x.org/?a=1&amp;b=2\">http://x.org/?a=1&amp;b=2</a></p>\n");
    CHECK(html("[a](\\&amp;) ![b](/p?x=1&amp;y=2)")
          =="<p><a href=\"&amp;amp;\">a</a> <img src=\"/p?x=1&amp;y=2\" alt=\"b\" /></p>\n");
}

TEST_CASE("HTML tables", "[html]") {
    CHECK(html("| a | b |\n| :-- | --: |\n| 1 | 2 |")==
          "<table>\n<thead>\n<tr>\n"
          "<th style=\"text-align: left;\">a</th>\n"
          "<th style=\"text-align: right;\">b</th>\n"
          "</tr>\n</thead>\n<tbody>\n<tr>\n"
          "<td style=\"text-align: left;\">1</td>\n"
          "<td style=\"text-align: right;\">2</td>\n"
          "</tr>\n</tbody>\n</table>\n");
}

TEST_CASE("a standalone page carries the title", "[html]") {
    Document doc;
    doc.meta["title"]=MetaString{ "A & B" };
    Para p;
    p.content.push_back(test::str("x"));
    doc.blocks.push_back(p);

    HtmlWriter writer((WriterOptions(true)));
    const string page=writer.write(doc);
    CHECK(page.compare(0, 15, "<!DOCTYPE html>")==0);
    CHECK(page.find("<title>A &amp; B</title>")!=string::npos);
    CHECK(page.find("<body>\n<p>x</p>\n</body>\n</html>\n")!=string::npos);
}

TEST_CASE("constructs without an HTML rendering are rejected", "[html]") {
    HtmlWriter writer;

    Document withDiv;
    withDiv.blocks.push_back(Div());
    try {
        writer.write(withDiv);
        FAIL("no exception");
    } catch (UnsupportedConstruct& e) {
        CHECK(e.format()=="html");
        CHECK(e.construct()=="Div");
    }

    Document withMath;
    Para p;
    p.content.push_back(Math{ cInlineMath, "x" });
    withMath.blocks.push_back(p);
    CHECK_THROWS_AS(writer.write(withMath), UnsupportedConstruct);
}
