/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "helpers.h"
#include "link_ids.h"

using namespace mdast;
using test::md;

TEST_CASE("labels are folded and whitespace collapsed", "[links]") {
    CHECK(LinkIds::scrubKey("  Foo \n Bar ")=="foo bar");
    CHECK(LinkIds::scrubKey("ABC")=="abc");
}

TEST_CASE("the first definition of a label wins", "[links]") {
    LinkIds ids;
    CHECK(ids.add("a", "/1", none));
    CHECK_FALSE(ids.add("A", "/2", string("t")));
    CHECK(ids.size()==1);

    optional<LinkIds::Target> found=ids.find("a");
    REQUIRE(found.is_initialized());
    CHECK(found->url=="/1");
    CHECK_FALSE(found->title.is_initialized());
    CHECK_FALSE(ids.find("b").is_initialized());
}

TEST_CASE("scanning link labels", "[links]") {
    string label;
    optional<size_t> end=scanLinkLabel("[foo] bar", 0, label);
    REQUIRE(end.is_initialized());
    CHECK(*end==5);
    CHECK(label=="foo");

    CHECK_FALSE(scanLinkLabel("[]", 0, label).is_initialized());
    CHECK_FALSE(scanLinkLabel("[  ]", 0, label).is_initialized());
    CHECK_FALSE(scanLinkLabel("[a[b]", 0, label).is_initialized());
    CHECK(scanLinkLabel("[a\\]b]", 0, label).is_initialized());
    CHECK_FALSE(scanLinkLabel("[" + string(1000, 'x') + "]", 0, label).is_initialized());
}

TEST_CASE("scanning link destinations", "[links]") {
    string url;
    optional<size_t> end=scanLinkDestination("<a b> x", 0, url);
    REQUIRE(end.is_initialized());
    CHECK(*end==5);
    CHECK(url=="a b");

    end=scanLinkDestination("/p(a(b)) x", 0, url);
    REQUIRE(end.is_initialized());
    CHECK(url=="/p(a(b))");

    end=scanLinkDestination("/a\\*b", 0, url);
    REQUIRE(end.is_initialized());
    CHECK(url=="/a*b");

    CHECK_FALSE(scanLinkDestination("<bad", 0, url).is_initialized());
}

TEST_CASE("scanning link titles", "[links]") {
    string title;
    optional<size_t> end=scanLinkTitle("\"a b\" x", 0, title);
    REQUIRE(end.is_initialized());
    CHECK(*end==5);
    CHECK(title=="a b");

    CHECK(scanLinkTitle("'x'", 0, title).is_initialized());
    CHECK(title=="x");
    CHECK(scanLinkTitle("(x)", 0, title).is_initialized());
    CHECK_FALSE(scanLinkTitle("\"open", 0, title).is_initialized());
}

TEST_CASE("definitions are read off the front of a paragraph", "[links]") {
    LinkIds ids;
    CHECK(parseLinkDefinitions("[a]: /x\n[b]: /y 'T'\nrest", ids)==20);
    REQUIRE(ids.size()==2);
    CHECK(ids.find("b")->title.get()=="T");

    LinkIds titled;
    CHECK(parseLinkDefinitions("[a]: /u\n'title'", titled)==15);
    CHECK(titled.find("a")->title.get()=="title");

    LinkIds invalid;
    CHECK(parseLinkDefinitions("[a]: <bad\n", invalid)==0);
    CHECK(invalid.size()==0);
}

TEST_CASE("reference links", "[links]") {
    CHECK(md("[foo]\n\n[foo]: /url \"t\"")==R"([Para [Link ("",[],[]) [Str "foo"] ("/url","t")]])");
    CHECK(md("[text][Foo]\n\n[foo]: /u")==R"([Para [Link ("",[],[]) [Str "text"] ("/u","")]])");
    CHECK(md("[foo][]\n\n[foo]: /u")==R"([Para [Link ("",[],[]) [Str "foo"] ("/u","")]])");
    CHECK(md("![foo]\n\n[foo]: /i.png")==R"([Para [Image ("",[],[]) [Str "foo"] ("/i.png","")]])");
}

TEST_CASE("a definition may follow its use", "[links]") {
    CHECK(md("- [x]\n\n> [x]: /q")==R"([BulletList [[Plain [Link ("",[],[]) [Str "x"] ("/q","")]]],BlockQuote []])");
}

TEST_CASE("an undefined full reference is literal", "[links]") {
    CHECK(md("[a][missing]")==R"([Para [Str "[a][missing]"]])");
}

TEST_CASE("an underline after nothing but definitions is not a heading", "[links]") {
    CHECK(md("[foo]: /url\n===")==R"([Para [Str "==="]])");
    CHECK(md("[foo]: /url\n---")==R"([HorizontalRule])");
    CHECK(md("[foo]: /url\n--")==R"([Para [Str "--"]])");
    CHECK(md("[foo]: /url\n===\nbar")==R"([Para [Str "===",SoftBreak,Str "bar"]])");
    CHECK(md("[foo]: /url\n===\n\n[foo]")
          ==R"([Para [Str "==="],Para [Link ("",[],[]) [Str "foo"] ("/url","")]])");

    CHECK(md("[foo]: /url\nbar\n===")==R"([Header 1 ("",[],[]) [Str "bar"]])");
    CHECK(md("[foo]:\n===")==R"([Header 1 ("",[],[]) [Str "[foo]:"]])");
}
