/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "helpers.h"

using namespace mdast;
using test::str;

namespace {

Inlines words(const string& a, const string& b) {
    Inlines r;
    r.push_back(str(a));
    r.push_back(Space());
    r.push_back(str(b));
    return r;
}

Blocks para(const Inlines& content) {
    Para p;
    p.content=content;
    return Blocks(1, Block(p));
}

// A document that uses every constructor at least once.
Document everything() {
    Document doc;

    MetaMap author;
    author.entries["name"]=MetaString{ "Ann" };
    MetaList tags;
    tags.items.push_back(MetaBool{ true });
    tags.items.push_back(MetaInlines{ words("x", "y") });
    doc.meta["author"]=author;
    doc.meta["tags"]=tags;
    doc.meta["abstract"]=MetaBlocks{ para(words("short", "one")) };

    Attr attr;
    attr.identifier="id";
    attr.classes.push_back("c1");
    attr.attributes.push_back(std::make_pair(string("k"), string("v \"q\"")));

    Inlines inl;
    inl.push_back(str("tab\there\x01" "1\x7F"));
    inl.push_back(Emph{ words("e", "f") });
    inl.push_back(Underline{ words("u", "v") });
    inl.push_back(Strong{ words("s", "t") });
    inl.push_back(Strikeout{ words("k", "o") });
    inl.push_back(Superscript{ words("2", "3") });
    inl.push_back(Subscript{ words("i", "j") });
    inl.push_back(SmallCaps{ words("sc", "x") });
    inl.push_back(Quoted{ cDoubleQuote, words("q", "r") });
    inl.push_back(Quoted{ cSingleQuote, Inlines() });

    Citation citation;
    citation.id="doe99";
    citation.prefix=words("see", "also");
    citation.mode=cAuthorInText;
    citation.noteNum=-1;
    citation.hash=7;
    Cite cite;
    cite.citations.push_back(citation);
    cite.content.push_back(str("@doe99"));
    inl.push_back(cite);

    inl.push_back(Code{ attr, "a \\ b" });
    inl.push_back(SoftBreak());
    inl.push_back(LineBreak());
    inl.push_back(Math{ cInlineMath, "x^2" });
    inl.push_back(Math{ cDisplayMath, "\\sum" });
    inl.push_back(RawInline{ "html", "<br>" });
    inl.push_back(Link{ Attr(), words("l", "m"), Target{ "/u", "t" } });
    inl.push_back(Image{ attr, words("caf\xC3\xA9", "x"), Target{ "/i.png", "" } });
    inl.push_back(Note{ para(words("n", "o")) });
    inl.push_back(Span{ attr, words("sp", "an") });

    Blocks& b=doc.blocks;
    b.push_back(Plain{ inl });
    b.push_back(Para{ words("p", "q") });

    LineBlock lines;
    lines.lines.push_back(words("l1", "a"));
    lines.lines.push_back(Inlines());
    b.push_back(lines);

    b.push_back(CodeBlock{ attr, "line 1\nline 2" });
    b.push_back(RawBlock{ "latex", "\\newpage" });
    b.push_back(BlockQuote{ para(words("bq", "x")) });

    OrderedList ol;
    ol.attributes.start=-3;
    ol.attributes.style=cLowerRoman;
    ol.attributes.delim=cTwoParens;
    ol.items.push_back(para(words("a", "b")));
    ol.items.push_back(Blocks());
    b.push_back(ol);

    BulletList bl;
    bl.items.push_back(Blocks(1, Block(HorizontalRule())));
    b.push_back(bl);

    DefinitionItem item;
    item.term=words("term", "x");
    item.definitions.push_back(para(words("def", "y")));
    DefinitionList dl;
    dl.items.push_back(item);
    b.push_back(dl);

    b.push_back(Header{ 2, attr, words("h", "i") });
    b.push_back(HorizontalRule());

    Table t;
    t.attr=attr;
    t.caption.shortCaption=words("short", "cap");
    t.caption.content=para(words("long", "cap"));
    t.colSpecs.push_back(ColSpec(cAlignLeft, ColWidth(0.25)));
    t.colSpecs.push_back(ColSpec(cAlignRight, ColWidth()));
    Row row;
    Cell cell=makeCell(words("c", "d"));
    cell.rowSpan=2;
    row.cells.push_back(cell);
    row.cells.push_back(Cell());
    t.head.rows.push_back(row);
    TableBody body;
    body.rowHeadColumns=1;
    body.head.push_back(row);
    body.body.push_back(row);
    t.bodies.push_back(body);
    t.foot.rows.push_back(row);
    b.push_back(t);

    Figure figure;
    figure.attr=attr;
    figure.caption.content=para(words("fig", "cap"));
    figure.content=para(words("fig", "body"));
    b.push_back(figure);

    b.push_back(Div{ attr, para(words("div", "x")) });
    return doc;
}

} // namespace

TEST_CASE("showString escapes like Haskell's show", "[native]") {
    CHECK(showString("plain")=="\"plain\"");
    CHECK(showString("a\"b\\c")=="\"a\\\"b\\\\c\"");
    CHECK(showString("a\nb\tc")=="\"a\\nb\\tc\"");
    CHECK(showString("\x01x")=="\"\\1x\"");
    CHECK(showString("\x01" "2")=="\"\\1\\&2\"");
    CHECK(showString("\x7F")=="\"\\127\"");
    CHECK(showString("caf\xC3\xA9")=="\"caf\xC3\xA9\"");
}

TEST_CASE("the native writer shows the whole document", "[native]") {
    Document doc;
    doc.blocks=para(words("hi", "there"));
    NativeWriter writer;
    CHECK(writer.write(doc)
          =="Pandoc (Meta {unMeta = fromList []}) [Para [Str \"hi\",Space,Str \"there\"]]\n");

    doc.meta["title"]=MetaString{ "T" };
    CHECK(writer.write(doc)
          =="Pandoc (Meta {unMeta = fromList [(\"title\",MetaString \"T\")]}) "
            "[Para [Str \"hi\",Space,Str \"there\"]]\n");
}

TEST_CASE("every constructor survives a round trip", "[native]") {
    const Document doc=everything();
    NativeWriter writer;
    NativeReader reader;
    const string text=writer.write(doc);
    const Document back=reader.parse(text);
    CHECK(back==doc);
    CHECK(writer.write(back)==text);
}

TEST_CASE("a parsed Markdown document survives a round trip", "[native]") {
    const string source=
        "# Title\n\n"
        "Some *emph*, **strong**, ~~gone~~ and `code`.\n\n"
        "> quoted\n> text\n\n"
        "1. one\n2. two\n\n"
        "- a\n\n- b\n\n"
        "| x | y |\n|:--|--:|\n| 1 | 2 |\n\n"
        "```cpp\nint main() {}\n```\n\n"
        "[link](/u \"t\") ![img](/i.png) <http://e.com>\n\n"
        "---\n";
    MarkdownReader markdown;
    const Document doc=markdown.read(source);

    NativeWriter writer;
    NativeReader reader;
    CHECK(reader.parse(writer.write(doc))==doc);
}

TEST_CASE("the reader accepts a bare block list and loose spacing", "[native]") {
    NativeReader reader;
    CHECK(test::native(reader.parse("[Para [Str \"a\"]]").blocks)==R"([Para [Str "a"]])");
    CHECK(test::native(reader.parse("[ Para\n    [ Str \"a\" , Space ]\n]\n").blocks)
          ==R"([Para [Str "a",Space]])");
    CHECK(test::native(reader.parse("[(Para [(Str \"a\")])]").blocks)==R"([Para [Str "a"]])");
    CHECK(reader.parse("[]").blocks.empty());
}

TEST_CASE("string escapes", "[native]") {
    NativeReader reader;
    Document doc=reader.parse("[Plain [Str \"caf\\233 \\x41\\o102 \\49\\&5 \\DEL\"]]");
    REQUIRE(doc.blocks.size()==1);
    const Plain *p=boost::get<Plain>(&doc.blocks[0]);
    REQUIRE(p!=0);
    CHECK(stringify(p->content)=="caf\xC3\xA9 AB 15 \x7F");
}

TEST_CASE("malformed input raises ReadError", "[native]") {
    NativeReader reader;
    CHECK_THROWS_AS(reader.parse("[Para [Str \"x\"]"), ReadError);
    CHECK_THROWS_AS(reader.parse("[Para [Str \"x]]"), ReadError);
    CHECK_THROWS_AS(reader.parse("[Para [Str \"x\"]] extra"), ReadError);
    CHECK_THROWS_AS(reader.parse("[Plain [Str \"\\q\"]]"), ReadError);
    CHECK_THROWS_AS(reader.parse("[OrderedList (1,Decimal,Comma) []]"), ReadError);

    try {
        reader.parse("[Bogus]");
        FAIL("no exception");
    } catch (ReadError& e) {
        CHECK(e.offset()==1);
    }
}
