/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include <catch2/catch.hpp>

#include "blocks.h"
#include "helpers.h"

using namespace mdast;
using test::cellText;
using test::md;
using test::parse;

namespace {

const Table& onlyTable(const Blocks& blocks) {
    REQUIRE(blocks.size()==1);
    const Table *t=boost::get<Table>(&blocks[0]);
    REQUIRE(t!=0);
    return *t;
}

} // namespace

TEST_CASE("a pipe table with a header, alignments and one body row", "[tables]") {
    Blocks blocks=parse("| a | b |\n| --- | :---: |\n| 1 | 2 |");
    const Table& t=onlyTable(blocks);

    REQUIRE(t.colSpecs.size()==2);
    CHECK(t.colSpecs[0].alignment==cAlignDefault);
    CHECK(t.colSpecs[1].alignment==cAlignCenter);
    CHECK(t.colSpecs[0].width.isDefault);

    REQUIRE(t.head.rows.size()==1);
    REQUIRE(t.head.rows[0].cells.size()==2);
    CHECK(cellText(t.head.rows[0].cells[0])=="a");
    CHECK(cellText(t.head.rows[0].cells[1])=="b");

    REQUIRE(t.bodies.size()==1);
    REQUIRE(t.bodies[0].body.size()==1);
    CHECK(cellText(t.bodies[0].body[0].cells[0])=="1");
    CHECK(cellText(t.bodies[0].body[0].cells[1])=="2");
    CHECK(t.foot.rows.empty());
}

TEST_CASE("every alignment marker", "[tables]") {
    Blocks blocks=parse("| l | r | c | d |\n|:--|--:|:-:|---|");
    const Table& t=onlyTable(blocks);
    REQUIRE(t.colSpecs.size()==4);
    CHECK(t.colSpecs[0].alignment==cAlignLeft);
    CHECK(t.colSpecs[1].alignment==cAlignRight);
    CHECK(t.colSpecs[2].alignment==cAlignCenter);
    CHECK(t.colSpecs[3].alignment==cAlignDefault);
    CHECK(t.bodies[0].body.empty());
}

TEST_CASE("rows are padded and truncated to the header width", "[tables]") {
    Blocks blocks=parse("a | b\n--|--\n1\n1 | 2 | 3");
    const Table& t=onlyTable(blocks);
    REQUIRE(t.bodies[0].body.size()==2);

    const Row& shortRow=t.bodies[0].body[0];
    REQUIRE(shortRow.cells.size()==2);
    CHECK(cellText(shortRow.cells[0])=="1");
    CHECK(shortRow.cells[1].content.empty());

    const Row& longRow=t.bodies[0].body[1];
    REQUIRE(longRow.cells.size()==2);
    CHECK(cellText(longRow.cells[1])=="2");
}

TEST_CASE("an escaped pipe stays in its cell", "[tables]") {
    Blocks blocks=parse("a | b\n--|--\nx \\| y | z");
    const Table& t=onlyTable(blocks);
    const Row& row=t.bodies[0].body[0];
    CHECK(cellText(row.cells[0])=="x | y");
    CHECK(cellText(row.cells[1])=="z");
}

TEST_CASE("a delimiter row must match the header's column count", "[tables]") {
    Blocks blocks=parse("| a | b |\n| --- |");
    REQUIRE(blocks.size()==1);
    CHECK(boost::get<Para>(&blocks[0])!=0);
}

TEST_CASE("the header is the paragraph's last line", "[tables]") {
    Blocks blocks=parse("intro\n| a |\n| - |");
    REQUIRE(blocks.size()==2);
    CHECK(test::native(Blocks(blocks.begin(), blocks.begin()+1))==R"([Para [Str "intro"]])");
    const Table *t=boost::get<Table>(&blocks[1]);
    REQUIRE(t!=0);
    CHECK(cellText(t->head.rows[0].cells[0])=="a");
}

TEST_CASE("a table ends at a blank line or another block", "[tables]") {
    Blocks blocks=parse("| a |\n| - |\n| 1 |\n\nafter");
    REQUIRE(blocks.size()==2);
    CHECK(boost::get<Table>(&blocks[0])!=0);
    CHECK(boost::get<Para>(&blocks[1])!=0);

    blocks=parse("| a |\n| - |\n> q");
    REQUIRE(blocks.size()==2);
    CHECK(boost::get<Table>(&blocks[0])!=0);
    CHECK(boost::get<BlockQuote>(&blocks[1])!=0);
}

TEST_CASE("tables can be turned off", "[tables]") {
    ReaderOptions options;
    options.tables=false;
    Blocks blocks=parse("| a |\n| - |", options);
    REQUIRE(blocks.size()==1);
    CHECK(boost::get<Para>(&blocks[0])!=0);
}

TEST_CASE("counting header columns", "[tables]") {
    CHECK(block::Table::countHeaderColumns("| a | b |")==2);
    CHECK(block::Table::countHeaderColumns("a | b")==2);
    CHECK(block::Table::countHeaderColumns("| a |")==1);
    CHECK(block::Table::countHeaderColumns("a \\| b")==0);
    CHECK(block::Table::countHeaderColumns("|")==0);
    CHECK(block::Table::countHeaderColumns("no pipes")==0);
}

TEST_CASE("parsing delimiter rows", "[tables]") {
    optional<std::vector<Alignment> > r=block::Table::parseDelimiterRow("|:-|-:|", 2);
    REQUIRE(r.is_initialized());
    CHECK((*r)[0]==cAlignLeft);
    CHECK((*r)[1]==cAlignRight);

    CHECK_FALSE(block::Table::parseDelimiterRow("|:-|-:|", 3).is_initialized());
    CHECK_FALSE(block::Table::parseDelimiterRow("| - | x |", 2).is_initialized());
    CHECK_FALSE(block::Table::parseDelimiterRow("| | |", 2).is_initialized());
}

TEST_CASE("splitting rows", "[tables]") {
    std::vector<string> cells=block::Table::splitRow("| a | b |", 2);
    REQUIRE(cells.size()==2);
    CHECK(cells[0]=="a");
    CHECK(cells[1]=="b");

    cells=block::Table::splitRow("a|b|c", 2);
    CHECK(cells.size()==2);

    cells=block::Table::splitRow("| a \\| b |", 1);
    REQUIRE(cells.size()==1);
    CHECK(cells[0]=="a | b");
}

TEST_CASE("native form of a table", "[tables]") {
    CHECK(md("| a |\n| :-: |")==
          R"([Table ("",[],[]) (Caption Nothing []) [(AlignCenter,ColWidthDefault)] )"
          R"((TableHead ("",[],[]) [Row ("",[],[]) [Cell ("",[],[]) AlignDefault )"
          R"((RowSpan 1) (ColSpan 1) [Plain [Str "a"]]]]) )"
          R"([TableBody ("",[],[]) (RowHeadColumns 0) [] []] (TableFoot ("",[],[]) [])])");
}
