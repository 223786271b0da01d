#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>

#include "../Grid.hpp"
#include "../Topology.hpp"
#include "Puzzles.hpp"

TEST_CASE("Load maps givens to digits and everything else to all candidates", "[grid]") {
	Grid grid(Topology::Get(true));

	REQUIRE(grid.Load(DIAG_PUZZLE));

	CHECK(grid.Get(0) == "2");
	CHECK(grid.Get(1) == "123456789");
	CHECK(grid.Get(80) == "3");
	CHECK(grid.GetNumSolved() == 17);
	CHECK(grid.ToString() == DIAG_PUZZLE);

	// any non-digit (and '0') marks an unknown box
	REQUIRE(grid.Load(std::string("0x?") + std::string(78, '-')));
	CHECK(grid.GetNumSolved() == 0);
}

TEST_CASE("Load rejects grids of the wrong size", "[grid]") {
	Grid grid(Topology::Get(true));

	CHECK_FALSE(grid.Load(""));
	CHECK_FALSE(grid.Load(std::string(80, '.')));
	CHECK_FALSE(grid.Load(std::string(82, '.')));
}

TEST_CASE("LoadFile skips whitespace and comment lines", "[grid]") {
	const char* fname = "grid_load_test.txt";

	{
		std::ofstream f(fname);
		f << "# easy puzzle\n";

		for (unsigned int row = 0; row < 9; row++) {
			f << std::string(EASY_PUZZLE).substr(row * 9, 9) << " \n";
		}
	}

	Grid grid(Topology::Get(false));

	CHECK(grid.LoadFile(fname));
	CHECK(grid.ToString() == EASY_PUZZLE);
	CHECK_FALSE(grid.LoadFile("no-such-puzzle.txt"));

	std::remove(fname);
}

TEST_CASE("Set with the current value is a no-op", "[grid]") {
	Grid grid(Topology::Get(true));
	REQUIRE(grid.Load(DIAG_PUZZLE));
	grid.EnableHistory();

	const Grid before(grid);

	CHECK(grid.Set(0, "2"));
	CHECK(grid.Set(1, "123456789"));
	CHECK(grid.GetHistorySize() == 0);
	CHECK(grid == before);
}

TEST_CASE("Set records only assignments that solve a box", "[grid]") {
	Grid grid(Topology::Get(true));
	REQUIRE(grid.Load(DIAG_PUZZLE));
	grid.EnableHistory();

	CHECK(grid.Set(1, "1234"));
	CHECK(grid.GetHistorySize() == 0);

	CHECK(grid.Set(1, "4"));
	REQUIRE(grid.GetHistorySize() == 1);
	CHECK(grid.GetHistory()[0][1] == "4");

	CHECK(grid.Set(2, "5"));
	REQUIRE(grid.GetHistorySize() == 2);
	CHECK(grid.GetHistory()[0][2] == "123456789");
	CHECK(grid.GetHistory()[1] == grid.GetValues());
}

TEST_CASE("Set without history enabled records nothing", "[grid]") {
	Grid grid(Topology::Get(true));
	REQUIRE(grid.Load(DIAG_PUZZLE));

	CHECK(grid.Set(1, "4"));
	CHECK(grid.GetHistorySize() == 0);
	CHECK(grid.GetHistory().empty());
}

TEST_CASE("Set rejects empty and growing candidate sets", "[grid]") {
	Grid grid(Topology::Get(true));
	REQUIRE(grid.Load(DIAG_PUZZLE));

	CHECK_FALSE(grid.Set(1, ""));
	CHECK(grid.Get(1) == "123456789");

	CHECK_FALSE(grid.Set(0, "12"));
	CHECK_FALSE(grid.Set(0, "5"));
	CHECK(grid.Get(0) == "2");

	CHECK_FALSE(grid.Set(81, "1"));
}

TEST_CASE("Copies are independent", "[grid]") {
	Grid grid(Topology::Get(true));
	REQUIRE(grid.Load(DIAG_PUZZLE));
	grid.EnableHistory();
	REQUIRE(grid.Set(1, "6"));

	Grid branch(grid);
	REQUIRE(branch.Set(2, "7"));

	CHECK(grid.Get(2) == "123456789");
	CHECK(grid.GetHistorySize() == 1);
	CHECK(branch.GetHistorySize() == 2);
	CHECK(branch.GetHistory()[0] == grid.GetHistory()[0]);
	CHECK(branch != grid);
}

TEST_CASE("IsValidSolution checks every unit", "[grid]") {
	Grid grid(Topology::Get(true));

	REQUIRE(grid.Load(DIAG_SOLUTION));
	CHECK(grid.IsSolved());
	CHECK(grid.IsValidSolution());

	// a standard solution is not necessarily a diagonal one
	Grid standard(Topology::Get(true));
	REQUIRE(standard.Load(EASY_SOLUTION));
	CHECK(standard.IsSolved());
	CHECK_FALSE(standard.IsValidSolution());

	Grid partial(Topology::Get(true));
	REQUIRE(partial.Load(DIAG_PUZZLE));
	CHECK_FALSE(partial.IsValidSolution());
}

TEST_CASE("Print renders rows with block separators", "[grid]") {
	Grid grid(Topology::Get(true));
	REQUIRE(grid.Load(DIAG_SOLUTION));

	std::stringstream out;
	grid.Print(out);

	std::string line;
	std::vector<std::string> lines;

	while (std::getline(out, line)) {
		lines.push_back(line);
	}

	REQUIRE(lines.size() == 13);
	CHECK(lines[0] == "+-------+-------+-------+");
	CHECK(lines[1] == "| 2 6 7 | 9 4 5 | 3 8 1 |");
	CHECK(lines[4] == lines[0]);
	CHECK(lines[12] == lines[0]);
}
