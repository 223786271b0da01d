#include <algorithm>
#include <cstdio>
#include <cctype>
#include <fstream>
#include <sstream>

#include "Grid.hpp"
#include "Topology.hpp"

Grid::Grid(const Topology& t): topology(&t), recordHistory(false) {
	values.resize(t.GetNumBoxes(), Topology::GetColNames());
}


bool Grid::Load(const std::string& gridString) {
	if (gridString.size() != values.size()) {
		printf("[%s] expected %u boxes, got %u\n", __FUNCTION__, static_cast<unsigned int>(values.size()), static_cast<unsigned int>(gridString.size()));
		return false;
	}

	const std::string digits = Topology::GetColNames();

	for (unsigned int box = 0; box < values.size(); box++) {
		const char val = gridString[box];

		if (digits.find(val) != std::string::npos) {
			values[box] = std::string(1, val);
		} else {
			values[box] = digits;
		}
	}

	// a freshly loaded puzzle starts with an empty history
	history.reset();
	return true;
}

bool Grid::LoadFile(const char* fname) {
	std::fstream f(fname, std::ios::in);

	if (!f.good())
		return false;

	std::string line;
	std::string gridString;

	while (std::getline(f, line)) {
		if (!line.empty() && line[0] == '#')
			continue;

		for (unsigned int n = 0; n < line.size(); n++) {
			if (std::isspace(static_cast<unsigned char>(line[n])))
				continue;

			gridString += line[n];
		}
	}

	f.close();
	return (Load(gridString));
}


bool Grid::Set(unsigned int box, const std::string& value) {
	if (box >= values.size())
		return false;
	if (values[box] == value)
		return true;
	if (value.empty())
		return false;

	// candidate sets may only ever shrink
	for (unsigned int n = 0; n < value.size(); n++) {
		if (values[box].find(value[n]) == std::string::npos) {
			return false;
		}
	}

	values[box] = value;

	if (recordHistory && value.size() == 1) {
		boost::shared_ptr<Assignment> assignment(new Assignment());

		assignment->prev = history;
		assignment->size = (history? history->size: 0) + 1;
		assignment->values = values;

		history = assignment;
	}

	return true;
}


std::vector<GridSnapshot> Grid::GetHistory() const {
	std::vector<GridSnapshot> snapshots(GetHistorySize());

	// walk the chain backwards, filling from the end
	unsigned int idx = snapshots.size();

	for (const Assignment* a = history.get(); a != NULL; a = a->prev.get()) {
		snapshots[--idx] = a->values;
	}

	return snapshots;
}

unsigned int Grid::GetHistorySize() const {
	return (history? history->size: 0);
}


unsigned int Grid::GetNumSolved() const {
	unsigned int numSolved = 0;

	for (unsigned int box = 0; box < values.size(); box++) {
		numSolved += (values[box].size() == 1);
	}

	return numSolved;
}

bool Grid::IsValidSolution() const {
	if (!IsSolved())
		return false;

	const std::vector<Unit>& units = topology->GetUnits();

	for (unsigned int unitIdx = 0; unitIdx < units.size(); unitIdx++) {
		std::string seen;

		for (unsigned int n = 0; n < units[unitIdx].size(); n++) {
			const char val = values[ units[unitIdx][n] ][0];

			if (seen.find(val) != std::string::npos)
				return false;

			seen += val;
		}

		if (seen.size() != GRID_N)
			return false;
	}

	return true;
}


std::string Grid::ToString() const {
	std::string str;
	str.reserve(values.size());

	for (unsigned int box = 0; box < values.size(); box++) {
		str += ((values[box].size() == 1)? values[box][0]: '.');
	}

	return str;
}

void Grid::Print(std::ostream& out) const {
	Print(values, out);
}

void Grid::Print(const GridSnapshot& values, std::ostream& out) {
	// every box is as wide as the widest candidate set
	unsigned int width = 1;

	for (unsigned int box = 0; box < values.size(); box++) {
		width = std::max(width, static_cast<unsigned int>(values[box].size()));
	}

	std::stringstream str; str << "";
	std::stringstream div; div << "+";

	// compose the divider string
	for (unsigned int blk = 0; blk < GRID_K; blk++) {
		div << std::string((width + 1) * GRID_K + 1, '-') << "+";
	}

	div << "\n";

	// compose the grid string
	for (unsigned int row = 0; row < GRID_N; row++) {
		if ((row % GRID_K) == 0) {
			str << div.str();
		}

		str << "|";

		for (unsigned int col = 0; col < GRID_N; col++) {
			const std::string& val = values[row * GRID_N + col];
			const unsigned int pad = width - val.size();

			str << " " << std::string(pad / 2, ' ') << val << std::string(pad - pad / 2, ' ');

			if (((col + 1) % GRID_K) == 0) {
				str << " |";
			}
		}

		str << "\n";
	}

	str << div.str();
	out << str.str();
}
