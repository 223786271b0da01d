#ifndef _GRID_HDR_
#define _GRID_HDR_

#include <iostream>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

class Topology;

// candidate digits of every box, in row-major box order
typedef std::vector<std::string> GridSnapshot;

class Grid {
public:
	explicit Grid(const Topology& topology);

	// <gridString> holds 81 characters, '1'-'9' are givens
	// and anything else marks a box as unknown
	bool Load(const std::string& gridString);
	bool LoadFile(const char* fname);

	const std::string& Get(unsigned int box) const { return values[box]; }

	// overwrite the candidates of <box>; a value that equals the current
	// one is a no-op and is not recorded, a value that is empty or not a
	// subset of the current candidates is rejected (returns false)
	bool Set(unsigned int box, const std::string& value);

	void EnableHistory() { recordHistory = true; }

	// snapshots taken after every assignment that solved a box,
	// oldest first (empty unless history recording is enabled)
	std::vector<GridSnapshot> GetHistory() const;
	unsigned int GetHistorySize() const;

	unsigned int GetNumSolved() const;
	bool IsSolved() const { return (GetNumSolved() == values.size()); }
	bool IsValidSolution() const;

	std::string ToString() const;
	void Print(std::ostream& out = std::cout) const;

	const Topology& GetTopology() const { return *topology; }
	const GridSnapshot& GetValues() const { return values; }

	bool operator == (const Grid& grid) const { return (values == grid.values); }
	bool operator != (const Grid& grid) const { return (values != grid.values); }

	static void Print(const GridSnapshot& values, std::ostream& out);

private:
	// history is a chain of immutable nodes shared between a
	// grid and its copies, so copying a grid never duplicates
	// snapshots and a discarded branch only frees its own tail
	struct Assignment {
		boost::shared_ptr<const Assignment> prev;
		unsigned int size;
		GridSnapshot values;
	};

	const Topology* topology;

	GridSnapshot values;

	bool recordHistory;
	boost::shared_ptr<const Assignment> history;
};

#endif
