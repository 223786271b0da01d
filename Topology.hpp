#ifndef _TOPOLOGY_HDR_
#define _TOPOLOGY_HDR_

#include <string>
#include <vector>

#define GRID_K 3                  // block size
#define GRID_N (GRID_K * GRID_K)  // number of rows, columns, blocks and unit size
#define GRID_Z (GRID_N * GRID_N)  // number of boxes

typedef std::vector<unsigned int> Unit;

// static box/unit/peer relations of a 9x9 grid, optionally
// with the two main diagonals as extra units; boxes are
// indexed row-major (A1 = 0, A2 = 1, ..., I9 = 80)
class Topology {
public:
	explicit Topology(bool diagonal);

	// shared immutable instance for either variant
	static const Topology& Get(bool diagonal);

	bool IsDiagonal() const { return diagonal; }
	unsigned int GetNumBoxes() const { return GRID_Z; }

	const std::vector<Unit>& GetUnits() const { return units; }
	const std::vector<unsigned int>& GetBoxUnits(unsigned int box) const { return boxUnits[box]; }
	const std::vector<unsigned int>& GetPeers(unsigned int box) const { return boxPeers[box]; }

	const std::string& GetBoxName(unsigned int box) const { return boxNames[box]; }
	// returns GRID_Z for unknown names
	unsigned int GetBoxIndex(const std::string& name) const;

	static const char* GetRowNames() { return "ABCDEFGHI"; }
	static const char* GetColNames() { return "123456789"; }

private:
	bool diagonal;

	std::vector<std::string> boxNames;
	std::vector<Unit> units;

	// indices into <units> of the units containing each box
	std::vector< std::vector<unsigned int> > boxUnits;
	std::vector< std::vector<unsigned int> > boxPeers;
};

#endif
