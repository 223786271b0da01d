#include <algorithm>

#include "Topology.hpp"

#define BOX_INDEX(r, c) ((r) * GRID_N + (c))

Topology::Topology(bool diag): diagonal(diag) {
	boxNames.reserve(GRID_Z);

	for (unsigned int row = 0; row < GRID_N; row++) {
		for (unsigned int col = 0; col < GRID_N; col++) {
			std::string name;
			name += GetRowNames()[row];
			name += GetColNames()[col];
			boxNames.push_back(name);
		}
	}

	units.reserve(3 * GRID_N + 2);

	for (unsigned int row = 0; row < GRID_N; row++) {
		Unit unit;
		for (unsigned int col = 0; col < GRID_N; col++)
			unit.push_back(BOX_INDEX(row, col));
		units.push_back(unit);
	}
	for (unsigned int col = 0; col < GRID_N; col++) {
		Unit unit;
		for (unsigned int row = 0; row < GRID_N; row++)
			unit.push_back(BOX_INDEX(row, col));
		units.push_back(unit);
	}
	for (unsigned int blk = 0; blk < GRID_N; blk++) {
		const unsigned int blkRow = (blk / GRID_K) * GRID_K;
		const unsigned int blkCol = (blk % GRID_K) * GRID_K;

		Unit unit;
		for (unsigned int row = blkRow; row < blkRow + GRID_K; row++) {
			for (unsigned int col = blkCol; col < blkCol + GRID_K; col++) {
				unit.push_back(BOX_INDEX(row, col));
			}
		}
		units.push_back(unit);
	}

	if (diagonal) {
		Unit major;
		Unit minor;
		for (unsigned int n = 0; n < GRID_N; n++) {
			major.push_back(BOX_INDEX(n, n));
			minor.push_back(BOX_INDEX(n, GRID_N - 1 - n));
		}
		units.push_back(major);
		units.push_back(minor);
	}

	boxUnits.resize(GRID_Z);
	boxPeers.resize(GRID_Z);

	for (unsigned int unitIdx = 0; unitIdx < units.size(); unitIdx++) {
		for (unsigned int n = 0; n < units[unitIdx].size(); n++) {
			boxUnits[ units[unitIdx][n] ].push_back(unitIdx);
		}
	}

	// peers: union of all units of a box (as a set), minus the box itself
	for (unsigned int box = 0; box < GRID_Z; box++) {
		std::vector<unsigned int>& peers = boxPeers[box];

		for (unsigned int n = 0; n < boxUnits[box].size(); n++) {
			const Unit& unit = units[ boxUnits[box][n] ];
			peers.insert(peers.end(), unit.begin(), unit.end());
		}

		std::sort(peers.begin(), peers.end());
		peers.erase(std::unique(peers.begin(), peers.end()), peers.end());
		peers.erase(std::remove(peers.begin(), peers.end(), box), peers.end());
	}
}

const Topology& Topology::Get(bool diagonal) {
	static const Topology plainTopology(false);
	static const Topology diagTopology(true);

	return (diagonal? diagTopology: plainTopology);
}

unsigned int Topology::GetBoxIndex(const std::string& name) const {
	const std::vector<std::string>::const_iterator it = std::find(boxNames.begin(), boxNames.end(), name);

	if (it == boxNames.end())
		return GRID_Z;

	return (it - boxNames.begin());
}
