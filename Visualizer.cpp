#include <cstdio>
#include <fstream>

#include "Topology.hpp"
#include "Visualizer.hpp"

bool ReplayVisualizer::Visualize(const std::vector<GridSnapshot>& assignments) {
	numFrames = 0;

	if (assignments.empty()) {
		printf("[%s] no assignments were recorded\n", __FUNCTION__);
		return false;
	}

	std::fstream f(fname.c_str(), std::ios::out | std::ios::trunc);

	if (!f.good()) {
		printf("[%s] unable to open file \"%s\"\n", __FUNCTION__, fname.c_str());
		return false;
	}

	for (unsigned int frame = 0; frame < assignments.size(); frame++) {
		const GridSnapshot& curr = assignments[frame];

		f << "step " << (frame + 1) << "/" << assignments.size();

		// name the boxes this step solved (usually exactly one)
		for (unsigned int box = 0; frame > 0 && box < curr.size(); box++) {
			if (curr[box].size() != 1)
				continue;
			if (assignments[frame - 1][box] == curr[box])
				continue;

			f << " " << topology.GetBoxName(box) << "=" << curr[box];
		}

		f << "\n";
		Grid::Print(curr, f);
		f << "\n";

		numFrames += 1;
	}

	f.close();
	return (!f.fail());
}
