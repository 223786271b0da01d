#ifndef _VISUALIZER_HDR_
#define _VISUALIZER_HDR_

#include <string>
#include <vector>

#include "Grid.hpp"

class Topology;

// optional consumer of the assignment history of a solved grid;
// a failing visualizer never affects the solution itself
class Visualizer {
public:
	virtual ~Visualizer() {}
	virtual bool Visualize(const std::vector<GridSnapshot>& assignments) = 0;
};

// writes one rendered frame per assignment to a text file
class ReplayVisualizer: public Visualizer {
public:
	ReplayVisualizer(const Topology& topology, const std::string& fname)
		: topology(topology)
		, fname(fname)
		, numFrames(0)
	{
	}

	bool Visualize(const std::vector<GridSnapshot>& assignments);

	unsigned int GetNumFrames() const { return numFrames; }

private:
	const Topology& topology;

	std::string fname;
	unsigned int numFrames;
};

#endif
