#include <cstdio>

#include "Solver.hpp"
#include "Strategies.hpp"
#include "Topology.hpp"

const char* SolveStatusToString(SolveStatus status) {
	switch (status) {
		case SOLVE_PENDING:    return "pending";
		case SOLVE_SOLVED:     return "solved";
		case SOLVE_UNSOLVABLE: return "unsolvable";
		case SOLVE_ABORTED:    return "aborted";
	}

	return "unknown";
}


Solver::Solver(const SolverConfig& cfg)
	: config(cfg)
	, status(SOLVE_PENDING)
	, I(0)
	, solveTime(0.0)
	, aborted(false)
	, exitSolve(false)
	, solveExited(false)
{
}

const Topology& Solver::GetTopology() const {
	return (Topology::Get(config.diagonal));
}


bool Solver::Reduce(Grid& grid) const {
	unsigned int numSolvedOld = 0;
	unsigned int numSolvedNew = grid.GetNumSolved();

	do {
		numSolvedOld = numSolvedNew;

		if (!Eliminate(grid))
			return false;
		// naked-twins goes before only-choice so that the pass that
		// ends the loop leaves nothing for elimination or only-choice
		if (config.nakedTwins && !NakedTwins(grid))
			return false;
		if (!OnlyChoice(grid))
			return false;

		numSolvedNew = grid.GetNumSolved();
	} while (numSolvedNew != numSolvedOld);

	return true;
}


boost::optional<Grid> Solver::Search(const Grid& grid) {
	I = 0;
	aborted = false;
	status = SOLVE_PENDING;

	Grid root(grid);
	const boost::optional<Grid> result = SearchNode(root, 0);

	if (result) {
		status = SOLVE_SOLVED;
	} else {
		status = (aborted? SOLVE_ABORTED: SOLVE_UNSOLVABLE);
	}

	return result;
}

boost::optional<Grid> Solver::SearchNode(Grid& grid, unsigned int depth) {
	if (!CheckBudget())
		return boost::none;

	if (!Reduce(grid))
		return boost::none;
	if (grid.IsSolved())
		return grid;

	const unsigned int box = GetBranchBox(grid);
	const std::string candidates = grid.Get(box);

	if (config.verbose) {
		printf("[%s] depth %u: branching on %s (%s)\n", __FUNCTION__, depth, grid.GetTopology().GetBoxName(box).c_str(), candidates.c_str());
	}

	for (unsigned int n = 0; n < candidates.size(); n++) {
		// each branch owns its copy, siblings never see each other's changes
		Grid branch(grid);

		if (!branch.Set(box, std::string(1, candidates[n])))
			continue;

		const boost::optional<Grid> attempt = SearchNode(branch, depth + 1);

		if (attempt)
			return attempt;
		if (aborted)
			break;
	}

	return boost::none;
}

unsigned int Solver::GetBranchBox(const Grid& grid) const {
	unsigned int minNumCandidates = GRID_N + 1;
	unsigned int minCandidatesBox = 0;

	// first box in row-major order wins ties
	for (unsigned int box = 0; box < grid.GetValues().size(); box++) {
		const unsigned int numCandidates = grid.Get(box).size();

		if (numCandidates < 2)
			continue;

		if (numCandidates < minNumCandidates) {
			minNumCandidates = numCandidates;
			minCandidatesBox = box;
		}
	}

	return minCandidatesBox;
}

bool Solver::CheckBudget() {
	if (exitSolve || (config.maxIters != 0 && I >= config.maxIters)) {
		aborted = true;
		return false;
	}

	I += 1;
	return true;
}


void Solver::Solve(const Grid& puzzle) {
	timer.Tick();

	solution = boost::none;
	solveExited = false;

	Grid grid(puzzle);

	if (config.recordHistory) {
		grid.EnableHistory();
	}

	solution = Search(grid);

	timer.Tock();
	solveTime = timer.Time();

	if (aborted && config.verbose) {
		printf("[%s] search stopped after %u nodes (%g seconds)\n", __FUNCTION__, I, solveTime);
	}

	// a stop request only applies to the run it interrupted
	exitSolve = false;
	solveExited = true;
}


boost::optional<Grid> SolveSudoku(const std::string& gridString, bool diagonal) {
	SolverConfig config;
	config.diagonal = diagonal;

	Solver solver(config);
	Grid grid(solver.GetTopology());

	if (!grid.Load(gridString))
		return boost::none;

	solver.Solve(grid);
	return (solver.GetSolution());
}
