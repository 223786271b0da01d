#ifndef _SOLVER_HDR_
#define _SOLVER_HDR_

#include <string>

#include <boost/atomic.hpp>
#include <boost/optional.hpp>

#include "Grid.hpp"
#include "Timer.hpp"

class Topology;

struct SolverConfig {
	SolverConfig()
		: diagonal(true)
		, nakedTwins(true)
		, recordHistory(false)
		, verbose(false)
		, maxIters(0)
		, maxSeconds(0.0)
	{
	}

	bool diagonal;      // add the two main diagonals as units
	bool nakedTwins;    // run naked-twins inside the reduction loop
	bool recordHistory; // record every assignment on the solution grid
	bool verbose;

	unsigned int maxIters; // search-node budget, 0 means unlimited
	double maxSeconds;     // enforced by whoever drives Solve, 0 means unlimited
};

enum SolveStatus {
	SOLVE_PENDING,
	SOLVE_SOLVED,
	SOLVE_UNSOLVABLE,
	SOLVE_ABORTED,
};

extern const char* SolveStatusToString(SolveStatus);

class Solver {
public:
	explicit Solver(const SolverConfig& config);

	// apply the reduction strategies until the number of solved
	// boxes stops increasing; false means <grid> is contradictory
	bool Reduce(Grid& grid) const;

	// depth-first search for a solution of <grid>, branching
	// on the unsolved box with the fewest candidates; none is
	// either no solution or an exhausted budget, see GetStatus
	boost::optional<Grid> Search(const Grid& grid);

	// search from <puzzle> and store the outcome, safe to
	// run on a thread other than the one calling ExitSolve
	void Solve(const Grid& puzzle);

	bool IsSolved() const { return (status == SOLVE_SOLVED); }
	bool SolveExited() const { return solveExited; }
	void ExitSolve() { exitSolve = true; }

	SolveStatus GetStatus() const { return status; }
	double GetTime() const { return solveTime; }
	unsigned int GetIters() const { return I; }

	const boost::optional<Grid>& GetSolution() const { return solution; }
	const Topology& GetTopology() const;

private:
	boost::optional<Grid> SearchNode(Grid& grid, unsigned int depth);
	unsigned int GetBranchBox(const Grid& grid) const;
	bool CheckBudget();

	SolverConfig config;

	SolveStatus status;
	unsigned int I; // number of search nodes visited so far
	double solveTime;
	bool aborted;

	boost::atomic<bool> exitSolve;
	boost::atomic<bool> solveExited;

	boost::optional<Grid> solution;

	Timer timer;
};

// solve <gridString> in one call; none if it cannot be
// loaded or has no solution
boost::optional<Grid> SolveSudoku(const std::string& gridString, bool diagonal = true);

#endif
