// Sudoku puzzle solver (standard or diagonal variant)
// uses constraint propagation plus best-first search
// on a worker thread that can be stopped after a deadline
//
#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <unistd.h>

#include <boost/bind.hpp>
#include <boost/thread.hpp>

#include "Grid.hpp"
#include "Solver.hpp"
#include "Timer.hpp"
#include "Visualizer.hpp"

static void PrintUsage(const char* argv0) {
	printf("usage: %s [OPTIONS] <puzzle | sudoku.txt>\n", argv0);
	printf("    -n           : no diagonal units (standard sudoku)\n");
	printf("    -t           : do not apply naked twins while reducing\n");
	printf("    -v           : trace search branches\n");
	printf("    -i <nodes>   : give up after visiting <nodes> search nodes\n");
	printf("    -s <seconds> : give up after <seconds> seconds\n");
	printf("    -r <file>    : record assignments and write a replay to <file>\n");
}

// <arg> names a puzzle file if one can be opened, otherwise it is the puzzle itself
static bool LoadPuzzle(Grid& grid, const char* arg) {
	std::fstream f(arg, std::ios::in);

	if (f.good())
		return (grid.LoadFile(arg));

	return (grid.Load(arg));
}

int main(int argc, char** argv) {
	SolverConfig config;
	const char* replayFile = NULL;

	int opt = 0;

	while ((opt = getopt(argc, argv, "ntvi:s:r:")) != -1) {
		switch (opt) {
			case 'n': { config.diagonal = false; } break;
			case 't': { config.nakedTwins = false; } break;
			case 'v': { config.verbose = true; } break;
			case 'i': { config.maxIters = std::strtoul(optarg, NULL, 10); } break;
			case 's': { config.maxSeconds = std::atof(optarg); } break;
			case 'r': { replayFile = optarg; config.recordHistory = true; } break;
			default: {
				PrintUsage(argv[0]);
				return EXIT_FAILURE;
			}
		}
	}

	if (optind != (argc - 1)) {
		PrintUsage(argv[0]);
		return EXIT_FAILURE;
	}

	const char* puzzle = argv[optind];

	Solver solver(config);
	Grid grid(solver.GetTopology());

	if (!LoadPuzzle(grid, puzzle)) {
		printf("[%s] unable to load puzzle \"%s\"\n", __FUNCTION__, puzzle);
		return EXIT_FAILURE;
	}

	printf("[%s] loaded %s puzzle \"%s\":\n", __FUNCTION__, (config.diagonal? "diagonal": "standard"), puzzle);
	grid.Print();

	{
		Timer timer;
		timer.Tick();

		boost::thread worker(boost::bind(&Solver::Solve, &solver, boost::cref(grid)));

		// busy-loop; the search has no suspension points, so the
		// only way to enforce a deadline is to poll and ask it to
		// stop once the deadline has passed
		while (!solver.SolveExited()) {
			usleep(1000);

			if (config.maxSeconds > 0.0 && timer.Elapsed() > config.maxSeconds) {
				solver.ExitSolve();
			}
		}

		worker.join();
	}

	switch (solver.GetStatus()) {
		case SOLVE_SOLVED: {
		} break;
		case SOLVE_ABORTED: {
			printf("[%s] gave up on \"%s\" (%g seconds, %u iterations)\n", __FUNCTION__, puzzle, solver.GetTime(), solver.GetIters());
			return 2;
		} break;
		default: {
			printf("[%s] \"%s\" has no solution\n", __FUNCTION__, puzzle);
			return EXIT_FAILURE;
		} break;
	}

	const Grid& solution = *solver.GetSolution();

	printf("[%s] solved \"%s\" (%g seconds, %u iterations):\n", __FUNCTION__, puzzle, solver.GetTime(), solver.GetIters());
	solution.Print();

	if (replayFile != NULL) {
		ReplayVisualizer visualizer(solution.GetTopology(), replayFile);

		if (visualizer.Visualize(solution.GetHistory())) {
			printf("[%s] wrote %u assignments to \"%s\"\n", __FUNCTION__, visualizer.GetNumFrames(), replayFile);
		} else {
			printf("[%s] could not replay the assignments, the solution above is not affected\n", __FUNCTION__);
		}
	}

	return EXIT_SUCCESS;
}
