#include <string>

#include "Grid.hpp"
#include "Strategies.hpp"
#include "Topology.hpp"

static std::string RemoveDigits(const std::string& candidates, const std::string& digits) {
	std::string remaining;
	remaining.reserve(candidates.size());

	for (unsigned int n = 0; n < candidates.size(); n++) {
		if (digits.find(candidates[n]) == std::string::npos) {
			remaining += candidates[n];
		}
	}

	return remaining;
}

static bool IsSameSet(const std::string& a, const std::string& b) {
	return (a.size() == b.size() && RemoveDigits(a, b).empty());
}


bool Eliminate(Grid& grid) {
	const Topology& topology = grid.GetTopology();

	for (unsigned int box = 0; box < topology.GetNumBoxes(); box++) {
		// check against the current map, boxes can become
		// solved while earlier ones are being eliminated
		if (grid.Get(box).size() != 1)
			continue;

		const std::string digit = grid.Get(box);
		const std::vector<unsigned int>& peers = topology.GetPeers(box);

		for (unsigned int n = 0; n < peers.size(); n++) {
			const std::string remaining = RemoveDigits(grid.Get(peers[n]), digit);

			if (remaining.empty())
				return false;
			if (!grid.Set(peers[n], remaining))
				return false;
		}
	}

	return true;
}


bool OnlyChoice(Grid& grid) {
	const std::vector<Unit>& units = grid.GetTopology().GetUnits();
	const std::string digits = Topology::GetColNames();

	for (unsigned int unitIdx = 0; unitIdx < units.size(); unitIdx++) {
		const Unit& unit = units[unitIdx];

		for (unsigned int d = 0; d < digits.size(); d++) {
			unsigned int numPlaces = 0;
			unsigned int lastPlace = 0;

			for (unsigned int n = 0; n < unit.size(); n++) {
				if (grid.Get(unit[n]).find(digits[d]) != std::string::npos) {
					numPlaces += 1;
					lastPlace = unit[n];
				}
			}

			if (numPlaces != 1)
				continue;
			if (!grid.Set(lastPlace, std::string(1, digits[d])))
				return false;
		}
	}

	return true;
}


bool NakedTwins(Grid& grid) {
	const std::vector<Unit>& units = grid.GetTopology().GetUnits();

	// removals can form new twins in pairs that were already
	// visited, so repeat until a full pass changes nothing
	bool changed = true;

	while (changed) {
		changed = false;

		for (unsigned int unitIdx = 0; unitIdx < units.size(); unitIdx++) {
			const Unit& unit = units[unitIdx];

			for (unsigned int i = 0; i < unit.size(); i++) {
				for (unsigned int j = i + 1; j < unit.size(); j++) {
					const std::string twins = grid.Get(unit[i]);

					if (twins.size() != 2 || !IsSameSet(twins, grid.Get(unit[j])))
						continue;

					for (unsigned int n = 0; n < unit.size(); n++) {
						if (n == i || n == j)
							continue;

						const std::string remaining = RemoveDigits(grid.Get(unit[n]), twins);

						if (remaining == grid.Get(unit[n]))
							continue;
						if (remaining.empty())
							return false;
						if (!grid.Set(unit[n], remaining))
							return false;

						changed = true;
					}
				}
			}
		}
	}

	return true;
}
