#ifndef _STRATEGIES_HDR_
#define _STRATEGIES_HDR_

class Grid;

// remove the value of every solved box from all of its peers;
// returns false as soon as a peer would be left without any
// candidate (in which case <grid> is only partially reduced)
bool Eliminate(Grid& grid);

// assign a digit to a box if that box is the only place left
// for the digit in one of its units
bool OnlyChoice(Grid& grid);

// remove the digits of every pair of boxes with the same two
// candidates from all other boxes of their unit, until no pair
// changes anything; returns false if a box would become empty
bool NakedTwins(Grid& grid);

#endif
