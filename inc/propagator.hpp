#ifndef PROPAGATOR_H
#define PROPAGATOR_H

#include "AssignmentLog.hpp"
#include "SudokuBoard.hpp"
#include "Topology.hpp"

// Constraint propagation rules. All of them work in place on a board owned
// by the caller; log may be null.

// removes the digit of every solved cell from its peers
void eliminate(const Topology &topology, SudokuBoard &board, AssignmentLog *log);

// places a digit in the only cell of a unit that can still hold it
void onlyChoice(const Topology &topology, SudokuBoard &board, AssignmentLog *log);

// Removes the digits of a naked pair from the rest of its unit. A unit is
// only touched when it contains exactly one pair of cells with identical
// two-candidate sets; units with several pairs, or three cells sharing the
// same pair, are left alone.
void nakedTwins(const Topology &topology, SudokuBoard &board, AssignmentLog *log);

// Applies eliminate, onlyChoice and nakedTwins in that order until the
// number of solved cells stops growing. Returns false as soon as a cell
// runs out of candidates.
bool reducePuzzle(const Topology &topology, SudokuBoard &board, AssignmentLog *log);

#endif // PROPAGATOR_H
