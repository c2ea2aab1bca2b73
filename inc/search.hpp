#ifndef SEARCH_H
#define SEARCH_H

#include <cstdint>
#include <string>

#include "AssignmentLog.hpp"
#include "SudokuBoard.hpp"
#include "Topology.hpp"

enum class SolveStatus : uint8_t {
  Solved = 0,
  NoSolution = 1,
  InvalidInput = 2
};

const char *solveStatusName(SolveStatus status);

// Undetermined cell with the fewest candidates (first in row-major order on
// ties), or -1 when every cell is solved.
Index findMostConstrained(const SudokuBoard &board);

// Depth-first search with propagation at every node. The board is taken by
// value; each trial works on its own copy. Returns true and fills out with
// the first solution found, false when none is reachable.
bool search(const Topology &topology, SudokuBoard board, SudokuBoard &out, AssignmentLog *log);

// Parses grid and searches it. err receives the parser message for
// InvalidInput.
SolveStatus solve(const char *grid, const Topology &topology, SudokuBoard &out,
                  AssignmentLog *log = nullptr, std::string *err = nullptr);

#endif // SEARCH_H
