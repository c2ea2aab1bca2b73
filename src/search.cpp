#include "search.hpp"
#include "propagator.hpp"
#include "utils.hpp"

#include <cstddef>

// =========================================================
// Search
// =========================================================

const char *solveStatusName(SolveStatus status) {
  switch (status) {
    case SolveStatus::Solved:
      return "solved";
    case SolveStatus::NoSolution:
      return "no solution";
    case SolveStatus::InvalidInput:
      return "invalid input";
  }
  return "?";
}

Index findMostConstrained(const SudokuBoard &board) {
  Index best = -1;
  size_t bestCount = 10;
  for (Index i = 0; i < 81; i++) {
    const size_t n = board.countCandidates(i);
    if (n >= 2 && n < bestCount) {
      best = i;
      bestCount = n;
    }
  }
  return best;
}

bool search(const Topology &topology, SudokuBoard board, SudokuBoard &out, AssignmentLog *log) {
  if (!reducePuzzle(topology, board, log)) {
    return false;
  }

  const Index idx = findMostConstrained(board);
  if (idx < 0) {
    out = board;
    return true;
  }

  const Mask candidates = board.getCandidateMask(idx);
  for (Digit digit = 1; digit <= 9; digit++) {
    if (!(candidates & digitToBit(digit))) {
      continue;
    }

    SudokuBoard trial = board;
    trial.applySetValue(idx, digit, ReasonId::SearchTrial, log);
    if (search(topology, trial, out, log)) {
      return true;
    }
  }

  // every trial failed, backtrack
  return false;
}

SolveStatus solve(const char *grid, const Topology &topology, SudokuBoard &out,
                  AssignmentLog *log, std::string *err) {
  SudokuBoard board;
  if (!board.importFromString(grid, log, err)) {
    return SolveStatus::InvalidInput;
  }

  if (!search(topology, board, out, log)) {
    return SolveStatus::NoSolution;
  }
  return SolveStatus::Solved;
}
