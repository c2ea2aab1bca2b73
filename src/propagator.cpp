#include "propagator.hpp"

#include <cstddef>
#include <vector>

#include "utils.hpp"

// =========================================================
// Techniques
// =========================================================

void eliminate(const Topology &topology, SudokuBoard &board, AssignmentLog *log) {
  // cells solved during this pass are handled by the next one
  std::vector<Index> solved;
  for (Index i = 0; i < 81; i++) {
    if (board.isSolved(i)) {
      solved.push_back(i);
    }
  }

  for (Index idx : solved) {
    const Digit digit = board.getValue(idx);
    if (digit == 0) {
      continue; // emptied by an earlier cell of this pass
    }
    for (Index peer : topology.peersOf(idx)) {
      board.applyRemoveCandidate(peer, digit, ReasonId::Eliminate, log);
    }
  }
}

void onlyChoice(const Topology &topology, SudokuBoard &board, AssignmentLog *log) {
  for (const Unit &unit : topology.units()) {
    for (Digit digit = 1; digit <= 9; digit++) {
      int foundIdx = -1;
      for (Index idx : unit) {
        if (board.hasCandidate(idx, digit)) {
          if (foundIdx != -1) {
            foundIdx = -2; // multiple places
            break;
          }
          foundIdx = idx;
        }
      }
      if (foundIdx >= 0) {
        board.applySetValue(foundIdx, digit, ReasonId::OnlyChoice, log);
      }
    }
  }
}

void nakedTwins(const Topology &topology, SudokuBoard &board, AssignmentLog *log) {
  for (const Unit &unit : topology.units()) {
    int pairs = 0;
    Index first = -1;
    Index second = -1;

    for (size_t a = 0; a < unit.size(); a++) {
      if (board.countCandidates(unit[a]) != 2) {
        continue;
      }
      for (size_t b = a + 1; b < unit.size(); b++) {
        if (board.getCandidateMask(unit[b]) == board.getCandidateMask(unit[a])) {
          pairs++;
          first = unit[a];
          second = unit[b];
        }
      }
    }

    if (pairs != 1) {
      continue;
    }

    const Mask twins = board.getCandidateMask(first);
    for (Index idx : unit) {
      if (idx == first || idx == second) {
        continue;
      }
      for (Digit digit = 1; digit <= 9; digit++) {
        if (twins & digitToBit(digit)) {
          board.applyRemoveCandidate(idx, digit, ReasonId::NakedTwins, log);
        }
      }
    }
  }
}

typedef void (*TechniqueFn)(const Topology &, SudokuBoard &, AssignmentLog *);

static constexpr TechniqueFn TECHNIQUES[] =
{
  &eliminate,
  &onlyChoice,
  &nakedTwins
};

// =========================================================
// Reduction loop
// =========================================================

bool reducePuzzle(const Topology &topology, SudokuBoard &board, AssignmentLog *log) {
  if (board.hasContradiction()) {
    return false;
  }

  bool stalled = false;
  while (!stalled) {
    const int before = board.countSolved();

    for (size_t i = 0; i < (sizeof(TECHNIQUES) / sizeof(TECHNIQUES[0])); i++) {
      TECHNIQUES[i](topology, board, log);
      if (board.hasContradiction()) {
        return false;
      }
    }

    stalled = board.countSolved() == before;
  }

  return true;
}
