#ifndef SUDOKU_CELL_H
#define SUDOKU_CELL_H

#include <cstddef>
#include <string>
#include "utils.hpp"

// Candidate set of a single cell. One candidate left means solved,
// none left means the board is in contradiction.
class SudokuCell
{
public:
  SudokuCell();

  // --- value ---
  Digit getValue() const;

  bool isSolved() const;

  bool isContradiction() const;

  // --- candidates ---
  Mask getCandidateMask() const;

  void setCandidateMask(Mask mask);

  bool hasCandidate(Digit digit) const;

  size_t countCandidates() const;

  Digit getSingleCandidate() const;

  bool disableCandidate(Digit digit);

  std::string toString() const;

  bool operator==(const SudokuCell &other) const;

  bool operator!=(const SudokuCell &other) const;

private:
  Mask candMask;  // 9-bit
};

#endif // SUDOKU_CELL_H
