#ifndef SUDOKU_BOARD_H
#define SUDOKU_BOARD_H

#include <cstdint>
#include <string>
#include "Reason.hpp"
#include "SudokuCell.hpp"

class AssignmentLog;
class Topology;

class SudokuBoard
{
public:
  SudokuBoard();

  // 81 chars, '1'..'9' given, '.' unknown. Returns 0 and fills err on
  // malformed input, leaving the board untouched.
  int importFromString(const char *values, AssignmentLog *log = nullptr, std::string *err = nullptr);

  // 81 chars + '\0', '.' for cells that are not solved
  void exportToString(char *out81) const;

  std::string toString() const;

  // 2-D layout, one text line per row. Columns are one wider than the
  // longest candidate string (2 on a solved board) so cells stay apart;
  // an odd amount of padding always puts the extra space on the right.
  std::string format() const;

  void exportToBuffers(uint16_t *cands) const;

  // --- values API ---
  Digit getValue(Index idx) const;

  bool isSolved(Index idx) const;

  // --- candidates API ---
  const SudokuCell &cell(Index idx) const;

  Mask getCandidateMask(Index idx) const;

  bool hasCandidate(Index idx, Digit digit) const;

  size_t countCandidates(Index idx) const;

  Digit getSingleCandidate(Index idx) const;

  // --- events API ---
  // Both record a snapshot in log when the cell ends up with a single
  // candidate it did not hold before.
  void applyCandidateMask(Index idx, Mask mask, ReasonId reason, AssignmentLog *log);

  void applySetValue(Index idx, Digit digit, ReasonId reason, AssignmentLog *log);

  void applyRemoveCandidate(Index idx, Digit digit, ReasonId reason, AssignmentLog *log);

  // --- whole board ---
  int countSolved() const;

  bool hasContradiction() const;

  bool isCompletelySolved() const;

  bool isValidSolution(const Topology &topology) const;

  bool operator==(const SudokuBoard &other) const;

  bool operator!=(const SudokuBoard &other) const;

private:
  // owned by value: copying a board gives an independent search branch
  SudokuCell cells[81];
};

#endif // SUDOKU_BOARD_H
