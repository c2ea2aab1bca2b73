#ifndef ASSIGNMENT_LOG_H
#define ASSIGNMENT_LOG_H

#include <cstddef>
#include <ostream>
#include <vector>
#include "Reason.hpp"
#include "SudokuBoard.hpp"

// one entry = one cell assignment and the board right after it
struct Assignment {
  Index idx;
  Mask candidates;
  ReasonId reason;
  SudokuBoard snapshot;
};

// Append-only record of every cell resolved to a single candidate,
// consumed by step-by-step visualizers. Passed explicitly to the solver,
// so independent runs never share a log.
class AssignmentLog
{
public:
  typedef std::vector<Assignment>::const_iterator const_iterator;

  AssignmentLog();

  void record(const SudokuBoard &board, Index idx, ReasonId reason);

  const Assignment &at(std::size_t i) const;

  const Assignment &front() const;

  const Assignment &back() const;

  const_iterator begin() const;

  const_iterator end() const;

  std::size_t size() const noexcept;

  bool empty() const noexcept;

  void clear();

  // "<seq> <cell> <reason> <c0>,...,<c80>" per entry
  bool writeTo(std::ostream &os) const;

private:
  std::vector<Assignment> entries;
};

#endif // ASSIGNMENT_LOG_H
