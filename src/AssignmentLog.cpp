#include "AssignmentLog.hpp"
#include <stdexcept>

// =========================================================
// Assignment log
// =========================================================

AssignmentLog::AssignmentLog() = default;

void AssignmentLog::record(const SudokuBoard &board, Index idx, ReasonId reason) {
  Assignment a;
  a.idx = idx;
  a.candidates = board.getCandidateMask(idx);
  a.reason = reason;
  a.snapshot = board;
  entries.push_back(a);
}

const Assignment &AssignmentLog::at(std::size_t i) const {
  if (i >= entries.size()) {
    throw std::out_of_range("AssignmentLog::at() index out of range");
  }
  return entries[i];
}

const Assignment &AssignmentLog::front() const {
  if (entries.empty()) {
    throw std::logic_error("AssignmentLog::front() on empty log");
  }
  return entries.front();
}

const Assignment &AssignmentLog::back() const {
  if (entries.empty()) {
    throw std::logic_error("AssignmentLog::back() on empty log");
  }
  return entries.back();
}

AssignmentLog::const_iterator AssignmentLog::begin() const {
  return entries.begin();
}

AssignmentLog::const_iterator AssignmentLog::end() const {
  return entries.end();
}

std::size_t AssignmentLog::size() const noexcept {
  return entries.size();
}

bool AssignmentLog::empty() const noexcept {
  return entries.empty();
}

void AssignmentLog::clear() {
  entries.clear();
}

bool AssignmentLog::writeTo(std::ostream &os) const {
  for (std::size_t i = 0; i < entries.size(); i++) {
    const Assignment &a = entries[i];
    os << i << ' ' << cellName(a.idx) << ' ' << reasonName(a.reason) << ' ';
    for (Index c = 0; c < 81; c++) {
      if (c != 0) {
        os << ',';
      }
      os << a.snapshot.cell(c).toString();
    }
    os << '\n';
    if (!os) {
      return false;
    }
  }
  os.flush();
  return static_cast<bool>(os);
}
