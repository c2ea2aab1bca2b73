#include "SudokuBoard.hpp"
#include "AssignmentLog.hpp"
#include "Topology.hpp"
#include "utils.hpp"

#include <cstring>
#include <sstream>

// =========================================================
// SudokuBoard
// =========================================================

// every cell unknown
SudokuBoard::SudokuBoard() = default;

int SudokuBoard::importFromString(const char *values, AssignmentLog *log, std::string *err) {
  if (values == nullptr) {
    if (err) {
      *err = "no grid given";
    }
    return 0;
  }

  // validate everything before touching the board
  const size_t len = std::strlen(values);
  if (len != 81) {
    if (err) {
      std::ostringstream oss;
      oss << "expected 81 characters, got " << len;
      *err = oss.str();
    }
    return 0;
  }

  for (size_t i = 0; i < 81; i++) {
    const char ch = values[i];
    if ((ch < '1' || ch > '9') && ch != '.') {
      if (err) {
        std::ostringstream oss;
        oss << "invalid character '" << ch << "' at position " << i << " (allowed: 1-9 or .)";
        *err = oss.str();
      }
      return 0;
    }
  }

  for (Index i = 0; i < 81; i++) {
    cells[i].setCandidateMask(ALL_CANDIDATES);
  }

  // one log entry per cell, givens and unknowns alike
  for (Index i = 0; i < 81; i++) {
    const char ch = values[i];
    if (ch == '.') {
      cells[i].setCandidateMask(ALL_CANDIDATES);
    } else {
      cells[i].setCandidateMask(digitToBit((Digit)(ch - '0')));
    }
    if (log) {
      log->record(*this, i, ch == '.' ? ReasonId::Unknown : ReasonId::Given);
    }
  }

  return 1;
}

void SudokuBoard::exportToString(char *out81) const {
  for (Index i = 0; i < 81; i++) {
    const Digit value = getValue(i);
    out81[i] = value ? (char)('0' + value) : '.';
  }
  out81[81] = '\0';
}

std::string SudokuBoard::toString() const {
  char buf[82];
  exportToString(buf);
  return std::string(buf, 81);
}

std::string SudokuBoard::format() const {
  size_t longest = 0;
  for (const SudokuCell &c : cells) {
    if (c.countCandidates() > longest) {
      longest = c.countCandidates();
    }
  }
  const size_t width = longest + 1;

  const std::string group(width * 3, '-');
  const std::string separator = group + "+" + group + "+" + group;

  std::string out;
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      const std::string content = cells[r * 9 + c].toString();
      const size_t pad = width - content.size();
      // extra padding goes to the right
      out.append(pad / 2, ' ');
      out += content;
      out.append(pad - pad / 2, ' ');
      if (c == 2 || c == 5) {
        out += '|';
      }
    }
    out += '\n';
    if (r == 2 || r == 5) {
      out += separator;
      out += '\n';
    }
  }
  return out;
}

void SudokuBoard::exportToBuffers(uint16_t *cands) const {
  for (Index i = 0; i < 81; i++) {
    cands[i] = cells[i].getCandidateMask();
  }
}

// --- values API ---
Digit SudokuBoard::getValue(Index idx) const {
  return cells[idx].getValue();
}

bool SudokuBoard::isSolved(Index idx) const {
  return cells[idx].isSolved();
}

// --- candidates API ---
const SudokuCell &SudokuBoard::cell(Index idx) const {
  return cells[idx];
}

Mask SudokuBoard::getCandidateMask(Index idx) const {
  return cells[idx].getCandidateMask();
}

bool SudokuBoard::hasCandidate(Index idx, Digit digit) const {
  return cells[idx].hasCandidate(digit);
}

size_t SudokuBoard::countCandidates(Index idx) const {
  return cells[idx].countCandidates();
}

Digit SudokuBoard::getSingleCandidate(Index idx) const {
  return cells[idx].getSingleCandidate();
}

// --- events API ---
void SudokuBoard::applyCandidateMask(Index idx, Mask mask, ReasonId reason, AssignmentLog *log) {
  const Mask before = cells[idx].getCandidateMask();
  cells[idx].setCandidateMask(mask);
  if (log && cells[idx].isSolved() && cells[idx].getCandidateMask() != before) {
    log->record(*this, idx, reason);
  }
}

void SudokuBoard::applySetValue(Index idx, Digit digit, ReasonId reason, AssignmentLog *log) {
  applyCandidateMask(idx, digitToBit(digit), reason, log);
}

void SudokuBoard::applyRemoveCandidate(Index idx, Digit digit, ReasonId reason, AssignmentLog *log) {
  const bool wasSolved = cells[idx].isSolved();
  if (!cells[idx].disableCandidate(digit)) {
    return;
  }
  if (log && !wasSolved && cells[idx].isSolved()) {
    log->record(*this, idx, reason);
  }
}

// --- whole board ---
int SudokuBoard::countSolved() const {
  int solved = 0;
  for (const SudokuCell &c : cells) {
    if (c.isSolved()) {
      ++solved;
    }
  }
  return solved;
}

bool SudokuBoard::hasContradiction() const {
  for (const SudokuCell &c : cells) {
    if (c.isContradiction()) {
      return true;
    }
  }
  return false;
}

bool SudokuBoard::isCompletelySolved() const {
  for (const SudokuCell &c : cells) {
    if (!c.isSolved()) {
      return false;
    }
  }
  return true;
}

bool SudokuBoard::isValidSolution(const Topology &topology) const {
  if (!isCompletelySolved()) {
    return false;
  }
  for (const Unit &unit : topology.units()) {
    Mask seen = 0;
    for (Index idx : unit) {
      seen = (Mask)(seen | cells[idx].getCandidateMask());
    }
    // nine solved cells cover 1..9 only if no digit repeats
    if (seen != ALL_CANDIDATES) {
      return false;
    }
  }
  return true;
}

bool SudokuBoard::operator==(const SudokuBoard &other) const {
  for (Index i = 0; i < 81; i++) {
    if (cells[i] != other.cells[i]) {
      return false;
    }
  }
  return true;
}

bool SudokuBoard::operator!=(const SudokuBoard &other) const {
  return !(*this == other);
}
