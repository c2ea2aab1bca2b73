#include "SudokuCell.hpp"
#include "utils.hpp"

// =========================================================
// SudokuCell
// =========================================================

// unknown cell: every digit is still possible
SudokuCell::SudokuCell() : candMask(ALL_CANDIDATES) { }

// --- value ---
Digit SudokuCell::getValue() const {
  return getSingleCandidate();
}

bool SudokuCell::isSolved() const {
  return countCandidates() == 1;
}

bool SudokuCell::isContradiction() const {
  return getCandidateMask() == 0;
}

// --- candidates ---
Mask SudokuCell::getCandidateMask() const {
  return (Mask)(candMask & 0x1FFu);
}

void SudokuCell::setCandidateMask(Mask mask) {
  candMask = (Mask)(mask & 0x1FFu);
}

bool SudokuCell::hasCandidate(Digit digit) const {
  if (digit < 1 || digit > 9) {
    return false;
  }
  return (getCandidateMask() & digitToBit(digit)) != 0;
}

size_t SudokuCell::countCandidates() const {
  return countBits9(getCandidateMask());
}

Digit SudokuCell::getSingleCandidate() const {
  const Mask m = getCandidateMask();
  if (countBits9(m) == 1) {
    return bitToDigitSingle(m);
  }
  return 0;
}

bool SudokuCell::disableCandidate(Digit digit) {
  const Mask bit = digitToBit(digit);
  const Mask before = getCandidateMask();
  const Mask after = (uint16_t)(before & ~bit);
  if (after != before) {
    candMask = after;
    return true;
  }
  return false;
}

std::string SudokuCell::toString() const {
  return maskToString(getCandidateMask());
}

bool SudokuCell::operator==(const SudokuCell &other) const {
  return getCandidateMask() == other.getCandidateMask();
}

bool SudokuCell::operator!=(const SudokuCell &other) const {
  return !(*this == other);
}
