#ifndef TOPOLOGY_H
#define TOPOLOGY_H

#include <array>
#include <cstddef>
#include <vector>
#include "utils.hpp"

typedef std::array<Index, 9> Unit;

// Static structure of the grid: the units (rows, columns, boxes and,
// optionally, the two diagonals) plus the per-cell unit and peer indices.
// Immutable once built, so one instance can be shared by any number of
// solver runs.
class Topology
{
public:
  explicit Topology(bool diagonal);

  // process-wide instances, built on first use
  static const Topology &standard();

  static const Topology &diagonal();

  static const Topology &get(bool diagonal);

  bool isDiagonal() const;

  // 27, or 29 with diagonals
  size_t unitCount() const;

  const Unit &unit(size_t u) const;

  const std::vector<Unit> &units() const;

  // unit numbers containing idx, in unit order
  const std::vector<size_t> &unitsOf(Index idx) const;

  // cells sharing at least one unit with idx, ascending, idx excluded
  const std::vector<Index> &peersOf(Index idx) const;

  bool arePeers(Index a, Index b) const;

private:
  bool diag;
  std::vector<Unit> unitList;
  std::vector<size_t> cellUnits[81];
  std::vector<Index> cellPeers[81];

  void _addUnit(const int cells[9]);
};

#endif // TOPOLOGY_H
