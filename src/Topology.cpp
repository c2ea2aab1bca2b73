#include "Topology.hpp"
#include <algorithm>

// =========================================================
// Topology
// =========================================================

Topology::Topology(bool diagonal) : diag(diagonal) {
  // order: rows, columns, boxes, then diagonals
  for (int u = 0; u < 9; u++) {
    _addUnit(ROW_CELLS[u]);
  }
  for (int u = 0; u < 9; u++) {
    _addUnit(COL_CELLS[u]);
  }
  for (int u = 0; u < 9; u++) {
    _addUnit(BOX_CELLS[u]);
  }
  if (diag) {
    _addUnit(MAIN_DIAG_CELLS);
    _addUnit(ANTI_DIAG_CELLS);
  }

  for (size_t u = 0; u < unitList.size(); u++) {
    for (Index idx : unitList[u]) {
      cellUnits[idx].push_back(u);
    }
  }

  for (Index idx = 0; idx < 81; idx++) {
    std::vector<Index> &peers = cellPeers[idx];
    for (size_t u : cellUnits[idx]) {
      for (Index other : unitList[u]) {
        if (other != idx) {
          peers.push_back(other);
        }
      }
    }
    std::sort(peers.begin(), peers.end());
    peers.erase(std::unique(peers.begin(), peers.end()), peers.end());
  }
}

const Topology &Topology::standard() {
  static const Topology topology(false);
  return topology;
}

const Topology &Topology::diagonal() {
  static const Topology topology(true);
  return topology;
}

const Topology &Topology::get(bool diagonal) {
  return diagonal ? Topology::diagonal() : Topology::standard();
}

bool Topology::isDiagonal() const {
  return diag;
}

size_t Topology::unitCount() const {
  return unitList.size();
}

const Unit &Topology::unit(size_t u) const {
  return unitList[u];
}

const std::vector<Unit> &Topology::units() const {
  return unitList;
}

const std::vector<size_t> &Topology::unitsOf(Index idx) const {
  return cellUnits[idx];
}

const std::vector<Index> &Topology::peersOf(Index idx) const {
  return cellPeers[idx];
}

bool Topology::arePeers(Index a, Index b) const {
  const std::vector<Index> &peers = cellPeers[a];
  return std::binary_search(peers.begin(), peers.end(), b);
}

void Topology::_addUnit(const int cells[9]) {
  Unit unit;
  for (int k = 0; k < 9; k++) {
    unit[k] = cells[k];
  }
  unitList.push_back(unit);
}
