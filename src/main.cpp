#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include "AssignmentLog.hpp"
#include "SudokuBoard.hpp"
#include "Topology.hpp"
#include "search.hpp"

static const char *DIAG_EXAMPLE =
    "2.............62....1....7...6..8...3...9...7...6..4...4....8....52.............3";

static void usage(const char *argv0) {
  std::cerr
      << "Usage: " << argv0 << " [grid81] [--variant=standard|diagonal] [--log=<file>]\n"
      << "  grid81: 81 chars, digits 1-9 for givens and '.' for empty cells.\n"
      << "  Without a grid the diagonal example is solved.\n";
}

// The solution is already printed when this runs; a failed export is only
// reported.
static void exportLog(const AssignmentLog &log, const std::string &path) {
  std::ofstream fout(path);
  if (!fout) {
    std::cerr << "Notice: could not open " << path << " for the assignment log, skipping export\n";
    return;
  }
  if (!log.writeTo(fout)) {
    std::cerr << "Notice: writing the assignment log to " << path << " failed\n";
    return;
  }
  std::cerr << "Assignment log: " << log.size() << " steps written to " << path << "\n";
}

int main(int argc, char **argv) {
  std::string grid = DIAG_EXAMPLE;
  std::string variant = "diagonal";
  std::string logPath;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a.rfind("--variant=", 0) == 0) {
      variant = a.substr(std::strlen("--variant="));
    } else if (a.rfind("--log=", 0) == 0) {
      logPath = a.substr(std::strlen("--log="));
    } else if (a == "-h" || a == "--help") {
      usage(argv[0]);
      return 0;
    } else if (a.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << a << "\n";
      usage(argv[0]);
      return 2;
    } else {
      grid = a;
    }
  }

  if (variant != "standard" && variant != "diagonal") {
    std::cerr << "Unknown variant: " << variant << "\n";
    usage(argv[0]);
    return 2;
  }

  const Topology &topology = Topology::get(variant == "diagonal");

  AssignmentLog log;
  SudokuBoard solution;
  std::string err;
  // every entry holds a whole board, so only record when it gets exported
  AssignmentLog *recorder = logPath.empty() ? nullptr : &log;
  const SolveStatus status = solve(grid.c_str(), topology, solution, recorder, &err);

  if (status == SolveStatus::InvalidInput) {
    std::cerr << "Invalid grid: " << err << "\n";
    return 2;
  }

  if (status == SolveStatus::NoSolution) {
    std::cout << "No solution.\n";
  } else {
    std::cout << solution.format();
  }

  if (!logPath.empty()) {
    exportLog(log, logPath);
  }

  return status == SolveStatus::Solved ? 0 : 1;
}
