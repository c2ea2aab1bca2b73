#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "solver.hpp"

static inline bool isDigitChar(char c) {
  return c >= '0' && c <= '9';
}

static inline bool isValidSudokuChar(char c) {
  return (c == '.') || isDigitChar(c);
}

static std::string trim(const std::string &s) {
  size_t a = 0;
  while (a < s.size() && (s[a] == ' ' || s[a] == '\t' || s[a] == '\r' || s[a] == '\n')) {
    a++;
  }
  size_t b = s.size();
  while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) {
    b--;
  }
  return s.substr(a, b - a);
}

static std::string normalize81(const std::string &line, std::string *err) {
  std::string s = trim(line);

  // Allow comments and blank lines
  if (s.empty() || s[0] == '#') {
    return "";
  }

  // Remove spaces in-between if the file uses spaced formatting.
  std::string compact;
  compact.reserve(s.size());
  for (char c : s) {
    if (c == ' ' || c == '\t') {
      continue;
    }
    compact.push_back(c);
  }

  if (compact.size() != 81) {
    if (err) {
      std::ostringstream oss;
      oss << "Expected 81 chars, got " << compact.size();
      *err = oss.str();
    }
    return "";
  }

  // the solver only takes '.' for empty cells
  for (char &c : compact) {
    if (!isValidSudokuChar(c)) {
      if (err) {
        *err = "Invalid character (allowed: 0-9 or .)";
      }
      return "";
    }
    if (c == '0') {
      c = '.';
    }
  }

  return compact;
}

static inline uint16_t bitForDigit(int d) {
  return static_cast<uint16_t>(1u << (d - 1));
}

static bool checkUnitMask(const std::vector<int> &idxs, const std::string &out81, std::string *why) {
  uint16_t seen = 0;
  for (int idx : idxs) {
    char c = out81[(size_t)idx];
    if (c < '1' || c > '9') {
      if (why) {
        std::ostringstream oss;
        oss << "Non-digit in solution at idx=" << idx << " ('" << c << "')";
        *why = oss.str();
      }
      return false;
    }
    int d = c - '0';
    uint16_t b = bitForDigit(d);
    if ((seen & b) != 0) {
      if (why) {
        std::ostringstream oss;
        oss << "Duplicate digit " << d << " in unit";
        *why = oss.str();
      }
      return false;
    }
    seen = static_cast<uint16_t>(seen | b);
  }
  if (seen != 0x01FFu) {
    if (why) {
      *why = "Unit does not contain all digits 1..9";
    }
    return false;
  }
  return true;
}

static bool validateSolution(const std::string &in81, const std::string &out81, bool diagonal, std::string *why) {
  if (out81.size() != 81) {
    if (why) {
      *why = "Output length != 81";
    }
    return false;
  }

  // Check givens are preserved
  for (int i = 0; i < 81; i++) {
    char in = in81[(size_t)i];
    char out = out81[(size_t)i];
    if (in >= '1' && in <= '9') {
      if (out != in) {
        if (why) {
          std::ostringstream oss;
          oss << "Given mismatch at idx=" << i << " (in=" << in << ", out=" << out << ")";
          *why = oss.str();
        }
        return false;
      }
    }
  }

  // Build unit indices once
  static std::vector<std::vector<int>> rows;
  static std::vector<std::vector<int>> cols;
  static std::vector<std::vector<int>> boxes;
  static std::vector<std::vector<int>> diags;

  if (rows.empty()) {
    rows.resize(9);
    cols.resize(9);
    boxes.resize(9);
    diags.resize(2);
    for (int r = 0; r < 9; r++) {
      for (int c = 0; c < 9; c++) {
        int idx = r * 9 + c;
        rows[(size_t)r].push_back(idx);
        cols[(size_t)c].push_back(idx);
        int b = (r / 3) * 3 + (c / 3);
        boxes[(size_t)b].push_back(idx);
        if (r == c) {
          diags[0].push_back(idx);
        }
        if (r + c == 8) {
          diags[1].push_back(idx);
        }
      }
    }
  }

  // Check all rows/cols/boxes contain 1..9 exactly once.
  for (int u = 0; u < 9; u++) {
    std::string w;
    if (!checkUnitMask(rows[(size_t)u], out81, &w)) {
      if (why) {
        std::ostringstream oss;
        oss << "Row " << u << " invalid: " << w;
        *why = oss.str();
      }
      return false;
    }
    if (!checkUnitMask(cols[(size_t)u], out81, &w)) {
      if (why) {
        std::ostringstream oss;
        oss << "Col " << u << " invalid: " << w;
        *why = oss.str();
      }
      return false;
    }
    if (!checkUnitMask(boxes[(size_t)u], out81, &w)) {
      if (why) {
        std::ostringstream oss;
        oss << "Box " << u << " invalid: " << w;
        *why = oss.str();
      }
      return false;
    }
  }

  if (diagonal) {
    for (size_t u = 0; u < diags.size(); u++) {
      std::string w;
      if (!checkUnitMask(diags[u], out81, &w)) {
        if (why) {
          std::ostringstream oss;
          oss << "Diagonal " << u << " invalid: " << w;
          *why = oss.str();
        }
        return false;
      }
    }
  }

  return true;
}

static int runFullSolveOne(const std::string &in81, bool diagonal, std::string *out81, std::string *why) {
  char outBuf[82];
  std::memset(outBuf, 0, sizeof(outBuf));

  int rc = sudoprop_solver_full(in81.c_str(), outBuf, diagonal ? 1 : 0);

  *out81 = std::string(outBuf);

  if (rc != SUDOPROP_SOLVED) {
    if (why) {
      std::ostringstream oss;
      oss << "sudoprop_solver_full returned " << rc;
      *why = oss.str();
    }
    return 0;
  }

  std::string w;
  if (!validateSolution(in81, *out81, diagonal, &w)) {
    if (why) {
      *why = w;
    }
    return 0;
  }

  return 1;
}

// Replays the assignment log of a session and rebuilds the solution from
// the last snapshot.
static int runStepSolveOne(const std::string &in81, bool diagonal, std::string *out81, std::string *why) {
  int rc = sudoprop_solver_init_board(in81.c_str(), diagonal ? 1 : 0);
  if (rc != SUDOPROP_SOLVED) {
    if (why) {
      std::ostringstream oss;
      oss << "sudoprop_solver_init_board returned " << rc;
      *why = oss.str();
    }
    return 0;
  }

  uint32_t ev[5];
  uint32_t steps = 0;
  while (sudoprop_solver_next_step(ev, 5)) {
    if (ev[4] != steps || ev[1] > 80) {
      if (why) {
        std::ostringstream oss;
        oss << "Malformed step " << steps << " (idx=" << ev[1] << ", seq=" << ev[4] << ")";
        *why = oss.str();
      }
      return 0;
    }
    steps++;
  }

  if (steps != (uint32_t)sudoprop_solver_log_size() || steps < 81) {
    if (why) {
      std::ostringstream oss;
      oss << "Replayed " << steps << " steps, log has " << sudoprop_solver_log_size();
      *why = oss.str();
    }
    return 0;
  }

  uint16_t cands[81];
  if (!sudoprop_solver_snapshot(steps - 1, cands)) {
    if (why) {
      *why = "Last snapshot not available";
    }
    return 0;
  }

  out81->assign(81, '.');
  for (int i = 0; i < 81; i++) {
    for (int d = 1; d <= 9; d++) {
      if (cands[i] == bitForDigit(d)) {
        (*out81)[(size_t)i] = (char)('0' + d);
      }
    }
  }

  std::string w;
  if (!validateSolution(in81, *out81, diagonal, &w)) {
    if (why) {
      *why = "Last snapshot: " + w;
    }
    return 0;
  }

  return 1;
}

static void usage(const char *argv0) {
  std::cerr
      << "Usage: " << argv0 << " <sudoku_file.txt> [--mode=full|step] [--variant=standard|diagonal]\n"
      << "  Each non-empty, non-comment line must contain 81 chars: digits 0-9 or '.' for empty.\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 2;
  }

  std::string path = argv[1];
  std::string mode = "full";
  std::string variant = "standard";
  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    if (a.rfind("--mode=", 0) == 0) {
      mode = a.substr(std::strlen("--mode="));
    } else if (a.rfind("--variant=", 0) == 0) {
      variant = a.substr(std::strlen("--variant="));
    }
  }

  if (mode != "full" && mode != "step") {
    std::cerr << "Unknown mode: " << mode << "\n";
    usage(argv[0]);
    return 2;
  }

  if (variant != "standard" && variant != "diagonal") {
    std::cerr << "Unknown variant: " << variant << "\n";
    usage(argv[0]);
    return 2;
  }
  const bool diagonal = variant == "diagonal";

  std::ifstream fin(path);
  if (!fin) {
    std::cerr << "Failed to open file: " << path << "\n";
    return 2;
  }

  size_t total = 0;
  size_t passed = 0;
  size_t failed = 0;

  std::string line;
  size_t lineNo = 0;

  while (std::getline(fin, line)) {
    lineNo++;

    std::string err;
    std::string in81 = normalize81(line, &err);
    if (in81.empty()) {
      // Either blank/comment, or invalid. Distinguish:
      std::string t = trim(line);
      if (!t.empty() && t[0] != '#') {
        total++;
        failed++;
        std::cout << "[#" << total << " line " << lineNo << "] "
                  << "INPUT: " << t << "\n"
                  << "OUTPUT: " << "(n/a)\n"
                  << "RESULT: FAILED (" << err << ")\n\n";
      }
      continue;
    }

    total++;

    std::string out81;
    std::string why;

    int ok = 0;
    if (mode == "full") {
      ok = runFullSolveOne(in81, diagonal, &out81, &why);
    } else {
      ok = runStepSolveOne(in81, diagonal, &out81, &why);
    }

    if (ok) {
      passed++;
      std::cout << "[#" << total << " line " << lineNo << "] " << "\n"
                << "INPUT:  " << in81 << "\n"
                << "OUTPUT: " << out81 << "\n"
                << "RESULT: PASSED\n\n";
    } else {
      failed++;
      std::cout << "[#" << total << " line " << lineNo << "] " << "\n"
                << "INPUT:  " << in81 << "\n"
                << "OUTPUT: " << out81 << "\n"
                << "RESULT: FAILED (" << why << ")\n\n";
    }
  }

  std::cout << "SUMMARY: total=" << total << " passed=" << passed << " failed=" << failed << "\n";

  return (failed == 0 && total > 0) ? 0 : 1;
}
