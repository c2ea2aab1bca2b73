// Sudoprop Solver Core (C++)
// C entry points for native callers and the WebAssembly build.
//
// Exported functions:
//   int sudoprop_solver_full(const char *in81, char *out81, int diagonal);
//   int sudoprop_solver_init_board(const char *in81, int diagonal);
//   int sudoprop_solver_next_step(uint32_t *out, uint32_t out_words);
//   int sudoprop_solver_snapshot(uint32_t step, uint16_t *cands81);
//   int sudoprop_solver_log_size(void);
//
// Input string:
//   in81[81]   : char      ('.' = empty, '1'..'9' = digit), '\0' terminated
//   diagonal   : int       (non-zero adds the two diagonal units)
//
// Output string (out81[82] as char):
//   out81      : solved grid + '\0', empty string when not solved
//
// Output buffer (out[5] as uint32_t):
//   out[0] = reasonId (0 = given, 1 = unknown, 2 = eliminate, 3 = only-choice,
//                      4 = naked-twins, 5 = search-trial)
//   out[1] = idx      (0..80)
//   out[2] = digit    (1..9, 0 = cell still has several candidates)
//   out[3] = cands    (bit0..bit8 correspond to digits 1..9)
//   out[4] = step     (position in the assignment log)
//
// Snapshot buffer (cands81[81] as uint16_t):
//   candidate masks of every cell right after the given step
//
// Return codes: SUDOPROP_SOLVED, SUDOPROP_NO_SOLUTION, SUDOPROP_INVALID_INPUT.
//
// Notes:
//   - sudoprop_solver_full keeps no state.
//   - sudoprop_solver_init_board solves the board and keeps its assignment
//     log; sudoprop_solver_next_step and sudoprop_solver_snapshot replay it.
//   - The replay session is the only global state; the solver itself gets
//     its log passed in.

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>

#include "solver.hpp"
#include "AssignmentLog.hpp"
#include "SudokuBoard.hpp"
#include "Topology.hpp"
#include "search.hpp"

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
#else
  // native
  #include <cstdio>
  #define EMSCRIPTEN_KEEPALIVE
  #define emscripten_log(x, fmt, ...) fprintf(stderr, fmt, ##__VA_ARGS__);
#endif

static AssignmentLog g_assignmentLog;
static std::size_t g_nextStep = 0;

static int statusToCode(SolveStatus status) {
  switch (status) {
    case SolveStatus::Solved:
      return SUDOPROP_SOLVED;
    case SolveStatus::NoSolution:
      return SUDOPROP_NO_SOLUTION;
    case SolveStatus::InvalidInput:
      return SUDOPROP_INVALID_INPUT;
  }
  return SUDOPROP_INVALID_INPUT;
}

// shared by both solving entry points
static SolveStatus run_solver(const char *in81, int diagonal, SudokuBoard &out, AssignmentLog *log) {
  std::string err;
  const SolveStatus status = solve(in81, Topology::get(diagonal != 0), out, log, &err);

  if (status == SolveStatus::InvalidInput) {
    emscripten_log(EM_LOG_CONSOLE, "sudoprop: rejected grid: %s\n", err.c_str());
  } else if (status == SolveStatus::NoSolution) {
    emscripten_log(EM_LOG_CONSOLE, "sudoprop: no solution for %s\n", in81);
  }
  return status;
}

// =========================================================
// Public API exported to JS
// =========================================================

extern "C"
{
  // Solves an entire Sudoku given its initial representation in one shot.
  EMSCRIPTEN_KEEPALIVE
  int sudoprop_solver_full(const char *in81, char *out81, int diagonal) {
    if (in81 == nullptr || out81 == nullptr) {
      return SUDOPROP_INVALID_INPUT;
    }

    out81[0] = '\0';

    SudokuBoard board;
    const SolveStatus status = run_solver(in81, diagonal, board, nullptr);
    if (status == SolveStatus::Solved) {
      board.exportToString(out81);
    }

    return statusToCode(status);
  }

  // Solves the board and keeps its assignment log for step-by-step replay.
  EMSCRIPTEN_KEEPALIVE
  int sudoprop_solver_init_board(const char *in81, int diagonal) {
    // Reset session
    g_assignmentLog.clear();
    g_nextStep = 0;

    if (in81 == nullptr) {
      return SUDOPROP_INVALID_INPUT;
    }

    SudokuBoard board;
    const SolveStatus status = run_solver(in81, diagonal, board, &g_assignmentLog);
    emscripten_log(EM_LOG_CONSOLE, "sudoprop: session ready, %u steps\n",
                   (unsigned)g_assignmentLog.size());

    return statusToCode(status);
  }

  // Returns the next assignment of the session.
  // Returns 0 at the end of the log or on bad arguments, else 1.
  EMSCRIPTEN_KEEPALIVE
  int sudoprop_solver_next_step(uint32_t *out, uint32_t out_words) {
    if (out == nullptr || out_words < 5) {
      return 0;
    }

    if (g_nextStep >= g_assignmentLog.size()) {
      // nothing left to replay
      out[0] = 0;
      out[1] = 0;
      out[2] = 0;
      out[3] = 0;
      out[4] = 0;
      return 0;
    }

    const Assignment &a = g_assignmentLog.at(g_nextStep);
    out[0] = (uint32_t)a.reason;
    out[1] = (uint32_t)a.idx;
    out[2] = (uint32_t)a.snapshot.getSingleCandidate(a.idx);
    out[3] = (uint32_t)a.candidates;
    out[4] = (uint32_t)g_nextStep;
    g_nextStep++;
    return 1;
  }

  // Copies the whole board as it was right after the given step.
  // Returns 0 if the step does not exist, else 1.
  EMSCRIPTEN_KEEPALIVE
  int sudoprop_solver_snapshot(uint32_t step, uint16_t *cands81) {
    if (cands81 == nullptr || step >= g_assignmentLog.size()) {
      return 0;
    }

    g_assignmentLog.at(step).snapshot.exportToBuffers(cands81);
    return 1;
  }

  EMSCRIPTEN_KEEPALIVE
  int sudoprop_solver_log_size(void) {
    return (int)g_assignmentLog.size();
  }
} // extern "C"
