#ifndef SOLVER_H
#define SOLVER_H

#include <cstdint>

#define SUDOPROP_SOLVED 1
#define SUDOPROP_NO_SOLUTION 0
#define SUDOPROP_INVALID_INPUT (-1)

extern "C"
{
  int sudoprop_solver_full(const char *in81, char *out81, int diagonal);

  int sudoprop_solver_init_board(const char *in81, int diagonal);

  int sudoprop_solver_next_step(uint32_t *out, uint32_t out_words);

  int sudoprop_solver_snapshot(uint32_t step, uint16_t *cands81);

  int sudoprop_solver_log_size(void);
} // extern "C"

#endif // SOLVER_H
