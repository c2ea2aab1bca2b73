#ifndef REASON_H
#define REASON_H

#include <cstdint>

// why a cell got its candidates; carried by every assignment log entry
enum class ReasonId : uint8_t {
  Given = 0,
  Unknown = 1,
  Eliminate = 2,
  OnlyChoice = 3,
  NakedTwins = 4,
  SearchTrial = 5
};

const char *reasonName(ReasonId reason);

#endif // REASON_H
