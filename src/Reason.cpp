#include "Reason.hpp"

const char *reasonName(ReasonId reason) {
  switch (reason) {
    case ReasonId::Given:
      return "given";
    case ReasonId::Unknown:
      return "unknown";
    case ReasonId::Eliminate:
      return "eliminate";
    case ReasonId::OnlyChoice:
      return "only-choice";
    case ReasonId::NakedTwins:
      return "naked-twins";
    case ReasonId::SearchTrial:
      return "search-trial";
  }
  return "?";
}
