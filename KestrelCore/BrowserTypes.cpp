#include "BrowserTypes.h"

namespace Kestrel {

const char *DragStateToString(DragState state) {
  switch (state) {
  case DragState::Idle:
    return "Idle";
  case DragState::Tracking:
    return "Tracking";
  case DragState::Active:
    return "Active";
  case DragState::Reordered:
    return "Reordered";
  case DragState::TransferredOut:
    return "TransferredOut";
  case DragState::Detached:
    return "Detached";
  case DragState::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

const char *DragOutcomeToString(DragOutcome outcome) {
  switch (outcome) {
  case DragOutcome::None:
    return "None";
  case DragOutcome::Pending:
    return "Pending";
  case DragOutcome::Cancelled:
    return "Cancelled";
  case DragOutcome::Reordered:
    return "Reordered";
  case DragOutcome::TransferredOut:
    return "TransferredOut";
  case DragOutcome::Detached:
    return "Detached";
  }
  return "Unknown";
}

} // namespace Kestrel
