#include "step_controller.h"

#include <algorithm>

namespace bricked {

void StepController::Advance() {
  if (cursor_ < part_count_) ++cursor_;
}

void StepController::Retreat() {
  if (cursor_ > 0) --cursor_;
}

void StepController::SetCursor(size_t cursor) { cursor_ = std::min(cursor, part_count_); }

void StepController::OnPartCountChanged(size_t part_count) {
  part_count_ = part_count;
  cursor_ = std::min(cursor_, part_count_);
}

int StepController::AutoHighlight(int manual_selection) const {
  if (manual_selection >= 0) return -1;
  return cursor_ > 0 ? (int)cursor_ - 1 : -1;
}

}  // namespace bricked
