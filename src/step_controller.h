#ifndef BRICKED_STEP_CONTROLLER_H_
#define BRICKED_STEP_CONTROLLER_H_

#include <cstddef>

namespace bricked {

// Progressive reveal cursor. Parts [0, cursor) are visible; cursor stays in
// [0, part_count] through every operation.
class StepController {
 public:
  explicit StepController(size_t part_count = 0) : part_count_(part_count), cursor_(0) {}

  void Advance();
  void Retreat();
  void JumpToStart() { cursor_ = 0; }
  void JumpToEnd() { cursor_ = part_count_; }
  void SetCursor(size_t cursor);
  void OnPartCountChanged(size_t part_count);

  // Most recently revealed part, or -1 when nothing is revealed or a manual
  // selection is active.
  int AutoHighlight(int manual_selection) const;

  bool IsVisible(size_t index) const { return index < cursor_; }
  bool finished() const { return part_count_ > 0 && cursor_ == part_count_; }
  size_t cursor() const { return cursor_; }
  size_t part_count() const { return part_count_; }

 private:
  size_t part_count_;
  size_t cursor_;
};

}  // namespace bricked

#endif  // BRICKED_STEP_CONTROLLER_H_
