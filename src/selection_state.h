#ifndef BRICKED_SELECTION_STATE_H_
#define BRICKED_SELECTION_STATE_H_

namespace bricked {

// -1 means none. A manual selection suppresses the auto-highlight.
struct SelectionState {
  int selected = -1;
  int autoHighlight = -1;
};

inline int EmphasizedIndex(const SelectionState &s) {
  return s.selected >= 0 ? s.selected : s.autoHighlight;
}

}  // namespace bricked

#endif  // BRICKED_SELECTION_STATE_H_
