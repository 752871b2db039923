// step_controller_test.cpp

#include <iostream>

#include "step_controller.h"

namespace {

static int g_pass = 0;
static int g_fail = 0;

bool require(bool cond, const char *label) {
  if (cond) {
    std::cout << "  PASS: " << label << "\n";
    ++g_pass;
  } else {
    std::cout << "  FAIL: " << label << "\n";
    ++g_fail;
  }
  return cond;
}

void test_walkthrough() {
  std::cout << "\n[step_controller_test] two-part walkthrough\n";
  bricked::StepController steps(2);
  require(steps.cursor() == 0, "starts before the first step");
  require(steps.AutoHighlight(-1) == -1, "nothing highlighted at cursor 0");
  require(!steps.IsVisible(0), "part 0 hidden at cursor 0");

  steps.Advance();
  require(steps.cursor() == 1 && steps.IsVisible(0) && !steps.IsVisible(1), "advance reveals part 0");
  require(steps.AutoHighlight(-1) == 0, "newest revealed part highlighted");
  require(steps.AutoHighlight(1) == -1, "manual selection suppresses auto highlight");

  steps.Advance();
  steps.Advance();
  require(steps.cursor() == 2 && steps.finished(), "advance stops at the part count");

  steps.Retreat();
  require(steps.cursor() == 1, "retreat steps back");
  steps.JumpToStart();
  steps.Retreat();
  require(steps.cursor() == 0, "retreat stops at zero");
  steps.JumpToEnd();
  require(steps.cursor() == 2, "jump to end reveals everything");
}

void test_clamping() {
  std::cout << "\n[step_controller_test] clamping\n";
  bricked::StepController steps(5);
  steps.SetCursor(5);
  steps.OnPartCountChanged(3);
  require(steps.cursor() == 3, "part count shrink clamps 5 -> 3");
  steps.SetCursor(99);
  require(steps.cursor() == 3, "set cursor clamps to part count");
  steps.OnPartCountChanged(10);
  require(steps.cursor() == 3, "growing keeps the cursor");
  steps.OnPartCountChanged(0);
  require(steps.cursor() == 0 && !steps.finished(), "empty list resets and is not finished");
}

}  // namespace

int main() {
  std::cout << "[step_controller_test] starting\n";
  test_walkthrough();
  test_clamping();
  std::cout << "\n[step_controller_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[step_controller_test] PASS\n";
    return 0;
  }
  std::cout << "[step_controller_test] FAIL\n";
  return 1;
}
