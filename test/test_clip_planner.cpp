#include <cassert>
#include <cstdio>
#include <cmath>
#include "timeline/ClipPlanner.h"

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

void test_backward_window() {
    ClipWindow w = ClipPlanner::plan(ClipMode::Backward, 12.0, 5.0);
    assert(near(w.start, 7.0));
    assert(near(w.end, 12.0));
    assert(near(w.duration(), 5.0));
    assert(w.isValid());
    printf("PASS: test_backward_window\n");
}

void test_backward_clamps_at_zero() {
    ClipWindow w = ClipPlanner::plan(ClipMode::Backward, 1.5, 2.0);
    assert(near(w.start, 0.0));
    assert(near(w.end, 1.5));
    printf("PASS: test_backward_clamps_at_zero\n");
}

void test_backward_at_zero_is_empty() {
    ClipWindow w = ClipPlanner::plan(ClipMode::Backward, 0.0, 2.0);
    assert(!w.isValid());
    printf("PASS: test_backward_at_zero_is_empty\n");
}

void test_centered_window() {
    ClipWindow w = ClipPlanner::plan(ClipMode::Centered, 10.0, 4.0);
    assert(near(w.start, 8.0));
    assert(near(w.end, 12.0));
    assert(near((w.start + w.end) / 2.0, 10.0));

    // Clamped at the start of the video, duration kept
    w = ClipPlanner::plan(ClipMode::Centered, 0.5, 4.0);
    assert(near(w.start, 0.0));
    assert(near(w.end, 4.0));
    assert(near(w.start + 4.0, w.end));
    printf("PASS: test_centered_window\n");
}

void test_range_window() {
    ClipWindow w = ClipPlanner::plan(ClipMode::Range, 30.0, 2.0, 2.0, 5.0);
    assert(near(w.start, 2.0));
    assert(near(w.end, 5.0));

    w = ClipPlanner::plan(ClipMode::Range, 30.0, 2.0, -1.0, 5.0);
    assert(near(w.start, 0.0));
    assert(near(w.end, 5.0));
    printf("PASS: test_range_window\n");
}

void test_range_falls_back_to_backward() {
    ClipWindow w = ClipPlanner::plan(ClipMode::Range, 12.0, 5.0, 8.0, 8.0);
    assert(near(w.start, 7.0) && near(w.end, 12.0));

    w = ClipPlanner::plan(ClipMode::Range, 12.0, 5.0, 9.0, 3.0);
    assert(near(w.start, 7.0) && near(w.end, 12.0));

    w = ClipPlanner::plan(ClipMode::Range, 12.0, 5.0, 3.0, std::nullopt);
    assert(near(w.start, 7.0) && near(w.end, 12.0));

    // Marks are ignored outside range mode
    w = ClipPlanner::plan(ClipMode::Backward, 12.0, 5.0, 2.0, 5.0);
    assert(near(w.start, 7.0) && near(w.end, 12.0));
    printf("PASS: test_range_falls_back_to_backward\n");
}

void test_mode_strings() {
    assert(ClipPlanner::modeToString(ClipMode::Backward) == "backward");
    assert(ClipPlanner::modeToString(ClipMode::Centered) == "centered");
    assert(ClipPlanner::modeToString(ClipMode::Range) == "range");
    assert(ClipPlanner::modeFromString(" Centered ") == ClipMode::Centered);
    assert(ClipPlanner::modeFromString("range") == ClipMode::Range);
    assert(!ClipPlanner::modeFromString("forward").has_value());
    printf("PASS: test_mode_strings\n");
}

int main() {
    test_backward_window();
    test_backward_clamps_at_zero();
    test_backward_at_zero_is_empty();
    test_centered_window();
    test_range_window();
    test_range_falls_back_to_backward();
    test_mode_strings();
    printf("All clip planner tests passed.\n");
    return 0;
}
