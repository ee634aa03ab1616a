#include "label_history.hpp"
#include <cassert>
#include <cmath>
#include <cstdio>

using traffic::CongestionLabel;
using traffic::LabelHistory;

static bool eq(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int main() {
  std::printf("Starting LabelHistory tests...\n");

  {
    std::printf("Test 1: Empty and single label have no trend... ");
    LabelHistory h(5);
    assert(h.size() == 0);
    assert(h.capacity() == 5);
    assert(eq(h.slope(), 0.0));
    assert(!h.trending_down());
    h.push(CongestionLabel::High);
    assert(h.size() == 1);
    assert(eq(h.slope(), 0.0));
    assert(!h.trending_down());
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 2: Falling labels give a negative slope... ");
    LabelHistory h(5);
    h.push(CongestionLabel::High);
    h.push(CongestionLabel::Medium);
    h.push(CongestionLabel::Low);
    // levels 2,1,0 -> slope -1
    assert(eq(h.slope(), -1.0));
    assert(h.trending_down());
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 3: Flat and rising labels are not trending down... ");
    LabelHistory flat(4);
    for (int i = 0; i < 4; ++i) flat.push(CongestionLabel::High);
    assert(eq(flat.slope(), 0.0));
    assert(!flat.trending_down());

    LabelHistory up(4);
    up.push(CongestionLabel::Low);
    up.push(CongestionLabel::Medium);
    up.push(CongestionLabel::High);
    assert(up.slope() > 0.0);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 4: Ring overwrites the oldest label... ");
    LabelHistory h(3);
    h.push(CongestionLabel::High);
    h.push(CongestionLabel::High);
    h.push(CongestionLabel::Low);
    h.push(CongestionLabel::Medium);  // drops the first High
    assert(h.size() == 3);
    assert(h.at(0) == CongestionLabel::High);
    assert(h.at(1) == CongestionLabel::Low);
    assert(h.at(2) == CongestionLabel::Medium);
    // levels 2,0,1 -> slope -0.5
    assert(eq(h.slope(), -0.5));
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 5: Equality follows retained order, not slot layout... ");
    LabelHistory a(2), b(2);
    a.push(CongestionLabel::Low);
    a.push(CongestionLabel::Medium);
    a.push(CongestionLabel::High);
    b.push(CongestionLabel::Medium);
    b.push(CongestionLabel::High);
    assert(a == b);
    b.push(CongestionLabel::Low);
    assert(!(a == b));
    std::printf("PASSED\n");
  }

  std::printf("All LabelHistory tests passed.\n");
  return 0;
}
