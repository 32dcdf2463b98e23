#include "../include/OperationResult.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using std::chrono::nanoseconds;

bool close_to(double a, double b) { return std::fabs(a - b) < 1e-9; }

void test_a_faster() {
  OperationResult r("x", 100, nanoseconds{500}, nanoseconds{700});
  assert(r.faster() == Variant::A);
  assert(close_to(r.speed_ratio(), 1.4));
  std::cout << "[PASS] test_a_faster\n";
}

void test_b_faster() {
  OperationResult r("x", 100, nanoseconds{900}, nanoseconds{300});
  assert(r.faster() == Variant::B);
  assert(close_to(r.speed_ratio(), 3.0));
  std::cout << "[PASS] test_b_faster\n";
}

void test_derived_fields_are_reproducible() {
  OperationResult first("x", 100, nanoseconds{500}, nanoseconds{700});
  OperationResult second("x", 100, nanoseconds{500}, nanoseconds{700});
  assert(first.faster() == second.faster());
  assert(first.speed_ratio() == second.speed_ratio());
  assert(second.faster() == Variant::A);
  assert(close_to(second.speed_ratio(), 1.4));
  std::cout << "[PASS] test_derived_fields_are_reproducible\n";
}

void test_fields_preserved() {
  OperationResult r("remove-front", 250, nanoseconds{12}, nanoseconds{34},
                    nanoseconds{5});
  assert(r.name() == "remove-front");
  assert(r.operation_count() == 250);
  assert(r.duration_a().count() == 12);
  assert(r.duration_b().count() == 34);
  assert(r.tie_tolerance().count() == 5);
  std::cout << "[PASS] test_fields_preserved\n";
}

void test_zero_duration_ratio() {
  OperationResult a_zero("x", 1, nanoseconds{0}, nanoseconds{700});
  assert(a_zero.speed_ratio() == 0.0);
  OperationResult b_zero("x", 1, nanoseconds{700}, nanoseconds{0});
  assert(b_zero.speed_ratio() == 0.0);
  OperationResult both_zero("x", 1, nanoseconds{0}, nanoseconds{0});
  assert(both_zero.speed_ratio() == 0.0);
  assert(both_zero.faster() == Variant::Tie);
  std::cout << "[PASS] test_zero_duration_ratio\n";
}

void test_ratio_at_least_one() {
  const long long samples[][2] = {
      {1, 1}, {1, 2}, {2, 1}, {999, 1000}, {1000, 999}, {5, 123456789}};
  for (const auto &s : samples) {
    OperationResult r("x", 1, nanoseconds(s[0]), nanoseconds(s[1]));
    assert(r.speed_ratio() >= 1.0);
  }
  std::cout << "[PASS] test_ratio_at_least_one\n";
}

void test_equal_durations_tie() {
  OperationResult r("x", 10, nanoseconds{400}, nanoseconds{400});
  assert(r.faster() == Variant::Tie);
  assert(close_to(r.speed_ratio(), 1.0));
  std::cout << "[PASS] test_equal_durations_tie\n";
}

void test_tolerance_boundary() {
  // Difference of 999 is below a 1000 ns tolerance
  OperationResult below("x", 10, nanoseconds{1000}, nanoseconds{1999},
                        nanoseconds{1000});
  assert(below.faster() == Variant::Tie);

  // Difference of exactly 1000 is not below it
  OperationResult at("x", 10, nanoseconds{1000}, nanoseconds{2000},
                     nanoseconds{1000});
  assert(at.faster() == Variant::A);

  OperationResult above("x", 10, nanoseconds{5000}, nanoseconds{1000},
                        nanoseconds{1000});
  assert(above.faster() == Variant::B);
  std::cout << "[PASS] test_tolerance_boundary\n";
}

void test_tie_keeps_ratio() {
  OperationResult r("x", 10, nanoseconds{100}, nanoseconds{150},
                    nanoseconds{1000});
  assert(r.faster() == Variant::Tie);
  assert(close_to(r.speed_ratio(), 1.5));
  std::cout << "[PASS] test_tie_keeps_ratio\n";
}

int main() {
  std::cout << "Running OperationResult tests...\n\n";

  // Derived fields
  test_a_faster();
  test_b_faster();
  test_derived_fields_are_reproducible();
  test_fields_preserved();

  // Speed ratio
  test_zero_duration_ratio();
  test_ratio_at_least_one();

  // Ties
  test_equal_durations_tie();
  test_tolerance_boundary();
  test_tie_keeps_ratio();

  std::cout << "\n=== All 9 OperationResult tests passed! ===\n";
  return 0;
}
