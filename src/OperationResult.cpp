#include "../include/OperationResult.hpp"
#include <algorithm>
#include <utility>

OperationResult::OperationResult(std::string name, int64_t operation_count,
                                 std::chrono::nanoseconds duration_a,
                                 std::chrono::nanoseconds duration_b,
                                 std::chrono::nanoseconds tie_tolerance)
    : name_(std::move(name)), operation_count_(operation_count),
      duration_a_(duration_a), duration_b_(duration_b),
      tie_tolerance_(tie_tolerance), faster_(determine_faster()),
      speed_ratio_(calculate_speed_ratio()) {}

Variant OperationResult::determine_faster() const {
  auto diff = duration_a_ - duration_b_;
  if (diff < diff.zero()) diff = -diff;

  if (diff == diff.zero() || diff < tie_tolerance_) return Variant::Tie;
  return duration_a_ < duration_b_ ? Variant::A : Variant::B;
}

double OperationResult::calculate_speed_ratio() const {
  if (duration_a_.count() == 0 || duration_b_.count() == 0) return 0.0;

  auto slow = std::max(duration_a_, duration_b_);
  auto fast = std::min(duration_a_, duration_b_);
  return static_cast<double>(slow.count()) / static_cast<double>(fast.count());
}
