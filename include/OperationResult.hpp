#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

enum class Variant { A, B, Tie };

/**
 * OperationResult - timing of one battery operation on both variants.
 *
 * faster and speed_ratio are derived once in the constructor. Durations
 * whose difference is strictly below tie_tolerance count as a tie; with a
 * zero tolerance only identical durations tie.
 */
class OperationResult {
private:
  std::string name_;
  int64_t operation_count_;
  std::chrono::nanoseconds duration_a_;
  std::chrono::nanoseconds duration_b_;
  std::chrono::nanoseconds tie_tolerance_;
  Variant faster_;
  double speed_ratio_;

  Variant determine_faster() const;
  double calculate_speed_ratio() const;

public:
  OperationResult(std::string name, int64_t operation_count,
                  std::chrono::nanoseconds duration_a,
                  std::chrono::nanoseconds duration_b,
                  std::chrono::nanoseconds tie_tolerance = std::chrono::nanoseconds{0});

  const std::string &name() const { return name_; }
  int64_t operation_count() const { return operation_count_; }
  std::chrono::nanoseconds duration_a() const { return duration_a_; }
  std::chrono::nanoseconds duration_b() const { return duration_b_; }
  std::chrono::nanoseconds tie_tolerance() const { return tie_tolerance_; }

  Variant faster() const { return faster_; }

  // max/min of the two durations, 0 when either is zero
  double speed_ratio() const { return speed_ratio_; }
};

// All results of one runner invocation, in battery order.
struct ResultSet {
  int64_t operation_count = 0;
  std::string variant_a;
  std::string variant_b;
  std::vector<OperationResult> results;

  size_t size() const { return results.size(); }
};
