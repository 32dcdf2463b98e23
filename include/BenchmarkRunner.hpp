#pragma once

#include "OperationResult.hpp"
#include "Sequence.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string_view>

struct RunnerConfig {
  std::chrono::nanoseconds tie_tolerance{1000};
  uint64_t seed = 42;
};

/**
 * BenchmarkRunner - times the fixed operation battery on two sequences.
 *
 * Each block clears and pre-populates both sequences outside the timed
 * interval, then times variant A followed by variant B. The block
 * functions are public so fixtures can be checked after a block.
 */
class BenchmarkRunner {
public:
  using SequenceFactory = std::function<std::unique_ptr<Sequence>()>;
  using ProgressCallback = std::function<void(const OperationResult &)>;

  static constexpr std::string_view APPEND = "append";
  static constexpr std::string_view PREPEND = "prepend";
  static constexpr std::string_view INSERT_MIDDLE = "insert-middle";
  static constexpr std::string_view READ_RANDOM = "read-random";
  static constexpr std::string_view READ_SEQUENTIAL = "read-sequential";
  static constexpr std::string_view REMOVE_FRONT = "remove-front";
  static constexpr std::string_view REMOVE_BACK = "remove-back";
  static constexpr std::string_view REMOVE_MIDDLE = "remove-middle";

  static constexpr size_t BATTERY_SIZE = 8;

private:
  RunnerConfig config;
  SequenceFactory make_a;
  SequenceFactory make_b;
  ProgressCallback progress_callback;
  std::mt19937_64 rng;
  int64_t checksum = 0;

  OperationResult finish(std::string_view name, int64_t operations,
                         std::chrono::nanoseconds a,
                         std::chrono::nanoseconds b);

public:
  explicit BenchmarkRunner(RunnerConfig cfg = {},
                           SequenceFactory factory_a = make_array_sequence,
                           SequenceFactory factory_b = make_linked_sequence);

  void set_progress_callback(ProgressCallback cb);

  const RunnerConfig &get_config() const { return config; }

  /// Run the whole battery. Throws std::invalid_argument if operation_count <= 0.
  [[nodiscard]] ResultSet run(int64_t operation_count);

  // ========== Battery Blocks ==========

  OperationResult time_append(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_prepend(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_insert_middle(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_read_random(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_read_sequential(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_remove_front(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_remove_back(Sequence &a, Sequence &b, int64_t operations);
  OperationResult time_remove_middle(Sequence &a, Sequence &b, int64_t operations);

  // Sum of every value read so far; keeps the read loops observable.
  int64_t get_checksum() const { return checksum; }
};
