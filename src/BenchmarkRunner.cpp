#include "../include/BenchmarkRunner.hpp"
#include <stdexcept>
#include <string>
#include <utility>

using Clock = std::chrono::steady_clock;

// Only the body runs between the two timestamps.
template <typename Body>
static std::chrono::nanoseconds time_block(Body &&body) {
  auto start = Clock::now();
  body();
  auto end = Clock::now();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
}

static void populate(Sequence &seq, int64_t count) {
  seq.clear();
  for (int64_t i = 0; i < count; i++) {
    seq.append(static_cast<int>(i));
  }
}

BenchmarkRunner::BenchmarkRunner(RunnerConfig cfg, SequenceFactory factory_a,
                                 SequenceFactory factory_b)
    : config(cfg), make_a(std::move(factory_a)), make_b(std::move(factory_b)),
      rng(cfg.seed) {}

void BenchmarkRunner::set_progress_callback(ProgressCallback cb) {
  progress_callback = std::move(cb);
}

OperationResult BenchmarkRunner::finish(std::string_view name,
                                        int64_t operations,
                                        std::chrono::nanoseconds a,
                                        std::chrono::nanoseconds b) {
  OperationResult result(std::string(name), operations, a, b,
                         config.tie_tolerance);
  if (progress_callback) {
    progress_callback(result);
  }
  return result;
}

ResultSet BenchmarkRunner::run(int64_t operation_count) {
  if (operation_count <= 0) {
    throw std::invalid_argument("operation count must be positive, got " +
                                std::to_string(operation_count));
  }

  auto a = make_a();
  auto b = make_b();
  if (!a || !b) {
    throw std::logic_error("sequence factory returned no sequence");
  }

  ResultSet set;
  set.operation_count = operation_count;
  set.variant_a = std::string(a->name());
  set.variant_b = std::string(b->name());
  set.results.reserve(BATTERY_SIZE);

  // Positional inserts and removals are linear per call on at least one
  // variant, so they run at a tenth (or twentieth) of the count.
  const int64_t tenth = operation_count / 10;
  const int64_t twentieth = operation_count / 20;

  set.results.push_back(time_append(*a, *b, operation_count));
  set.results.push_back(time_prepend(*a, *b, tenth));
  set.results.push_back(time_insert_middle(*a, *b, tenth));
  set.results.push_back(time_read_random(*a, *b, operation_count));
  set.results.push_back(time_read_sequential(*a, *b, operation_count));
  set.results.push_back(time_remove_front(*a, *b, tenth));
  set.results.push_back(time_remove_back(*a, *b, tenth));
  set.results.push_back(time_remove_middle(*a, *b, twentieth));

  return set;
}

// ========== Insertion ==========

OperationResult BenchmarkRunner::time_append(Sequence &a, Sequence &b,
                                             int64_t operations) {
  auto append_all = [operations](Sequence &seq) {
    for (int64_t i = 0; i < operations; i++) {
      seq.append(static_cast<int>(i));
    }
  };

  a.clear();
  auto duration_a = time_block([&] { append_all(a); });
  b.clear();
  auto duration_b = time_block([&] { append_all(b); });

  return finish(APPEND, operations, duration_a, duration_b);
}

OperationResult BenchmarkRunner::time_prepend(Sequence &a, Sequence &b,
                                              int64_t operations) {
  auto prepend_all = [operations](Sequence &seq) {
    for (int64_t i = 0; i < operations; i++) {
      seq.insert_at(0, static_cast<int>(i));
    }
  };

  populate(a, operations);
  auto duration_a = time_block([&] { prepend_all(a); });
  populate(b, operations);
  auto duration_b = time_block([&] { prepend_all(b); });

  return finish(PREPEND, operations, duration_a, duration_b);
}

OperationResult BenchmarkRunner::time_insert_middle(Sequence &a, Sequence &b,
                                                    int64_t operations) {
  auto insert_all = [operations](Sequence &seq) {
    for (int64_t i = 0; i < operations; i++) {
      seq.insert_at(seq.size() / 2, static_cast<int>(i));
    }
  };

  populate(a, operations);
  auto duration_a = time_block([&] { insert_all(a); });
  populate(b, operations);
  auto duration_b = time_block([&] { insert_all(b); });

  return finish(INSERT_MIDDLE, operations, duration_a, duration_b);
}

// ========== Indexed Reads ==========

OperationResult BenchmarkRunner::time_read_random(Sequence &a, Sequence &b,
                                                  int64_t operations) {
  // Both variants read the same indices. The block engine is seeded from the
  // runner's engine, so every call draws a new stream.
  std::mt19937_64 gen_a(rng());
  std::mt19937_64 gen_b = gen_a;

  auto read_all = [this, operations](Sequence &seq, std::mt19937_64 &gen) {
    if (seq.empty()) return;
    std::uniform_int_distribution<size_t> index(0, seq.size() - 1);
    int64_t sum = 0;
    for (int64_t i = 0; i < operations; i++) {
      sum += seq.get_at(index(gen));
    }
    checksum += sum;
  };

  populate(a, operations);
  auto duration_a = time_block([&] { read_all(a, gen_a); });
  populate(b, operations);
  auto duration_b = time_block([&] { read_all(b, gen_b); });

  return finish(READ_RANDOM, operations, duration_a, duration_b);
}

OperationResult BenchmarkRunner::time_read_sequential(Sequence &a, Sequence &b,
                                                      int64_t operations) {
  auto read_all = [this, operations](Sequence &seq) {
    if (seq.empty()) return;
    const size_t size = seq.size();
    int64_t sum = 0;
    for (int64_t i = 0; i < operations; i++) {
      sum += seq.get_at(static_cast<size_t>(i) % size);
    }
    checksum += sum;
  };

  populate(a, operations);
  auto duration_a = time_block([&] { read_all(a); });
  populate(b, operations);
  auto duration_b = time_block([&] { read_all(b); });

  return finish(READ_SEQUENTIAL, operations, duration_a, duration_b);
}

// ========== Removal ==========

OperationResult BenchmarkRunner::time_remove_front(Sequence &a, Sequence &b,
                                                   int64_t operations) {
  auto remove_all = [operations](Sequence &seq) {
    for (int64_t i = 0; i < operations && !seq.empty(); i++) {
      seq.remove_at(0);
    }
  };

  populate(a, 2 * operations);
  auto duration_a = time_block([&] { remove_all(a); });
  populate(b, 2 * operations);
  auto duration_b = time_block([&] { remove_all(b); });

  return finish(REMOVE_FRONT, operations, duration_a, duration_b);
}

OperationResult BenchmarkRunner::time_remove_back(Sequence &a, Sequence &b,
                                                  int64_t operations) {
  auto remove_all = [operations](Sequence &seq) {
    for (int64_t i = 0; i < operations && !seq.empty(); i++) {
      seq.remove_at(seq.size() - 1);
    }
  };

  populate(a, 2 * operations);
  auto duration_a = time_block([&] { remove_all(a); });
  populate(b, 2 * operations);
  auto duration_b = time_block([&] { remove_all(b); });

  return finish(REMOVE_BACK, operations, duration_a, duration_b);
}

OperationResult BenchmarkRunner::time_remove_middle(Sequence &a, Sequence &b,
                                                    int64_t operations) {
  auto remove_all = [operations](Sequence &seq) {
    for (int64_t i = 0; i < operations && !seq.empty(); i++) {
      seq.remove_at(seq.size() / 2);
    }
  };

  populate(a, 3 * operations);
  auto duration_a = time_block([&] { remove_all(a); });
  populate(b, 3 * operations);
  auto duration_b = time_block([&] { remove_all(b); });

  return finish(REMOVE_MIDDLE, operations, duration_a, duration_b);
}
