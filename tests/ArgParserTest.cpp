#include "../include/ArgParser.hpp"
#include "../profiles/SizePresets.hpp"
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>

// Helper to create argv-style arguments
class ArgvBuilder {
public:
  ArgvBuilder() { args.push_back(strdup("list-bench")); }
  ~ArgvBuilder() {
    for (char* arg : args) free(arg);
  }

  ArgvBuilder& add(const char* arg) {
    args.push_back(strdup(arg));
    return *this;
  }

  int argc() const { return static_cast<int>(args.size()); }
  char** argv() { return args.data(); }

private:
  std::vector<char*> args;
};

void test_default_options() {
  ArgvBuilder builder;
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert(opts.preset == "standard");
  assert(opts.sizes == make_standard_sizes());
  assert(opts.tie_tolerance_ns == 1000);
  assert(opts.seed == 42);
  assert(opts.detailed == false);
  assert(opts.json_output == false);
  assert(opts.verbose == false);
  assert(opts.show_help == false);
  assert(opts.sizes_set == false);

  std::cout << "[PASS] test_default_options\n";
}

void test_preset_flag() {
  ArgvBuilder builder;
  builder.add("--preset").add("quick");
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert(opts.preset == "quick");
  assert(opts.sizes == make_quick_sizes());
  std::cout << "[PASS] test_preset_flag\n";
}

void test_unknown_preset_defaults_to_standard() {
  assert(get_preset_sizes("nonexistent") == make_standard_sizes());
  assert(get_preset_sizes("large") == make_large_sizes());
  assert(get_preset_sizes("tiny") == make_tiny_sizes());
  std::cout << "[PASS] test_unknown_preset_defaults_to_standard\n";
}

void test_sizes_flag() {
  ArgvBuilder builder;
  builder.add("--sizes").add("100,2500,40000");
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert(opts.sizes_set);
  assert((opts.sizes == std::vector<int64_t>{100, 2500, 40000}));
  std::cout << "[PASS] test_sizes_flag\n";
}

void test_sizes_override_preset() {
  ArgvBuilder builder;
  builder.add("--sizes").add("7").add("--preset").add("large");
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert((opts.sizes == std::vector<int64_t>{7}));
  std::cout << "[PASS] test_sizes_override_preset\n";
}

void test_parse_sizes_edge_cases() {
  assert(ArgParser::parse_sizes("").empty());
  assert((ArgParser::parse_sizes("5") == std::vector<int64_t>{5}));
  assert((ArgParser::parse_sizes("5,,6,") == std::vector<int64_t>{5, 6}));
  // Non-positive counts are the runner's to reject
  assert((ArgParser::parse_sizes("0,-5") == std::vector<int64_t>{0, -5}));
  std::cout << "[PASS] test_parse_sizes_edge_cases\n";
}

void test_malformed_size_throws() {
  bool threw = false;
  try {
    (void)ArgParser::parse_sizes("12,abc");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  std::cout << "[PASS] test_malformed_size_throws\n";
}

void test_tolerance_and_seed() {
  ArgvBuilder builder;
  builder.add("--tolerance").add("0").add("--seed").add("1234");
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert(opts.tie_tolerance_ns == 0);
  assert(opts.seed == 1234);
  std::cout << "[PASS] test_tolerance_and_seed\n";
}

void test_boolean_flags() {
  ArgvBuilder builder;
  builder.add("--details").add("--json").add("--verbose").add("--help");
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert(opts.detailed);
  assert(opts.json_output);
  assert(opts.verbose);
  assert(opts.show_help);
  std::cout << "[PASS] test_boolean_flags\n";
}

void test_missing_value_ignored() {
  ArgvBuilder builder;
  builder.add("--seed");
  auto opts = ArgParser::parse(builder.argc(), builder.argv());

  assert(opts.seed == 42);
  std::cout << "[PASS] test_missing_value_ignored\n";
}

int main() {
  std::cout << "Running ArgParser tests...\n\n";

  // Defaults and presets
  test_default_options();
  test_preset_flag();
  test_unknown_preset_defaults_to_standard();

  // Size lists
  test_sizes_flag();
  test_sizes_override_preset();
  test_parse_sizes_edge_cases();
  test_malformed_size_throws();

  // Remaining flags
  test_tolerance_and_seed();
  test_boolean_flags();
  test_missing_value_ignored();

  std::cout << "\n=== All 10 ArgParser tests passed! ===\n";
  return 0;
}
