#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

// Operation counts run by the driver, one runner invocation per entry.

// Default sweep
inline std::vector<int64_t> make_standard_sizes() {
  return {1000, 5000, 10000, 20000};
}

// Skips the largest count, for a quick look
inline std::vector<int64_t> make_quick_sizes() { return {1000, 5000, 10000}; }

// Positional tests get slow here for the array-backed variant's inserts
// and the linked variant's reads
inline std::vector<int64_t> make_large_sizes() {
  return {50000, 100000, 200000};
}

// At 10 operations remove-middle floors to zero iterations
inline std::vector<int64_t> make_tiny_sizes() { return {10, 100, 1000}; }

inline std::vector<int64_t> get_preset_sizes(std::string_view name) {
  if (name == "quick") return make_quick_sizes();
  if (name == "large") return make_large_sizes();
  if (name == "tiny") return make_tiny_sizes();
  return make_standard_sizes();
}
