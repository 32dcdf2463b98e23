#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct BenchOptions {
    std::string preset = "standard";
    std::vector<int64_t> sizes;
    int64_t tie_tolerance_ns = 1000;
    uint64_t seed = 42;
    bool detailed = false;
    bool json_output = false;
    bool verbose = false;
    bool show_help = false;
    bool sizes_set = false;
};

class ArgParser {
public:
    /// Parse command line arguments and return benchmark options
    [[nodiscard]] static BenchOptions parse(int argc, char* argv[]);

    /// Print usage/help information to stderr
    static void print_usage(const char* program_name);

    /// Parse a comma separated list of operation counts ("1000,5000")
    [[nodiscard]] static std::vector<int64_t> parse_sizes(std::string_view list);
};
