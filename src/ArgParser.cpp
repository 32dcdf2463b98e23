#include "../include/ArgParser.hpp"
#include "../profiles/SizePresets.hpp"
#include <iostream>

void ArgParser::print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --preset <name>   standard|quick|large|tiny (default: standard)\n"
              << "  --sizes <n,...>   Comma separated operation counts (overrides preset)\n"
              << "  --tolerance <ns>  Differences below this many ns are a tie (default: 1000)\n"
              << "  --seed <n>        Seed for the random-read index stream (default: 42)\n"
              << "  --details         Print a per-operation analysis after each summary\n"
              << "  --json            Output JSON format\n"
              << "  --verbose         Log each timed block to stderr\n"
              << "  --help            Show this help\n";
}

std::vector<int64_t> ArgParser::parse_sizes(std::string_view list) {
    std::vector<int64_t> sizes;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string_view::npos) comma = list.size();
        std::string item(list.substr(start, comma - start));
        if (!item.empty()) {
            sizes.push_back(std::stoll(item));
        }
        start = comma + 1;
    }
    return sizes;
}

BenchOptions ArgParser::parse(int argc, char* argv[]) {
    BenchOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--preset" && i + 1 < argc) {
            opts.preset = argv[++i];
        } else if (arg == "--sizes" && i + 1 < argc) {
            opts.sizes = parse_sizes(argv[++i]);
            opts.sizes_set = true;
        } else if (arg == "--tolerance" && i + 1 < argc) {
            opts.tie_tolerance_ns = std::stoll(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            opts.seed = std::stoull(argv[++i]);
        } else if (arg == "--details") {
            opts.detailed = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help") {
            opts.show_help = true;
        }
    }

    // Explicit sizes win over the preset
    if (!opts.sizes_set) {
        opts.sizes = get_preset_sizes(opts.preset);
    }

    return opts;
}
