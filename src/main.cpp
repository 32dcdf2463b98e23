#include "../include/ArgParser.hpp"
#include "../include/BenchmarkRunner.hpp"
#include "../include/JsonOutput.hpp"
#include "../include/Reporter.hpp"
#include <exception>
#include <iostream>
#include <vector>

int main(int argc, char *argv[]) {
  try {
    BenchOptions opts = ArgParser::parse(argc, argv);
    if (opts.show_help) {
      ArgParser::print_usage(argv[0]);
      return 0;
    }

    RunnerConfig cfg;
    cfg.tie_tolerance = std::chrono::nanoseconds{opts.tie_tolerance_ns};
    cfg.seed = opts.seed;

    BenchmarkRunner runner(cfg);

    if (opts.verbose) {
      runner.set_progress_callback([](const OperationResult &r) {
        std::cerr << "  " << r.name() << " x" << r.operation_count()
                  << ": A=" << r.duration_a().count()
                  << " ns B=" << r.duration_b().count() << " ns\n";
      });
    }

    // Each count gets its own freshly constructed containers
    std::vector<ResultSet> sets;
    sets.reserve(opts.sizes.size());
    for (int64_t size : opts.sizes) {
      if (opts.verbose)
        std::cerr << "Running battery for " << size << " operations\n";
      sets.push_back(runner.run(size));
    }

    if (opts.json_output) {
      JsonOutput::write_report(std::cout, sets, cfg.seed, opts.tie_tolerance_ns);
    } else {
      Reporter::render_report(std::cout, sets, opts.detailed);
    }
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
