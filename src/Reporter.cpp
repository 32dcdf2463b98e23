#include "../include/Reporter.hpp"
#include <iomanip>
#include <sstream>

static constexpr int NAME_WIDTH = 18;
static constexpr int COUNT_WIDTH = 12;
static constexpr int TIME_WIDTH = 18;
static constexpr int RATIO_WIDTH = 8;
static constexpr int LABEL_WIDTH = 14;
static constexpr int CELL_WIDTH = 22;

static std::string rule(char c, size_t width) { return std::string(width, c); }

// ========== Labels ==========

std::string Reporter::faster_label(const ResultSet& set, const OperationResult& result) {
    switch (result.faster()) {
        case Variant::A: return set.variant_a;
        case Variant::B: return set.variant_b;
        case Variant::Tie: return "tie";
    }
    return "tie";
}

const char* Reporter::unit_suffix(TimeUnit unit) {
    return unit == TimeUnit::Milliseconds ? "ms" : "ns";
}

double Reporter::convert(std::chrono::nanoseconds duration, TimeUnit unit) {
    if (unit == TimeUnit::Milliseconds) {
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }
    return static_cast<double>(duration.count());
}

// ========== Tables ==========

void Reporter::render_table(std::ostream& out, const ResultSet& set, TimeUnit unit) {
    const std::string suffix = unit_suffix(unit);
    const size_t width = NAME_WIDTH + COUNT_WIDTH + 2 * TIME_WIDTH + RATIO_WIDTH +
                         LABEL_WIDTH + 15;

    out << rule('=', width) << "\n";
    out << "Results for " << set.operation_count << " operations (" << suffix << ")\n";
    out << rule('=', width) << "\n";
    out << std::left
        << std::setw(NAME_WIDTH) << "operation" << " | "
        << std::setw(COUNT_WIDTH) << "iterations" << " | "
        << std::setw(TIME_WIDTH) << (set.variant_a + " (" + suffix + ")") << " | "
        << std::setw(TIME_WIDTH) << (set.variant_b + " (" + suffix + ")") << " | "
        << std::setw(RATIO_WIDTH) << "ratio" << " | "
        << "faster\n";
    out << rule('-', width) << "\n";

    for (const auto& result : set.results) {
        out << std::left << std::setw(NAME_WIDTH) << result.name() << " | "
            << std::setw(COUNT_WIDTH) << result.operation_count() << " | " << std::right;
        if (unit == TimeUnit::Milliseconds) {
            out << std::fixed << std::setprecision(3)
                << std::setw(TIME_WIDTH) << convert(result.duration_a(), unit) << " | "
                << std::setw(TIME_WIDTH) << convert(result.duration_b(), unit) << " | ";
        } else {
            out << std::setw(TIME_WIDTH) << result.duration_a().count() << " | "
                << std::setw(TIME_WIDTH) << result.duration_b().count() << " | ";
        }
        out << std::fixed << std::setprecision(1)
            << std::setw(RATIO_WIDTH) << result.speed_ratio() << " | "
            << std::left << std::setw(LABEL_WIDTH) << faster_label(set, result) << "\n";
    }
    out << std::right;
}

// ========== Summary ==========

WinTally Reporter::tally(const ResultSet& set) {
    WinTally t;
    for (const auto& result : set.results) {
        switch (result.faster()) {
            case Variant::A: t.a_wins++; break;
            case Variant::B: t.b_wins++; break;
            case Variant::Tie: t.ties++; break;
        }
    }
    return t;
}

Recommendation Reporter::recommend(const WinTally& tally) {
    if (tally.a_wins > tally.b_wins) return Recommendation::PreferA;
    if (tally.b_wins > tally.a_wins) return Recommendation::PreferB;
    return Recommendation::DependsOnWorkload;
}

std::string Reporter::recommendation_text(const ResultSet& set, Recommendation rec) {
    switch (rec) {
        case Recommendation::PreferA:
            return "prefer " + set.variant_a;
        case Recommendation::PreferB:
            return "prefer " + set.variant_b;
        case Recommendation::DependsOnWorkload:
            return "depends on workload";
    }
    return "depends on workload";
}

void Reporter::render_summary(std::ostream& out, const ResultSet& set) {
    WinTally t = tally(set);
    Recommendation rec = recommend(t);

    out << rule('=', 70) << "\n";
    out << "Summary for " << set.operation_count << " operations\n";
    out << rule('=', 70) << "\n";
    out << set.variant_a << " wins: " << t.a_wins << "\n";
    out << set.variant_b << " wins: " << t.b_wins << "\n";
    out << "ties: " << t.ties << "\n\n";

    out << "Recommendation: " << recommendation_text(set, rec) << "\n";
    out << rule('-', 70) << "\n";
    switch (rec) {
        case Recommendation::PreferA:
            out << set.variant_a << " won most operations. It suits:\n"
                << "  - frequent indexed reads\n"
                << "  - appending and removing at the back\n"
                << "  - workloads where memory footprint matters\n";
            break;
        case Recommendation::PreferB:
            out << set.variant_b << " won most operations. It suits:\n"
                << "  - frequent inserts and removals at the front or middle\n"
                << "  - queue (FIFO) and stack (LIFO) usage\n"
                << "  - workloads dominated by positional edits\n";
            break;
        case Recommendation::DependsOnWorkload:
            out << "Neither container won outright. Choose by dominant operation:\n"
                << "  - indexed access: " << set.variant_a << "\n"
                << "  - positional inserts and removals: " << set.variant_b << "\n";
            break;
    }
}

// ========== Detailed Analysis ==========

std::string Reporter::verdict(const ResultSet& set, const OperationResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (result.faster() == Variant::Tie) {
        oss << "difference is negligible";
    } else if (result.speed_ratio() > 1.5) {
        oss << faster_label(set, result) << " is " << result.speed_ratio() << "x faster";
    } else if (result.speed_ratio() > 1.1) {
        oss << faster_label(set, result) << " is slightly faster ("
            << result.speed_ratio() << "x)";
    } else {
        oss << "difference is negligible";
    }
    return oss.str();
}

void Reporter::render_details(std::ostream& out, const ResultSet& set) {
    out << "Detailed analysis for " << set.operation_count << " operations\n";
    out << rule('-', 80) << "\n";

    for (const auto& result : set.results) {
        out << result.name() << " (" << result.operation_count() << " iterations):\n";
        out << "  " << std::left << std::setw(14) << set.variant_a << std::right
            << result.duration_a().count() << " ns (" << std::fixed << std::setprecision(3)
            << convert(result.duration_a(), TimeUnit::Milliseconds) << " ms)\n";
        out << "  " << std::left << std::setw(14) << set.variant_b << std::right
            << result.duration_b().count() << " ns (" << std::fixed << std::setprecision(3)
            << convert(result.duration_b(), TimeUnit::Milliseconds) << " ms)\n";
        out << "  " << verdict(set, result) << "\n";
    }
}

// ========== Multiple Operation Counts ==========

void Reporter::render_scaling(std::ostream& out, const std::vector<ResultSet>& sets) {
    if (sets.empty()) return;

    const size_t width = NAME_WIDTH + sets.size() * (CELL_WIDTH + 3);
    out << rule('=', width) << "\n";
    out << "Speed ratio by operation count\n";
    out << rule('=', width) << "\n";

    out << std::left << std::setw(NAME_WIDTH) << "operation";
    for (const auto& set : sets) {
        out << " | " << std::setw(CELL_WIDTH) << set.operation_count;
    }
    out << "\n" << rule('-', width) << "\n";

    // Battery order is fixed, so row i of every set is the same operation
    const auto& first = sets.front();
    for (size_t i = 0; i < first.results.size(); i++) {
        out << std::left << std::setw(NAME_WIDTH) << first.results[i].name();
        for (const auto& set : sets) {
            std::ostringstream cell;
            if (i < set.results.size()) {
                const auto& result = set.results[i];
                cell << std::fixed << std::setprecision(1) << result.speed_ratio() << "x "
                     << faster_label(set, result);
            }
            out << " | " << std::setw(CELL_WIDTH) << cell.str();
        }
        out << "\n";
    }
    out << std::right;
}

void Reporter::render_report(std::ostream& out, const std::vector<ResultSet>& sets,
                             bool detailed) {
    for (const auto& set : sets) {
        out << "\n" << rule('*', 30) << "\n";
        out << "Benchmark: " << set.operation_count << " operations\n";
        out << rule('*', 30) << "\n\n";

        render_table(out, set, TimeUnit::Nanoseconds);
        out << "\n";
        render_table(out, set, TimeUnit::Milliseconds);
        out << "\n";
        render_summary(out, set);

        if (detailed) {
            out << "\n";
            render_details(out, set);
        }
    }

    if (sets.size() > 1) {
        out << "\n";
        render_scaling(out, sets);
    }
}
