#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "OperationResult.hpp"

enum class TimeUnit { Nanoseconds, Milliseconds };

enum class Recommendation { PreferA, PreferB, DependsOnWorkload };

struct WinTally {
  int a_wins = 0;
  int b_wins = 0;
  int ties = 0;

  int total() const { return a_wins + b_wins + ties; }
};

/**
 * Reporter - human readable rendering of benchmark result sets.
 *
 * All functions are pure formatting over already measured data:
 * - Result tables in nanoseconds or milliseconds
 * - Win tally and the resulting recommendation
 * - Per-operation detailed verdicts
 * - Speed ratio across several operation counts
 */
class Reporter {
public:
    // ========== Labels ==========

    /**
     * Display label for the faster variant of a result: the variant's
     * container name, or "tie".
     */
    [[nodiscard]] static std::string faster_label(const ResultSet& set,
                                                  const OperationResult& result);

    [[nodiscard]] static const char* unit_suffix(TimeUnit unit);

    /// Duration in the requested unit: raw integer ns, or ns / 1e6 for ms.
    [[nodiscard]] static double convert(std::chrono::nanoseconds duration, TimeUnit unit);

    // ========== Tables ==========

    /**
     * Write one row per result: name, iterations, both durations in the
     * requested unit, speed ratio and the faster label.
     */
    static void render_table(std::ostream& out, const ResultSet& set, TimeUnit unit);

    // ========== Summary ==========

    [[nodiscard]] static WinTally tally(const ResultSet& set);

    [[nodiscard]] static Recommendation recommend(const WinTally& tally);

    [[nodiscard]] static std::string recommendation_text(const ResultSet& set,
                                                         Recommendation rec);

    /**
     * Write the win/tie counts followed by the recommendation and the
     * workloads the recommended container suits.
     */
    static void render_summary(std::ostream& out, const ResultSet& set);

    // ========== Detailed Analysis ==========

    /// One-line verdict for a result, graded by speed ratio.
    [[nodiscard]] static std::string verdict(const ResultSet& set,
                                             const OperationResult& result);

    static void render_details(std::ostream& out, const ResultSet& set);

    // ========== Multiple Operation Counts ==========

    /**
     * Write a table with one row per battery operation and one column per
     * operation count. Cells hold the speed ratio and the faster variant.
     */
    static void render_scaling(std::ostream& out, const std::vector<ResultSet>& sets);

    /**
     * Full report: for every set the ns table, ms table and summary (and
     * the details when requested), then the scaling table if there is more
     * than one set.
     */
    static void render_report(std::ostream& out, const std::vector<ResultSet>& sets,
                              bool detailed = false);
};
