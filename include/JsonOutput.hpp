#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "OperationResult.hpp"
#include "Reporter.hpp"

/**
 * JsonOutput - Utility class for generating JSON output from benchmark results.
 *
 * Produces a single document for a whole invocation:
 * - Run context (seed, tie tolerance)
 * - One entry per operation count with every battery result
 * - The win tally and recommendation for each operation count
 */
class JsonOutput {
public:
    // ========== Utility Functions ==========

    /**
     * Escape special characters in a string for JSON compliance.
     * Handles: " and \ characters
     */
    [[nodiscard]] static std::string escape(std::string_view s);

    /// "A", "B" or "tie"
    [[nodiscard]] static const char* variant_char(Variant variant);

    /// Stable machine-readable name of a recommendation
    [[nodiscard]] static const char* recommendation_key(Recommendation rec);

    // ========== Results ==========

    /**
     * Write one operation result as a JSON object.
     *
     * @param out Output stream
     * @param result The measured operation
     * @param last Whether this is the last result in its array (controls trailing comma)
     */
    static void write_result(std::ostream& out, const OperationResult& result,
                             bool last = false);

    /**
     * Write the win tally and recommendation of a result set.
     */
    static void write_summary(std::ostream& out, const ResultSet& set);

    /**
     * Write a complete result set (operation count, variant names, results
     * and summary) as a JSON object.
     */
    static void write_result_set(std::ostream& out, const ResultSet& set,
                                 bool last = false);

    // ========== Full Document ==========

    static void write_report(std::ostream& out, const std::vector<ResultSet>& sets,
                             uint64_t seed, int64_t tie_tolerance_ns);
};
