#include "../include/JsonOutput.hpp"
#include <iomanip>

// ========== Utility Functions ==========

std::string JsonOutput::escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"') out += "\\\"";
        else if (c == '\\') out += "\\\\";
        else out += c;
    }
    return out;
}

const char* JsonOutput::variant_char(Variant variant) {
    switch (variant) {
        case Variant::A: return "A";
        case Variant::B: return "B";
        case Variant::Tie: return "tie";
    }
    return "tie";
}

const char* JsonOutput::recommendation_key(Recommendation rec) {
    switch (rec) {
        case Recommendation::PreferA: return "A";
        case Recommendation::PreferB: return "B";
        case Recommendation::DependsOnWorkload: return "depends";
    }
    return "depends";
}

// ========== Results ==========

void JsonOutput::write_result(std::ostream& out, const OperationResult& result, bool last) {
    out << "        {\"name\": \"" << escape(result.name()) << "\", "
        << "\"operations\": " << result.operation_count() << ", "
        << "\"durationANs\": " << result.duration_a().count() << ", "
        << "\"durationBNs\": " << result.duration_b().count() << ", "
        << "\"speedRatio\": " << std::fixed << std::setprecision(3) << result.speed_ratio() << ", "
        << "\"faster\": \"" << variant_char(result.faster()) << "\"}"
        << (last ? "\n" : ",\n");
}

void JsonOutput::write_summary(std::ostream& out, const ResultSet& set) {
    WinTally t = Reporter::tally(set);
    out << "      \"summary\": {"
        << "\"aWins\": " << t.a_wins << ", "
        << "\"bWins\": " << t.b_wins << ", "
        << "\"ties\": " << t.ties << ", "
        << "\"recommendation\": \"" << recommendation_key(Reporter::recommend(t)) << "\"}\n";
}

void JsonOutput::write_result_set(std::ostream& out, const ResultSet& set, bool last) {
    out << "    {\n";
    out << "      \"operations\": " << set.operation_count << ",\n";
    out << "      \"variantA\": \"" << escape(set.variant_a) << "\",\n";
    out << "      \"variantB\": \"" << escape(set.variant_b) << "\",\n";
    out << "      \"results\": [\n";
    for (size_t i = 0; i < set.results.size(); i++) {
        write_result(out, set.results[i], i + 1 == set.results.size());
    }
    out << "      ],\n";
    write_summary(out, set);
    out << "    }" << (last ? "\n" : ",\n");
}

// ========== Full Document ==========

void JsonOutput::write_report(std::ostream& out, const std::vector<ResultSet>& sets,
                              uint64_t seed, int64_t tie_tolerance_ns) {
    out << "{\n";
    out << "  \"seed\": " << seed << ",\n";
    out << "  \"tieToleranceNs\": " << tie_tolerance_ns << ",\n";
    out << "  \"runs\": [\n";
    for (size_t i = 0; i < sets.size(); i++) {
        write_result_set(out, sets[i], i + 1 == sets.size());
    }
    out << "  ]\n";
    out << "}\n";
}
