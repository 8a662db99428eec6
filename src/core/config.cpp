#include "taxotree/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

namespace taxotree {

namespace {

std::uint64_t parse_unsigned(std::string_view text, std::uint64_t max,
                             const std::string& what) {
    std::uint64_t value = 0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec == std::errc::invalid_argument || ptr != last) {
        throw ConfigError("invalid " + what + " \"" + std::string(text) + "\"");
    }
    if (ec == std::errc::result_out_of_range || value > max) {
        throw ConfigError(what + " out of range: " + std::string(text));
    }
    return value;
}

} // anonymous namespace

TaxId parse_taxid(std::string_view text) {
    return static_cast<TaxId>(
        parse_unsigned(text, std::numeric_limits<TaxId>::max(), "taxid"));
}

Count parse_count(std::string_view text) {
    return static_cast<Count>(
        parse_unsigned(text, std::numeric_limits<Count>::max(), "count"));
}

Scoring parse_scoring(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (Scoring scoring : {Scoring::Shel, Scoring::Length, Scoring::LogLength,
                            Scoring::Norma, Scoring::Lmat}) {
        if (to_string(scoring) == upper) {
            return scoring;
        }
    }
    throw ConfigError("unknown scoring scheme \"" + std::string(text) + "\"");
}

std::string_view score_display_name(Scoring scoring) {
    switch (scoring) {
        case Scoring::Shel: return "Confidence (avg)";
        case Scoring::Length: return "Read length (avg)";
        case Scoring::LogLength: return "Read length (avg, log10)";
        case Scoring::Norma: return "Confidence/Length (%)";
        case Scoring::Lmat: return "LMAT score (avg)";
    }
    throw ConfigError("unknown scoring scheme " +
                      std::to_string(static_cast<int>(scoring)));
}

void ReportConfig::validate() const {
    // Taxonomy is required
    if (taxdump_dir.empty()) {
        throw std::invalid_argument("taxdump_dir is required");
    }

    // At least one sample
    if (sample_files.empty()) {
        throw std::invalid_argument("at least one sample file is required");
    }

    if (min_taxa == 0) {
        throw std::invalid_argument("min_taxa must be positive, got 0");
    }

    if (threads <= 0) {
        throw std::invalid_argument(
            "threads must be positive, got " + std::to_string(threads));
    }

    // A taxon both included and excluded can never be reported
    for (TaxId taxid : include) {
        if (exclude.count(taxid) != 0) {
            throw std::invalid_argument(
                "taxid " + std::to_string(taxid) +
                " is both included and excluded");
        }
    }
}

} // namespace taxotree
