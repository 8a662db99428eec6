#ifndef TAXOTREE_CORE_CONFIG_HPP
#define TAXOTREE_CORE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Report configuration for taxotree.
 *
 * This header defines the scoring schemes used to label the score attribute
 * of a report, and the ReportConfig struct that holds every parameter of a
 * taxotree run: inputs, tree pruning thresholds, extraction filters and
 * display metadata.
 */

#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace taxotree {

/**
 * @class ConfigError
 * @brief Exception thrown for fatal configuration errors.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief Scoring scheme of the per-read scores fed to the trees.
 *
 * The scheme does not change how scores are aggregated, only how they are
 * labelled and ranged for display.
 */
enum class Scoring : std::uint8_t {
    Shel = 0,       ///< Single hit equivalent length (classifier confidence)
    Length = 1,     ///< Read length
    LogLength = 2,  ///< log10 of read length
    Norma = 3,      ///< Confidence normalized by read length (%)
    Lmat = 4        ///< LMAT score
};

/**
 * @brief Short identifier of a scoring scheme ("SHEL", "LENGTH", ...).
 */
[[nodiscard]] constexpr std::string_view to_string(Scoring scoring) {
    switch (scoring) {
        case Scoring::Shel: return "SHEL";
        case Scoring::Length: return "LENGTH";
        case Scoring::LogLength: return "LOGLENGTH";
        case Scoring::Norma: return "NORMA";
        case Scoring::Lmat: return "LMAT";
    }
    return "Unknown";
}

/**
 * @brief Parse a scoring scheme identifier (case-insensitive).
 * @throws ConfigError if the identifier is unknown.
 */
[[nodiscard]] Scoring parse_scoring(std::string_view text);

/**
 * @brief Human readable label of the score attribute for a scheme.
 */
[[nodiscard]] std::string_view score_display_name(Scoring scoring);

/**
 * @brief Parse a taxid given on the command line.
 *
 * The whole text must be decimal digits and the value must fit a TaxId.
 * @throws ConfigError on empty, signed, partial or out of range input.
 */
[[nodiscard]] TaxId parse_taxid(std::string_view text);

/**
 * @brief Parse a read count given on the command line.
 * @throws ConfigError on empty, signed, partial or out of range input.
 */
[[nodiscard]] Count parse_count(std::string_view text);

/**
 * @struct ReportConfig
 * @brief Complete configuration for a taxotree run.
 */
struct ReportConfig {
    //==========================================================================
    // Input files
    //==========================================================================

    /** @brief Directory holding nodes.dmp and names.dmp. Required. */
    std::string taxdump_dir;

    /** @brief Per-sample abundance tables, one sample each. Required. */
    std::vector<std::string> sample_files;

    //==========================================================================
    // Output
    //==========================================================================

    /** @brief Report file; standard output when unset. */
    std::optional<std::string> output_file;

    /** @brief Also print every sample tree as indented text. */
    bool print_trees = false;

    //==========================================================================
    // Pruning
    //==========================================================================

    /**
     * @brief Minimum reads directly assigned to a leaf to keep it.
     *
     * Leaves below this count are collapsed into (or removed from) their
     * parent. Default: 1 (keep every populated leaf).
     */
    Count min_taxa = 1;

    /** @brief Finest rank kept in the trees (unset: no rank floor). */
    std::optional<Rank> min_rank;

    /** @brief Fold pruned leaves' counts into their parents. Default: true. */
    bool collapse = true;

    //==========================================================================
    // Extraction filters
    //==========================================================================

    /** @brief Roots of the subtrees to report (empty: everything). */
    std::set<TaxId> include;

    /** @brief Roots of the subtrees never reported. */
    std::set<TaxId> exclude;

    //==========================================================================
    // Display metadata
    //==========================================================================

    /** @brief Scoring scheme of the input scores. Default: SHEL. */
    Scoring scoring = Scoring::Shel;

    //==========================================================================
    // Execution
    //==========================================================================

    /** @brief Samples processed concurrently. Default: 1. */
    int threads = 1;

    //==========================================================================
    // Validation
    //==========================================================================

    /**
     * @brief Validate configuration parameters.
     * @throws std::invalid_argument if any parameter is invalid.
     */
    void validate() const;
};

} // namespace taxotree

#endif // TAXOTREE_CORE_CONFIG_HPP
