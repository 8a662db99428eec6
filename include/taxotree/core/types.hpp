#ifndef TAXOTREE_CORE_TYPES_HPP
#define TAXOTREE_CORE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core type definitions for taxotree.
 *
 * This header defines the fundamental types shared by the taxonomy graph,
 * the abundance trees and the readers/writers: taxonomic identifiers,
 * read counts, confidence scores and the input maps built from them.
 */

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace taxotree {

/**
 * @brief Taxonomic identifier (NCBI taxid).
 */
using TaxId = std::uint32_t;

/**
 * @brief Number of reads assigned to a taxon.
 */
using Count = std::uint64_t;

/**
 * @brief Confidence/quality metric of a taxon.
 */
using Score = double;

/**
 * @brief A score that may be absent.
 *
 * The empty state is the no-score sentinel: no confidence score was
 * supplied or computed for the node.
 */
using OptionalScore = std::optional<Score>;

/**
 * @brief The no-score sentinel.
 */
inline constexpr std::nullopt_t kNoScore = std::nullopt;

/**
 * @brief Universal ancestor of the NCBI taxonomy.
 */
inline constexpr TaxId kRootTaxId = 1;

/** @brief Reads directly assigned to each taxid of one sample. */
using Abundances = std::unordered_map<TaxId, Count>;

/** @brief Score of each taxid of one sample. */
using Scores = std::unordered_map<TaxId, Score>;

/** @brief Parent of each taxid in the taxonomy. */
using Parents = std::unordered_map<TaxId, TaxId>;

} // namespace taxotree

#endif // TAXOTREE_CORE_TYPES_HPP
