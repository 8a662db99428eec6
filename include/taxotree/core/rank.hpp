#ifndef TAXOTREE_CORE_RANK_HPP
#define TAXOTREE_CORE_RANK_HPP

/**
 * @file rank.hpp
 * @brief Taxonomic levels and their ordering.
 *
 * Ranks are totally ordered from coarse to fine. The underlying values grow
 * towards the coarse end, so the built-in comparison operators read the
 * natural way: Rank::Domain > Rank::Phylum > Rank::Species > Rank::Strain.
 * Rank::Unclassified and Rank::Clade carry no level and take no part in
 * is_below() and is_at_or_below().
 */

#include "taxotree/core/types.hpp"

#include <cstdint>
#include <string_view>
#include <unordered_map>

namespace taxotree {

/**
 * @brief Taxonomic level (NCBI ranks plus an unclassified sentinel).
 */
enum class Rank : std::uint8_t {
    Unclassified = 0,  ///< No rank, or a rank string we do not know
    Clade = 1,         ///< Named group with no place in the rank order
    Isolate = 2,
    Strain = 3,
    Serotype = 4,
    Serogroup = 5,
    FormaSpecialis = 6,
    Forma = 7,
    Varietas = 8,
    Subspecies = 9,
    Species = 10,
    SpeciesSubgroup = 11,
    SpeciesGroup = 12,
    Series = 13,
    Subsection = 14,
    Section = 15,
    Subgenus = 16,
    Genus = 17,
    Subtribe = 18,
    Tribe = 19,
    Subfamily = 20,
    Family = 21,
    Superfamily = 22,
    Parvorder = 23,
    Infraorder = 24,
    Suborder = 25,
    Order = 26,
    Superorder = 27,
    Subcohort = 28,
    Cohort = 29,
    Infraclass = 30,
    Subclass = 31,
    Class = 32,
    Superclass = 33,
    Subphylum = 34,
    Phylum = 35,
    Superphylum = 36,
    Subkingdom = 37,
    Kingdom = 38,
    Domain = 39,       ///< Also "superkingdom" in older NCBI dumps
    Root = 40
};

/** @brief Rank of each taxid, as extracted from a tree. */
using RankMap = std::unordered_map<TaxId, Rank>;

/**
 * @brief Lowercase NCBI name of a rank ("species", "no rank", ...).
 */
[[nodiscard]] std::string_view to_string(Rank rank) noexcept;

/**
 * @brief Convert an NCBI rank string to a Rank.
 * @param text Rank name, case-insensitive ("superkingdom" maps to Domain).
 * @return The rank, or Rank::Unclassified for "no rank" and unknown names.
 */
[[nodiscard]] Rank parse_rank(std::string_view text);

/**
 * @brief Check whether a rank has a place in the rank order.
 */
[[nodiscard]] constexpr bool has_level(Rank rank) noexcept {
    return rank != Rank::Unclassified && rank != Rank::Clade;
}

/**
 * @brief Check whether a rank is strictly finer than another.
 *
 * Rank::Unclassified and Rank::Clade carry no level information, so they
 * are never below anything and nothing is below them.
 */
[[nodiscard]] constexpr bool is_below(Rank rank, Rank other) noexcept {
    return has_level(rank) && has_level(other) && rank < other;
}

/**
 * @brief Check whether a rank is the same as or finer than another.
 *
 * Same treatment of unleveled ranks as is_below().
 */
[[nodiscard]] constexpr bool is_at_or_below(Rank rank, Rank other) noexcept {
    return has_level(rank) && has_level(other) && rank <= other;
}

} // namespace taxotree

#endif // TAXOTREE_CORE_RANK_HPP
