#ifndef TAXOTREE_TREE_TAXON_NODE_HPP
#define TAXOTREE_TREE_TAXON_NODE_HPP

/**
 * @file taxon_node.hpp
 * @brief Node structure of a single-sample abundance tree.
 *
 * This header defines the TaxonNode class that represents one taxon of a
 * sample's abundance tree. Each node stores the reads directly assigned to
 * its taxid, the accumulated reads of its whole subtree, a confidence score
 * and the children it exclusively owns.
 */

#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"

#include <memory>
#include <vector>

namespace taxotree {

/**
 * @class TaxonNode
 * @brief A taxon in a single-sample abundance tree.
 *
 * Children are kept in taxonomy order and keyed by their taxid: no two
 * siblings share a taxid, and no taxid repeats on a root-to-node path.
 *
 * Lifecycle of the counters:
 * 1. Growth sets counts, rank and score from the sample's input maps
 * 2. TaxonTree::shape() fills acc bottom-up and scores empty internal nodes
 * 3. TaxonTree::prune() may fold leaves' counts into their parents
 */
class TaxonNode {
public:
    //==========================================================================
    // Constructors
    //==========================================================================

    /**
     * @brief Construct a node.
     * @param taxid Taxid of the node.
     * @param counts Reads directly assigned to the taxid.
     * @param rank Taxonomic level of the taxid.
     * @param score Score of the taxid, or kNoScore.
     */
    TaxonNode(TaxId taxid, Count counts, Rank rank, OptionalScore score = kNoScore);

    // Move operations
    TaxonNode(TaxonNode&&) noexcept = default;
    TaxonNode& operator=(TaxonNode&&) noexcept = default;

    // No copying (children are owned through unique_ptr)
    TaxonNode(const TaxonNode&) = delete;
    TaxonNode& operator=(const TaxonNode&) = delete;

    //==========================================================================
    // Data
    //==========================================================================

    /** @brief Taxid of this node (its key in the parent's children). */
    TaxId taxid = 0;

    /** @brief Reads directly assigned to this taxid, not to a descendant. */
    Count counts = 0;

    /** @brief Taxonomic level, looked up once at creation time. */
    Rank rank = Rank::Unclassified;

    /** @brief Confidence score (kNoScore when not available). */
    OptionalScore score;

    /** @brief Accumulated reads (own + descendants); zero until shaped. */
    Count acc = 0;

    /** @brief Child nodes in taxonomy order. */
    std::vector<std::unique_ptr<TaxonNode>> children;

    //==========================================================================
    // Query methods
    //==========================================================================

    /**
     * @brief Check if this node is a leaf (has no children).
     */
    [[nodiscard]] bool is_leaf() const noexcept {
        return children.empty();
    }

    /**
     * @brief Find a direct child by taxid.
     * @return The child, or nullptr if there is none with this taxid.
     */
    [[nodiscard]] const TaxonNode* find_child(TaxId child_taxid) const noexcept;

    /** @copydoc find_child(TaxId) const */
    [[nodiscard]] TaxonNode* find_child(TaxId child_taxid) noexcept;

    //==========================================================================
    // Subtree operations
    //==========================================================================

    /**
     * @brief Count total nodes in the subtree rooted at this node.
     */
    [[nodiscard]] std::size_t count_nodes() const;

    /**
     * @brief Sum of direct counts over the subtree rooted at this node.
     */
    [[nodiscard]] Count total_counts() const;
};

} // namespace taxotree

#endif // TAXOTREE_TREE_TAXON_NODE_HPP
