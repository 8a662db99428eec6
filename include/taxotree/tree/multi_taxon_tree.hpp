#ifndef TAXOTREE_TREE_MULTI_TAXON_TREE_HPP
#define TAXOTREE_TREE_MULTI_TAXON_TREE_HPP

/**
 * @file multi_taxon_tree.hpp
 * @brief Cross-sample taxonomic abundance tree.
 *
 * A MultiTaxonTree has the same shape as a TaxonTree, but each node holds
 * one counts/acc/score slot per sample, in a sample order fixed for the whole
 * tree. It is grown from the already shaped (and pruned) results of several
 * single-sample trees: a taxon is present iff at least one sample has reads
 * accumulated in it, so the tree is the union of the samples' trees.
 */

#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"
#include "taxotree/taxonomy/taxonomy.hpp"
#include "taxotree/tree/node_record.hpp"
#include "taxotree/tree/taxon_tree.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace taxotree {

/**
 * @class MultiTaxonNode
 * @brief A taxon of a cross-sample tree.
 */
class MultiTaxonNode {
public:
    MultiTaxonNode(TaxId taxid, Rank rank,
                   std::vector<Count> counts,
                   std::vector<Count> accs,
                   std::vector<OptionalScore> scores);

    // Move operations
    MultiTaxonNode(MultiTaxonNode&&) noexcept = default;
    MultiTaxonNode& operator=(MultiTaxonNode&&) noexcept = default;

    // No copying (children are owned through unique_ptr)
    MultiTaxonNode(const MultiTaxonNode&) = delete;
    MultiTaxonNode& operator=(const MultiTaxonNode&) = delete;

    /** @brief Taxid of this node. */
    TaxId taxid = 0;

    /** @brief Taxonomic level. */
    Rank rank = Rank::Unclassified;

    /** @brief Reads directly assigned, one slot per sample. */
    std::vector<Count> counts;

    /** @brief Accumulated reads, one slot per sample. */
    std::vector<Count> accs;

    /** @brief Score, one slot per sample. */
    std::vector<OptionalScore> scores;

    /** @brief Child nodes in taxonomy order. */
    std::vector<std::unique_ptr<MultiTaxonNode>> children;

    [[nodiscard]] bool is_leaf() const noexcept { return children.empty(); }

    /**
     * @brief Find a direct child by taxid.
     * @return The child, or nullptr if there is none with this taxid.
     */
    [[nodiscard]] const MultiTaxonNode* find_child(TaxId child_taxid) const noexcept;

    /**
     * @brief Count total nodes in the subtree rooted at this node.
     */
    [[nodiscard]] std::size_t count_nodes() const;
};

/**
 * @struct TaxonItem
 * @brief One row of the full tabular export.
 */
struct TaxonItem {
    TaxId taxid = 0;
    std::vector<Count> accs;
    std::vector<Count> counts;
    std::vector<OptionalScore> scores;
    std::string rank;
    std::string name;
};

/**
 * @brief One row of the restricted tabular export: taxid and selected counts.
 */
using TaxonCountsItem = std::pair<TaxId, std::vector<Count>>;

/**
 * @class MultiTaxonTree
 * @brief Abundance tree of several samples.
 */
class MultiTaxonTree {
public:
    /**
     * @brief Grow the union tree of several samples.
     * @param taxonomy Reference taxonomy.
     * @param samples Sample names; their order fixes the slot order.
     * @param abundances Direct counts, one map per sample (empty: the root
     *        gets one synthetic read in every sample).
     * @param accs Accumulated counts, one map per sample (empty: same
     *        default as abundances).
     * @param scores Scores, one map per sample (empty: no scores).
     * @throws std::invalid_argument if a non-empty input does not have one
     *         map per sample.
     *
     * Taxids already on the path from the root are skipped, as in
     * TaxonTree::grow(). A node, and its subtree, is only created if some
     * sample has a nonzero accumulated count for its taxid.
     */
    [[nodiscard]] static MultiTaxonTree grow(const TaxonomyGraph& taxonomy,
                                             std::vector<std::string> samples,
                                             const std::vector<Abundances>& abundances = {},
                                             const std::vector<Abundances>& accs = {},
                                             const std::vector<Scores>& scores = {});

    /**
     * @brief Merge shaped single-sample trees into a union tree.
     * @param taxonomy Reference taxonomy the trees were grown from.
     * @param samples Sample names, one per tree, in the same order.
     * @param trees Shaped trees (not owned).
     * @throws std::invalid_argument if samples and trees differ in size.
     */
    [[nodiscard]] static MultiTaxonTree merge(const TaxonomyGraph& taxonomy,
                                              std::vector<std::string> samples,
                                              const std::vector<const TaxonTree*>& trees);

    // Move operations
    MultiTaxonTree(MultiTaxonTree&&) noexcept = default;
    MultiTaxonTree& operator=(MultiTaxonTree&&) noexcept = default;

    // No copying
    MultiTaxonTree(const MultiTaxonTree&) = delete;
    MultiTaxonTree& operator=(const MultiTaxonTree&) = delete;

    /**
     * @brief Visit the nodes selected by a filter in pre-order.
     * @param taxonomy Taxonomy used to resolve names.
     * @param visitor Called once per reported node, parents first.
     * @param filter Same rules as TaxonTree::traverse() (just_level ignored).
     */
    void traverse(const TaxonomyGraph& taxonomy, const NodeVisitor& visitor,
                  const TaxaFilter& filter = {}) const;

    /**
     * @brief Full tabular export: per-sample (acc, count, score), rank, name.
     * @param taxonomy Taxonomy used to resolve names.
     * @param filter Nodes to export (default: all).
     * @return One row per exported node, in pre-order.
     */
    [[nodiscard]] std::vector<TaxonItem> to_items(const TaxonomyGraph& taxonomy,
                                                  const TaxaFilter& filter = {}) const;

    /**
     * @brief Restricted tabular export: counts of some samples only.
     * @param sample_indexes Indexes into samples() of the columns wanted.
     * @return One row per node, in pre-order.
     * @throws std::out_of_range if an index is not a sample.
     */
    [[nodiscard]] std::vector<TaxonCountsItem> to_items(
        const std::vector<std::size_t>& sample_indexes) const;

    /** @brief Sample names in slot order. */
    [[nodiscard]] const std::vector<std::string>& samples() const noexcept {
        return samples_;
    }

    /** @brief Whether no sample had reads at the root. */
    [[nodiscard]] bool empty() const noexcept { return !root_; }

    /**
     * @brief Root node.
     * @throws std::logic_error if the tree is empty.
     */
    [[nodiscard]] const MultiTaxonNode& root() const;

    /** @brief Total number of nodes (0 for an empty tree). */
    [[nodiscard]] std::size_t count_nodes() const {
        return root_ ? root_->count_nodes() : 0;
    }

private:
    MultiTaxonTree(std::vector<std::string> samples,
                   std::unique_ptr<MultiTaxonNode> root);

    std::vector<std::string> samples_;
    std::unique_ptr<MultiTaxonNode> root_;
};

} // namespace taxotree

#endif // TAXOTREE_TREE_MULTI_TAXON_TREE_HPP
