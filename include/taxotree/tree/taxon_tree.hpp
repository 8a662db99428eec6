#ifndef TAXOTREE_TREE_TAXON_TREE_HPP
#define TAXOTREE_TREE_TAXON_TREE_HPP

/**
 * @file taxon_tree.hpp
 * @brief Single-sample taxonomic abundance tree.
 *
 * A TaxonTree mirrors the reference taxonomy below its root, holding the
 * reads one sample assigned to each taxon. It is grown once from the
 * sample's (taxid -> count) and (taxid -> score) maps, optionally shaped and
 * pruned in place, and then read for extraction, lineage tracing and export.
 *
 * Usage:
 * @code
 * auto tree = TaxonTree::grow(taxonomy, abundances, scores);
 * tree.shape();
 * tree.prune(10, Rank::Species, true);
 * Abundances accs;
 * tree.get_taxa({}, TaxaOutputs{nullptr, &accs});
 * @endcode
 */

#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"
#include "taxotree/taxonomy/taxonomy.hpp"
#include "taxotree/tree/node_record.hpp"
#include "taxotree/tree/taxon_node.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace taxotree {

/**
 * @struct TaxaFilter
 * @brief Which nodes an extraction or export walk reports.
 *
 * Depths count from the tree root (depth 0); bounds are inclusive and 0
 * disables them. A node is in branch when include is empty, or when it or
 * one of its ancestors is in include; and it is not itself in exclude.
 * Exclusion is checked at every node, so an excluded node takes its whole
 * subtree out of the branch.
 */
struct TaxaFilter {
    /** @brief Shallowest depth reported (0: no lower bound). */
    int mindepth = 0;

    /** @brief Deepest depth reported and descended into (0: no bound). */
    int maxdepth = 0;

    /** @brief Roots of the subtrees to report (empty: everything). */
    std::set<TaxId> include;

    /** @brief Roots of the subtrees never reported. */
    std::set<TaxId> exclude;

    /** @brief If set, only report taxa at this rank. */
    std::optional<Rank> just_level;

    /**
     * @brief Whether a node is in branch, given its parent's state.
     */
    [[nodiscard]] bool in_branch(TaxId taxid, bool parent_in_branch) const {
        return (parent_in_branch || include.empty() || include.count(taxid) != 0) &&
               exclude.count(taxid) == 0;
    }

    /** @brief Whether a node at this depth may be reported. */
    [[nodiscard]] bool reports_depth(int depth) const noexcept {
        return depth >= mindepth && (maxdepth == 0 || depth <= maxdepth);
    }

    /** @brief Whether the children of a node at this depth are visited. */
    [[nodiscard]] bool descends_below(int depth) const noexcept {
        return maxdepth == 0 || depth < maxdepth;
    }
};

/**
 * @struct TaxaOutputs
 * @brief Caller-supplied collections filled by TaxonTree::get_taxa().
 *
 * Any of them may be null to skip that attribute. Scores are only recorded
 * for nodes that have one.
 */
struct TaxaOutputs {
    Abundances* counts = nullptr;
    Abundances* accs = nullptr;
    Scores* scores = nullptr;
    RankMap* ranks = nullptr;
};

/**
 * @struct LineageResult
 * @brief Lineages found by TaxonTree::get_lineage(), plus what went wrong.
 */
struct LineageResult {
    /** @brief Root-to-taxid path for every taxid successfully traced. */
    std::unordered_map<TaxId, std::vector<TaxId>> lineages;

    /** @brief One message per taxid that could not be traced. */
    std::vector<std::string> warnings;
};

/**
 * @class TaxonTree
 * @brief Abundance tree of one sample.
 *
 * The tree exclusively owns its nodes. Trees of different samples share
 * nothing and can be grown, shaped and pruned on different threads; the
 * taxonomy they read is never modified.
 */
class TaxonTree {
public:
    //==========================================================================
    // Construction
    //==========================================================================

    /**
     * @brief Grow the tree of a sample from the root of a taxonomy.
     * @param taxonomy Reference taxonomy.
     * @param abundances Reads directly assigned to each taxid. When empty,
     *        the root gets a single synthetic read so that an empty sample
     *        still yields a one-node tree.
     * @param scores Score of each taxid (missing taxids get kNoScore).
     * @return The grown tree (acc not populated until shape()).
     *
     * Every taxon reachable from the root is created, with or without reads.
     * A taxid already on the path from the root is skipped, so back-edges in
     * the taxonomy (like the NCBI root being its own child) end that branch.
     */
    [[nodiscard]] static TaxonTree grow(const TaxonomyGraph& taxonomy,
                                        const Abundances& abundances = {},
                                        const Scores& scores = {});

    // Move operations
    TaxonTree(TaxonTree&&) noexcept = default;
    TaxonTree& operator=(TaxonTree&&) noexcept = default;

    // No copying
    TaxonTree(const TaxonTree&) = delete;
    TaxonTree& operator=(const TaxonTree&) = delete;

    //==========================================================================
    // In-place transformations
    //==========================================================================

    /**
     * @brief Accumulate counts bottom-up and drop empty branches.
     *
     * Sets acc of every node to its counts plus its children's acc, removing
     * children whose acc is zero. Nodes without direct counts but with a
     * populated subtree get the acc-weighted average of their children's
     * scores. Shaping an already shaped tree changes nothing.
     */
    void shape();

    /**
     * @brief Prune or collapse low-abundance and low-rank leaves.
     * @param min_taxa Leaves with fewer direct counts are pruned.
     * @param min_rank If set, leaves below this rank, or whose parent is at
     *        or below it, are pruned.
     * @param collapse Fold a pruned leaf's counts (and score) into its
     *        parent; otherwise only subtract them from the parent's acc.
     * @return true if the root still has children.
     *
     * Only leaves are pruned, bottom-up, so a branch whose leaves all go
     * becomes a leaf that is checked in turn. The root is never removed.
     */
    bool prune(Count min_taxa = 1,
               std::optional<Rank> min_rank = std::nullopt,
               bool collapse = true);

    //==========================================================================
    // Queries
    //==========================================================================

    /**
     * @brief Extract attributes of the taxa selected by a filter.
     * @param filter Depth bounds, subtree inclusion/exclusion and rank.
     * @param outputs Collections to fill (null members are skipped).
     */
    void get_taxa(const TaxaFilter& filter, const TaxaOutputs& outputs) const;

    /**
     * @brief Collect the path from the root down to a taxid.
     * @param target Taxid to look for (not the root: see get_lineage()).
     * @param path Output; on success holds root ... target.
     * @return true if the target was found.
     */
    bool trace(TaxId target, std::vector<TaxId>& path) const;

    /**
     * @brief Lineages of several taxids.
     * @param parents Parent map of the taxonomy; taxids missing from it are
     *        reported as unknown.
     * @param taxids Taxids to trace.
     * @return Lineage of every traced taxid and a warning for every other.
     */
    [[nodiscard]] LineageResult get_lineage(const Parents& parents,
                                            const std::vector<TaxId>& taxids) const;

    /**
     * @brief Visit the nodes selected by a filter in pre-order.
     * @param taxonomy Taxonomy used to resolve names.
     * @param visitor Called once per reported node, parents first.
     * @param filter Same selection rules as get_taxa() (just_level ignored).
     */
    void traverse(const TaxonomyGraph& taxonomy,
                  const NodeVisitor& visitor,
                  const TaxaFilter& filter = {}) const;

    //==========================================================================
    // Accessors
    //==========================================================================

    /** @brief Root node. */
    [[nodiscard]] const TaxonNode& root() const noexcept { return *root_; }

    /** @brief Root node (mutable). */
    [[nodiscard]] TaxonNode& root() noexcept { return *root_; }

    /** @brief Total number of nodes. */
    [[nodiscard]] std::size_t count_nodes() const { return root_->count_nodes(); }

    /** @brief Sum of direct counts over all nodes. */
    [[nodiscard]] Count total_counts() const { return root_->total_counts(); }

private:
    explicit TaxonTree(std::unique_ptr<TaxonNode> root);

    std::unique_ptr<TaxonNode> root_;
};

} // namespace taxotree

#endif // TAXOTREE_TREE_TAXON_TREE_HPP
