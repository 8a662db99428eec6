#ifndef TAXOTREE_TREE_NODE_RECORD_HPP
#define TAXOTREE_TREE_NODE_RECORD_HPP

/**
 * @file node_record.hpp
 * @brief What the export traversal hands to exporters for each node.
 *
 * Both tree types are walked in pre-order and every visited node is
 * described by a NodeRecord, with one slot per sample in the per-sample
 * vectors (a single slot for a single-sample tree). The sample order is
 * fixed for the whole traversal.
 */

#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"

#include <functional>
#include <string_view>
#include <vector>

namespace taxotree {

/**
 * @struct NodeRecord
 * @brief Attributes of one tree node, as seen by an exporter.
 */
struct NodeRecord {
    /** @brief Taxid of the node. */
    TaxId taxid = 0;

    /** @brief Display name resolved through the taxonomy. */
    std::string_view name;

    /** @brief Taxonomic level. */
    Rank rank = Rank::Unclassified;

    /** @brief Distance from the tree root (root = 0). */
    int depth = 0;

    /** @brief Reads directly assigned, per sample. */
    std::vector<Count> counts;

    /** @brief Accumulated reads, per sample. */
    std::vector<Count> accs;

    /** @brief Score, per sample. */
    std::vector<OptionalScore> scores;

    /** @brief Whether the node has children in the tree. */
    bool has_children = false;
};

/**
 * @brief Callback invoked once per visited node, parents before children.
 */
using NodeVisitor = std::function<void(const NodeRecord&)>;

} // namespace taxotree

#endif // TAXOTREE_TREE_NODE_RECORD_HPP
