#include "taxotree/tree/taxon_node.hpp"

#include <utility>

namespace taxotree {

TaxonNode::TaxonNode(TaxId node_taxid, Count node_counts, Rank node_rank,
                     OptionalScore node_score)
    : taxid(node_taxid),
      counts(node_counts),
      rank(node_rank),
      score(std::move(node_score)) {}

const TaxonNode* TaxonNode::find_child(TaxId child_taxid) const noexcept {
    for (const auto& child : children) {
        if (child->taxid == child_taxid) {
            return child.get();
        }
    }
    return nullptr;
}

TaxonNode* TaxonNode::find_child(TaxId child_taxid) noexcept {
    for (auto& child : children) {
        if (child->taxid == child_taxid) {
            return child.get();
        }
    }
    return nullptr;
}

std::size_t TaxonNode::count_nodes() const {
    std::size_t count = 1;  // This node

    for (const auto& child : children) {
        count += child->count_nodes();
    }

    return count;
}

Count TaxonNode::total_counts() const {
    Count total = counts;

    for (const auto& child : children) {
        total += child->total_counts();
    }

    return total;
}

} // namespace taxotree
