#include "taxotree/tree/taxon_tree.hpp"

#include "taxotree/tree/score_math.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace taxotree {

namespace {

std::unique_ptr<TaxonNode> grow_node(const TaxonomyGraph& taxonomy,
                                     const Abundances& abundances,
                                     const Scores& scores,
                                     TaxId taxid,
                                     std::vector<TaxId>& path) {
    auto count_it = abundances.find(taxid);
    auto score_it = scores.find(taxid);
    auto node = std::make_unique<TaxonNode>(
        taxid,
        count_it != abundances.end() ? count_it->second : 0,
        taxonomy.rank_of(taxid),
        score_it != scores.end() ? OptionalScore(score_it->second) : kNoScore);

    const auto& children = taxonomy.children_of(taxid);
    std::unordered_set<TaxId> grown;
    grown.reserve(children.size());

    path.push_back(taxid);
    for (TaxId child : children) {
        // Avoid loops for taxids already on the path (like the root)
        if (std::find(path.begin(), path.end(), child) != path.end()) {
            continue;
        }
        // A child listed twice by the taxonomy is grown once
        if (!grown.insert(child).second) {
            continue;
        }
        node->children.push_back(
            grow_node(taxonomy, abundances, scores, child, path));
    }
    path.pop_back();

    return node;
}

void shape_node(TaxonNode& node) {
    node.acc = node.counts;

    for (auto& child : node.children) {
        shape_node(*child);
    }

    // Empty branches cannot be rendered meaningfully
    node.children.erase(
        std::remove_if(node.children.begin(), node.children.end(),
                       [](const std::unique_ptr<TaxonNode>& child) {
                           return child->acc == 0;
                       }),
        node.children.end());

    ScoreAccumulator children_score;
    for (const auto& child : node.children) {
        node.acc += child->acc;
        children_score.add(child->score, child->acc);
    }

    // Nodes with reads of their own keep the score they were grown with.
    // A node with no reads at all ends with no score.
    if (node.counts == 0) {
        node.score = children_score.result();
    }
}

bool is_prune_candidate(const TaxonNode& parent, const TaxonNode& leaf,
                        Count min_taxa, const std::optional<Rank>& min_rank) {
    if (leaf.counts < min_taxa) {
        return true;
    }
    return min_rank &&
           (is_below(leaf.rank, *min_rank) || is_at_or_below(parent.rank, *min_rank));
}

bool prune_node(TaxonNode& node, Count min_taxa,
                const std::optional<Rank>& min_rank, bool collapse) {
    std::vector<std::unique_ptr<TaxonNode>> kept;
    kept.reserve(node.children.size());

    for (auto& child_ptr : node.children) {
        TaxonNode& child = *child_ptr;

        // The pruned subtree keeps having branches: still not a leaf
        if ((!child.is_leaf() && prune_node(child, min_taxa, min_rank, collapse)) ||
            !is_prune_candidate(node, child, min_taxa, min_rank)) {
            kept.push_back(std::move(child_ptr));
            continue;
        }

        if (collapse) {
            const Count collapsed_counts = node.counts + child.counts;
            if (collapsed_counts != 0) {
                ScoreAccumulator collapsed_score;
                collapsed_score.add(node.score, node.counts);
                collapsed_score.add(child.score, child.counts);
                node.score = collapsed_score.result();
                node.counts = collapsed_counts;
            }
        } else {
            node.acc = node.acc > child.counts ? node.acc - child.counts : 0;
        }
    }

    node.children = std::move(kept);
    return !node.is_leaf();
}

void collect_taxa(const TaxonNode& node, const TaxaFilter& filter,
                  const TaxaOutputs& outputs, int depth, bool parent_in_branch) {
    const bool in_branch = filter.in_branch(node.taxid, parent_in_branch);

    if (filter.reports_depth(depth) && in_branch &&
        (!filter.just_level || node.rank == *filter.just_level)) {
        if (outputs.counts) {
            (*outputs.counts)[node.taxid] = node.counts;
        }
        if (outputs.accs) {
            (*outputs.accs)[node.taxid] = node.acc;
        }
        if (outputs.scores && node.score) {
            (*outputs.scores)[node.taxid] = *node.score;
        }
        if (outputs.ranks) {
            (*outputs.ranks)[node.taxid] = node.rank;
        }
    }

    if (!filter.descends_below(depth)) {
        return;
    }
    for (const auto& child : node.children) {
        collect_taxa(*child, filter, outputs, depth + 1, in_branch);
    }
}

bool trace_node(const TaxonNode& node, TaxId target, std::vector<TaxId>& path) {
    if (node.is_leaf()) {
        return false;
    }

    path.push_back(node.taxid);
    if (node.find_child(target) != nullptr) {
        path.push_back(target);
        return true;
    }
    for (const auto& child : node.children) {
        if (trace_node(*child, target, path)) {
            return true;
        }
    }
    path.pop_back();
    return false;
}

void visit_node(const TaxonNode& node, const TaxonomyGraph& taxonomy,
                const NodeVisitor& visitor, const TaxaFilter& filter,
                int depth, bool parent_in_branch) {
    const bool in_branch = filter.in_branch(node.taxid, parent_in_branch);

    if (filter.reports_depth(depth) && in_branch) {
        NodeRecord record;
        record.taxid = node.taxid;
        record.name = taxonomy.name_of(node.taxid);
        record.rank = node.rank;
        record.depth = depth;
        record.counts = {node.counts};
        record.accs = {node.acc};
        record.scores = {node.score};
        record.has_children = !node.is_leaf();
        visitor(record);
    }

    if (!filter.descends_below(depth)) {
        return;
    }
    for (const auto& child : node.children) {
        visit_node(*child, taxonomy, visitor, filter, depth + 1, in_branch);
    }
}

} // anonymous namespace

TaxonTree::TaxonTree(std::unique_ptr<TaxonNode> root) : root_(std::move(root)) {}

TaxonTree TaxonTree::grow(const TaxonomyGraph& taxonomy,
                          const Abundances& abundances,
                          const Scores& scores) {
    const TaxId root_taxid = taxonomy.root();
    std::vector<TaxId> path;

    if (abundances.empty()) {
        const Abundances synthetic{{root_taxid, 1}};
        return TaxonTree(grow_node(taxonomy, synthetic, scores, root_taxid, path));
    }
    return TaxonTree(grow_node(taxonomy, abundances, scores, root_taxid, path));
}

void TaxonTree::shape() {
    shape_node(*root_);
}

bool TaxonTree::prune(Count min_taxa, std::optional<Rank> min_rank, bool collapse) {
    return prune_node(*root_, min_taxa, min_rank, collapse);
}

void TaxonTree::get_taxa(const TaxaFilter& filter, const TaxaOutputs& outputs) const {
    collect_taxa(*root_, filter, outputs, 0, false);
}

bool TaxonTree::trace(TaxId target, std::vector<TaxId>& path) const {
    return trace_node(*root_, target, path);
}

LineageResult TaxonTree::get_lineage(const Parents& parents,
                                     const std::vector<TaxId>& taxids) const {
    LineageResult result;

    for (TaxId taxid : taxids) {
        if (taxid == root_->taxid) {
            result.lineages[taxid] = {taxid};
        } else if (parents.count(taxid) != 0) {
            std::vector<TaxId> path;
            if (trace(taxid, path)) {
                result.lineages[taxid] = std::move(path);
            } else {
                result.warnings.push_back("Failed tracing of taxid " +
                                          std::to_string(taxid) +
                                          ": missing in tree");
            }
        } else {
            result.warnings.push_back("Discarded unknown taxid " +
                                      std::to_string(taxid) +
                                      ": missing in parents");
        }
    }

    return result;
}

void TaxonTree::traverse(const TaxonomyGraph& taxonomy,
                         const NodeVisitor& visitor,
                         const TaxaFilter& filter) const {
    visit_node(*root_, taxonomy, visitor, filter, 0, false);
}

} // namespace taxotree
