#include "taxotree/tree/multi_taxon_tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace taxotree {

namespace {

// Per-sample inputs of a growth, already checked against the sample count.
struct GrowInputs {
    const TaxonomyGraph& taxonomy;
    std::size_t num_samples;
    const std::vector<Abundances>& abundances;
    const std::vector<Abundances>& accs;
    const std::vector<Scores>& scores;
};

template <typename Map>
void check_sample_count(const std::vector<Map>& per_sample, std::size_t num_samples,
                        const char* what) {
    if (per_sample.size() != num_samples) {
        throw std::invalid_argument(
            std::string(what) + " has " + std::to_string(per_sample.size()) +
            " samples, expected " + std::to_string(num_samples));
    }
}

Count lookup(const Abundances& map, TaxId taxid) {
    auto it = map.find(taxid);
    return it != map.end() ? it->second : 0;
}

std::unique_ptr<MultiTaxonNode> grow_node(const GrowInputs& in, TaxId taxid,
                                          std::vector<TaxId>& path) {
    std::vector<Count> multi_acc(in.num_samples);
    for (std::size_t i = 0; i < in.num_samples; ++i) {
        multi_acc[i] = lookup(in.accs[i], taxid);
    }

    // Only populated branches make it into the union tree
    if (std::all_of(multi_acc.begin(), multi_acc.end(),
                    [](Count acc) { return acc == 0; })) {
        return nullptr;
    }

    std::vector<Count> multi_count(in.num_samples);
    std::vector<OptionalScore> multi_score(in.num_samples, kNoScore);
    for (std::size_t i = 0; i < in.num_samples; ++i) {
        multi_count[i] = lookup(in.abundances[i], taxid);
        if (!in.scores.empty()) {
            auto it = in.scores[i].find(taxid);
            if (it != in.scores[i].end()) {
                multi_score[i] = it->second;
            }
        }
    }

    auto node = std::make_unique<MultiTaxonNode>(
        taxid, in.taxonomy.rank_of(taxid), std::move(multi_count),
        std::move(multi_acc), std::move(multi_score));

    const auto& children = in.taxonomy.children_of(taxid);
    std::unordered_set<TaxId> grown;
    grown.reserve(children.size());

    path.push_back(taxid);
    for (TaxId child : children) {
        if (std::find(path.begin(), path.end(), child) != path.end() ||
            !grown.insert(child).second) {
            continue;
        }
        auto child_node = grow_node(in, child, path);
        if (child_node) {
            node->children.push_back(std::move(child_node));
        }
    }
    path.pop_back();

    return node;
}

void visit_node(const MultiTaxonNode& node, const TaxonomyGraph& taxonomy,
                const NodeVisitor& visitor, const TaxaFilter& filter,
                int depth, bool parent_in_branch) {
    const bool in_branch = filter.in_branch(node.taxid, parent_in_branch);

    if (filter.reports_depth(depth) && in_branch) {
        NodeRecord record;
        record.taxid = node.taxid;
        record.name = taxonomy.name_of(node.taxid);
        record.rank = node.rank;
        record.depth = depth;
        record.counts = node.counts;
        record.accs = node.accs;
        record.scores = node.scores;
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

void collect_counts(const MultiTaxonNode& node,
                    const std::vector<std::size_t>& sample_indexes,
                    std::vector<TaxonCountsItem>& items) {
    std::vector<Count> row;
    row.reserve(sample_indexes.size());
    for (std::size_t i : sample_indexes) {
        row.push_back(node.counts[i]);
    }
    items.emplace_back(node.taxid, std::move(row));

    for (const auto& child : node.children) {
        collect_counts(*child, sample_indexes, items);
    }
}

} // anonymous namespace

MultiTaxonNode::MultiTaxonNode(TaxId node_taxid, Rank node_rank,
                               std::vector<Count> node_counts,
                               std::vector<Count> node_accs,
                               std::vector<OptionalScore> node_scores)
    : taxid(node_taxid),
      rank(node_rank),
      counts(std::move(node_counts)),
      accs(std::move(node_accs)),
      scores(std::move(node_scores)) {}

const MultiTaxonNode* MultiTaxonNode::find_child(TaxId child_taxid) const noexcept {
    for (const auto& child : children) {
        if (child->taxid == child_taxid) {
            return child.get();
        }
    }
    return nullptr;
}

std::size_t MultiTaxonNode::count_nodes() const {
    std::size_t count = 1;  // This node
    for (const auto& child : children) {
        count += child->count_nodes();
    }
    return count;
}

MultiTaxonTree::MultiTaxonTree(std::vector<std::string> samples,
                               std::unique_ptr<MultiTaxonNode> root)
    : samples_(std::move(samples)), root_(std::move(root)) {}

MultiTaxonTree MultiTaxonTree::grow(const TaxonomyGraph& taxonomy,
                                    std::vector<std::string> samples,
                                    const std::vector<Abundances>& abundances,
                                    const std::vector<Abundances>& accs,
                                    const std::vector<Scores>& scores) {
    const std::size_t num_samples = samples.size();
    const TaxId root_taxid = taxonomy.root();

    // Missing inputs: one synthetic read at the root of every sample
    const std::vector<Abundances> synthetic(num_samples, Abundances{{root_taxid, 1}});

    if (!abundances.empty()) {
        check_sample_count(abundances, num_samples, "abundances");
    }
    if (!accs.empty()) {
        check_sample_count(accs, num_samples, "accs");
    }
    if (!scores.empty()) {
        check_sample_count(scores, num_samples, "scores");
    }

    GrowInputs inputs{taxonomy, num_samples,
                      abundances.empty() ? synthetic : abundances,
                      accs.empty() ? synthetic : accs,
                      scores};

    std::vector<TaxId> path;
    auto root = grow_node(inputs, root_taxid, path);
    return MultiTaxonTree(std::move(samples), std::move(root));
}

MultiTaxonTree MultiTaxonTree::merge(const TaxonomyGraph& taxonomy,
                                     std::vector<std::string> samples,
                                     const std::vector<const TaxonTree*>& trees) {
    check_sample_count(trees, samples.size(), "trees");

    std::vector<Abundances> abundances(trees.size());
    std::vector<Abundances> accs(trees.size());
    std::vector<Scores> scores(trees.size());

    for (std::size_t i = 0; i < trees.size(); ++i) {
        if (trees[i] == nullptr) {
            throw std::invalid_argument("tree of sample " + samples[i] + " is null");
        }
        TaxaOutputs outputs;
        outputs.counts = &abundances[i];
        outputs.accs = &accs[i];
        outputs.scores = &scores[i];
        trees[i]->get_taxa(TaxaFilter{}, outputs);
    }

    return grow(taxonomy, std::move(samples), abundances, accs, scores);
}

void MultiTaxonTree::traverse(const TaxonomyGraph& taxonomy,
                              const NodeVisitor& visitor,
                              const TaxaFilter& filter) const {
    if (root_) {
        visit_node(*root_, taxonomy, visitor, filter, 0, false);
    }
}

std::vector<TaxonItem> MultiTaxonTree::to_items(const TaxonomyGraph& taxonomy,
                                                const TaxaFilter& filter) const {
    std::vector<TaxonItem> items;

    traverse(taxonomy, [&items](const NodeRecord& record) {
        TaxonItem item;
        item.taxid = record.taxid;
        item.accs = record.accs;
        item.counts = record.counts;
        item.scores = record.scores;
        item.rank = std::string(to_string(record.rank));
        item.name = std::string(record.name);
        items.push_back(std::move(item));
    }, filter);

    return items;
}

std::vector<TaxonCountsItem> MultiTaxonTree::to_items(
    const std::vector<std::size_t>& sample_indexes) const {
    for (std::size_t i : sample_indexes) {
        if (i >= samples_.size()) {
            throw std::out_of_range("Sample index " + std::to_string(i) +
                                    " out of range");
        }
    }

    std::vector<TaxonCountsItem> items;
    if (root_) {
        collect_counts(*root_, sample_indexes, items);
    }
    return items;
}

const MultiTaxonNode& MultiTaxonTree::root() const {
    if (!root_) {
        throw std::logic_error("Multi-sample tree is empty");
    }
    return *root_;
}

} // namespace taxotree
