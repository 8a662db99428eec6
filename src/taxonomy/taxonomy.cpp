#include "taxotree/taxonomy/taxonomy.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace taxotree {

namespace {

const std::vector<TaxId> kNoChildren;
constexpr std::string_view kUnknownName = "unknown";

} // anonymous namespace

Taxonomy::Taxonomy(TaxId root) : root_(root) {}

void Taxonomy::add_node(TaxId taxid, TaxId parent, Rank rank, std::string name) {
    // Re-adding a taxon moves it under its new parent
    auto old = parents_.find(taxid);
    if (old != parents_.end() && old->second != parent) {
        auto& siblings = children_[old->second];
        siblings.erase(std::remove(siblings.begin(), siblings.end(), taxid),
                       siblings.end());
    }

    if (old == parents_.end() || old->second != parent) {
        children_[parent].push_back(taxid);
    }

    parents_[taxid] = parent;
    ranks_[taxid] = rank;
    if (!name.empty()) {
        names_[taxid] = std::move(name);
    }
}

void Taxonomy::set_name(TaxId taxid, std::string name) {
    names_[taxid] = std::move(name);
}

Rank Taxonomy::rank_of(TaxId taxid) const {
    auto it = ranks_.find(taxid);
    return it != ranks_.end() ? it->second : Rank::Unclassified;
}

std::string_view Taxonomy::name_of(TaxId taxid) const {
    auto it = names_.find(taxid);
    if (it == names_.end()) {
        return kUnknownName;
    }
    return it->second;
}

const std::vector<TaxId>& Taxonomy::children_of(TaxId taxid) const {
    auto it = children_.find(taxid);
    return it != children_.end() ? it->second : kNoChildren;
}

TaxId Taxonomy::parent_of(TaxId taxid) const {
    auto it = parents_.find(taxid);
    if (it == parents_.end()) {
        throw std::out_of_range("Unknown taxid " + std::to_string(taxid));
    }
    return it->second;
}

} // namespace taxotree
