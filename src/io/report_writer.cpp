#include "taxotree/io/report_writer.hpp"

#include <fstream>
#include <stdexcept>

namespace taxotree {

namespace {

void write_score(std::ostream& os, const OptionalScore& score) {
    if (score) {
        os << *score;
    }
}

} // anonymous namespace

void write_items_tsv(std::ostream& os,
                     const std::vector<std::string>& samples,
                     const std::vector<TaxonItem>& items) {
    // Header line
    os << "taxid";
    for (const auto& sample : samples) {
        os << '\t' << sample << "_acc"
           << '\t' << sample << "_count"
           << '\t' << sample << "_score";
    }
    os << "\trank\tname\n";

    for (const auto& item : items) {
        os << item.taxid;
        for (std::size_t i = 0; i < samples.size(); ++i) {
            os << '\t' << item.accs.at(i)
               << '\t' << item.counts.at(i) << '\t';
            write_score(os, item.scores.at(i));
        }
        os << '\t' << item.rank << '\t' << item.name << '\n';
    }
}

void write_counts_tsv(std::ostream& os,
                      const std::vector<std::string>& samples,
                      const std::vector<TaxonCountsItem>& items) {
    os << "taxid";
    for (const auto& sample : samples) {
        os << '\t' << sample;
    }
    os << '\n';

    for (const auto& [taxid, counts] : items) {
        os << taxid;
        for (Count count : counts) {
            os << '\t' << count;
        }
        os << '\n';
    }
}

void write_report_file(const std::string& filename,
                       const MultiTaxonTree& tree,
                       const TaxonomyGraph& taxonomy,
                       const TaxaFilter& filter) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    write_items_tsv(file, tree.samples(), tree.to_items(taxonomy, filter));
}

void write_tree_text(std::ostream& os,
                     const TaxonTree& tree,
                     const TaxonomyGraph& taxonomy,
                     Count min_count) {
    tree.traverse(taxonomy, [&](const NodeRecord& record) {
        if (record.counts.front() < min_count) {
            return;
        }
        os << std::string(static_cast<std::size_t>(record.depth) * 2, ' ')
           << record.name << " (" << record.taxid << ") ["
           << record.counts.front() << '/' << record.accs.front() << "]\n";
    });
}

} // namespace taxotree
