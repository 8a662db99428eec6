#ifndef TAXOTREE_IO_REPORT_WRITER_HPP
#define TAXOTREE_IO_REPORT_WRITER_HPP

/**
 * @file report_writer.hpp
 * @brief Tabular and text output of abundance trees.
 *
 * The TSV writers turn MultiTaxonTree::to_items() rows into tables with a
 * header line. Scores that are not available are written as empty cells.
 */

#include "taxotree/taxonomy/taxonomy.hpp"
#include "taxotree/tree/multi_taxon_tree.hpp"
#include "taxotree/tree/taxon_tree.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace taxotree {

/**
 * @brief Write the full report: per-sample acc, count and score, rank, name.
 * @param os Output stream.
 * @param samples Sample names, in the order of the items' slots.
 * @param items Rows from MultiTaxonTree::to_items(taxonomy).
 */
void write_items_tsv(std::ostream& os,
                     const std::vector<std::string>& samples,
                     const std::vector<TaxonItem>& items);

/**
 * @brief Write the restricted report: counts of some samples only.
 * @param os Output stream.
 * @param samples Names of the selected samples, in column order.
 * @param items Rows from MultiTaxonTree::to_items(sample_indexes).
 */
void write_counts_tsv(std::ostream& os,
                      const std::vector<std::string>& samples,
                      const std::vector<TaxonCountsItem>& items);

/**
 * @brief Write the full report of a tree to a file.
 * @param filename Output file path.
 * @param tree Tree to report.
 * @param taxonomy Taxonomy used to resolve names.
 * @param filter Nodes to report (default: all).
 * @throws std::runtime_error if the file cannot be opened.
 */
void write_report_file(const std::string& filename,
                       const MultiTaxonTree& tree,
                       const TaxonomyGraph& taxonomy,
                       const TaxaFilter& filter = {});

/**
 * @brief Print a single-sample tree as indented text.
 * @param os Output stream.
 * @param tree Tree to print.
 * @param taxonomy Taxonomy used to resolve names.
 * @param min_count Nodes with fewer direct counts are not printed (their
 *        descendants still are).
 *
 * One line per node: indentation by depth, name, taxid, then direct and
 * accumulated counts, e.g. "  Bacteria (2) [5/120]".
 */
void write_tree_text(std::ostream& os,
                     const TaxonTree& tree,
                     const TaxonomyGraph& taxonomy,
                     Count min_count = 0);

} // namespace taxotree

#endif // TAXOTREE_IO_REPORT_WRITER_HPP
