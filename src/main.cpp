/**
 * taxotree - Taxonomic abundance trees
 *
 * Builds one pruned, scored taxonomic tree per sample from already assigned
 * (taxid, count, score) observations, merges them into a cross-sample tree
 * and writes a tabular report.
 */

#include "taxotree/core/config.hpp"
#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"
#include "taxotree/io/report_writer.hpp"
#include "taxotree/io/sample_reader.hpp"
#include "taxotree/io/taxdump_reader.hpp"
#include "taxotree/taxonomy/taxonomy.hpp"
#include "taxotree/tree/multi_taxon_tree.hpp"
#include "taxotree/tree/taxon_tree.hpp"

#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "taxotree - Taxonomic abundance trees\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Required:\n";
    std::cerr << "  -n <dir>     Directory with NCBI nodes.dmp and names.dmp\n";
    std::cerr << "  -s <file>    Sample table: taxid<TAB>count[<TAB>score] (repeatable)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  -o <file>    Report file (default: standard output)\n";
    std::cerr << "  --tree       Also print every sample tree as indented text\n";
    std::cerr << "  -l <taxid>   Print the lineage of a taxid in every sample (repeatable)\n\n";
    std::cerr << "Pruning options:\n";
    std::cerr << "  -m <int>     Minimum reads of a leaf to keep it (default: 1)\n";
    std::cerr << "  -r <rank>    Finest rank kept, e.g. species, genus (default: none)\n";
    std::cerr << "  --no-collapse  Drop pruned leaves instead of folding them into the parent\n\n";
    std::cerr << "Filter options:\n";
    std::cerr << "  -i <taxid>   Report only this taxon and below (repeatable)\n";
    std::cerr << "  -x <taxid>   Never report this taxon and below (repeatable)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  -c <scheme>  Scoring scheme: SHEL, LENGTH, LOGLENGTH, NORMA, LMAT (default: SHEL)\n";
    std::cerr << "  -j <int>     Samples processed in parallel (default: 1)\n";
    std::cerr << "  -h           Show this help message\n";
}

void print_version() {
    std::cout << "taxotree 1.0.0\n";
}

taxotree::TaxonTree build_sample_tree(const taxotree::Taxonomy& taxonomy,
                                      const taxotree::SampleData& sample,
                                      const taxotree::ReportConfig& config) {
    auto tree = taxotree::TaxonTree::grow(taxonomy, sample.abundances, sample.scores);
    tree.shape();
    tree.prune(config.min_taxa, config.min_rank, config.collapse);
    return tree;
}

void print_lineages(const taxotree::Taxonomy& taxonomy,
                    const std::vector<taxotree::SampleData>& samples,
                    const std::vector<taxotree::TaxonTree>& trees,
                    const std::vector<taxotree::TaxId>& taxids) {
    for (std::size_t i = 0; i < trees.size(); ++i) {
        auto result = trees[i].get_lineage(taxonomy.parents(), taxids);
        for (const auto& warning : result.warnings) {
            std::cerr << "Warning (" << samples[i].name << "): " << warning << "\n";
        }
        for (taxotree::TaxId taxid : taxids) {
            auto it = result.lineages.find(taxid);
            if (it == result.lineages.end()) {
                continue;
            }
            std::cout << samples[i].name << '\t' << taxid << '\t';
            for (std::size_t k = 0; k < it->second.size(); ++k) {
                std::cout << (k ? ";" : "") << taxonomy.name_of(it->second[k]);
            }
            std::cout << '\n';
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    taxotree::ReportConfig config;
    std::vector<taxotree::TaxId> lineage_taxids;

    // Parse command-line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            if (arg == "--version") {
                print_version();
                return 0;
            }
            if (arg == "--tree") {
                config.print_trees = true;
                continue;
            }
            if (arg == "--no-collapse") {
                config.collapse = false;
                continue;
            }

            // Options that take a value
            if (i + 1 >= argc && arg[0] == '-' && arg.length() == 2) {
                std::cerr << "Error: Option " << arg << " requires an argument\n";
                return 1;
            }

            if (arg == "-n") {
                config.taxdump_dir = argv[++i];
            } else if (arg == "-s") {
                config.sample_files.emplace_back(argv[++i]);
            } else if (arg == "-o") {
                config.output_file = argv[++i];
            } else if (arg == "-l") {
                lineage_taxids.push_back(taxotree::parse_taxid(argv[++i]));
            } else if (arg == "-m") {
                config.min_taxa = taxotree::parse_count(argv[++i]);
            } else if (arg == "-r") {
                std::string rank_name = argv[++i];
                auto rank = taxotree::parse_rank(rank_name);
                if (rank == taxotree::Rank::Unclassified) {
                    std::cerr << "Error: Unknown rank: " << rank_name << "\n";
                    return 1;
                }
                config.min_rank = rank;
            } else if (arg == "-i") {
                config.include.insert(taxotree::parse_taxid(argv[++i]));
            } else if (arg == "-x") {
                config.exclude.insert(taxotree::parse_taxid(argv[++i]));
            } else if (arg == "-c") {
                config.scoring = taxotree::parse_scoring(argv[++i]);
            } else if (arg == "-j") {
                config.threads = std::atoi(argv[++i]);
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const taxotree::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // Validate configuration
    try {
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Load taxonomy
    taxotree::Taxonomy taxonomy;
    try {
        taxonomy = taxotree::read_taxdump_dir(config.taxdump_dir);
        std::cerr << "Loaded taxonomy with " << taxonomy.size() << " taxa\n";
    } catch (const std::exception& e) {
        std::cerr << "Error reading taxonomy: " << e.what() << "\n";
        return 1;
    }

    // Load samples
    std::vector<taxotree::SampleData> samples;
    try {
        for (const auto& file : config.sample_files) {
            samples.push_back(taxotree::read_sample_file(file));
            std::cerr << "Loaded sample " << samples.back().name << " ("
                      << samples.back().abundances.size() << " taxa)\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error reading sample: " << e.what() << "\n";
        return 1;
    }

    // Build, shape and prune one tree per sample, config.threads at a time
    std::cerr << "Building sample trees...\n";
    std::vector<taxotree::TaxonTree> trees;
    trees.reserve(samples.size());
    const auto batch_size = static_cast<std::size_t>(config.threads);
    try {
        for (std::size_t first = 0; first < samples.size(); first += batch_size) {
            std::vector<std::future<taxotree::TaxonTree>> batch;
            for (std::size_t i = first; i < samples.size() && i < first + batch_size; ++i) {
                batch.push_back(std::async(std::launch::async, build_sample_tree,
                                           std::cref(taxonomy), std::cref(samples[i]),
                                           std::cref(config)));
            }
            for (auto& future : batch) {
                trees.push_back(future.get());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error building sample trees: " << e.what() << "\n";
        return 1;
    }
    for (std::size_t i = 0; i < trees.size(); ++i) {
        std::cerr << "Sample " << samples[i].name << ": " << trees[i].count_nodes()
                  << " taxa, " << trees[i].root().acc << " reads\n";
    }

    if (config.print_trees) {
        for (std::size_t i = 0; i < trees.size(); ++i) {
            std::cout << "# " << samples[i].name << "\n";
            taxotree::write_tree_text(std::cout, trees[i], taxonomy);
        }
    }

    if (!lineage_taxids.empty()) {
        print_lineages(taxonomy, samples, trees, lineage_taxids);
    }

    // Merge into the cross-sample tree
    std::vector<std::string> names;
    std::vector<const taxotree::TaxonTree*> tree_ptrs;
    for (std::size_t i = 0; i < trees.size(); ++i) {
        names.push_back(samples[i].name);
        tree_ptrs.push_back(&trees[i]);
    }
    std::optional<taxotree::MultiTaxonTree> multi;
    try {
        multi.emplace(taxotree::MultiTaxonTree::merge(taxonomy, names, tree_ptrs));
    } catch (const std::exception& e) {
        std::cerr << "Error merging samples: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "Merged tree: " << multi->count_nodes() << " taxa, scores as "
              << taxotree::score_display_name(config.scoring) << "\n";

    // Write the report
    taxotree::TaxaFilter filter;
    filter.include = config.include;
    filter.exclude = config.exclude;
    try {
        if (config.output_file) {
            taxotree::write_report_file(*config.output_file, *multi, taxonomy, filter);
            std::cerr << "Wrote report to: " << *config.output_file << "\n";
        } else {
            taxotree::write_items_tsv(std::cout, multi->samples(),
                                      multi->to_items(taxonomy, filter));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error writing report: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Done.\n";
    return 0;
}
