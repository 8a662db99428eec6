#include <catch2/catch_test_macros.hpp>

#include "taxotree/io/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace taxotree;

namespace {

Taxonomy make_taxonomy() {
    Taxonomy taxonomy;
    taxonomy.add_node(1, 1, Rank::Root, "root");
    taxonomy.add_node(2, 1, Rank::Domain, "Bacteria");
    taxonomy.add_node(562, 2, Rank::Species, "Escherichia coli");
    return taxonomy;
}

TaxonTree shaped_tree(const Taxonomy& taxonomy, const Abundances& abundances,
                      const Scores& scores) {
    auto tree = TaxonTree::grow(taxonomy, abundances, scores);
    tree.shape();
    return tree;
}

const char* kReport =
    "taxid\ts1_acc\ts1_count\ts1_score\ts2_acc\ts2_count\ts2_score\trank\tname\n"
    "1\t3\t0\t0.5\t1\t0\t\troot\troot\n"
    "2\t3\t0\t0.5\t1\t1\t\tdomain\tBacteria\n"
    "562\t3\t3\t0.5\t0\t0\t\tspecies\tEscherichia coli\n";

} // anonymous namespace

TEST_CASE("Tabular reports", "[report_writer]") {
    const auto taxonomy = make_taxonomy();
    auto first = shaped_tree(taxonomy, {{562, 3}}, {{562, 0.5}});
    auto second = shaped_tree(taxonomy, {{2, 1}}, {});
    auto multi = MultiTaxonTree::merge(taxonomy, {"s1", "s2"}, {&first, &second});

    SECTION("Full report with empty cells for missing scores") {
        std::ostringstream out;
        write_items_tsv(out, multi.samples(), multi.to_items(taxonomy));
        REQUIRE(out.str() == kReport);
    }

    SECTION("Counts report") {
        std::ostringstream out;
        write_counts_tsv(out, multi.samples(), multi.to_items(std::vector<std::size_t>{0, 1}));
        REQUIRE(out.str() == "taxid\ts1\ts2\n1\t0\t0\n2\t0\t1\n562\t3\t0\n");
    }

    SECTION("Report with a filter") {
        TaxaFilter filter;
        filter.mindepth = 2;
        std::ostringstream out;
        write_items_tsv(out, multi.samples(), multi.to_items(taxonomy, filter));

        std::string header;
        std::string row;
        std::istringstream lines(out.str());
        std::getline(lines, header);
        std::getline(lines, row);
        REQUIRE(row.rfind("562\t", 0) == 0);
        REQUIRE_FALSE(std::getline(lines, row));
    }

    SECTION("Report file") {
        const auto path = std::filesystem::temp_directory_path() / "taxotree_report_test.tsv";
        write_report_file(path.string(), multi, taxonomy);

        std::ifstream file(path);
        const std::string contents((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
        REQUIRE(contents == kReport);
        file.close();
        std::filesystem::remove(path);
    }

    SECTION("Unwritable report file") {
        REQUIRE_THROWS_AS(write_report_file("/nonexistent/dir/report.tsv", multi, taxonomy),
                          std::runtime_error);
    }
}

TEST_CASE("Tree text output", "[report_writer]") {
    const auto taxonomy = make_taxonomy();
    auto tree = shaped_tree(taxonomy, {{562, 3}}, {});

    SECTION("One indented line per node") {
        std::ostringstream out;
        write_tree_text(out, tree, taxonomy);
        REQUIRE(out.str() ==
                "root (1) [0/3]\n"
                "  Bacteria (2) [0/3]\n"
                "    Escherichia coli (562) [3/3]\n");
    }

    SECTION("Nodes under the count threshold are hidden") {
        std::ostringstream out;
        write_tree_text(out, tree, taxonomy, 1);
        REQUIRE(out.str() == "    Escherichia coli (562) [3/3]\n");
    }
}
