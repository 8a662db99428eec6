#include <catch2/catch_test_macros.hpp>

#include "taxotree/taxonomy/taxonomy.hpp"

#include <stdexcept>
#include <vector>

using namespace taxotree;

TEST_CASE("Taxonomy construction", "[taxonomy]") {
    Taxonomy taxonomy;
    taxonomy.add_node(1, 1, Rank::Root, "root");
    taxonomy.add_node(2, 1, Rank::Domain, "Bacteria");
    taxonomy.add_node(10239, 1, Rank::Unclassified, "Viruses");
    taxonomy.add_node(1224, 2, Rank::Phylum, "Proteobacteria");

    SECTION("Root defaults to the NCBI root") {
        REQUIRE(taxonomy.root() == kRootTaxId);
    }

    SECTION("Children keep insertion order") {
        const auto& children = taxonomy.children_of(1);
        REQUIRE(children == std::vector<TaxId>{1, 2, 10239});
        REQUIRE(taxonomy.children_of(2) == std::vector<TaxId>{1224});
    }

    SECTION("Ranks and names") {
        REQUIRE(taxonomy.rank_of(1224) == Rank::Phylum);
        REQUIRE(taxonomy.name_of(2) == "Bacteria");
        REQUIRE(taxonomy.name_of(10239) == "Viruses");
    }

    SECTION("Parents") {
        REQUIRE(taxonomy.parent_of(1224) == 2);
        REQUIRE(taxonomy.parent_of(1) == 1);
        REQUIRE(taxonomy.parents().size() == 4);
        REQUIRE(taxonomy.size() == 4);
    }

    SECTION("Unknown taxids") {
        REQUIRE_FALSE(taxonomy.contains(999));
        REQUIRE(taxonomy.rank_of(999) == Rank::Unclassified);
        REQUIRE(taxonomy.name_of(999) == "unknown");
        REQUIRE(taxonomy.children_of(999).empty());
        REQUIRE_THROWS_AS(taxonomy.parent_of(999), std::out_of_range);
    }
}

TEST_CASE("Taxonomy updates", "[taxonomy]") {
    Taxonomy taxonomy;
    taxonomy.add_node(1, 1, Rank::Root);
    taxonomy.add_node(2, 1, Rank::Domain);
    taxonomy.add_node(3, 1, Rank::Domain);
    taxonomy.add_node(4, 2, Rank::Phylum);

    SECTION("Names can be set after the node") {
        taxonomy.set_name(4, "Firmicutes");
        REQUIRE(taxonomy.name_of(4) == "Firmicutes");
    }

    SECTION("Re-adding a node under another parent moves it") {
        taxonomy.add_node(4, 3, Rank::Phylum);
        REQUIRE(taxonomy.children_of(2).empty());
        REQUIRE(taxonomy.children_of(3) == std::vector<TaxId>{4});
        REQUIRE(taxonomy.parent_of(4) == 3);
    }

    SECTION("Re-adding under the same parent does not duplicate it") {
        taxonomy.add_node(4, 2, Rank::Class);
        REQUIRE(taxonomy.children_of(2) == std::vector<TaxId>{4});
        REQUIRE(taxonomy.rank_of(4) == Rank::Class);
    }

    SECTION("Custom root") {
        Taxonomy sub(2);
        sub.add_node(2, 2, Rank::Domain);
        REQUIRE(sub.root() == 2);
    }
}
