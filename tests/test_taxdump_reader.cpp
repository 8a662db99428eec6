#include <catch2/catch_test_macros.hpp>

#include "taxotree/io/taxdump_reader.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace taxotree;

namespace {

const char* kNodes =
    "1\t|\t1\t|\tno rank\t|\t\t|\t8\t|\n"
    "131567\t|\t1\t|\tno rank\t|\t\t|\t8\t|\n"
    "2\t|\t131567\t|\tsuperkingdom\t|\t\t|\t0\t|\n"
    "1224\t|\t2\t|\tphylum\t|\t\t|\t0\t|\n"
    "10239\t|\t1\t|\tsuperkingdom\t|\t\t|\t9\t|\n";

const char* kNames =
    "1\t|\tall\t|\t\t|\tsynonym\t|\n"
    "1\t|\troot\t|\t\t|\tscientific name\t|\n"
    "2\t|\tBacteria\t|\tBacteria <bacteria>\t|\tscientific name\t|\n"
    "2\t|\teubacteria\t|\t\t|\tgenbank common name\t|\n"
    "1224\t|\tProteobacteria\t|\t\t|\tscientific name\t|\n"
    "10239\t|\tViruses\t|\t\t|\tscientific name\t|\n";

} // anonymous namespace

TEST_CASE("Reading nodes.dmp", "[taxdump_reader]") {
    Taxonomy taxonomy;
    std::istringstream nodes(kNodes);
    read_nodes(nodes, taxonomy);

    SECTION("Every record is loaded") {
        REQUIRE(taxonomy.size() == 5);
        REQUIRE(taxonomy.parent_of(1224) == 2);
        REQUIRE(taxonomy.parent_of(2) == 131567);
    }

    SECTION("Children keep file order") {
        REQUIRE(taxonomy.children_of(1) == std::vector<TaxId>{1, 131567, 10239});
    }

    SECTION("Ranks are parsed") {
        REQUIRE(taxonomy.rank_of(2) == Rank::Domain);
        REQUIRE(taxonomy.rank_of(1224) == Rank::Phylum);
        REQUIRE(taxonomy.rank_of(131567) == Rank::Unclassified);
    }

    SECTION("The self-parented record is the root") {
        REQUIRE(taxonomy.rank_of(1) == Rank::Root);
    }

    SECTION("Blank lines are skipped") {
        Taxonomy other;
        std::istringstream input("\n1\t|\t1\t|\tno rank\t|\n\n");
        read_nodes(input, other);
        REQUIRE(other.size() == 1);
    }
}

TEST_CASE("Reading names.dmp", "[taxdump_reader]") {
    Taxonomy taxonomy;
    std::istringstream nodes(kNodes);
    std::istringstream names(kNames);
    read_nodes(nodes, taxonomy);
    read_names(names, taxonomy);

    SECTION("Only scientific names are used") {
        REQUIRE(taxonomy.name_of(1) == "root");
        REQUIRE(taxonomy.name_of(2) == "Bacteria");
        REQUIRE(taxonomy.name_of(10239) == "Viruses");
    }

    SECTION("Taxa without a scientific name stay unknown") {
        REQUIRE(taxonomy.name_of(131567) == "unknown");
    }
}

TEST_CASE("Taxdump errors", "[taxdump_reader]") {
    Taxonomy taxonomy;

    SECTION("Too few fields in nodes.dmp") {
        std::istringstream input("1\t|\t1\t|\n");
        REQUIRE_THROWS_AS(read_nodes(input, taxonomy), TaxdumpError);
    }

    SECTION("Non-numeric taxid") {
        std::istringstream input("abc\t|\t1\t|\tgenus\t|\n");
        REQUIRE_THROWS_AS(read_nodes(input, taxonomy), TaxdumpError);
    }

    SECTION("Too few fields in names.dmp") {
        std::istringstream input("1\t|\troot\t|\n");
        REQUIRE_THROWS_AS(read_names(input, taxonomy), TaxdumpError);
    }

    SECTION("Errors name the source and line") {
        std::istringstream input("1\t|\t1\t|\tno rank\t|\nx\t|\t1\t|\tgenus\t|\n");
        try {
            read_nodes(input, taxonomy, "nodes.dmp");
            FAIL("read_nodes should have thrown");
        } catch (const TaxdumpError& e) {
            REQUIRE(std::string(e.what()).find("Taxdump error: nodes.dmp:2:") == 0);
        }
    }

    SECTION("Missing files") {
        REQUIRE_THROWS_AS(read_taxdump_dir("/nonexistent/taxdump"), std::runtime_error);
    }
}
