#include <catch2/catch_test_macros.hpp>

#include "taxotree/core/rank.hpp"

using namespace taxotree;

TEST_CASE("Rank ordering", "[rank]") {
    SECTION("Coarse ranks compare greater than fine ranks") {
        REQUIRE(Rank::Root > Rank::Domain);
        REQUIRE(Rank::Domain > Rank::Phylum);
        REQUIRE(Rank::Phylum > Rank::Genus);
        REQUIRE(Rank::Genus > Rank::Species);
        REQUIRE(Rank::Species > Rank::Forma);
        REQUIRE(Rank::Forma > Rank::Strain);
        REQUIRE(Rank::SpeciesGroup > Rank::Species);
        REQUIRE(Rank::Subgenus > Rank::Section);
    }

    SECTION("is_below is strict") {
        REQUIRE(is_below(Rank::Species, Rank::Genus));
        REQUIRE_FALSE(is_below(Rank::Genus, Rank::Genus));
        REQUIRE_FALSE(is_below(Rank::Family, Rank::Genus));
    }

    SECTION("is_at_or_below includes equality") {
        REQUIRE(is_at_or_below(Rank::Genus, Rank::Genus));
        REQUIRE(is_at_or_below(Rank::Subgenus, Rank::Genus));
        REQUIRE_FALSE(is_at_or_below(Rank::Order, Rank::Genus));
    }

    SECTION("Unclassified never takes part in comparisons") {
        REQUIRE_FALSE(is_below(Rank::Unclassified, Rank::Species));
        REQUIRE_FALSE(is_below(Rank::Species, Rank::Unclassified));
        REQUIRE_FALSE(is_at_or_below(Rank::Unclassified, Rank::Unclassified));
        REQUIRE_FALSE(is_at_or_below(Rank::Unclassified, Rank::Genus));
    }

    SECTION("Clade never takes part in comparisons") {
        REQUIRE_FALSE(has_level(Rank::Clade));
        REQUIRE_FALSE(is_below(Rank::Clade, Rank::Species));
        REQUIRE_FALSE(is_below(Rank::Species, Rank::Clade));
        REQUIRE_FALSE(is_at_or_below(Rank::Clade, Rank::Clade));
    }

    SECTION("Strains are below species") {
        REQUIRE(has_level(Rank::Strain));
        REQUIRE(is_below(Rank::Strain, Rank::Species));
        REQUIRE(is_below(Rank::Isolate, Rank::Strain));
    }

    SECTION("Comparisons are usable at compile time") {
        static_assert(is_below(Rank::Species, Rank::Domain));
        static_assert(!is_below(Rank::Root, Rank::Domain));
    }
}

TEST_CASE("Rank names", "[rank]") {
    SECTION("to_string gives NCBI names") {
        REQUIRE(to_string(Rank::Species) == "species");
        REQUIRE(to_string(Rank::SpeciesGroup) == "species group");
        REQUIRE(to_string(Rank::Domain) == "domain");
        REQUIRE(to_string(Rank::Root) == "root");
        REQUIRE(to_string(Rank::Unclassified) == "no rank");
    }

    SECTION("parse_rank is case-insensitive") {
        REQUIRE(parse_rank("genus") == Rank::Genus);
        REQUIRE(parse_rank("Genus") == Rank::Genus);
        REQUIRE(parse_rank("PHYLUM") == Rank::Phylum);
        REQUIRE(parse_rank("species subgroup") == Rank::SpeciesSubgroup);
    }

    SECTION("Ranks below species and botanical ranks") {
        REQUIRE(parse_rank("strain") == Rank::Strain);
        REQUIRE(parse_rank("isolate") == Rank::Isolate);
        REQUIRE(parse_rank("serotype") == Rank::Serotype);
        REQUIRE(parse_rank("serogroup") == Rank::Serogroup);
        REQUIRE(parse_rank("forma specialis") == Rank::FormaSpecialis);
        REQUIRE(parse_rank("section") == Rank::Section);
        REQUIRE(parse_rank("subsection") == Rank::Subsection);
        REQUIRE(parse_rank("series") == Rank::Series);
        REQUIRE(parse_rank("subcohort") == Rank::Subcohort);
    }

    SECTION("clade has its own value") {
        REQUIRE(parse_rank("clade") == Rank::Clade);
        REQUIRE(to_string(Rank::Clade) == "clade");
    }

    SECTION("superkingdom is an alias of domain") {
        REQUIRE(parse_rank("superkingdom") == Rank::Domain);
    }

    SECTION("Unknown names are unclassified") {
        REQUIRE(parse_rank("no rank") == Rank::Unclassified);
        REQUIRE(parse_rank("subvariety") == Rank::Unclassified);
        REQUIRE(parse_rank("") == Rank::Unclassified);
    }

    SECTION("Names round-trip for every real rank") {
        for (int i = 1; i <= static_cast<int>(Rank::Root); ++i) {
            const auto rank = static_cast<Rank>(i);
            REQUIRE(parse_rank(to_string(rank)) == rank);
        }
    }
}
