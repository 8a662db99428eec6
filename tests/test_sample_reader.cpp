#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "taxotree/io/sample_reader.hpp"

#include <sstream>
#include <string>

using namespace taxotree;
using Catch::Approx;

TEST_CASE("Reading sample tables", "[sample_reader]") {
    SECTION("Counts with and without scores") {
        std::istringstream input("562\t10\t0.9\n10239\t4\n");
        auto sample = read_sample(input, "s1");

        REQUIRE(sample.name == "s1");
        REQUIRE(sample.abundances.size() == 2);
        REQUIRE(sample.abundances.at(562) == 10);
        REQUIRE(sample.abundances.at(10239) == 4);
        REQUIRE(sample.scores.size() == 1);
        REQUIRE(sample.scores.at(562) == Approx(0.9));
    }

    SECTION("Comments, blank lines and CRLF endings are accepted") {
        std::istringstream input("# taxid\tcount\tscore\r\n\r\n562\t3\t0.5\r\n\n");
        auto sample = read_sample(input, "s1");
        REQUIRE(sample.abundances.at(562) == 3);
        REQUIRE(sample.scores.at(562) == Approx(0.5));
    }

    SECTION("Repeated taxids add up with count-weighted scores") {
        std::istringstream input("562\t1\t1.0\n562\t3\t0.0\n562\t2\n");
        auto sample = read_sample(input, "s1");
        REQUIRE(sample.abundances.at(562) == 6);
        REQUIRE(sample.scores.at(562) == Approx(0.25));
    }

    SECTION("Empty input gives an empty sample") {
        std::istringstream input("");
        auto sample = read_sample(input, "empty");
        REQUIRE(sample.abundances.empty());
        REQUIRE(sample.scores.empty());
    }
}

TEST_CASE("Sample table errors", "[sample_reader]") {
    SECTION("Wrong number of fields") {
        std::istringstream input("562\n");
        REQUIRE_THROWS_AS(read_sample(input, "s1"), SampleFormatError);

        std::istringstream extra("562\t1\t0.5\tx\n");
        REQUIRE_THROWS_AS(read_sample(extra, "s1"), SampleFormatError);
    }

    SECTION("Negative counts") {
        std::istringstream input("562\t-3\n");
        REQUIRE_THROWS_AS(read_sample(input, "s1"), SampleFormatError);
    }

    SECTION("Non-numeric values") {
        std::istringstream taxid("abc\t3\n");
        REQUIRE_THROWS_AS(read_sample(taxid, "s1"), SampleFormatError);

        std::istringstream count("562\t3x\n");
        REQUIRE_THROWS_AS(read_sample(count, "s1"), SampleFormatError);

        std::istringstream score("562\t3\thigh\n");
        REQUIRE_THROWS_AS(read_sample(score, "s1"), SampleFormatError);
    }

    SECTION("Taxids wider than 32 bits") {
        std::istringstream input("4294967296\t1\n");
        REQUIRE_THROWS_AS(read_sample(input, "s1"), SampleFormatError);
    }

    SECTION("Errors name the sample and line") {
        std::istringstream input("562\t1\n\nbad\n");
        try {
            (void)read_sample(input, "s1");
            FAIL("read_sample should have thrown");
        } catch (const SampleFormatError& e) {
            REQUIRE(std::string(e.what()).find("Sample format error: s1:3:") == 0);
        }
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(read_sample_file("/nonexistent/s1.tsv"), std::runtime_error);
    }
}

TEST_CASE("Sample names from paths", "[sample_reader]") {
    REQUIRE(sample_name_from_path("dir/s1.tsv") == "s1");
    REQUIRE(sample_name_from_path("/data/run.2/gut.txt") == "gut");
    REQUIRE(sample_name_from_path("plain") == "plain");
    REQUIRE(sample_name_from_path(".hidden") == ".hidden");
}
