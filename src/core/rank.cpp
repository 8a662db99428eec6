#include "taxotree/core/rank.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace taxotree {

namespace {

// Indexed by the underlying value of Rank.
constexpr std::array<std::string_view, 41> kRankNames = {
    "no rank",
    "clade",
    "isolate",
    "strain",
    "serotype",
    "serogroup",
    "forma specialis",
    "forma",
    "varietas",
    "subspecies",
    "species",
    "species subgroup",
    "species group",
    "series",
    "subsection",
    "section",
    "subgenus",
    "genus",
    "subtribe",
    "tribe",
    "subfamily",
    "family",
    "superfamily",
    "parvorder",
    "infraorder",
    "suborder",
    "order",
    "superorder",
    "subcohort",
    "cohort",
    "infraclass",
    "subclass",
    "class",
    "superclass",
    "subphylum",
    "phylum",
    "superphylum",
    "subkingdom",
    "kingdom",
    "domain",
    "root"
};

} // anonymous namespace

std::string_view to_string(Rank rank) noexcept {
    const auto index = static_cast<std::size_t>(rank);
    if (index >= kRankNames.size()) {
        return kRankNames[0];
    }
    return kRankNames[index];
}

Rank parse_rank(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "superkingdom") {
        return Rank::Domain;
    }

    for (std::size_t i = 1; i < kRankNames.size(); ++i) {
        if (kRankNames[i] == lowered) {
            return static_cast<Rank>(i);
        }
    }
    return Rank::Unclassified;
}

} // namespace taxotree
