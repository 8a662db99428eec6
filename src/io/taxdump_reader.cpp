#include "taxotree/io/taxdump_reader.hpp"

#include <cctype>
#include <fstream>
#include <string_view>
#include <vector>

namespace taxotree {

namespace {

std::string_view trim(std::string_view field) {
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.front()))) {
        field.remove_prefix(1);
    }
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.back()))) {
        field.remove_suffix(1);
    }
    return field;
}

// Split a dump line on '|' and trim every field. The trailing "\t|" of NCBI
// lines yields an empty last field, which is dropped.
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    while (true) {
        const std::size_t bar = line.find('|');
        fields.push_back(trim(line.substr(0, bar)));
        if (bar == std::string_view::npos) {
            break;
        }
        line.remove_prefix(bar + 1);
    }
    if (!fields.empty() && fields.back().empty()) {
        fields.pop_back();
    }
    return fields;
}

TaxId parse_taxid(std::string_view field, const std::string& source, std::size_t line) {
    const std::string text(field);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw TaxdumpError(source, line, "invalid taxid \"" + text + "\"");
    }
    try {
        std::size_t used = 0;
        const unsigned long value = std::stoul(text, &used);
        if (used != text.size() || value > 0xFFFFFFFFUL) {
            throw TaxdumpError(source, line, "invalid taxid \"" + text + "\"");
        }
        return static_cast<TaxId>(value);
    } catch (const std::logic_error&) {
        throw TaxdumpError(source, line, "invalid taxid \"" + text + "\"");
    }
}

std::ifstream open_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open taxonomy file: " + filename);
    }
    return file;
}

} // anonymous namespace

void read_nodes(std::istream& input, Taxonomy& taxonomy, const std::string& source) {
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = split_fields(line);
        if (fields.size() < 3) {
            throw TaxdumpError(source, line_number,
                               "expected at least 3 fields, got " +
                               std::to_string(fields.size()));
        }

        const TaxId taxid = parse_taxid(fields[0], source, line_number);
        const TaxId parent = parse_taxid(fields[1], source, line_number);
        const Rank rank = taxid == parent ? Rank::Root : parse_rank(fields[2]);

        taxonomy.add_node(taxid, parent, rank);
    }
}

void read_names(std::istream& input, Taxonomy& taxonomy, const std::string& source) {
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = split_fields(line);
        if (fields.size() < 4) {
            throw TaxdumpError(source, line_number,
                               "expected 4 fields, got " +
                               std::to_string(fields.size()));
        }
        if (fields[3] != "scientific name") {
            continue;
        }

        const TaxId taxid = parse_taxid(fields[0], source, line_number);
        taxonomy.set_name(taxid, std::string(fields[1]));
    }
}

Taxonomy read_taxdump(const std::string& nodes_file, const std::string& names_file) {
    Taxonomy taxonomy;

    std::ifstream nodes = open_file(nodes_file);
    read_nodes(nodes, taxonomy, nodes_file);

    std::ifstream names = open_file(names_file);
    read_names(names, taxonomy, names_file);

    return taxonomy;
}

Taxonomy read_taxdump_dir(const std::string& directory) {
    std::string prefix = directory;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    return read_taxdump(prefix + kNodesFile, prefix + kNamesFile);
}

} // namespace taxotree
