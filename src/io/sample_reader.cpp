#include "taxotree/io/sample_reader.hpp"

#include "taxotree/tree/score_math.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace taxotree {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string field;
    while (std::getline(ss, field, '\t')) {
        fields.push_back(field);
    }
    return fields;
}

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

template <typename T, typename Parse>
T parse_field(const std::string& text, Parse parse, const char* what,
              const std::string& source, std::size_t line) {
    try {
        std::size_t used = 0;
        T value = parse(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // Reported below
    }
    throw SampleFormatError(source, line,
                            std::string("invalid ") + what + " \"" + text + "\"");
}

} // anonymous namespace

SampleData read_sample(std::istream& input, const std::string& name) {
    SampleData sample;
    sample.name = name;

    std::unordered_map<TaxId, ScoreAccumulator> score_sums;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line) || line[0] == '#') {
            continue;
        }

        const auto fields = split_tabs(line);
        if (fields.size() < 2 || fields.size() > 3) {
            throw SampleFormatError(name, line_number,
                                    "expected 2 or 3 tab-separated fields, got " +
                                    std::to_string(fields.size()));
        }

        if (fields[0].empty() || fields[0][0] == '-' ||
            fields[1].empty() || fields[1][0] == '-') {
            throw SampleFormatError(name, line_number, "negative or empty value");
        }

        const auto taxid = parse_field<unsigned long>(
            fields[0],
            [](const std::string& s, std::size_t* used) { return std::stoul(s, used); },
            "taxid", name, line_number);
        const auto count = parse_field<unsigned long long>(
            fields[1],
            [](const std::string& s, std::size_t* used) { return std::stoull(s, used); },
            "count", name, line_number);
        if (taxid > 0xFFFFFFFFUL) {
            throw SampleFormatError(name, line_number,
                                    "taxid out of range \"" + fields[0] + "\"");
        }

        sample.abundances[static_cast<TaxId>(taxid)] += count;

        if (fields.size() == 3) {
            const double score = parse_field<double>(
                fields[2],
                [](const std::string& s, std::size_t* used) { return std::stod(s, used); },
                "score", name, line_number);
            score_sums[static_cast<TaxId>(taxid)].add(score, count);
        }
    }

    for (const auto& [taxid, accumulator] : score_sums) {
        if (auto score = accumulator.result()) {
            sample.scores[taxid] = *score;
        }
    }

    return sample;
}

SampleData read_sample_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open sample file: " + filename);
    }

    SampleData sample = read_sample(file, filename);
    sample.name = sample_name_from_path(filename);
    return sample;
}

std::string sample_name_from_path(const std::string& filename) {
    std::string name = filename;

    const std::size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    const std::size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot != 0) {
        name = name.substr(0, dot);
    }

    return name;
}

} // namespace taxotree
