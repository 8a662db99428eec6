#ifndef TAXOTREE_IO_SAMPLE_READER_HPP
#define TAXOTREE_IO_SAMPLE_READER_HPP

/**
 * @file sample_reader.hpp
 * @brief Reading of per-sample abundance tables.
 *
 * A sample is a tab-separated table of already assigned observations:
 *
 *     taxid <TAB> count [<TAB> score]
 *
 * Blank lines and lines starting with '#' are ignored. A taxid may appear on
 * several lines (for instance one line per read): counts add up and scores
 * are averaged, weighted by the count of their line.
 */

#include "taxotree/core/types.hpp"

#include <istream>
#include <stdexcept>
#include <string>

namespace taxotree {

/**
 * @class SampleFormatError
 * @brief Exception thrown when a sample table line cannot be parsed.
 */
class SampleFormatError : public std::runtime_error {
public:
    SampleFormatError(const std::string& source, std::size_t line, const std::string& message)
        : std::runtime_error("Sample format error: " + source + ":" +
                             std::to_string(line) + ": " + message) {}
};

/**
 * @struct SampleData
 * @brief Abundances and scores of one sample.
 */
struct SampleData {
    /** @brief Sample name (file name without directories and extension). */
    std::string name;

    /** @brief Reads assigned to each taxid. */
    Abundances abundances;

    /** @brief Average score of each taxid that had scored lines. */
    Scores scores;
};

/**
 * @brief Read a sample table from a stream.
 * @param input Stream with the table.
 * @param name Sample name, also used in error messages.
 * @throws SampleFormatError on malformed lines.
 */
[[nodiscard]] SampleData read_sample(std::istream& input, const std::string& name);

/**
 * @brief Read a sample table from a file.
 * @param filename Path to the table.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws SampleFormatError on malformed lines.
 */
[[nodiscard]] SampleData read_sample_file(const std::string& filename);

/**
 * @brief Sample name derived from a file path ("dir/s1.tsv" -> "s1").
 */
[[nodiscard]] std::string sample_name_from_path(const std::string& filename);

} // namespace taxotree

#endif // TAXOTREE_IO_SAMPLE_READER_HPP
