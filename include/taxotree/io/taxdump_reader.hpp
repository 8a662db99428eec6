#ifndef TAXOTREE_IO_TAXDUMP_READER_HPP
#define TAXOTREE_IO_TAXDUMP_READER_HPP

/**
 * @file taxdump_reader.hpp
 * @brief Loading of the NCBI taxonomy dump (nodes.dmp and names.dmp).
 *
 * Both files are '|'-separated tables:
 * - nodes.dmp: taxid | parent taxid | rank | ... (extra columns ignored)
 * - names.dmp: taxid | name | unique name | name class
 *
 * Only "scientific name" rows of names.dmp are used. The record whose parent
 * is itself becomes the root of the taxonomy and gets Rank::Root.
 */

#include "taxotree/taxonomy/taxonomy.hpp"

#include <istream>
#include <stdexcept>
#include <string>

namespace taxotree {

/**
 * @class TaxdumpError
 * @brief Exception thrown when a taxonomy dump line cannot be parsed.
 */
class TaxdumpError : public std::runtime_error {
public:
    TaxdumpError(const std::string& source, std::size_t line, const std::string& message)
        : std::runtime_error("Taxdump error: " + source + ":" +
                             std::to_string(line) + ": " + message) {}
};

/**
 * @brief Default file names inside a taxdump directory.
 */
inline constexpr const char* kNodesFile = "nodes.dmp";
inline constexpr const char* kNamesFile = "names.dmp";

/**
 * @brief Read nodes.dmp records into a taxonomy.
 * @param input Stream with nodes.dmp contents.
 * @param taxonomy Taxonomy to fill.
 * @param source Name used in error messages.
 * @throws TaxdumpError on malformed lines.
 */
void read_nodes(std::istream& input, Taxonomy& taxonomy,
                const std::string& source = kNodesFile);

/**
 * @brief Read names.dmp scientific names into a taxonomy.
 * @param input Stream with names.dmp contents.
 * @param taxonomy Taxonomy to fill.
 * @param source Name used in error messages.
 * @throws TaxdumpError on malformed lines.
 */
void read_names(std::istream& input, Taxonomy& taxonomy,
                const std::string& source = kNamesFile);

/**
 * @brief Load a taxonomy from a nodes and a names file.
 * @throws std::runtime_error if a file cannot be opened.
 * @throws TaxdumpError on malformed lines.
 */
[[nodiscard]] Taxonomy read_taxdump(const std::string& nodes_file,
                                    const std::string& names_file);

/**
 * @brief Load nodes.dmp and names.dmp from a directory.
 * @throws std::runtime_error if a file cannot be opened.
 * @throws TaxdumpError on malformed lines.
 */
[[nodiscard]] Taxonomy read_taxdump_dir(const std::string& directory);

} // namespace taxotree

#endif // TAXOTREE_IO_TAXDUMP_READER_HPP
