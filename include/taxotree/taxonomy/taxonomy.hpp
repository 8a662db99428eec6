#ifndef TAXOTREE_TAXONOMY_TAXONOMY_HPP
#define TAXOTREE_TAXONOMY_TAXONOMY_HPP

/**
 * @file taxonomy.hpp
 * @brief Taxonomy graph consumed by the abundance trees.
 *
 * The trees only need four things from a taxonomy: the rank, the display
 * name and the ordered children of a taxid, plus the distinguished root.
 * TaxonomyGraph is that contract; Taxonomy is an in-memory implementation
 * filled node by node (see io/taxdump_reader.hpp for the NCBI loader).
 */

#include "taxotree/core/rank.hpp"
#include "taxotree/core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taxotree {

/**
 * @class TaxonomyGraph
 * @brief Read-only view of a reference taxonomy.
 *
 * Implementations must be safe to query concurrently from several threads
 * as long as nobody modifies them.
 */
class TaxonomyGraph {
public:
    virtual ~TaxonomyGraph() = default;

    /**
     * @brief Universal ancestor of the taxonomy.
     */
    [[nodiscard]] virtual TaxId root() const noexcept = 0;

    /**
     * @brief Rank of a taxid (Rank::Unclassified if unknown).
     */
    [[nodiscard]] virtual Rank rank_of(TaxId taxid) const = 0;

    /**
     * @brief Display name of a taxid.
     */
    [[nodiscard]] virtual std::string_view name_of(TaxId taxid) const = 0;

    /**
     * @brief Ordered children of a taxid (empty if it has none or is unknown).
     */
    [[nodiscard]] virtual const std::vector<TaxId>& children_of(TaxId taxid) const = 0;
};

/**
 * @class Taxonomy
 * @brief In-memory taxonomy built from (taxid, parent, rank, name) records.
 *
 * Children keep the order in which their records were added. A record whose
 * parent is itself (the NCBI root) is stored as its own child as well; the
 * trees' cycle guard takes care of it.
 */
class Taxonomy : public TaxonomyGraph {
public:
    /**
     * @brief Construct an empty taxonomy.
     * @param root Taxid of the universal ancestor.
     */
    explicit Taxonomy(TaxId root = kRootTaxId);

    /**
     * @brief Add or replace a taxon.
     * @param taxid Taxon identifier.
     * @param parent Parent taxid (may equal taxid for the root).
     * @param rank Taxonomic level.
     * @param name Display name (may be empty and set later with set_name()).
     */
    void add_node(TaxId taxid, TaxId parent, Rank rank, std::string name = {});

    /**
     * @brief Set the display name of a taxid.
     */
    void set_name(TaxId taxid, std::string name);

    [[nodiscard]] TaxId root() const noexcept override { return root_; }
    [[nodiscard]] Rank rank_of(TaxId taxid) const override;
    [[nodiscard]] std::string_view name_of(TaxId taxid) const override;
    [[nodiscard]] const std::vector<TaxId>& children_of(TaxId taxid) const override;

    /**
     * @brief Parent of a taxid, if known.
     * @throws std::out_of_range if the taxid is unknown.
     */
    [[nodiscard]] TaxId parent_of(TaxId taxid) const;

    /**
     * @brief Check whether the taxid has a record.
     */
    [[nodiscard]] bool contains(TaxId taxid) const noexcept {
        return parents_.count(taxid) != 0;
    }

    /**
     * @brief Parent of every known taxid (used for lineage requests).
     */
    [[nodiscard]] const Parents& parents() const noexcept { return parents_; }

    /**
     * @brief Number of taxa with a record.
     */
    [[nodiscard]] std::size_t size() const noexcept { return parents_.size(); }

private:
    TaxId root_;
    Parents parents_;
    std::unordered_map<TaxId, Rank> ranks_;
    std::unordered_map<TaxId, std::string> names_;
    std::unordered_map<TaxId, std::vector<TaxId>> children_;
};

} // namespace taxotree

#endif // TAXOTREE_TAXONOMY_TAXONOMY_HPP
