// SPDX-License-Identifier: MIT
/**
 * @file sector_mapper.hpp
 * @brief Symbol to sector/industry mapping and the sector lookup interface
 *
 * Provides the metadata source used by sector analysis. Lookups may be
 * slow or fail in real deployments, so callers go through SectorLookup and
 * cache successful answers themselves.
 */

#ifndef TRACKER_DATA_SECTOR_MAPPER_HPP
#define TRACKER_DATA_SECTOR_MAPPER_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tracker {
namespace data {

/**
 * @struct SectorInfo
 * @brief Classification of one symbol
 */
struct SectorInfo {
    std::string sector = "Unknown";
    std::string industry = "Unknown";
    std::string source;  ///< "mapping", "cache", "fallback" or "error"

    nlohmann::json to_json() const;
};

/**
 * @class SectorLookup
 * @brief Source of sector metadata per symbol
 */
class SectorLookup {
public:
    virtual ~SectorLookup() = default;

    /**
     * @brief Classify @p symbol
     * @return nullopt when the source has no answer for the symbol
     * @throws std::runtime_error when the source itself fails
     */
    virtual std::optional<SectorInfo> lookup(const std::string& symbol) const = 0;
};

/**
 * @class SectorMapping
 * @brief Maps symbols to sectors and industries
 *
 * Thread safety:
 * - Instances are safe for concurrent read-only access after construction.
 * - Mutating operations are not thread-safe.
 *
 * Usage example:
 * @code
 * // CSV rows: symbol,sector[,industry]
 * auto mapping = SectorMapping::from_csv("data/sectors.csv");
 * MappedSectorLookup lookup(mapping);
 * @endcode
 */
class SectorMapping {
public:
    SectorMapping() = default;

    /**
     * @brief Construct mapping from parallel vectors
     * @param symbols Symbol identifiers
     * @param sectors Sector names (same length)
     * @param industries Industry names (same length, or empty for "Unknown")
     * @throws std::invalid_argument if sizes differ or a name is empty
     */
    SectorMapping(const std::vector<std::string>& symbols,
                  const std::vector<std::string>& sectors,
                  const std::vector<std::string>& industries = {});

    /**
     * @brief Factory: create mapping from CSV file with a header row
     * @throws std::runtime_error on IO errors or when no row parses
     */
    static SectorMapping from_csv(const std::string& filepath, char delimiter = ',');

    /**
     * @brief Factory: create mapping from JSON
     * @param j {"assets": [...], "sectors": [...], "industries": [...]} (industries optional)
     * @throws std::invalid_argument on missing fields or size mismatch
     */
    static SectorMapping from_json(const nlohmann::json& j);

    const std::vector<std::string>& symbols() const { return symbols_; }

    /// Unique sectors, sorted.
    std::vector<std::string> get_sectors() const;

    /// Symbols of one sector in insertion order.
    std::vector<std::string> get_symbols_in_sector(const std::string& sector) const;

    bool contains(const std::string& symbol) const;

    /**
     * @brief Get classification of a symbol
     * @throws std::out_of_range if symbol not found
     */
    const SectorInfo& get(const std::string& symbol) const;

    nlohmann::json to_json() const;

    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }

private:
    std::vector<std::string> symbols_;                     ///< Symbols in order
    std::unordered_map<std::string, SectorInfo> by_symbol_; ///< Map symbol -> info
};

/**
 * @class MappedSectorLookup
 * @brief SectorLookup answering from a SectorMapping
 */
class MappedSectorLookup : public SectorLookup {
public:
    explicit MappedSectorLookup(SectorMapping mapping) : mapping_(std::move(mapping)) {}

    std::optional<SectorInfo> lookup(const std::string& symbol) const override;

    const SectorMapping& mapping() const { return mapping_; }

private:
    SectorMapping mapping_;
};

} // namespace data
} // namespace tracker

#endif // TRACKER_DATA_SECTOR_MAPPER_HPP
