#ifndef UNIT_TABLE_READER_HPP
#define UNIT_TABLE_READER_HPP

#include "UnitTable.hpp"
#include <string>
#include <vector>
#include <utility>
#include <memory>
#include <istream>
#include <ostream>

namespace PhysUnits {

/**
 * @brief INI-style reader for unit table files
 *
 * Lets the multiplier, unit, quantity-name and unit-system tables be
 * supplied as versioned data instead of the compiled-in defaults.
 *
 * File layout:
 * @code
 *   [multipliers]
 *   k = 1000
 *
 *   [fundamental_units]
 *   # symbol = DIMENSION, factor, offset
 *   kg = MASS, 1
 *   C = TEMPERATURE, 1, 273.15
 *
 *   [derived_units]
 *   # symbol = composition, factor
 *   N = kg m s^-2, 1
 *
 *   [quantity_names]
 *   Velocity = m s^-1
 *
 *   [unit_system.BT]
 *   MASS = slug
 * @endcode
 *
 * Section and key order are preserved; multiplier order decides prefix
 * matching.
 */
class UnitTableReader {
public:
    UnitTableReader() = default;

    /// Parse a file; false (with an error on stderr) if it cannot be opened
    bool loadFile(const std::string& filename);

    /// Parse table text held in memory
    bool loadString(const std::string& content);

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;

    /**
     * @brief Build a unit table from the parsed sections
     * @throws UnitConfigurationError for malformed entries
     * @throws UnitAlreadyRegistered for a symbol defined twice
     */
    std::shared_ptr<const UnitTable> buildTable() const;

    /// Write a table in the format loadFile() reads
    static void writeTable(const UnitTable& table, std::ostream& os);
    static bool writeTable(const UnitTable& table, const std::string& filename);

private:
    using Section = std::vector<std::pair<std::string, std::string>>;
    std::vector<std::pair<std::string, Section>> data_;

    bool parseStream(std::istream& input);
    Section& section(const std::string& name);
    const Section* findSection(const std::string& name) const;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
    double parseNumber(const std::string& section, const std::string& key,
                       const std::string& text) const;
};

} // namespace PhysUnits

#endif // UNIT_TABLE_READER_HPP
