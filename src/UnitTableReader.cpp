#include "UnitTableReader.hpp"
#include "UnitErrors.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <limits>

namespace PhysUnits {

namespace {

const std::string SYSTEM_PREFIX = "unit_system.";

} // namespace

// =============================================================================
// Parsing
// =============================================================================

bool UnitTableReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open unit table file: " << filename << std::endl;
        return false;
    }

    bool ok = parseStream(file);
    file.close();
    return ok;
}

bool UnitTableReader::loadString(const std::string& content) {
    std::istringstream input(content);
    return parseStream(input);
}

bool UnitTableReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            section(current_section);
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }
        if (key.empty()) {
            std::cerr << "Warning: Empty key at line " << line_num << std::endl;
            continue;
        }

        Section& entries = section(current_section);
        bool replaced = false;
        for (auto& entry : entries) {
            if (entry.first == key) {
                std::cerr << "Warning: Duplicate key '" << key << "' in [" << current_section
                          << "] at line " << line_num << ", keeping the last value" << std::endl;
                entry.second = value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            entries.emplace_back(key, value);
        }
    }

    return true;
}

UnitTableReader::Section& UnitTableReader::section(const std::string& name) {
    for (auto& s : data_) {
        if (s.first == name) return s.second;
    }
    data_.emplace_back(name, Section());
    return data_.back().second;
}

const UnitTableReader::Section* UnitTableReader::findSection(const std::string& name) const {
    for (const auto& s : data_) {
        if (s.first == name) return &s.second;
    }
    return nullptr;
}

std::string UnitTableReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> UnitTableReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    // Empty fields are kept, including a trailing one
    while (std::getline(ss, item, delim)) {
        result.push_back(trim(item));
    }
    if (!str.empty() && str.back() == delim) {
        result.push_back("");
    }

    return result;
}

double UnitTableReader::parseNumber(const std::string& section, const std::string& key,
                                    const std::string& text) const {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }

    if (consumed == 0 || consumed != text.size()) {
        throw UnitConfigurationError("[" + section + "] " + key + ": '" + text +
                                     "' is not a number");
    }
    return value;
}

// =============================================================================
// Queries
// =============================================================================

bool UnitTableReader::hasSection(const std::string& section) const {
    return findSection(section) != nullptr;
}

bool UnitTableReader::hasKey(const std::string& section, const std::string& key) const {
    const Section* entries = findSection(section);
    if (!entries) return false;
    for (const auto& entry : *entries) {
        if (entry.first == key) return true;
    }
    return false;
}

std::vector<std::string> UnitTableReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& s : data_) {
        sections.push_back(s.first);
    }
    return sections;
}

std::vector<std::string> UnitTableReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    const Section* entries = findSection(section);
    if (entries) {
        for (const auto& entry : *entries) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

std::string UnitTableReader::getString(const std::string& section, const std::string& key,
                                       const std::string& default_val) const {
    const Section* entries = findSection(section);
    if (!entries) return default_val;
    for (const auto& entry : *entries) {
        if (entry.first == key) return entry.second;
    }
    return default_val;
}

// =============================================================================
// Table Construction
// =============================================================================

std::shared_ptr<const UnitTable> UnitTableReader::buildTable() const {
    auto table = std::make_shared<UnitTable>();

    if (const Section* multipliers = findSection("multipliers")) {
        for (const auto& entry : *multipliers) {
            table->addMultiplier(entry.first, parseNumber("multipliers", entry.first, entry.second));
        }
    }

    if (const Section* fundamentals = findSection("fundamental_units")) {
        for (const auto& entry : *fundamentals) {
            std::vector<std::string> fields = split(entry.second, ',');
            if (fields.empty() || fields.size() > 3 || fields[0].empty()) {
                throw UnitConfigurationError("[fundamental_units] " + entry.first +
                                             ": expected 'DIMENSION, factor, offset'");
            }

            BaseDimension type = parseBaseDimension(fields[0]);
            double factor = fields.size() > 1
                ? parseNumber("fundamental_units", entry.first, fields[1]) : 1.0;
            double offset = fields.size() > 2
                ? parseNumber("fundamental_units", entry.first, fields[2]) : 0.0;

            table->addFundamentalUnit(FundamentalUnit(entry.first, type, factor, offset));
        }
    }

    if (const Section* derived = findSection("derived_units")) {
        for (const auto& entry : *derived) {
            std::vector<std::string> fields = split(entry.second, ',');
            if (fields.size() > 2) {
                throw UnitConfigurationError("[derived_units] " + entry.first +
                                             ": expected 'composition, factor'");
            }

            std::string composition = fields.empty() ? "" : fields[0];
            double factor = fields.size() > 1
                ? parseNumber("derived_units", entry.first, fields[1]) : 1.0;

            table->addDerivedUnit(DerivedUnit(entry.first, composition, factor));
        }
    }

    if (const Section* names = findSection("quantity_names")) {
        for (const auto& entry : *names) {
            table->addQuantityName(entry.first, entry.second);
        }
    }

    for (const auto& s : data_) {
        if (s.first.compare(0, SYSTEM_PREFIX.size(), SYSTEM_PREFIX) != 0) {
            continue;
        }

        std::string name = s.first.substr(SYSTEM_PREFIX.size());
        if (name.empty()) {
            throw UnitConfigurationError("[" + s.first + "] has no unit system name");
        }

        UnitSystemDefinition units;
        for (const auto& entry : s.second) {
            units[parseBaseDimension(entry.first)] = entry.second;
        }
        table->addUnitSystem(name, units);
    }

    for (const auto& s : data_) {
        const std::string& name = s.first;
        if (name != "multipliers" && name != "fundamental_units" &&
            name != "derived_units" && name != "quantity_names" &&
            name.compare(0, SYSTEM_PREFIX.size(), SYSTEM_PREFIX) != 0) {
            std::cerr << "Warning: Ignoring unknown section [" << name << "]" << std::endl;
        }
    }

    return table;
}

// =============================================================================
// Output
// =============================================================================

void UnitTableReader::writeTable(const UnitTable& table, std::ostream& os) {
    os << std::setprecision(std::numeric_limits<double>::max_digits10);

    os << "# Unit table\n\n";

    os << "[multipliers]\n";
    for (const auto& m : table.multipliers()) {
        os << m.symbol << " = " << m.factor << "\n";
    }

    os << "\n[fundamental_units]\n";
    for (const auto& u : table.fundamentalUnits()) {
        os << u.symbol << " = " << toString(u.type) << ", " << u.factor;
        if (u.offset != 0.0) os << ", " << u.offset;
        os << "\n";
    }

    os << "\n[derived_units]\n";
    for (const auto& u : table.derivedUnits()) {
        os << u.symbol << " = " << u.composition << ", " << u.factor << "\n";
    }

    os << "\n[quantity_names]\n";
    for (const auto& kv : table.quantityNames()) {
        os << kv.first << " = " << kv.second << "\n";
    }

    for (const auto& name : table.unitSystemNames()) {
        os << "\n[" << SYSTEM_PREFIX << name << "]\n";
        for (const auto& kv : table.unitSystem(name)) {
            os << toString(kv.first) << " = " << kv.second << "\n";
        }
    }
}

bool UnitTableReader::writeTable(const UnitTable& table, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write unit table file: " << filename << std::endl;
        return false;
    }

    writeTable(table, file);
    file.close();
    return true;
}

} // namespace PhysUnits
