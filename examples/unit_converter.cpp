/**
 * @file unit_converter.cpp
 * @brief Command-line unit converter
 *
 * Usage:
 *   ./unit_converter <value> <from_units> <to_units>
 *   ./unit_converter --system <name> <value> <units>
 *   ./unit_converter --compatible <units>
 *   ./unit_converter --list
 *   ./unit_converter --help
 *
 * Any form may be preceded by --table <file> to use a unit table file
 * instead of the built-in units.
 *
 * Examples:
 *   ./unit_converter 5000 kPa psi
 *   ./unit_converter 100 C F
 *   ./unit_converter 1 "kg m^-3" "slug ft^-3"
 *   ./unit_converter --system BT 10 "kg ft s"
 *   ./unit_converter --compatible N
 */

#include "PhysUnits.hpp"
#include "Quantity.hpp"
#include "UnitSystem.hpp"
#include "UnitTableReader.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

using namespace PhysUnits;

void printHelp() {
    std::cout << "\n";
    std::cout << "PhysUnits Unit Converter\n";
    std::cout << "========================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  unit_converter [--table <file>] <value> <from_units> <to_units>\n";
    std::cout << "  unit_converter [--table <file>] --system <name> <value> <units>\n";
    std::cout << "  unit_converter [--table <file>] --compatible <units>\n";
    std::cout << "  unit_converter [--table <file>] --list\n";
    std::cout << "  unit_converter --help\n\n";
    std::cout << "Compound units are space separated with optional powers,\n";
    std::cout << "quoted on the command line: \"kg m^-1 s^-2\".\n\n";
    std::cout << "Examples:\n";
    std::cout << "  unit_converter 5000 kPa psi\n";
    std::cout << "  unit_converter 100 C F\n";
    std::cout << "  unit_converter 20 delta_C delta_F\n";
    std::cout << "  unit_converter 1 \"kg m^-3\" \"slug ft^-3\"\n";
    std::cout << "  unit_converter --system BT 10 \"kg ft s\"\n";
    std::cout << "  unit_converter --compatible N\n\n";
}

void listUnits(const UnitTable& table) {
    std::cout << "\n";
    std::cout << "Fundamental Units:\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << std::setw(12) << std::left << "Symbol"
              << std::setw(26) << "Dimension"
              << "Factor\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& unit : table.fundamentalUnits()) {
        std::cout << std::setw(12) << std::left << unit.symbol
                  << std::setw(26) << toString(unit.type)
                  << std::scientific << std::setprecision(6) << unit.factor;
        if (unit.offset != 0.0) {
            std::cout << " (offset: " << std::fixed << std::setprecision(2) << unit.offset << ")";
        }
        std::cout << "\n";
    }

    std::cout << "\nDerived Units:\n";
    std::cout << std::string(60, '=') << "\n";
    for (const auto& unit : table.derivedUnits()) {
        std::cout << std::setw(12) << std::left << unit.symbol
                  << std::setw(26) << unit.composition
                  << std::scientific << std::setprecision(6) << unit.factor << "\n";
    }

    std::cout << "\nMultipliers:";
    for (const auto& m : table.multipliers()) {
        std::cout << " " << m.symbol;
    }
    std::cout << "\n\nUnit Systems:";
    for (const auto& name : table.unitSystemNames()) {
        std::cout << " " << name;
    }
    std::cout << "\n\n";
}

void printConversion(const Quantity& input, const Quantity& output) {
    std::cout << "\n";
    std::cout << "Conversion Result:\n";
    std::cout << "==================\n\n";
    std::cout << std::setprecision(10);
    std::cout << "  Input:   " << input.value() << " " << input.units() << "\n";
    std::cout << "  Output:  " << output.value() << " " << output.units() << "\n";
    std::cout << "\n";
    std::cout << std::scientific << std::setprecision(6);
    std::cout << "  SI Base: " << input.siValue() << " " << input.siUnits() << "\n";
    std::cout << "  Type:    " << toString(input.type()) << "\n\n";
}

void printCompatible(const Unit& unit) {
    std::vector<std::string> symbols = unit.compatibleUnits();

    std::cout << "\n";
    std::cout << "Units compatible with '" << unit.name() << "' "
              << unit.dimensions() << ":\n";
    if (symbols.empty()) {
        std::cout << "  (none)\n\n";
        return;
    }
    for (const auto& symbol : symbols) {
        std::cout << "  " << symbol << "\n";
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() || (args.size() == 1 && args[0] == "--help")) {
        printHelp();
        return 0;
    }

    try {
        std::shared_ptr<const UnitTable> table = UnitTable::builtin();

        if (args[0] == "--table") {
            if (args.size() < 2) {
                std::cerr << "Error: --table requires a file name\n";
                return 1;
            }
            UnitTableReader reader;
            if (!reader.loadFile(args[1])) {
                return 1;
            }
            table = reader.buildTable();
            args.erase(args.begin(), args.begin() + 2);
        }

        if (args.size() == 1 && args[0] == "--list") {
            listUnits(*table);
            return 0;
        }

        if (args.size() == 2 && args[0] == "--compatible") {
            printCompatible(Unit(args[1], table));
            return 0;
        }

        if (args.size() == 4 && args[0] == "--system") {
            UnitSystem system(args[1], table);
            Quantity input(std::stod(args[2]), args[3], table);
            printConversion(input, system.convert(input));
            return 0;
        }

        if (args.size() != 3) {
            std::cerr << "Error: Invalid number of arguments\n";
            printHelp();
            return 1;
        }

        Quantity input(std::stod(args[0]), args[1], table);
        printConversion(input, input.to(args[2]));

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid value\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: Value out of range\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
