#include <CLI/CLI.hpp>
#include <measura/v1/core.hpp>
#include <measura/v1/parser/sheet_parser.hpp>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace measura::v1;

namespace {

void print_diagnostics(const parser::SheetParser& sheet_parser, bool quiet) {
    for (const auto& err : sheet_parser.errors()) {
        std::cerr << "Error: " << err << std::endl;
    }
    if (!quiet) {
        for (const auto& warn : sheet_parser.warnings()) {
            std::cerr << "Warning: " << warn << std::endl;
        }
    }
}

std::optional<UnitDescriptor> resolve_unit(DimensionId dimension, const std::string& key) {
    const auto unit = UnitCatalog::instance().find(dimension, key);
    if (!unit) {
        std::cerr << "Error: " << to_string(unit.error) << ": '" << key << "' is not a "
                  << to_string(dimension) << " unit" << std::endl;
        return std::nullopt;
    }
    return *unit;
}

void write_csv_file(const parser::SheetEvaluation& result, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    parser::write_csv(file, result);
}

int cmd_convert(double value, const std::string& dimension_text, const std::string& unit_text,
                const std::string& target_text, bool verbose) {
    const auto dimension = UnitCatalog::parse_dimension(dimension_text);
    if (!dimension) {
        std::cerr << "Error: unknown dimension '" << dimension_text << "'" << std::endl;
        return 1;
    }

    const auto from = resolve_unit(*dimension, unit_text);
    if (!from) return 1;

    const auto& catalog = UnitCatalog::instance();
    UnitDescriptor to = catalog.base_of(*dimension);
    if (!target_text.empty()) {
        const auto target = resolve_unit(*dimension, target_text);
        if (!target) return 1;
        to = *target;
    }

    const double base = UnitCatalog::to_base(*from, value);
    const double result = UnitCatalog::from_base(to, base);

    if (verbose) {
        std::cerr << "  " << from->name << " -> " << catalog.base_of(*dimension).name
                  << " factor " << from->factor << std::endl;
    }
    std::cout << std::setprecision(15) << result << " " << to.symbol << std::endl;
    return 0;
}

int cmd_units(const std::string& dimension_text) {
    const auto& catalog = UnitCatalog::instance();
    std::optional<DimensionId> only;
    if (!dimension_text.empty()) {
        const auto d = UnitCatalog::parse_dimension(dimension_text);
        if (!d) {
            std::cerr << "Error: unknown dimension '" << dimension_text << "'" << std::endl;
            return 1;
        }
        only = *d;
    }

    for (const DimensionId d : all_dimensions) {
        if (only && *only != d) continue;
        std::cout << to_string(d) << ":" << std::endl;
        for (const auto& u : catalog.units(d)) {
            std::cout << "  " << std::left << std::setw(6) << u.symbol << std::setw(14) << u.name
                      << std::setprecision(15) << u.factor << (u.is_base ? "  (base)" : "") << std::endl;
        }
    }
    return 0;
}

int cmd_sheet(const std::string& sheet_file, const std::string& output_file, bool verbose, bool quiet) {
    try {
        if (!quiet) {
            std::cerr << "Reading sheet: " << sheet_file << std::endl;
        }

        parser::SheetParser sheet_parser;
        const auto sheet = sheet_parser.load(sheet_file);
        print_diagnostics(sheet_parser, quiet);
        if (!sheet_parser.errors().empty()) {
            return 1;
        }

        if (verbose) {
            std::cerr << "Sheet loaded:" << std::endl;
            std::cerr << "  Measurements: " << sheet.measurements.size() << std::endl;
            std::cerr << "  Precision: " << to_string(sheet.options.precision) << std::endl;
            std::cerr << "  abs_tolerance: " << sheet.options.abs_tolerance << std::endl;
            std::cerr << "  rel_tolerance: " << sheet.options.rel_tolerance << std::endl;
        }

        const auto result = parser::evaluate(sheet);

        for (const auto& e : result.entries) {
            if (!e.within_expectation) {
                std::cerr << "Expectation failed: " << e.name << " = " << e.base_value << " "
                          << e.base_unit.symbol << std::endl;
            }
        }

        if (!output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing results to: " << output_file << std::endl;
            }
            write_csv_file(result, output_file);
        } else {
            std::cout << std::setprecision(15);
            for (const auto& e : result.entries) {
                std::cout << e.name << ": " << e.value << " " << e.unit.symbol << " = "
                          << e.base_value << " " << e.base_unit.symbol << std::endl;
            }
        }

        if (!quiet) {
            std::cerr << "Totals:" << std::endl;
            for (const auto& [dimension, total] : result.totals) {
                std::cerr << "  " << to_string(dimension) << ": " << total << " "
                          << UnitCatalog::instance().base_of(dimension).symbol << std::endl;
            }
        }

        return result.success() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& sheet_file, bool verbose) {
    parser::SheetParser sheet_parser;
    const auto sheet = sheet_parser.load(sheet_file);
    print_diagnostics(sheet_parser, false);

    if (!sheet_parser.errors().empty()) {
        std::cerr << "Validation failed with " << sheet_parser.errors().size() << " error(s)" << std::endl;
        return 1;
    }

    std::cout << "Sheet is valid" << std::endl;
    if (verbose) {
        std::cout << "  Measurements: " << sheet.measurements.size() << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"Measura - type-safe units of measure"};
    app.set_version_flag("-V,--version", "Measura 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Convert command
    auto* convert_cmd = app.add_subcommand("convert", "Convert a value to the base unit or another unit");
    double value = 0.0;
    std::string dimension;
    std::string unit;
    std::string target;
    convert_cmd->add_option("value", value, "Magnitude")->required();
    convert_cmd->add_option("dimension", dimension, "force | temperature | time | mass")->required();
    convert_cmd->add_option("unit", unit, "Unit symbol or name")->required();
    convert_cmd->add_option("--to", target, "Target unit (default: base unit)");
    convert_cmd->callback([&]() {
        std::exit(cmd_convert(value, dimension, unit, target, verbose));
    });

    // Units command
    auto* units_cmd = app.add_subcommand("units", "List declared units");
    std::string units_dimension;
    units_cmd->add_option("dimension", units_dimension, "Restrict to one dimension");
    units_cmd->callback([&]() {
        std::exit(cmd_units(units_dimension));
    });

    // Sheet command
    auto* sheet_cmd = app.add_subcommand("sheet", "Evaluate a measurement sheet");
    std::string sheet_file;
    std::string output_file;
    sheet_cmd->add_option("sheet", sheet_file, "Measurement sheet (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    sheet_cmd->add_option("-o,--output", output_file, "Output file (CSV)");
    sheet_cmd->callback([&]() {
        std::exit(cmd_sheet(sheet_file, output_file, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate a measurement sheet");
    std::string validate_file;
    validate_cmd->add_option("sheet", validate_file, "Measurement sheet (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, verbose));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
