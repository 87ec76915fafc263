#pragma once

#include "measura/v1/numeric_kernel.hpp"
#include "measura/v1/unit_catalog.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace measura::v1::parser {

struct SheetOptions {
    Precision precision = Precision::Double;
    double abs_tolerance = KernelTraits<double>::default_abstol;
    double rel_tolerance = KernelTraits<double>::default_reltol;
};

struct Measurement {
    std::string name;
    UnitDescriptor unit;
    double value = 0.0;
    std::optional<double> expect_base;  // expected base-unit magnitude
};

struct MeasurementSheet {
    SheetOptions options;
    std::vector<Measurement> measurements;
};

struct EvaluatedMeasurement {
    std::string name;
    UnitDescriptor unit;
    UnitDescriptor base_unit;
    double value = 0.0;
    double base_value = 0.0;
    bool within_expectation = true;
};

struct SheetEvaluation {
    std::vector<EvaluatedMeasurement> entries;
    std::map<DimensionId, double> totals;   // base units, only dimensions present
    std::size_t failed_expectations = 0;

    [[nodiscard]] bool success() const { return failed_expectations == 0; }
};

struct SheetParserOptions {
    bool strict = true;   // Fail on unknown fields
};

class SheetParser {
public:
    explicit SheetParser(SheetParserOptions options = {});

    // Parse from file
    MeasurementSheet load(const std::filesystem::path& path);

    // Parse from string
    MeasurementSheet load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    SheetParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, MeasurementSheet& sheet);
};

/// Convert every entry through its typed quantity family, in the kernel
/// selected by sheet.options.precision, and total each dimension.
SheetEvaluation evaluate(const MeasurementSheet& sheet);

/// CSV with header name,dimension,unit,value,base_value,base_unit. Names are
/// quoted when they contain a comma, quote or line break (RFC 4180).
void write_csv(std::ostream& out, const SheetEvaluation& result);

}  // namespace measura::v1::parser
