#include "measura/v1/parser/sheet_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace measura::v1::parser {

namespace {

constexpr const char* kSchemaId = "measura-v1";
constexpr const char* kDiagUnknownField = "MEASURA_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "MEASURA_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagUnknownDimension = "MEASURA_YAML_E_DIMENSION_UNKNOWN";
constexpr const char* kDiagUnknownUnit = "MEASURA_YAML_E_UNIT_UNKNOWN";
constexpr const char* kDiagUnitDimension = "MEASURA_YAML_E_UNIT_DIMENSION";
constexpr const char* kDiagDuplicateName = "MEASURA_YAML_E_DUPLICATE_NAME";
constexpr const char* kDiagMissingField = "MEASURA_YAML_E_MISSING_FIELD";
constexpr const char* kDiagInvalidOption = "MEASURA_YAML_E_OPTION_INVALID";
constexpr const char* kDiagNonFinite = "MEASURA_YAML_W_VALUE_NON_FINITE";
constexpr const char* kDiagEmptySheet = "MEASURA_YAML_W_SHEET_EMPTY";
constexpr const char* kDiagIo = "MEASURA_YAML_E_IO";
constexpr const char* kDiagSyntax = "MEASURA_YAML_E_SYNTAX";
constexpr const char* kDiagSchema = "MEASURA_YAML_E_SCHEMA";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "undefined";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& node) {
    push_error(errors, kDiagTypeMismatch,
               "Expected " + expected + " at '" + path + "', got " + yaml_node_class(node));
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   bool strict) {
    if (!node || !node.IsMap()) return;
    for (const auto& it : node) {
        if (!it.first.IsScalar()) {
            push_type_mismatch_error(errors, context, "string key", it.first);
            continue;
        }
        const std::string& key = it.first.Scalar();
        if (strict && allowed.find(key) == allowed.end()) {
            push_error(errors, kDiagUnknownField, "Unknown field at '" + context + "." + key + "'");
        }
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
    return node.Scalar();
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
}

/// Plain decimal or scientific notation. Unit suffixes are rejected: the unit
/// belongs in the 'unit' field.
std::optional<double> parse_real(const YAML::Node& node,
                                 const std::string& path,
                                 std::vector<std::string>& errors) {
    if (!node || node.IsNull() || !node.IsScalar()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }

    const std::string& raw = node.Scalar();
    // YAML 1.2 spellings of the special values
    if (raw == ".inf" || raw == ".Inf" || raw == ".INF" || raw == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (raw == "-.inf" || raw == "-.Inf" || raw == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (raw == ".nan" || raw == ".NaN" || raw == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    char* end = nullptr;
    const double value = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
    std::string rest(end);
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) {
        rest.pop_back();
    }
    if (!rest.empty()) {
        push_error(errors, kDiagTypeMismatch,
                   "Trailing text '" + rest + "' after number at '" + path +
                       "'; put the unit in the 'unit' field");
        return std::nullopt;
    }
    return value;
}

void parse_options(const YAML::Node& node, SheetOptions& options,
                   std::vector<std::string>& errors, bool strict) {
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, "options", "map", node);
        return;
    }
    validate_keys(node, {"precision", "abs_tolerance", "rel_tolerance"}, "options", errors, strict);

    if (const auto precision = parse_string_scalar(node["precision"], "options.precision", errors)) {
        if (*precision == "double") {
            options.precision = Precision::Double;
        } else if (*precision == "single") {
            options.precision = Precision::Single;
            options.abs_tolerance = KernelTraits<float>::default_abstol;
            options.rel_tolerance = KernelTraits<float>::default_reltol;
        } else {
            push_error(errors, kDiagInvalidOption,
                       "Invalid precision '" + *precision + "' (expected 'double' or 'single')");
        }
    }

    if (node["abs_tolerance"]) {
        if (const auto v = parse_real(node["abs_tolerance"], "options.abs_tolerance", errors)) {
            if (*v < 0.0 || !std::isfinite(*v)) {
                push_error(errors, kDiagInvalidOption, "options.abs_tolerance must be finite and >= 0");
            } else {
                options.abs_tolerance = *v;
            }
        }
    }
    if (node["rel_tolerance"]) {
        if (const auto v = parse_real(node["rel_tolerance"], "options.rel_tolerance", errors)) {
            if (*v < 0.0 || !std::isfinite(*v)) {
                push_error(errors, kDiagInvalidOption, "options.rel_tolerance must be finite and >= 0");
            } else {
                options.rel_tolerance = *v;
            }
        }
    }
}

std::optional<Measurement> parse_measurement(const YAML::Node& node,
                                             const std::string& path,
                                             std::vector<std::string>& errors,
                                             std::vector<std::string>& warnings,
                                             bool strict) {
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, path, "map", node);
        return std::nullopt;
    }
    validate_keys(node, {"name", "dimension", "unit", "value", "expect"}, path, errors, strict);

    bool complete = true;
    for (const char* field : {"name", "dimension", "unit", "value"}) {
        if (!node[field]) {
            push_error(errors, kDiagMissingField, "Missing required field '" + path + "." + field + "'");
            complete = false;
        }
    }
    if (!complete) {
        return std::nullopt;
    }

    const auto name = parse_string_scalar(node["name"], path + ".name", errors);
    const auto dimension_text = parse_string_scalar(node["dimension"], path + ".dimension", errors);
    const auto unit_text = parse_string_scalar(node["unit"], path + ".unit", errors);
    const auto value = parse_real(node["value"], path + ".value", errors);
    if (!name || !dimension_text || !unit_text || !value) {
        return std::nullopt;
    }

    const auto& catalog = UnitCatalog::instance();
    const auto dimension = UnitCatalog::parse_dimension(*dimension_text);
    if (!dimension) {
        push_error(errors, kDiagUnknownDimension,
                   "Unknown dimension '" + *dimension_text + "' at '" + path + ".dimension'");
        return std::nullopt;
    }

    const auto unit = catalog.find(*dimension, *unit_text);
    if (!unit) {
        if (unit.error == CatalogError::DimensionMismatch) {
            push_error(errors, kDiagUnitDimension,
                       "Unit '" + *unit_text + "' at '" + path + ".unit' is not a " +
                           std::string(to_string(*dimension)) + " unit");
        } else {
            push_error(errors, kDiagUnknownUnit,
                       "Unknown " + std::string(to_string(*dimension)) + " unit '" + *unit_text +
                           "' at '" + path + ".unit'");
        }
        return std::nullopt;
    }

    if (!std::isfinite(*value)) {
        push_warning(warnings, kDiagNonFinite, "Non-finite value at '" + path + ".value'");
    }

    Measurement m;
    m.name = *name;
    m.unit = *unit;
    m.value = *value;
    if (node["expect"]) {
        const auto expect = parse_real(node["expect"], path + ".expect", errors);
        if (!expect) {
            return std::nullopt;
        }
        m.expect_base = *expect;
    }
    return m;
}

std::string csv_field(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (const char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

template<NumericKernel T>
SheetEvaluation evaluate_with(const MeasurementSheet& sheet) {
    const auto& catalog = UnitCatalog::instance();
    SheetEvaluation out;
    std::map<DimensionId, T> totals;

    for (const auto& m : sheet.measurements) {
        EvaluatedMeasurement e;
        e.name = m.name;
        e.unit = m.unit;
        e.base_unit = catalog.base_of(m.unit.dimension);
        e.value = m.value;

        T& running = totals[m.unit.dimension];
        dispatch_dimension<T>(m.unit.dimension, [&](auto family) {
            using Q = typename decltype(family)::type;
            const auto q = make_quantity<Q>(m.unit, kernel_constant<T>(m.value));
            if (!q) {
                throw std::invalid_argument("Measurement '" + m.name + "' has an inconsistent unit descriptor");
            }
            e.base_value = static_cast<double>(q->to_base_unit());
            running = (Q::from_base_unit(running) + *q).to_base_unit();
            if (m.expect_base) {
                const Q expected = Q::from_base_unit(kernel_constant<T>(*m.expect_base));
                e.within_expectation = approx_equal(*q, expected, sheet.options.abs_tolerance,
                                                    sheet.options.rel_tolerance);
            }
        });

        if (!e.within_expectation) {
            ++out.failed_expectations;
        }
        out.entries.push_back(std::move(e));
    }

    for (const auto& [dimension, total] : totals) {
        out.totals[dimension] = static_cast<double>(total);
    }
    return out;
}

}  // namespace

SheetParser::SheetParser(SheetParserOptions options)
    : options_(options) {}

MeasurementSheet SheetParser::load(const std::filesystem::path& path) {
    errors_.clear();
    warnings_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        push_error(errors_, kDiagIo, "Cannot open file: " + path.string());
        return MeasurementSheet{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

MeasurementSheet SheetParser::load_string(const std::string& content) {
    MeasurementSheet sheet;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, sheet);
    return sheet;
}

void SheetParser::parse_yaml(const std::string& content, MeasurementSheet& sheet) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        push_error(errors_, kDiagSyntax, std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root || !root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "options", "measurements"}, "root", errors_, options_.strict);

    if (!root["schema"]) {
        push_error(errors_, kDiagSchema, "Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        push_error(errors_, kDiagSchema, "Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        push_error(errors_, kDiagSchema, "Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        push_error(errors_, kDiagSchema, "Unsupported schema version: " + std::to_string(*version));
        return;
    }

    if (root["options"]) {
        parse_options(root["options"], sheet.options, errors_, options_.strict);
    }

    const YAML::Node list = root["measurements"];
    if (!list || list.IsNull() || (list.IsSequence() && list.size() == 0)) {
        push_warning(warnings_, kDiagEmptySheet, "Sheet has no measurements");
        return;
    }
    if (!list.IsSequence()) {
        push_type_mismatch_error(errors_, "measurements", "sequence", list);
        return;
    }

    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const std::string path = "measurements[" + std::to_string(i) + "]";
        auto m = parse_measurement(list[i], path, errors_, warnings_, options_.strict);
        if (!m) {
            continue;
        }
        if (!seen.insert(m->name).second) {
            push_error(errors_, kDiagDuplicateName, "Duplicate measurement name '" + m->name + "' at '" + path + "'");
            continue;
        }
        sheet.measurements.push_back(std::move(*m));
    }
}

SheetEvaluation evaluate(const MeasurementSheet& sheet) {
    switch (sheet.options.precision) {
        case Precision::Single:
            return evaluate_with<RealS>(sheet);
        case Precision::Double:
            break;
    }
    return evaluate_with<RealD>(sheet);
}

void write_csv(std::ostream& out, const SheetEvaluation& result) {
    const auto precision = out.precision(17);
    out << "name,dimension,unit,value,base_value,base_unit\n";
    for (const auto& e : result.entries) {
        out << csv_field(e.name) << ',' << to_string(e.unit.dimension) << ',' << e.unit.symbol << ','
            << e.value << ',' << e.base_value << ',' << e.base_unit.symbol << "\n";
    }
    out.precision(precision);
}

}  // namespace measura::v1::parser
