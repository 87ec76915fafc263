#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "measura/v1/parser/sheet_parser.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace measura::v1;
using Catch::Approx;

namespace {

bool has_diagnostic(const std::vector<std::string>& diagnostics, const std::string& code) {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [&](const std::string& d) {
        return d.find(code) != std::string::npos;
    });
}

const std::string kValidSheet = R"(schema: measura-v1
version: 1
options:
  precision: double
  abs_tolerance: 1e-6
measurements:
  - name: dead_load
    dimension: force
    unit: kip
    value: 1.0
    expect: 4448.221615255
  - name: live_load
    dimension: force
    unit: N
    value: 10
  - name: soak
    dimension: time
    unit: hour
    value: 1.5
  - name: ambient
    dimension: temperature
    unit: degR
    value: 540
)";

}  // namespace

TEST_CASE("v1 sheet parser loads a valid sheet", "[v1][yaml][sheet]") {
    parser::SheetParser parser;
    const auto sheet = parser.load_string(kValidSheet);

    REQUIRE(parser.errors().empty());
    REQUIRE(parser.warnings().empty());
    REQUIRE(sheet.options.precision == Precision::Double);
    REQUIRE(sheet.options.abs_tolerance == 1e-6);
    REQUIRE(sheet.measurements.size() == 4);

    const auto& dead = sheet.measurements[0];
    REQUIRE(dead.name == "dead_load");
    REQUIRE(dead.unit == describe(ForceUnit::Kilopound));
    REQUIRE(dead.value == 1.0);
    REQUIRE(dead.expect_base);
    REQUIRE(*dead.expect_base == 4448.221615255);

    REQUIRE(sheet.measurements[2].unit == describe(TimeUnit::Hour));
    REQUIRE_FALSE(sheet.measurements[1].expect_base);
}

TEST_CASE("v1 sheet evaluation", "[v1][yaml][sheet]") {
    parser::SheetParser parser;
    const auto sheet = parser.load_string(kValidSheet);
    REQUIRE(parser.errors().empty());

    const auto result = parser::evaluate(sheet);
    REQUIRE(result.success());
    REQUIRE(result.entries.size() == 4);

    REQUIRE(result.entries[0].base_value == Approx(4448.221615255));
    REQUIRE(result.entries[0].base_unit.symbol == "N");
    REQUIRE(result.entries[0].within_expectation);
    REQUIRE(result.entries[2].base_value == 5400.0);
    REQUIRE(result.entries[3].base_value == Approx(300.0));
    REQUIRE(result.entries[3].base_unit.symbol == "K");

    REQUIRE(result.totals.size() == 3);
    REQUIRE(result.totals.at(DimensionId::Force) == Approx(4458.221615255));
    REQUIRE(result.totals.at(DimensionId::Time) == 5400.0);
    REQUIRE_FALSE(result.totals.contains(DimensionId::Mass));
}

TEST_CASE("v1 sheet evaluation flags failed expectations", "[v1][yaml][sheet]") {
    const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: bag
    dimension: mass
    unit: lb
    value: 1
    expect: 0.5
  - name: coin
    dimension: mass
    unit: g
    value: 5
    expect: 0.005
)";

    parser::SheetParser parser;
    const auto sheet = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());

    const auto result = parser::evaluate(sheet);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.failed_expectations == 1);
    REQUIRE_FALSE(result.entries[0].within_expectation);
    REQUIRE(result.entries[1].within_expectation);
    REQUIRE(result.totals.at(DimensionId::Mass) == Approx(0.45859237));
}

TEST_CASE("v1 sheet single precision", "[v1][yaml][sheet]") {
    const std::string yaml = R"(schema: measura-v1
version: 1
options:
  precision: single
measurements:
  - name: lap
    dimension: time
    unit: min
    value: 2.5
    expect: 150.00001
)";

    parser::SheetParser parser;
    const auto sheet = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    REQUIRE(sheet.options.precision == Precision::Single);
    REQUIRE(sheet.options.abs_tolerance == KernelTraits<float>::default_abstol);

    const auto result = parser::evaluate(sheet);
    REQUIRE(result.success());
    REQUIRE(result.entries[0].base_value == Approx(150.0));
}

TEST_CASE("v1 sheet parser rejects unknown fields in strict mode", "[v1][yaml][sheet][validation]") {
    const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: force
    unit: N
    value: 1
    tolerance: 0.1
)";

    SECTION("Strict") {
        parser::SheetParser parser;
        parser.load_string(yaml);
        REQUIRE(has_diagnostic(parser.errors(), "MEASURA_YAML_E_UNKNOWN_FIELD"));
        REQUIRE(has_diagnostic(parser.errors(), "measurements[0].tolerance"));
    }

    SECTION("Lenient") {
        parser::SheetParser parser(parser::SheetParserOptions{.strict = false});
        const auto sheet = parser.load_string(yaml);
        REQUIRE(parser.errors().empty());
        REQUIRE(sheet.measurements.size() == 1);
    }
}

TEST_CASE("v1 sheet parser unit diagnostics", "[v1][yaml][sheet][validation]") {
    const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: force
    unit: stone
    value: 1
  - name: b
    dimension: force
    unit: kg
    value: 1
  - name: c
    dimension: length
    unit: m
    value: 1
  - name: d
    dimension: mass
    unit: t
    value: 2
)";

    parser::SheetParser parser;
    const auto sheet = parser.load_string(yaml);

    CHECK(has_diagnostic(parser.errors(), "MEASURA_YAML_E_UNIT_UNKNOWN"));
    CHECK(has_diagnostic(parser.errors(), "MEASURA_YAML_E_UNIT_DIMENSION"));
    CHECK(has_diagnostic(parser.errors(), "MEASURA_YAML_E_DIMENSION_UNKNOWN"));
    REQUIRE(parser.errors().size() == 3);
    REQUIRE(sheet.measurements.size() == 1);
    REQUIRE(sheet.measurements[0].name == "d");
}

TEST_CASE("v1 sheet parser value diagnostics", "[v1][yaml][sheet][validation]") {
    SECTION("Unit written into the value") {
        const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: force
    unit: kip
    value: 1.0 kip
)";
        parser::SheetParser parser;
        parser.load_string(yaml);
        REQUIRE(has_diagnostic(parser.errors(), "MEASURA_YAML_E_TYPE_MISMATCH"));
        REQUIRE(has_diagnostic(parser.errors(), "'unit' field"));
    }

    SECTION("Value is not a scalar") {
        const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: force
    unit: N
    value: [1, 2]
)";
        parser::SheetParser parser;
        parser.load_string(yaml);
        REQUIRE(has_diagnostic(parser.errors(), "Expected number at 'measurements[0].value', got sequence"));
    }

    SECTION("Missing required fields") {
        const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: force
)";
        parser::SheetParser parser;
        const auto sheet = parser.load_string(yaml);
        REQUIRE(parser.errors().size() == 2);
        REQUIRE(has_diagnostic(parser.errors(), "measurements[0].unit"));
        REQUIRE(has_diagnostic(parser.errors(), "measurements[0].value"));
        REQUIRE(sheet.measurements.empty());
    }

    SECTION("Non-finite value is a warning") {
        const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: temperature
    unit: K
    value: .inf
)";
        parser::SheetParser parser;
        const auto sheet = parser.load_string(yaml);
        REQUIRE(parser.errors().empty());
        REQUIRE(has_diagnostic(parser.warnings(), "MEASURA_YAML_W_VALUE_NON_FINITE"));
        REQUIRE(std::isinf(sheet.measurements[0].value));
    }

    SECTION("Duplicate names") {
        const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - {name: a, dimension: time, unit: s, value: 1}
  - {name: a, dimension: time, unit: ms, value: 1}
)";
        parser::SheetParser parser;
        const auto sheet = parser.load_string(yaml);
        REQUIRE(has_diagnostic(parser.errors(), "MEASURA_YAML_E_DUPLICATE_NAME"));
        REQUIRE(sheet.measurements.size() == 1);
    }
}

TEST_CASE("v1 sheet parser options diagnostics", "[v1][yaml][sheet][validation]") {
    const std::string yaml = R"(schema: measura-v1
version: 1
options:
  precision: quad
  rel_tolerance: -1
measurements:
  - {name: a, dimension: time, unit: s, value: 1}
)";

    parser::SheetParser parser;
    const auto sheet = parser.load_string(yaml);
    REQUIRE(parser.errors().size() == 2);
    REQUIRE(has_diagnostic(parser.errors(), "Invalid precision 'quad'"));
    REQUIRE(has_diagnostic(parser.errors(), "options.rel_tolerance"));
    REQUIRE(sheet.options.precision == Precision::Double);
}

TEST_CASE("v1 sheet parser header diagnostics", "[v1][yaml][sheet][validation]") {
    SECTION("Missing schema") {
        parser::SheetParser parser;
        parser.load_string("version: 1\n");
        REQUIRE(parser.errors().size() == 1);
        REQUIRE(parser.errors()[0] == "[MEASURA_YAML_E_SCHEMA] Missing required field 'schema'");
    }

    SECTION("Wrong schema") {
        parser::SheetParser parser;
        parser.load_string("schema: pulse-v2\nversion: 1\n");
        REQUIRE(parser.errors()[0] == "[MEASURA_YAML_E_SCHEMA] Unsupported schema: pulse-v2");
    }

    SECTION("Wrong version") {
        parser::SheetParser parser;
        parser.load_string("schema: measura-v1\nversion: 3\n");
        REQUIRE(parser.errors()[0] == "[MEASURA_YAML_E_SCHEMA] Unsupported schema version: 3");
    }

    SECTION("Root is not a map") {
        parser::SheetParser parser;
        parser.load_string("- a\n- b\n");
        REQUIRE(has_diagnostic(parser.errors(), "Expected map at 'root', got sequence"));
    }

    SECTION("Malformed YAML") {
        parser::SheetParser parser;
        parser.load_string("schema: [measura-v1\n");
        REQUIRE(parser.errors().size() == 1);
        REQUIRE(parser.errors()[0].rfind("[MEASURA_YAML_E_SYNTAX] YAML parse error", 0) == 0);
    }

    SECTION("Non-scalar key is a diagnostic, not an exception") {
        parser::SheetParser parser;
        const std::string yaml = "schema: measura-v1\nversion: 1\n[a, b]: 1\nmeasurements: []\n";
        REQUIRE_NOTHROW(parser.load_string(yaml));
        REQUIRE(parser.errors().size() == 1);
        REQUIRE(has_diagnostic(parser.errors(), "MEASURA_YAML_E_TYPE_MISMATCH"));
        REQUIRE(has_diagnostic(parser.errors(), "Expected string key at 'root', got sequence"));
    }

    SECTION("Non-scalar key inside a lenient measurement") {
        parser::SheetParser parser(parser::SheetParserOptions{.strict = false});
        const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: a
    dimension: time
    unit: s
    value: 1
    {x: 1}: 2
)";
        const auto sheet = parser.load_string(yaml);
        REQUIRE(has_diagnostic(parser.errors(), "Expected string key at 'measurements[0]', got map"));
        REQUIRE(sheet.measurements.size() == 1);
    }

    SECTION("Empty sheet warns") {
        parser::SheetParser parser;
        const auto sheet = parser.load_string("schema: measura-v1\nversion: 1\nmeasurements: []\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(has_diagnostic(parser.warnings(), "MEASURA_YAML_W_SHEET_EMPTY"));
        REQUIRE(sheet.measurements.empty());
    }
}

TEST_CASE("v1 sheet parser file loading", "[v1][yaml][sheet]") {
    SECTION("Missing file") {
        parser::SheetParser parser;
        parser.load("/nonexistent/measura/sheet.yaml");
        REQUIRE(parser.errors().size() == 1);
        REQUIRE(parser.errors()[0].rfind("[MEASURA_YAML_E_IO] Cannot open file:", 0) == 0);
    }

    SECTION("From disk") {
        const auto path = std::filesystem::temp_directory_path() / "measura_sheet_parser_test.yaml";
        {
            std::ofstream out(path);
            out << kValidSheet;
        }

        parser::SheetParser parser;
        const auto sheet = parser.load(path);
        std::filesystem::remove(path);

        REQUIRE(parser.errors().empty());
        REQUIRE(sheet.measurements.size() == 4);
    }

    SECTION("Diagnostics are reset between loads") {
        parser::SheetParser parser;
        parser.load_string("version: 1\n");
        REQUIRE_FALSE(parser.errors().empty());
        parser.load_string(kValidSheet);
        REQUIRE(parser.errors().empty());
    }
}

TEST_CASE("v1 sheet evaluation CSV output", "[v1][yaml][sheet][csv]") {
    const std::string yaml = R"(schema: measura-v1
version: 1
measurements:
  - name: plain
    dimension: time
    unit: min
    value: 2
  - name: 'load, "east"'
    dimension: force
    unit: kN
    value: 1.5
)";

    parser::SheetParser parser;
    const auto sheet = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    REQUIRE(sheet.measurements[1].name == "load, \"east\"");

    std::ostringstream out;
    parser::write_csv(out, parser::evaluate(sheet));

    std::istringstream lines(out.str());
    std::string header;
    std::string first;
    std::string second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);

    REQUIRE(header == "name,dimension,unit,value,base_value,base_unit");
    REQUIRE(first == "plain,time,min,2,120,s");
    REQUIRE(second == "\"load, \"\"east\"\"\",force,kN,1.5,1500,N");
}
