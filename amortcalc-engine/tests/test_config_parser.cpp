#include <catch2/catch.hpp>
#include "config_parser.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace amortcalc;
using Catch::Detail::Approx;

#ifndef AMORTCALC_DATA_DIR
#define AMORTCALC_DATA_DIR "../amortcalc-engine/data"
#endif

TEST_CASE("Environment variable expansion", "[config_parser]") {
    SECTION("Expand ${VAR}") {
        setenv("TEST_VAR", "test_value", 1);
        auto result = expand_environment_variables("prefix_${TEST_VAR}_suffix");
        REQUIRE(result == "prefix_test_value_suffix");
        unsetenv("TEST_VAR");
    }

    SECTION("Expand $VAR") {
        setenv("TEST_VAR", "test_value", 1);
        auto result = expand_environment_variables("prefix_$TEST_VAR");
        REQUIRE(result == "prefix_test_value");
        unsetenv("TEST_VAR");
    }

    SECTION("Undefined variable expands to empty string") {
        auto result = expand_environment_variables("${UNDEFINED_VAR}");
        REQUIRE(result == "");
    }

    SECTION("Lone dollar sign is kept") {
        REQUIRE(expand_environment_variables("cost in $ only") == "cost in $ only");
    }

    SECTION("No variables returns original string") {
        auto result = expand_environment_variables("no_variables_here");
        REQUIRE(result == "no_variables_here");
    }
}

TEST_CASE("Relative path resolution", "[config_parser]") {
    REQUIRE(resolve_relative_path("ledger.tsv", "/etc/amortcalc/run.json") ==
            "/etc/amortcalc/ledger.tsv");
    REQUIRE(resolve_relative_path("/var/ledger.tsv", "/etc/amortcalc/run.json") ==
            "/var/ledger.tsv");
}

TEST_CASE("Extra payment mode names", "[config_parser]") {
    REQUIRE(parse_extra_payment_mode("keep_payment") == ExtraPaymentMode::KeepPayment);
    REQUIRE(parse_extra_payment_mode("recast") == ExtraPaymentMode::Recast);
    REQUIRE_THROWS_AS(parse_extra_payment_mode("sometimes"), ConfigParseError);
}

TEST_CASE("JSON config parsing", "[config_parser]") {
    SECTION("Parse minimal loan config") {
        std::string json = R"({
            "loan": {"annual_rate": 0.5, "total_periods": 10},
            "loans": [{"principal": 100000}]
        })";

        auto config = parse_run_config_from_string(json);
        REQUIRE(config.loan_info == (LoanInfo{0.5, 10}));
        REQUIRE(config.mode == ExtraPaymentMode::KeepPayment);
        REQUIRE(config.loans.size() == 1);
        REQUIRE(config.loans[0].name == "loan_0");
        REQUIRE(config.loans[0].principal == 100000.0);
        REQUIRE(config.loans[0].start_period == 1);
        REQUIRE(config.loans[0].extra_payments.empty());
        REQUIRE_FALSE(config.property.has_value());
        REQUIRE(config.output.format == "text");
        REQUIRE(config.output.view == "full");
    }

    SECTION("Parse loans with extra payments") {
        std::string json = R"({
            "description": "Two slices",
            "loan": {"annual_rate": 0.06, "total_periods": 360, "mode": "recast"},
            "loans": [
                {"name": "first", "principal": 200000, "extra_payments": {"0": 40000, "12": 5000}},
                {"name": "second", "principal": 25000, "start_period": 61}
            ],
            "output": {"format": "summary", "combine": true},
            "logging": {"level": "DEBUG", "json": false}
        })";

        auto config = parse_run_config_from_string(json);
        REQUIRE(config.description == "Two slices");
        REQUIRE(config.mode == ExtraPaymentMode::Recast);
        REQUIRE(config.loans.size() == 2);
        REQUIRE(config.loans[0].extra_payments.at(0) == 40000.0);
        REQUIRE(config.loans[0].extra_payments.at(12) == 5000.0);
        REQUIRE(config.loans[1].start_period == 61);
        REQUIRE(config.output.format == "summary");
        REQUIRE(config.output.combine);
        REQUIRE(config.logging.min_level == LogLevel::DEBUG);
        REQUIRE_FALSE(config.logging.enable_json);
        REQUIRE_FALSE(config.logging.enable_file);
    }

    SECTION("Parse property config") {
        setenv("AMORTCALC_TEST_LEDGER", "ledger.tsv", 1);
        std::string json = R"({
            "loan": {"annual_rate": 0.065, "total_periods": 360},
            "property": {
                "purchase_cost": 500000,
                "purchase_down_payment": 100000,
                "stakeholders": [
                    {"name": "Alice", "ledger_strings": ["ALICE"], "exclusion_amount": 20},
                    {"name": "Bob", "ledger_strings": ["BOB"], "ledger_exclusions": ["refund"]},
                    {"name": "Joint", "role": "Common Party"}
                ],
                "stakeholder_down_payments": {"Alice": 50000, "Bob": 50000}
            },
            "ledger": {
                "path": "${AMORTCALC_TEST_LEDGER}",
                "first_period": "03/01/2025",
                "mutual_income_strings": ["RENT"],
                "advance_after": true
            },
            "output": {"view": "sideloan", "format": "json", "path": "out/result.json"}
        })";

        auto config = parse_run_config_from_string(json);
        unsetenv("AMORTCALC_TEST_LEDGER");

        REQUIRE(config.loans.empty());
        REQUIRE(config.property.has_value());
        const PropertyConfig& property = *config.property;
        REQUIRE(property.purchase_cost == 500000.0);
        REQUIRE(property.stakeholders.size() == 3);
        REQUIRE(property.stakeholders[0].role == "Stakeholder");
        REQUIRE(property.stakeholders[0].exclusion_amount.has_value());
        REQUIRE(*property.stakeholders[0].exclusion_amount == Approx(20.0));
        REQUIRE(property.stakeholders[1].ledger_exclusions == std::vector<std::string>{"refund"});
        REQUIRE_FALSE(property.stakeholders[1].exclusion_amount.has_value());
        REQUIRE(property.stakeholders[2].is_common_party());
        REQUIRE(property.stakeholder_down_payments.at("Bob") == 50000.0);

        REQUIRE(config.ledger.has_value());
        REQUIRE(config.ledger->path == "ledger.tsv");
        REQUIRE(config.ledger->first_period == "03/01/2025");
        REQUIRE(config.ledger->mutual_income_strings.size() == 1);
        REQUIRE(config.ledger->advance_after);
        REQUIRE(config.ledger->delimiter == '\t');

        REQUIRE(config.output.view == "sideloan");
        REQUIRE(config.output.format == "json");
        REQUIRE(config.output.path == "out/result.json");
    }

    SECTION("Missing loan field should fail") {
        std::string json = R"({"loans": [{"principal": 1000}]})";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Missing principal should fail") {
        std::string json = R"({
            "loan": {"annual_rate": 0.05, "total_periods": 12},
            "loans": [{"name": "a"}]
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Wrong field type should fail") {
        std::string json = R"({
            "loan": {"annual_rate": "five percent", "total_periods": 12},
            "loans": [{"principal": 1000}]
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Non-integer extra payment period should fail") {
        std::string json = R"({
            "loan": {"annual_rate": 0.05, "total_periods": 12},
            "loans": [{"principal": 1000, "extra_payments": {"five": 10}}]
        })";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }

    SECTION("Invalid JSON should fail") {
        std::string json = "not valid json";
        REQUIRE_THROWS_AS(parse_run_config_from_string(json), ConfigParseError);
    }
}

TEST_CASE("Run config validation", "[config_parser]") {
    RunConfig config;
    config.loan_info = LoanInfo{0.05, 12};
    LoanConfig loan;
    loan.name = "a";
    loan.principal = 1000.0;
    config.loans.push_back(loan);

    SECTION("Valid loan config passes") {
        REQUIRE_NOTHROW(validate_run_config(config));
    }

    SECTION("Non-positive term fails") {
        config.loan_info.total_periods = 0;
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Neither loans nor property fails") {
        config.loans.clear();
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Both loans and property fails") {
        PropertyConfig property;
        property.purchase_cost = 1000.0;
        property.stakeholders.push_back(Party("Alice", "Stakeholder"));
        config.property = property;
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Duplicate loan names fail") {
        config.loans.push_back(loan);
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Start period below 1 fails") {
        config.loans[0].start_period = 0;
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Down payment and later extra payments pass") {
        config.loans[0].extra_payments[0] = 100.0;
        config.loans[0].extra_payments[6] = 50.0;
        REQUIRE_NOTHROW(validate_run_config(config));
    }

    SECTION("Negative extra payment period fails") {
        config.loans[0].extra_payments[-1] = 10.0;
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Ledger without property fails") {
        config.ledger = LedgerConfig();
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Unknown output format fails") {
        config.output.format = "xml";
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Unknown view fails") {
        config.output.view = "nominal";
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);
    }

    SECTION("Property checks") {
        config.loans.clear();
        PropertyConfig property;
        property.purchase_cost = 1000.0;
        property.stakeholders = {Party("Alice", "Stakeholder"), Party("Alice", "Stakeholder")};
        config.property = property;
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);

        config.property->stakeholders = {Party("Joint", kCommonPartyRole)};
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);

        config.property->stakeholders = {Party("Alice", "Stakeholder")};
        config.property->purchase_down_payment = 2000.0;
        REQUIRE_THROWS_AS(validate_run_config(config), ConfigParseError);

        config.property->purchase_down_payment = 200.0;
        REQUIRE_NOTHROW(validate_run_config(config));
    }
}

TEST_CASE("Config file parsing", "[config_parser]") {
    SECTION("Sample property config resolves paths next to the file") {
        const std::string path = std::string(AMORTCALC_DATA_DIR) + "/sample_property.json";
        auto config = parse_run_config_from_file(path);

        REQUIRE(config.property.has_value());
        REQUIRE(config.ledger.has_value());
        const std::filesystem::path expected =
            std::filesystem::path(AMORTCALC_DATA_DIR) / "sample_ledger.tsv";
        REQUIRE(config.ledger->path == expected.string());
    }

    SECTION("Missing file should fail") {
        REQUIRE_THROWS_AS(parse_run_config_from_file("/nonexistent/run.json"), ConfigParseError);
    }

    SECTION("Written config round-trips through the file parser") {
        const std::string path = "/tmp/amortcalc_test_config.json";
        {
            std::ofstream file(path);
            file << R"({
                "loan": {"annual_rate": 0.04, "total_periods": 24},
                "loans": [{"name": "car", "principal": 18000}],
                "output": {"path": "car.txt"},
                "logging": {"file": "run.log"}
            })";
        }

        auto config = parse_run_config_from_file(path);
        REQUIRE(config.loans[0].name == "car");
        REQUIRE(config.output.path == "/tmp/car.txt");
        REQUIRE(config.logging.enable_file);
        REQUIRE(config.logging.log_file_path == "/tmp/run.log");

        std::remove(path.c_str());
    }
}
