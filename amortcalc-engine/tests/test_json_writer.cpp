#include <catch2/catch.hpp>
#include "io/json_writer.hpp"
#include "loan_slice.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace amortcalc;
using Catch::Detail::Approx;
using json = nlohmann::json;

TEST_CASE("Table JSON output", "[json]") {
    LoanSlice loan(LoanInfo{0.0, 12}, 1200.0, 1, ExtraPayments{{3, 150.0}});

    SECTION("Pretty printed") {
        std::ostringstream oss;
        io::write_table_json(oss, loan.schedule());
        REQUIRE(oss.str().find('\n') != std::string::npos);

        json j = json::parse(oss.str());
        REQUIRE(j["period_count"] == 12);
        REQUIRE(j["totals"]["paid"].get<double>() == Approx(1350.0));
        REQUIRE(j["totals"]["interest"].get<double>() == Approx(0.0));
        REQUIRE(j["totals"]["extra"].get<double>() == Approx(150.0));

        REQUIRE(j["rows"].size() == 12);
        const json& third = j["rows"][2];
        REQUIRE(third["period"] == 3);
        REQUIRE(third["total_payment"].get<double>() == Approx(100.0));
        REQUIRE(third["extra_payment"].get<double>() == Approx(150.0));
        REQUIRE(third["remaining_balance"].get<double>() == Approx(750.0));
    }

    SECTION("Compact") {
        std::ostringstream oss;
        io::write_table_json(oss, loan.schedule(), false);
        REQUIRE(oss.str().find('\n') == std::string::npos);
        REQUIRE(json::parse(oss.str())["rows"].size() == 12);
    }

    SECTION("Empty table") {
        std::ostringstream oss;
        io::write_table_json(oss, AmortizationTable());
        json j = json::parse(oss.str());
        REQUIRE(j["period_count"] == 0);
        REQUIRE(j["rows"].empty());
    }
}

TEST_CASE("Named tables JSON output", "[json]") {
    std::map<std::string, AmortizationTable> tables{
        {"Alice", LoanSlice(LoanInfo{0.05, 6}, 3000.0).schedule()},
        {"Bob \"B\"", LoanSlice(LoanInfo{0.05, 6}, 1000.0).schedule()}
    };

    std::ostringstream oss;
    io::write_tables_json(oss, tables, "sideloan");

    json j = json::parse(oss.str());
    REQUIRE(j["view"] == "sideloan");
    REQUIRE(j["tables"].size() == 2);
    REQUIRE(j["tables"]["Alice"]["period_count"] == 6);
    REQUIRE(j["tables"]["Bob \"B\""]["rows"].size() == 6);
}

TEST_CASE("JSON output to file", "[json]") {
    const std::string path = "/tmp/amortcalc_test_table.json";
    LoanSlice loan(LoanInfo{0.05, 6}, 3000.0);

    io::write_table_json(path, loan.schedule());

    std::ifstream file(path);
    REQUIRE(file.good());
    json j = json::parse(file);
    REQUIRE(j["rows"].size() == 6);
    file.close();
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(io::write_table_json("/nonexistent/dir/out.json", loan.schedule()),
                      std::runtime_error);
}
