#include <catch2/catch.hpp>
#include "schedule.hpp"
#include <stdexcept>

using namespace amortcalc;
using Catch::Detail::Approx;

namespace {

AmortizationTable make_table(std::initializer_list<double> payments) {
    std::vector<ScheduleEntry> rows;
    int period = 1;
    for (double payment : payments) {
        rows.push_back(ScheduleEntry{period, payment, payment * 0.75, payment * 0.25, 0.0,
                                     1000.0 - period * 10.0});
        ++period;
    }
    return AmortizationTable(std::move(rows));
}

} // anonymous namespace

// ============================================================================
// ScheduleEntry Tests
// ============================================================================

TEST_CASE("zero_entry keeps only the period number", "[schedule]") {
    ScheduleEntry entry = zero_entry(7);
    REQUIRE(entry.period == 7);
    REQUIRE(entry.total_payment == 0.0);
    REQUIRE(entry.principal == 0.0);
    REQUIRE(entry.interest == 0.0);
    REQUIRE(entry.extra_payment == 0.0);
    REQUIRE(entry.remaining_balance == 0.0);
}

TEST_CASE("ScheduleEntry equality is exact", "[schedule]") {
    ScheduleEntry a{1, 100.0, 80.0, 20.0, 0.0, 900.0};
    ScheduleEntry b = a;
    REQUIRE(a == b);

    b.remaining_balance += 1e-9;
    REQUIRE(a != b);
}

// ============================================================================
// AmortizationTable Tests
// ============================================================================

TEST_CASE("AmortizationTable construction", "[schedule]") {
    SECTION("Empty table") {
        AmortizationTable table;
        REQUIRE(table.empty());
        REQUIRE(table.size() == 0);
        REQUIRE_THROWS_AS(table.front(), std::out_of_range);
        REQUIRE_THROWS_AS(table.back(), std::out_of_range);
    }

    SECTION("Strictly increasing periods are accepted") {
        AmortizationTable table({zero_entry(1), zero_entry(2), zero_entry(5)});
        REQUIRE(table.size() == 3);
        REQUIRE(table.front().period == 1);
        REQUIRE(table.back().period == 5);
    }

    SECTION("Duplicate periods are rejected") {
        REQUIRE_THROWS_AS(AmortizationTable({zero_entry(1), zero_entry(1)}), std::invalid_argument);
    }

    SECTION("Decreasing periods are rejected") {
        REQUIRE_THROWS_AS(AmortizationTable({zero_entry(2), zero_entry(1)}), std::invalid_argument);
    }
}

TEST_CASE("AmortizationTable lookup by period", "[schedule]") {
    AmortizationTable table({zero_entry(1), zero_entry(3), zero_entry(4)});

    REQUIRE(table.find(3) != nullptr);
    REQUIRE(table.find(3)->period == 3);
    REQUIRE(table.find(2) == nullptr);
    REQUIRE(table.find(0) == nullptr);
    REQUIRE(table.find(5) == nullptr);

    REQUIRE(table.at_period(4).period == 4);
    REQUIRE_THROWS_AS(table.at_period(2), std::out_of_range);
}

TEST_CASE("AmortizationTable totals", "[schedule]") {
    AmortizationTable table({
        ScheduleEntry{1, 100.0, 90.0, 10.0, 50.0, 860.0},
        ScheduleEntry{2, 100.0, 95.0, 5.0, 0.0, 765.0}
    });

    REQUIRE(table.total_paid() == Approx(250.0));
    REQUIRE(table.total_interest() == Approx(15.0));
    REQUIRE(table.total_extra() == Approx(50.0));
}

TEST_CASE("compare_cash_flows", "[schedule]") {
    AmortizationTable base = make_table({100.0, 100.0, 100.0});

    SECTION("Identical tables agree") {
        REQUIRE(base.compare_cash_flows(base).empty());
    }

    SECTION("Differences within tolerance are ignored") {
        std::vector<ScheduleEntry> rows = base.entries();
        rows[1].total_payment += 1e-9;
        REQUIRE(base.compare_cash_flows(AmortizationTable(rows)).empty());
    }

    SECTION("Balance and extra payment columns are not compared") {
        std::vector<ScheduleEntry> rows = base.entries();
        rows[0].remaining_balance = -5.0;
        rows[2].extra_payment = 123.0;
        REQUIRE(base.compare_cash_flows(AmortizationTable(rows)).empty());
    }

    SECTION("Payment differences are reported per row") {
        std::vector<ScheduleEntry> rows = base.entries();
        rows[1].total_payment = 110.0;
        rows[1].interest = 30.0;

        auto mismatches = base.compare_cash_flows(AmortizationTable(rows));
        REQUIRE(mismatches.size() == 1);
        REQUIRE(mismatches[0].find("Row 2 mismatch") != std::string::npos);
        REQUIRE(mismatches[0].find("Total Payment: Expected 100.00, got 110.00") != std::string::npos);
        REQUIRE(mismatches[0].find("Interest: Expected 25.00, got 30.00") != std::string::npos);
        REQUIRE(mismatches[0].find("Principal") == std::string::npos);
    }

    SECTION("Row count mismatch is reported") {
        AmortizationTable shorter = make_table({100.0, 100.0});
        auto mismatches = base.compare_cash_flows(shorter);
        REQUIRE(mismatches.size() == 1);
        REQUIRE(mismatches[0] == "Row count mismatch -> Expected 3, got 2");
    }
}

TEST_CASE("payment_ranges groups equal consecutive payments", "[schedule]") {
    SECTION("Empty table has no ranges") {
        REQUIRE(AmortizationTable().payment_ranges().empty());
    }

    SECTION("Single run") {
        auto ranges = make_table({100.0, 100.0, 100.0}).payment_ranges();
        REQUIRE(ranges.size() == 1);
        REQUIRE(ranges[0].first == 0);
        REQUIRE(ranges[0].last == 2);
        REQUIRE(ranges[0].length() == 3);
    }

    SECTION("Several runs") {
        auto ranges = make_table({0.0, 0.0, 100.0, 100.0, 100.0, 80.0}).payment_ranges();
        REQUIRE(ranges.size() == 3);
        REQUIRE(ranges[0].first == 0);
        REQUIRE(ranges[0].last == 1);
        REQUIRE(ranges[1].first == 2);
        REQUIRE(ranges[1].last == 4);
        REQUIRE(ranges[2].first == 5);
        REQUIRE(ranges[2].length() == 1);
    }
}
