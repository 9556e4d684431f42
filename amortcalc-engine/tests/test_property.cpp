#include <catch2/catch.hpp>
#include "property.hpp"

using namespace amortcalc;
using Catch::Detail::Approx;

namespace {

const LoanInfo kLoanInfo{0.06, 12};

PropertyParams make_params(std::map<std::string, double> down_payments = {}) {
    PropertyParams params{
        200000.0,
        40000.0,
        kLoanInfo,
        {Party("Alice", "Stakeholder"), Party("Bob", "Stakeholder"),
         Party("Joint Account", kCommonPartyRole)},
        std::move(down_payments)
    };
    return params;
}

// Every stakeholder pays the adjusted schedule's amount for the current period
void pay_all_scheduled(Property& property) {
    const int period = property.current_period();
    for (const std::string& name : property.stakeholder_names()) {
        double amount = property.tranche(name).adjusted().payment_for_period(period).total_payment;
        property.accept_payment(name, amount, period);
    }
    property.advance_period();
}

} // anonymous namespace

TEST_CASE("Property splits cost and debt evenly", "[property]") {
    Property property(make_params());

    REQUIRE(property.stakeholder_names() == std::vector<std::string>{"Alice", "Bob"});
    REQUIRE(property.has_stakeholder("Alice"));
    REQUIRE_FALSE(property.has_stakeholder("Joint Account"));
    REQUIRE(property.common_fund().name == kCommonFundName);
    REQUIRE(property.common_fund().is_common_party());
    REQUIRE(property.loan_info() == kLoanInfo);
    REQUIRE(property.current_period() == 0);

    for (const auto& [name, tranche] : property.tranches()) {
        REQUIRE(tranche.type() == TrancheType::Flexible);
        REQUIRE(tranche.baseline().principal() == Approx(100000.0));
        REQUIRE(tranche.nominal().principal() == Approx(80000.0));
        REQUIRE(tranche.parties().common_party.name == kCommonFundName);
    }

    REQUIRE(property.total_stake_allocated() == Approx(160000.0));
}

TEST_CASE("Property requires stakeholders", "[property]") {
    PropertyParams params = make_params();
    params.stakeholders = {Party("Joint Account", kCommonPartyRole)};
    REQUIRE_THROWS_AS(Property(params), std::invalid_argument);
}

TEST_CASE("Stakeholder down payments are accepted at period 0", "[property]") {
    Property property(make_params({{"Alice", 20000.0}, {"Bob", 20000.0}, {"Carol", 5000.0}}));

    REQUIRE(property.tranche("Alice").pending_payments().size() == 1);
    REQUIRE(property.tranche("Bob").pending_payments().size() == 1);

    property.advance_period();
    REQUIRE(property.current_period() == 1);

    for (const auto& [name, tranche] : property.tranches()) {
        REQUIRE(tranche.adjusted().principal() == Approx(80000.0));
    }

    SECTION("Matching down payments leave no side loans") {
        AmortizationTable sideloan = property.combined_schedule(TableView::Sideloan);
        REQUIRE(sideloan.size() == 12);
        for (const ScheduleEntry& entry : sideloan) {
            REQUIRE(entry.remaining_balance == Approx(0.0).margin(1e-6));
        }
    }

    SECTION("Combined full schedule amortizes the real mortgage") {
        AmortizationTable full = property.combined_schedule(TableView::Full);
        LoanSlice mortgage(kLoanInfo, 160000.0);
        REQUIRE(full.compare_cash_flows(mortgage.schedule()).empty());
    }
}

TEST_CASE("Unequal contributions create opposite side loans", "[property]") {
    Property property(make_params({{"Alice", 30000.0}, {"Bob", 10000.0}}));
    property.advance_period();

    for (int i = 0; i < 3; ++i) {
        pay_all_scheduled(property);
    }
    REQUIRE(property.current_period() == 4);

    auto sideloans = property.schedules(TableView::Sideloan);
    REQUIRE(sideloans.size() == 2);

    const ScheduleEntry& alice = sideloans.at("Alice").at_period(4);
    const ScheduleEntry& bob = sideloans.at("Bob").at_period(4);
    REQUIRE(alice.remaining_balance < 0.0);
    REQUIRE(bob.remaining_balance > 0.0);
    REQUIRE(alice.remaining_balance == Approx(-bob.remaining_balance));

    // Side loans cancel out across stakeholders
    AmortizationTable combined = property.combined_schedule(TableView::Sideloan);
    for (const ScheduleEntry& entry : combined) {
        REQUIRE(entry.remaining_balance == Approx(0.0).margin(1e-6));
    }
}

TEST_CASE("Property payments", "[property]") {
    Property property(make_params());

    SECTION("Unknown stakeholder is rejected") {
        REQUIRE_THROWS_AS(property.accept_payment("Mallory", 100.0, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(property.tranche("Mallory"), std::invalid_argument);
    }

    SECTION("Payment objects are routed by sender") {
        property.accept_payment(Payment(5000.0, "Bob", kCommonFundName, 0));
        REQUIRE(property.tranche("Bob").pending_payments().size() == 1);
        REQUIRE(property.tranche("Alice").pending_payments().empty());
    }

    SECTION("Payments for another period are rejected") {
        REQUIRE_THROWS_AS(property.accept_payment("Alice", 100.0, 3), PaymentError);
    }
}

TEST_CASE("Property baseline view ignores payments", "[property]") {
    Property property(make_params({{"Alice", 50000.0}}));
    property.advance_period();

    auto baselines = property.schedules(TableView::Baseline);
    REQUIRE(baselines.at("Alice") == property.tranche("Alice").baseline().schedule());
    REQUIRE(baselines.at("Alice") == baselines.at("Bob"));
}
