#include "property.hpp"
#include "combiner.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace amortcalc {

Property::Property(const PropertyParams& params)
    : loan_info_(params.loan_info),
      common_fund_(kCommonFundName, kCommonPartyRole),
      current_period_(0)
{
    for (const Party& party : params.stakeholders) {
        if (!party.is_common_party()) {
            stakeholders_.emplace(party.name, party);
        }
    }

    if (stakeholders_.empty()) {
        throw std::invalid_argument("Property requires at least one stakeholder");
    }

    const double count = static_cast<double>(stakeholders_.size());
    const double stake_value = params.purchase_cost / count;
    const double stake_debt = (params.purchase_cost - params.purchase_down_payment) / count;

    for (const auto& [name, party] : stakeholders_) {
        tranches_.emplace(name, Tranche(Parties{party, common_fund_}, loan_info_,
                                        stake_value, stake_debt, TrancheType::Flexible));
    }

    for (const auto& [name, amount] : params.stakeholder_down_payments) {
        if (has_stakeholder(name)) {
            accept_payment(name, amount, 0);
        } else {
            Logger::get_instance().log_warning(
                LogContext("property", name, 0),
                "Down payment ignored for unknown stakeholder " + name);
        }
    }
}

bool Property::has_stakeholder(const std::string& name) const {
    return tranches_.count(name) > 0;
}

Tranche& Property::find_tranche(const std::string& name) {
    auto it = tranches_.find(name);
    if (it == tranches_.end()) {
        throw std::invalid_argument("Unknown stakeholder: " + name);
    }
    return it->second;
}

const Tranche& Property::tranche(const std::string& name) const {
    auto it = tranches_.find(name);
    if (it == tranches_.end()) {
        throw std::invalid_argument("Unknown stakeholder: " + name);
    }
    return it->second;
}

void Property::accept_payment(const std::string& stakeholder, double amount, int period) {
    Tranche& target = find_tranche(stakeholder);
    target.accept_payment(Payment(amount, stakeholder, common_fund_.name, period));
}

void Property::accept_payment(const Payment& payment) {
    accept_payment(payment.sender, payment.amount, payment.period);
}

void Property::advance_period() {
    for (auto& [name, tranche] : tranches_) {
        tranche.advance_period();
    }
    ++current_period_;
}

std::map<std::string, AmortizationTable> Property::schedules(TableView view) const {
    std::map<std::string, AmortizationTable> result;
    for (const auto& [name, tranche] : tranches_) {
        result.emplace(name, tranche.schedule(view));
    }
    return result;
}

AmortizationTable Property::combined_schedule(TableView view) const {
    std::vector<AmortizationTable> tables;
    tables.reserve(tranches_.size());
    for (const auto& [name, tranche] : tranches_) {
        tables.push_back(tranche.schedule(view));
    }
    return combine_tables(tables);
}

std::vector<std::string> Property::stakeholder_names() const {
    std::vector<std::string> names;
    names.reserve(tranches_.size());
    for (const auto& [name, tranche] : tranches_) {
        names.push_back(name);
    }
    return names;
}

double Property::total_stake_allocated() const {
    double total = 0.0;
    for (const auto& [name, tranche] : tranches_) {
        total += tranche.nominal().principal();
    }
    return total;
}

} // namespace amortcalc
