/*
 Copyright (C) 2025 The MPE Authors
 All rights reserved.

 This file is part of MPE, a free-software/open-source library
 for mortgage amortization and payoff projection

 MPE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program, see the LICENSE file.

 This program is distributed in the hope that it will be useful, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <mped/engine/amortizationengine.hpp>
#include <mped/loan/errors.hpp>
#include <mped/utilities/log.hpp>
#include <mped/utilities/to_string.hpp>

#include <ql/math/comparison.hpp>

#include <algorithm>
#include <cmath>

namespace mpe {
namespace data {

Real levelPayment(Real principal, Rate periodicRate, Size n) {
    QL_REQUIRE(n > 0, "levelPayment(): number of periods must be positive");
    if (periodicRate == 0.0)
        return principal / static_cast<Real>(n);
    return principal * periodicRate / (1.0 - std::pow(1.0 + periodicRate, -static_cast<Real>(n)));
}

AmortizationEngine::AmortizationEngine(const AmortizationConfig& config) : config_(config) {}

Real AmortizationEngine::scheduledPayment(const LoanTerms& loan) const {
    if (loan.fixedPayment())
        return config_.currencyRounding()(*loan.fixedPayment());
    return config_.roundPayment(levelPayment(loan.principal(), loan.monthlyRate(), loan.termMonths()));
}

Real AmortizationEngine::amortizingPayment(const LoanTerms& loan) const {
    if (loan.fixedPayment())
        return config_.accrualRounding()(*loan.fixedPayment());
    return config_.accrualRounding()(levelPayment(loan.principal(), loan.monthlyRate(), loan.termMonths()));
}

void AmortizationEngine::checkFixedPayment(const LoanTerms& loan, Real payment) const {
    MPE_REQUIRE(InvalidLoanError, payment > 0.0,
                "monthly payment " << *loan.fixedPayment() << " rounds to zero at " << config_.accrualPrecision()
                                   << " decimals");

    const Real balance = config_.accrualRounding()(loan.principal());
    const Rate r = loan.monthlyRate();
    MPE_REQUIRE(InvalidLoanError, payment > balance * r,
                "monthly payment " << payment << " does not cover the first month interest " << balance * r);

    // number of level payments that retire the balance
    Real periods = r == 0.0 ? balance / payment : -std::log(1.0 - balance * r / payment) / std::log(1.0 + r);
    Real months = std::ceil(periods - 1.0E-8);
    MPE_REQUIRE(InvalidLoanError, months <= static_cast<Real>(config_.maxMonths()),
                "monthly payment " << payment << " pays the loan off in " << months
                                   << " months, more than the maximum of " << config_.maxMonths() << " months");
}

std::vector<MonthlyEntry> AmortizationEngine::computeSchedule(const LoanTerms& loan, const PaymentPlan& plan) const {

    plan.validate(loan);

    MPE_REQUIRE(InvariantViolation, loan.termMonths() <= config_.maxMonths(),
                "loan term of " << loan.termMonths() << " months exceeds the maximum of " << config_.maxMonths()
                                << " months");

    const QuantLib::Rounding round = config_.accrualRounding();
    const PmiPolicy& pmiPolicy = config_.pmiPolicy();
    const bool fixedPayment = static_cast<bool>(loan.fixedPayment());
    const Size horizon = fixedPayment ? config_.maxMonths() : loan.termMonths();
    const Rate r = loan.monthlyRate();
    const Real payment = amortizingPayment(loan);
    if (fixedPayment)
        checkFixedPayment(loan, payment);

    DLOG("AmortizationEngine: payment " << payment << (fixedPayment ? " (fixed)" : " (level)") << ", monthly rate "
                                        << r << ", horizon " << horizon << " months, PMI threshold "
                                        << pmiPolicy.threshold() << " " << pmiPolicy.basis() << " "
                                        << pmiPolicy.timing());

    std::vector<MonthlyEntry> schedule;
    schedule.reserve(horizon);

    Real balance = round(loan.principal());
    bool pmiRemoved = false;

    for (Size i = 1; i <= horizon; ++i) {
        Real interest = round(balance * r);
        MPE_REQUIRE(InvariantViolation, payment >= interest,
                    "payment " << payment << " does not cover the interest " << interest << " in month " << i);

        // the last term period takes the remaining balance
        Real scheduledPrincipal = std::min(round(payment - interest), balance);
        if (!fixedPayment && i == loan.termMonths())
            scheduledPrincipal = balance;
        Real extra = std::min(round(plan.extra(i)), round(balance - scheduledPrincipal));
        Real ending = round(balance - scheduledPrincipal - extra);
        if (ending <= 0.0)
            ending = 0.0;

        bool pmiActive = loan.chargesPmi() && !pmiRemoved;
        if (pmiActive && loan.pmiRemovable() && pmiPolicy.crossed(balance, ending, *loan.homeValue())) {
            pmiRemoved = true;
            pmiActive = pmiPolicy.chargedInCrossingPeriod();
            DLOG("AmortizationEngine: loan-to-value threshold crossed in month " << i << ", PMI "
                                                                                << (pmiActive ? "charged" : "removed")
                                                                                << " in this month");
        }

        Real escrow = round(loan.addOns().total(pmiActive));
        Real total = round(scheduledPrincipal + interest + extra + escrow);

        schedule.emplace_back(i, loan.paymentDate(i), balance, scheduledPrincipal, interest, extra, ending, pmiActive,
                              escrow, total);
        TLOG(schedule.back());

        balance = ending;
        if (QuantLib::close_enough(balance, 0.0))
            break;
    }

    MPE_REQUIRE(InvariantViolation, QuantLib::close_enough(balance, 0.0),
                "loan is not paid off within " << horizon << " months, remaining balance " << balance);

    DLOG("AmortizationEngine: " << schedule.size() << " payments, paid off "
                                << to_string(schedule.back().calendarDate()));
    return schedule;
}

} // namespace data
} // namespace mpe
