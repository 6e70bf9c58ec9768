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

#include <mped/engine/schedulecomparator.hpp>
#include <mped/loan/errors.hpp>
#include <mped/utilities/log.hpp>

namespace mpe {
namespace data {

ScheduleComparator::ScheduleComparator(const AmortizationConfig& config) : engine_(config) {}

ScheduleSummary ScheduleComparator::summarize(const LoanTerms& loan, const PaymentPlan& plan) const {
    return ScheduleSummary(loan, engine_.computeSchedule(loan, plan), engine_.scheduledPayment(loan),
                           engine_.config().currencyRounding());
}

SavingsSummary ScheduleComparator::compare(const LoanTerms& loan, const PaymentPlan& baselinePlan,
                                           const PaymentPlan& scenarioPlan) const {
    ScheduleSummary baseline = summarize(loan, baselinePlan);
    ScheduleSummary scenario = summarize(loan, scenarioPlan);

    MPE_REQUIRE(InvariantViolation, scenario.months() <= baseline.months(),
                "scenario runs " << scenario.months() << " months, longer than the baseline " << baseline.months()
                                 << " months");
    Real interestSaved = engine_.config().currencyRounding()(baseline.totalInterest() - scenario.totalInterest());
    MPE_REQUIRE(InvariantViolation, interestSaved >= 0.0,
                "scenario interest " << scenario.totalInterest() << " exceeds the baseline interest "
                                     << baseline.totalInterest());
    if (interestSaved == 0.0)
        interestSaved = 0.0; // no negative zero

    Size monthsShaved = baseline.months() - scenario.months();
    DLOG("ScheduleComparator: " << monthsShaved << " months shaved, interest saved " << interestSaved);
    return SavingsSummary(baseline, scenario, monthsShaved, interestSaved);
}

SavingsSummary ScheduleComparator::compare(const LoanTerms& loan, const PaymentPlan& scenarioPlan) const {
    return compare(loan, PaymentPlan::none(), scenarioPlan);
}

} // namespace data
} // namespace mpe
