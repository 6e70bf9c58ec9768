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

/*! \file mped/engine/schedulecomparator.hpp
    \brief Savings of an extra payment scenario against a baseline
    \ingroup engine
*/

#pragma once

#include <mped/engine/amortizationengine.hpp>
#include <mped/engine/schedulesummary.hpp>

namespace mpe {
namespace data {

//! Savings of a scenario against a baseline
/*! \ingroup engine */
class SavingsSummary {
public:
    SavingsSummary(const ScheduleSummary& baseline, const ScheduleSummary& scenario, Size monthsShaved,
                   Real interestSaved)
        : baseline_(baseline), scenario_(scenario), monthsShaved_(monthsShaved), interestSaved_(interestSaved) {}

    Size monthsShaved() const { return monthsShaved_; }
    Real interestSaved() const { return interestSaved_; }
    const ScheduleSummary& baseline() const { return baseline_; }
    const ScheduleSummary& scenario() const { return scenario_; }

private:
    ScheduleSummary baseline_, scenario_;
    Size monthsShaved_;
    Real interestSaved_;
};

//! Runs the engine for a baseline and a scenario plan and derives the savings
/*! Extra payments never increase the interest or the term, a negative saving means the scenario pays less than
    the baseline and is reported as an InvariantViolation rather than displayed.

    \ingroup engine
*/
class ScheduleComparator {
public:
    explicit ScheduleComparator(const AmortizationConfig& config = AmortizationConfig());

    SavingsSummary compare(const LoanTerms& loan, const PaymentPlan& baselinePlan,
                           const PaymentPlan& scenarioPlan) const;
    //! Compare against the plan without extra payments
    SavingsSummary compare(const LoanTerms& loan, const PaymentPlan& scenarioPlan) const;

    //! Run the engine and summarise the schedule
    ScheduleSummary summarize(const LoanTerms& loan, const PaymentPlan& plan) const;

private:
    AmortizationEngine engine_;
};

} // namespace data
} // namespace mpe
