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

/*! \file mped/engine/amortizationengine.hpp
    \brief Monthly amortization schedule of a fixed rate mortgage
    \ingroup engine
*/

#pragma once

#include <mped/engine/amortizationconfig.hpp>
#include <mped/loan/loanterms.hpp>
#include <mped/loan/monthlyentry.hpp>
#include <mped/loan/paymentplan.hpp>

#include <vector>

namespace mpe {
namespace data {
using QuantLib::Rate;

//! Level payment that amortizes the principal over n periods at the given periodic rate, unrounded
/*! principal / n for a zero rate, principal * r / (1 - (1 + r)^-n) otherwise
    \ingroup engine
*/
Real levelPayment(Real principal, Rate periodicRate, Size n);

//! Amortization engine
/*! Produces the month by month schedule of a loan under a payment plan.

    The schedule is computed at the accrual precision of the configuration. Each period accrues interest on the
    beginning balance, rounded at the point of accrual, and splits the amortizing payment into interest and
    principal. Extra principal is added on top and clipped so that the balance never goes negative. Add-on costs
    are charged every period, PMI until it is removed according to the configured PmiPolicy. The schedule ends when
    the balance reaches zero or at the end of the term, the last term period amortizes whatever rounding left on
    the balance.

    A loan with a fixed payment runs until it is paid off instead. The payoff horizon is checked against
    AmortizationConfig::maxMonths() before the schedule is computed.

    The engine keeps no state between calls, computeSchedule() is a pure function of its inputs and may be called
    concurrently.

    \ingroup engine
*/
class AmortizationEngine {
public:
    explicit AmortizationEngine(const AmortizationConfig& config = AmortizationConfig());

    const AmortizationConfig& config() const { return config_; }

    //! The quoted payment at currency precision, the rounded level payment or the fixed payment if the loan has one
    Real scheduledPayment(const LoanTerms& loan) const;

    //! The payment the schedule amortizes with, at accrual precision
    Real amortizingPayment(const LoanTerms& loan) const;

    /*! Throws InvalidPlanError if the plan does not fit the loan, InvalidLoanError if a fixed payment does not pay
        the loan off within the horizon guard, InvariantViolation if the term exceeds the horizon guard. No partial
        schedule is ever returned. */
    std::vector<MonthlyEntry> computeSchedule(const LoanTerms& loan,
                                              const PaymentPlan& plan = PaymentPlan::none()) const;

private:
    void checkFixedPayment(const LoanTerms& loan, Real payment) const;

    AmortizationConfig config_;
};

} // namespace data
} // namespace mpe
