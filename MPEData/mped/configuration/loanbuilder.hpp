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

/*! \file mped/configuration/loanbuilder.hpp
    \brief Build loan terms, payment plans and engine configuration from parameters
    \ingroup configuration
*/

#pragma once

#include <mped/configuration/parameters.hpp>
#include <mped/engine/amortizationconfig.hpp>
#include <mped/loan/loanterms.hpp>
#include <mped/loan/paymentplan.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mpe {
namespace data {

//! Builds the engine inputs from the parameter groups
/*! Loan group
    - principal, annualRatePercent, startDate (mandatory)
    - termMonths or termYears (one of them mandatory)
    - homeValue, monthlyTax, monthlyInsurance, monthlyHOA, monthlyPMI, fixedPayment, requirePmiRemoval (optional)

    Engine group (optional, defaults as in AmortizationConfig)
    - pmiThreshold, pmiBasis, pmiTiming, precision, paymentRounding, maxMonths, accrualPrecision

    Scenario groups (all optional)
    - extraMonthly, effectiveFromMonth, oneTimeExtraMonth, oneTimeExtraAmount

    Invalid values raise the errors of the data model, InvalidLoanError and InvalidPlanError, malformed text a
    QuantLib::Error.

    \ingroup configuration
*/
class LoanBuilder {
public:
    explicit LoanBuilder(const Parameters& params) : params_(params) {}

    LoanTerms loanTerms() const;
    AmortizationConfig amortizationConfig() const;
    PaymentPlan paymentPlan(const std::string& scenario) const;
    //! All scenarios in file order
    std::vector<std::pair<std::string, PaymentPlan>> scenarios() const;

    //! Payment plan from a group of scenario parameters
    static PaymentPlan buildPaymentPlan(const std::map<std::string, std::string>& group);

private:
    const Parameters& params_;
};

} // namespace data
} // namespace mpe
