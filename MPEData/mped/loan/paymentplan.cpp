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

#include <mped/loan/errors.hpp>
#include <mped/loan/loanterms.hpp>
#include <mped/loan/paymentplan.hpp>

#include <cmath>

namespace mpe {
namespace data {

PaymentPlan::PaymentPlan(Real extraMonthly, Size effectiveFromMonth,
                         const boost::optional<OneTimeExtra>& oneTimeExtra)
    : extraMonthly_(extraMonthly), effectiveFromMonth_(effectiveFromMonth), oneTimeExtra_(oneTimeExtra) {
    MPE_REQUIRE(InvalidPlanError, std::isfinite(extraMonthly_) && extraMonthly_ >= 0.0,
                "extra monthly payment must be non-negative, got " << extraMonthly_);
    MPE_REQUIRE(InvalidPlanError, effectiveFromMonth_ >= 1,
                "extra monthly payment effective month is 1-based, got " << effectiveFromMonth_);
    if (oneTimeExtra_) {
        MPE_REQUIRE(InvalidPlanError, std::isfinite(oneTimeExtra_->amount) && oneTimeExtra_->amount >= 0.0,
                    "one-time extra payment must be non-negative, got " << oneTimeExtra_->amount);
        MPE_REQUIRE(InvalidPlanError, oneTimeExtra_->monthIndex >= 1,
                    "one-time extra payment month is 1-based, got " << oneTimeExtra_->monthIndex);
    }
}

bool PaymentPlan::hasExtraPayments() const {
    return extraMonthly_ > 0.0 || (oneTimeExtra_ && oneTimeExtra_->amount > 0.0);
}

Real PaymentPlan::extra(Size monthIndex) const {
    Real result = monthIndex >= effectiveFromMonth_ ? extraMonthly_ : 0.0;
    if (oneTimeExtra_ && oneTimeExtra_->monthIndex == monthIndex)
        result += oneTimeExtra_->amount;
    return result;
}

void PaymentPlan::validate(const LoanTerms& loan) const {
    if (oneTimeExtra_) {
        MPE_REQUIRE(InvalidPlanError, oneTimeExtra_->monthIndex <= loan.termMonths(),
                    "one-time extra payment month " << oneTimeExtra_->monthIndex << " is outside the loan term [1, "
                                                    << loan.termMonths() << "]");
    }
}

} // namespace data
} // namespace mpe
