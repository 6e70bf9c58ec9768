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
#include <mped/utilities/log.hpp>
#include <mped/utilities/to_string.hpp>

#include <ql/time/period.hpp>

#include <cmath>

using std::string;

namespace mpe {
namespace data {

LoanTerms::LoanTerms(Real principal, Real annualRatePercent, Size termMonths, const Date& startDate,
                     const boost::optional<Real>& homeValue, const AddOnCosts& addOns,
                     const boost::optional<Real>& fixedPayment, bool requirePmiRemoval)
    : principal_(principal), annualRatePercent_(annualRatePercent), termMonths_(termMonths), startDate_(startDate),
      homeValue_(homeValue), addOns_(addOns), fixedPayment_(fixedPayment), requirePmiRemoval_(requirePmiRemoval),
      pmiRemovable_(false) {
    validate();
}

Date LoanTerms::paymentDate(Size monthIndex) const {
    QL_REQUIRE(monthIndex > 0, "LoanTerms::paymentDate(): month index is 1-based, got 0");
    return startDate_ + static_cast<QuantLib::Integer>(monthIndex - 1) * QuantLib::Months;
}

void LoanTerms::validate() {
    MPE_REQUIRE(InvalidLoanError, std::isfinite(principal_) && principal_ > 0.0,
                "principal must be positive, got " << principal_);
    MPE_REQUIRE(InvalidLoanError, std::isfinite(annualRatePercent_) && annualRatePercent_ >= 0.0,
                "annual rate must be non-negative, got " << annualRatePercent_ << "%");
    MPE_REQUIRE(InvalidLoanError, termMonths_ > 0, "term must be at least one month");
    MPE_REQUIRE(InvalidLoanError, startDate_ != Date(), "start date is not set");

    const std::pair<const char*, Real> addOns[] = {{"monthly tax", addOns_.monthlyTax},
                                                   {"monthly insurance", addOns_.monthlyInsurance},
                                                   {"monthly HOA", addOns_.monthlyHOA},
                                                   {"monthly PMI", addOns_.monthlyPMI}};
    for (const auto& a : addOns) {
        MPE_REQUIRE(InvalidLoanError, std::isfinite(a.second) && a.second >= 0.0,
                    a.first << " must be non-negative, got " << a.second);
    }

    if (homeValue_) {
        MPE_REQUIRE(InvalidLoanError, std::isfinite(*homeValue_) && *homeValue_ > 0.0,
                    "home value must be positive if given, got " << *homeValue_);
    }

    if (fixedPayment_) {
        MPE_REQUIRE(InvalidLoanError, std::isfinite(*fixedPayment_) && *fixedPayment_ > 0.0,
                    "monthly payment must be greater than 0, got " << *fixedPayment_);
        Real firstInterest = principal_ * monthlyRate();
        MPE_REQUIRE(InvalidLoanError, monthlyRate() == 0.0 || *fixedPayment_ > firstInterest,
                    "monthly payment " << *fixedPayment_ << " does not cover the first month interest "
                                       << firstInterest << ", the loan would never be paid off");
    }

    if (chargesPmi()) {
        if (homeValue_ && *homeValue_ >= principal_) {
            pmiRemovable_ = true;
        } else {
            string reason = homeValue_ ? "home value " + to_string(*homeValue_) + " is below the principal " +
                                             to_string(principal_)
                                       : string("home value is not given");
            MPE_REQUIRE(InvalidLoanError, !requirePmiRemoval_,
                        "PMI removal is required but can not be evaluated: " << reason);
            StructuredMessage(StructuredMessage::Category::Warning, StructuredMessage::Group::Loan,
                              "PMI removal by loan-to-value can not be evaluated, PMI is charged for the life of "
                              "the loan",
                              {{"reason", reason}, {"monthlyPMI", to_string(addOns_.monthlyPMI)}})
                .log();
        }
    }

    DLOG("LoanTerms: principal " << principal_ << ", rate " << annualRatePercent_ << "%, term " << termMonths_
                                 << "M, start " << to_string(startDate_) << ", PMI removable "
                                 << std::boolalpha << pmiRemovable_);
}

} // namespace data
} // namespace mpe
