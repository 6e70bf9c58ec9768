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

/*! \file mped/loan/loanterms.hpp
    \brief Validated static description of a fixed rate mortgage
    \ingroup loan
*/

#pragma once

#include <boost/optional.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

namespace mpe {
namespace data {
using QuantLib::Date;
using QuantLib::Rate;
using QuantLib::Real;
using QuantLib::Size;

//! Monthly non principal and interest charges bundled into the housing payment
/*! \ingroup loan */
struct AddOnCosts {
    AddOnCosts(Real tax = 0.0, Real insurance = 0.0, Real hoa = 0.0, Real pmi = 0.0)
        : monthlyTax(tax), monthlyInsurance(insurance), monthlyHOA(hoa), monthlyPMI(pmi) {}

    //! Sum of the monthly charges, PMI only included if requested
    Real total(bool withPmi) const { return monthlyTax + monthlyInsurance + monthlyHOA + (withPmi ? monthlyPMI : 0.0); }

    Real monthlyTax;
    Real monthlyInsurance;
    Real monthlyHOA;
    Real monthlyPMI;
};

//! Fixed rate loan terms
/*! All invariants are checked on construction, an instance that exists is valid:

    - principal > 0, termMonths > 0, annualRatePercent >= 0, all amounts finite
    - add-on costs non-negative, homeValue positive if given
    - a fixed payment, if given, is positive and exceeds the first period interest

    If PMI is charged but the home value is missing or below the principal, PMI removal can not be evaluated. A
    structured warning is logged and PMI is charged for the life of the loan, unless requirePmiRemoval is set in
    which case construction fails.

    \ingroup loan
*/
class LoanTerms {
public:
    LoanTerms(Real principal, Real annualRatePercent, Size termMonths, const Date& startDate,
              const boost::optional<Real>& homeValue = boost::none, const AddOnCosts& addOns = AddOnCosts(),
              const boost::optional<Real>& fixedPayment = boost::none, bool requirePmiRemoval = false);

    //! \name Inspectors
    //@{
    Real principal() const { return principal_; }
    Real annualRatePercent() const { return annualRatePercent_; }
    Size termMonths() const { return termMonths_; }
    const Date& startDate() const { return startDate_; }
    const boost::optional<Real>& homeValue() const { return homeValue_; }
    const AddOnCosts& addOns() const { return addOns_; }
    Real monthlyTax() const { return addOns_.monthlyTax; }
    Real monthlyInsurance() const { return addOns_.monthlyInsurance; }
    Real monthlyHOA() const { return addOns_.monthlyHOA; }
    Real monthlyPMI() const { return addOns_.monthlyPMI; }
    //! Principal and interest payment given by the borrower instead of the level payment
    const boost::optional<Real>& fixedPayment() const { return fixedPayment_; }
    bool requirePmiRemoval() const { return requirePmiRemoval_; }
    //@}

    //! Monthly interest rate as a decimal
    Rate monthlyRate() const { return annualRatePercent_ / 100.0 / 12.0; }
    //! Payment date of the given 1-based period, end of month dates are clamped
    Date paymentDate(Size monthIndex) const;

    bool chargesPmi() const { return addOns_.monthlyPMI > 0.0; }
    //! True if PMI is charged and its removal by loan-to-value can be evaluated
    bool pmiRemovable() const { return pmiRemovable_; }

private:
    void validate();

    Real principal_;
    Real annualRatePercent_;
    Size termMonths_;
    Date startDate_;
    boost::optional<Real> homeValue_;
    AddOnCosts addOns_;
    boost::optional<Real> fixedPayment_;
    bool requirePmiRemoval_;
    bool pmiRemovable_;
};

} // namespace data
} // namespace mpe
