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

/*! \file mped/loan/paymentplan.hpp
    \brief Extra payment strategy applied on top of the scheduled loan payment
    \ingroup loan
*/

#pragma once

#include <boost/optional.hpp>
#include <ql/types.hpp>

namespace mpe {
namespace data {
using QuantLib::Real;
using QuantLib::Size;

class LoanTerms;

//! Extra principal payments
/*! A recurring monthly extra, paid every period from effectiveFromMonth onwards, and an optional one-time extra
    paid in a single period. Amounts are requested amounts, the engine clips them to the outstanding balance.

    Amounts must be non-negative and month indices are 1-based. Whether the one-time extra falls inside the loan
    term can only be checked against the loan, see validate().

    \ingroup loan
*/
class PaymentPlan {
public:
    //! One-time extra payment in the given period
    struct OneTimeExtra {
        OneTimeExtra(Size monthIndex, Real amount) : monthIndex(monthIndex), amount(amount) {}
        Size monthIndex;
        Real amount;
    };

    explicit PaymentPlan(Real extraMonthly = 0.0, Size effectiveFromMonth = 1,
                         const boost::optional<OneTimeExtra>& oneTimeExtra = boost::none);

    //! The plan without any extra payment, the usual baseline
    static PaymentPlan none() { return PaymentPlan(); }

    //! \name Inspectors
    //@{
    Real extraMonthly() const { return extraMonthly_; }
    Size effectiveFromMonth() const { return effectiveFromMonth_; }
    const boost::optional<OneTimeExtra>& oneTimeExtra() const { return oneTimeExtra_; }
    //@}

    bool hasExtraPayments() const;

    //! Requested extra principal for the given 1-based period, before clipping to the balance
    Real extra(Size monthIndex) const;

    //! Checks the plan against the loan it is applied to, throws InvalidPlanError
    void validate(const LoanTerms& loan) const;

private:
    Real extraMonthly_;
    Size effectiveFromMonth_;
    boost::optional<OneTimeExtra> oneTimeExtra_;
};

} // namespace data
} // namespace mpe
