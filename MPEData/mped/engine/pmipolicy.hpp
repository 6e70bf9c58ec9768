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

/*! \file mped/engine/pmipolicy.hpp
    \brief Mortgage insurance removal by loan-to-value
    \ingroup engine
*/

#pragma once

#include <ql/types.hpp>

#include <iosfwd>

namespace mpe {
namespace data {
using QuantLib::Real;

//! PMI removal policy
/*! PMI stops once the loan-to-value, i.e. balance over home value, is at or below the threshold.

    The balance the loan-to-value is measured on is given by the basis: the ending balance after this period's
    payment (PostPayment) or the beginning balance (PrePayment). The timing decides whether the period in which the
    threshold is crossed is still charged (NextPeriod, PMI removed from the following period) or not (SamePeriod).

    The default, post-payment balance with a one period lag, charges PMI in the crossing period.

    \ingroup engine
*/
class PmiPolicy {
public:
    enum class Basis { PostPayment, PrePayment };
    enum class Timing { NextPeriod, SamePeriod };

    explicit PmiPolicy(Real threshold = 0.80, Basis basis = Basis::PostPayment, Timing timing = Timing::NextPeriod);

    Real threshold() const { return threshold_; }
    Basis basis() const { return basis_; }
    Timing timing() const { return timing_; }

    static Real loanToValue(Real balance, Real homeValue);

    //! True if the loan-to-value of the period is at or below the threshold
    bool crossed(Real beginningBalance, Real endingBalance, Real homeValue) const;

    //! True if PMI is charged in the period in which the threshold is crossed
    bool chargedInCrossingPeriod() const { return timing_ == Timing::NextPeriod; }

private:
    Real threshold_;
    Basis basis_;
    Timing timing_;
};

std::ostream& operator<<(std::ostream& out, PmiPolicy::Basis b);
std::ostream& operator<<(std::ostream& out, PmiPolicy::Timing t);

} // namespace data
} // namespace mpe
