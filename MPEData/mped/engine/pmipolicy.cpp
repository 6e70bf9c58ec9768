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

#include <mped/engine/pmipolicy.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>

#include <cmath>
#include <ostream>

namespace mpe {
namespace data {

PmiPolicy::PmiPolicy(Real threshold, Basis basis, Timing timing)
    : threshold_(threshold), basis_(basis), timing_(timing) {
    QL_REQUIRE(std::isfinite(threshold_) && threshold_ > 0.0 && threshold_ <= 1.0,
               "PMI removal threshold must be in (0, 1], got " << threshold_);
}

Real PmiPolicy::loanToValue(Real balance, Real homeValue) {
    QL_REQUIRE(homeValue > 0.0, "loan-to-value requires a positive home value, got " << homeValue);
    return balance / homeValue;
}

bool PmiPolicy::crossed(Real beginningBalance, Real endingBalance, Real homeValue) const {
    Real ltv = loanToValue(basis_ == Basis::PostPayment ? endingBalance : beginningBalance, homeValue);
    return ltv < threshold_ || QuantLib::close_enough(ltv, threshold_);
}

std::ostream& operator<<(std::ostream& out, PmiPolicy::Basis b) {
    switch (b) {
    case PmiPolicy::Basis::PostPayment:
        return out << "PostPayment";
    case PmiPolicy::Basis::PrePayment:
        return out << "PrePayment";
    default:
        QL_FAIL("unknown PMI basis " << static_cast<int>(b));
    }
}

std::ostream& operator<<(std::ostream& out, PmiPolicy::Timing t) {
    switch (t) {
    case PmiPolicy::Timing::NextPeriod:
        return out << "NextPeriod";
    case PmiPolicy::Timing::SamePeriod:
        return out << "SamePeriod";
    default:
        QL_FAIL("unknown PMI timing " << static_cast<int>(t));
    }
}

} // namespace data
} // namespace mpe
