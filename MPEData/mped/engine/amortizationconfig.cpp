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

#include <mped/engine/amortizationconfig.hpp>

#include <ql/errors.hpp>

#include <cmath>

namespace mpe {
namespace data {

AmortizationConfig::AmortizationConfig(const PmiPolicy& pmiPolicy, Integer precision,
                                       QuantLib::Rounding::Type paymentRounding, Size maxMonths,
                                       Integer accrualPrecision)
    : pmiPolicy_(pmiPolicy), precision_(precision), paymentRounding_(paymentRounding), maxMonths_(maxMonths),
      accrualPrecision_(accrualPrecision) {
    QL_REQUIRE(precision_ >= 2 && precision_ <= 6, "currency precision must be between 2 and 6, got " << precision_);
    QL_REQUIRE(accrualPrecision_ >= precision_ && accrualPrecision_ <= 10,
               "accrual precision must be between the currency precision " << precision_ << " and 10, got "
                                                                           << accrualPrecision_);
    QL_REQUIRE(maxMonths_ > 0, "maximum number of months must be positive");
}

Real AmortizationConfig::roundPayment(Real payment) const {
    if (paymentRounding_ == QuantLib::Rounding::Up) {
        // QuantLib rounds up any non-zero remainder, a representation error of e.g. 1.1 * 100 would add a cent
        Real tolerance = 1E-4 * std::pow(10.0, -precision_);
        return QuantLib::Rounding(precision_, paymentRounding_)(payment - tolerance);
    }
    return QuantLib::Rounding(precision_, paymentRounding_)(payment);
}

} // namespace data
} // namespace mpe
