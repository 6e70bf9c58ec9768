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

/*! \file mped/engine/amortizationconfig.hpp
    \brief Policy settings of the amortization engine
    \ingroup engine
*/

#pragma once

#include <mped/engine/pmipolicy.hpp>

#include <ql/math/rounding.hpp>
#include <ql/types.hpp>

namespace mpe {
namespace data {
using QuantLib::Integer;
using QuantLib::Size;

//! Amortization engine configuration
/*! - pmiPolicy: PMI removal threshold, basis and timing
    - precision: currency precision of the quoted payment, summary totals and reports
    - paymentRounding: rounding applied to the quoted level payment, Up by default so that the quoted payment is
      never short of the amortizing amount
    - maxMonths: horizon guard, longer terms or fixed payments not paying off within it are rejected
    - accrualPrecision: decimals kept by the schedule arithmetic, the payment, interest and balances are rounded to
      it at the point of accrual. Must be at least the currency precision.

    \ingroup engine
*/
class AmortizationConfig {
public:
    explicit AmortizationConfig(const PmiPolicy& pmiPolicy = PmiPolicy(), Integer precision = 2,
                                QuantLib::Rounding::Type paymentRounding = QuantLib::Rounding::Up,
                                Size maxMonths = 1200, Integer accrualPrecision = 6);

    const PmiPolicy& pmiPolicy() const { return pmiPolicy_; }
    Integer precision() const { return precision_; }
    QuantLib::Rounding::Type paymentRoundingType() const { return paymentRounding_; }
    Size maxMonths() const { return maxMonths_; }
    Integer accrualPrecision() const { return accrualPrecision_; }

    //! Closest rounding at accrual precision
    QuantLib::Rounding accrualRounding() const { return QuantLib::ClosestRounding(accrualPrecision_); }
    //! Closest rounding at currency precision
    QuantLib::Rounding currencyRounding() const { return QuantLib::ClosestRounding(precision_); }
    //! Rounds the quoted level payment to currency precision according to paymentRounding
    Real roundPayment(Real payment) const;

private:
    PmiPolicy pmiPolicy_;
    Integer precision_;
    QuantLib::Rounding::Type paymentRounding_;
    Size maxMonths_;
    Integer accrualPrecision_;
};

} // namespace data
} // namespace mpe
