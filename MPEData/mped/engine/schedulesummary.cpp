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

#include <mped/engine/schedulesummary.hpp>

#include <ql/errors.hpp>

namespace mpe {
namespace data {

ScheduleSummary::ScheduleSummary(const LoanTerms& loan, const std::vector<MonthlyEntry>& schedule,
                                 Real scheduledPayment, const QuantLib::Rounding& rounding)
    : months_(schedule.size()), totalInterest_(0.0), totalPrincipal_(0.0), totalExtra_(0.0), totalPaid_(0.0),
      totalEscrow_(0.0), scheduledPayment_(scheduledPayment) {

    for (const auto& e : schedule) {
        totalInterest_ += e.scheduledInterest();
        totalPrincipal_ += e.scheduledPrincipal();
        totalExtra_ += e.extraPrincipal();
        totalEscrow_ += e.escrowAddOns();
        if (!pmiDropMonth_ && loan.chargesPmi() && !e.pmiActive()) {
            pmiDropMonth_ = e.monthIndex();
            pmiDropDate_ = e.calendarDate();
        }
    }
    totalInterest_ = rounding(totalInterest_);
    totalPrincipal_ = rounding(totalPrincipal_);
    totalExtra_ = rounding(totalExtra_);
    totalEscrow_ = rounding(totalEscrow_);
    totalPaid_ = rounding(totalInterest_ + totalPrincipal_ + totalExtra_);

    if (!schedule.empty() && schedule.back().endingBalance() == 0.0)
        payoffDate_ = schedule.back().calendarDate();

    housingWithPmi_ = rounding(scheduledPayment_ + loan.addOns().total(true));
    housingWithoutPmi_ = rounding(scheduledPayment_ + loan.addOns().total(false));
}

} // namespace data
} // namespace mpe
