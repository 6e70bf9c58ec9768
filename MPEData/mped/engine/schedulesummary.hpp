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

/*! \file mped/engine/schedulesummary.hpp
    \brief Totals and key dates of an amortization schedule
    \ingroup engine
*/

#pragma once

#include <mped/loan/loanterms.hpp>
#include <mped/loan/monthlyentry.hpp>

#include <boost/optional.hpp>
#include <ql/math/rounding.hpp>

#include <vector>

namespace mpe {
namespace data {

//! Schedule summary
/*! Reduces a schedule to its totals, payoff date and PMI drop-off. The housing cost figures are the scheduled
    principal and interest payment plus the monthly add-on costs, with and without PMI.

    Totals are rounded with the given rounding, normally the currency rounding of the engine configuration.

    \ingroup engine
*/
class ScheduleSummary {
public:
    ScheduleSummary(const LoanTerms& loan, const std::vector<MonthlyEntry>& schedule, Real scheduledPayment,
                    const QuantLib::Rounding& rounding = QuantLib::ClosestRounding(2));

    //! \name Inspectors
    //@{
    Size months() const { return months_; }
    Real totalInterest() const { return totalInterest_; }
    Real totalPrincipal() const { return totalPrincipal_; }
    Real totalExtra() const { return totalExtra_; }
    //! principal and interest including extra principal, add-ons excluded
    Real totalPaid() const { return totalPaid_; }
    Real totalEscrow() const { return totalEscrow_; }
    Real scheduledPayment() const { return scheduledPayment_; }
    //! Date of the payment that brings the balance to zero
    const boost::optional<Date>& payoffDate() const { return payoffDate_; }
    //! First period without PMI, empty if PMI is not charged or never removed within the schedule
    const boost::optional<Size>& pmiDropMonth() const { return pmiDropMonth_; }
    const boost::optional<Date>& pmiDropDate() const { return pmiDropDate_; }
    Real housingWithPmi() const { return housingWithPmi_; }
    Real housingWithoutPmi() const { return housingWithoutPmi_; }
    //@}

private:
    Size months_;
    Real totalInterest_, totalPrincipal_, totalExtra_, totalPaid_, totalEscrow_;
    Real scheduledPayment_;
    boost::optional<Date> payoffDate_;
    boost::optional<Size> pmiDropMonth_;
    boost::optional<Date> pmiDropDate_;
    Real housingWithPmi_, housingWithoutPmi_;
};

} // namespace data
} // namespace mpe
