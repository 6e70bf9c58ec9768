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

/*! \file mped/loan/monthlyentry.hpp
    \brief One period of an amortization schedule
    \ingroup loan
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <iosfwd>

namespace mpe {
namespace data {
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;

//! Amortization schedule row
/*! Immutable once produced. Monetary fields carry the accrual precision of the engine.
    \ingroup loan
*/
class MonthlyEntry {
public:
    MonthlyEntry(Size monthIndex, const Date& calendarDate, Real beginningBalance, Real scheduledPrincipal,
                 Real scheduledInterest, Real extraPrincipal, Real endingBalance, bool pmiActive, Real escrowAddOns,
                 Real totalPayment)
        : monthIndex_(monthIndex), calendarDate_(calendarDate), beginningBalance_(beginningBalance),
          scheduledPrincipal_(scheduledPrincipal), scheduledInterest_(scheduledInterest),
          extraPrincipal_(extraPrincipal), endingBalance_(endingBalance), pmiActive_(pmiActive),
          escrowAddOns_(escrowAddOns), totalPayment_(totalPayment) {}

    //! \name Inspectors
    //@{
    Size monthIndex() const { return monthIndex_; }
    const Date& calendarDate() const { return calendarDate_; }
    Real beginningBalance() const { return beginningBalance_; }
    Real scheduledPrincipal() const { return scheduledPrincipal_; }
    Real scheduledInterest() const { return scheduledInterest_; }
    Real extraPrincipal() const { return extraPrincipal_; }
    Real endingBalance() const { return endingBalance_; }
    bool pmiActive() const { return pmiActive_; }
    //! tax, insurance, HOA and PMI (if active) charged this period
    Real escrowAddOns() const { return escrowAddOns_; }
    //! scheduled principal and interest, extra principal and escrow add-ons
    Real totalPayment() const { return totalPayment_; }
    //@}

    //! Scheduled principal and interest
    Real scheduledPayment() const { return scheduledPrincipal_ + scheduledInterest_; }
    //! All principal repaid this period
    Real principalPaid() const { return scheduledPrincipal_ + extraPrincipal_; }

private:
    Size monthIndex_;
    Date calendarDate_;
    Real beginningBalance_;
    Real scheduledPrincipal_;
    Real scheduledInterest_;
    Real extraPrincipal_;
    Real endingBalance_;
    bool pmiActive_;
    Real escrowAddOns_;
    Real totalPayment_;
};

bool operator==(const MonthlyEntry& a, const MonthlyEntry& b);
bool operator!=(const MonthlyEntry& a, const MonthlyEntry& b);

std::ostream& operator<<(std::ostream& out, const MonthlyEntry& e);

} // namespace data
} // namespace mpe
