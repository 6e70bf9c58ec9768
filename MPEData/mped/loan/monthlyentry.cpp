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

#include <mped/loan/monthlyentry.hpp>
#include <mped/utilities/to_string.hpp>

#include <iomanip>
#include <ostream>

namespace mpe {
namespace data {

bool operator==(const MonthlyEntry& a, const MonthlyEntry& b) {
    return a.monthIndex() == b.monthIndex() && a.calendarDate() == b.calendarDate() &&
           a.beginningBalance() == b.beginningBalance() && a.scheduledPrincipal() == b.scheduledPrincipal() &&
           a.scheduledInterest() == b.scheduledInterest() && a.extraPrincipal() == b.extraPrincipal() &&
           a.endingBalance() == b.endingBalance() && a.pmiActive() == b.pmiActive() &&
           a.escrowAddOns() == b.escrowAddOns() && a.totalPayment() == b.totalPayment();
}

bool operator!=(const MonthlyEntry& a, const MonthlyEntry& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& out, const MonthlyEntry& e) {
    return out << "#" << e.monthIndex() << " " << to_string(e.calendarDate()) << std::fixed << std::setprecision(2)
               << " begin " << e.beginningBalance() << " principal " << e.scheduledPrincipal() << " interest "
               << e.scheduledInterest() << " extra " << e.extraPrincipal() << " end " << e.endingBalance()
               << " pmi " << (e.pmiActive() ? "Y" : "N") << " escrow " << e.escrowAddOns() << " total "
               << e.totalPayment();
}

} // namespace data
} // namespace mpe
