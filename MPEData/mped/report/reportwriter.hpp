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

/*! \file mped/report/reportwriter.hpp
    \brief Write schedules, summaries and savings to reports
    \ingroup report
*/

#pragma once

#include <mped/engine/schedulecomparator.hpp>
#include <mped/engine/schedulesummary.hpp>
#include <mped/loan/monthlyentry.hpp>
#include <mped/report/report.hpp>

#include <string>
#include <vector>

namespace mpe {
namespace data {

//! Write engine outputs to reports
/*! The schedule report has the columns

    MonthIndex, Date, BeginningBalance, ScheduledPrincipal, ScheduledInterest, ExtraPrincipal, EndingBalance,
    PmiActive, EscrowAddOns, TotalPayment

    in this order, monetary columns rounded to the currency precision. Consumers exporting the report rely on the
    order.

    \ingroup report
*/
class ReportWriter {
public:
    /*! Constructor.
        \param precision decimals of monetary columns
        \param nullString used to represent string values that are not applicable.
    */
    ReportWriter(Size precision = 2, const std::string& nullString = "#N/A")
        : precision_(precision), nullString_(nullString) {}

    virtual ~ReportWriter() {}

    //! Column headers of the schedule report, in report order
    static const std::vector<std::string>& scheduleColumns();

    virtual void writeSchedule(Report& report, const std::vector<MonthlyEntry>& schedule);

    //! One row per named schedule summary
    virtual void writeSummary(Report& report, const std::vector<std::pair<std::string, ScheduleSummary>>& summaries);

    //! One row per named scenario
    virtual void writeSavings(Report& report, const std::vector<std::pair<std::string, SavingsSummary>>& savings);

    const std::string& nullString() const { return nullString_; }

protected:
    Size precision_;
    std::string nullString_;
};

} // namespace data
} // namespace mpe
