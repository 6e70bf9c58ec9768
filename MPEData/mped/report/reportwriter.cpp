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

#include <mped/report/reportwriter.hpp>
#include <mped/utilities/log.hpp>
#include <mped/utilities/to_string.hpp>

#include <ql/math/rounding.hpp>
#include <ql/utilities/null.hpp>

using QuantLib::Null;
using std::string;
using std::vector;

namespace mpe {
namespace data {

const vector<string>& ReportWriter::scheduleColumns() {
    static const vector<string> columns = {"MonthIndex",         "Date",           "BeginningBalance",
                                           "ScheduledPrincipal", "ScheduledInterest", "ExtraPrincipal",
                                           "EndingBalance",      "PmiActive",      "EscrowAddOns",
                                           "TotalPayment"};
    return columns;
}

void ReportWriter::writeSchedule(Report& report, const vector<MonthlyEntry>& schedule) {
    LOG("Writing schedule report with " << schedule.size() << " rows");
    const vector<string>& c = scheduleColumns();
    report.addColumn(c[0], Size())
        .addColumn(c[1], Date())
        .addColumn(c[2], double(), precision_)
        .addColumn(c[3], double(), precision_)
        .addColumn(c[4], double(), precision_)
        .addColumn(c[5], double(), precision_)
        .addColumn(c[6], double(), precision_)
        .addColumn(c[7], string())
        .addColumn(c[8], double(), precision_)
        .addColumn(c[9], double(), precision_);

    // amounts leave the engine at accrual precision
    QuantLib::ClosestRounding round(precision_);
    for (const auto& e : schedule) {
        report.next()
            .add(e.monthIndex())
            .add(e.calendarDate())
            .add(round(e.beginningBalance()))
            .add(round(e.scheduledPrincipal()))
            .add(round(e.scheduledInterest()))
            .add(round(e.extraPrincipal()))
            .add(round(e.endingBalance()))
            .add(to_string(e.pmiActive()))
            .add(round(e.escrowAddOns()))
            .add(round(e.totalPayment()));
    }
    report.end();
    LOG("Schedule report written");
}

void ReportWriter::writeSummary(Report& report, const vector<std::pair<string, ScheduleSummary>>& summaries) {
    LOG("Writing summary report for " << summaries.size() << " schedules");
    report.addColumn("Scenario", string())
        .addColumn("Months", Size())
        .addColumn("PayoffDate", Date())
        .addColumn("ScheduledPayment", double(), precision_)
        .addColumn("TotalInterest", double(), precision_)
        .addColumn("TotalPrincipal", double(), precision_)
        .addColumn("TotalExtra", double(), precision_)
        .addColumn("TotalPaid", double(), precision_)
        .addColumn("TotalEscrow", double(), precision_)
        .addColumn("PmiDropDate", Date())
        .addColumn("HousingWithPmi", double(), precision_)
        .addColumn("HousingWithoutPmi", double(), precision_);

    for (const auto& s : summaries) {
        const ScheduleSummary& summary = s.second;
        report.next()
            .add(s.first)
            .add(summary.months())
            .add(summary.payoffDate() ? *summary.payoffDate() : Null<Date>())
            .add(summary.scheduledPayment())
            .add(summary.totalInterest())
            .add(summary.totalPrincipal())
            .add(summary.totalExtra())
            .add(summary.totalPaid())
            .add(summary.totalEscrow())
            .add(summary.pmiDropDate() ? *summary.pmiDropDate() : Null<Date>())
            .add(summary.housingWithPmi())
            .add(summary.housingWithoutPmi());
    }
    report.end();
}

void ReportWriter::writeSavings(Report& report, const vector<std::pair<string, SavingsSummary>>& savings) {
    LOG("Writing savings report for " << savings.size() << " scenarios");
    report.addColumn("Scenario", string())
        .addColumn("MonthsShaved", Size())
        .addColumn("InterestSaved", double(), precision_)
        .addColumn("BaselinePayoffDate", Date())
        .addColumn("ScenarioPayoffDate", Date());

    for (const auto& s : savings) {
        const SavingsSummary& summary = s.second;
        report.next()
            .add(s.first)
            .add(summary.monthsShaved())
            .add(summary.interestSaved())
            .add(summary.baseline().payoffDate() ? *summary.baseline().payoffDate() : Null<Date>())
            .add(summary.scenario().payoffDate() ? *summary.scenario().payoffDate() : Null<Date>());
    }
    report.end();
}

} // namespace data
} // namespace mpe
