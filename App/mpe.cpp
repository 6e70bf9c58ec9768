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

#include <mped/configuration/loanbuilder.hpp>
#include <mped/configuration/parameters.hpp>
#include <mped/engine/schedulecomparator.hpp>
#include <mped/report/inmemoryreport.hpp>
#include <mped/report/reportwriter.hpp>
#include <mped/utilities/log.hpp>
#include <mped/utilities/parsers.hpp>
#include <mped/utilities/to_string.hpp>
#include <mped/version.hpp>

#include <boost/timer/timer.hpp>

#include <iomanip>
#include <iostream>

using namespace std;
using namespace mpe::data;

namespace {

class ReportValuePrinter : public boost::static_visitor<string> {
public:
    ReportValuePrinter(Size precision, const string& nullString) : precision_(precision), nullString_(nullString) {}

    string operator()(const Size s) const { return to_string(s); }
    string operator()(const Real r) const { return to_string(r, precision_); }
    string operator()(const string& s) const { return s; }
    string operator()(const Date& d) const { return d == Date() ? nullString_ : to_string(d); }

private:
    Size precision_;
    const string& nullString_;
};

// Right aligned table, one line per report row
void printReport(ostream& out, const InMemoryReport& report, const string& nullString) {
    vector<vector<string>> cells(report.columns());
    vector<Size> widths(report.columns());
    for (Size i = 0; i < report.columns(); ++i) {
        widths[i] = report.header(i).size();
        ReportValuePrinter printer(report.columnPrecision(i), nullString);
        for (Size j = 0; j < report.rows(); ++j) {
            cells[i].push_back(boost::apply_visitor(printer, report.data(i, j)));
            widths[i] = std::max(widths[i], cells[i].back().size());
        }
    }
    for (Size i = 0; i < report.columns(); ++i)
        out << (i == 0 ? "" : "  ") << setw(widths[i]) << report.header(i);
    out << endl;
    for (Size j = 0; j < report.rows(); ++j) {
        for (Size i = 0; i < report.columns(); ++i)
            out << (i == 0 ? "" : "  ") << setw(widths[i]) << cells[i][j];
        out << endl;
    }
    out << endl;
}

void setupLog(const Parameters& params) {
    Log::instance().removeAllLoggers();
    unsigned mask = 15;
    string tmp = params.get("setup", "logMask", false);
    if (!tmp.empty())
        mask = static_cast<unsigned>(parseInteger(tmp));
    string logFile = params.get("setup", "logFile", false);
    if (!logFile.empty())
        Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(logFile));
    else
        Log::instance().registerLogger(QuantLib::ext::make_shared<StderrLogger>(true));
    Log::instance().setMask(mask);
    Log::instance().switchOn();
}

void run(const Parameters& params) {
    LoanBuilder builder(params);
    LoanTerms loan = builder.loanTerms();
    AmortizationConfig config = builder.amortizationConfig();
    vector<pair<string, PaymentPlan>> scenarios = builder.scenarios();

    AmortizationEngine engine(config);
    ScheduleComparator comparator(config);
    ReportWriter writer(static_cast<Size>(config.precision()));

    vector<pair<string, ScheduleSummary>> summaries;
    vector<pair<string, SavingsSummary>> savings;
    summaries.push_back(make_pair(string("Baseline"), comparator.summarize(loan, PaymentPlan::none())));
    for (const auto& s : scenarios) {
        SavingsSummary saving = comparator.compare(loan, s.second);
        summaries.push_back(make_pair(s.first, saving.scenario()));
        savings.push_back(make_pair(s.first, saving));
    }

    InMemoryReport summaryReport;
    writer.writeSummary(summaryReport, summaries);
    cout << "Summary" << endl;
    printReport(cout, summaryReport, writer.nullString());

    if (!savings.empty()) {
        InMemoryReport savingsReport;
        writer.writeSavings(savingsReport, savings);
        cout << "Savings" << endl;
        printReport(cout, savingsReport, writer.nullString());
    }

    InMemoryReport baselineReport;
    writer.writeSchedule(baselineReport, engine.computeSchedule(loan));
    cout << "Schedule Baseline" << endl;
    printReport(cout, baselineReport, writer.nullString());

    for (const auto& s : scenarios) {
        InMemoryReport scheduleReport;
        writer.writeSchedule(scheduleReport, engine.computeSchedule(loan, s.second));
        cout << "Schedule " << s.first << endl;
        printReport(cout, scheduleReport, writer.nullString());
    }
}

} // namespace

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "MPE version " << MPE_VERSION << endl;
        exit(0);
    }

    if (argc != 2) {
        std::cout << endl << "usage: mpe path/to/mpe.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        boost::timer::cpu_timer timer;
        Parameters params;
        params.fromFile(inputFile);
        setupLog(params);
        params.log();
        run(params);
        LOG("MPE run done in " << timer.format(2, "%w") << " s");
        return 0;
    } catch (const exception& e) {
        ALOG("MPE run failed: " << e.what());
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}
