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

/*! \file mped/report/report.hpp
    \brief Tabular output of schedules and summaries
    \ingroup report
*/

#pragma once

#include <boost/variant.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <string>

namespace mpe {
namespace data {
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

//! Report interface
/*! A table with typed, named columns. Columns are declared first, then rows are filled cell by cell in column
    order. A cell is a month index or count (Size), an amount (Real, printed with the column precision), a flag or
    name (string) or a date, the null date standing for a date that does not apply.

    <pre>
     report.addColumn("MonthIndex", Size()).addColumn("EndingBalance", double(), 2).addColumn("PmiActive", string());
     report.next().add(Size(1)).add(179847.63).add(string("true"));
     report.end();
    </pre>

    \ingroup report
*/
class Report {
public:
    typedef boost::variant<Size, Real, string, Date> ReportType;

    virtual ~Report() {}
    //! Adds a column, precision is the number of decimals amounts in the column are shown with
    virtual Report& addColumn(const string& name, const ReportType& type, Size precision = 0) = 0;
    //! Starts a new row
    virtual Report& next() = 0;
    //! Fills the next cell of the current row
    virtual Report& add(const ReportType& value) = 0;
    //! Checks that the last row is complete
    virtual void end() = 0;
};

} // namespace data
} // namespace mpe
