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

/*! \file mped/report/inmemoryreport.hpp
    \brief In memory report class
    \ingroup report
*/

#pragma once

#include <mped/report/report.hpp>
#include <ql/errors.hpp>

#include <algorithm>
#include <vector>

namespace mpe {
namespace data {
using std::string;
using std::vector;

/*! InMemoryReport just stores report information in local vectors and provides an interface to access
 *  the values. It could be used as a backend to a GUI
 \ingroup report
 */
class InMemoryReport : public Report {
public:
    InMemoryReport() : i_(0) {}

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    //! Append the rows of a report with the same columns
    Report& add(const InMemoryReport& report);
    void end() override;

    // InMemoryInterface
    Size columns() const { return headers_.size(); }
    Size rows() const { return columns() == 0 ? 0 : data_[0].size(); }
    const string& header(Size i) const { return headers_[i]; }
    bool hasHeader(string h) const { return std::find(headers_.begin(), headers_.end(), h) != headers_.end(); }
    ReportType columnType(Size i) const { return columnTypes_[i]; }
    Size columnPrecision(Size i) const { return columnPrecision_[i]; }
    //! Returns the data
    const vector<ReportType>& data(Size i) const;
    //! Returns the data of column i in row j
    const ReportType& data(Size i, Size j) const;
    //! Index of the column with the given header, throws if there is none
    Size columnIndex(const string& h) const;

private:
    Size i_;
    vector<string> headers_;
    vector<ReportType> columnTypes_;
    vector<Size> columnPrecision_;
    vector<vector<ReportType>> data_;
};

} // namespace data
} // namespace mpe
