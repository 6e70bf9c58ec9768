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

#include <mped/report/inmemoryreport.hpp>
#include <mped/utilities/to_string.hpp>

#include <boost/algorithm/string/join.hpp>

namespace mpe {
namespace data {

Report& InMemoryReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    QL_REQUIRE(!hasHeader(name), "Report already has a column " << name);
    headers_.push_back(name);
    columnTypes_.push_back(rt);
    columnPrecision_.push_back(precision);
    data_.push_back(vector<ReportType>()); // Initialise vector for column
    i_++;
    return *this;
}

Report& InMemoryReport::next() {
    QL_REQUIRE(i_ == headers_.size(), "Cannot go to next line, only " << i_ << " entries filled, report headers are: "
                                                                      << boost::join(headers_, ","));
    i_ = 0;
    return *this;
}

Report& InMemoryReport::add(const ReportType& rt) {
    // check type is valid
    QL_REQUIRE(i_ < headers_.size(), "No column to add [" << rt << "] to.");
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(), "Cannot add value "
                                                           << rt << " of type " << rt.which() << " to column "
                                                           << headers_[i_] << " of type " << columnTypes_[i_].which()
                                                           << ", report headers are: " << boost::join(headers_, ","));

    data_[i_].push_back(rt);
    i_++;
    return *this;
}

Report& InMemoryReport::add(const InMemoryReport& report) {
    QL_REQUIRE(columns() == report.columns(), "Cannot combine reports of different sizes ("
                                                  << columns() << " vs " << report.columns()
                                                  << "), report headers are: " << boost::join(headers_, ","));
    for (Size i = 0; i < columns(); i++) {
        string h1 = headers_[i];
        string h2 = report.header(i);
        QL_REQUIRE(h1 == h2, "Cannot combine reports with different headers (\""
                                 << h1 << "\" and \"" << h2
                                 << "\"), report headers are: " << boost::join(headers_, ","));
    }

    for (Size rowIdx = 0; rowIdx < report.rows(); rowIdx++) {
        next();
        for (Size columnIdx = 0; columnIdx < report.columns(); columnIdx++)
            add(report.data(columnIdx, rowIdx));
    }
    return *this;
}

void InMemoryReport::end() {
    QL_REQUIRE(i_ == headers_.size() || i_ == 0, "report is finalized with incomplete row, got data for "
                                                     << i_ << " columns out of " << columns());
}

const vector<Report::ReportType>& InMemoryReport::data(Size i) const {
    QL_REQUIRE(i < columns(), "InMemoryReport::data(" << i << "): column index out of range, have " << columns());
    return data_[i];
}

const Report::ReportType& InMemoryReport::data(Size i, Size j) const {
    QL_REQUIRE(j < data(i).size(), "InMemoryReport::data(" << i << ", " << j << "): row index out of range, have "
                                                           << data(i).size());
    return data_[i][j];
}

Size InMemoryReport::columnIndex(const string& h) const {
    auto it = std::find(headers_.begin(), headers_.end(), h);
    QL_REQUIRE(it != headers_.end(), "InMemoryReport has no column " << h);
    return static_cast<Size>(std::distance(headers_.begin(), it));
}

} // namespace data
} // namespace mpe
