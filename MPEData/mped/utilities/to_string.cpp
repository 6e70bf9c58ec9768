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

#include <mped/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <cstdio>
#include <iomanip>

namespace mpe {
namespace data {

std::string to_string(const QuantLib::Date& date) {
    if (date == QuantLib::Date())
        return "1900-01-01";
    char buf[11];
    int y = date.year();
    int m = static_cast<int>(date.month());
    int d = date.dayOfMonth();
    int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    QL_REQUIRE(n == 10, "to_string(): date string length (" << n << ") not equal to required length 10");
    return std::string(buf);
}

std::string to_string(bool aBool) { return aBool ? "true" : "false"; }

std::string to_string(QuantLib::Real amount, QuantLib::Size precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(static_cast<int>(precision)) << amount;
    return oss.str();
}

} // namespace data
} // namespace mpe
