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

#include <mped/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <ql/errors.hpp>
#include <ql/utilities/dataparsers.hpp>

#include <algorithm>
#include <cctype>
#include <map>

using boost::algorithm::to_upper_copy;
using std::map;

namespace mpe {
namespace data {

Date parseDate(const string& s) {
    QL_REQUIRE(!s.empty(), "Cannot convert empty string to date");

    if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
        // yyyy-mm-dd
        return QuantLib::DateParser::parseISO(s);
    } else if (s.size() == 8 && std::all_of(s.begin(), s.end(), ::isdigit)) {
        // yyyymmdd
        return QuantLib::DateParser::parseFormatted(s, "%Y%m%d");
    } else if (s.size() == 7 && s[4] == '-') {
        // yyyy-mm, first of the month
        Integer y = parseInteger(s.substr(0, 4));
        Integer m = parseInteger(s.substr(5, 2));
        QL_REQUIRE(m >= 1 && m <= 12, "Cannot convert \"" << s << "\" to Date, month " << m << " out of range");
        return Date(1, static_cast<QuantLib::Month>(m), y);
    }

    QL_FAIL("Cannot convert \"" << s << "\" to Date.");
}

Real parseReal(const string& s) {
    try {
        return boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (std::exception& ex) {
        QL_FAIL("Failed to parseReal(\"" << s << "\") " << ex.what());
    }
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::trim_copy(s));
    } catch (std::exception& ex) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\") " << ex.what());
    }
}

bool parseBool(const string& s) {
    static map<string, bool> b = {{"Y", true},  {"YES", true}, {"TRUE", true},   {"1", true},
                                  {"N", false}, {"NO", false}, {"FALSE", false}, {"0", false}};

    auto it = b.find(to_upper_copy(boost::trim_copy(s)));
    if (it != b.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to bool");
    }
}

PmiPolicy::Basis parsePmiBasis(const string& s) {
    static map<string, PmiPolicy::Basis> b = {{"POSTPAYMENT", PmiPolicy::Basis::PostPayment},
                                              {"POST", PmiPolicy::Basis::PostPayment},
                                              {"PREPAYMENT", PmiPolicy::Basis::PrePayment},
                                              {"PRE", PmiPolicy::Basis::PrePayment}};
    auto it = b.find(to_upper_copy(boost::trim_copy(s)));
    QL_REQUIRE(it != b.end(), "PMI basis \"" << s << "\" not recognized, expected PostPayment or PrePayment");
    return it->second;
}

PmiPolicy::Timing parsePmiTiming(const string& s) {
    static map<string, PmiPolicy::Timing> t = {{"NEXTPERIOD", PmiPolicy::Timing::NextPeriod},
                                               {"SAMEPERIOD", PmiPolicy::Timing::SamePeriod}};
    auto it = t.find(to_upper_copy(boost::trim_copy(s)));
    QL_REQUIRE(it != t.end(), "PMI timing \"" << s << "\" not recognized, expected NextPeriod or SamePeriod");
    return it->second;
}

QuantLib::Rounding::Type parseRoundingType(const string& s) {
    static map<string, QuantLib::Rounding::Type> m = {{"NONE", QuantLib::Rounding::Type::None},
                                                      {"UP", QuantLib::Rounding::Type::Up},
                                                      {"DOWN", QuantLib::Rounding::Type::Down},
                                                      {"CLOSEST", QuantLib::Rounding::Type::Closest}};
    auto it = m.find(to_upper_copy(boost::trim_copy(s)));
    QL_REQUIRE(it != m.end(), "Rounding type \"" << s << "\" not recognized, expected None, Up, Down or Closest");
    return it->second;
}

} // namespace data
} // namespace mpe
