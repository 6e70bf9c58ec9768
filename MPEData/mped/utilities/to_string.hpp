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

/*! \file mped/utilities/to_string.hpp
    \brief string conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/time/period.hpp>

#include <boost/optional.hpp>

#include <sstream>
#include <string>

namespace mpe {
namespace data {

//! Convert QuantLib::Date to std::string
/*!
  Returns date as a string in YYYY-MM-DD format, which matches QuantLib::io::iso_date()
  However that function can have issues with locale so we have a local snprintf() based version.

  If date == Date() returns 1900-01-01 so the above format is preserved.
  \ingroup utilities
*/
std::string to_string(const QuantLib::Date& date);

//! Convert bool to std::string
/*!
  Returns "true" for true and "false" for false
  \ingroup utilities
*/
std::string to_string(bool aBool);

//! Convert a monetary amount to std::string with the given number of decimals
/*! \ingroup utilities */
std::string to_string(QuantLib::Real amount, QuantLib::Size precision);

//! Convert type to std::string
/*!
  Utility to give a string for any type with an operator<<
  \ingroup utilities
*/
template <class T> std::string to_string(const T& t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
}

//! Convert an optional value to std::string, an empty optional gives the given null string
/*! \ingroup utilities */
template <class T> std::string to_string(const boost::optional<T>& t, const std::string& nullString = "") {
    return t ? to_string(*t) : nullString;
}

} // namespace data
} // namespace mpe
