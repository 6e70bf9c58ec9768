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

/*! \file mped/utilities/parsers.hpp
    \brief Map text representations to QuantLib and engine structures
    \ingroup utilities
*/

#pragma once

#include <mped/engine/pmipolicy.hpp>

#include <ql/math/rounding.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>

namespace mpe {
namespace data {
using QuantLib::Date;
using QuantLib::Integer;
using QuantLib::Real;
using std::string;

//! Convert text to QuantLib::Date
/*!
  Accepts yyyy-mm-dd, yyyymmdd and yyyy-mm, the latter giving the first day of the month.
  \ingroup utilities
 */
Date parseDate(const string& s);

//! Convert text to Real
/*!
  \ingroup utilities
 */
Real parseReal(const string& s);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
 */
Integer parseInteger(const string& s);

//! Convert text to bool
/*!
  \ingroup utilities
 */
bool parseBool(const string& s);

//! Convert text to PmiPolicy::Basis
/*! \ingroup utilities */
PmiPolicy::Basis parsePmiBasis(const string& s);

//! Convert text to PmiPolicy::Timing
/*! \ingroup utilities */
PmiPolicy::Timing parsePmiTiming(const string& s);

//! Convert text to QuantLib::Rounding::Type
/*! None, Up, Down and Closest
    \ingroup utilities
*/
QuantLib::Rounding::Type parseRoundingType(const string& s);

} // namespace data
} // namespace mpe
