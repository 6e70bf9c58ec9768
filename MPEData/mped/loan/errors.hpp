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

/*! \file mped/loan/errors.hpp
    \brief Error types raised by the loan data model and the amortization engine
    \ingroup loan
*/

#pragma once

#include <ql/errors.hpp>

#include <sstream>
#include <string>

namespace mpe {
namespace data {

//! Structurally invalid loan terms
/*! Raised before any computation starts, a LoanTerms instance is never partially built.
    \ingroup loan
*/
class InvalidLoanError : public QuantLib::Error {
public:
    InvalidLoanError(const std::string& file, long line, const std::string& functionName,
                     const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

//! Malformed payment plan, e.g. negative amounts or a one-time extra outside the loan term
/*! \ingroup loan */
class InvalidPlanError : public QuantLib::Error {
public:
    InvalidPlanError(const std::string& file, long line, const std::string& functionName,
                     const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

//! Internal defect guard
/*! Signals a programming error (negative savings, runaway schedule), never a recoverable user condition.
    \ingroup loan
*/
class InvariantViolation : public QuantLib::Error {
public:
    InvariantViolation(const std::string& file, long line, const std::string& functionName,
                       const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

} // namespace data
} // namespace mpe

/*! \def MPE_FAIL
    \brief throw an error of the given type (possibly with file and line information)
*/
#define MPE_FAIL(ErrorType, message)                                                                                   \
    do {                                                                                                               \
        std::ostringstream _mpe_msg_stream;                                                                            \
        _mpe_msg_stream << message;                                                                                    \
        throw ErrorType(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _mpe_msg_stream.str());                               \
    } while (false)

/*! \def MPE_REQUIRE
    \brief throw an error of the given type if the given pre-condition is not verified
*/
#define MPE_REQUIRE(ErrorType, condition, message)                                                                     \
    if (!(condition)) {                                                                                                \
        MPE_FAIL(ErrorType, message);                                                                                  \
    } else
