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

/*! \file mpet/log.hpp
    \brief boost test logger
*/

#pragma once

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>
#include <mped/utilities/log.hpp>

#include <string>
#include <vector>

using mpe::data::Logger;

namespace mpe {
namespace test {

//! BoostTest Logger
/*!
  This logger writes each log message out to the BOOST_TEST_MESSAGE.
  To view log messages run the unit tests with the flag "--log_level=test_suite"
  \see Log
 */
class BoostTestLogger : public Logger {
public:
    //! Constructor
    BoostTestLogger() : Logger("BoostTestLogger") {}
    //! The log callback
    virtual void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! Gets passed the command line arguments from a unit test suite
//! and sets up MPE logging if it is requested
/*!
    Specifying --mpe_log_mask on its own turns on logging with a default
    log mask of 255
    Optionally, you can specify the log mask using --mpe_log_mask=<mask>
*/
inline void setupTestLogging(int argc, char** argv) {

    for (int i = 1; i < argc; ++i) {

        // --mpe_log_mask indicates we want MPE logging
        if (boost::starts_with(argv[i], "--mpe_log_mask")) {

            // Check if mask is provided also (default is 255)
            unsigned int mask = 255;
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                mask = boost::lexical_cast<unsigned int>(strs[1]);
            }

            // Set up logging
            QuantLib::ext::shared_ptr<BoostTestLogger> logger = QuantLib::ext::make_shared<BoostTestLogger>();
            mpe::data::Log::instance().removeAllLoggers();
            mpe::data::Log::instance().registerLogger(logger);
            mpe::data::Log::instance().switchOn();
            mpe::data::Log::instance().setMask(mask);
        }
    }
}

} // namespace test
} // namespace mpe
