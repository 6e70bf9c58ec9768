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

/*! \file mpet/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <mped/utilities/log.hpp>

namespace mpe {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : logEnabled_(mpe::data::Log::instance().enabled()), logMask_(mpe::data::Log::instance().mask()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Remove a buffer logger a test case registered to capture messages
        if (mpe::data::Log::instance().hasLogger(mpe::data::BufferLogger::name))
            mpe::data::Log::instance().removeLogger(mpe::data::BufferLogger::name);
        // Restore the logging state set up by the global fixture
        mpe::data::Log::instance().setMask(logMask_);
        if (logEnabled_)
            mpe::data::Log::instance().switchOn();
        else
            mpe::data::Log::instance().switchOff();
    }

private:
    bool logEnabled_;
    unsigned logMask_;
};

} // namespace test
} // namespace mpe
