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

/*! \file mped/version.hpp
    \brief Version
*/

#pragma once

// We require QuantLib 1.11 or higher
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x011100f0
#error using an old version of QuantLib, please update.
#endif

#include <boost/version.hpp>
#if BOOST_VERSION < 106500
#error using an old version of Boost, please update.
#endif

//! Version string
#define MPE_VERSION "1.0.0"

//! Version number
#define MPE_VERSION_NUM 1000000
