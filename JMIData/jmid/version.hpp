/*
 Copyright (C) 2026 JMI Developers
 All rights reserved.

 This file is part of JMI, a free-software/open-source library
 for market-implied rate and credit analytics.

 JMI is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file jmid/version.hpp
    \brief Version
*/

#pragma once

// We require Boost 1.72 or higher
#include <boost/version.hpp>
#if BOOST_VERSION < 107200
#error using an old version of Boost, please update.
#endif

// We require QuantLib 1.30 or higher
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x013000f0
#error using an old version of QuantLib, please update.
#endif

//! Version string
#define JMI_VERSION "1.0.0"

//! Version number
#define JMI_VERSION_NUM 1000000
