// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest/gtest.h"

#include <stratum/logging/logging_level.hpp>

using namespace stratum;

namespace {

int g_evaluations = 0;

int count_evaluation() { return ++g_evaluations; }

} // anonymous namespace

TEST( LoggingLevel, ParseLevels ) {
    EXPECT_EQ( logging::level::none, logging::parse_logging_level( "0" ) );
    EXPECT_EQ( logging::level::debug, logging::parse_logging_level( "5" ) );
    EXPECT_EQ( logging::level::warning, logging::parse_logging_level( " Warning " ) );
    EXPECT_EQ( logging::level::error, logging::parse_logging_level( "errors" ) );
    EXPECT_EQ( logging::level::stats, logging::parse_logging_level( "stats" ) );
    EXPECT_THROW( logging::parse_logging_level( "6" ), std::invalid_argument );
    EXPECT_THROW( logging::parse_logging_level( "loud" ), std::invalid_argument );
    EXPECT_EQ( "2 - Warnings", logging::logging_level_as_string( logging::level::warning ) );
}

TEST( LoggingLevel, LevelInScope ) {
    const int original = logging::get_logging_level();
    {
        logging::set_logging_level_in_scope scope( logging::level::error );
        EXPECT_EQ( logging::level::error, logging::get_logging_level() );
        EXPECT_TRUE( logging::is_logging_errors() );
        EXPECT_FALSE( logging::is_logging_warnings() );
    }
    EXPECT_EQ( original, logging::get_logging_level() );
}

TEST( LoggingLevel, DisabledStreamsSkipTheMessage ) {
    logging::scoped_log_capture capture;
    logging::set_logging_level_in_scope scope( logging::level::warning );

    g_evaluations = 0;
    ST_LOG( warning ) << "shown " << count_evaluation() << std::endl;
    ST_LOG( debug ) << "hidden " << count_evaluation() << std::endl;
    ST_LOG( stats ) << "hidden " << count_evaluation() << std::endl;

    EXPECT_EQ( 1, g_evaluations );
    EXPECT_EQ( "shown 1\n", capture.str() );
}

TEST( LoggingLevel, CaptureRestoresStreams ) {
    std::streambuf* before = logging::error.rdbuf();
    {
        logging::scoped_log_capture capture;
        EXPECT_NE( before, logging::error.rdbuf() );
        ST_LOG( error ) << "captured";
        EXPECT_EQ( "captured", capture.str() );
    }
    EXPECT_EQ( before, logging::error.rdbuf() );
}
