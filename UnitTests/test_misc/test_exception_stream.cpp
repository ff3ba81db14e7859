// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest/gtest.h"

#include <stratum/misc/exception_stream.hpp>

#include <cstring>

using namespace stratum;

TEST( ExceptionStream, BuildsMessage ) {
    try {
        throw exception_stream() << "row " << 3 << " of plane " << 7;
    } catch( const std::exception& e ) {
        EXPECT_STREQ( "row 3 of plane 7", e.what() );
    }
}

TEST( ExceptionStream, CopiesShareTheMessage ) {
    voxset_exception original( voxset_error::read_only, "set_metadata: " );
    original << "opened for reading";
    voxset_exception copy( original );

    EXPECT_STREQ( "set_metadata: opened for reading", copy.what() );
    EXPECT_EQ( voxset_error::read_only, copy.kind() );
}

TEST( ExceptionStream, ErrorKindNames ) {
    EXPECT_STREQ( "open_failure", voxset_error::to_string( voxset_error::open_failure ) );
    EXPECT_STREQ( "index_out_of_range", voxset_error::to_string( voxset_error::index_out_of_range ) );
    EXPECT_STREQ( "invalid_state", voxset_error::to_string( voxset_error::invalid_state ) );
    EXPECT_STREQ( "metadata_write_failure", voxset_error::to_string( voxset_error::metadata_write_failure ) );
    EXPECT_STREQ( "read_only", voxset_error::to_string( voxset_error::read_only ) );
    EXPECT_STREQ( "storage_read_failure", voxset_error::to_string( voxset_error::storage_read_failure ) );
}
