// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest/gtest.h"

#include "UnitTests/gtest-helper.h"

#include <stratum/geospatial/coordinate_system.hpp>
#include <stratum/graphics/boundbox3t.hpp>
#include <stratum/graphics/boundrect2t.hpp>
#include <stratum/graphics/size3.hpp>
#include <stratum/graphics/vector3t.hpp>

#include <limits>
#include <sstream>

using namespace stratum;
using namespace stratum::graphics;

TEST( GridGeometry, Vector3 ) {
    vector3fd v( 1.0, 2.0, 2.0 );
    EXPECT_EQ( 3.0, v.get_magnitude() );
    EXPECT_EQ( 2.0, v[1] );
    EXPECT_VECTOR3FD_EQ( vector3fd( 2.0, 4.0, 4.0 ), v * 2.0 );
    EXPECT_VECTOR3FD_EQ( vector3fd( 0.0 ), v - v );
    EXPECT_TRUE( v.is_finite() );
    EXPECT_FALSE( vector3fd( std::numeric_limits<double>::quiet_NaN() ).is_finite() );

    std::stringstream ss;
    ss << vector3fd( 1.5, std::numeric_limits<double>::quiet_NaN(), -2.0 );
    EXPECT_EQ( "[1.5, nan, -2]", ss.str() );
}

TEST( GridGeometry, BoundsAndSize ) {
    boundbox3fd box;
    EXPECT_TRUE( box.is_empty() );
    box += vector3fd( 1.0, -2.0, 3.0 );
    box += vector3fd( -1.0, 5.0, 0.0 );
    EXPECT_FALSE( box.is_empty() );
    EXPECT_BOUNDBOX3FD_EQ( boundbox3fd( -1.0, 1.0, -2.0, 5.0, 0.0, 3.0 ), box );

    boundrect2fd rect = boundrect2fd::from_boundbox3( box );
    EXPECT_EQ( boundrect2fd( -1.0, -2.0, 1.0, 5.0 ), rect );
    EXPECT_EQ( 2.0, rect.xsize() );
    EXPECT_EQ( 7.0, rect.ysize() );

    size3 dims( 70000, 70000, 2 );
    EXPECT_EQ( boost::int64_t( 9800000000LL ), dims.volume() );
    EXPECT_FALSE( dims.is_zero_or_negative() );
    EXPECT_TRUE( size3( 1, 0, 1 ).is_zero_or_negative() );
}

TEST( GridGeometry, CoordinateSystem ) {
    geospatial::coordinate_system unknown = geospatial::coordinate_system::unknown();
    EXPECT_FALSE( unknown.is_known() );
    EXPECT_EQ( "*unknown", unknown.str() );

    geospatial::coordinate_system utm( "NAD83 / UTM zone 17N", "EPSG:26917" );
    EXPECT_TRUE( utm.is_known() );
    EXPECT_EQ( "NAD83 / UTM zone 17N", utm.str() );
    EXPECT_NE( unknown, utm );
    EXPECT_EQ( utm, geospatial::coordinate_system( "NAD83 / UTM zone 17N", "EPSG:26917" ) );
}
