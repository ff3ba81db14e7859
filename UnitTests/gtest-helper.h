// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "gtest/gtest.h"

#include <stratum/graphics/boundbox3t.hpp>
#include <stratum/graphics/vector3t.hpp>
#include <stratum/misc/exception_stream.hpp>
#include <stratum/volumetrics/voxel_sample.hpp>

#include <iomanip>
#include <limits>
#include <sstream>

using stratum::graphics::boundbox3t;
using stratum::graphics::vector3t;
using stratum::volumetrics::voxel_sample;
using stratum::volumetrics::voxel_value;

#define EXPECT_VECTOR3FD_EQ( expected, actual )                                                                        \
    EXPECT_PRED_FORMAT2( ::testing::internal::cmpVector3tEQ<double>, expected, actual );

#define EXPECT_VECTOR3FD_NEAR( expected, actual, abs_error )                                                           \
    EXPECT_PRED_FORMAT3( ::testing::internal::vector3tNear<double>, expected, actual, abs_error )

#define EXPECT_BOUNDBOX3FD_EQ( expected, actual )                                                                      \
    EXPECT_PRED_FORMAT2( ::testing::internal::cmpBoundbox3tEQ<double>, expected, actual );

// Compares position and value, where a missing value only matches a missing value
#define EXPECT_VOXEL_SAMPLE_EQ( expected, actual )                                                                     \
    EXPECT_PRED_FORMAT2( ::testing::internal::cmpVoxelSample, expected, actual );

// Checks that a voxset call throws stratum::voxset_exception of the given kind
#define EXPECT_VOXSET_ERROR( statement, expectedKind )                                                                 \
    do {                                                                                                               \
        bool caughtExpected = false;                                                                                   \
        try {                                                                                                          \
            statement;                                                                                                 \
        } catch( const stratum::voxset_exception& e ) {                                                                \
            EXPECT_EQ( stratum::voxset_error::to_string( expectedKind ), stratum::voxset_error::to_string( e.kind() ) ) \
                << e.what();                                                                                           \
            caughtExpected = true;                                                                                     \
        }                                                                                                              \
        EXPECT_TRUE( caughtExpected ) << "Expected " #statement " to throw voxset_exception";                          \
    } while( false )

namespace testing {
namespace internal {

template <typename RawType>
bool almostEquals( vector3t<RawType> expected, vector3t<RawType> actual ) {
    FloatingPoint<RawType> lhsX( expected.x ), lhsY( expected.y ), lhsZ( expected.z );
    FloatingPoint<RawType> rhsX( actual.x ), rhsY( actual.y ), rhsZ( actual.z );
    if( lhsX.AlmostEquals( rhsX ) && lhsY.AlmostEquals( rhsY ) && lhsZ.AlmostEquals( rhsZ ) ) {
        return true;
    }
    return false;
}

template <typename RawType>
AssertionResult cmpVector3tEQ( const char* expected_expression, const char* actual_expression,
                               vector3t<RawType> expected, vector3t<RawType> actual ) {
    if( almostEquals( expected, actual ) ) {
        return AssertionSuccess();
    }
    ::std::stringstream expected_ss;
    expected_ss << std::setprecision( std::numeric_limits<RawType>::digits10 + 2 ) << expected;

    ::std::stringstream actual_ss;
    actual_ss << std::setprecision( std::numeric_limits<RawType>::digits10 + 2 ) << actual;
    return EqFailure( expected_expression, actual_expression, StringStreamToString( &expected_ss ),
                      StringStreamToString( &actual_ss ), false );
}

template <typename RawType>
AssertionResult vector3tNear( const char* expr1, const char* expr2, const char* abs_error_expr,
                              const vector3t<RawType>& val1, const vector3t<RawType>& val2, RawType abs_error ) {
    const RawType diff = vector3t<RawType>::distance( val1, val2 );
    if( diff <= abs_error )
        return AssertionSuccess();

    return AssertionFailure() << "The distance between " << expr1 << " and " << expr2 << " is " << diff
                              << ", which exceeds " << abs_error_expr << ", where\n"
                              << expr1 << " evaluates to " << val1 << ",\n"
                              << expr2 << " evaluates to " << val2 << ", and\n"
                              << abs_error_expr << " evaluates to " << abs_error << ".";
}

template <typename RawType>
AssertionResult cmpBoundbox3tEQ( const char* expected_expression, const char* actual_expression,
                                 boundbox3t<RawType> expected, boundbox3t<RawType> actual ) {
    if( almostEquals( expected.minimum(), actual.minimum() ) && almostEquals( expected.maximum(), actual.maximum() ) ) {
        return AssertionSuccess();
    }
    ::std::stringstream expected_ss;
    expected_ss << std::setprecision( std::numeric_limits<RawType>::digits10 + 2 ) << expected;

    ::std::stringstream actual_ss;
    actual_ss << std::setprecision( std::numeric_limits<RawType>::digits10 + 2 ) << actual;
    return EqFailure( expected_expression, actual_expression, StringStreamToString( &expected_ss ),
                      StringStreamToString( &actual_ss ), false );
}

AssertionResult cmpVoxelSample( const char* expected_expression, const char* actual_expression,
                                const voxel_sample& expected, const voxel_sample& actual );

} // namespace internal
} // namespace testing
