// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "UnitTests/gtest-helper.h"

namespace testing {
namespace internal {

AssertionResult cmpVoxelSample( const char* expected_expression, const char* actual_expression,
                                const voxel_sample& expected, const voxel_sample& actual ) {
    bool valuesMatch;
    if( !expected.value || !actual.value ) {
        valuesMatch = !expected.value && !actual.value;
    } else if( expected.value->is_integer() || actual.value->is_integer() ) {
        valuesMatch = *expected.value == *actual.value;
    } else {
        FloatingPoint<double> lhs( expected.value->as_double() ), rhs( actual.value->as_double() );
        valuesMatch = lhs.AlmostEquals( rhs );
    }

    if( valuesMatch && almostEquals( expected.position, actual.position ) ) {
        return AssertionSuccess();
    }

    ::std::stringstream expected_ss;
    expected_ss << std::setprecision( std::numeric_limits<double>::digits10 + 2 ) << expected;

    ::std::stringstream actual_ss;
    actual_ss << std::setprecision( std::numeric_limits<double>::digits10 + 2 ) << actual;
    return EqFailure( expected_expression, actual_expression, StringStreamToString( &expected_ss ),
                      StringStreamToString( &actual_ss ), false );
}

} // namespace internal
} // namespace testing
