// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/volumetrics/voxel_storage.hpp>

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <stdexcept>

namespace stratum {
namespace volumetrics {

const char* voxel_array_kind_str( voxel_array_kind kind ) {
    switch( kind ) {
    case voxel_array_scalar:
        return "scalar";
    case voxel_array_vector3:
        return "vector3";
    default:
        return "unknown";
    }
}

void build_axis_locations( double origin, double spacing, int count, const std::vector<double>& explicitLocations,
                           std::vector<double>& outLocations ) {
    if( is_nonuniform_spacing( spacing ) ) {
        if( static_cast<int>( explicitLocations.size() ) != count )
            throw std::runtime_error( "build_axis_locations: A non-uniform axis of " +
                                      boost::lexical_cast<std::string>( count ) + " voxels was given " +
                                      boost::lexical_cast<std::string>( explicitLocations.size() ) + " locations" );
        outLocations = explicitLocations;
        return;
    }

    outLocations.resize( count > 0 ? count : 0 );
    for( int i = 0; i < count; ++i )
        outLocations[i] = origin + i * spacing;
}

graphics::boundbox3fd extent_from_locations( const std::vector<double>& xs, const std::vector<double>& ys,
                                             const std::vector<double>& zs ) {
    if( xs.empty() || ys.empty() || zs.empty() )
        return graphics::boundbox3fd::from_empty();

    // Locations usually increase, but a negative spacing makes them decrease
    return graphics::boundbox3fd( *std::min_element( xs.begin(), xs.end() ), *std::max_element( xs.begin(), xs.end() ),
                                  *std::min_element( ys.begin(), ys.end() ), *std::max_element( ys.begin(), ys.end() ),
                                  *std::min_element( zs.begin(), zs.end() ),
                                  *std::max_element( zs.begin(), zs.end() ) );
}

} // namespace volumetrics
} // namespace stratum
