// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/geospatial/coordinate_system.hpp>
#include <stratum/graphics/boundbox3t.hpp>
#include <stratum/graphics/size3.hpp>
#include <stratum/graphics/vector3t.hpp>
#include <stratum/volumetrics/voxel_data_type.hpp>
#include <stratum/volumetrics/voxel_row_buffer.hpp>

#include <boost/shared_ptr.hpp>

#include <string>
#include <vector>

namespace stratum {
namespace volumetrics {

enum voxel_array_kind {
    // One value per voxel. The only kind a voxset accepts.
    voxel_array_scalar = 0,
    // Three components per voxel
    voxel_array_vector3 = 1
};

const char* voxel_array_kind_str( voxel_array_kind kind );

struct voxel_storage_header {
    data_type_t valueType;
    voxel_array_kind arrayKind;
    graphics::size3 dimensions;

    voxel_storage_header()
        : valueType( data_type_invalid )
        , arrayKind( voxel_array_scalar ) {}

    voxel_storage_header( data_type_t type, const graphics::size3& dims )
        : valueType( type )
        , arrayKind( voxel_array_scalar )
        , dimensions( dims ) {}
};

/**
 * The origin is the center of voxel (0,0,0). A spacing equal to dummy::float64 marks a non-uniform axis, whose
 * locations have to come from get_location_arrays().
 */
struct voxel_simple_location {
    graphics::vector3fd origin;
    graphics::vector3fd spacing;

    voxel_simple_location()
        : spacing( 1.0 ) {}

    voxel_simple_location( const graphics::vector3fd& origin_, const graphics::vector3fd& spacing_ )
        : origin( origin_ )
        , spacing( spacing_ ) {}
};

/**
 * The store a voxset reads its voxels from. Implementations deliver whole rows, where a row is all the x positions
 * for a fixed plane (z index) and row (y index).
 *
 * Any method may throw. Failures to open should be reported as voxset_exception with voxset_error::open_failure,
 * failures to read a row with voxset_error::storage_read_failure.
 */
class voxel_storage {
  public:
    virtual ~voxel_storage() {}

    /**
     * Releases the storage. Calling it more than once has no effect.
     */
    virtual void close() = 0;

    virtual std::string name() const = 0;

    virtual voxel_storage_header get_header() const = 0;

    virtual voxel_simple_location get_simple_location() const = 0;

    /**
     * Fills the center locations of every voxel along each axis. The arrays have nx, ny and nz entries.
     */
    virtual void get_location_arrays( std::vector<double>& outX, std::vector<double>& outY,
                                      std::vector<double>& outZ ) const = 0;

    virtual geospatial::coordinate_system get_coordinate_system() const = 0;

    /**
     * Reads the row at ( plane, row ) into outBuffer, allocating it as nx values of the storage's value type.
     * Dummy values are delivered unchanged.
     */
    virtual void read_row( int plane, int row, voxel_row_buffer& outBuffer ) = 0;

    /**
     * The bounding box of the voxel centers.
     */
    virtual graphics::boundbox3fd get_extent() const = 0;
};

typedef boost::shared_ptr<voxel_storage> voxel_storage_ptr;

/**
 * Computes the locations along one axis. Uniform axes are origin + i * spacing, non-uniform axes copy explicit.
 */
void build_axis_locations( double origin, double spacing, int count, const std::vector<double>& explicitLocations,
                           std::vector<double>& outLocations );

/**
 * The bounding box of a grid given its location arrays, or an empty box when any array is empty.
 */
graphics::boundbox3fd extent_from_locations( const std::vector<double>& xs, const std::vector<double>& ys,
                                             const std::vector<double>& zs );

} // namespace volumetrics
} // namespace stratum
