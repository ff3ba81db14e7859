// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/misc/exception_stream.hpp>
#include <stratum/volumetrics/voxel_storage.hpp>
#include <stratum/volumetrics/voxset_file_writer.hpp>

#include <boost/lexical_cast.hpp>

#include <cstring>
#include <string>
#include <utility>
#include <vector>

/**
 * Writes a voxset file with values[iz*nx*ny + iy*nx + ix] as its voxels.
 */
template <class T>
void write_test_voxset( const std::string& path, const stratum::graphics::size3& dims,
                        const stratum::volumetrics::voxel_simple_location& location, const std::vector<T>& values,
                        stratum::volumetrics::voxset_compression_t compression =
                            stratum::volumetrics::voxset_compression_none,
                        const stratum::geospatial::coordinate_system& cs = stratum::geospatial::coordinate_system(),
                        const std::vector<double>* axisLocations = 0 ) {
    using namespace stratum::volumetrics;
    voxset_file_writer writer( path, voxel_data_type_traits<T>::data_type(), dims, location, cs, compression );
    if( axisLocations ) {
        for( int axis = 0; axis < 3; ++axis ) {
            if( is_nonuniform_spacing( location.spacing[axis] ) )
                writer.set_axis_locations( axis, axisLocations[axis] );
        }
    }
    const std::size_t nx = dims.xsize();
    for( int iz = 0; iz < dims.zsize(); ++iz ) {
        for( int iy = 0; iy < dims.ysize(); ++iy ) {
            const std::size_t start = ( static_cast<std::size_t>( iz ) * dims.ysize() + iy ) * nx;
            std::vector<T> row( values.begin() + start, values.begin() + start + nx );
            writer.write_row( iz, iy, row );
        }
    }
    writer.close();
}

/**
 * An in-memory voxel_storage that counts its calls, for checking how a voxset uses its storage.
 */
template <class T>
class mock_voxel_storage : public stratum::volumetrics::voxel_storage {
    stratum::volumetrics::voxel_storage_header m_header;
    stratum::volumetrics::voxel_simple_location m_location;
    std::vector<T> m_values;
    std::vector<double> m_axisLocations[3];
    std::string m_name;

  public:
    int rowReads;
    int locationRequests;
    int coordinateSystemRequests;
    int closeCalls;
    bool failReads;
    std::vector<std::pair<int, int> > readLog;

    mock_voxel_storage( const stratum::graphics::size3& dims,
                        const stratum::volumetrics::voxel_simple_location& location, const std::vector<T>& values )
        : m_header( stratum::volumetrics::voxel_data_type_traits<T>::data_type(), dims )
        , m_location( location )
        , m_values( values )
        , m_name( "mock" )
        , rowReads( 0 )
        , locationRequests( 0 )
        , coordinateSystemRequests( 0 )
        , closeCalls( 0 )
        , failReads( false ) {}

    void set_array_kind( stratum::volumetrics::voxel_array_kind kind ) { m_header.arrayKind = kind; }

    void set_axis_locations( int axis, const std::vector<double>& locations ) { m_axisLocations[axis] = locations; }

    virtual void close() { ++closeCalls; }

    virtual std::string name() const { return m_name; }

    virtual stratum::volumetrics::voxel_storage_header get_header() const { return m_header; }

    virtual stratum::volumetrics::voxel_simple_location get_simple_location() const { return m_location; }

    virtual void get_location_arrays( std::vector<double>& outX, std::vector<double>& outY,
                                      std::vector<double>& outZ ) const {
        ++const_cast<mock_voxel_storage*>( this )->locationRequests;
        build_locations( outX, outY, outZ );
    }

    void build_locations( std::vector<double>& outX, std::vector<double>& outY, std::vector<double>& outZ ) const {
        using stratum::volumetrics::build_axis_locations;
        build_axis_locations( m_location.origin.x, m_location.spacing.x, m_header.dimensions.xsize(),
                              m_axisLocations[0], outX );
        build_axis_locations( m_location.origin.y, m_location.spacing.y, m_header.dimensions.ysize(),
                              m_axisLocations[1], outY );
        build_axis_locations( m_location.origin.z, m_location.spacing.z, m_header.dimensions.zsize(),
                              m_axisLocations[2], outZ );
    }

    virtual stratum::geospatial::coordinate_system get_coordinate_system() const {
        ++const_cast<mock_voxel_storage*>( this )->coordinateSystemRequests;
        return stratum::geospatial::coordinate_system( "WGS 84", "EPSG:4326" );
    }

    virtual void read_row( int plane, int row, stratum::volumetrics::voxel_row_buffer& outBuffer ) {
        if( failReads )
            throw std::runtime_error( "mock_voxel_storage: Read failure requested" );
        ++rowReads;
        readLog.push_back( std::make_pair( plane, row ) );
        const int nx = m_header.dimensions.xsize();
        outBuffer.allocate( m_header.valueType, nx );
        const std::size_t start = ( static_cast<std::size_t>( plane ) * m_header.dimensions.ysize() + row ) * nx;
        std::memcpy( outBuffer.data(), &m_values[start], nx * sizeof( T ) );
    }

    virtual stratum::graphics::boundbox3fd get_extent() const {
        std::vector<double> xs, ys, zs;
        build_locations( xs, ys, zs );
        return stratum::volumetrics::extent_from_locations( xs, ys, zs );
    }
};
