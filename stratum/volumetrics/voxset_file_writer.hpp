// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/files/files.hpp>
#include <stratum/geospatial/coordinate_system.hpp>
#include <stratum/volumetrics/voxel_storage.hpp>
#include <stratum/volumetrics/voxset_file_common.hpp>

#include <boost/cstdint.hpp>
#include <boost/filesystem/path.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace stratum {
namespace volumetrics {

/**
 * Writes a .voxset file.
 *
 * To use this class:
 * 1. Construct it with the grid description.
 * 2. For each axis whose spacing is dummy::float64, call set_axis_locations.
 * 3. Call write_row for every row, planes from bottom to top and rows by increasing y within a plane.
 * 4. Call close. A writer destroyed before close deletes its incomplete file.
 */
class voxset_file_writer {
    boost::filesystem::path m_path;
    files::file_ptr m_file;

    data_type_t m_valueType;
    graphics::size3 m_dimensions;
    voxel_simple_location m_location;
    geospatial::coordinate_system m_coordinateSystem;
    voxset_compression_t m_compression;
    std::vector<double> m_axisLocations[3];

    bool m_hasWrittenHeader;
    boost::int64_t m_rowIndexPosition;
    std::vector<boost::int64_t> m_rowOffsets;
    // The next row to be written, counting planes times ny plus rows
    boost::int64_t m_nextRow;

    std::vector<char> m_compressedBuffer;

    voxset_file_writer( const voxset_file_writer& );            // not implemented
    voxset_file_writer& operator=( const voxset_file_writer& ); // not implemented

    void write_header();

  public:
    voxset_file_writer( const boost::filesystem::path& path, data_type_t valueType,
                        const graphics::size3& dimensions, const voxel_simple_location& location,
                        const geospatial::coordinate_system& coordinateSystem = geospatial::coordinate_system(),
                        voxset_compression_t compression = voxset_compression_none );

    ~voxset_file_writer();

    /**
     * Provides the locations of a non-uniform axis (0 for x, 1 for y, 2 for z). Must be called before the first row.
     */
    void set_axis_locations( int axis, const std::vector<double>& locations );

    /**
     * Writes one row of nx values in the native layout of the writer's value type. Rows must arrive in file order.
     */
    void write_row( int plane, int row, const void* values );

    template <class T>
    void write_row( int plane, int row, const std::vector<T>& values ) {
        if( voxel_data_type_traits<T>::data_type() != m_valueType )
            throw std::runtime_error( std::string( "voxset_file_writer.write_row: Values of type " ) +
                                      voxel_data_type_str( voxel_data_type_traits<T>::data_type() ) +
                                      " cannot be written to a " + voxel_data_type_str( m_valueType ) + " voxset" );
        if( values.size() != static_cast<std::size_t>( m_dimensions.xsize() ) )
            throw std::runtime_error( "voxset_file_writer.write_row: A row must have exactly nx values" );
        write_row( plane, row, static_cast<const void*>( &values[0] ) );
    }

    /**
     * Finishes the file by writing the row index. Throws std::runtime_error if any rows are missing.
     */
    void close();

    bool is_open() const { return m_file.get() != 0; }

    boost::int64_t rows_written() const { return m_nextRow; }
};

} // namespace volumetrics
} // namespace stratum
