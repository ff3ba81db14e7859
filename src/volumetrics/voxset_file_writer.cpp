// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/logging/logging_level.hpp>
#include <stratum/volumetrics/voxset_file_writer.hpp>

#include <boost/lexical_cast.hpp>

#include <zlib.h>

#include <sstream>

using namespace std;
using namespace stratum;
using namespace stratum::volumetrics;

voxset_file_writer::voxset_file_writer( const boost::filesystem::path& path, data_type_t valueType,
                                        const graphics::size3& dimensions, const voxel_simple_location& location,
                                        const geospatial::coordinate_system& coordinateSystem,
                                        voxset_compression_t compression )
    : m_path( path )
    , m_valueType( valueType )
    , m_dimensions( dimensions )
    , m_location( location )
    , m_coordinateSystem( coordinateSystem )
    , m_compression( compression )
    , m_hasWrittenHeader( false )
    , m_rowIndexPosition( 0 )
    , m_nextRow( 0 ) {
    // Validates the type
    get_voxset_file_type_code( valueType );

    if( dimensions.is_zero_or_negative() )
        throw std::runtime_error( "voxset_file_writer: Invalid dimensions for \"" + path.string() + "\"" );
    if( compression < 0 || compression >= voxset_compression_count )
        throw std::runtime_error( "voxset_file_writer: Invalid compression for \"" + path.string() + "\"" );

    m_file.reset( files::tfopen( path, "wb" ) );
    if( !m_file )
        throw std::runtime_error( "voxset_file_writer: Failed to open the file \"" + path.string() +
                                  "\" for writing." );
}

voxset_file_writer::~voxset_file_writer() {
    if( m_file.get() ) {
        m_file.close();
        ST_LOG( warning ) << "voxset_file_writer: The file \"" << m_path.string()
                          << "\" was not closed, deleting the incomplete file" << std::endl;
        if( !files::delete_file_if_exists( m_path.string() ) )
            ST_LOG( error ) << "voxset_file_writer: Failed to delete \"" << m_path.string() << "\"" << std::endl;
    }
}

void voxset_file_writer::set_axis_locations( int axis, const std::vector<double>& locations ) {
    if( axis < 0 || axis > 2 )
        throw std::runtime_error( "voxset_file_writer.set_axis_locations: Invalid axis " +
                                  boost::lexical_cast<std::string>( axis ) );
    if( m_hasWrittenHeader )
        throw std::runtime_error( "voxset_file_writer.set_axis_locations: Locations must be set before any rows of \"" +
                                  m_path.string() + "\" are written" );
    const int count = axis == 0 ? m_dimensions.xsize() : ( axis == 1 ? m_dimensions.ysize() : m_dimensions.zsize() );
    if( static_cast<int>( locations.size() ) != count )
        throw std::runtime_error( "voxset_file_writer.set_axis_locations: Expected " +
                                  boost::lexical_cast<std::string>( count ) + " locations, got " +
                                  boost::lexical_cast<std::string>( locations.size() ) );
    m_axisLocations[axis] = locations;
}

void voxset_file_writer::write_header() {
    const string streamName = m_path.string();

    voxset_file_header header;
    header.headerLength = voxset_file_fixed_header_length();
    header.version = STRATUM_VOXSET_FILE_VERSION;
    header.typeCode = get_voxset_file_type_code( m_valueType );
    header.arrayKind = voxel_array_scalar;
    header.nx = m_dimensions.xsize();
    header.ny = m_dimensions.ysize();
    header.nz = m_dimensions.zsize();
    header.compression = m_compression;
    for( int i = 0; i < 3; ++i ) {
        header.origin[i] = m_location.origin[i];
        header.spacing[i] = m_location.spacing[i];
    }
    serialize::write_header( m_file, streamName, header );

    serialize::write_string( m_file, m_coordinateSystem.name(), streamName );
    serialize::write_string( m_file, m_coordinateSystem.descriptor(), streamName );

    for( int axis = 0; axis < 3; ++axis ) {
        if( !is_nonuniform_spacing( m_location.spacing[axis] ) )
            continue;
        if( m_axisLocations[axis].empty() )
            throw std::runtime_error( "voxset_file_writer: Axis " + boost::lexical_cast<std::string>( axis ) +
                                      " of \"" + streamName + "\" is non-uniform but has no locations" );
        const std::vector<double>& locations = m_axisLocations[axis];
        if( std::fwrite( &locations[0], sizeof( double ), locations.size(), m_file ) != locations.size() )
            throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );
    }

    // Reserve the row index, it gets filled in by close()
    m_rowIndexPosition = files::ftell64( m_file );
    const std::size_t indexSize = static_cast<std::size_t>( m_dimensions.ysize() ) * m_dimensions.zsize() + 1;
    m_rowOffsets.assign( indexSize, 0 );
    if( std::fwrite( &m_rowOffsets[0], sizeof( boost::int64_t ), indexSize, m_file ) != indexSize )
        throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );

    m_hasWrittenHeader = true;
}

void voxset_file_writer::write_row( int plane, int row, const void* values ) {
    const string streamName = m_path.string();
    if( !m_file.get() )
        throw std::runtime_error( "voxset_file_writer.write_row: The file \"" + streamName + "\" is closed" );

    const boost::int64_t rowIndex = static_cast<boost::int64_t>( plane ) * m_dimensions.ysize() + row;
    if( plane < 0 || plane >= m_dimensions.zsize() || row < 0 || row >= m_dimensions.ysize() ||
        rowIndex != m_nextRow ) {
        stringstream ss;
        ss << "voxset_file_writer.write_row: Row (" << plane << ", " << row << ") of \"" << streamName
           << "\" is out of order, expected row " << m_nextRow;
        throw std::runtime_error( ss.str() );
    }

    if( !m_hasWrittenHeader )
        write_header();

    const std::size_t rowBytes = static_cast<std::size_t>( m_dimensions.xsize() ) * sizeof_voxel_data_type( m_valueType );
    m_rowOffsets[static_cast<std::size_t>( rowIndex )] = files::ftell64( m_file );

    if( m_compression == voxset_compression_zlib ) {
        uLongf compressedSize = compressBound( static_cast<uLong>( rowBytes ) );
        // Detect overflow by making sure the compressBound function returned a value that's bigger
        if( compressedSize < rowBytes )
            throw std::runtime_error( "voxset_file_writer.write_row: A row of \"" + streamName + "\" is too big" );
        m_compressedBuffer.resize( compressedSize );
        int ret = compress2( reinterpret_cast<Bytef*>( &m_compressedBuffer[0] ), &compressedSize,
                             reinterpret_cast<const Bytef*>( values ), static_cast<uLong>( rowBytes ),
                             Z_DEFAULT_COMPRESSION );
        if( ret != Z_OK )
            throw std::runtime_error( "voxset_file_writer.write_row: zlib failed to compress a row of \"" +
                                      streamName + "\", error " + boost::lexical_cast<std::string>( ret ) );
        if( std::fwrite( &m_compressedBuffer[0], 1, compressedSize, m_file ) != compressedSize )
            throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );
    } else {
        if( std::fwrite( values, 1, rowBytes, m_file ) != rowBytes )
            throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );
    }

    ++m_nextRow;
}

void voxset_file_writer::close() {
    if( !m_file.get() )
        return;

    const string streamName = m_path.string();
    const boost::int64_t rowCount = static_cast<boost::int64_t>( m_dimensions.ysize() ) * m_dimensions.zsize();
    if( m_nextRow != rowCount ) {
        stringstream ss;
        ss << "voxset_file_writer.close: Only " << m_nextRow << " of " << rowCount << " rows were written to \""
           << streamName << "\"";
        throw std::runtime_error( ss.str() );
    }

    m_rowOffsets.back() = files::ftell64( m_file );
    if( files::fseek64( m_file, m_rowIndexPosition, SEEK_SET ) != 0 )
        throw std::runtime_error( "voxset_file_writer.close: Failed to seek in \"" + streamName + "\"" );
    if( std::fwrite( &m_rowOffsets[0], sizeof( boost::int64_t ), m_rowOffsets.size(), m_file ) !=
        m_rowOffsets.size() )
        throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );

    if( m_file.close() != 0 )
        throw std::runtime_error( "voxset_file_writer.close: Failed to close \"" + streamName + "\"" );

    ST_LOG( debug ) << "voxset_file_writer: Wrote \"" << streamName << "\" " << m_dimensions << " "
                    << voxel_data_type_str( m_valueType ) << std::endl;
}
