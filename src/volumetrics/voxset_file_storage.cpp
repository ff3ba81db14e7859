// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/logging/logging_level.hpp>
#include <stratum/misc/exception_stream.hpp>
#include <stratum/volumetrics/voxset_file_storage.hpp>

#include <zlib.h>

#include <limits>

using namespace std;
using namespace stratum;
using namespace stratum::volumetrics;

namespace {

const char* g_axisNames[] = { "x", "y", "z" };

} // anonymous namespace

voxset_file_storage::voxset_file_storage( const boost::filesystem::path& path )
    : m_path( path )
    , m_compression( voxset_compression_none )
    , m_rowReads( 0 ) {
    const string streamName = path.string();

    m_file.reset( files::tfopen( path, "rb" ) );
    if( !m_file ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: Failed to open the file \"" << streamName << "\" for reading.";
    }

    voxset_file_header header;
    serialize::read_header( m_file, streamName, header );

    m_header.valueType = get_data_type_from_voxset_file_type_code( header.typeCode );
    if( m_header.valueType == data_type_invalid ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has an unrecognized value type code "
            << header.typeCode << ".";
    }

    if( header.arrayKind != voxel_array_scalar && header.arrayKind != voxel_array_vector3 ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has an unrecognized array kind "
            << header.arrayKind << ".";
    }
    m_header.arrayKind = static_cast<voxel_array_kind>( header.arrayKind );

    m_header.dimensions.set( header.nx, header.ny, header.nz );
    if( m_header.dimensions.is_zero_or_negative() ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has invalid dimensions "
            << m_header.dimensions << ".";
    }

    if( header.compression < 0 || header.compression >= voxset_compression_count ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has an unrecognized compression "
            << header.compression << ".";
    }
    m_compression = static_cast<voxset_compression_t>( header.compression );

    m_location.origin.set( header.origin[0], header.origin[1], header.origin[2] );
    m_location.spacing.set( header.spacing[0], header.spacing[1], header.spacing[2] );

    const string csName = serialize::read_string( m_file, streamName );
    const string csDescriptor = serialize::read_string( m_file, streamName );
    m_coordinateSystem = geospatial::coordinate_system( csName, csDescriptor );

    read_location_arrays( streamName );
    read_row_index( streamName );

    ST_LOG( debug ) << "voxset_file_storage: Opened \"" << streamName << "\" " << m_header.dimensions << " "
                    << voxel_data_type_str( m_header.valueType ) << ", compression "
                    << get_voxset_compression_string( m_compression ) << std::endl;
}

voxset_file_storage::~voxset_file_storage() { close(); }

void voxset_file_storage::close() {
    if( m_file.get() ) {
        m_file.close();
        std::vector<char>().swap( m_compressedBuffer );
    }
}

std::string voxset_file_storage::name() const { return m_path.string(); }

void voxset_file_storage::read_location_arrays( const std::string& streamName ) {
    const int counts[3] = { m_header.dimensions.xsize(), m_header.dimensions.ysize(), m_header.dimensions.zsize() };
    std::vector<double> explicitLocations[3];

    for( int axis = 0; axis < 3; ++axis ) {
        if( !is_nonuniform_spacing( m_location.spacing[axis] ) )
            continue;
        explicitLocations[axis].resize( counts[axis] );
        if( std::fread( &explicitLocations[axis][0], sizeof( double ), counts[axis], m_file ) !=
            static_cast<std::size_t>( counts[axis] ) ) {
            throw voxset_exception( voxset_error::open_failure )
                << "voxset_file_storage: The file \"" << streamName << "\" is missing the " << g_axisNames[axis]
                << " locations of its non-uniform axis.";
        }
    }

    build_axis_locations( m_location.origin.x, m_location.spacing.x, counts[0], explicitLocations[0], m_xLocations );
    build_axis_locations( m_location.origin.y, m_location.spacing.y, counts[1], explicitLocations[1], m_yLocations );
    build_axis_locations( m_location.origin.z, m_location.spacing.z, counts[2], explicitLocations[2], m_zLocations );
}

void voxset_file_storage::read_row_index( const std::string& streamName ) {
    const boost::int64_t rowCount =
        static_cast<boost::int64_t>( m_header.dimensions.ysize() ) * m_header.dimensions.zsize();
    const boost::int64_t fileSize = files::file_size( m_path.string() );

    // Each row index entry takes 8 bytes, so a count beyond the file size means a corrupted header
    if( ( rowCount + 1 ) * 8 > fileSize ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" is too small to hold " << rowCount
            << " rows.";
    }

    m_rowOffsets.resize( static_cast<std::size_t>( rowCount + 1 ) );
    if( std::fread( &m_rowOffsets[0], sizeof( boost::int64_t ), m_rowOffsets.size(), m_file ) !=
        m_rowOffsets.size() ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has a truncated row index.";
    }

    const boost::int64_t dataStart = files::ftell64( m_file );
    const boost::int64_t uncompressedRowBytes =
        static_cast<boost::int64_t>( m_header.dimensions.xsize() ) * sizeof_voxel_data_type( m_header.valueType ) *
        ( m_header.arrayKind == voxel_array_vector3 ? 3 : 1 );

    if( m_rowOffsets.front() != dataStart || m_rowOffsets.back() > fileSize ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has a row index that does not match its data.";
    }
    for( std::size_t i = 0; i + 1 < m_rowOffsets.size(); ++i ) {
        const boost::int64_t rowBytes = m_rowOffsets[i + 1] - m_rowOffsets[i];
        const bool valid = m_compression == voxset_compression_none ? rowBytes == uncompressedRowBytes : rowBytes > 0;
        if( !valid ) {
            throw voxset_exception( voxset_error::open_failure )
                << "voxset_file_storage: The file \"" << streamName << "\" has an invalid size " << rowBytes
                << " for row " << i << ".";
        }
    }
}

void voxset_file_storage::get_location_arrays( std::vector<double>& outX, std::vector<double>& outY,
                                               std::vector<double>& outZ ) const {
    outX = m_xLocations;
    outY = m_yLocations;
    outZ = m_zLocations;
}

graphics::boundbox3fd voxset_file_storage::get_extent() const {
    return extent_from_locations( m_xLocations, m_yLocations, m_zLocations );
}

void voxset_file_storage::read_row( int plane, int row, voxel_row_buffer& outBuffer ) {
    const string streamName = m_path.string();
    if( !m_file.get() ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset_file_storage.read_row: The file \"" << streamName << "\" has been closed.";
    }
    if( m_header.arrayKind != voxel_array_scalar ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset_file_storage.read_row: The file \"" << streamName << "\" holds "
            << voxel_array_kind_str( m_header.arrayKind ) << " voxels, only scalar voxels can be read.";
    }
    if( plane < 0 || plane >= m_header.dimensions.zsize() || row < 0 || row >= m_header.dimensions.ysize() ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset_file_storage.read_row: Row (" << plane << ", " << row << ") is outside the grid "
            << m_header.dimensions << " of \"" << streamName << "\".";
    }

    const std::size_t rowIndex = static_cast<std::size_t>( plane ) * m_header.dimensions.ysize() + row;
    const boost::int64_t offset = m_rowOffsets[rowIndex];
    const std::size_t storedBytes = static_cast<std::size_t>( m_rowOffsets[rowIndex + 1] - offset );

    outBuffer.allocate( m_header.valueType, m_header.dimensions.xsize() );

    if( files::fseek64( m_file, offset, SEEK_SET ) != 0 ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset_file_storage.read_row: Failed to seek to row (" << plane << ", " << row << ") of \""
            << streamName << "\".";
    }

    if( m_compression == voxset_compression_none ) {
        if( std::fread( outBuffer.data(), 1, storedBytes, m_file ) != storedBytes ) {
            throw voxset_exception( voxset_error::storage_read_failure )
                << "voxset_file_storage.read_row: Failed to read row (" << plane << ", " << row << ") of \""
                << streamName << "\".";
        }
    } else {
        m_compressedBuffer.resize( storedBytes );
        if( std::fread( &m_compressedBuffer[0], 1, storedBytes, m_file ) != storedBytes ) {
            throw voxset_exception( voxset_error::storage_read_failure )
                << "voxset_file_storage.read_row: Failed to read row (" << plane << ", " << row << ") of \""
                << streamName << "\".";
        }
        uLongf destLen = static_cast<uLongf>( outBuffer.size_in_bytes() );
        int ret = uncompress( reinterpret_cast<Bytef*>( outBuffer.data() ), &destLen,
                              reinterpret_cast<const Bytef*>( &m_compressedBuffer[0] ),
                              static_cast<uLong>( storedBytes ) );
        if( ret != Z_OK || destLen != outBuffer.size_in_bytes() ) {
            throw voxset_exception( voxset_error::storage_read_failure )
                << "voxset_file_storage.read_row: Failed to decompress row (" << plane << ", " << row << ") of \""
                << streamName << "\", zlib error " << ret << ".";
        }
    }

    ++m_rowReads;
}
