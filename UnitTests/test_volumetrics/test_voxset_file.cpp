// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest/gtest.h"

#include "UnitTests/gtest-helper.h"
#include "UnitTests/utilities/scoped_temp_file.hpp"
#include "UnitTests/utilities/voxset_generators.hpp"

#include <stratum/files/files.hpp>
#include <stratum/logging/logging_level.hpp>
#include <stratum/volumetrics/voxset.hpp>
#include <stratum/volumetrics/voxset_file_storage.hpp>
#include <stratum/volumetrics/voxset_file_writer.hpp>

#include <cstdio>

using namespace stratum;
using namespace stratum::volumetrics;
using stratum::graphics::size3;
using stratum::graphics::vector3fd;

namespace {

std::vector<boost::int16_t> test_values( const size3& dims ) {
    std::vector<boost::int16_t> values( static_cast<std::size_t>( dims.volume() ) );
    for( std::size_t i = 0; i < values.size(); ++i )
        values[i] = static_cast<boost::int16_t>( i % 7 == 3 ? dummy::int16 : 100 * i );
    return values;
}

void overwrite_bytes( const std::string& path, long offset, const char* bytes, std::size_t count ) {
    files::file_ptr f( files::tfopen( path, "r+b" ) );
    ASSERT_TRUE( f.get() != 0 );
    ASSERT_EQ( 0, std::fseek( f, offset, SEEK_SET ) );
    ASSERT_EQ( count, std::fwrite( bytes, 1, count, f ) );
}

void check_file_contents( voxset_compression_t compression ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 5, 4, 3 );
    const std::vector<boost::int16_t> values = test_values( dims );
    voxel_simple_location location( vector3fd( 1.0, 2.0, 3.0 ), vector3fd( 0.25, 0.5, 10.0 ) );
    write_test_voxset( tempFile.get_path(), dims, location, values, compression,
                       geospatial::coordinate_system( "NAD83 / UTM zone 17N", "EPSG:26917" ) );

    voxset_file_storage storage( tempFile.get_path() );
    EXPECT_EQ( compression, storage.compression() );
    EXPECT_EQ( data_type_int16, storage.get_header().valueType );
    EXPECT_EQ( voxel_array_scalar, storage.get_header().arrayKind );
    EXPECT_EQ( dims, storage.get_header().dimensions );
    EXPECT_VECTOR3FD_EQ( location.origin, storage.get_simple_location().origin );
    EXPECT_VECTOR3FD_EQ( location.spacing, storage.get_simple_location().spacing );
    EXPECT_EQ( "NAD83 / UTM zone 17N", storage.get_coordinate_system().name() );
    EXPECT_EQ( "EPSG:26917", storage.get_coordinate_system().descriptor() );
    EXPECT_BOUNDBOX3FD_EQ( graphics::boundbox3fd( 1.0, 2.0, 2.0, 3.5, 3.0, 23.0 ), storage.get_extent() );

    // Rows are read in any order
    voxel_row_buffer buffer;
    for( int iz = dims.zsize() - 1; iz >= 0; --iz ) {
        for( int iy = 0; iy < dims.ysize(); ++iy ) {
            storage.read_row( iz, iy, buffer );
            ASSERT_EQ( 5u, buffer.size() );
            const boost::int16_t* row = buffer.as_array<boost::int16_t>();
            for( int ix = 0; ix < dims.xsize(); ++ix )
                EXPECT_EQ( values[( iz * 4 + iy ) * 5 + ix], row[ix] );
        }
    }
    EXPECT_EQ( 12, storage.row_reads() );

    EXPECT_VOXSET_ERROR( storage.read_row( 3, 0, buffer ), voxset_error::storage_read_failure );
    storage.close();
    EXPECT_FALSE( storage.is_open() );
    EXPECT_VOXSET_ERROR( storage.read_row( 0, 0, buffer ), voxset_error::storage_read_failure );
}

} // anonymous namespace

TEST( VoxsetFile, Uncompressed ) { check_file_contents( voxset_compression_none ); }

TEST( VoxsetFile, ZlibCompressed ) { check_file_contents( voxset_compression_zlib ); }

TEST( VoxsetFile, VoxsetOverFile ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 5, 4, 3 );
    const std::vector<boost::int16_t> values = test_values( dims );
    write_test_voxset( tempFile.get_path(), dims, voxel_simple_location(), values, voxset_compression_zlib );

    voxset vs( tempFile.get_path() );
    EXPECT_EQ( data_type_int16, vs.value_type() );
    EXPECT_FALSE( vs.coordinate_system().is_known() );
    for( boost::int64_t i = 0; i < vs.size(); ++i ) {
        voxel_sample s = vs.get( i );
        if( values[i] == dummy::int16 ) {
            EXPECT_TRUE( s.is_null() ) << i;
        } else {
            ASSERT_TRUE( s.value ) << i;
            EXPECT_EQ( values[i], s.value->as_int64() );
        }
    }
}

TEST( VoxsetFile, NonUniformAxes ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 3, 2, 4 );
    voxel_simple_location location( vector3fd( 0.0, 50.0, 0.0 ), vector3fd( dummy::float64, 10.0, dummy::float64 ) );
    std::vector<double> axisLocations[3];
    axisLocations[0].push_back( -1.0 );
    axisLocations[0].push_back( 0.5 );
    axisLocations[0].push_back( 4.0 );
    axisLocations[2].push_back( -100.0 );
    axisLocations[2].push_back( -60.0 );
    axisLocations[2].push_back( -35.0 );
    axisLocations[2].push_back( -20.0 );
    write_test_voxset( tempFile.get_path(), dims, location, std::vector<float>( 24, 2.5f ), voxset_compression_none,
                       geospatial::coordinate_system(), axisLocations );

    voxset vs( tempFile.get_path() );
    EXPECT_FALSE( vs.uniform_x() );
    EXPECT_TRUE( vs.uniform_y() );
    EXPECT_FALSE( vs.uniform_z() );
    EXPECT_EQ( axisLocations[0], vs.x_locations() );
    EXPECT_EQ( axisLocations[2], vs.z_locations() );
    EXPECT_VECTOR3FD_EQ( vector3fd( 4.0, 60.0, -35.0 ), vs.xyz( 2, 1, 2 ) );
    EXPECT_BOUNDBOX3FD_EQ( graphics::boundbox3fd( -1.0, 4.0, 50.0, 60.0, -100.0, -20.0 ), vs.extent() );
}

TEST( VoxsetFile, NonUniformAxisNeedsLocations ) {
    scoped_temp_file tempFile( ".voxset" );
    voxel_simple_location location( vector3fd( 0.0 ), vector3fd( dummy::float64, 1.0, 1.0 ) );
    logging::set_logging_level_in_scope quiet( logging::level::none );
    {
        voxset_file_writer writer( tempFile.get_path(), data_type_float32, size3( 2, 1, 1 ), location );
        EXPECT_THROW( writer.set_axis_locations( 0, std::vector<double>( 3, 0.0 ) ), std::runtime_error );
        EXPECT_THROW( writer.write_row( 0, 0, std::vector<float>( 2, 0.0f ) ), std::runtime_error );
    }
    // The incomplete file is removed
    EXPECT_FALSE( files::file_exists( tempFile.get_path() ) );
}

TEST( VoxsetFile, WriterRejectsOutOfOrderAndMissingRows ) {
    scoped_temp_file tempFile( ".voxset" );
    logging::set_logging_level_in_scope quiet( logging::level::none );

    voxset_file_writer writer( tempFile.get_path(), data_type_uint8, size3( 2, 2, 2 ), voxel_simple_location() );
    std::vector<boost::uint8_t> row( 2, 1 );
    EXPECT_THROW( writer.write_row( 0, 1, row ), std::runtime_error );
    writer.write_row( 0, 0, row );
    EXPECT_THROW( writer.write_row( 0, 0, row ), std::runtime_error );
    EXPECT_THROW( writer.write_row( 0, 1, std::vector<boost::uint16_t>( 2, 1 ) ), std::runtime_error );
    EXPECT_THROW( writer.write_row( 0, 1, std::vector<boost::uint8_t>( 3, 1 ) ), std::runtime_error );
    writer.write_row( 0, 1, row );
    EXPECT_EQ( 2, writer.rows_written() );
    EXPECT_THROW( writer.close(), std::runtime_error );
    EXPECT_TRUE( writer.is_open() );
}

TEST( VoxsetFile, CorruptFilesFailToOpen ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 2, 2, 2 );
    write_test_voxset( tempFile.get_path(), dims, voxel_simple_location(), std::vector<double>( 8, 1.0 ) );
    ASSERT_NO_THROW( voxset_file_storage storage( tempFile.get_path() ) );

    // Bad magic number
    overwrite_bytes( tempFile.get_path(), 1, "Q", 1 );
    EXPECT_VOXSET_ERROR( voxset vs( tempFile.get_path() ), voxset_error::open_failure );

    // Unknown value type code, which follows the magic, header length, signature and version
    write_test_voxset( tempFile.get_path(), dims, voxel_simple_location(), std::vector<double>( 8, 1.0 ) );
    const char badType[4] = { 99, 0, 0, 0 };
    overwrite_bytes( tempFile.get_path(), 8 + 4 + STRATUM_VOXSET_SIGNATURE_LENGTH + 4, badType, 4 );
    EXPECT_VOXSET_ERROR( voxset vs( tempFile.get_path() ), voxset_error::open_failure );

    // Truncated data
    write_test_voxset( tempFile.get_path(), dims, voxel_simple_location(), std::vector<double>( 8, 1.0 ) );
    boost::filesystem::resize_file( tempFile.get_path(), files::file_size( tempFile.get_path() ) - 8 );
    EXPECT_VOXSET_ERROR( voxset vs( tempFile.get_path() ), voxset_error::open_failure );

    // Not a voxset at all
    {
        files::file_ptr f( files::tfopen( tempFile.get_path(), "wb" ) );
        std::fputs( "<xml>this is not voxel data</xml>", f );
    }
    EXPECT_VOXSET_ERROR( voxset vs( tempFile.get_path() ), voxset_error::open_failure );
}

TEST( VoxsetFile, CorruptCompressedRowFailsOnRead ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 64, 1, 1 );
    write_test_voxset( tempFile.get_path(), dims, voxel_simple_location(), std::vector<double>( 64, 3.0 ),
                       voxset_compression_zlib );

    // Scribble over the end of the only row
    const long fileSize = static_cast<long>( files::file_size( tempFile.get_path() ) );
    const char junk[4] = { 1, 2, 3, 4 };
    overwrite_bytes( tempFile.get_path(), fileSize - 4, junk, 4 );

    voxset vs( tempFile.get_path() );
    EXPECT_VOXSET_ERROR( vs.get( 0 ), voxset_error::storage_read_failure );
}
