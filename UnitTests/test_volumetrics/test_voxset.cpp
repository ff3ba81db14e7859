// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest/gtest.h"

#include "UnitTests/gtest-helper.h"
#include "UnitTests/utilities/scoped_temp_file.hpp"
#include "UnitTests/utilities/voxset_generators.hpp"

#include <stratum/diagnostics/resource_tracker.hpp>
#include <stratum/files/files.hpp>
#include <stratum/logging/logging_level.hpp>
#include <stratum/volumetrics/voxset.hpp>
#include <stratum/volumetrics/voxset_metadata.hpp>

#include <boost/filesystem/operations.hpp>
#include <boost/make_shared.hpp>

#include <limits>

using namespace stratum;
using namespace stratum::volumetrics;
using stratum::graphics::size3;
using stratum::graphics::vector3fd;

namespace {

voxel_simple_location unit_location() { return voxel_simple_location( vector3fd( 0.0 ), vector3fd( 1.0 ) ); }

// Values 0, 1, 2, ... in linear index order
template <class T>
std::vector<T> ramp_values( const size3& dims ) {
    std::vector<T> values( static_cast<std::size_t>( dims.volume() ) );
    for( std::size_t i = 0; i < values.size(); ++i )
        values[i] = static_cast<T>( i );
    return values;
}

template <class T>
boost::shared_ptr<mock_voxel_storage<T> > make_mock( const size3& dims, const voxel_simple_location& location,
                                                     const std::vector<T>& values ) {
    return boost::make_shared<mock_voxel_storage<T> >( dims, location, values );
}

// A three voxel row of T with the middle value missing
template <class T>
void check_missing_value_translation() {
    const T dummyValue = voxel_data_type_traits<T>::dummy_value();
    std::vector<T> values;
    values.push_back( static_cast<T>( 7 ) );
    values.push_back( dummyValue );
    values.push_back( static_cast<T>( 9 ) );

    boost::shared_ptr<mock_voxel_storage<T> > storage = make_mock( size3( 3, 1, 1 ), unit_location(), values );
    voxset vs( "missing", storage );

    EXPECT_EQ( voxel_data_type_traits<T>::data_type(), vs.value_type() );

    voxel_sample first = vs.get( 0, 0, 0 );
    ASSERT_TRUE( first.value ) << voxel_data_type_str( vs.value_type() );
    EXPECT_EQ( 7.0, first.value->as_double() );
    EXPECT_EQ( bool( std::numeric_limits<T>::is_integer ), first.value->is_integer() );

    EXPECT_TRUE( vs.get( 1, 0, 0 ).is_null() ) << voxel_data_type_str( vs.value_type() );

    voxel_sample last = vs.get( 2 );
    ASSERT_TRUE( last.value );
    EXPECT_EQ( 9.0, last.value->as_double() );
}

} // anonymous namespace

TEST( Voxset, TwoByTwoByOneIteratesInLinearOrder ) {
    scoped_temp_file tempFile( ".voxset" );
    std::vector<double> values;
    values.push_back( 1.0 );
    values.push_back( 2.0 );
    values.push_back( 3.0 );
    values.push_back( 4.0 );
    write_test_voxset( tempFile.get_path(), size3( 2, 2, 1 ), unit_location(), values );

    voxset vs( tempFile.get_path() );
    std::vector<voxel_sample> samples;
    voxel_sample sample;
    while( vs.next( sample ) )
        samples.push_back( sample );

    ASSERT_EQ( 4u, samples.size() );
    EXPECT_VOXEL_SAMPLE_EQ( voxel_sample( vector3fd( 0, 0, 0 ), voxel_value::from_double( 1.0 ) ), samples[0] );
    EXPECT_VOXEL_SAMPLE_EQ( voxel_sample( vector3fd( 1, 0, 0 ), voxel_value::from_double( 2.0 ) ), samples[1] );
    EXPECT_VOXEL_SAMPLE_EQ( voxel_sample( vector3fd( 0, 1, 0 ), voxel_value::from_double( 3.0 ) ), samples[2] );
    EXPECT_VOXEL_SAMPLE_EQ( voxel_sample( vector3fd( 1, 1, 0 ), voxel_value::from_double( 4.0 ) ), samples[3] );
}

TEST( Voxset, LinearIndexMatchesAxisIndices ) {
    const size3 dims( 3, 4, 2 );
    voxel_simple_location location( vector3fd( 10.0, 20.0, -5.0 ), vector3fd( 0.5, 2.0, 3.0 ) );
    voxset vs( "grid", make_mock( dims, location, ramp_values<boost::int32_t>( dims ) ) );

    ASSERT_EQ( 24, vs.size() );
    for( int iz = 0; iz < dims.zsize(); ++iz ) {
        for( int iy = 0; iy < dims.ysize(); ++iy ) {
            for( int ix = 0; ix < dims.xsize(); ++ix ) {
                const boost::int64_t i = static_cast<boost::int64_t>( iz ) * 12 + iy * 3 + ix;
                voxel_sample byAxes = vs.get( ix, iy, iz );
                voxel_sample byIndex = vs.get( i );
                EXPECT_VOXEL_SAMPLE_EQ( byAxes, byIndex );
                ASSERT_TRUE( byIndex.value );
                EXPECT_EQ( i, byIndex.value->as_int64() );
                EXPECT_VECTOR3FD_EQ( vector3fd( 10.0 + 0.5 * ix, 20.0 + 2.0 * iy, -5.0 + 3.0 * iz ), byIndex.position );
            }
        }
    }
    EXPECT_VOXEL_SAMPLE_EQ( vs.get( 5 ), vs[5] );
}

TEST( Voxset, IterationIsCompleteAndRestartable ) {
    const size3 dims( 2, 3, 2 );
    voxset vs( "grid", make_mock( dims, unit_location(), ramp_values<float>( dims ) ) );

    std::vector<voxel_sample> firstPass, secondPass;
    voxel_sample sample;
    while( vs.next( sample ) )
        firstPass.push_back( sample );
    EXPECT_EQ( 0, vs.cursor() );
    while( vs.next( sample ) )
        secondPass.push_back( sample );

    ASSERT_EQ( 12u, firstPass.size() );
    ASSERT_EQ( firstPass.size(), secondPass.size() );
    for( std::size_t i = 0; i < firstPass.size(); ++i ) {
        EXPECT_VOXEL_SAMPLE_EQ( vs.get( static_cast<boost::int64_t>( i ) ), firstPass[i] );
        EXPECT_VOXEL_SAMPLE_EQ( firstPass[i], secondPass[i] );
    }

    // reset() in the middle starts over
    vs.next( sample );
    vs.next( sample );
    EXPECT_EQ( 2, vs.cursor() );
    vs.reset();
    ASSERT_TRUE( vs.next( sample ) );
    EXPECT_VOXEL_SAMPLE_EQ( firstPass[0], sample );
}

TEST( Voxset, IteratorSharesTheCursor ) {
    const size3 dims( 2, 2, 2 );
    voxset vs( "grid", make_mock( dims, unit_location(), ramp_values<boost::int16_t>( dims ) ) );

    std::vector<boost::int64_t> values;
    for( voxset::iterator it = vs.begin(), itEnd = vs.end(); it != itEnd; ++it )
        values.push_back( it->value->as_int64() );
    ASSERT_EQ( 8u, values.size() );
    for( std::size_t i = 0; i < values.size(); ++i )
        EXPECT_EQ( static_cast<boost::int64_t>( i ), values[i] );

    // Taking three samples leaves the cursor at 3, and begin() continues from there
    voxel_sample sample;
    vs.next( sample );
    vs.next( sample );
    vs.next( sample );
    voxset::iterator it = vs.begin();
    ASSERT_TRUE( it != vs.end() );
    EXPECT_EQ( 3, it->value->as_int64() );

    int remaining = 0;
    for( ; it != vs.end(); ++it )
        ++remaining;
    EXPECT_EQ( 5, remaining );
    EXPECT_EQ( 0, vs.cursor() );
}

TEST( Voxset, MissingValuesForEveryType ) {
    check_missing_value_translation<boost::int8_t>();
    check_missing_value_translation<boost::int16_t>();
    check_missing_value_translation<boost::int32_t>();
    check_missing_value_translation<boost::int64_t>();
    check_missing_value_translation<boost::uint8_t>();
    check_missing_value_translation<boost::uint16_t>();
    check_missing_value_translation<boost::uint32_t>();
    check_missing_value_translation<boost::uint64_t>();
    check_missing_value_translation<float>();
    check_missing_value_translation<double>();
}

TEST( Voxset, StoredNaNIsMissing ) {
    std::vector<float> values( 2, 1.5f );
    values[1] = std::numeric_limits<float>::quiet_NaN();
    voxset vs( "nan", make_mock( size3( 2, 1, 1 ), unit_location(), values ) );
    EXPECT_FALSE( vs.get( 0 ).is_null() );
    EXPECT_TRUE( vs.get( 1 ).is_null() );
}

TEST( Voxset, IntegersKeepFullPrecision ) {
    std::vector<boost::uint64_t> values;
    values.push_back( std::numeric_limits<boost::uint64_t>::max() - 1 );
    std::vector<boost::int64_t> signedValues;
    signedValues.push_back( std::numeric_limits<boost::int64_t>::min() );

    voxset unsignedVoxset( "u64", make_mock( size3( 1, 1, 1 ), unit_location(), values ) );
    voxel_sample s = unsignedVoxset.get( 0 );
    ASSERT_TRUE( s.value );
    EXPECT_EQ( voxel_value::unsigned_integer, s.value->domain() );
    EXPECT_EQ( std::numeric_limits<boost::uint64_t>::max() - 1, s.value->as_uint64() );

    // The int64 dummy is min() + 1, so min() itself is a real value
    voxset signedVoxset( "i64", make_mock( size3( 1, 1, 1 ), unit_location(), signedValues ) );
    s = signedVoxset.get( 0 );
    ASSERT_TRUE( s.value );
    EXPECT_EQ( std::numeric_limits<boost::int64_t>::min(), s.value->as_int64() );
}

TEST( Voxset, RowCacheReadsEachRowOnce ) {
    const size3 dims( 4, 3, 2 );
    boost::shared_ptr<mock_voxel_storage<float> > storage = make_mock( dims, unit_location(), ramp_values<float>( dims ) );
    voxset vs( "grid", storage );

    voxel_sample sample;
    while( vs.next( sample ) ) {
    }
    EXPECT_EQ( 6, storage->rowReads );
    EXPECT_EQ( 6, vs.row_read_count() );
    for( std::size_t i = 0; i < storage->readLog.size(); ++i ) {
        EXPECT_EQ( static_cast<int>( i ) / 3, storage->readLog[i].first );
        EXPECT_EQ( static_cast<int>( i ) % 3, storage->readLog[i].second );
    }

    // Within one row nothing more is read
    storage->rowReads = 0;
    vs.get( 0, 0, 0 );
    vs.get( 3, 0, 0 );
    vs.get( 1, 0, 0 );
    EXPECT_EQ( 1, storage->rowReads );

    // Only one row is kept, so alternating rows reads every time
    vs.get( 0, 1, 0 );
    vs.get( 0, 0, 0 );
    vs.get( 0, 0, 1 );
    vs.get( 0, 0, 0 );
    EXPECT_EQ( 5, storage->rowReads );
}

TEST( Voxset, PropertiesAreFetchedOnce ) {
    const size3 dims( 2, 2, 2 );
    boost::shared_ptr<mock_voxel_storage<float> > storage = make_mock( dims, unit_location(), ramp_values<float>( dims ) );
    voxset vs( "grid", storage );

    EXPECT_EQ( 0, storage->locationRequests );
    EXPECT_EQ( 0, storage->coordinateSystemRequests );

    vs.xyz( 1, 1, 1 );
    vs.x_locations();
    vs.get( 7 );
    EXPECT_EQ( 1, storage->locationRequests );

    EXPECT_EQ( "WGS 84", vs.coordinate_system().name() );
    EXPECT_EQ( "EPSG:4326", vs.coordinate_system().descriptor() );
    EXPECT_EQ( 1, storage->coordinateSystemRequests );
}

TEST( Voxset, UniformAndNonUniformSpacing ) {
    const size3 dims( 3, 3, 2 );
    voxel_simple_location location( vector3fd( 100.0, 0.0, -10.0 ), vector3fd( 2.0, dummy::float64, 5.0 ) );
    boost::shared_ptr<mock_voxel_storage<double> > storage =
        make_mock( dims, location, ramp_values<double>( dims ) );
    std::vector<double> ys;
    ys.push_back( 0.0 );
    ys.push_back( 1.0 );
    ys.push_back( 5.0 );
    storage->set_axis_locations( 1, ys );

    voxset vs( "grid", storage );
    EXPECT_TRUE( vs.uniform_x() );
    EXPECT_FALSE( vs.uniform_y() );
    EXPECT_TRUE( vs.uniform_z() );
    ASSERT_TRUE( vs.spacing_x() );
    EXPECT_EQ( 2.0, *vs.spacing_x() );
    EXPECT_FALSE( vs.spacing_y() );
    ASSERT_TRUE( vs.spacing_z() );
    EXPECT_EQ( 5.0, *vs.spacing_z() );
    EXPECT_VECTOR3FD_EQ( vector3fd( 100.0, 0.0, -10.0 ), vs.origin() );

    EXPECT_VECTOR3FD_EQ( vector3fd( 104.0, 5.0, -5.0 ), vs.xyz( 2, 2, 1 ) );
    EXPECT_EQ( ys, vs.y_locations() );

    EXPECT_BOUNDBOX3FD_EQ( graphics::boundbox3fd( 100.0, 104.0, 0.0, 5.0, -10.0, -5.0 ), vs.extent() );
    EXPECT_EQ( graphics::boundrect2fd( 100.0, 0.0, 104.0, 5.0 ), vs.extent_2d() );
}

TEST( Voxset, BoundsAreEnforced ) {
    const size3 dims( 2, 3, 4 );
    voxset vs( "grid", make_mock( dims, unit_location(), ramp_values<boost::uint8_t>( dims ) ) );

    EXPECT_NO_THROW( vs.xyz( 1, 2, 3 ) );
    EXPECT_VOXSET_ERROR( vs.xyz( -1, 0, 0 ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.xyz( 2, 0, 0 ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.xyz( 0, 3, 0 ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.xyz( 0, 0, 4 ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.xyz( 0, -1, 0 ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.get( 0, 0, -1 ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.get( boost::int64_t( 24 ) ), voxset_error::index_out_of_range );
    EXPECT_VOXSET_ERROR( vs.get( boost::int64_t( -1 ) ), voxset_error::index_out_of_range );
}

TEST( Voxset, AccessAfterCloseFails ) {
    const size3 dims( 2, 2, 1 );
    boost::shared_ptr<mock_voxel_storage<float> > storage = make_mock( dims, unit_location(), ramp_values<float>( dims ) );
    voxset vs( "grid", storage );
    vs.get( 0 );
    vs.close();

    EXPECT_FALSE( vs.is_open() );
    EXPECT_EQ( 1, storage->closeCalls );

    voxel_sample sample;
    EXPECT_VOXSET_ERROR( vs.get( 0 ), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.get( 0, 0, 0 ), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.next( sample ), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.reset(), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.xyz( 0, 0, 0 ), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.dimensions(), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.extent(), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.coordinate_system(), voxset_error::invalid_state );
    EXPECT_VOXSET_ERROR( vs.value_type(), voxset_error::invalid_state );

    // Closing again does nothing
    vs.close();
    EXPECT_EQ( 1, storage->closeCalls );
}

TEST( Voxset, StorageReadFailure ) {
    const size3 dims( 2, 2, 1 );
    boost::shared_ptr<mock_voxel_storage<float> > storage = make_mock( dims, unit_location(), ramp_values<float>( dims ) );
    voxset vs( "grid", storage );

    storage->failReads = true;
    EXPECT_VOXSET_ERROR( vs.get( 0 ), voxset_error::storage_read_failure );

    // The failed row is not treated as cached
    storage->failReads = false;
    voxel_sample s = vs.get( 1 );
    ASSERT_TRUE( s.value );
    EXPECT_EQ( 1.0, s.value->as_double() );
    EXPECT_EQ( 1, storage->rowReads );
}

TEST( Voxset, OpenFailures ) {
    scoped_temp_file tempFile( ".voxset" );
    EXPECT_VOXSET_ERROR( voxset vs( tempFile.get_path() ), voxset_error::open_failure );

    boost::shared_ptr<mock_voxel_storage<float> > storage =
        make_mock( size3( 1, 1, 1 ), unit_location(), std::vector<float>( 1, 0.0f ) );
    storage->set_array_kind( voxel_array_vector3 );
    diagnostics::resource_tracker tracker;
    EXPECT_VOXSET_ERROR( voxset vs( "vector", storage, mode_read, tracker.hook() ), voxset_error::open_failure );
    EXPECT_EQ( 1, storage->closeCalls );
    EXPECT_EQ( 0, tracker.total_opened() );
}

TEST( Voxset, NamesAndFileNames ) {
    EXPECT_EQ( "grid.voxset", voxset_file_name( "grid" ) );
    EXPECT_EQ( "grid.VOXSET", voxset_file_name( "grid.VOXSET" ) );
    EXPECT_EQ( "grid.voxset.xml", voxset_metadata_file_name( "grid.voxset" ) );

    voxset vs( "data/survey_2024", make_mock( size3( 1, 1, 1 ), unit_location(), std::vector<float>( 1, 0.0f ) ),
               mode_readwrite );
    EXPECT_EQ( "survey_2024", vs.name() );
    EXPECT_EQ( "data/survey_2024.voxset", vs.file_name() );
    EXPECT_EQ( "data/survey_2024.voxset.xml", vs.metadata_file_name() );
    EXPECT_EQ( mode_readwrite, vs.mode() );
    EXPECT_TRUE( vs.is_open() );
}

TEST( Voxset, MetadataIsWrittenOnlyWhenChanged ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 2, 1, 1 );
    write_test_voxset( tempFile.get_path(), dims, unit_location(), ramp_values<float>( dims ) );
    const std::string sidecar = tempFile.get_path() + ".xml";

    {
        voxset vs( tempFile.get_path(), mode_readwrite );
        vs.get( 0 );
    }
    EXPECT_FALSE( files::file_exists( sidecar ) );

    {
        voxset vs( tempFile.get_path(), mode_readwrite );
        vs.set_metadata( "survey/operator", "Ada" );
        vs.set_metadata( "survey/year", "2024" );
        EXPECT_TRUE( vs.is_metadata_changed() );
        vs.close();
        EXPECT_TRUE( files::file_exists( sidecar ) );

        // A second close doesn't write again
        files::delete_file( sidecar );
        vs.close();
        EXPECT_FALSE( files::file_exists( sidecar ) );
    }

    {
        voxset vs( tempFile.get_path(), mode_readwrite );
        vs.set_metadata( "survey/operator", "Ada" );
        vs.set_metadata( "survey/year", "2024" );
    }
    {
        voxset vs( tempFile.get_path() );
        EXPECT_EQ( "Ada", vs.metadata().get( "survey/operator" ) );
        EXPECT_EQ( 2024, vs.metadata().get_as<int>( "survey/year", 0 ) );
        EXPECT_FALSE( vs.is_metadata_changed() );
    }

    // Existing entries survive a later change
    {
        voxset vs( tempFile.get_path(), mode_readwrite );
        vs.set_metadata( "survey/year", "2025" );
    }
    voxset_metadata md;
    md.read( sidecar );
    EXPECT_EQ( 2u, md.size() );
    EXPECT_EQ( "Ada", md.get( "survey/operator" ) );
    EXPECT_EQ( "2025", md.get( "survey/year" ) );
}

TEST( Voxset, SettingTheSameValueIsNotAChange ) {
    voxset vs( "grid", make_mock( size3( 1, 1, 1 ), unit_location(), std::vector<float>( 1, 0.0f ) ),
               mode_readwrite );
    vs.set_metadata( "a", "1" );
    EXPECT_TRUE( vs.is_metadata_changed() );

    voxset other( "grid2", make_mock( size3( 1, 1, 1 ), unit_location(), std::vector<float>( 1, 0.0f ) ),
                  mode_readwrite );
    other.update_metadata( std::map<std::string, std::string>() );
    EXPECT_FALSE( other.is_metadata_changed() );
    EXPECT_FALSE( other.remove_metadata( "missing" ) );
    EXPECT_FALSE( other.is_metadata_changed() );
}

TEST( Voxset, ReadOnlyMetadata ) {
    voxset vs( "grid", make_mock( size3( 1, 1, 1 ), unit_location(), std::vector<float>( 1, 0.0f ) ) );
    EXPECT_VOXSET_ERROR( vs.set_metadata( "a", "b" ), voxset_error::read_only );
    EXPECT_VOXSET_ERROR( vs.remove_metadata( "a" ), voxset_error::read_only );
    EXPECT_VOXSET_ERROR( vs.update_metadata( std::map<std::string, std::string>() ), voxset_error::read_only );
    EXPECT_FALSE( vs.is_metadata_changed() );
}

TEST( Voxset, MetadataWriteFailure ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 1, 1, 1 );
    write_test_voxset( tempFile.get_path(), dims, unit_location(), ramp_values<float>( dims ) );
    // A directory where the sidecar should go makes the write fail
    boost::filesystem::create_directory( tempFile.get_path() + ".xml" );

    diagnostics::resource_tracker tracker;
    {
        voxset vs( tempFile.get_path(), mode_readwrite, tracker.hook() );
        vs.set_metadata( "key", "value" );

        logging::set_logging_level_in_scope quiet( logging::level::none );
        EXPECT_VOXSET_ERROR( vs.close(), voxset_error::metadata_write_failure );
        EXPECT_FALSE( vs.is_open() );
        EXPECT_EQ( 0, tracker.open_count() );
        EXPECT_NO_THROW( vs.close() );
    }
    EXPECT_EQ( 1, tracker.total_closed() );

    // A destructor driven close only logs the failure
    {
        logging::scoped_log_capture capture;
        {
            voxset vs( tempFile.get_path(), mode_readwrite, tracker.hook() );
            vs.set_metadata( "key", "value" );
        }
        EXPECT_NE( std::string::npos, capture.str().find( "Failed to write the metadata" ) );
    }
    EXPECT_EQ( 0, tracker.open_count() );
}

TEST( Voxset, ResourceHookSeesEveryOpenAndClose ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 2, 2, 1 );
    write_test_voxset( tempFile.get_path(), dims, unit_location(), ramp_values<float>( dims ) );

    diagnostics::resource_tracker tracker;
    {
        voxset_ptr first = voxset::open( tempFile.get_path(), mode_read, tracker.hook() );
        voxset second( tempFile.get_path(), mode_read, tracker.hook() );
        EXPECT_EQ( 2, tracker.open_count() );
        first->close();
        first->close();
        EXPECT_EQ( 1, tracker.open_count() );
    }
    EXPECT_EQ( 0, tracker.open_count() );
    EXPECT_EQ( 2, tracker.total_opened() );
    EXPECT_EQ( 2, tracker.total_closed() );

    // Leaving scope through an exception closes too
    try {
        voxset vs( tempFile.get_path(), mode_read, tracker.hook() );
        vs.get( boost::int64_t( 100 ) );
    } catch( const voxset_exception& e ) {
        EXPECT_EQ( voxset_error::index_out_of_range, e.kind() );
    }
    EXPECT_EQ( 0, tracker.open_count() );
}

TEST( Voxset, DeleteFiles ) {
    scoped_temp_file tempFile( ".voxset" );
    const size3 dims( 1, 1, 1 );
    write_test_voxset( tempFile.get_path(), dims, unit_location(), ramp_values<float>( dims ) );
    {
        voxset vs( tempFile.get_path(), mode_readwrite );
        vs.set_metadata( "key", "value" );
    }
    ASSERT_TRUE( files::file_exists( tempFile.get_path() ) );
    ASSERT_TRUE( files::file_exists( tempFile.get_path() + ".xml" ) );

    voxset::delete_files( tempFile.get_path() );
    EXPECT_FALSE( files::file_exists( tempFile.get_path() ) );
    EXPECT_FALSE( files::file_exists( tempFile.get_path() + ".xml" ) );

    // Nothing left to delete is fine
    EXPECT_NO_THROW( voxset::delete_files( tempFile.get_path() ) );
}
