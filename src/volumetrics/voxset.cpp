// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/files/files.hpp>
#include <stratum/files/paths.hpp>
#include <stratum/logging/logging_level.hpp>
#include <stratum/misc/exception_stream.hpp>
#include <stratum/volumetrics/voxset.hpp>
#include <stratum/volumetrics/voxset_file_common.hpp>
#include <stratum/volumetrics/voxset_file_storage.hpp>

namespace stratum {
namespace volumetrics {

namespace {

const char* g_resourceType = "voxset";

} // anonymous namespace

std::string voxset_file_name( const std::string& name ) {
    return files::ensure_extension( name, voxset_file_extension() );
}

std::string voxset_metadata_file_name( const std::string& fileName ) { return fileName + ".xml"; }

voxset::voxset( const std::string& name, voxset_open_mode mode, const diagnostics::resource_hook& hook )
    : m_fileName( voxset_file_name( name ) )
    , m_mode( mode )
    , m_hook( hook )
    , m_typeInfo( 0 )
    , m_cachedPlane( -1 )
    , m_cachedRow( -1 )
    , m_rowReadCount( 0 )
    , m_cursor( 0 )
    , m_metadataChanged( false ) {
    m_name = files::basename_from_path( m_fileName );

    voxel_storage_ptr storage;
    try {
        storage.reset( new voxset_file_storage( m_fileName ) );
    } catch( const voxset_exception& ) {
        throw;
    } catch( const std::exception& e ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset: Failed to open \"" << m_fileName << "\": " << e.what();
    }
    initialize( storage );
}

voxset::voxset( const std::string& name, const voxel_storage_ptr& storage, voxset_open_mode mode,
                const diagnostics::resource_hook& hook )
    : m_fileName( voxset_file_name( name ) )
    , m_mode( mode )
    , m_hook( hook )
    , m_typeInfo( 0 )
    , m_cachedPlane( -1 )
    , m_cachedRow( -1 )
    , m_rowReadCount( 0 )
    , m_cursor( 0 )
    , m_metadataChanged( false ) {
    m_name = files::basename_from_path( m_fileName );
    if( !storage )
        throw voxset_exception( voxset_error::open_failure ) << "voxset: No storage was provided for \"" << m_name
                                                             << "\".";
    initialize( storage );
}

voxset::~voxset() {
    try {
        std::string metadataError;
        // A metadata write failure has already been logged by close_resources
        close_resources( metadataError );
    } catch( const std::exception& e ) {
        ST_LOG( error ) << "voxset: Error while closing \"" << m_name << "\": " << e.what() << std::endl;
    }
}

boost::shared_ptr<voxset> voxset::open( const std::string& name, voxset_open_mode mode,
                                        const diagnostics::resource_hook& hook ) {
    return boost::shared_ptr<voxset>( new voxset( name, mode, hook ) );
}

void voxset::initialize( const voxel_storage_ptr& storage ) {
    try {
        const voxel_storage_header header = storage->get_header();
        if( header.arrayKind != voxel_array_scalar ) {
            throw voxset_exception( voxset_error::open_failure )
                << "voxset: \"" << m_name << "\" holds " << voxel_array_kind_str( header.arrayKind )
                << " voxels, only scalar voxel data can be opened.";
        }
        if( header.valueType == data_type_invalid ) {
            throw voxset_exception( voxset_error::open_failure )
                << "voxset: \"" << m_name << "\" has an invalid value type.";
        }
        if( header.dimensions.is_zero_or_negative() ) {
            throw voxset_exception( voxset_error::open_failure )
                << "voxset: \"" << m_name << "\" has invalid dimensions " << header.dimensions << ".";
        }

        m_typeInfo = &get_voxel_type_info( header.valueType );
        m_dimensions = header.dimensions;
        m_location = storage->get_simple_location();
    } catch( const voxset_exception& ) {
        storage->close();
        throw;
    } catch( const std::exception& e ) {
        storage->close();
        throw voxset_exception( voxset_error::open_failure )
            << "voxset: Failed to open \"" << m_name << "\": " << e.what();
    }

    m_storage = storage;
    load_sidecar();

    if( m_hook )
        m_hook( diagnostics::resource_opened, g_resourceType, m_name );

    ST_LOG( stats ) << "voxset: Opened \"" << m_name << "\" " << m_dimensions << " " << m_typeInfo->name
                    << ( m_mode == mode_readwrite ? " for read/write" : "" ) << std::endl;
}

void voxset::load_sidecar() {
    const std::string sidecar = metadata_file_name();
    if( !files::file_exists( sidecar ) )
        return;
    try {
        m_metadata.read( sidecar );
    } catch( const std::exception& e ) {
        ST_LOG( warning ) << "voxset: Ignoring the unreadable metadata file \"" << sidecar << "\": " << e.what()
                          << std::endl;
        m_metadata.clear();
    }
}

bool voxset::close_resources( std::string& outMetadataError ) {
    if( !m_storage )
        return false;

    if( m_metadataChanged && m_mode == mode_readwrite ) {
        const std::string sidecar = metadata_file_name();
        try {
            m_metadata.write( sidecar );
            m_metadataChanged = false;
        } catch( const std::exception& e ) {
            outMetadataError = e.what();
            ST_LOG( error ) << "voxset: Failed to write the metadata of \"" << m_name << "\" to \"" << sidecar
                            << "\": " << outMetadataError << std::endl;
        }
    }

    voxel_storage_ptr storage;
    storage.swap( m_storage );
    try {
        storage->close();
    } catch( const std::exception& e ) {
        ST_LOG( error ) << "voxset: Error while releasing the storage of \"" << m_name << "\": " << e.what()
                        << std::endl;
    }
    storage.reset();

    m_coordinateSystem = boost::none;
    std::vector<double>().swap( m_xLocations );
    std::vector<double>().swap( m_yLocations );
    std::vector<double>().swap( m_zLocations );
    m_rowBuffer.release();
    m_cachedPlane = m_cachedRow = -1;
    m_cursor = 0;

    ST_LOG( stats ) << "voxset: Closed \"" << m_name << "\" after " << m_rowReadCount << " row reads" << std::endl;

    if( m_hook )
        m_hook( diagnostics::resource_closed, g_resourceType, m_name );

    return true;
}

void voxset::close() {
    std::string metadataError;
    if( close_resources( metadataError ) && !metadataError.empty() ) {
        throw voxset_exception( voxset_error::metadata_write_failure )
            << "voxset.close: Failed to write the metadata of \"" << m_name << "\" to \"" << metadata_file_name()
            << "\": " << metadataError;
    }
}

void voxset::check_open( const char* operation ) const {
    if( !m_storage ) {
        throw voxset_exception( voxset_error::invalid_state )
            << "voxset." << operation << ": The voxset \"" << m_name << "\" has been closed.";
    }
}

void voxset::check_writable( const char* operation ) const {
    check_open( operation );
    if( m_mode != mode_readwrite ) {
        throw voxset_exception( voxset_error::read_only )
            << "voxset." << operation << ": The voxset \"" << m_name
            << "\" was opened for reading only, its metadata cannot be changed.";
    }
}

data_type_t voxset::value_type() const {
    check_open( "value_type" );
    return m_typeInfo->type;
}

const graphics::size3& voxset::dimensions() const {
    check_open( "dimensions" );
    return m_dimensions;
}

boost::int64_t voxset::size() const {
    check_open( "size" );
    return m_dimensions.volume();
}

const graphics::vector3fd& voxset::origin() const {
    check_open( "origin" );
    return m_location.origin;
}

boost::optional<double> voxset::spacing_x() const {
    check_open( "spacing_x" );
    if( is_nonuniform_spacing( m_location.spacing.x ) )
        return boost::none;
    return m_location.spacing.x;
}

boost::optional<double> voxset::spacing_y() const {
    check_open( "spacing_y" );
    if( is_nonuniform_spacing( m_location.spacing.y ) )
        return boost::none;
    return m_location.spacing.y;
}

boost::optional<double> voxset::spacing_z() const {
    check_open( "spacing_z" );
    if( is_nonuniform_spacing( m_location.spacing.z ) )
        return boost::none;
    return m_location.spacing.z;
}

bool voxset::uniform_x() const {
    check_open( "uniform_x" );
    return !is_nonuniform_spacing( m_location.spacing.x );
}

bool voxset::uniform_y() const {
    check_open( "uniform_y" );
    return !is_nonuniform_spacing( m_location.spacing.y );
}

bool voxset::uniform_z() const {
    check_open( "uniform_z" );
    return !is_nonuniform_spacing( m_location.spacing.z );
}

graphics::boundbox3fd voxset::extent() const {
    check_open( "extent" );
    return m_storage->get_extent();
}

graphics::boundrect2fd voxset::extent_2d() const { return graphics::boundrect2fd::from_boundbox3( extent() ); }

const geospatial::coordinate_system& voxset::coordinate_system() const {
    check_open( "coordinate_system" );
    if( !m_coordinateSystem ) {
        try {
            m_coordinateSystem = m_storage->get_coordinate_system();
        } catch( const voxset_exception& ) {
            throw;
        } catch( const std::exception& e ) {
            throw voxset_exception( voxset_error::storage_read_failure )
                << "voxset.coordinate_system: Failed to read the coordinate system of \"" << m_name
                << "\": " << e.what();
        }
    }
    return *m_coordinateSystem;
}

void voxset::fetch_location_arrays() const {
    if( !m_xLocations.empty() )
        return;

    std::vector<double> xs, ys, zs;
    try {
        m_storage->get_location_arrays( xs, ys, zs );
    } catch( const voxset_exception& ) {
        throw;
    } catch( const std::exception& e ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset: Failed to read the voxel locations of \"" << m_name << "\": " << e.what();
    }

    if( static_cast<int>( xs.size() ) != m_dimensions.xsize() ||
        static_cast<int>( ys.size() ) != m_dimensions.ysize() ||
        static_cast<int>( zs.size() ) != m_dimensions.zsize() ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset: The storage of \"" << m_name << "\" returned " << xs.size() << "x" << ys.size() << "x"
            << zs.size() << " locations for a " << m_dimensions << " grid.";
    }

    m_xLocations.swap( xs );
    m_yLocations.swap( ys );
    m_zLocations.swap( zs );
}

const std::vector<double>& voxset::x_locations() const {
    check_open( "x_locations" );
    fetch_location_arrays();
    return m_xLocations;
}

const std::vector<double>& voxset::y_locations() const {
    check_open( "y_locations" );
    fetch_location_arrays();
    return m_yLocations;
}

const std::vector<double>& voxset::z_locations() const {
    check_open( "z_locations" );
    fetch_location_arrays();
    return m_zLocations;
}

graphics::vector3fd voxset::xyz( int ix, int iy, int iz ) const {
    check_open( "xyz" );
    if( ix < 0 || ix >= m_dimensions.xsize() || iy < 0 || iy >= m_dimensions.ysize() || iz < 0 ||
        iz >= m_dimensions.zsize() ) {
        throw voxset_exception( voxset_error::index_out_of_range )
            << "voxset.xyz: The index (" << ix << ", " << iy << ", " << iz << ") is outside the grid "
            << m_dimensions << " of \"" << m_name << "\".";
    }
    fetch_location_arrays();
    return graphics::vector3fd( m_xLocations[ix], m_yLocations[iy], m_zLocations[iz] );
}

void voxset::load_row( int plane, int row ) {
    // Invalidate first so a failed read never leaves a half filled buffer marked as valid
    m_cachedPlane = m_cachedRow = -1;

    try {
        m_storage->read_row( plane, row, m_rowBuffer );
    } catch( const voxset_exception& ) {
        throw;
    } catch( const std::exception& e ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset: Failed to read row " << row << " of plane " << plane << " of \"" << m_name
            << "\": " << e.what();
    }

    if( m_rowBuffer.data_type() != m_typeInfo->type ||
        m_rowBuffer.size() != static_cast<std::size_t>( m_dimensions.xsize() ) ) {
        throw voxset_exception( voxset_error::storage_read_failure )
            << "voxset: The storage of \"" << m_name << "\" returned " << m_rowBuffer.size() << " "
            << voxel_data_type_str( m_rowBuffer.data_type() ) << " values for row " << row << " of plane " << plane
            << ", expected " << m_dimensions.xsize() << " " << m_typeInfo->name << " values.";
    }

    if( m_typeInfo->isFloat )
        m_rowBuffer.dummy_to_nan();

    m_cachedPlane = plane;
    m_cachedRow = row;
    ++m_rowReadCount;

    ST_LOG( debug ) << "voxset: Read row " << row << " of plane " << plane << " of \"" << m_name << "\""
                    << std::endl;
}

voxel_sample voxset::get( int ix, int iy, int iz ) {
    const graphics::vector3fd position = xyz( ix, iy, iz );
    if( iz != m_cachedPlane || iy != m_cachedRow )
        load_row( iz, iy );
    return voxel_sample( position, m_rowBuffer.value_at( static_cast<std::size_t>( ix ) ) );
}

voxel_sample voxset::get( boost::int64_t i ) {
    check_open( "get" );
    const boost::int64_t count = m_dimensions.volume();
    if( i < 0 || i >= count ) {
        throw voxset_exception( voxset_error::index_out_of_range )
            << "voxset.get: The linear index " << i << " is outside [0, " << count << ") for \"" << m_name
            << "\".";
    }

    const boost::int64_t planeSize = static_cast<boost::int64_t>( m_dimensions.xsize() ) * m_dimensions.ysize();
    const int iz = static_cast<int>( i / planeSize );
    const boost::int64_t r = i % planeSize;
    const int ix = static_cast<int>( r % m_dimensions.xsize() );
    const int iy = static_cast<int>( r / m_dimensions.xsize() );
    return get( ix, iy, iz );
}

bool voxset::next( voxel_sample& outSample ) {
    check_open( "next" );
    if( m_cursor >= m_dimensions.volume() ) {
        m_cursor = 0;
        return false;
    }
    outSample = get( m_cursor );
    ++m_cursor;
    return true;
}

void voxset::reset() {
    check_open( "reset" );
    m_cursor = 0;
}

void voxset::set_metadata( const std::string& key, const std::string& value ) {
    check_writable( "set_metadata" );
    if( m_metadata.set( key, value ) )
        m_metadataChanged = true;
}

void voxset::update_metadata( const std::map<std::string, std::string>& values ) {
    check_writable( "update_metadata" );
    if( m_metadata.update( values ) )
        m_metadataChanged = true;
}

bool voxset::remove_metadata( const std::string& key ) {
    check_writable( "remove_metadata" );
    const bool removed = m_metadata.erase( key );
    if( removed )
        m_metadataChanged = true;
    return removed;
}

void voxset::delete_files( const std::string& name ) {
    const std::string fileName = voxset_file_name( name );
    files::delete_file_if_exists( fileName );
    files::delete_file_if_exists( voxset_metadata_file_name( fileName ) );
}

} // namespace volumetrics
} // namespace stratum
