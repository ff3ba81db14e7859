// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/diagnostics/resource_tracker.hpp>
#include <stratum/geospatial/coordinate_system.hpp>
#include <stratum/graphics/boundbox3t.hpp>
#include <stratum/graphics/boundrect2t.hpp>
#include <stratum/graphics/size3.hpp>
#include <stratum/volumetrics/voxel_access.hpp>
#include <stratum/volumetrics/voxel_row_buffer.hpp>
#include <stratum/volumetrics/voxel_storage.hpp>
#include <stratum/volumetrics/voxset_metadata.hpp>

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>

#include <cstddef>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace stratum {
namespace volumetrics {

enum voxset_open_mode {
    // Properties and metadata are immutable
    mode_read = 0,
    // Metadata may change and is written to the sidecar at close. Voxel data is never rewritten.
    mode_readwrite = 1
};

/**
 * @return the voxset file name for name, which gets the .voxset extension unless it already has it.
 */
std::string voxset_file_name( const std::string& name );

/**
 * @return the sidecar metadata file of a voxset file, "<fileName>.xml".
 */
std::string voxset_metadata_file_name( const std::string& fileName );

/**
 * A voxel grid opened for reading, backed by a voxel_storage.
 *
 * Voxels are read a row at a time (all the x positions for one y and z) and the most recently read row is kept, so
 * walking the grid in linear order reads each row from storage exactly once. Missing values, stored as the dummy of
 * the value type, come back as samples with no value.
 *
 * The voxset owns its storage and releases it in close(), which the destructor calls. Any use after close() throws
 * voxset_exception with voxset_error::invalid_state. A voxset is not safe to use from multiple threads.
 */
class voxset : public voxel_random_access, public voxel_sequence {
  public:
    /**
     * An input iterator over the voxset's sequence. It advances the voxset's own cursor, so all iterators of a voxset
     * share one position, and begin() continues from wherever the cursor is.
     */
    class iterator {
        voxset* m_voxset;
        voxel_sample m_sample;

        void advance() {
            if( !m_voxset->next( m_sample ) )
                m_voxset = 0;
        }

      public:
        typedef std::input_iterator_tag iterator_category;
        typedef voxel_sample value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const voxel_sample* pointer;
        typedef const voxel_sample& reference;

        // The end iterator
        iterator()
            : m_voxset( 0 ) {}

        explicit iterator( voxset* vs )
            : m_voxset( vs ) {
            if( m_voxset )
                advance();
        }

        reference operator*() const { return m_sample; }

        pointer operator->() const { return &m_sample; }

        iterator& operator++() {
            if( m_voxset )
                advance();
            return *this;
        }

        iterator operator++( int ) {
            iterator result( *this );
            ++*this;
            return result;
        }

        bool operator==( const iterator& rhs ) const { return m_voxset == rhs.m_voxset; }

        bool operator!=( const iterator& rhs ) const { return m_voxset != rhs.m_voxset; }
    };

  private:
    std::string m_name;
    std::string m_fileName;
    voxset_open_mode m_mode;
    diagnostics::resource_hook m_hook;
    voxel_storage_ptr m_storage;

    // Fixed at open
    const voxel_type_info* m_typeInfo;
    graphics::size3 m_dimensions;
    voxel_simple_location m_location;

    // Lazily fetched from storage
    mutable boost::optional<geospatial::coordinate_system> m_coordinateSystem;
    mutable std::vector<double> m_xLocations, m_yLocations, m_zLocations;

    // The row cache, valid only for ( m_cachedPlane, m_cachedRow )
    voxel_row_buffer m_rowBuffer;
    int m_cachedPlane, m_cachedRow;
    boost::int64_t m_rowReadCount;

    boost::int64_t m_cursor;

    voxset_metadata m_metadata;
    bool m_metadataChanged;

    voxset( const voxset& );            // not implemented
    voxset& operator=( const voxset& ); // not implemented

    void initialize( const voxel_storage_ptr& storage );
    void load_sidecar();
    void check_open( const char* operation ) const;
    void check_writable( const char* operation ) const;
    void fetch_location_arrays() const;
    void load_row( int plane, int row );
    bool close_resources( std::string& outMetadataError );

  public:
    /**
     * Opens the voxset file for name (the .voxset extension is added if missing).
     * Throws voxset_exception with open_failure if the file can't be opened or isn't a voxel dataset.
     *
     * @param hook if provided, is notified when the voxset opens and closes.
     */
    explicit voxset( const std::string& name, voxset_open_mode mode = mode_read,
                     const diagnostics::resource_hook& hook = diagnostics::resource_hook() );

    /**
     * Opens a voxset on an already opened storage. The name determines the file name and with it the sidecar
     * metadata location. The voxset takes over closing the storage.
     */
    voxset( const std::string& name, const voxel_storage_ptr& storage, voxset_open_mode mode = mode_read,
            const diagnostics::resource_hook& hook = diagnostics::resource_hook() );

    /**
     * Closes the voxset. A failure to write the metadata is logged instead of thrown.
     */
    virtual ~voxset();

    static boost::shared_ptr<voxset> open( const std::string& name, voxset_open_mode mode = mode_read,
                                           const diagnostics::resource_hook& hook = diagnostics::resource_hook() );

    /**
     * Writes changed metadata to the sidecar file and releases the storage. Calling it again has no effect.
     * If the sidecar could not be written, everything is still released and then voxset_exception with
     * metadata_write_failure is thrown.
     */
    void close();

    bool is_open() const { return m_storage.get() != 0; }

    const std::string& name() const { return m_name; }

    const std::string& file_name() const { return m_fileName; }

    std::string metadata_file_name() const { return voxset_metadata_file_name( m_fileName ); }

    voxset_open_mode mode() const { return m_mode; }

    data_type_t value_type() const;

    const graphics::size3& dimensions() const;
    int nx() const { return dimensions().xsize(); }
    int ny() const { return dimensions().ysize(); }
    int nz() const { return dimensions().zsize(); }

    virtual boost::int64_t size() const;

    const graphics::vector3fd& origin() const;

    // The spacing along an axis, or none if the axis is non-uniform
    boost::optional<double> spacing_x() const;
    boost::optional<double> spacing_y() const;
    boost::optional<double> spacing_z() const;

    bool uniform_x() const;
    bool uniform_y() const;
    bool uniform_z() const;

    /**
     * The bounding box of the voxel centers, queried from the storage on each call.
     */
    graphics::boundbox3fd extent() const;

    graphics::boundrect2fd extent_2d() const;

    const geospatial::coordinate_system& coordinate_system() const;

    const std::vector<double>& x_locations() const;
    const std::vector<double>& y_locations() const;
    const std::vector<double>& z_locations() const;

    /**
     * The location of the center of voxel ( ix, iy, iz ). Throws voxset_exception with index_out_of_range if any
     * index is outside the grid.
     */
    graphics::vector3fd xyz( int ix, int iy, int iz ) const;

    virtual voxel_sample get( int ix, int iy, int iz );

    virtual voxel_sample get( boost::int64_t i );

    voxel_sample operator[]( boost::int64_t i ) { return get( i ); }

    virtual bool next( voxel_sample& outSample );

    virtual void reset();

    // The linear index the next call to next() will return
    boost::int64_t cursor() const { return m_cursor; }

    iterator begin() { return iterator( this ); }

    iterator end() { return iterator(); }

    // The number of rows this voxset has read from storage
    boost::int64_t row_read_count() const { return m_rowReadCount; }

    const voxset_metadata& metadata() const { return m_metadata; }

    /**
     * Sets a metadata value. Throws voxset_exception with read_only in mode_read.
     */
    void set_metadata( const std::string& key, const std::string& value );

    void update_metadata( const std::map<std::string, std::string>& values );

    bool remove_metadata( const std::string& key );

    bool is_metadata_changed() const { return m_metadataChanged; }

    /**
     * Removes the voxset file for name and its sidecar, ignoring files that don't exist.
     */
    static void delete_files( const std::string& name );
};

typedef boost::shared_ptr<voxset> voxset_ptr;

} // namespace volumetrics
} // namespace stratum
