// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/files/files.hpp>
#include <stratum/volumetrics/voxel_storage.hpp>
#include <stratum/volumetrics/voxset_file_common.hpp>

#include <boost/cstdint.hpp>
#include <boost/filesystem/path.hpp>

#include <vector>

namespace stratum {
namespace volumetrics {

/**
 * Reads rows from a .voxset file. The header, coordinate system, location arrays and row index are read when the
 * file is opened, and each read_row() seeks directly to its row.
 */
class voxset_file_storage : public voxel_storage {
    boost::filesystem::path m_path;
    files::file_ptr m_file;

    voxel_storage_header m_header;
    voxel_simple_location m_location;
    voxset_compression_t m_compression;
    geospatial::coordinate_system m_coordinateSystem;
    std::vector<double> m_xLocations, m_yLocations, m_zLocations;
    // ny*nz+1 entries, row k occupies [m_rowOffsets[k], m_rowOffsets[k+1])
    std::vector<boost::int64_t> m_rowOffsets;

    std::vector<char> m_compressedBuffer;
    boost::int64_t m_rowReads;

    voxset_file_storage( const voxset_file_storage& );            // not implemented
    voxset_file_storage& operator=( const voxset_file_storage& ); // not implemented

    void read_location_arrays( const std::string& streamName );
    void read_row_index( const std::string& streamName );

  public:
    /**
     * Opens the file. Throws voxset_exception with open_failure if it is missing or is not a valid voxset file.
     */
    explicit voxset_file_storage( const boost::filesystem::path& path );

    virtual ~voxset_file_storage();

    virtual void close();

    bool is_open() const { return m_file.get() != 0; }

    virtual std::string name() const;

    virtual voxel_storage_header get_header() const { return m_header; }

    virtual voxel_simple_location get_simple_location() const { return m_location; }

    virtual void get_location_arrays( std::vector<double>& outX, std::vector<double>& outY,
                                      std::vector<double>& outZ ) const;

    virtual geospatial::coordinate_system get_coordinate_system() const { return m_coordinateSystem; }

    virtual void read_row( int plane, int row, voxel_row_buffer& outBuffer );

    virtual graphics::boundbox3fd get_extent() const;

    voxset_compression_t compression() const { return m_compression; }

    // The number of rows read from the file since it was opened
    boost::int64_t row_reads() const { return m_rowReads; }
};

} // namespace volumetrics
} // namespace stratum
