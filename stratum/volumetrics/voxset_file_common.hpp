// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/misc/exception_stream.hpp>
#include <stratum/volumetrics/voxel_data_type.hpp>

#include <boost/cstdint.hpp>

#include <cstdio>
#include <string>

// NOTE: This here is assuming a little-endian machine, as do the voxset file I/O routines.

// {0xC5, 'V', 'O', 'X', '\r', '\n', 0x1A, '\n'}
#define STRATUM_VOXSET_MAGIC_NUMBER ( 0x0A1A0A0D584F56C5ULL )

#define STRATUM_VOXSET_FILE_VERSION ( 1 )

#define STRATUM_VOXSET_SIGNATURE_LENGTH ( 32 )

// Strings in the header (the coordinate system) are bounded to catch corrupted lengths early
#define STRATUM_VOXSET_MAX_HEADER_STRING ( 1 << 20 )

/*
 * Layout of a .voxset file, all values little endian:
 *
 *   uint64   magic number
 *   int32    header length (bytes from the start of the file to the end of the fixed header)
 *   char[32] signature, NULL padded
 *   int32    version
 *   int32    value type code
 *   int32    array kind
 *   int32    nx, ny, nz
 *   int32    compression
 *   float64  origin x, y, z
 *   float64  spacing x, y, z (dummy::float64 for a non-uniform axis)
 *   -- end of fixed header --
 *   int32 + bytes   coordinate system name
 *   int32 + bytes   coordinate system descriptor
 *   float64[n]      locations of each non-uniform axis, in x, y, z order
 *   int64[ny*nz+1]  absolute file offset of each row, plus the end of the last row
 *   row data, planes from bottom to top and rows by increasing y within a plane
 */

namespace stratum {
namespace volumetrics {

enum voxset_compression_t {
    voxset_compression_none,
    // Each row is compressed separately with zlib
    voxset_compression_zlib,

    voxset_compression_count
};

const char* get_voxset_compression_string( voxset_compression_t compression );

voxset_compression_t get_voxset_compression_from_string( const std::string& s );

/**
 * The extension of voxset files, including the leading '.'.
 */
const char* voxset_file_extension();

const char* voxset_file_signature();

/**
 * The stable codes types are stored with. These don't follow the data_type_t enumeration so that it can change.
 */
boost::int32_t get_voxset_file_type_code( data_type_t type );

/**
 * @return the type for the code, or data_type_invalid.
 */
data_type_t get_data_type_from_voxset_file_type_code( boost::int32_t code );

/**
 * The fixed part of the header. Strings, location arrays and the row index follow it in the file.
 */
struct voxset_file_header {
    boost::int32_t headerLength;
    char signature[STRATUM_VOXSET_SIGNATURE_LENGTH];
    boost::int32_t version;
    boost::int32_t typeCode;
    boost::int32_t arrayKind;
    boost::int32_t nx, ny, nz;
    boost::int32_t compression;
    double origin[3];
    double spacing[3];
};

// Bytes from the start of the file to the end of the fixed header, magic number included
boost::int32_t voxset_file_fixed_header_length();

namespace serialize {

/**
 * Reads a POD value of type T from the file. Throws voxset_exception with open_failure if the file ends early.
 */
template <typename T>
inline T read_value( FILE* in, const std::string& streamName ) {
    T result;
    if( std::fread( &result, sizeof( T ), 1, in ) != 1 ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" is truncated or corrupted.";
    }
    return result;
}

template <typename T>
inline void write_value( FILE* out, const T& value, const std::string& streamName ) {
    if( std::fwrite( &value, sizeof( T ), 1, out ) != 1 ) {
        throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );
    }
}

/** Reads an int32 length followed by that many bytes. */
std::string read_string( FILE* in, const std::string& streamName );

void write_string( FILE* out, const std::string& value, const std::string& streamName );

void read_header( FILE* in, const std::string& streamName, voxset_file_header& outHeader );

void write_header( FILE* out, const std::string& streamName, const voxset_file_header& header );

} // namespace serialize

} // namespace volumetrics
} // namespace stratum
