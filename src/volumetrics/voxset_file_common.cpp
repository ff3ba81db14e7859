// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/volumetrics/voxset_file_common.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cstring>
#include <stdexcept>
#include <vector>

namespace stratum {
namespace volumetrics {

namespace {

struct type_code_entry {
    data_type_t type;
    boost::int32_t code;
};

// The on-disk codes. Never renumber these.
const type_code_entry g_typeCodes[] = { { data_type_int8, 1 },     { data_type_uint8, 2 },   { data_type_int16, 3 },
                                        { data_type_uint16, 4 },   { data_type_int32, 5 },   { data_type_uint32, 6 },
                                        { data_type_int64, 7 },    { data_type_uint64, 8 },  { data_type_float32, 9 },
                                        { data_type_float64, 10 } };

const int g_typeCodeCount = sizeof( g_typeCodes ) / sizeof( g_typeCodes[0] );

} // anonymous namespace

const char* get_voxset_compression_string( voxset_compression_t compression ) {
    switch( compression ) {
    case voxset_compression_none:
        return "none";
    case voxset_compression_zlib:
        return "zlib";
    default:
        return "invalid";
    }
}

voxset_compression_t get_voxset_compression_from_string( const std::string& s ) {
    const std::string lower = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( s ) );
    if( lower == "none" || lower == "uncompressed" )
        return voxset_compression_none;
    if( lower == "zlib" )
        return voxset_compression_zlib;
    throw std::runtime_error( "get_voxset_compression_from_string: Unrecognized compression \"" + s + "\"" );
}

const char* voxset_file_extension() { return ".voxset"; }

const char* voxset_file_signature() { return "Stratum Voxel Set"; }

boost::int32_t get_voxset_file_type_code( data_type_t type ) {
    for( int i = 0; i < g_typeCodeCount; ++i ) {
        if( g_typeCodes[i].type == type )
            return g_typeCodes[i].code;
    }
    throw std::runtime_error( std::string( "get_voxset_file_type_code: The data type " ) +
                              voxel_data_type_str( type ) + " cannot be stored in a voxset file" );
}

data_type_t get_data_type_from_voxset_file_type_code( boost::int32_t code ) {
    for( int i = 0; i < g_typeCodeCount; ++i ) {
        if( g_typeCodes[i].code == code )
            return g_typeCodes[i].type;
    }
    return data_type_invalid;
}

boost::int32_t voxset_file_fixed_header_length() {
    // magic, then the fields of voxset_file_header as written one at a time
    return static_cast<boost::int32_t>( 8 + 4 + STRATUM_VOXSET_SIGNATURE_LENGTH + 4 * 7 + 8 * 6 );
}

namespace serialize {

std::string read_string( FILE* in, const std::string& streamName ) {
    const boost::int32_t length = read_value<boost::int32_t>( in, streamName );
    if( length < 0 || length > STRATUM_VOXSET_MAX_HEADER_STRING ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has an invalid string length " << length
            << ".";
    }
    if( length == 0 )
        return std::string();

    std::vector<char> buffer( length );
    if( std::fread( &buffer[0], 1, length, in ) != static_cast<std::size_t>( length ) ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" is truncated or corrupted.";
    }
    return std::string( buffer.begin(), buffer.end() );
}

void write_string( FILE* out, const std::string& value, const std::string& streamName ) {
    if( value.size() > static_cast<std::size_t>( STRATUM_VOXSET_MAX_HEADER_STRING ) )
        throw std::runtime_error( "voxset_file_writer: A header string for \"" + streamName + "\" is too long." );
    write_value<boost::int32_t>( out, static_cast<boost::int32_t>( value.size() ), streamName );
    if( !value.empty() && std::fwrite( value.data(), 1, value.size(), out ) != value.size() )
        throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );
}

void read_header( FILE* in, const std::string& streamName, voxset_file_header& outHeader ) {
    const boost::uint64_t magic = read_value<boost::uint64_t>( in, streamName );
    if( magic != STRATUM_VOXSET_MAGIC_NUMBER ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName
            << "\" did not begin with the voxset file magic number.";
    }

    outHeader.headerLength = read_value<boost::int32_t>( in, streamName );
    if( std::fread( outHeader.signature, 1, STRATUM_VOXSET_SIGNATURE_LENGTH, in ) != STRATUM_VOXSET_SIGNATURE_LENGTH ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" is truncated or corrupted.";
    }
    outHeader.signature[STRATUM_VOXSET_SIGNATURE_LENGTH - 1] = '\0';
    if( std::strcmp( outHeader.signature, voxset_file_signature() ) != 0 ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has an unrecognized signature \""
            << outHeader.signature << "\".";
    }

    outHeader.version = read_value<boost::int32_t>( in, streamName );
    if( outHeader.version != STRATUM_VOXSET_FILE_VERSION ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has unsupported version "
            << outHeader.version << ", only version " << STRATUM_VOXSET_FILE_VERSION << " is supported.";
    }
    // A newer minor layout may grow the fixed header, but never shrink it
    if( outHeader.headerLength < voxset_file_fixed_header_length() ) {
        throw voxset_exception( voxset_error::open_failure )
            << "voxset_file_storage: The file \"" << streamName << "\" has an invalid header length "
            << outHeader.headerLength << ".";
    }

    outHeader.typeCode = read_value<boost::int32_t>( in, streamName );
    outHeader.arrayKind = read_value<boost::int32_t>( in, streamName );
    outHeader.nx = read_value<boost::int32_t>( in, streamName );
    outHeader.ny = read_value<boost::int32_t>( in, streamName );
    outHeader.nz = read_value<boost::int32_t>( in, streamName );
    outHeader.compression = read_value<boost::int32_t>( in, streamName );
    for( int i = 0; i < 3; ++i )
        outHeader.origin[i] = read_value<double>( in, streamName );
    for( int i = 0; i < 3; ++i )
        outHeader.spacing[i] = read_value<double>( in, streamName );

    if( outHeader.headerLength > voxset_file_fixed_header_length() ) {
        if( std::fseek( in, outHeader.headerLength, SEEK_SET ) != 0 ) {
            throw voxset_exception( voxset_error::open_failure )
                << "voxset_file_storage: The file \"" << streamName << "\" is truncated or corrupted.";
        }
    }
}

void write_header( FILE* out, const std::string& streamName, const voxset_file_header& header ) {
    write_value<boost::uint64_t>( out, STRATUM_VOXSET_MAGIC_NUMBER, streamName );
    write_value<boost::int32_t>( out, header.headerLength, streamName );
    char signature[STRATUM_VOXSET_SIGNATURE_LENGTH];
    std::memset( signature, 0, sizeof( signature ) );
    std::strncpy( signature, voxset_file_signature(), STRATUM_VOXSET_SIGNATURE_LENGTH - 1 );
    if( std::fwrite( signature, 1, STRATUM_VOXSET_SIGNATURE_LENGTH, out ) != STRATUM_VOXSET_SIGNATURE_LENGTH )
        throw std::runtime_error( "voxset_file_writer: Failed to write to the file \"" + streamName + "\"." );
    write_value<boost::int32_t>( out, header.version, streamName );
    write_value<boost::int32_t>( out, header.typeCode, streamName );
    write_value<boost::int32_t>( out, header.arrayKind, streamName );
    write_value<boost::int32_t>( out, header.nx, streamName );
    write_value<boost::int32_t>( out, header.ny, streamName );
    write_value<boost::int32_t>( out, header.nz, streamName );
    write_value<boost::int32_t>( out, header.compression, streamName );
    for( int i = 0; i < 3; ++i )
        write_value<double>( out, header.origin[i], streamName );
    for( int i = 0; i < 3; ++i )
        write_value<double>( out, header.spacing[i], streamName );
}

} // namespace serialize

} // namespace volumetrics
} // namespace stratum
