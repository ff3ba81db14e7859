// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on
#include <stratum/files/files.hpp>

#include <boost/filesystem/operations.hpp>

#include <cstring>
#include <fstream>
#include <stdexcept>

#if !defined( _WIN32 )
#include <sys/types.h>
#include <unistd.h>
#endif

using namespace stratum;
namespace fs = boost::filesystem;

FILE* files::tfopen( const boost::filesystem::path& path, const char* mode ) {
#ifdef _WIN32
    std::wstring wmode( mode, mode + strlen( mode ) );
    return _wfopen( path.wstring().c_str(), wmode.c_str() );
#else
    return std::fopen( path.string().c_str(), mode );
#endif
}

bool files::file_exists( const std::string& filename ) {
    boost::system::error_code ec;
    fs::file_status status = fs::status( fs::path( filename ), ec );
    return !ec && fs::exists( status ) && !fs::is_directory( status );
}

void files::delete_file( const std::string& filename ) {
    boost::system::error_code ec;
    fs::remove( fs::path( filename ), ec );
    if( ec )
        throw std::runtime_error( "delete_file: Could not delete \"" + filename + "\": " + ec.message() );
}

bool files::delete_file_if_exists( const std::string& filename ) {
    if( !file_exists( filename ) )
        return false;
    boost::system::error_code ec;
    return fs::remove( fs::path( filename ), ec ) && !ec;
}

int files::fseek64( FILE* stream, boost::int64_t offset, int origin ) {
#ifdef _WIN32
    return _fseeki64( stream, offset, origin );
#elif defined( __APPLE__ )
    return fseeko( stream, offset, origin );
#else
    return fseeko64( stream, offset, origin );
#endif
}

boost::int64_t files::ftell64( FILE* stream ) {
#ifdef _WIN32
    return _ftelli64( stream );
#elif defined( __APPLE__ )
    return ftello( stream );
#else
    return ftello64( stream );
#endif
}

boost::int64_t files::file_size( const std::string& filename ) {
    if( file_exists( filename ) ) {
        std::ifstream ftest( filename.c_str(), std::ios::binary );
        if( !ftest )
            return -1;
        else {
            ftest.seekg( 0, std::ios::end );
            return ftest.tellg();
        }
    } else {
        return -1;
    }
}
