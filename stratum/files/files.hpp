// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdio>
#include <string>

#include <boost/cstdint.hpp>
#include <boost/filesystem/path.hpp>

#include <stratum/files/paths.hpp>

namespace stratum {
namespace files {

/**
 * This provides a wrapper for a FILE* object. The constructor opens the file and the destructor closes it.
 * This should used to help ensure exception safety when working with FILE*s.
 */
class file_ptr {
    FILE* m_file;

    // Disable copy construction/assignment
    file_ptr( const file_ptr& );            // do not implement
    file_ptr& operator=( const file_ptr& ); // do not implement
  public:
    file_ptr()
        : m_file( 0 ) {}

    /**
     * @param file the FILE struct opened with std::fopen
     */
    explicit file_ptr( FILE* file )
        : m_file( file ) {}

    ~file_ptr() { close(); }

    /**
     * Closes any existing open file, and replaces its FILE* with the given variable.
     */
    void reset( FILE* file ) {
        close();
        m_file = file;
    }

    int close() {
        int result = 0;
        if( m_file ) {
            result = fclose( m_file );
            m_file = 0;
        }
        return result;
    }

    FILE* get() { return m_file; }

    const FILE* get() const { return m_file; }

    operator FILE*() { return m_file; }

    FILE* operator->() { return m_file; }
};

/**
 * Opens a file with std::fopen semantics, accepting a boost path.
 *
 * @return the FILE*, or NULL if the file could not be opened.
 */
FILE* tfopen( const boost::filesystem::path& path, const char* mode );

/**
 * Tests to see if the specified file exists. Directories are not files.
 */
bool file_exists( const std::string& filename );

/**
 * Deletes the specified file. Throws if the file exists and could not be removed.
 */
void delete_file( const std::string& filename );

/**
 * Deletes the specified file if it exists, silently doing nothing when it is absent.
 *
 * @return true if a file was removed.
 */
bool delete_file_if_exists( const std::string& filename );

int fseek64( FILE* stream, boost::int64_t offset, int origin );

boost::int64_t ftell64( FILE* stream );

/**
 * @return the size of the file in bytes, or -1 if it does not exist.
 */
boost::int64_t file_size( const std::string& filename );

} // namespace files
} // namespace stratum
