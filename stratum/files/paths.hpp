// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <boost/filesystem/path.hpp>

namespace stratum {
namespace files {

std::string forward_slashes( std::string path );

// Returns the file name component of the path, e.g. "/a/b/name.ext" -> "name.ext"
std::string filename_from_path( const std::string& path );

// Returns the file name without its directory and last extension, e.g. "/a/b/name.ext" -> "name"
std::string basename_from_path( const std::string& path );
std::string basename_from_path_p( const boost::filesystem::path& thePath );

// Returns the directory part of the path, e.g. "/a/b/name.ext" -> "/a/b"
std::string directory_from_path( const std::string& path );

// Returns the last extension including the '.', or an empty string. Dots in directory names are ignored.
std::string extension_from_path( const std::string& path );

// Case-insensitive comparison of the path's extension against ext (which includes the leading '.')
bool extension_iequals( const std::string& path, const std::string& ext );

std::string replace_extension( const std::string& path, const std::string& replacementExt );

/**
 * Appends ext to path unless the path already ends with that extension (compared case-insensitively).
 * For example ensure_extension( "grid", ".voxset" ) == "grid.voxset" and
 * ensure_extension( "grid.VOXSET", ".voxset" ) == "grid.VOXSET".
 */
std::string ensure_extension( const std::string& path, const std::string& ext );

} // namespace files
} // namespace stratum
