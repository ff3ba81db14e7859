// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on
#include <stratum/files/paths.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

using namespace std;

namespace stratum {
namespace files {

string forward_slashes( string path ) {
    std::replace( path.begin(), path.end(), '\\', '/' );
    return path;
}

string filename_from_path( const string& path ) { return boost::filesystem::path( path ).filename().string(); }

string basename_from_path_p( const boost::filesystem::path& thePath ) {
    // Grab the filename
    string filename = thePath.filename().string();

    // Split it into the basename and the extension
    size_t extIndex = filename.rfind( '.' );
    if( extIndex != string::npos && extIndex != 0 ) {
        return filename.substr( 0, extIndex );
    } else {
        return filename;
    }
}

string basename_from_path( const string& path ) { return basename_from_path_p( boost::filesystem::path( path ) ); }

string directory_from_path( const string& path ) { return boost::filesystem::path( path ).parent_path().string(); }

string extension_from_path( const string& path ) {
    // Only look for the '.' after the last separator, so "a.b/name" has no extension
    size_t sepIndex = path.find_last_of( "/\\" );
    size_t extIndex = path.rfind( '.' );
    if( extIndex != string::npos && ( sepIndex == string::npos || extIndex > sepIndex ) ) {
        return path.substr( extIndex );
    } else {
        return "";
    }
}

bool extension_iequals( const string& path, const string& ext ) {
    string pathExtLower = extension_from_path( path );
    boost::algorithm::to_lower( pathExtLower );
    string extLower = ext;
    boost::algorithm::to_lower( extLower );
    return pathExtLower == extLower;
}

string replace_extension( const string& path, const string& replacementExt ) {
    const string ext = extension_from_path( path );
    return path.substr( 0, path.size() - ext.size() ) + replacementExt;
}

string ensure_extension( const string& path, const string& ext ) {
    if( extension_iequals( path, ext ) )
        return path;
    return path + ext;
}

} // namespace files
} // namespace stratum
