// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/volumetrics/voxel_data_type.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <stdexcept>

namespace stratum {
namespace volumetrics {

namespace {

// Indexed by data_type_t. Entry 0 is data_type_invalid.
const voxel_type_info g_typeTable[] = {
    { data_type_invalid, "invalid", 0, false, false, 0, 0, 0.0 },
    { data_type_int8, "int8", 1, false, true, dummy::int8, 0, 0.0 },
    { data_type_int16, "int16", 2, false, true, dummy::int16, 0, 0.0 },
    { data_type_int32, "int32", 4, false, true, dummy::int32, 0, 0.0 },
    { data_type_int64, "int64", 8, false, true, dummy::int64, 0, 0.0 },
    { data_type_uint8, "uint8", 1, false, false, 0, dummy::uint8, 0.0 },
    { data_type_uint16, "uint16", 2, false, false, 0, dummy::uint16, 0.0 },
    { data_type_uint32, "uint32", 4, false, false, 0, dummy::uint32, 0.0 },
    { data_type_uint64, "uint64", 8, false, false, 0, dummy::uint64, 0.0 },
    { data_type_float32, "float32", 4, true, true, 0, 0, dummy::float32 },
    { data_type_float64, "float64", 8, true, true, 0, 0, dummy::float64 } };

const int g_typeCount = sizeof( g_typeTable ) / sizeof( g_typeTable[0] );

} // anonymous namespace

const voxel_type_info& get_voxel_type_info( data_type_t type ) {
    if( type <= data_type_invalid || static_cast<int>( type ) >= g_typeCount )
        throw std::invalid_argument( "get_voxel_type_info: Invalid voxel data type " +
                                     boost::lexical_cast<std::string>( static_cast<int>( type ) ) );
    return g_typeTable[type];
}

const char* voxel_data_type_str( data_type_t type ) {
    if( type < data_type_invalid || static_cast<int>( type ) >= g_typeCount )
        return "invalid";
    return g_typeTable[type].name;
}

data_type_t voxel_data_type_from_string( const std::string& dataTypeStr ) {
    const std::string s = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( dataTypeStr ) );
    for( int i = 1; i < g_typeCount; ++i ) {
        if( s == g_typeTable[i].name )
            return g_typeTable[i].type;
    }
    // Common aliases
    if( s == "float" )
        return data_type_float32;
    if( s == "double" )
        return data_type_float64;
    return data_type_invalid;
}

std::size_t sizeof_voxel_data_type( data_type_t type ) { return get_voxel_type_info( type ).size; }

bool is_voxel_data_type_float( data_type_t type ) { return get_voxel_type_info( type ).isFloat; }

bool is_voxel_data_type_signed( data_type_t type ) { return get_voxel_type_info( type ).isSigned; }

} // namespace volumetrics
} // namespace stratum
