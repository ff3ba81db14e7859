// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/cstdint.hpp>

#include <cstddef>
#include <string>

namespace stratum {
namespace volumetrics {

/**
 * The scalar types a voxel grid can hold. The type of a voxset is fixed when it is opened.
 *
 * @note IF YOU CHANGE THIS, update the type table in voxel_data_type.cpp and the file type codes in
 * voxset_file_common.cpp.
 */
enum data_type_t {
    data_type_invalid,
    data_type_int8,
    data_type_int16,
    data_type_int32,
    data_type_int64,
    data_type_uint8,
    data_type_uint16,
    data_type_uint32,
    data_type_uint64,
    data_type_float32,
    data_type_float64
};

/**
 * The reserved "no data" values. Every numeric width has its own, and the float64 dummy doubles as the marker for a
 * non-uniform axis spacing.
 */
namespace dummy {
const boost::int8_t int8 = -127;
const boost::uint8_t uint8 = 255u;
const boost::int16_t int16 = -32767;
const boost::uint16_t uint16 = 65535u;
const boost::int32_t int32 = -2147483647;
const boost::uint32_t uint32 = 4294967295u;
const boost::int64_t int64 = -( ( boost::int64_t( 1 ) << 62 ) - 1 ) * 2 - 1; // -9223372036854775807
const boost::uint64_t uint64 = ~boost::uint64_t( 0 );
const float float32 = -1.0e32f;
const double float64 = -1.0e32;
} // namespace dummy

/**
 * Everything the voxel layer needs to know about a data type, looked up once per voxset.
 */
struct voxel_type_info {
    data_type_t type;
    const char* name;
    std::size_t size;
    bool isFloat;
    bool isSigned;
    // Only the member matching the type's domain is meaningful.
    boost::int64_t signedDummy;
    boost::uint64_t unsignedDummy;
    double floatDummy;
};

/**
 * Returns the type table entry for the given type. Throws std::invalid_argument for data_type_invalid or values
 * outside the enumeration.
 */
const voxel_type_info& get_voxel_type_info( data_type_t type );

const char* voxel_data_type_str( data_type_t type );

/**
 * Converts a string like "int16" or "float32" into a data type, returning data_type_invalid when unrecognized.
 */
data_type_t voxel_data_type_from_string( const std::string& dataTypeStr );

std::size_t sizeof_voxel_data_type( data_type_t type );

bool is_voxel_data_type_float( data_type_t type );

bool is_voxel_data_type_signed( data_type_t type );

/**
 * Compile time mapping between C++ types and data_type_t, with the dummy of each type.
 */
template <class T>
struct voxel_data_type_traits;

#define STRATUM_VOXEL_DATA_TYPE_TRAITS( CType, EnumValue, DummyValue )                                                \
    template <>                                                                                                        \
    struct voxel_data_type_traits<CType> {                                                                             \
        typedef CType value_type;                                                                                      \
        static data_type_t data_type() { return EnumValue; }                                                           \
        static value_type dummy_value() { return DummyValue; }                                                         \
    };

STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::int8_t, data_type_int8, dummy::int8 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::int16_t, data_type_int16, dummy::int16 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::int32_t, data_type_int32, dummy::int32 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::int64_t, data_type_int64, dummy::int64 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::uint8_t, data_type_uint8, dummy::uint8 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::uint16_t, data_type_uint16, dummy::uint16 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::uint32_t, data_type_uint32, dummy::uint32 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( boost::uint64_t, data_type_uint64, dummy::uint64 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( float, data_type_float32, dummy::float32 )
STRATUM_VOXEL_DATA_TYPE_TRAITS( double, data_type_float64, dummy::float64 )

#undef STRATUM_VOXEL_DATA_TYPE_TRAITS

/**
 * @return true if the spacing value marks a non-uniform axis.
 */
inline bool is_nonuniform_spacing( double spacing ) { return spacing == dummy::float64; }

} // namespace volumetrics
} // namespace stratum
