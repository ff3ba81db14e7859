// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/volumetrics/voxel_row_buffer.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <cstring>
#include <limits>

namespace stratum {
namespace volumetrics {

namespace {

template <class T>
std::size_t replace_dummy_with_nan( T* values, std::size_t count ) {
    const T dummyValue = voxel_data_type_traits<T>::dummy_value();
    const T nan = std::numeric_limits<T>::quiet_NaN();
    std::size_t replaced = 0;
    for( std::size_t i = 0; i < count; ++i ) {
        if( values[i] == dummyValue ) {
            values[i] = nan;
            ++replaced;
        }
    }
    return replaced;
}

// memcpy since rows from storage carry no alignment promise
template <class T>
T load_value( const char* data, std::size_t index ) {
    T result;
    std::memcpy( &result, data + index * sizeof( T ), sizeof( T ) );
    return result;
}

template <class T>
boost::optional<voxel_value> signed_value_at( const char* data, std::size_t index ) {
    const T v = load_value<T>( data, index );
    if( v == voxel_data_type_traits<T>::dummy_value() )
        return boost::none;
    return voxel_value::from_int64( static_cast<boost::int64_t>( v ) );
}

template <class T>
boost::optional<voxel_value> unsigned_value_at( const char* data, std::size_t index ) {
    const T v = load_value<T>( data, index );
    if( v == voxel_data_type_traits<T>::dummy_value() )
        return boost::none;
    return voxel_value::from_uint64( static_cast<boost::uint64_t>( v ) );
}

template <class T>
boost::optional<voxel_value> float_value_at( const char* data, std::size_t index ) {
    const T v = load_value<T>( data, index );
    if( ( boost::math::isnan )( v ) )
        return boost::none;
    return voxel_value::from_double( static_cast<double>( v ) );
}

} // anonymous namespace

void voxel_row_buffer::allocate( data_type_t type, std::size_t length ) {
    const voxel_type_info& info = get_voxel_type_info( type );
    m_data.resize( length * info.size );
    m_typeInfo = &info;
    m_length = length;
}

std::size_t voxel_row_buffer::dummy_to_nan() {
    switch( data_type() ) {
    case data_type_float32:
        return replace_dummy_with_nan( as_array<float>(), m_length );
    case data_type_float64:
        return replace_dummy_with_nan( as_array<double>(), m_length );
    default:
        return 0;
    }
}

boost::optional<voxel_value> voxel_row_buffer::value_at( std::size_t index ) const {
    if( index >= m_length )
        throw std::out_of_range( "voxel_row_buffer.value_at: Index " + boost::lexical_cast<std::string>( index ) +
                                 " is outside the row of length " + boost::lexical_cast<std::string>( m_length ) );

    const char* d = data();
    switch( data_type() ) {
    case data_type_int8:
        return signed_value_at<boost::int8_t>( d, index );
    case data_type_int16:
        return signed_value_at<boost::int16_t>( d, index );
    case data_type_int32:
        return signed_value_at<boost::int32_t>( d, index );
    case data_type_int64:
        return signed_value_at<boost::int64_t>( d, index );
    case data_type_uint8:
        return unsigned_value_at<boost::uint8_t>( d, index );
    case data_type_uint16:
        return unsigned_value_at<boost::uint16_t>( d, index );
    case data_type_uint32:
        return unsigned_value_at<boost::uint32_t>( d, index );
    case data_type_uint64:
        return unsigned_value_at<boost::uint64_t>( d, index );
    case data_type_float32:
        return float_value_at<float>( d, index );
    case data_type_float64:
        return float_value_at<double>( d, index );
    default:
        throw std::runtime_error( "voxel_row_buffer.value_at: The buffer has not been allocated" );
    }
}

} // namespace volumetrics
} // namespace stratum
