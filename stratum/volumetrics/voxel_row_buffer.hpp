// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/volumetrics/voxel_data_type.hpp>
#include <stratum/volumetrics/voxel_sample.hpp>

#include <boost/optional.hpp>

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace stratum {
namespace volumetrics {

/**
 * This class holds one row of voxel values (all the x positions for a fixed y and z) in the native binary layout of
 * its data type. Storage backends fill it in place, and the voxset decodes individual values out of it.
 *
 * The buffer doesn't initialize its values, so a newly allocated buffer has to be filled before values are read.
 */
class voxel_row_buffer {
    const voxel_type_info* m_typeInfo;
    std::size_t m_length;
    std::vector<char> m_data;

  public:
    voxel_row_buffer()
        : m_typeInfo( 0 )
        , m_length( 0 ) {}

    voxel_row_buffer( data_type_t type, std::size_t length )
        : m_typeInfo( 0 )
        , m_length( 0 ) {
        allocate( type, length );
    }

    /**
     * Sizes the buffer to hold length values of the given type. Reuses the existing memory when it is large enough.
     */
    void allocate( data_type_t type, std::size_t length );

    void release() {
        std::vector<char>().swap( m_data );
        m_typeInfo = 0;
        m_length = 0;
    }

    bool is_allocated() const { return m_typeInfo != 0; }

    data_type_t data_type() const { return m_typeInfo ? m_typeInfo->type : data_type_invalid; }

    // The number of values in the row
    std::size_t size() const { return m_length; }

    std::size_t size_in_bytes() const { return m_typeInfo ? m_length * m_typeInfo->size : 0; }

    char* data() { return m_data.empty() ? 0 : &m_data[0]; }

    const char* data() const { return m_data.empty() ? 0 : &m_data[0]; }

    /**
     * Typed access to the row. T must match the buffer's data type.
     */
    template <class T>
    T* as_array() {
        if( voxel_data_type_traits<T>::data_type() != data_type() )
            throw std::runtime_error( std::string( "voxel_row_buffer.as_array: Requested type " ) +
                                      voxel_data_type_str( voxel_data_type_traits<T>::data_type() ) +
                                      " does not match the buffer type " + voxel_data_type_str( data_type() ) );
        return reinterpret_cast<T*>( data() );
    }

    template <class T>
    const T* as_array() const {
        return const_cast<voxel_row_buffer*>( this )->as_array<T>();
    }

    /**
     * Replaces every dummy value with NaN. Does nothing for integer types, which have no NaN.
     *
     * @return the number of values that were replaced.
     */
    std::size_t dummy_to_nan();

    /**
     * Decodes the value at index. Returns an empty optional for a NaN float or for an integer equal to its type's
     * dummy. Float dummies are only recognized after dummy_to_nan() has converted them.
     */
    boost::optional<voxel_value> value_at( std::size_t index ) const;
};

} // namespace volumetrics
} // namespace stratum
