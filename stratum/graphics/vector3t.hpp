// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cmath>
#include <locale>
#include <ostream>
#include <sstream>

#include <boost/math/special_functions/fpclassify.hpp>
#include <boost/math/special_functions/nonfinite_num_facets.hpp>

namespace stratum {
namespace graphics {

template <typename FloatType>
class vector3t {

  public:
    FloatType x, y, z;
    typedef FloatType float_type;

    vector3t( const float_type& X, const float_type& Y, const float_type& Z )
        : x( X )
        , y( Y )
        , z( Z ) {}

    explicit vector3t( const float_type& X )
        : x( X )
        , y( X )
        , z( X ) {}

    explicit vector3t( const float_type vec[3] )
        : x( vec[0] )
        , y( vec[1] )
        , z( vec[2] ) {}

    vector3t()
        : x( 0 )
        , y( 0 )
        , z( 0 ) {}

    void set( const float_type& X, const float_type& Y, const float_type& Z ) {
        x = X;
        y = Y;
        z = Z;
    }

    float_type& operator[]( int index ) { return ( &x )[index]; }

    const float_type& operator[]( int index ) const { return ( &x )[index]; }

    bool is_finite() const {
        return ( boost::math::isfinite )( x ) && ( boost::math::isfinite )( y ) && ( boost::math::isfinite )( z );
    }

    bool operator==( const vector3t& a ) const { return x == a.x && y == a.y && z == a.z; }

    bool operator!=( const vector3t& a ) const { return !operator==( a ); }

    vector3t operator+( const vector3t& a ) const { return vector3t( x + a.x, y + a.y, z + a.z ); }

    vector3t operator-( const vector3t& a ) const { return vector3t( x - a.x, y - a.y, z - a.z ); }

    vector3t operator*( float_type k ) const { return vector3t( x * k, y * k, z * k ); }

    float_type get_magnitude() const { return std::sqrt( x * x + y * y + z * z ); }

    static float_type distance( const vector3t& a, const vector3t& b ) { return ( a - b ).get_magnitude(); }
};

template <typename CharType, typename FloatType>
inline std::basic_ostream<CharType>& operator<<( std::basic_ostream<CharType>& out, const vector3t<FloatType>& v ) {
    std::basic_stringstream<CharType> ss;
    // nonfinite_num_put for a standard representation of non-finite numbers,
    // for example, "inf" instead of the "1.#INF" in Visual Studio
    ss.imbue( std::locale( std::locale::classic(), new boost::math::nonfinite_num_put<CharType> ) );
    ss.precision( out.precision() );
    ss << "[" << v.x << ", " << v.y << ", " << v.z << "]";
    out << ss.str();
    return out;
}

typedef vector3t<float> vector3f;
typedef vector3t<double> vector3fd;

} // namespace graphics
} // namespace stratum
