// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <limits>
#include <ostream>

#include <stratum/graphics/vector3t.hpp>

namespace stratum {
namespace graphics {

template <typename FloatType>
class boundbox3t {
  public:
    typedef FloatType float_type;
    typedef vector3t<FloatType> vector3f_type;

  private:
    vector3f_type m_minimum, m_maximum;

  public:
    boundbox3t() { set_to_empty(); }

    explicit boundbox3t( const vector3f_type& position )
        : m_minimum( position )
        , m_maximum( position ) {}

    boundbox3t( const vector3f_type& minimum, const vector3f_type& maximum )
        : m_minimum( minimum )
        , m_maximum( maximum ) {}

    boundbox3t( float_type xmin, float_type xmax, float_type ymin, float_type ymax, float_type zmin, float_type zmax )
        : m_minimum( xmin, ymin, zmin )
        , m_maximum( xmax, ymax, zmax ) {}

    void set( const vector3f_type& minimum, const vector3f_type& maximum ) {
        m_minimum = minimum;
        m_maximum = maximum;
    }

    void set_to_empty() {
        m_minimum = vector3f_type( ( std::numeric_limits<float_type>::max )() );
        m_maximum = vector3f_type( -( std::numeric_limits<float_type>::max )() );
    }

    static boundbox3t from_empty() { return boundbox3t(); }

    const vector3f_type& minimum() const { return m_minimum; }

    const vector3f_type& maximum() const { return m_maximum; }

    float_type xminimum() const { return m_minimum.x; }
    float_type yminimum() const { return m_minimum.y; }
    float_type zminimum() const { return m_minimum.z; }
    float_type xmaximum() const { return m_maximum.x; }
    float_type ymaximum() const { return m_maximum.y; }
    float_type zmaximum() const { return m_maximum.z; }

    bool is_empty() const {
        return m_minimum.x > m_maximum.x || m_minimum.y > m_maximum.y || m_minimum.z > m_maximum.z;
    }

    // Grows the box to include the point
    void operator+=( const vector3f_type& point ) {
        m_minimum.set( ( std::min )( m_minimum.x, point.x ), ( std::min )( m_minimum.y, point.y ),
                       ( std::min )( m_minimum.z, point.z ) );
        m_maximum.set( ( std::max )( m_maximum.x, point.x ), ( std::max )( m_maximum.y, point.y ),
                       ( std::max )( m_maximum.z, point.z ) );
    }

    bool operator==( const boundbox3t& rhs ) const { return m_minimum == rhs.m_minimum && m_maximum == rhs.m_maximum; }

    bool operator!=( const boundbox3t& rhs ) const { return !operator==( rhs ); }
};

template <typename CharType, typename FloatType>
inline std::basic_ostream<CharType>& operator<<( std::basic_ostream<CharType>& out, const boundbox3t<FloatType>& box ) {
    if( box.is_empty() )
        out << "(boundbox3 empty)";
    else
        out << "(boundbox3 " << box.minimum() << " " << box.maximum() << " )";
    return out;
}

typedef boundbox3t<float> boundbox3f;
typedef boundbox3t<double> boundbox3fd;

} // namespace graphics
} // namespace stratum
