// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ostream>

#include <stratum/graphics/boundbox3t.hpp>

namespace stratum {
namespace graphics {

/**
 * An axis aligned 2D rectangle. The plan view of a boundbox3t, as used for map extents.
 */
template <typename FloatType>
class boundrect2t {
  public:
    typedef FloatType float_type;

  private:
    float_type m_xmin, m_ymin, m_xmax, m_ymax;

  public:
    boundrect2t()
        : m_xmin( 0 )
        , m_ymin( 0 )
        , m_xmax( 0 )
        , m_ymax( 0 ) {}

    boundrect2t( float_type xmin, float_type ymin, float_type xmax, float_type ymax )
        : m_xmin( xmin )
        , m_ymin( ymin )
        , m_xmax( xmax )
        , m_ymax( ymax ) {}

    // Drops the z axis of the box
    static boundrect2t from_boundbox3( const boundbox3t<FloatType>& box ) {
        return boundrect2t( box.xminimum(), box.yminimum(), box.xmaximum(), box.ymaximum() );
    }

    float_type xminimum() const { return m_xmin; }
    float_type yminimum() const { return m_ymin; }
    float_type xmaximum() const { return m_xmax; }
    float_type ymaximum() const { return m_ymax; }

    float_type xsize() const { return m_xmax - m_xmin; }
    float_type ysize() const { return m_ymax - m_ymin; }

    bool operator==( const boundrect2t& rhs ) const {
        return m_xmin == rhs.m_xmin && m_ymin == rhs.m_ymin && m_xmax == rhs.m_xmax && m_ymax == rhs.m_ymax;
    }
};

template <typename CharType, typename FloatType>
inline std::basic_ostream<CharType>& operator<<( std::basic_ostream<CharType>& out,
                                                 const boundrect2t<FloatType>& rect ) {
    out << "(boundrect2 [" << rect.xminimum() << ", " << rect.yminimum() << "] [" << rect.xmaximum() << ", "
        << rect.ymaximum() << "] )";
    return out;
}

typedef boundrect2t<double> boundrect2fd;

} // namespace graphics
} // namespace stratum
