// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/cstdint.hpp>

#include <ostream>

namespace stratum {
namespace graphics {

class size3 {
    int m_xsize, m_ysize, m_zsize;

  public:
    explicit size3( int w ) { m_xsize = m_ysize = m_zsize = w; }

    size3( int xsize, int ysize, int zsize ) {
        m_xsize = xsize;
        m_ysize = ysize;
        m_zsize = zsize;
    }

    size3() {
        m_xsize = 0;
        m_ysize = 0;
        m_zsize = 0;
    }

    void set( int xsize, int ysize, int zsize ) {
        m_xsize = xsize;
        m_ysize = ysize;
        m_zsize = zsize;
    }

    int xsize() const { return m_xsize; }

    int ysize() const { return m_ysize; }

    int zsize() const { return m_zsize; }

    bool is_zero_or_negative() const { return m_xsize <= 0 || m_ysize <= 0 || m_zsize <= 0; }

    // The number of voxels, computed in 64 bits since large grids overflow an int
    boost::int64_t volume() const {
        return static_cast<boost::int64_t>( m_xsize ) * static_cast<boost::int64_t>( m_ysize ) *
               static_cast<boost::int64_t>( m_zsize );
    }

    bool operator==( const size3& rhs ) const {
        return m_xsize == rhs.m_xsize && m_ysize == rhs.m_ysize && m_zsize == rhs.m_zsize;
    }

    bool operator!=( const size3& rhs ) const { return !operator==( rhs ); }
};

inline std::ostream& operator<<( std::ostream& out, const size3& s ) {
    out << "(" << s.xsize() << ", " << s.ysize() << ", " << s.zsize() << ")";
    return out;
}

} // namespace graphics
} // namespace stratum
