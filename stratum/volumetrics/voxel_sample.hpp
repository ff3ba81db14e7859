// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/graphics/vector3t.hpp>

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>

#include <ostream>

namespace stratum {
namespace volumetrics {

/**
 * A single voxel value, kept in the widest type of its domain so that no integer precision is lost when it is read
 * from a 64-bit grid.
 */
class voxel_value {
  public:
    enum domain_t { signed_integer, unsigned_integer, floating_point };

  private:
    domain_t m_domain;
    union {
        boost::int64_t i;
        boost::uint64_t u;
        double f;
    } m_value;

  public:
    voxel_value()
        : m_domain( floating_point ) {
        m_value.f = 0.0;
    }

    static voxel_value from_int64( boost::int64_t v ) {
        voxel_value result;
        result.m_domain = signed_integer;
        result.m_value.i = v;
        return result;
    }

    static voxel_value from_uint64( boost::uint64_t v ) {
        voxel_value result;
        result.m_domain = unsigned_integer;
        result.m_value.u = v;
        return result;
    }

    static voxel_value from_double( double v ) {
        voxel_value result;
        result.m_domain = floating_point;
        result.m_value.f = v;
        return result;
    }

    domain_t domain() const { return m_domain; }

    bool is_integer() const { return m_domain != floating_point; }

    boost::int64_t as_int64() const {
        switch( m_domain ) {
        case signed_integer:
            return m_value.i;
        case unsigned_integer:
            return static_cast<boost::int64_t>( m_value.u );
        default:
            return static_cast<boost::int64_t>( m_value.f );
        }
    }

    boost::uint64_t as_uint64() const {
        switch( m_domain ) {
        case signed_integer:
            return static_cast<boost::uint64_t>( m_value.i );
        case unsigned_integer:
            return m_value.u;
        default:
            return static_cast<boost::uint64_t>( m_value.f );
        }
    }

    double as_double() const {
        switch( m_domain ) {
        case signed_integer:
            return static_cast<double>( m_value.i );
        case unsigned_integer:
            return static_cast<double>( m_value.u );
        default:
            return m_value.f;
        }
    }

    // Values compare by number, so from_int64( 3 ) == from_double( 3.0 ).
    bool operator==( const voxel_value& rhs ) const {
        if( m_domain == rhs.m_domain ) {
            switch( m_domain ) {
            case signed_integer:
                return m_value.i == rhs.m_value.i;
            case unsigned_integer:
                return m_value.u == rhs.m_value.u;
            default:
                return m_value.f == rhs.m_value.f;
            }
        }
        if( is_integer() && rhs.is_integer() ) {
            const voxel_value& s = ( m_domain == signed_integer ) ? *this : rhs;
            const voxel_value& u = ( m_domain == signed_integer ) ? rhs : *this;
            return s.m_value.i >= 0 && static_cast<boost::uint64_t>( s.m_value.i ) == u.m_value.u;
        }
        return as_double() == rhs.as_double();
    }

    bool operator!=( const voxel_value& rhs ) const { return !operator==( rhs ); }
};

inline std::ostream& operator<<( std::ostream& out, const voxel_value& v ) {
    switch( v.domain() ) {
    case voxel_value::signed_integer:
        out << v.as_int64();
        break;
    case voxel_value::unsigned_integer:
        out << v.as_uint64();
        break;
    default:
        out << v.as_double();
        break;
    }
    return out;
}

/**
 * A voxel's center location together with its value. An absent value means the voxel holds no data.
 */
struct voxel_sample {
    graphics::vector3fd position;
    boost::optional<voxel_value> value;

    voxel_sample() {}

    voxel_sample( const graphics::vector3fd& pos, const boost::optional<voxel_value>& v )
        : position( pos )
        , value( v ) {}

    double x() const { return position.x; }
    double y() const { return position.y; }
    double z() const { return position.z; }

    bool is_null() const { return !value; }

    bool operator==( const voxel_sample& rhs ) const { return position == rhs.position && value == rhs.value; }

    bool operator!=( const voxel_sample& rhs ) const { return !operator==( rhs ); }
};

inline std::ostream& operator<<( std::ostream& out, const voxel_sample& s ) {
    out << "(" << s.position.x << ", " << s.position.y << ", " << s.position.z << ", ";
    if( s.value )
        out << *s.value;
    else
        out << "None";
    out << ")";
    return out;
}

} // namespace volumetrics
} // namespace stratum
