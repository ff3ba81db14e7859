// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ostream>
#include <string>

namespace stratum {
namespace geospatial {

/**
 * An opaque projection / spatial reference. The voxel layer never interprets it, it only hands it from the storage to
 * the caller. A coordinate system has a short display name (e.g. "NAD83 / UTM zone 17N") and a descriptor in whatever
 * form the storage keeps it, typically WKT.
 */
class coordinate_system {
    std::string m_name;
    std::string m_descriptor;

  public:
    coordinate_system() {}

    explicit coordinate_system( const std::string& name, const std::string& descriptor = std::string() )
        : m_name( name )
        , m_descriptor( descriptor ) {}

    static coordinate_system unknown() { return coordinate_system(); }

    const std::string& name() const { return m_name; }

    const std::string& descriptor() const { return m_descriptor; }

    // A coordinate system without a name is "unknown"
    bool is_known() const { return !m_name.empty(); }

    std::string str() const { return is_known() ? m_name : std::string( "*unknown" ); }

    bool operator==( const coordinate_system& rhs ) const {
        return m_name == rhs.m_name && m_descriptor == rhs.m_descriptor;
    }

    bool operator!=( const coordinate_system& rhs ) const { return !operator==( rhs ); }
};

inline std::ostream& operator<<( std::ostream& out, const coordinate_system& cs ) {
    out << cs.str();
    return out;
}

} // namespace geospatial
} // namespace stratum
