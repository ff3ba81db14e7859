// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>

#include <map>
#include <string>

namespace stratum {
namespace volumetrics {

/**
 * User metadata stored beside a voxset in its XML sidecar file.
 *
 * Keys are '/' separated paths like "survey/operator", where each segment becomes an element of the XML document.
 * Keys are normalized when they are stored, so "/survey//operator/" and "survey/operator" refer to the same value.
 */
class voxset_metadata {
  public:
    typedef std::map<std::string, std::string> collection_type;
    typedef collection_type::const_iterator const_iterator;

  private:
    collection_type m_values;

  public:
    /**
     * Converts a key into its stored form. Throws std::invalid_argument if the key has no segments or if a segment
     * is not a valid XML element name.
     */
    static std::string normalize_key( const std::string& key );

    bool empty() const { return m_values.empty(); }

    std::size_t size() const { return m_values.size(); }

    bool has( const std::string& key ) const;

    boost::optional<std::string> find( const std::string& key ) const;

    /**
     * @return the value for key, or defaultValue if it isn't set.
     */
    std::string get( const std::string& key, const std::string& defaultValue = std::string() ) const;

    template <class T>
    T get_as( const std::string& key, const T& defaultValue ) const {
        boost::optional<std::string> value = find( key );
        if( !value )
            return defaultValue;
        return boost::lexical_cast<T>( *value );
    }

    /**
     * @return true if this changed the stored value.
     */
    bool set( const std::string& key, const std::string& value );

    template <class T>
    bool set_value( const std::string& key, const T& value ) {
        return set( key, boost::lexical_cast<std::string>( value ) );
    }

    /**
     * Sets every entry of values.
     *
     * @return true if any stored value changed.
     */
    bool update( const std::map<std::string, std::string>& values );

    /**
     * @return true if the key was present.
     */
    bool erase( const std::string& key );

    void clear() { m_values.clear(); }

    const collection_type& values() const { return m_values; }

    const_iterator begin() const { return m_values.begin(); }

    const_iterator end() const { return m_values.end(); }

    bool operator==( const voxset_metadata& rhs ) const { return m_values == rhs.m_values; }

    bool operator!=( const voxset_metadata& rhs ) const { return !operator==( rhs ); }

    /**
     * Replaces the contents with the values in the XML file. Throws std::runtime_error if the file can't be loaded
     * or isn't a voxset metadata document.
     */
    void read( const boost::filesystem::path& path );

    /**
     * Writes the values as an XML file. Throws std::runtime_error on failure.
     */
    void write( const boost::filesystem::path& path ) const;
};

} // namespace volumetrics
} // namespace stratum
