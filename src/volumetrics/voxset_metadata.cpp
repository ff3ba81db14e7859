// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/tinyxml/tinyxml_utility.hpp>
#include <stratum/volumetrics/voxset_metadata.hpp>

#include <boost/algorithm/string/join.hpp>

#include <cctype>
#include <stdexcept>
#include <vector>

namespace stratum {
namespace volumetrics {

namespace {

const char* g_rootElementName = "voxset_metadata";

bool is_valid_element_name( const std::string& s ) {
    if( s.empty() )
        return false;
    const unsigned char first = static_cast<unsigned char>( s[0] );
    if( !std::isalpha( first ) && first != '_' )
        return false;
    // Names starting with "xml" are reserved
    if( s.size() >= 3 && std::tolower( s[0] ) == 'x' && std::tolower( s[1] ) == 'm' && std::tolower( s[2] ) == 'l' )
        return false;
    for( std::size_t i = 1; i < s.size(); ++i ) {
        const unsigned char c = static_cast<unsigned char>( s[i] );
        if( !std::isalnum( c ) && c != '_' && c != '-' && c != '.' )
            return false;
    }
    return true;
}

} // anonymous namespace

std::string voxset_metadata::normalize_key( const std::string& key ) {
    const std::vector<std::string> segments = tinyxml::split_xml_path( key );
    if( segments.empty() )
        throw std::invalid_argument( "voxset_metadata: The key \"" + key + "\" is empty." );
    for( std::size_t i = 0; i < segments.size(); ++i ) {
        if( !is_valid_element_name( segments[i] ) )
            throw std::invalid_argument( "voxset_metadata: The key \"" + key + "\" has the segment \"" +
                                         segments[i] + "\", which is not a valid XML element name." );
    }
    return boost::algorithm::join( segments, "/" );
}

bool voxset_metadata::has( const std::string& key ) const { return m_values.count( normalize_key( key ) ) != 0; }

boost::optional<std::string> voxset_metadata::find( const std::string& key ) const {
    collection_type::const_iterator i = m_values.find( normalize_key( key ) );
    if( i == m_values.end() )
        return boost::none;
    return i->second;
}

std::string voxset_metadata::get( const std::string& key, const std::string& defaultValue ) const {
    boost::optional<std::string> value = find( key );
    return value ? *value : defaultValue;
}

bool voxset_metadata::set( const std::string& key, const std::string& value ) {
    const std::string normalized = normalize_key( key );
    collection_type::iterator i = m_values.find( normalized );
    if( i != m_values.end() ) {
        if( i->second == value )
            return false;
        i->second = value;
        return true;
    }
    m_values.insert( std::make_pair( normalized, value ) );
    return true;
}

bool voxset_metadata::update( const std::map<std::string, std::string>& values ) {
    // Validate every key first so a bad key leaves the metadata untouched
    std::map<std::string, std::string> normalized;
    for( std::map<std::string, std::string>::const_iterator i = values.begin(); i != values.end(); ++i )
        normalized[normalize_key( i->first )] = i->second;

    bool changed = false;
    for( std::map<std::string, std::string>::const_iterator i = normalized.begin(); i != normalized.end(); ++i ) {
        if( set( i->first, i->second ) )
            changed = true;
    }
    return changed;
}

bool voxset_metadata::erase( const std::string& key ) { return m_values.erase( normalize_key( key ) ) != 0; }

void voxset_metadata::read( const boost::filesystem::path& path ) {
    tinyxml2::XMLDocument doc;
    tinyxml::load_xml_file( path, doc );

    tinyxml2::XMLElement* root = doc.RootElement();
    if( !root || std::string( root->Name() ) != g_rootElementName )
        throw std::runtime_error( "voxset_metadata.read: The file \"" + path.string() + "\" does not have a <" +
                                  g_rootElementName + "> root element." );

    collection_type values;
    tinyxml::collect_leaf_values( tinyxml2::XMLHandle( root ), values );
    m_values.swap( values );
}

void voxset_metadata::write( const boost::filesystem::path& path ) const {
    tinyxml2::XMLDocument doc;
    doc.InsertEndChild( doc.NewDeclaration() );
    tinyxml2::XMLElement* root = doc.NewElement( g_rootElementName );
    doc.InsertEndChild( root );

    for( collection_type::const_iterator i = m_values.begin(); i != m_values.end(); ++i )
        tinyxml::set_xml_value( root, i->first, i->second );

    tinyxml::save_xml_file( path, doc );
}

} // namespace volumetrics
} // namespace stratum
