// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/logging/logging_level.hpp>

#include <tinyxml2.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options/variables_map.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <vector>

// File: tinyxml_utility.hpp
//
// Utility functions for reading and writing values in a tinyxml2 document by '/' separated element paths,
// e.g. "survey/crs/name". Command line parameters of equivalent names can override the xml if desired.
namespace stratum {
namespace tinyxml {

inline std::string get_xml_handle_path( tinyxml2::XMLHandle handle ) {
    if( handle.ToNode() == 0 )
        return "<nul>";
    else if( handle.ToNode()->ToDocument() != 0 )
        return "/";
    else if( handle.ToNode()->ToElement() != 0 ) {
        std::string root = get_xml_handle_path( tinyxml2::XMLHandle( handle.ToNode()->Parent() ) );
        if( root.size() == 0 || root[root.size() - 1] != '/' )
            root += "/";
        return root + handle.ToNode()->Value();
    } else
        return "unknown";
}

inline std::string get_xml_handle_path( tinyxml2::XMLHandle handle, const std::string& nodeName ) {
    const std::string suffix = ( nodeName == "." || nodeName.empty() ) ? "" : "/" + nodeName;
    if( handle.ToNode() == 0 )
        return "<nul>" + suffix;
    else if( handle.ToNode()->ToDocument() != 0 )
        return suffix.empty() ? "/" : suffix;
    else
        return get_xml_handle_path( handle ) + suffix;
}

/**
 * Splits an element path into its non-empty segments, so "a//b/" gives { "a", "b" }.
 */
inline std::vector<std::string> split_xml_path( const std::string& xmlPath ) {
    std::vector<std::string> segments, result;
    boost::algorithm::split( segments, xmlPath, boost::algorithm::is_any_of( "/" ) );
    for( std::size_t i = 0; i < segments.size(); ++i ) {
        if( !segments[i].empty() && segments[i] != "." )
            result.push_back( segments[i] );
    }
    return result;
}

namespace detail {
inline tinyxml2::XMLHandle get_tinyxml_handle_helper( tinyxml2::XMLHandle handle,
                                                      const std::vector<std::string>& nodePath, std::size_t start ) {
    if( start >= nodePath.size() )
        return tinyxml2::XMLHandle( static_cast<tinyxml2::XMLNode*>( 0 ) );

    for( tinyxml2::XMLElement* childNode = handle.FirstChildElement( nodePath[start].c_str() ).ToElement(); childNode;
         childNode = childNode->NextSiblingElement( nodePath[start].c_str() ) ) {
        if( start == nodePath.size() - 1 )
            return tinyxml2::XMLHandle( childNode );
        tinyxml2::XMLHandle foundNode = get_tinyxml_handle_helper( tinyxml2::XMLHandle( childNode ), nodePath, start + 1 );
        if( foundNode.ToNode() != 0 )
            return foundNode;
    }

    return tinyxml2::XMLHandle( static_cast<tinyxml2::XMLNode*>( 0 ) );
}
} // namespace detail

inline tinyxml2::XMLHandle get_tinyxml_handle( tinyxml2::XMLHandle handle, const std::string& xmlPath ) {
    std::vector<std::string> nodePath = split_xml_path( xmlPath );
    if( nodePath.empty() || handle.ToNode() == 0 )
        return handle;

    return detail::get_tinyxml_handle_helper( handle, nodePath, 0 );
}

inline bool node_exists( tinyxml2::XMLHandle handle, const std::string& xmlPath ) {
    return get_tinyxml_handle( handle, xmlPath ).ToNode() != 0;
}

//
// Function: get_xml_value
//
// Gets a value from XML.
//
// Parameters:
//  name - the path of the element, relative to handle, whose text holds the value.
//  defaultValue - the value this function returns if "name" is not specified in XML.
//  handle - a tinyxml2::XMLHandle to the node that contains the "name" field.
//  warnOnFail - log a warning when "name" is missing.
//  cmd_line_vars - when it holds a value for "name", that value wins over the XML.
//
// Returns:
//  The value specified by "name" or "defaultValue" if "name" was not found.
//
template <class T>
inline T get_xml_value( const std::string& name, const T& defaultValue, tinyxml2::XMLHandle handle,
                        bool warnOnFail = true, const boost::program_options::variables_map* cmd_line_vars = 0 ) {
    if( cmd_line_vars != 0 && cmd_line_vars->count( name ) > 0 && !( *cmd_line_vars )[name].defaulted() )
        return ( *cmd_line_vars )[name].as<T>();

    tinyxml2::XMLHandle childHandle = get_tinyxml_handle( handle, name );
    tinyxml2::XMLText* text = childHandle.FirstChild().ToText();
    if( text ) {
        try {
            return boost::lexical_cast<T>( boost::algorithm::trim_copy( std::string( text->Value() ) ) );
        } catch( const boost::bad_lexical_cast& ) {
            throw std::runtime_error( "XML variable \"" + get_xml_handle_path( handle, name ) + "\", with value \"" +
                                      text->Value() + "\" could not be parsed as a " + typeid( T ).name() );
        }
    } else if( warnOnFail ) {
        ST_LOG( warning ) << "Warning: Couldn't read xml parameter \"" << get_xml_handle_path( handle, name )
                          << "\", assuming default of " << defaultValue << std::endl;
    }

    return defaultValue;
}

template <class T>
inline T get_xml_value( const std::string& name, tinyxml2::XMLHandle handle,
                        const boost::program_options::variables_map* cmd_line_vars = 0 ) {
    if( cmd_line_vars != 0 && cmd_line_vars->count( name ) > 0 && !( *cmd_line_vars )[name].defaulted() )
        return ( *cmd_line_vars )[name].as<T>();

    tinyxml2::XMLHandle childHandle = get_tinyxml_handle( handle, name );
    tinyxml2::XMLText* text = childHandle.FirstChild().ToText();
    if( text ) {
        try {
            return boost::lexical_cast<T>( boost::algorithm::trim_copy( std::string( text->Value() ) ) );
        } catch( const boost::bad_lexical_cast& ) {
            throw std::runtime_error( "XML variable \"" + get_xml_handle_path( handle, name ) + "\", with value \"" +
                                      text->Value() + "\" could not be parsed as a " + typeid( T ).name() );
        }
    }

    throw std::runtime_error( "XML variable \"" + get_xml_handle_path( handle, name ) +
                              "\", intended to be parsed as a " + typeid( T ).name() +
                              ", could not be found in the .xml file" );
}

inline bool parse_bool( const std::string& value, bool& outResult ) {
    std::string v = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( value ) );
    if( v == "true" || v == "on" || v == "1" || v == "yes" ) {
        outResult = true;
        return true;
    }
    if( v == "false" || v == "off" || v == "0" || v == "no" ) {
        outResult = false;
        return true;
    }
    return false;
}

inline bool get_bool( const std::string& name, bool defaultValue, tinyxml2::XMLHandle handle, bool warnOnFail = true,
                      const boost::program_options::variables_map* cmd_line_vars = 0 ) {
    if( cmd_line_vars != 0 && cmd_line_vars->count( name ) > 0 && !( *cmd_line_vars )[name].defaulted() )
        return ( *cmd_line_vars )[name].as<bool>();

    tinyxml2::XMLText* text = get_tinyxml_handle( handle, name ).FirstChild().ToText();
    if( !text ) {
        if( warnOnFail )
            ST_LOG( warning ) << "Warning: Couldn't read xml parameter \"" << get_xml_handle_path( handle, name )
                              << "\", assuming default of " << defaultValue << std::endl;
        return defaultValue;
    }

    bool result = defaultValue;
    if( !parse_bool( text->Value(), result ) )
        throw std::runtime_error( "XML variable \"" + get_xml_handle_path( handle, name ) + "\" with value \"" +
                                  text->Value() + "\", intended to be parsed as a bool, could not be parsed properly" );
    return result;
}

inline std::string get_string( const std::string& name, const std::string& defaultValue, tinyxml2::XMLHandle handle,
                               bool warnOnFail = true,
                               const boost::program_options::variables_map* cmd_line_vars = 0 ) {
    return get_xml_value<std::string>( name, defaultValue, handle, warnOnFail, cmd_line_vars );
}

// Function: set_node_value
// Sets the text of the element that is pointed to by the specified handle.
//  If the element already has a tinyxml2::XMLText child, it simply sets the value of the text.
//  Otherwise a tinyxml2::XMLText is created and inserted as the first child of the element.
// Returns:
//  true if the set value was successful, false otherwise.
inline bool set_node_value( tinyxml2::XMLHandle handle, const std::string& value ) {
    tinyxml2::XMLText* text = handle.FirstChild().ToText();
    if( text != 0 ) {
        text->SetValue( value.c_str() );
        return true;
    }

    tinyxml2::XMLNode* currentNode = handle.ToNode();
    if( !currentNode )
        return false;
    return currentNode->InsertFirstChild( currentNode->GetDocument()->NewText( value.c_str() ) ) != 0;
}

/**
 * Finds the element at xmlPath below parent, creating every missing element along the way.
 *
 * @return the element, or NULL if xmlPath has no segments.
 */
inline tinyxml2::XMLElement* ensure_element( tinyxml2::XMLNode* parent, const std::string& xmlPath ) {
    std::vector<std::string> nodePath = split_xml_path( xmlPath );
    if( nodePath.empty() || !parent )
        return 0;

    tinyxml2::XMLDocument* doc = parent->GetDocument();
    tinyxml2::XMLElement* current = 0;
    for( std::size_t i = 0; i < nodePath.size(); ++i ) {
        current = parent->FirstChildElement( nodePath[i].c_str() );
        if( !current )
            current = parent->InsertEndChild( doc->NewElement( nodePath[i].c_str() ) )->ToElement();
        parent = current;
    }
    return current;
}

/**
 * Sets the text of the element at xmlPath below parent, creating the elements if needed.
 */
inline void set_xml_value( tinyxml2::XMLNode* parent, const std::string& xmlPath, const std::string& value ) {
    tinyxml2::XMLElement* element = ensure_element( parent, xmlPath );
    if( !element || !set_node_value( tinyxml2::XMLHandle( element ), value ) )
        throw std::runtime_error( "set_xml_value: Could not set XML variable \"" +
                                  get_xml_handle_path( tinyxml2::XMLHandle( parent ), xmlPath ) + "\"" );
}

/**
 * Collects the text of every leaf element below handle into outValues, keyed by the '/' separated path relative to
 * handle. An element that holds text is a leaf, as is an empty element (which maps to an empty string).
 */
inline void collect_leaf_values( tinyxml2::XMLHandle handle, std::map<std::string, std::string>& outValues,
                                 const std::string& prefix = std::string() ) {
    for( tinyxml2::XMLElement* child = handle.FirstChildElement().ToElement(); child;
         child = child->NextSiblingElement() ) {
        const std::string path = prefix.empty() ? std::string( child->Name() ) : prefix + "/" + child->Name();
        const char* text = child->GetText();
        if( child->FirstChildElement() ) {
            // An element can carry its own value alongside nested values.
            if( text )
                outValues[path] = text;
            collect_leaf_values( tinyxml2::XMLHandle( child ), outValues, path );
        } else {
            outValues[path] = text ? text : "";
        }
    }
}

/**
 * Loads an XML file into doc, throwing std::runtime_error with the parser's message on failure.
 */
inline void load_xml_file( const boost::filesystem::path& path, tinyxml2::XMLDocument& doc ) {
    const tinyxml2::XMLError result = doc.LoadFile( path.string().c_str() );
    if( result != tinyxml2::XML_SUCCESS ) {
        const char* errorStr = doc.ErrorStr();
        throw std::runtime_error( "load_xml_file: Failed to load XML file \"" + path.string() +
                                  "\": " + ( errorStr ? errorStr : doc.ErrorName() ) );
    }
}

/**
 * Saves doc to an XML file, throwing std::runtime_error on failure.
 */
inline void save_xml_file( const boost::filesystem::path& path, tinyxml2::XMLDocument& doc ) {
    const tinyxml2::XMLError result = doc.SaveFile( path.string().c_str() );
    if( result != tinyxml2::XML_SUCCESS ) {
        throw std::runtime_error( "save_xml_file: Failed to save XML file \"" + path.string() + "\": " +
                                  doc.ErrorName() );
    }
}

} // namespace tinyxml
} // namespace stratum
