// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest/gtest.h"

#include <stratum/logging/logging_level.hpp>
#include <stratum/tinyxml/tinyxml_utility.hpp>

#include <boost/program_options.hpp>

using namespace stratum;

namespace {

const char* g_config = "<voxset_info>"
                       "  <input>grid.voxset</input>"
                       "  <limit> 25 </limit>"
                       "  <values>yes</values>"
                       "  <output><format>text</format></output>"
                       "</voxset_info>";

} // anonymous namespace

TEST( TinyXMLUtility, GetValues ) {
    tinyxml2::XMLDocument doc;
    ASSERT_EQ( tinyxml2::XML_SUCCESS, doc.Parse( g_config ) );
    tinyxml2::XMLHandle root( doc.RootElement() );

    EXPECT_EQ( "grid.voxset", tinyxml::get_xml_value<std::string>( "input", root ) );
    EXPECT_EQ( 25, tinyxml::get_xml_value<int>( "limit", 0, root ) );
    EXPECT_EQ( "text", tinyxml::get_string( "output/format", "", root ) );
    EXPECT_TRUE( tinyxml::get_bool( "values", false, root ) );

    logging::set_logging_level_in_scope quiet( logging::level::none );
    EXPECT_EQ( 7, tinyxml::get_xml_value<int>( "missing", 7, root ) );
    EXPECT_THROW( tinyxml::get_xml_value<int>( "missing", root ), std::runtime_error );
    EXPECT_THROW( tinyxml::get_xml_value<int>( "input", 0, root ), std::runtime_error );

    EXPECT_TRUE( tinyxml::node_exists( root, "output/format" ) );
    EXPECT_FALSE( tinyxml::node_exists( root, "output/style" ) );
    EXPECT_EQ( "/voxset_info/output/format", tinyxml::get_xml_handle_path( root, "output/format" ) );
}

TEST( TinyXMLUtility, CommandLineOverridesXml ) {
    namespace po = boost::program_options;
    tinyxml2::XMLDocument doc;
    ASSERT_EQ( tinyxml2::XML_SUCCESS, doc.Parse( g_config ) );
    tinyxml2::XMLHandle root( doc.RootElement() );

    po::options_description desc;
    desc.add_options()( "limit", po::value<int>()->default_value( 10 ), "" )( "input", po::value<std::string>(),
                                                                             "" );

    // A defaulted option doesn't override
    {
        const char* argv[] = { "voxset_info" };
        po::variables_map vm;
        po::store( po::parse_command_line( 1, argv, desc ), vm );
        po::notify( vm );
        EXPECT_EQ( 25, tinyxml::get_xml_value<int>( "limit", 0, root, true, &vm ) );
    }

    {
        const char* argv[] = { "voxset_info", "--limit", "3", "--input", "other.voxset" };
        po::variables_map vm;
        po::store( po::parse_command_line( 5, argv, desc ), vm );
        po::notify( vm );
        EXPECT_EQ( 3, tinyxml::get_xml_value<int>( "limit", 0, root, true, &vm ) );
        EXPECT_EQ( "other.voxset", tinyxml::get_string( "input", "", root, true, &vm ) );
    }
}

TEST( TinyXMLUtility, SetAndCollectValues ) {
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLElement* root = doc.NewElement( "root" );
    doc.InsertEndChild( root );

    tinyxml::set_xml_value( root, "a/b", "1" );
    tinyxml::set_xml_value( root, "a/c", "2" );
    tinyxml::set_xml_value( root, "/d/", "3" );
    tinyxml::set_xml_value( root, "a/b", "4" );
    EXPECT_THROW( tinyxml::set_xml_value( root, "//", "5" ), std::runtime_error );

    EXPECT_EQ( std::vector<std::string>( 1, "d" ), tinyxml::split_xml_path( "/d/" ) );

    std::map<std::string, std::string> values;
    tinyxml::collect_leaf_values( tinyxml2::XMLHandle( root ), values );
    ASSERT_EQ( 3u, values.size() );
    EXPECT_EQ( "4", values["a/b"] );
    EXPECT_EQ( "2", values["a/c"] );
    EXPECT_EQ( "3", values["d"] );
}
