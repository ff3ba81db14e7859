// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/diagnostics/resource_tracker.hpp>
#include <stratum/logging/logging_level.hpp>
#include <stratum/tinyxml/tinyxml_utility.hpp>
#include <stratum/volumetrics/voxset.hpp>

#include <boost/program_options.hpp>

#include <iostream>

using namespace std;
using namespace stratum;
using namespace stratum::volumetrics;

namespace po = boost::program_options;

namespace {

struct voxset_info_options {
    std::string input;
    std::string logLevel;
    bool printValues;
    boost::int64_t limit;
    std::vector<std::string> setMetadata;

    voxset_info_options()
        : printValues( false )
        , limit( 0 ) {}
};

void print_spacing( std::ostream& out, const char* axis, const boost::optional<double>& spacing ) {
    out << "  " << axis << ": ";
    if( spacing )
        out << *spacing << "\n";
    else
        out << "non-uniform\n";
}

void print_summary( std::ostream& out, const voxset& vs ) {
    out << "File:              " << vs.file_name() << "\n";
    out << "Dimensions:        " << vs.nx() << " x " << vs.ny() << " x " << vs.nz() << " (" << vs.size()
        << " voxels)\n";
    out << "Value type:        " << voxel_data_type_str( vs.value_type() ) << "\n";
    out << "Origin:            " << vs.origin() << "\n";
    out << "Spacing:\n";
    print_spacing( out, "x", vs.spacing_x() );
    print_spacing( out, "y", vs.spacing_y() );
    print_spacing( out, "z", vs.spacing_z() );
    out << "Extent:            " << vs.extent() << "\n";
    out << "Coordinate system: " << vs.coordinate_system() << "\n";

    const voxset_metadata& metadata = vs.metadata();
    out << "Metadata:          " << metadata.size() << " value(s)\n";
    for( voxset_metadata::const_iterator i = metadata.begin(); i != metadata.end(); ++i )
        out << "  " << i->first << " = " << i->second << "\n";
}

void print_values( std::ostream& out, voxset& vs, boost::int64_t limit ) {
    boost::int64_t count = 0;
    voxel_sample sample;
    vs.reset();
    while( ( limit <= 0 || count < limit ) && vs.next( sample ) ) {
        out << sample << "\n";
        ++count;
    }
    if( count < vs.size() )
        out << "... " << ( vs.size() - count ) << " more\n";
}

// Splits "key=value" entries from the command line
std::map<std::string, std::string> parse_metadata_assignments( const std::vector<std::string>& assignments ) {
    std::map<std::string, std::string> result;
    for( std::size_t i = 0; i < assignments.size(); ++i ) {
        std::string::size_type eq = assignments[i].find( '=' );
        if( eq == std::string::npos || eq == 0 )
            throw std::runtime_error( "Expected key=value for --set-metadata, got \"" + assignments[i] + "\"" );
        result[assignments[i].substr( 0, eq )] = assignments[i].substr( eq + 1 );
    }
    return result;
}

voxset_info_options load_options( const po::variables_map& vm ) {
    voxset_info_options options;

    tinyxml2::XMLDocument doc;
    if( vm.count( "config" ) ) {
        tinyxml::load_xml_file( vm["config"].as<std::string>(), doc );
        if( !doc.FirstChildElement( "voxset_info" ) )
            throw std::runtime_error( "The configuration file \"" + vm["config"].as<std::string>() +
                                      "\" doesn't have a <voxset_info> root element" );
    }
    tinyxml2::XMLHandle root = tinyxml2::XMLHandle( doc ).FirstChildElement( "voxset_info" );

    options.input = tinyxml::get_string( "input", "", root, false, &vm );
    options.logLevel = tinyxml::get_string( "log-level", "stats", root, false, &vm );
    options.printValues = tinyxml::get_bool( "values", false, root, false, &vm );
    options.limit = tinyxml::get_xml_value<boost::int64_t>( "limit", 100, root, false, &vm );
    if( vm.count( "set-metadata" ) )
        options.setMetadata = vm["set-metadata"].as<std::vector<std::string> >();

    return options;
}

} // anonymous namespace

int main( int argc, char* argv[] ) {
    po::options_description desc( "Usage: voxset_info [options] <input>" );
    // clang-format off
    desc.add_options()
        ( "help,h", "Print this help message." )
        ( "input,i", po::value<std::string>(), "The voxset to inspect." )
        ( "config,c", po::value<std::string>(), "An XML file with a <voxset_info> root holding default option values." )
        ( "log-level", po::value<std::string>()->default_value( "stats" ),
          "Logging level: none, error, warning, progress, stats, debug, or a number from 0 to 5." )
        ( "values", po::bool_switch(), "Print the voxel samples in iteration order." )
        ( "limit", po::value<boost::int64_t>()->default_value( 100 ),
          "The maximum number of samples to print with --values. 0 prints all of them." )
        ( "set-metadata", po::value<std::vector<std::string> >()->composing(),
          "Set a metadata value as key=value. May be repeated. Opens the voxset for writing." );
    // clang-format on

    po::positional_options_description positional;
    positional.add( "input", 1 );

    diagnostics::resource_tracker tracker;

    try {
        po::variables_map vm;
        po::store( po::command_line_parser( argc, argv ).options( desc ).positional( positional ).run(), vm );
        po::notify( vm );

        if( vm.count( "help" ) ) {
            cout << desc << endl;
            return 0;
        }

        voxset_info_options options = load_options( vm );

        logging::set_logging_level( logging::parse_logging_level( options.logLevel ) );

        if( options.input.empty() ) {
            ST_LOG( error ) << "No input voxset was specified." << endl;
            cerr << desc << endl;
            return 1;
        }

        const std::map<std::string, std::string> assignments = parse_metadata_assignments( options.setMetadata );
        const voxset_open_mode mode = assignments.empty() ? mode_read : mode_readwrite;

        {
            voxset vs( options.input, mode, tracker.hook() );

            if( !assignments.empty() ) {
                vs.update_metadata( assignments );
                ST_LOG( progress ) << "Updated " << assignments.size() << " metadata value(s) in \""
                                   << vs.metadata_file_name() << "\"" << endl;
            }

            print_summary( cout, vs );
            if( options.printValues )
                print_values( cout, vs, options.limit );

            vs.close();
        }

        if( tracker.open_count() != 0 )
            ST_LOG( warning ) << "Resources left open: " << tracker << endl;
        ST_LOG( stats ) << "Read " << tracker.total_opened() << " voxset(s)" << endl;
    } catch( const std::exception& e ) {
        ST_LOG( error ) << "voxset_info: " << e.what() << endl;
        return 1;
    }

    return 0;
}
