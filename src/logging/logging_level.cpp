// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/logging/logging_level.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <iostream>
#include <stdexcept>

// 0 is no logging, 1 is errors only, 2 is warnings, 3 is with progress, 4 is with stats, 5 is debugging
static int g_loggingLevel = 4;

namespace stratum {
namespace logging {

std::ostream debug( std::clog.rdbuf() );
std::ostream stats( std::clog.rdbuf() );
std::ostream progress( std::clog.rdbuf() );
std::ostream warning( std::clog.rdbuf() );
std::ostream error( std::cerr.rdbuf() );

std::string logging_level_as_string( int level ) {
    switch( level ) {
    case level::none:
        return "0 - No Logging";
    case level::error:
        return "1 - Errors";
    case level::warning:
        return "2 - Warnings";
    case level::progress:
        return "3 - Progress";
    case level::stats:
        return "4 - Stats";
    default:
        return "5 - Debug";
    }
}

std::ostream& get_logging_stream( int streamLevel ) {
    switch( streamLevel ) {
    case level::error:
        return error;
    case level::warning:
        return warning;
    case level::progress:
        return progress;
    case level::stats:
        return stats;
    case level::debug:
        return debug;
    default:
        return std::cout;
    }
}

void redirect_all_streams( std::streambuf* newBuff ) {
    debug.rdbuf( newBuff );
    stats.rdbuf( newBuff );
    progress.rdbuf( newBuff );
    warning.rdbuf( newBuff );
    error.rdbuf( newBuff );
}

void reset_default_streams() {
    debug.rdbuf( std::clog.rdbuf() );
    stats.rdbuf( std::clog.rdbuf() );
    progress.rdbuf( std::clog.rdbuf() );
    warning.rdbuf( std::clog.rdbuf() );
    error.rdbuf( std::cerr.rdbuf() );
}

void set_logging_level( int level ) { g_loggingLevel = level; }

std::string get_logging_level_string() { return logging_level_as_string( g_loggingLevel ); }

int get_logging_level() { return g_loggingLevel; }

int parse_logging_level( const std::string& levelString ) {
    std::string s = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( levelString ) );

    static const char* names[] = { "none", "error", "warning", "progress", "stats", "debug" };
    for( int i = 0; i < 6; ++i ) {
        if( s == names[i] || ( s.size() == 1 && s[0] == '0' + i ) )
            return i;
    }
    // Accept the plural forms used by logging_level_as_string
    if( s == "errors" )
        return level::error;
    if( s == "warnings" )
        return level::warning;

    throw std::invalid_argument( "parse_logging_level: \"" + levelString +
                                 "\" is not a logging level. Expected 0-5 or one of none, error, warning, progress, "
                                 "stats, debug." );
}

set_logging_level_in_scope::set_logging_level_in_scope( int level )
    : m_oldLevel( get_logging_level() ) {
    set_logging_level( level );
}

set_logging_level_in_scope::~set_logging_level_in_scope() { set_logging_level( m_oldLevel ); }

scoped_log_capture::scoped_log_capture() {
    m_oldBuffers[0] = debug.rdbuf();
    m_oldBuffers[1] = stats.rdbuf();
    m_oldBuffers[2] = progress.rdbuf();
    m_oldBuffers[3] = warning.rdbuf();
    m_oldBuffers[4] = error.rdbuf();
    redirect_all_streams( &m_buffer );
}

scoped_log_capture::~scoped_log_capture() {
    debug.rdbuf( m_oldBuffers[0] );
    stats.rdbuf( m_oldBuffers[1] );
    progress.rdbuf( m_oldBuffers[2] );
    warning.rdbuf( m_oldBuffers[3] );
    error.rdbuf( m_oldBuffers[4] );
}

bool is_logging_errors() { return g_loggingLevel > 0; }

bool is_logging_warnings() { return g_loggingLevel > 1; }

bool is_logging_progress() { return g_loggingLevel > 2; }

bool is_logging_stats() { return g_loggingLevel > 3; }

bool is_logging_debug() { return g_loggingLevel > 4; }

} // namespace logging
} // namespace stratum
