// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ostream>
#include <sstream>
#include <string>

// Implemented as a macro so that nothing on the right hand side is evaluated when the stream is disabled. Usage:
//		ST_LOG(debug) << "Reading row " << row << " of plane " << plane << std::endl;
#define ST_LOG( stream )                                                                                               \
    if( stratum::logging::get_logging_level() >= stratum::logging::level::stream && stratum::logging::stream.rdbuf() ) \
    stratum::logging::stream

namespace stratum {
namespace logging {

// By default the log streams write to std::clog, except for error which writes to std::cerr. Use
// redirect_stream() or redirect_all_streams() to send them elsewhere.
extern std::ostream debug;
extern std::ostream stats;
extern std::ostream progress;
extern std::ostream warning;
extern std::ostream error;

// 0 is no logging, 1 is errors only, 2 is warnings, 3 is with progress, 4 is with stats, 5 is debugging
namespace level {
enum { none = 0, error, warning, progress, stats, debug };
}

inline void redirect_stream( std::ostream& stream, std::streambuf* newBuff ) { stream.rdbuf( newBuff ); }

void redirect_all_streams( std::streambuf* newBuff );
void reset_default_streams();

void set_logging_level( int level );
int get_logging_level();
std::string get_logging_level_string();

/**
 * Parses a level given either as a number ("0" to "5") or a name ("none", "error", "warning", "progress", "stats",
 * "debug"). Throws std::invalid_argument for anything else.
 */
int parse_logging_level( const std::string& levelString );

class set_logging_level_in_scope {
  public:
    explicit set_logging_level_in_scope( int level );
    ~set_logging_level_in_scope();

  private:
    int m_oldLevel;
};

std::string logging_level_as_string( int level );

std::ostream& get_logging_stream( int streamLevel );

bool is_logging_errors();
bool is_logging_warnings();
bool is_logging_progress();
bool is_logging_stats();
bool is_logging_debug();

/**
 * Redirects every log stream into an internal string buffer for the lifetime of the object, restoring the previous
 * buffers on destruction. Useful for capturing the log output of an operation.
 */
class scoped_log_capture {
    std::stringbuf m_buffer;
    std::streambuf* m_oldBuffers[5];

    scoped_log_capture( const scoped_log_capture& );
    scoped_log_capture& operator=( const scoped_log_capture& );

  public:
    scoped_log_capture();
    ~scoped_log_capture();

    std::string str() const { return m_buffer.str(); }
};

} // namespace logging
} // namespace stratum
