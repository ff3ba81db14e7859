// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/shared_ptr.hpp>

#include <sstream>
#include <streambuf>

namespace stratum {

// This specialization of std::basic_stringbuf exposes the underlying char* of the buffer and adds methods
// for manipulating the ending character of the buffer. This is convenient for maintaining the terminating NULL.
template <class CharType, class Traits>
class basic_charbuf : public std::basic_stringbuf<CharType, Traits> {
  private:
    basic_charbuf( const basic_charbuf& buf );
    basic_charbuf& operator=( const basic_charbuf& buf );

  public:
    basic_charbuf() {}

    CharType* c_str() { return std::basic_stringbuf<CharType, Traits>::gptr(); }

    void pop_back() {
        if( std::basic_stringbuf<CharType, Traits>::pptr() > std::basic_stringbuf<CharType, Traits>::pbase() )
            std::basic_stringbuf<CharType, Traits>::pbump( -1 );
    }

    void push_back( CharType c ) { std::basic_stringbuf<CharType, Traits>::sputc( c ); }
};
typedef basic_charbuf<char, std::char_traits<char>> char_buf;

// class exception_stream_base
//
//  Example Usage:
//    throw voxset_exception( voxset_error::index_out_of_range ) << "ix " << ix << " is outside [0," << nx << ")";
//
// A derived exception that provides stream operators in order to build the message it contains.
template <class ExceptionClass>
class exception_stream_base : public std::exception {
  private:
    // Copies of the exception share the buffer, so no allocation happens after the throw.
    boost::shared_ptr<char_buf> m_pBuffer;

    std::ostream m_stream;

    exception_stream_base& operator=( const exception_stream_base& /*e*/ ) throw();

  public:
    exception_stream_base()
        : m_pBuffer( new char_buf )
        , m_stream( m_pBuffer.get() ) {
        // Mark the end of the buffer w/ a NULL character
        m_pBuffer->push_back( '\0' );
    }

    explicit exception_stream_base( const std::string& msg )
        : m_pBuffer( new char_buf )
        , m_stream( m_pBuffer.get() ) {
        m_stream << msg;
        m_pBuffer->push_back( '\0' );
    }

    exception_stream_base( const exception_stream_base& e )
        : std::exception( e )
        , m_pBuffer( e.m_pBuffer )
        , m_stream( e.m_pBuffer.get() ) {}

    virtual ~exception_stream_base() throw() {}

    const char* what() const throw() { return m_pBuffer->c_str(); }

    template <class Type>
    ExceptionClass& operator<<( const Type& t ) {
        m_pBuffer->pop_back(); // Pop the trailing NULL so the new text is concatenated
        m_stream << t;
        m_pBuffer->push_back( '\0' );

        return *static_cast<ExceptionClass*>( this );
    }
};

class exception_stream : public exception_stream_base<exception_stream> {
  public:
    exception_stream() {}
    virtual ~exception_stream() throw() {}
};

namespace voxset_error {
/**
 * The ways a voxset operation can fail. All of them are reported through voxset_exception.
 */
enum kind {
    open_failure,           // storage could not be opened or is not a voxel dataset
    index_out_of_range,     // an axis index or linear index is outside the grid
    invalid_state,          // the voxset was used after close()
    metadata_write_failure, // the metadata sidecar could not be written at close
    read_only,              // metadata was modified on a voxset opened for reading only
    storage_read_failure    // the storage failed to deliver a row
};

inline const char* to_string( kind k ) {
    switch( k ) {
    case open_failure:
        return "open_failure";
    case index_out_of_range:
        return "index_out_of_range";
    case invalid_state:
        return "invalid_state";
    case metadata_write_failure:
        return "metadata_write_failure";
    case read_only:
        return "read_only";
    case storage_read_failure:
        return "storage_read_failure";
    default:
        return "unknown";
    }
}
} // namespace voxset_error

class voxset_exception : public exception_stream_base<voxset_exception> {
    voxset_error::kind m_kind;

  public:
    explicit voxset_exception( voxset_error::kind k )
        : m_kind( k ) {}
    voxset_exception( voxset_error::kind k, const std::string& msg )
        : exception_stream_base<voxset_exception>( msg )
        , m_kind( k ) {}
    virtual ~voxset_exception() throw() {}

    voxset_error::kind kind() const { return m_kind; }
};

} // namespace stratum
