// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <stratum/diagnostics/resource_tracker.hpp>
#include <stratum/logging/logging_level.hpp>

#include <boost/bind/bind.hpp>

namespace stratum {
namespace diagnostics {

resource_tracker::resource_tracker()
    : m_totalOpened( 0 )
    , m_totalClosed( 0 ) {}

resource_hook resource_tracker::hook() {
    using namespace boost::placeholders;
    return boost::bind( &resource_tracker::notify, this, _1, _2, _3 );
}

void resource_tracker::notify( resource_event ev, const std::string& type, const std::string& name ) {
    const std::string key = type + ":" + name;
    if( ev == resource_opened ) {
        ++m_openResources[key];
        ++m_totalOpened;
    } else {
        std::map<std::string, int>::iterator it = m_openResources.find( key );
        if( it == m_openResources.end() ) {
            ST_LOG( warning ) << "resource_tracker: Close of \"" << key << "\" which was never opened" << std::endl;
            return;
        }
        if( --it->second == 0 )
            m_openResources.erase( it );
        ++m_totalClosed;
    }
}

std::vector<std::string> resource_tracker::open_resources() const {
    std::vector<std::string> result;
    for( std::map<std::string, int>::const_iterator it = m_openResources.begin(); it != m_openResources.end(); ++it ) {
        for( int i = 0; i < it->second; ++i )
            result.push_back( it->first );
    }
    return result;
}

void resource_tracker::clear() {
    m_openResources.clear();
    m_totalOpened = 0;
    m_totalClosed = 0;
}

std::ostream& operator<<( std::ostream& out, const resource_tracker& tracker ) {
    out << "resources opened: " << tracker.m_totalOpened << ", closed: " << tracker.m_totalClosed;
    std::vector<std::string> open = tracker.open_resources();
    for( std::size_t i = 0; i < open.size(); ++i )
        out << "\n  still open: " << open[i];
    return out;
}

} // namespace diagnostics
} // namespace stratum
