// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/function.hpp>

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace stratum {
namespace diagnostics {

enum resource_event { resource_opened, resource_closed };

/**
 * Called by resource owning objects (such as a voxset) when they acquire and release their resources. The type is
 * the kind of object ("voxset") and the name identifies the instance.
 */
typedef boost::function<void( resource_event, const std::string& /*type*/, const std::string& /*name*/ )>
    resource_hook;

/**
 * Counts open/close notifications so that leaked resources can be listed. Hand the result of hook() to the objects to
 * be tracked. The tracker must outlive every object holding its hook.
 */
class resource_tracker {
    // "type:name" -> number of currently open instances
    std::map<std::string, int> m_openResources;
    int m_totalOpened;
    int m_totalClosed;

    resource_tracker( const resource_tracker& );
    resource_tracker& operator=( const resource_tracker& );

  public:
    resource_tracker();

    resource_hook hook();

    void notify( resource_event ev, const std::string& type, const std::string& name );

    // Number of resources currently open
    int open_count() const { return m_totalOpened - m_totalClosed; }

    int total_opened() const { return m_totalOpened; }

    int total_closed() const { return m_totalClosed; }

    // Lists the open resources as "type:name", one entry per open instance
    std::vector<std::string> open_resources() const;

    void clear();

    friend std::ostream& operator<<( std::ostream& out, const resource_tracker& tracker );
};

} // namespace diagnostics
} // namespace stratum
