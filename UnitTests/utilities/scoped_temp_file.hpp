// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/filesystem.hpp>
#include <boost/noncopyable.hpp>

#include <string>

/**
 * A unique path in the temp directory that is removed, along with its ".xml" sidecar, when the object goes out of
 * scope. The file itself isn't created.
 */
class scoped_temp_file : boost::noncopyable {
  public:
    explicit scoped_temp_file( const boost::filesystem::path& extension )
        : m_path( boost::filesystem::unique_path(
              ( boost::filesystem::temp_directory_path() / "%%%%-%%%%-%%%%-%%%%." ).replace_extension( extension ) ) ) {
    }

    ~scoped_temp_file() {
        boost::system::error_code ec;
        boost::filesystem::remove_all( m_path, ec );
        boost::filesystem::remove_all( m_path.string() + ".xml", ec );
    }

    std::string get_path() const { return m_path.string(); }

  private:
    boost::filesystem::path m_path;
};
