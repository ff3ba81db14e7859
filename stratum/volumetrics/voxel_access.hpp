// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratum/volumetrics/voxel_sample.hpp>

#include <boost/cstdint.hpp>

namespace stratum {
namespace volumetrics {

/**
 * Random access to the voxels of a grid, by axis indices or by linear index i = iz*nx*ny + iy*nx + ix.
 */
class voxel_random_access {
  public:
    virtual ~voxel_random_access() {}

    // The number of voxels, nx*ny*nz
    virtual boost::int64_t size() const = 0;

    virtual voxel_sample get( int ix, int iy, int iz ) = 0;

    virtual voxel_sample get( boost::int64_t i ) = 0;
};

/**
 * A finite sequence of voxels in linear index order that can be traversed again after it is exhausted.
 */
class voxel_sequence {
  public:
    virtual ~voxel_sequence() {}

    /**
     * Copies the voxel at the cursor into outSample and advances. At the end of the sequence the cursor goes back to
     * the first voxel and false is returned, leaving outSample unchanged.
     */
    virtual bool next( voxel_sample& outSample ) = 0;

    virtual void reset() = 0;
};

} // namespace volumetrics
} // namespace stratum
