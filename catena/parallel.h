#ifndef __CATENA_PARALLEL_H__
#define __CATENA_PARALLEL_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <vector>

#include <boost/function.hpp>

namespace Catena {

/// @brief Run functors concurrently and wait for all of them
/// @details
/// Each functor gets a Fiber of its own on the current Scheduler, and the
/// caller yields until the last one finishes.  They overlap either because
/// the Scheduler has several threads, or because they block on Fiber
/// primitives.  Without a current Scheduler they run one after the other.
///
/// Every functor runs to completion even if another throws; afterwards the
/// exception of the first failing functor (in vector order) is rethrown.
/// @param parallelism Maximum number running at once; negative for no limit
void parallel_do(const std::vector<boost::function<void ()> > &dgs,
    int parallelism = -1);

}

#endif
