// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   WorkerPool - run a numbered batch of tasks on a bounded thread group

   The tasks [0, Count) are handed out in order to at most Jobs threads.
   The first failing task stops the distribution of further work; tasks
   which are already running are allowed to finish. Messages a task
   leaves on the (thread local) error stack are moved to the error
   stack of the thread calling Run once all workers are joined.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_WORKERPOOL_H
#define IMAPKG_WORKERPOOL_H

#include <ima-pkg/macros.h>

#include <cstddef>
#include <functional>

namespace IMA {

class IMA_PUBLIC WorkerPool
{
   unsigned int const Jobs;

   public:
   /** a task gets the index of its work item and reports failure
    *  by returning \b false, ideally with a message on the error stack */
   typedef std::function<bool(size_t const Index)> Task;

   /** \brief run Work for every index in [0, Count)
    *
    *  Blocks until all started tasks are done.
    *  \return \b false if any task failed or threads could not be started */
   bool Run(size_t const Count, Task const &Work);

   unsigned int JobCount() const { return Jobs; }

   /** \param Jobs upper bound of concurrent threads, 0 picks the
    *  available parallelism of the host */
   explicit WorkerPool(unsigned int const Jobs);
};

/** number of threads the host can run in parallel, at least 1 */
IMA_PUBLIC unsigned int AvailableParallelism();

}

#endif
