// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   WorkerPool - run a numbered batch of tasks on a bounded thread group

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/workerpool.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>
									/*}}}*/

using namespace std;

namespace IMA {

// AvailableParallelism - threads the host can run at once		/*{{{*/
unsigned int AvailableParallelism()
{
   unsigned int const Cores = std::thread::hardware_concurrency();
   if (Cores == 0)
      return 1;
   return Cores;
}
									/*}}}*/
// WorkerPool::WorkerPool - Constructor					/*{{{*/
WorkerPool::WorkerPool(unsigned int const Jobs) :
   Jobs(Jobs == 0 ? AvailableParallelism() : Jobs)
{
}
									/*}}}*/
// WorkerPool::Run - distribute the tasks and wait for them		/*{{{*/
// ---------------------------------------------------------------------
/* The queue is just the next index to hand out. Everything shared
   between the workers is guarded by Lock, the task itself runs
   without it. */
bool WorkerPool::Run(size_t const Count, Task const &Work)
{
   bool const Debug = _config->FindB("Debug::IMA::WorkerPool", false);
   if (Count == 0)
      return true;

   size_t const Threads = std::min<size_t>(Jobs, Count);
   if (Debug == true)
      std::clog << "WorkerPool: " << Count << " tasks on " << Threads << " threads" << std::endl;

   std::mutex Lock;
   size_t Next = 0;
   bool Failed = false;
   GlobalError Collected;

   auto const Worker = [&](size_t const Id) {
      while (true)
      {
	 size_t Index;
	 {
	    std::lock_guard<std::mutex> Guard(Lock);
	    if (Failed == true || Next == Count)
	       break;
	    Index = Next++;
	 }

	 bool const Res = Work(Index);

	 std::lock_guard<std::mutex> Guard(Lock);
	 if (Res == false || _error->PendingError() == true)
	 {
	    if (Debug == true && Failed == false)
	       std::clog << "WorkerPool: task " << Index << " failed on thread " << Id
			 << ", no further tasks are started" << std::endl;
	    Failed = true;
	 }
	 // this thread's error stack is its own, hand the messages over
	 Collected.MergeWith(*_GetErrorObj());
      }
   };

   std::vector<std::thread> Workers;
   Workers.reserve(Threads);
   for (size_t I = 0; I != Threads; ++I)
   {
      try
      {
	 Workers.emplace_back(Worker, I);
      }
      catch (std::system_error const &E)
      {
	 {
	    std::lock_guard<std::mutex> Guard(Lock);
	    Failed = true;
	 }
	 _error->Error("Unable to start worker thread: %s", E.what());
	 break;
      }
   }

   for (auto &T : Workers)
      T.join();

   _error->MergeWith(Collected);
   if (Debug == true)
      std::clog << "WorkerPool: " << Next << " of " << Count << " tasks started, "
		<< (Failed ? "failed" : "succeeded") << std::endl;
   return Failed == false;
}
									/*}}}*/

}
