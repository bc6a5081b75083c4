/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_SCHEDULER_INCLUDED
#define RINGBENCH_SCHEDULER_INCLUDED

#include "object.hpp"

#include <atomic>
#include <exception>

#ifdef RINGBENCH_USE_BOOST
	#include <boost/thread/condition_variable.hpp>
#else
	#include <condition_variable>
#endif

namespace ringbench
{
	// Represents a pool of objects which can be executed in a thread pool.
	class scheduler
	{
	public:
		typedef any_object * ObjectPtr;

		scheduler();

		// Used by an object to signal that there are messages to process.
		// Objects are run in the order they were activated.
		void activate(ObjectPtr) throw();

		// Thread tracking:
		void start_work() throw();
		void stop_work() throw();

		// Runs in current thread until there are no more messages in the entire pool
		// and no other thread is busy.
		// Can be run concurrently.
		void run();

		// Runs one activated object, if there is one.
		// Used by threads that wait for a result to do some work in the meantime.
		// Returns false if nothing was run.
		bool run_one();

		// Records the first failure. Once failed, no further objects are run.
		void fail(std::exception_ptr) throw();

		bool failed() const throw()
		{
			return m_failed.load(std::memory_order_acquire);
		}

		// Throws the recorded failure, if any.
		void rethrow() const;

	private:
		scheduler(const scheduler&);
		scheduler & operator=(const scheduler&);

		mutable platform::mutex m_mutex;
		platform::condition_variable m_ready;
		any_object *m_head, *m_tail;   // List of activated objects.
		int m_busy_count;	// Used to work out when we have actually finished.
		std::atomic<bool> m_failed;
		std::exception_ptr m_error;

		bool run_managed() throw();
		bool locked_run_one();
	};

	// Sleeps the calling thread.
	void pause(int milliseconds);
}

#endif
