/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_PROMISE_INCLUDED
#define RINGBENCH_PROMISE_INCLUDED

#include "scheduler.hpp"
#include "waiter.hpp"
#include "channel.hpp"

#include <chrono>
#include <future>

namespace ringbench
{
	// Waits until result is ready, running scheduled work whilst waiting.
	// Returns false if the scheduler fails first.
	template<typename T>
	bool wait_ready(std::future<T> & result, scheduler & sched = default_scheduler)
	{
		while( result.wait_for(std::chrono::seconds(0)) != std::future_status::ready )
		{
			if( sched.failed() )
				return false;
			if( !sched.run_one() )
			{
				// No more work (for now).
				result.wait_for(std::chrono::milliseconds(1));
			}
		}
		return true;
	}

	// Waits for result. Rethrows a failure of the scheduler.
	template<typename T>
	T wait(std::future<T> & result, scheduler & sched = default_scheduler)
	{
		if( !wait_ready(result, sched) )
			sched.rethrow();
		return result.get();
	}

	// Takes from a channel, buffered channel or mailbox on a thread which is not a task.
	template<typename Primitive>
	typename Primitive::value_type take(Primitive & p, scheduler & sched = default_scheduler)
	{
		typedef typename Primitive::value_type value_type;
		detail::blocking_taker<value_type> waiter;
		std::future<value_type> result = waiter.get_future();
		p.take(&waiter);
		if( !wait_ready(result, sched) && p.cancel(&waiter) )
			sched.rethrow();
		return result.get();
	}

	// Gives on a channel on a thread which is not a task.
	template<typename T>
	void give(channel<T> & ch, T value, scheduler & sched = default_scheduler)
	{
		detail::blocking_giver<T> waiter(std::move(value));
		std::future<void> done = waiter.get_future();
		ch.give(&waiter);
		if( !wait_ready(done, sched) && ch.cancel(&waiter) )
			sched.rethrow();
		done.get();
	}
}

#endif
