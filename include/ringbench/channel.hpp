/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_CHANNEL_INCLUDED
#define RINGBENCH_CHANNEL_INCLUDED

#include "waiter.hpp"
#include "wait_queue.hpp"

namespace ringbench
{
	/*	Synchronous channel.
		A give completes only when a take receives its value, and a take
		completes only when it is handed a value by a give. There is no buffer.
		Gives and takes which cannot be matched immediately wait, and are
		matched in order of arrival.
	  */
	template<typename T>
	class channel
	{
	public:
		typedef T value_type;
		typedef ringbench::taker<T> taker_type;
		typedef ringbench::giver<T> giver_type;

		channel() { }

		~channel()
		{
			dispose();
		}

		void give(giver_type * g)
		{
			platform::unique_lock<platform::mutex> lock(m_mutex);
			if( taker_type * t = m_takers.pop() )
			{
				lock.unlock();
				t->deliver(g->release());
				g->resume();
			}
			else
			{
				m_givers.push(g);
			}
		}

		void take(taker_type * t)
		{
			platform::unique_lock<platform::mutex> lock(m_mutex);
			if( giver_type * g = m_givers.pop() )
			{
				lock.unlock();
				t->deliver(g->release());
				g->resume();
			}
			else
			{
				m_takers.push(t);
			}
		}

		// Gives value from the task self. fn() runs on self once the value is taken.
		template<typename Fn>
		void give(basic & self, T value, Fn fn)
		{
			give( new detail::task_giver<T,Fn>(self, std::move(value), fn) );
		}

		// Takes a value from the task self. fn(value) runs on self.
		template<typename Fn>
		void take(basic & self, Fn fn)
		{
			take( new detail::task_taker<T,Fn>(self, fn) );
		}

		// Withdraws a waiter. Returns false if it has already been matched.
		bool cancel(taker_type * t)
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			return m_takers.erase(t);
		}

		bool cancel(giver_type * g)
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			return m_givers.erase(g);
		}

		// Whether a give is waiting for a take.
		bool has_givers() const
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			return !m_givers.empty();
		}

		bool has_takers() const
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			return !m_takers.empty();
		}

		// Releases all waiters. They never complete.
		void dispose() throw()
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			while( taker_type * t = m_takers.pop() )
				t->dispose();
			while( giver_type * g = m_givers.pop() )
				g->dispose();
		}

	private:
		channel(const channel&);
		channel & operator=(const channel&);

		mutable platform::mutex m_mutex;
		wait_queue<taker_type> m_takers;
		wait_queue<giver_type> m_givers;
	};
}

#endif
