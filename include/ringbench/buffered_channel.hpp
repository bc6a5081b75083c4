/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_BUFFERED_CHANNEL_INCLUDED
#define RINGBENCH_BUFFERED_CHANNEL_INCLUDED

#include "waiter.hpp"
#include "wait_queue.hpp"

#include <cstddef>
#include <deque>

namespace ringbench
{
	/*	Asynchronous channel with an unbounded buffer.
		send() never waits. take() waits until a value is available.
		Values are taken in the order they were sent; waiting takes are served
		in order of arrival. While a take waits, the buffer is empty.
	  */
	template<typename T>
	class buffered_channel
	{
	public:
		typedef T value_type;
		typedef ringbench::taker<T> taker_type;

		buffered_channel() { }

		~buffered_channel()
		{
			dispose();
		}

		void send(T value)
		{
			platform::unique_lock<platform::mutex> lock(m_mutex);
			if( taker_type * t = m_takers.pop() )
			{
				lock.unlock();
				t->deliver(std::move(value));
			}
			else
			{
				m_values.push_back(std::move(value));
			}
		}

		void take(taker_type * t)
		{
			platform::unique_lock<platform::mutex> lock(m_mutex);
			if( m_values.empty() )
			{
				m_takers.push(t);
				return;
			}
			T value = std::move(m_values.front());
			m_values.pop_front();
			lock.unlock();
			t->deliver(std::move(value));
		}

		// Takes a value from the task self. fn(value) runs on self.
		template<typename Fn>
		void take(basic & self, Fn fn)
		{
			take( new detail::task_taker<T,Fn>(self, fn) );
		}

		bool cancel(taker_type * t)
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			return m_takers.erase(t);
		}

		// Number of values sent but not yet taken.
		std::size_t size() const
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			return m_values.size();
		}

		// Releases all waiters and drops buffered values.
		void dispose() throw()
		{
			platform::lock_guard<platform::mutex> lock(m_mutex);
			while( taker_type * t = m_takers.pop() )
				t->dispose();
			m_values.clear();
		}

	private:
		buffered_channel(const buffered_channel&);
		buffered_channel & operator=(const buffered_channel&);

		mutable platform::mutex m_mutex;
		std::deque<T> m_values;
		wait_queue<taker_type> m_takers;
	};
}

#endif
