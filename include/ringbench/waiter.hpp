/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_WAITER_INCLUDED
#define RINGBENCH_WAITER_INCLUDED

#include "object.hpp"

#include <future>
#include <memory>
#include <utility>

namespace ringbench
{
	/*	A parked receive.
		deliver() hands over the value and completes the receive.
		dispose() releases a receive which will never complete.
		Both may destroy the waiter. */
	template<typename T>
	struct taker
	{
		taker() : m_next(nullptr) { }
		virtual void deliver(T value)=0;
		virtual void dispose() throw()=0;
		taker * m_next;
	protected:
		~taker() { }
	};

	/*	A parked rendezvous send.
		release() moves the offered value out; resume() then completes the send. */
	template<typename T>
	struct giver
	{
		giver() : m_next(nullptr) { }
		virtual T release()=0;
		virtual void resume()=0;
		virtual void dispose() throw()=0;
		giver * m_next;
	protected:
		~giver() { }
	};

	namespace detail
	{
		// Binds a received value to a continuation.
		template<typename Fn, typename T>
		struct apply
		{
			apply(const Fn & fn, T value) : m_fn(fn), m_value(std::move(value)) { }
			void operator()() { m_fn(std::move(m_value)); }
			Fn m_fn;
			T m_value;
		};

		// A receive from a task. The continuation is posted back to the task.
		template<typename T, typename Fn>
		class task_taker : public taker<T>
		{
		public:
			task_taker(basic & self, const Fn & fn) : m_self(self), m_fn(fn) { }

			void deliver(T value)
			{
				std::unique_ptr<task_taker> owner(this);
				m_self.active_fn( apply<Fn,T>(m_fn, std::move(value)) );
			}

			void dispose() throw()
			{
				delete this;
			}

		private:
			basic & m_self;
			Fn m_fn;
		};

		// A rendezvous send from a task.
		template<typename T, typename Fn>
		class task_giver : public giver<T>
		{
		public:
			task_giver(basic & self, T value, const Fn & fn) :
				m_self(self), m_value(std::move(value)), m_fn(fn) { }

			T release()
			{
				return std::move(m_value);
			}

			void resume()
			{
				std::unique_ptr<task_giver> owner(this);
				m_self.active_fn( std::move(m_fn) );
			}

			void dispose() throw()
			{
				delete this;
			}

		private:
			basic & m_self;
			T m_value;
			Fn m_fn;
		};

		// A receive from a thread which is not a task.
		// The promise is moved out before it is fulfilled, since the waiting
		// thread may destroy this node as soon as the value is visible.
		template<typename T>
		class blocking_taker : public taker<T>
		{
		public:
			std::future<T> get_future() { return m_promise.get_future(); }

			void deliver(T value)
			{
				std::promise<T> promise(std::move(m_promise));
				promise.set_value(std::move(value));
			}

			void dispose() throw()
			{
				std::promise<T> broken(std::move(m_promise));
			}

		private:
			std::promise<T> m_promise;
		};

		// A rendezvous send from a thread which is not a task.
		template<typename T>
		class blocking_giver : public giver<T>
		{
		public:
			explicit blocking_giver(T value) : m_value(std::move(value)) { }

			std::future<void> get_future() { return m_done.get_future(); }

			T release()
			{
				return std::move(m_value);
			}

			void resume()
			{
				std::promise<void> done(std::move(m_done));
				done.set_value();
			}

			void dispose() throw()
			{
				std::promise<void> broken(std::move(m_done));
			}

		private:
			T m_value;
			std::promise<void> m_done;
		};
	}
}

#endif
