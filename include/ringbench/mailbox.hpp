/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_MAILBOX_INCLUDED
#define RINGBENCH_MAILBOX_INCLUDED

#include "buffered_channel.hpp"

namespace ringbench
{
	// An actor's inbox. Anyone may send(); the owning actor takes.
	// Delivery is as for buffered_channel.
	template<typename T>
	class mailbox
	{
	public:
		typedef T value_type;
		typedef ringbench::taker<T> taker_type;

		void send(T value) { m_inbox.send(std::move(value)); }

		void take(taker_type * t) { m_inbox.take(t); }

		template<typename Fn>
		void take(basic & owner, Fn fn) { m_inbox.take(owner, fn); }

		bool cancel(taker_type * t) { return m_inbox.cancel(t); }

		std::size_t size() const { return m_inbox.size(); }

	private:
		buffered_channel<T> m_inbox;
	};
}

#endif
