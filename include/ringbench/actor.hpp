/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_ACTOR_INCLUDED
#define RINGBENCH_ACTOR_INCLUDED

#include "object.hpp"
#include "channel.hpp"

namespace ringbench
{
	/*	A member of a ring. On each token it either passes token-1 on, or,
		for the token 0, gives its name on the finish channel and stops.
		Derived classes supply the receive and forward mechanics.
	  */
	class actor
	{
	public:
		virtual ~actor();

		int name() const { return m_name; }

		// Number of tokens passed on.
		long long hops() const { return m_hops; }

		// Whether this actor received the token 0.
		bool reported() const { return m_reported; }

	protected:
		actor(int name, channel<int> & finish);

		// Returns true if token-1 must be passed on.
		bool receive(int token)
		{
			if( token==0 ) return false;
			++m_hops;
			return true;
		}

		void report(basic & self);

	private:
		actor(const actor&);
		actor & operator=(const actor&);

		const int m_name;
		channel<int> & m_finish;
		long long m_hops;
		bool m_reported;
	};

	// An actor written as a loop: take from in, forward to out, repeat.
	template<typename Link>
	class loop_actor : public basic, public actor
	{
	public:
		typedef typename Link::primitive_type primitive_type;

		loop_actor(int name, primitive_type & in, primitive_type & out,
			channel<int> & finish, scheduler & sched = default_scheduler) :
			basic(sched), actor(name, finish), m_in(in), m_out(out)
		{
		}

		// Enters the receive loop.
		void start()
		{
			active_fn( [this]() { next(); } );
		}

	private:
		void next()
		{
			Link::take( m_in, *this, [this](int token) { on_token(token); } );
		}

		void on_token(int token)
		{
			if( receive(token) )
				Link::forward( m_out, *this, token-1, [this]() { next(); } );
			else
				report(*this);
		}

		primitive_type & m_in;
		primitive_type & m_out;
	};

	// An actor written as a message handler. Tokens are posted to it directly.
	class post_actor : public object<post_actor>, public actor
	{
	public:
		post_actor(int name, channel<int> & finish, scheduler & sched = default_scheduler);

		void set_next(post_actor & next) { m_successor = &next; }

		void active_method(int token)
		{
			if( receive(token) )
				(*m_successor)(token-1);
			else
				report(*this);
		}

	private:
		post_actor * m_successor;
	};
}

#endif
