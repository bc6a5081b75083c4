/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_RING_INCLUDED
#define RINGBENCH_RING_INCLUDED

#include "actor.hpp"

#include <memory>
#include <vector>

namespace ringbench
{
	/*	A closed ring of actors, named 1 to size() in ring order.
		Actor i passes tokens to actor i+1, and the last actor to the first.
		Destroying the ring releases its actors and primitives; it must be
		idle when this happens.
	  */
	class ring
	{
	public:
		virtual ~ring();

		virtual int size() const=0;

		// The actor at 0-based position i, named i+1.
		virtual const actor & get_actor(int i) const=0;

		// Introduces a token at actor 1. self is the injecting task.
		virtual void inject(basic & self, int token)=0;

		// Tokens passed on by all actors.
		long long hops() const;
	};

	// Ring of loop actors linked by primitives of Link.
	template<typename Link>
	class loop_ring : public ring
	{
	public:
		typedef typename Link::primitive_type primitive_type;
		typedef loop_actor<Link> actor_type;

		// Each actor starts as soon as it is constructed. None can receive
		// anything before the ring is complete, because only inject() puts a
		// token into it.
		loop_ring(int nodes, channel<int> & finish, scheduler & sched = default_scheduler)
		{
			m_links.reserve(nodes);
			m_actors.reserve(nodes);

			m_links.emplace_back(new primitive_type);
			primitive_type * in = m_links.front().get();
			for( int i=1; i<=nodes; ++i )
			{
				primitive_type * out;
				if( i==nodes )
				{
					out = m_links.front().get();
				}
				else
				{
					m_links.emplace_back(new primitive_type);
					out = m_links.back().get();
				}
				m_actors.emplace_back(new actor_type(i, *in, *out, finish, sched));
				m_actors.back()->start();
				in = out;
			}
		}

		int size() const { return int(m_actors.size()); }

		const actor & get_actor(int i) const { return *m_actors.at(i); }

		void inject(basic & self, int token)
		{
			Link::forward(entry(), self, token, noop());
		}

		// The inbound primitive of actor 1.
		primitive_type & entry() { return *m_links.front(); }

	private:
		std::vector<std::unique_ptr<primitive_type> > m_links;
		std::vector<std::unique_ptr<actor_type> > m_actors;
	};

	// Ring of message-handling actors, each holding a pointer to the next.
	class post_ring : public ring
	{
	public:
		post_ring(int nodes, channel<int> & finish, scheduler & sched = default_scheduler);

		int size() const;

		const actor & get_actor(int i) const;

		void inject(basic & self, int token);

	private:
		std::vector<std::unique_ptr<post_actor> > m_actors;
	};
}

#endif
