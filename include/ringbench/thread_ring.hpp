/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#ifndef RINGBENCH_THREAD_RING_INCLUDED
#define RINGBENCH_THREAD_RING_INCLUDED

#include "ring.hpp"
#include "links.hpp"
#include "scheduler.hpp"

#include <memory>
#include <vector>

namespace ringbench
{
	namespace thread_ring
	{
		typedef std::unique_ptr<ring> (*ring_factory)(int nodes, channel<int> & finish, scheduler & sched);

		// One way of building a ring.
		struct variant
		{
			const char * name;
			ring_factory make_chain;
			bool rendezvous;	// A give completes only when the next actor takes.
		};

		template<typename Link>
		std::unique_ptr<ring> make_loop_ring(int nodes, channel<int> & finish, scheduler & sched)
		{
			return std::unique_ptr<ring>(new loop_ring<Link>(nodes, finish, sched));
		}

		std::unique_ptr<ring> make_post_ring(int nodes, channel<int> & finish, scheduler & sched);

		extern const variant ch_give;	// loop actors, rendezvous channels
		extern const variant ch_send;	// loop actors, buffered channels
		extern const variant mb_send;	// loop actors, mailboxes
		extern const variant mp_post;	// message-handling actors

		// The actor which receives the token 0 when token is injected at actor 1.
		int expected_reporter(int nodes, int token);

		/*	Runs independent rings concurrently and waits for all of them.
			A rendezvous ring of one actor could never pass on a token, so
			it is rejected unless the token is 0.
			Every ring is built and injected by its own task, so the
			injections are not serialised. All rings report on one shared
			finish channel; the caller takes one report per ring.
		  */
		class parallel_run
		{
		public:
			parallel_run(const variant & v, int nodes, int token, int chains,
				scheduler & sched = default_scheduler);
			~parallel_run();

			// Returns the name of the reporting actor of each ring, in the order reported.
			// The rings are rebuilt on each call.
			// Throws std::logic_error if a ring reports more than once.
			std::vector<int> run(int threads = platform::thread::hardware_concurrency());

			// Tokens passed on in the last run.
			long long hops() const;

			int chains() const { return m_chains; }

			// Ring i of the last run.
			const ring & get_chain(int i) const;

		private:
			parallel_run(const parallel_run&);
			parallel_run & operator=(const parallel_run&);

			class injector;

			const variant m_variant;
			const int m_nodes, m_token, m_chains;
			scheduler & m_scheduler;
			channel<int> m_finish;
			std::vector<std::unique_ptr<injector> > m_injectors;
		};
	}
}

#endif
