/* Ringbench: message-passing micro-benchmarks
 * Copyright (C) Calum Grant 2012
 */

#include <ringbench/thread_ring.hpp>
#include <ringbench/promise.hpp>

#include <stdexcept>
#include <string>

ringbench::actor::actor(int name, channel<int> & finish) :
	m_name(name), m_finish(finish), m_hops(0), m_reported(false)
{
}

ringbench::actor::~actor()
{
}

void ringbench::actor::report(basic & self)
{
	m_reported = true;
	m_finish.give(self, m_name, noop());
}

ringbench::post_actor::post_actor(int name, channel<int> & finish, scheduler & sched) :
	object<post_actor>(sched), actor(name, finish), m_successor(nullptr)
{
}

ringbench::ring::~ring()
{
}

long long ringbench::ring::hops() const
{
	long long total = 0;
	for( int i=0; i<size(); ++i )
		total += get_actor(i).hops();
	return total;
}

ringbench::post_ring::post_ring(int nodes, channel<int> & finish, scheduler & sched)
{
	m_actors.reserve(nodes);
	for( int i=1; i<=nodes; ++i )
		m_actors.emplace_back(new post_actor(i, finish, sched));
	for( int i=0; i<nodes; ++i )
		m_actors[i]->set_next(*m_actors[(i+1) % nodes]);
}

int ringbench::post_ring::size() const
{
	return int(m_actors.size());
}

const ringbench::actor & ringbench::post_ring::get_actor(int i) const
{
	return *m_actors.at(i);
}

void ringbench::post_ring::inject(basic &, int token)
{
	(*m_actors.front())(token);
}

std::unique_ptr<ringbench::ring> ringbench::thread_ring::make_post_ring(int nodes, channel<int> & finish, scheduler & sched)
{
	return std::unique_ptr<ring>(new post_ring(nodes, finish, sched));
}

const ringbench::thread_ring::variant ringbench::thread_ring::ch_give = { "ChGive", &make_loop_ring<links::give>, true };
const ringbench::thread_ring::variant ringbench::thread_ring::ch_send = { "ChSend", &make_loop_ring<links::send>, false };
const ringbench::thread_ring::variant ringbench::thread_ring::mb_send = { "MbSend", &make_loop_ring<links::mail>, false };
const ringbench::thread_ring::variant ringbench::thread_ring::mp_post = { "MPPost", &make_post_ring, false };

int ringbench::thread_ring::expected_reporter(int nodes, int token)
{
	return token % nodes + 1;
}

// Builds one ring from the worker pool and puts the first token into it.
class ringbench::thread_ring::parallel_run::injector : public ringbench::basic
{
public:
	explicit injector(parallel_run & owner) :
		basic(owner.m_scheduler), m_owner(owner)
	{
	}

	void start()
	{
		active_fn( [this]() { build(); } );
	}

	bool built() const { return m_chain!=nullptr; }

	const ring & get_chain() const { return *m_chain; }

private:
	void build()
	{
		m_chain = m_owner.m_variant.make_chain(m_owner.m_nodes, m_owner.m_finish, m_owner.m_scheduler);
		m_chain->inject(*this, m_owner.m_token);
	}

	parallel_run & m_owner;
	std::unique_ptr<ring> m_chain;
};

ringbench::thread_ring::parallel_run::parallel_run(const variant & v, int nodes, int token, int chains, scheduler & sched) :
	m_variant(v), m_nodes(nodes), m_token(token), m_chains(chains), m_scheduler(sched)
{
	if( nodes<1 ) throw std::invalid_argument("thread ring needs at least one actor");
	if( token<0 ) throw std::invalid_argument("thread ring token must not be negative");
	if( chains<1 ) throw std::invalid_argument("thread ring needs at least one chain");
	if( v.rendezvous && nodes==1 && token>0 )
		throw std::invalid_argument(std::string(v.name) + ": a single actor cannot give a token to itself");
}

ringbench::thread_ring::parallel_run::~parallel_run()
{
}

std::vector<int> ringbench::thread_ring::parallel_run::run(int threads)
{
	m_injectors.clear();
	m_injectors.reserve(m_chains);
	for( int c=0; c<m_chains; ++c )
		m_injectors.emplace_back(new injector(*this));

	std::vector<int> reporters;
	reporters.reserve(m_chains);

	{
		ringbench::run workers(threads, m_scheduler);
		for( int c=0; c<m_chains; ++c )
			m_injectors[c]->start();
		for( int c=0; c<m_chains; ++c )
			reporters.push_back( ringbench::take(m_finish, m_scheduler) );
	}

	// Every ring has finished, so any report still waiting is a second one.
	if( m_finish.has_givers() )
	{
		m_finish.dispose();
		throw std::logic_error(std::string(m_variant.name) + ": a ring reported more than once");
	}
	return reporters;
}

long long ringbench::thread_ring::parallel_run::hops() const
{
	long long total = 0;
	for( std::size_t c=0; c<m_injectors.size(); ++c )
		if( m_injectors[c]->built() )
			total += m_injectors[c]->get_chain().hops();
	return total;
}

const ringbench::ring & ringbench::thread_ring::parallel_run::get_chain(int i) const
{
	if( i<0 || i>=int(m_injectors.size()) || !m_injectors[i]->built() )
		throw std::out_of_range("no such chain");
	return m_injectors[i]->get_chain();
}
